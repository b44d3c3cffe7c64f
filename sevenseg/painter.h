#pragma once

#include <QImage>
#include <QPainter>
#include <QSize>

#include "readout.h"
#include "style.h"

namespace sevenseg {

void paint(QPainter& p, const Fills& fills);

// size of an image showing the readout at style.height
QSize imageSize(const Readout& readout, const Style& style);

QImage renderImage(const Readout& readout, const Style& style);

}  // namespace sevenseg
