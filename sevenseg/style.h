#pragma once

#include <QColor>
#include <QJsonObject>
#include <QString>

#include "display.h"
#include "readout.h"

namespace sevenseg {

/**
 * How a readout is drawn by the painter, the widget and the command line.
 * Loaded from a JSON file like
 *   { "color": "#f72727", "background": "#000000", "skew": "traditional",
 *     "aspect_ratio": 0.5625, "height": 64 }
 * "skew" is "none", "traditional" or a custom shear factor.
 */
struct Style {
	QColor color = DEFAULT_COLOR;
	QColor background = QColor(Qt::black);
	Skew skew = Skew::none();
	qreal aspect_ratio = DEFAULT_ASPECT_RATIO;
	unsigned height = 64;

	// keys missing in json keep their current value
	void fromJSON(QJsonObject json);
	QJsonObject toJSON() const;
};

bool parseSkew(const QString& text, Skew& skew);
QString skewName(Skew skew);

bool loadStyleFile(const QString& file, Style& style);
bool saveStyleFile(const QString& file, const Style& style);

}  // namespace sevenseg
