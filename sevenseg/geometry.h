#pragma once

#include <QPainterPath>
#include <QPolygonF>
#include <QRectF>
#include <QSizeF>

#include "segment.h"

namespace sevenseg {

// stroke thickness relative to the shorter side of the display
const qreal THICKNESS_RATIO = 0.1;

struct SegmentGeometry {
	Segment segment;
	Kind kind;
	QRectF frame;
	QPolygonF outline;  // tapered bar, empty for Kind::dot
	QRectF ellipse;     // dot only

	QPainterPath path() const;
};

qreal thicknessFor(const QSizeF& parent);

// bar and dot sizes never exceed the parent, degenerate parents give empty sizes
QSizeF sizeFor(Kind kind, const QSizeF& parent);

/**
 * Sub rectangle of a display of the given size in which the segment is drawn,
 * relative to the display's top left corner.
 * The bars tile without gaps: all horizontal bars share one x center, the
 * vertical bars sit flush left/right around the quarter height marks and the
 * period sits in the bottom right corner.
 */
QRectF frameFor(Segment segment, const QSizeF& parent);

// six vertices, both short edges narrowed to a point on the midline
QPolygonF outlineFor(Kind kind, const QRectF& rect);

QPainterPath shapeFor(Kind kind, const QRectF& rect);

SegmentGeometry geometry(Segment segment, const QSizeF& parent);

}  // namespace sevenseg
