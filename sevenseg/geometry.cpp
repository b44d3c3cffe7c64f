#include "geometry.h"

#include <algorithm>

namespace sevenseg {

QPainterPath SegmentGeometry::path() const {
	return shapeFor(kind, frame);
}

qreal thicknessFor(const QSizeF& parent) {
	return std::max<qreal>(1, std::min(parent.width(), parent.height()) * THICKNESS_RATIO);
}

QSizeF sizeFor(Kind kind, const QSizeF& parent) {
	const qreal thin = thicknessFor(parent);
	const qreal width = parent.width();
	const qreal height = parent.height();
	switch (kind) {
		case Kind::horizontal:
			return QSizeF(std::max<qreal>(0, width - 2.5 * thin), std::min(thin, height));
		case Kind::vertical:
			return QSizeF(std::min(thin, width), std::max<qreal>(0, (height - thin) / 2));
		case Kind::dot:
			break;
	}
	const qreal side = std::min({thin, width, height});
	return QSizeF(side, side);
}

QRectF frameFor(Segment segment, const QSizeF& parent) {
	const qreal thin = thicknessFor(parent);
	const qreal width = parent.width();
	const qreal height = parent.height();
	const QSizeF size = sizeFor(kindOf(segment), parent);

	// columns of the vertical bars, the digit body leaves room for the period
	const qreal xcol1 = 0;
	const qreal xcol2 = std::max<qreal>(0, width - 2.5 * thin);
	const qreal xbar = std::min(thin / 2, width);
	const qreal yrow1 = height / 4 - size.height() / 2;
	const qreal yrow2 = 3 * height / 4 - size.height() / 2;

	QPointF origin;
	switch (segment) {
		case Segment::top:
			origin = QPointF(xbar, 0);
			break;
		case Segment::center:
			origin = QPointF(xbar, (height - size.height()) / 2);
			break;
		case Segment::bottom:
			origin = QPointF(xbar, height - size.height());
			break;
		case Segment::topLeft:
			origin = QPointF(xcol1, yrow1);
			break;
		case Segment::bottomLeft:
			origin = QPointF(xcol1, yrow2);
			break;
		case Segment::topRight:
			origin = QPointF(xcol2, yrow1);
			break;
		case Segment::bottomRight:
			origin = QPointF(xcol2, yrow2);
			break;
		case Segment::period:
			origin = QPointF(width - size.width(), height - size.height());
			break;
	}
	return QRectF(origin, size);
}

QPolygonF outlineFor(Kind kind, const QRectF& rect) {
	const qreal half = std::min(rect.width(), rect.height()) / 2;

	QPolygonF outline;
	if (kind == Kind::horizontal) {
		outline << QPointF(rect.right(), rect.center().y()) << QPointF(rect.right() - half, rect.bottom())
		        << QPointF(rect.left() + half, rect.bottom()) << QPointF(rect.left(), rect.center().y())
		        << QPointF(rect.left() + half, rect.top()) << QPointF(rect.right() - half, rect.top());
	} else if (kind == Kind::vertical) {
		outline << QPointF(rect.center().x(), rect.bottom()) << QPointF(rect.right(), rect.bottom() - half)
		        << QPointF(rect.right(), rect.top() + half) << QPointF(rect.center().x(), rect.top())
		        << QPointF(rect.left(), rect.top() + half) << QPointF(rect.left(), rect.bottom() - half);
	}
	return outline;
}

QPainterPath shapeFor(Kind kind, const QRectF& rect) {
	QPainterPath path;
	if (kind == Kind::dot) {
		path.addEllipse(rect);
	} else {
		path.addPolygon(outlineFor(kind, rect));
		path.closeSubpath();
	}
	return path;
}

SegmentGeometry geometry(Segment segment, const QSizeF& parent) {
	const Kind kind = kindOf(segment);
	const QRectF frame = frameFor(segment, parent);
	return SegmentGeometry{segment, kind, frame, outlineFor(kind, frame), kind == Kind::dot ? frame : QRectF()};
}

}  // namespace sevenseg
