#include "display.h"

#include <algorithm>
#include <cmath>

namespace sevenseg {

/* Skew */

qreal Skew::padding(qreal frame_width) const {
	return std::abs(factor) * frame_width;
}

qreal Skew::inset(const QRectF& frame) const {
	// the shear moves the top and bottom edge by |factor| * height / 2
	const qreal pad = std::abs(factor) * std::max(frame.width(), frame.height() / 2);
	return std::min(pad, frame.width() / 2);
}

QTransform Skew::transform(const QRectF& frame) const {
	// shear around the vertical center so the top and bottom lean equally
	const qreal center_y = frame.center().y();
	return QTransform(1, 0, factor, 1, -factor * center_y, 0);
}

/* Rendering */

QColor dimmed(const QColor& color, qreal opacity) {
	QColor dim = color;
	dim.setAlphaF(color.alphaF() * opacity);
	return dim;
}

Fills render(DisplayState state, const QColor& color, Skew skew, const QRectF& frame) {
	QRectF content = frame;
	if (!skew.isNone()) {
		const qreal pad = skew.inset(frame);
		content = frame.adjusted(pad, 0, -pad, 0);
	}
	const QTransform shear = skew.transform(frame);
	const QColor dim = dimmed(color);

	Fills fills;
	fills.reserve(SEGMENTS.size());
	for (Segment segment : SEGMENTS) {
		const QRectF local = frameFor(segment, content.size()).translated(content.topLeft());
		QPainterPath shape = shapeFor(kindOf(segment), local);
		if (!skew.isNone()) {
			shape = shear.map(shape);
		}
		const bool lit = state.contains(segment);
		fills.push_back(SegmentFill{segment, shape, lit ? color : dim, lit});
	}
	return fills;
}

/* Display */

Display::Display(DisplayState state, QColor color, Skew skew) : m_state(state), m_color(color), m_skew(skew) {}

std::optional<Display> Display::resembling(Character character, QColor color, Skew skew) {
	auto state = displayState(character);
	if (!state) {
		return std::nullopt;
	}
	return Display(*state, color, skew);
}

Display Display::blank(QColor color) {
	return Display(blankDisplayState(), color);
}

Fills Display::render(const QRectF& frame) const {
	return sevenseg::render(m_state, m_color, m_skew, frame);
}

}  // namespace sevenseg
