#pragma once

#include <QColor>
#include <QPainterPath>
#include <QRectF>
#include <QTransform>
#include <optional>
#include <vector>

#include "encoding.h"
#include "geometry.h"

namespace sevenseg {

// alpha multiplier of segments that are off
const qreal DIM_OPACITY = 0.1;

const QColor DEFAULT_COLOR = QColor("#f72727");

/**
 * Horizontal shear of a whole display, (x, y) -> (x + factor * (y - center_y), y).
 * A negative factor leans the glyphs to the right.
 */
struct Skew {
	qreal factor = 0;

	static Skew none() { return Skew{0}; }
	static Skew traditional() { return Skew{-0.1}; }
	static Skew custom(qreal factor) { return Skew{factor}; }

	bool isNone() const { return factor == 0; }
	// horizontal inset on each side so the sheared glyph stays inside the frame
	qreal padding(qreal frame_width) const;
	// padding actually applied to a frame, grows for frames taller than twice their width
	// and never exceeds half the width, shears steeper than that still leave the frame
	qreal inset(const QRectF& frame) const;
	QTransform transform(const QRectF& frame) const;

	bool operator==(const Skew& other) const { return factor == other.factor; }
	bool operator!=(const Skew& other) const { return factor != other.factor; }
};

struct SegmentFill {
	Segment segment;
	QPainterPath shape;
	QColor color;
	bool lit;
};
typedef std::vector<SegmentFill> Fills;

QColor dimmed(const QColor& color, qreal opacity = DIM_OPACITY);

/**
 * Composes the eight segments of one display inside the given frame.
 * Always returns one fill per segment in ascending bit order, segments that
 * are off get the dimmed color.
 */
Fills render(DisplayState state, const QColor& color, Skew skew, const QRectF& frame);

class Display {
	DisplayState m_state;
	QColor m_color;
	Skew m_skew;

   public:
	Display(DisplayState state, QColor color = DEFAULT_COLOR, Skew skew = Skew::none());

	// no value if the character can't be shown on seven segments
	static std::optional<Display> resembling(Character character, QColor color = DEFAULT_COLOR,
	                                         Skew skew = Skew::none());
	static Display blank(QColor color = DEFAULT_COLOR);

	DisplayState state() const { return m_state; }
	const QColor& color() const { return m_color; }
	Skew skew() const { return m_skew; }

	Fills render(const QRectF& frame) const;
};

}  // namespace sevenseg
