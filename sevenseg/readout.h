#pragma once

#include <QString>
#include <vector>

#include "display.h"

namespace sevenseg {

// width / height of a single display
const qreal DEFAULT_ASPECT_RATIO = 9.0 / 16.0;

struct ReadoutCell {
	QRectF frame;
	DisplayState state;
};
typedef std::vector<ReadoutCell> ReadoutLayout;

// one state per code point, blank where no segments resemble the character
std::vector<DisplayState> statesFor(const QString& text);

// 5% of the total width is shared by the gaps between the displays
qreal spacingFor(qreal total_width, size_t count);

qreal aspectRatioFor(size_t count, qreal per_character = DEFAULT_ASPECT_RATIO);

ReadoutLayout layoutReadout(const std::vector<DisplayState>& states, const QRectF& frame);
ReadoutLayout layoutReadout(const QString& text, const QRectF& frame);

/**
 * A horizontal row of displays sharing one color and skew.
 * Built once from its states, a different text means a new Readout.
 */
class Readout {
	std::vector<DisplayState> m_states;
	QColor m_color;
	Skew m_skew;

   public:
	Readout(std::vector<DisplayState> states, QColor color = DEFAULT_COLOR, Skew skew = Skew::none());

	static Readout resembling(const QString& text, QColor color = DEFAULT_COLOR, Skew skew = Skew::none());

	const std::vector<DisplayState>& states() const { return m_states; }
	const QColor& color() const { return m_color; }
	Skew skew() const { return m_skew; }
	size_t size() const { return m_states.size(); }

	std::vector<Display> displays() const;
	qreal aspectRatio(qreal per_character = DEFAULT_ASPECT_RATIO) const;
	ReadoutLayout layout(const QRectF& frame) const;
	Fills render(const QRectF& frame) const;
};

}  // namespace sevenseg
