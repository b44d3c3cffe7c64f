#include "readout.h"

#include <algorithm>

namespace sevenseg {

std::vector<DisplayState> statesFor(const QString& text) {
	std::vector<DisplayState> states;
	for (uint ucs4 : text.toUcs4()) {
		states.push_back(displayState(static_cast<Character>(ucs4)).value_or(blankDisplayState()));
	}
	return states;
}

qreal spacingFor(qreal total_width, size_t count) {
	if (count <= 1) {
		return 0;
	}
	return (total_width / 20) / std::max<size_t>(1, count - 1);
}

qreal aspectRatioFor(size_t count, qreal per_character) {
	if (count == 0) {
		return per_character;
	}
	return per_character * count;
}

ReadoutLayout layoutReadout(const std::vector<DisplayState>& states, const QRectF& frame) {
	ReadoutLayout cells;
	if (states.empty()) {
		return cells;
	}
	const size_t count = states.size();
	const qreal spacing = spacingFor(frame.width(), count);
	const qreal cell_width = std::max<qreal>(0, (frame.width() - spacing * (count - 1)) / count);

	cells.reserve(count);
	for (size_t i = 0; i < count; i++) {
		const QRectF cell(frame.left() + i * (cell_width + spacing), frame.top(), cell_width, frame.height());
		cells.push_back(ReadoutCell{cell, states[i]});
	}
	return cells;
}

ReadoutLayout layoutReadout(const QString& text, const QRectF& frame) {
	return layoutReadout(statesFor(text), frame);
}

/* Readout */

Readout::Readout(std::vector<DisplayState> states, QColor color, Skew skew)
    : m_states(std::move(states)), m_color(color), m_skew(skew) {}

Readout Readout::resembling(const QString& text, QColor color, Skew skew) {
	return Readout(statesFor(text), color, skew);
}

std::vector<Display> Readout::displays() const {
	std::vector<Display> displays;
	displays.reserve(m_states.size());
	for (DisplayState state : m_states) {
		displays.emplace_back(state, m_color, m_skew);
	}
	return displays;
}

qreal Readout::aspectRatio(qreal per_character) const {
	return aspectRatioFor(m_states.size(), per_character);
}

ReadoutLayout Readout::layout(const QRectF& frame) const {
	return layoutReadout(m_states, frame);
}

Fills Readout::render(const QRectF& frame) const {
	Fills fills;
	fills.reserve(m_states.size() * SEGMENTS.size());
	for (const ReadoutCell& cell : layout(frame)) {
		Fills cell_fills = sevenseg::render(cell.state, m_color, m_skew, cell.frame);
		fills.insert(fills.end(), cell_fills.begin(), cell_fills.end());
	}
	return fills;
}

}  // namespace sevenseg
