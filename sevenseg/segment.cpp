#include "segment.h"

#include <iomanip>

namespace sevenseg {

Kind kindOf(Segment segment) {
	switch (segment) {
		case Segment::top:
		case Segment::center:
		case Segment::bottom:
			return Kind::horizontal;
		case Segment::topRight:
		case Segment::bottomRight:
		case Segment::bottomLeft:
		case Segment::topLeft:
			return Kind::vertical;
		case Segment::period:
			return Kind::dot;
	}
	return Kind::dot;
}

const char* nameOf(Segment segment) {
	switch (segment) {
		case Segment::top:
			return "top";
		case Segment::topRight:
			return "top_right";
		case Segment::bottomRight:
			return "bottom_right";
		case Segment::bottom:
			return "bottom";
		case Segment::bottomLeft:
			return "bottom_left";
		case Segment::topLeft:
			return "top_left";
		case Segment::center:
			return "center";
		case Segment::period:
			return "period";
	}
	return "undefined";
}

/* DisplayState */

DisplayState::DisplayState(std::initializer_list<Segment> segments) {
	for (Segment segment : segments) {
		m_mask |= bitOf(segment);
	}
}

bool DisplayState::contains(Segment segment) const {
	return (m_mask & bitOf(segment)) != 0;
}

bool DisplayState::hasPeriod() const {
	return contains(Segment::period);
}

DisplayState DisplayState::withPeriod(bool has_period) const {
	if (has_period) {
		return DisplayState(m_mask | bitOf(Segment::period));
	}
	return DisplayState(m_mask & ~bitOf(Segment::period));
}

std::vector<Segment> DisplayState::segments() const {
	std::vector<Segment> lit;
	for (Segment segment : SEGMENTS) {
		if (contains(segment)) {
			lit.push_back(segment);
		}
	}
	return lit;
}

/* Free functions */

DisplayState blankDisplayState() {
	return DisplayState();
}

DisplayState unite(DisplayState a, DisplayState b) {
	return a | b;
}

DisplayState intersect(DisplayState a, DisplayState b) {
	return a & b;
}

bool contains(DisplayState state, Segment segment) {
	return state.contains(segment);
}

DisplayState withPeriod(DisplayState state, bool has_period) {
	return state.withPeriod(has_period);
}

std::vector<Segment> segmentsOf(DisplayState state) {
	return state.segments();
}

std::string toAscii(DisplayState state) {
	auto on = [&state](Segment segment, char c) { return state.contains(segment) ? c : ' '; };

	std::string out;
	out += ' ';
	out += on(Segment::top, '_');
	out += "  \n";
	out += on(Segment::topLeft, '|');
	out += on(Segment::center, '_');
	out += on(Segment::topRight, '|');
	out += " \n";
	out += on(Segment::bottomLeft, '|');
	out += on(Segment::bottom, '_');
	out += on(Segment::bottomRight, '|');
	out += on(Segment::period, '.');
	return out;
}

std::ostream& operator<<(std::ostream& os, Segment segment) {
	return os << nameOf(segment);
}

std::ostream& operator<<(std::ostream& os, DisplayState state) {
	std::ios_base::fmtflags flags(os.flags());
	const char fill = os.fill();
	os << "DisplayState(0x" << std::hex << std::setw(2) << std::setfill('0') << unsigned(state.mask()) << ")";
	os.flags(flags);
	os.fill(fill);
	return os;
}

}  // namespace sevenseg
