#pragma once

#include <array>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <ostream>
#include <string>
#include <vector>

namespace sevenseg {

//  0
// 5   1
//  6
// 4   2
//  3   7
enum class Segment : uint8_t {
	top = 0b00000001,
	topRight = 0b00000010,
	bottomRight = 0b00000100,
	bottom = 0b00001000,
	bottomLeft = 0b00010000,
	topLeft = 0b00100000,
	center = 0b01000000,
	period = 0b10000000,
};

enum class Kind { horizontal, vertical, dot };

// ascending bit order
const std::array<Segment, 8> SEGMENTS = {Segment::top,        Segment::topRight, Segment::bottomRight,
                                         Segment::bottom,     Segment::bottomLeft, Segment::topLeft,
                                         Segment::center,     Segment::period};

inline uint8_t bitOf(Segment segment) {
	return static_cast<uint8_t>(segment);
}

Kind kindOf(Segment segment);
const char* nameOf(Segment segment);

/**
 * Set of lit segments for one character position.
 * Plain value type over an 8 bit mask, every "setter" returns a copy.
 */
class DisplayState {
	uint8_t m_mask = 0;

   public:
	DisplayState() = default;
	explicit DisplayState(uint8_t mask) : m_mask(mask) {}
	DisplayState(Segment segment) : m_mask(bitOf(segment)) {}
	DisplayState(std::initializer_list<Segment> segments);

	uint8_t mask() const { return m_mask; }
	bool isBlank() const { return m_mask == 0; }
	bool contains(Segment segment) const;
	bool hasPeriod() const;

	DisplayState withPeriod(bool has_period = true) const;
	std::vector<Segment> segments() const;

	DisplayState operator|(DisplayState other) const { return DisplayState(m_mask | other.m_mask); }
	DisplayState operator&(DisplayState other) const { return DisplayState(m_mask & other.m_mask); }
	bool operator==(DisplayState other) const { return m_mask == other.m_mask; }
	bool operator!=(DisplayState other) const { return m_mask != other.m_mask; }
};

DisplayState blankDisplayState();
DisplayState unite(DisplayState a, DisplayState b);
DisplayState intersect(DisplayState a, DisplayState b);
bool contains(DisplayState state, Segment segment);
DisplayState withPeriod(DisplayState state, bool has_period);
std::vector<Segment> segmentsOf(DisplayState state);

// three lines of four columns, e.g. " _  \n|_| \n|_|." for an '8' with period
std::string toAscii(DisplayState state);

std::ostream& operator<<(std::ostream& os, Segment segment);
std::ostream& operator<<(std::ostream& os, DisplayState state);

}  // namespace sevenseg

namespace std {
template <>
struct hash<sevenseg::DisplayState> {
	size_t operator()(sevenseg::DisplayState state) const { return std::hash<uint8_t>()(state.mask()); }
};
}  // namespace std
