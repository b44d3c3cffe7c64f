#include "encoding.h"

#include <QChar>
#include <QString>
#include <QVector>
#include <iostream>

namespace sevenseg {

constexpr bool debug_logging = false;

namespace {
typedef Segment S;
}

const CharacterEncodings& characterEncodings() {
	// clang-format off
	static const CharacterEncodings encodings = {
		{U'0', {S::top, S::topRight, S::bottomRight, S::bottom, S::bottomLeft, S::topLeft}},
		{U'1', {S::topRight, S::bottomRight}},
		{U'2', {S::top, S::topRight, S::center, S::bottomLeft, S::bottom}},
		{U'3', {S::top, S::topRight, S::center, S::bottomRight, S::bottom}},
		{U'4', {S::topLeft, S::topRight, S::center, S::bottomRight}},
		{U'5', {S::top, S::topLeft, S::center, S::bottomRight, S::bottom}},
		{U'6', {S::top, S::topLeft, S::center, S::bottomRight, S::bottom, S::bottomLeft}},
		{U'7', {S::top, S::topRight, S::bottomRight}},
		{U'8', {S::top, S::topRight, S::bottomRight, S::bottom, S::bottomLeft, S::topLeft, S::center}},
		{U'9', {S::bottom, S::bottomRight, S::topRight, S::top, S::topLeft, S::center}},

		{U'A', {S::bottomLeft, S::topLeft, S::top, S::topRight, S::bottomRight, S::center}},
		{U'C', {S::top, S::topLeft, S::bottomLeft, S::bottom}},
		{U'E', {S::top, S::topLeft, S::bottomLeft, S::bottom, S::center}},
		{U'F', {S::top, S::topLeft, S::bottomLeft, S::center}},
		{U'H', {S::topLeft, S::bottomLeft, S::center, S::topRight, S::bottomRight}},
		{U'I', {S::topRight, S::bottomRight}},
		{U'J', {S::topRight, S::bottomRight, S::bottom, S::bottomLeft}},
		{U'L', {S::topLeft, S::bottomLeft, S::bottom}},
		{U'O', {S::top, S::topRight, S::bottomRight, S::bottom, S::bottomLeft, S::topLeft}},
		{U'P', {S::bottomLeft, S::topLeft, S::top, S::topRight, S::center}},
		{U'S', {S::top, S::topLeft, S::center, S::bottomRight, S::bottom}},
		{U'U', {S::topLeft, S::bottomLeft, S::bottom, S::bottomRight, S::topRight}},
		{U'Z', {S::top, S::topRight, S::center, S::bottomLeft, S::bottom}},

		{U'a', {S::top, S::topRight, S::center, S::bottomLeft, S::bottom, S::bottomRight}},
		{U'b', {S::center, S::bottomRight, S::bottom, S::bottomLeft, S::topLeft}},
		{U'c', {S::center, S::bottomLeft, S::bottom}},
		{U'd', {S::center, S::bottomLeft, S::bottom, S::bottomRight, S::topRight}},
		{U'e', {S::center, S::topRight, S::top, S::topLeft, S::bottomLeft, S::bottom}},
		{U'f', {S::bottomLeft, S::topLeft, S::top, S::center}},
		{U'g', {S::center, S::topLeft, S::top, S::topRight, S::bottomRight, S::bottom}},
		{U'h', {S::topLeft, S::bottomLeft, S::center, S::bottomRight}},
		{U'i', {S::bottomRight}},
		{U'j', {S::topRight, S::bottomRight, S::bottom, S::bottomLeft}},
		{U'l', {S::topLeft, S::bottomLeft}},
		{U'n', {S::bottomLeft, S::center, S::bottomRight}},
		{U'o', {S::center, S::bottomRight, S::bottom, S::bottomLeft}},
		{U'p', {S::bottomLeft, S::topLeft, S::top, S::topRight, S::center}},
		{U'q', {S::bottomRight, S::topRight, S::top, S::topLeft, S::center}},
		{U'r', {S::bottomLeft, S::center}},
		{U's', {S::top, S::topLeft, S::center, S::bottomRight, S::bottom}},
		{U't', {S::topLeft, S::bottomLeft, S::bottom, S::center}},
		{U'u', {S::bottomLeft, S::bottom, S::bottomRight}},
		{U'y', {S::topLeft, S::center, S::topRight, S::bottomRight, S::bottom}},
		{U'z', {S::top, S::topRight, S::center, S::bottomLeft, S::bottom}},

		{U' ', DisplayState()},
		{U'-', {S::center}},
		{U'_', {S::bottom}},
		{U'=', {S::center, S::bottom}},
		{U'\'', {S::topRight}},
	};
	// clang-format on
	return encodings;
}

Character toggleCase(Character character) {
	const uint ucs4 = static_cast<uint>(character);
	const QString single = QString::fromUcs4(&ucs4, 1);
	QString toggled;
	if (QChar::isLower(ucs4)) {
		toggled = single.toUpper();
	} else if (QChar::isUpper(ucs4)) {
		toggled = single.toLower();
	} else {
		return character;
	}
	// full case mapping may expand, e.g. U+00DF -> "SS", keep the first character
	const QVector<uint> code_points = toggled.toUcs4();
	if (code_points.isEmpty())
		return character;
	return static_cast<Character>(code_points.first());
}

std::optional<DisplayState> displayState(Character character, bool allow_case_toggle) {
	const CharacterEncodings& encodings = characterEncodings();

	auto it = encodings.find(character);
	if (it != encodings.end()) {
		return it->second;
	}
	if (allow_case_toggle) {
		it = encodings.find(toggleCase(character));
		if (it != encodings.end()) {
			return it->second;
		}
	}
	if (debug_logging)
		std::cout << "[Encoding] no segments resemble U+" << std::hex << uint32_t(character) << std::dec
		          << std::endl;
	return std::nullopt;
}

}  // namespace sevenseg
