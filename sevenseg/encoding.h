#pragma once

#include <optional>
#include <unordered_map>

#include "segment.h"

namespace sevenseg {

typedef char32_t Character;
typedef std::unordered_map<Character, DisplayState> CharacterEncodings;

/**
 * The process-wide character table. Only characters that stay recognizable on
 * seven segments are listed, e.g. there is no uppercase 'B' (it would read as '8').
 */
const CharacterEncodings& characterEncodings();

/**
 * Looks up the segments resembling the given character.
 * If the character is not listed and allow_case_toggle is set, the character
 * with toggled case is tried once. Returns no value if neither is listed,
 * callers show a blank display in that case.
 */
std::optional<DisplayState> displayState(Character character, bool allow_case_toggle = true);

// upper <-> lower, characters without case are returned unchanged.
// Expanding mappings keep their first character.
Character toggleCase(Character character);

}  // namespace sevenseg
