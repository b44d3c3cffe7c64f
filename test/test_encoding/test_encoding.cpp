#include <unity.h>

#include "sevenseg/encoding.h"

using namespace sevenseg;

void setUp(void) {}
void tearDown(void) {}

static uint8_t maskOf(Character character, bool allow_case_toggle = true) {
	auto state = displayState(character, allow_case_toggle);
	TEST_ASSERT_TRUE_MESSAGE(state.has_value(), "character is not representable");
	return state ? state->mask() : 0xFF;
}

void test_digits(void) {
	const uint8_t expected[10] = {0x3F, 0x06, 0x5B, 0x4F, 0x66, 0x6D, 0x7D, 0x07, 0x7F, 0x6F};
	for (unsigned i = 0; i < 10; i++) {
		TEST_ASSERT_EQUAL_HEX8(expected[i], maskOf(U'0' + i, false));
	}
}

void test_uppercase_table(void) {
	TEST_ASSERT_EQUAL_HEX8(0x77, maskOf(U'A', false));
	TEST_ASSERT_EQUAL_HEX8(0x39, maskOf(U'C', false));
	TEST_ASSERT_EQUAL_HEX8(0x79, maskOf(U'E', false));
	TEST_ASSERT_EQUAL_HEX8(0x71, maskOf(U'F', false));
	TEST_ASSERT_EQUAL_HEX8(0x76, maskOf(U'H', false));
	TEST_ASSERT_EQUAL_HEX8(0x06, maskOf(U'I', false));
	TEST_ASSERT_EQUAL_HEX8(0x1E, maskOf(U'J', false));
	TEST_ASSERT_EQUAL_HEX8(0x38, maskOf(U'L', false));
	TEST_ASSERT_EQUAL_HEX8(0x3F, maskOf(U'O', false));
	TEST_ASSERT_EQUAL_HEX8(0x73, maskOf(U'P', false));
	TEST_ASSERT_EQUAL_HEX8(0x6D, maskOf(U'S', false));
	TEST_ASSERT_EQUAL_HEX8(0x3E, maskOf(U'U', false));
	TEST_ASSERT_EQUAL_HEX8(0x5B, maskOf(U'Z', false));
}

void test_lowercase_table(void) {
	TEST_ASSERT_EQUAL_HEX8(0x5F, maskOf(U'a', false));
	TEST_ASSERT_EQUAL_HEX8(0x7C, maskOf(U'b', false));
	TEST_ASSERT_EQUAL_HEX8(0x58, maskOf(U'c', false));
	TEST_ASSERT_EQUAL_HEX8(0x5E, maskOf(U'd', false));
	TEST_ASSERT_EQUAL_HEX8(0x7B, maskOf(U'e', false));
	TEST_ASSERT_EQUAL_HEX8(0x71, maskOf(U'f', false));
	TEST_ASSERT_EQUAL_HEX8(0x6F, maskOf(U'g', false));
	TEST_ASSERT_EQUAL_HEX8(0x74, maskOf(U'h', false));
	TEST_ASSERT_EQUAL_HEX8(0x04, maskOf(U'i', false));
	TEST_ASSERT_EQUAL_HEX8(0x1E, maskOf(U'j', false));
	TEST_ASSERT_EQUAL_HEX8(0x30, maskOf(U'l', false));
	TEST_ASSERT_EQUAL_HEX8(0x54, maskOf(U'n', false));
	TEST_ASSERT_EQUAL_HEX8(0x5C, maskOf(U'o', false));
	TEST_ASSERT_EQUAL_HEX8(0x73, maskOf(U'p', false));
	TEST_ASSERT_EQUAL_HEX8(0x67, maskOf(U'q', false));
	TEST_ASSERT_EQUAL_HEX8(0x50, maskOf(U'r', false));
	TEST_ASSERT_EQUAL_HEX8(0x6D, maskOf(U's', false));
	TEST_ASSERT_EQUAL_HEX8(0x78, maskOf(U't', false));
	TEST_ASSERT_EQUAL_HEX8(0x1C, maskOf(U'u', false));
	TEST_ASSERT_EQUAL_HEX8(0x6E, maskOf(U'y', false));
	TEST_ASSERT_EQUAL_HEX8(0x5B, maskOf(U'z', false));
}

void test_space_and_punctuation(void) {
	TEST_ASSERT_EQUAL_HEX8(0x00, maskOf(U' ', false));
	TEST_ASSERT_EQUAL_HEX8(0x40, maskOf(U'-', false));
	TEST_ASSERT_EQUAL_HEX8(0x08, maskOf(U'_', false));
	TEST_ASSERT_EQUAL_HEX8(0x48, maskOf(U'=', false));
	TEST_ASSERT_EQUAL_HEX8(0x02, maskOf(U'\'', false));

	TEST_ASSERT_FALSE(displayState(U'?').has_value());
	TEST_ASSERT_FALSE(displayState(U'.').has_value());
	TEST_ASSERT_FALSE(displayState(U'\n').has_value());
	TEST_ASSERT_FALSE(displayState(U'\U0001F600').has_value());
}

void test_missing_letters_without_toggle(void) {
	for (Character c : {U'B', U'D', U'G', U'K', U'M', U'N', U'Q', U'R', U'T', U'V', U'W', U'X', U'Y'}) {
		TEST_ASSERT_FALSE(displayState(c, false).has_value());
	}
	for (Character c : {U'k', U'm', U'v', U'w', U'x'}) {
		TEST_ASSERT_FALSE(displayState(c, false).has_value());
	}
}

void test_case_toggle_fallback(void) {
	// only one case listed, both cases show the same segments
	TEST_ASSERT_EQUAL_HEX8(maskOf(U'b'), maskOf(U'B'));
	TEST_ASSERT_EQUAL_HEX8(maskOf(U'd'), maskOf(U'D'));
	TEST_ASSERT_EQUAL_HEX8(maskOf(U't'), maskOf(U'T'));
	TEST_ASSERT_EQUAL_HEX8(maskOf(U'y'), maskOf(U'Y'));

	// neither case listed
	for (Character c : {U'K', U'M', U'V', U'W', U'X', U'k', U'm', U'v', U'w', U'x'}) {
		TEST_ASSERT_FALSE(displayState(c).has_value());
	}

	// both cases listed, the verbatim entry wins
	TEST_ASSERT_EQUAL_HEX8(0x77, maskOf(U'A'));
	TEST_ASSERT_EQUAL_HEX8(0x5F, maskOf(U'a'));
	TEST_ASSERT_EQUAL_HEX8(0x39, maskOf(U'C'));
	TEST_ASSERT_EQUAL_HEX8(0x58, maskOf(U'c'));
}

void test_toggle_case(void) {
	TEST_ASSERT_TRUE(toggleCase(U'a') == U'A');
	TEST_ASSERT_TRUE(toggleCase(U'Q') == U'q');
	TEST_ASSERT_TRUE(toggleCase(U'\u00e9') == U'\u00c9');
	TEST_ASSERT_TRUE(toggleCase(U'7') == U'7');
	TEST_ASSERT_TRUE(toggleCase(U'=') == U'=');
}

void test_expanding_case_mapping(void) {
	// sharp s uppercases to "SS", the ligature fi to "FI"
	TEST_ASSERT_TRUE(toggleCase(U'\u00df') == U'S');
	TEST_ASSERT_TRUE(toggleCase(U'\ufb01') == U'F');
	TEST_ASSERT_EQUAL_HEX8(0x6D, maskOf(U'\u00df'));
	TEST_ASSERT_EQUAL_HEX8(0x71, maskOf(U'\ufb01'));
	TEST_ASSERT_FALSE(displayState(U'\u00df', false).has_value());
}

void test_table_contents(void) {
	const CharacterEncodings& encodings = characterEncodings();
	TEST_ASSERT_EQUAL_UINT32(49, encodings.size());
	TEST_ASSERT_TRUE(&encodings == &characterEncodings());
	for (auto const& [character, state] : encodings) {
		TEST_ASSERT_FALSE(state.hasPeriod());
	}
}

int main(int, char**) {
	UNITY_BEGIN();
	RUN_TEST(test_digits);
	RUN_TEST(test_uppercase_table);
	RUN_TEST(test_lowercase_table);
	RUN_TEST(test_space_and_punctuation);
	RUN_TEST(test_missing_letters_without_toggle);
	RUN_TEST(test_case_toggle_fallback);
	RUN_TEST(test_toggle_case);
	RUN_TEST(test_expanding_case_mapping);
	RUN_TEST(test_table_contents);
	return UNITY_END();
}
