//
//  ArgumentsTests.cpp
//  Apple DOS Shim
//
//  Created by Thomas Harte on 19/10/2026.
//  Copyright © 2026 Thomas Harte. All rights reserved.
//

#include "Machines/Apple/DOS/Arguments.hpp"
#include "TestTerminal.hpp"

#include <gtest/gtest.h>

using namespace Apple::DOS;

TEST(Arguments, EmptyTailLeavesEverythingAbsent) {
	const auto arguments = parse_arguments("", "VDSLRBACIO");
	for(const char letter: Arguments::Letters) {
		EXPECT_FALSE(arguments.is_present(letter)) << letter;
		EXPECT_EQ(arguments.value(letter), 0u) << letter;
	}
}

TEST(Arguments, DecimalAndHexadecimalValues) {
	const auto arguments = parse_arguments(",R3,B$1F", "RB");
	EXPECT_EQ(arguments.record(), 3u);
	EXPECT_EQ(arguments.byte(), 31u);
	EXPECT_EQ(arguments.length(), 0u);
	EXPECT_FALSE(arguments.is_present('L'));
}

TEST(Arguments, HexadecimalIsCaseInsensitive) {
	EXPECT_EQ(parse_arguments(",A$c0DE", "A").address(), 0xc0deu);
}

TEST(Arguments, CommasAndWhitespaceAreOptional) {
	const auto spaced = parse_arguments(", S 6 , D 1 ", "SD");
	EXPECT_EQ(spaced.slot(), 6u);
	EXPECT_EQ(spaced.drive(), 1u);

	const auto run_together = parse_arguments("S6D2V254", "SDV");
	EXPECT_EQ(run_together.slot(), 6u);
	EXPECT_EQ(run_together.drive(), 2u);
	EXPECT_EQ(run_together.volume(), 254u);
}

TEST(Arguments, LastRepetitionWins) {
	const auto arguments = parse_arguments(",R1,R7,R4", "R");
	EXPECT_EQ(arguments.record(), 4u);
}

TEST(Arguments, FlagsNeedNoValue) {
	const auto arguments = parse_arguments(",I,O", "ICO");
	EXPECT_TRUE(arguments.is_present('I'));
	EXPECT_TRUE(arguments.is_present('O'));
	EXPECT_FALSE(arguments.is_present('C'));
}

TEST(Arguments, NumericLetterWithoutValueIsPresentAndZero) {
	const auto arguments = parse_arguments(",R", "R");
	EXPECT_TRUE(arguments.is_present('R'));
	EXPECT_EQ(arguments.record(), 0u);
}

TEST(Arguments, DisallowedLetterIsInvalid) {
	Fixtures::expect_fault([] { parse_arguments(",L5", "RB"); }, Error::InvalidOption);
	Fixtures::expect_fault([] { parse_arguments(",I", ""); }, Error::InvalidOption);
}

TEST(Arguments, UnparseableTextIsInvalid) {
	Fixtures::expect_fault([] { parse_arguments(",R3X", "R"); }, Error::InvalidOption);
	Fixtures::expect_fault([] { parse_arguments(",", "R"); }, Error::InvalidOption);
	Fixtures::expect_fault([] { parse_arguments("junk", "R"); }, Error::InvalidOption);
	Fixtures::expect_fault([] { parse_arguments(",B$", "B"); }, Error::InvalidOption);
	Fixtures::expect_fault([] { parse_arguments(",r3", "R"); }, Error::InvalidOption);
}

TEST(Arguments, ValuesMustFitThirtyTwoBits) {
	EXPECT_EQ(parse_arguments(",R4294967295", "R").record(), 4294967295u);
	EXPECT_EQ(parse_arguments(",B$FFFFFFFF", "B").byte(), 0xffffffffu);
	Fixtures::expect_fault([] { parse_arguments(",R4294967296", "R"); }, Error::InvalidOption);
	Fixtures::expect_fault([] { parse_arguments(",B$100000000", "B"); }, Error::InvalidOption);
}
