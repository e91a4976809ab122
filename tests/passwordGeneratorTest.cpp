// PassShield: Secure Password and Passphrase Generation Tools.
// Copyright (C) 2024  Ian Duncan <dr8co@duck.com>
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see https://www.gnu.org/licenses.

#include "generator/passwordGenerator.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <set>
#include <string>

namespace {

using passshield::CharacterClass;
using passshield::ConfigError;
using passshield::GenerationConfig;

std::size_t countFrom(const passshield::SecureString &password, const std::string_view alphabet) {
    return static_cast<std::size_t>(std::count_if(password.begin(), password.end(), [&](const char ch) {
        return alphabet.find(ch) != std::string_view::npos;
    }));
}

std::string plain(const passshield::SecureString &s) {
    return {s.begin(), s.end()};
}

}  // namespace

namespace passshield {

TEST(PasswordGeneratorTest, DefaultConfig) {
    const GenerationConfig config;
    EXPECT_EQ(config.length, 12);
    EXPECT_FALSE(config.excludeAmbiguous);
    for (const auto cls: ALL_CLASSES) {
        EXPECT_TRUE(config.rule(cls).include);
        EXPECT_EQ(config.rule(cls).minimum, 1);
    }
}

TEST(PasswordGeneratorTest, PasswordLength) {
    GenerationConfig config;
    for (const int length: {4, 5, 12, 31, 128}) {
        config.length = length;
        EXPECT_EQ(generatePassword(config).size(), static_cast<std::size_t>(length));
    }
}

TEST(PasswordGeneratorTest, ContainsEveryIncludedClass) {
    const GenerationConfig config;
    for (int i = 0; i < 50; ++i) {
        const auto password = generatePassword(config);
        for (const auto cls: ALL_CLASSES)
            EXPECT_GE(countFrom(password, baseAlphabet(cls)), 1u) << plain(password);
    }
}

TEST(PasswordGeneratorTest, HonorsMinimumCounts) {
    GenerationConfig config;
    config.length = 16;
    config.lowercase.minimum = 2;
    config.uppercase.minimum = 3;
    config.digits.minimum = 4;
    config.symbols.minimum = 5;

    for (int i = 0; i < 50; ++i) {
        const auto password = generatePassword(config);
        EXPECT_GE(countFrom(password, LOWERCASE_CHARS), 2u) << plain(password);
        EXPECT_GE(countFrom(password, UPPERCASE_CHARS), 3u) << plain(password);
        EXPECT_GE(countFrom(password, DIGIT_CHARS), 4u) << plain(password);
        EXPECT_GE(countFrom(password, SYMBOL_CHARS), 5u) << plain(password);
    }
}

TEST(PasswordGeneratorTest, MinimumsFillingTheWholeLength) {
    GenerationConfig config;
    config.length = 8;
    config.lowercase.minimum = 0;
    config.uppercase.minimum = 0;
    config.digits.minimum = 8;
    config.symbols.minimum = 0;

    const auto password = generatePassword(config);
    EXPECT_EQ(countFrom(password, DIGIT_CHARS), 8u);
}

TEST(PasswordGeneratorTest, ExcludedClassesAreAbsent) {
    GenerationConfig config;
    config.length = 40;
    config.uppercase.include = false;
    config.symbols.include = false;

    for (int i = 0; i < 20; ++i) {
        const auto password = generatePassword(config);
        EXPECT_EQ(countFrom(password, UPPERCASE_CHARS), 0u);
        EXPECT_EQ(countFrom(password, SYMBOL_CHARS), 0u);
        EXPECT_EQ(countFrom(password, LOWERCASE_CHARS) + countFrom(password, DIGIT_CHARS), 40u);
    }
}

TEST(PasswordGeneratorTest, MinimumOfExcludedClassIsIgnored) {
    GenerationConfig config;
    config.length = 4;
    config.symbols.include = false;
    config.symbols.minimum = 10;

    EXPECT_EQ(generatePassword(config).size(), 4u);
}

TEST(PasswordGeneratorTest, ExcludeAmbiguous) {
    GenerationConfig config;
    config.length = 64;
    config.excludeAmbiguous = true;

    for (int i = 0; i < 50; ++i) {
        const auto password = generatePassword(config);
        EXPECT_EQ(countFrom(password, AMBIGUOUS_CHARS), 0u) << plain(password);
    }
}

TEST(PasswordGeneratorTest, AlphabetFiltering) {
    EXPECT_EQ(alphabetFor(CharacterClass::Digit, true), "23456789");
    EXPECT_EQ(alphabetFor(CharacterClass::Lowercase, true), "abcdefghjkmnpqrstuvwxyz");
    EXPECT_EQ(alphabetFor(CharacterClass::Uppercase, true), "ABCDEFGHIJKMNPQRSTUVWXYZ");
    EXPECT_EQ(alphabetFor(CharacterClass::Symbol, true), std::string{SYMBOL_CHARS});
    EXPECT_EQ(alphabetFor(CharacterClass::Digit, false), std::string{DIGIT_CHARS});
}

TEST(PasswordGeneratorTest, RejectsShortLength) {
    GenerationConfig config;
    config.length = 3;
    config.lowercase.minimum = 0;
    config.uppercase.minimum = 0;
    config.digits.minimum = 0;
    config.symbols.minimum = 0;
    EXPECT_THROW(generatePassword(config), ConfigError);

    config.length = -1;
    EXPECT_THROW(generatePassword(config), ConfigError);
}

TEST(PasswordGeneratorTest, RejectsNoClasses) {
    GenerationConfig config;
    for (const auto cls: ALL_CLASSES)
        config.rule(cls).include = false;

    EXPECT_THROW(generatePassword(config), ConfigError);
}

TEST(PasswordGeneratorTest, RejectsMinimumsExceedingLength) {
    GenerationConfig config;
    config.length = 6;
    config.digits.minimum = 4;
    EXPECT_THROW(generatePassword(config), ConfigError);

    config.digits.minimum = 3;
    EXPECT_NO_THROW(generatePassword(config));
}

TEST(PasswordGeneratorTest, RejectsNegativeMinimum) {
    GenerationConfig config;
    config.lowercase.minimum = -1;
    EXPECT_THROW(validateConfig(config), ConfigError);
}

TEST(PasswordGeneratorTest, ConfigErrorIsInvalidArgument) {
    GenerationConfig config;
    config.length = 2;
    EXPECT_THROW(generatePassword(config), std::invalid_argument);
}

TEST(PasswordGeneratorTest, RequiredDrawFromEmptyAlphabetFails) {
    SecureString out;
    EXPECT_THROW(drawRequired(out, "", 1, CharacterClass::Digit), ConfigError);

    EXPECT_NO_THROW(drawRequired(out, "", 0, CharacterClass::Digit));
    EXPECT_TRUE(out.empty());

    drawRequired(out, "ab", 3, CharacterClass::Lowercase);
    EXPECT_EQ(out.size(), 3u);
    EXPECT_EQ(countFrom(out, "ab"), 3u);
}

TEST(PasswordGeneratorTest, RepeatedCallsDiffer) {
    const GenerationConfig config;
    std::set<std::string> seen;
    for (int i = 0; i < 20; ++i)
        seen.insert(plain(generatePassword(config)));

    EXPECT_EQ(seen.size(), 20u);
}

TEST(PasswordGeneratorTest, RequiredCharactersAreNotClustered) {
    // Only one required digit in a digit-free pool: it must not always sit at the front
    GenerationConfig config;
    config.length = 20;
    config.lowercase.minimum = 0;
    config.uppercase.include = false;
    config.symbols.include = false;
    config.digits.minimum = 1;

    std::set<std::size_t> positions;
    for (int i = 0; i < 50; ++i) {
        const auto password = generatePassword(config);
        positions.insert(std::find_if(password.begin(), password.end(), [](const char ch) {
            return ch >= '0' && ch <= '9';
        }) - password.begin());
    }
    EXPECT_GT(positions.size(), 1u);
}

TEST(PasswordGeneratorTest, GeneratesBatches) {
    GenerationConfig config;
    config.length = 10;

    const auto passwords = generatePasswords(5, config);
    ASSERT_EQ(passwords.size(), 5u);
    for (const auto &password: passwords)
        EXPECT_EQ(password.size(), 10u);

    EXPECT_TRUE(generatePasswords(0, config).empty());
    EXPECT_THROW(generatePasswords(-1, config), ConfigError);

    config.length = 2;
    EXPECT_THROW(generatePasswords(3, config), ConfigError);
}

TEST(PasswordGeneratorTest, ClassNames) {
    EXPECT_EQ(className(CharacterClass::Lowercase), "lowercase letters");
    EXPECT_EQ(className(CharacterClass::Symbol), "symbols");
}

}  // namespace passshield
