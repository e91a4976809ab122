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

#include "passwordGenerator.hpp"
#include "../random/secureRandom.hpp"

namespace passshield {

    ClassRule &GenerationConfig::rule(const CharacterClass cls) noexcept {
        switch (cls) {
            case CharacterClass::Lowercase:
                return lowercase;
            case CharacterClass::Uppercase:
                return uppercase;
            case CharacterClass::Digit:
                return digits;
            default:
                return symbols;
        }
    }

    const ClassRule &GenerationConfig::rule(const CharacterClass cls) const noexcept {
        return const_cast<GenerationConfig *>(this)->rule(cls);
    }

    /// \brief Returns the full alphabet of a character class.
    std::string_view baseAlphabet(const CharacterClass cls) noexcept {
        switch (cls) {
            case CharacterClass::Lowercase:
                return LOWERCASE_CHARS;
            case CharacterClass::Uppercase:
                return UPPERCASE_CHARS;
            case CharacterClass::Digit:
                return DIGIT_CHARS;
            default:
                return SYMBOL_CHARS;
        }
    }

    /// \brief Returns the alphabet of a character class, optionally without the ambiguous characters.
    /// \param cls the character class.
    /// \param excludeAmbiguous whether to strip the characters in AMBIGUOUS_CHARS.
    /// \return the usable characters of the class.
    std::string alphabetFor(const CharacterClass cls, const bool excludeAmbiguous) {
        std::string alphabet{baseAlphabet(cls)};
        if (excludeAmbiguous) {
            std::erase_if(alphabet, [](const char ch) noexcept {
                return AMBIGUOUS_CHARS.find(ch) != std::string_view::npos;
            });
        }
        return alphabet;
    }

    std::string_view className(const CharacterClass cls) noexcept {
        switch (cls) {
            case CharacterClass::Lowercase:
                return "lowercase letters";
            case CharacterClass::Uppercase:
                return "uppercase letters";
            case CharacterClass::Digit:
                return "digits";
            default:
                return "symbols";
        }
    }

    /// \brief Checks that a configuration can produce a password.
    /// \param config the configuration to check.
    /// \throws ConfigError if the length is below 4, a minimum is negative, no class is included,
    /// a required class has no characters left, or the minimums exceed the length.
    void validateConfig(const GenerationConfig &config) {
        if (config.length < 4)
            throw ConfigError("Password length must be at least 4 characters");

        bool anyIncluded{false};
        long long required{0};

        for (const auto cls: ALL_CLASSES) {
            const ClassRule &rule = config.rule(cls);
            if (!rule.include) continue;

            if (rule.minimum < 0)
                throw ConfigError("Minimum count of " + std::string{className(cls)} + " cannot be negative");

            anyIncluded = true;
            required += rule.minimum;
        }

        if (!anyIncluded)
            throw ConfigError("At least one character type must be selected");

        for (const auto cls: ALL_CLASSES) {
            if (const ClassRule &rule = config.rule(cls);
                rule.include && rule.minimum > 0 && alphabetFor(cls, config.excludeAmbiguous).empty()) {
                throw ConfigError("No " + std::string{className(cls)} + " remain after excluding ambiguous characters");
            }
        }

        if (required > config.length)
            throw ConfigError("Required minimum characters exceed password length");
    }

    /// \brief Appends the characters a class is guaranteed to contribute.
    /// \param out the buffer to append to.
    /// \param alphabet the class's (filtered) alphabet.
    /// \param count how many characters to draw.
    /// \param cls the class, for error reporting.
    /// \throws ConfigError if characters are required from an empty alphabet.
    void drawRequired(SecureString &out, const std::string_view alphabet, const int count, const CharacterClass cls) {
        if (count > 0 && alphabet.empty())
            throw ConfigError("No " + std::string{className(cls)} + " available to satisfy the minimum count");

        for (int i = 0; i < count; ++i)
            out += pickFrom(alphabet);
    }

    /// \brief Generates a random password.
    ///
    /// The required characters of every included class are drawn first, the rest of the
    /// password is filled from the union of the included alphabets, and the result is shuffled
    /// so the required characters do not sit at predictable positions.
    ///
    /// \param config the generation parameters.
    /// \return a password of exactly config.length characters.
    /// \throws ConfigError if the configuration is invalid.
    SecureString generatePassword(const GenerationConfig &config) {
        validateConfig(config);

        std::string pool;
        SecureString password;
        password.reserve(static_cast<std::size_t>(config.length));

        for (const auto cls: ALL_CLASSES) {
            const ClassRule &rule = config.rule(cls);
            if (!rule.include) continue;

            const std::string alphabet = alphabetFor(cls, config.excludeAmbiguous);
            pool += alphabet;
            drawRequired(password, alphabet, rule.minimum, cls);
        }

        while (password.size() < static_cast<std::size_t>(config.length))
            password += pickFrom(pool);

        secureShuffle(password.begin(), password.end());

        return password;
    }

    /// \brief Generates several independent passwords with the same parameters.
    /// \param count the number of passwords. Duplicates are possible.
    /// \param config the generation parameters.
    /// \return the generated passwords.
    /// \throws ConfigError if count is negative or the configuration is invalid.
    SecureVector<SecureString> generatePasswords(const int count, const GenerationConfig config) {
        if (count < 0)
            throw ConfigError("Password count cannot be negative");

        SecureVector<SecureString> passwords;
        passwords.reserve(static_cast<std::size_t>(count));

        for (int i = 0; i < count; ++i)
            passwords.emplace_back(generatePassword(config));

        return passwords;
    }

}  // namespace passshield
