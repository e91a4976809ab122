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

#pragma once

#include "../secureAllocator.hpp"
#include "../configError.hpp"
#include <array>
#include <string>
#include <string_view>

namespace passshield {

    enum class CharacterClass {
        Lowercase,
        Uppercase,
        Digit,
        Symbol
    };

    /// Classes in the order their required characters are drawn.
    constexpr std::array<CharacterClass, 4> ALL_CLASSES{
        CharacterClass::Lowercase, CharacterClass::Uppercase, CharacterClass::Digit, CharacterClass::Symbol
    };

    constexpr std::string_view LOWERCASE_CHARS = "abcdefghijklmnopqrstuvwxyz";
    constexpr std::string_view UPPERCASE_CHARS = "ABCDEFGHIJKLMNOPQRSTUVWXYZ";
    constexpr std::string_view DIGIT_CHARS = "0123456789";
    constexpr std::string_view SYMBOL_CHARS = "!@#$%^&*()_+-=[]{}|;:,.<>?";

    /// Visually confusable characters, removed on request.
    constexpr std::string_view AMBIGUOUS_CHARS = "il1Lo0O";

    /// \brief Per-class generation settings.
    struct ClassRule {
        bool include{true};
        int minimum{1};
    };

    /// \brief Parameters of a password generation request.
    struct GenerationConfig {
        int length{12};
        ClassRule lowercase{};
        ClassRule uppercase{};
        ClassRule digits{};
        ClassRule symbols{};
        bool excludeAmbiguous{false};

        [[nodiscard]] ClassRule &rule(CharacterClass cls) noexcept;

        [[nodiscard]] const ClassRule &rule(CharacterClass cls) const noexcept;
    };

    std::string_view baseAlphabet(CharacterClass cls) noexcept;

    std::string alphabetFor(CharacterClass cls, bool excludeAmbiguous);

    std::string_view className(CharacterClass cls) noexcept;

    void validateConfig(const GenerationConfig &config);

    void drawRequired(SecureString &out, std::string_view alphabet, int count, CharacterClass cls);

    SecureString generatePassword(const GenerationConfig &config);

    SecureVector<SecureString> generatePasswords(int count, GenerationConfig config);

}  // namespace passshield
