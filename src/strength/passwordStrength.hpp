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

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace passshield {

    /// \brief The outcome of a password strength analysis.
    /// \note The score is not clamped: a password passing every check scores 105.
    /// \p length counts UTF-8 code points.
    struct StrengthReport {
        int score{0};
        std::string strength;
        std::vector<std::string> feedback;
        std::size_t length{0};
        bool hasLowercase{false};
        bool hasUppercase{false};
        bool hasDigits{false};
        bool hasSymbols{false};
    };

    bool hasRepeatedRun(std::u32string_view codePoints) noexcept;

    bool hasRepeatedRun(std::string_view password);

    bool hasSequentialDigits(std::string_view password) noexcept;

    std::string_view strengthLabel(int score) noexcept;

    StrengthReport analyzeStrength(std::string_view password);

}  // namespace passshield
