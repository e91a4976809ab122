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

#include "passwordStrength.hpp"
#include "../generator/passwordGenerator.hpp"
#include "../utils/utils.hpp"
#include <array>

namespace passshield {

    namespace {
        constexpr std::array<std::string_view, 9> SEQUENTIAL_DIGITS{
            "012", "123", "234", "345", "456", "567", "678", "789", "890"
        };
    }

    /// \brief Checks for three or more identical consecutive characters (code points, not bytes).
    bool hasRepeatedRun(const std::u32string_view codePoints) noexcept {
        std::size_t run{1};
        for (std::size_t i = 1; i < codePoints.size(); ++i) {
            run = codePoints[i] == codePoints[i - 1] ? run + 1 : 1;
            if (run >= 3) return true;
        }
        return false;
    }

    bool hasRepeatedRun(const std::string_view password) {
        return hasRepeatedRun(decodeUtf8(password));
    }

    /// \brief Checks for an ascending run of three digits, such as "456" or "890".
    bool hasSequentialDigits(const std::string_view password) noexcept {
        for (const auto &sequence: SEQUENTIAL_DIGITS) {
            if (password.find(sequence) != std::string_view::npos)
                return true;
        }
        return false;
    }

    /// \brief Maps a score to its strength label.
    std::string_view strengthLabel(const int score) noexcept {
        if (score >= 85) return "Very Strong";
        if (score >= 70) return "Strong";
        if (score >= 50) return "Moderate";
        if (score >= 30) return "Weak";
        return "Very Weak";
    }

    /// \brief Scores a password against length, character variety and simple pattern checks.
    ///
    /// Scoring is additive: 25/15/5 points for a length of at least 12, 8 to 11, or fewer than 8
    /// characters, 15 points per character class present, and 10 points each for the absence of
    /// repeated runs and of sequential digits. Feedback lists what is missing, in that order.
    /// Lengths and runs are measured in UTF-8 code points.
    ///
    /// \param password the password to analyze.
    /// \return the strength report.
    StrengthReport analyzeStrength(const std::string_view password) {
        const std::u32string codePoints = decodeUtf8(password);

        StrengthReport report;
        report.length = codePoints.size();

        if (report.length >= 12) {
            report.score += 25;
        } else if (report.length >= 8) {
            report.score += 15;
            report.feedback.emplace_back("Consider using at least 12 characters");
        } else {
            report.score += 5;
            report.feedback.emplace_back("Password is too short - use at least 8 characters");
        }

        for (const char32_t cp: codePoints) {
            if (cp >= U'a' && cp <= U'z')
                report.hasLowercase = true;
            else if (cp >= U'A' && cp <= U'Z')
                report.hasUppercase = true;
            else if (cp >= U'0' && cp <= U'9')
                report.hasDigits = true;
            else if (cp < 0x80 && SYMBOL_CHARS.find(static_cast<char>(cp)) != std::string_view::npos)
                report.hasSymbols = true;
        }

        const std::array<bool, 4> present{
            report.hasLowercase, report.hasUppercase, report.hasDigits, report.hasSymbols
        };
        constexpr std::array<const char *, 4> advice{
            "Add lowercase letters", "Add uppercase letters", "Add numbers", "Add special characters"
        };

        for (std::size_t i = 0; i < present.size(); ++i) {
            if (present[i])
                report.score += 15;
            else report.feedback.emplace_back(advice[i]);
        }

        if (!hasRepeatedRun(codePoints))
            report.score += 10;
        else report.feedback.emplace_back("Avoid repeating characters");

        if (!hasSequentialDigits(password))
            report.score += 10;
        else report.feedback.emplace_back("Avoid sequential numbers");

        report.strength = strengthLabel(report.score);

        return report;
    }

}  // namespace passshield
