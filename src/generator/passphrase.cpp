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

#include "passphrase.hpp"
#include "../configError.hpp"
#include "../random/secureRandom.hpp"
#include <array>
#include <cctype>
#include <charconv>
#include <sodium.h>

namespace passshield {

    /// \brief Generates a memorable passphrase.
    ///
    /// Words are drawn independently (with replacement) from WORD_LIST, and a random
    /// number below PASSPHRASE_NUMBER_BOUND is appended as the last segment.
    ///
    /// \param wordCount the number of words.
    /// \param separator the text placed between segments.
    /// \param capitalize whether to upper-case the first letter of each word.
    /// \return the passphrase, e.g. "River-Noble-Storm-Apple-417".
    /// \throws ConfigError if wordCount is less than 1.
    SecureString generatePassphrase(const int wordCount, const std::string_view separator, const bool capitalize) {
        if (wordCount < 1)
            throw ConfigError("A passphrase needs at least one word");

        SecureString passphrase;

        for (int i = 0; i < wordCount; ++i) {
            const std::string_view word = WORD_LIST[uniformBelow(static_cast<std::uint32_t>(WORD_LIST.size()))];

            const std::size_t start = passphrase.size();
            passphrase.append(word.begin(), word.end());

            if (capitalize)
                passphrase[start] = static_cast<char>(std::toupper(static_cast<unsigned char>(passphrase[start])));

            passphrase.append(separator.begin(), separator.end());
        }

        // Formatted on the stack, then wiped
        std::array<char, 4> digits{};
        const auto result = std::to_chars(digits.data(), digits.data() + digits.size(),
                                          uniformBelow(PASSPHRASE_NUMBER_BOUND));
        passphrase.append(digits.data(), result.ptr);
        sodium_memzero(digits.data(), digits.size());

        return passphrase;
    }

}  // namespace passshield
