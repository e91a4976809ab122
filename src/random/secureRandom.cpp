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

#include "secureRandom.hpp"
#include <limits>
#include <stdexcept>
#include <sodium.h>

namespace passshield {

    /// \brief Initializes libsodium. Safe to call more than once.
    /// \throws std::runtime_error if the library could not be initialized.
    void initRandom() {
        if (sodium_init() == -1)
            throw std::runtime_error("Failed to initialize libsodium.");
    }

    /// \brief Draws a uniformly distributed integer from the operating system's CSPRNG.
    /// \param upperBound the exclusive upper bound.
    /// \return an integer in [0, upperBound).
    /// \throws std::invalid_argument if upperBound is zero.
    std::uint32_t uniformBelow(const std::uint32_t upperBound) {
        if (upperBound == 0)
            throw std::invalid_argument("Cannot draw from an empty range.");

        // randombytes_uniform() rejects biased samples internally
        return randombytes_uniform(upperBound);
    }

    /// \brief Picks one character of an alphabet uniformly at random.
    /// \param alphabet the characters to choose from.
    /// \return the chosen character.
    /// \throws std::invalid_argument if the alphabet is empty or too large.
    char pickFrom(const std::string_view alphabet) {
        if (alphabet.size() > std::numeric_limits<std::uint32_t>::max())
            throw std::invalid_argument("Alphabet is too large.");

        return alphabet[uniformBelow(static_cast<std::uint32_t>(alphabet.size()))];
    }

}  // namespace passshield
