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
#include <array>
#include <cstdint>
#include <string_view>

namespace passshield {

    constexpr std::array<std::string_view, 40> WORD_LIST{
        "apple", "brave", "cloud", "dance", "eagle", "flame", "grace", "happy",
        "imagine", "jungle", "knight", "light", "magic", "nature", "ocean", "peace",
        "quiet", "river", "storm", "tiger", "unity", "village", "wisdom", "xenial",
        "yellow", "zebra", "anchor", "bridge", "castle", "dragon", "earth", "forest",
        "galaxy", "harbor", "island", "journey", "kingdom", "legend", "mountain", "noble"
    };

    /// Exclusive upper bound of the number appended to a passphrase.
    constexpr std::uint32_t PASSPHRASE_NUMBER_BOUND = 1000;

    SecureString generatePassphrase(int wordCount = 4, std::string_view separator = "-", bool capitalize = true);

}  // namespace passshield
