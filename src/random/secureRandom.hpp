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

#include <cstdint>
#include <iterator>
#include <string_view>
#include <utility>

namespace passshield {

    void initRandom();

    std::uint32_t uniformBelow(std::uint32_t upperBound);

    char pickFrom(std::string_view alphabet);

    /// \brief Shuffles a range in place (Fisher-Yates), drawing every swap index from libsodium.
    /// \param first iterator to the first element.
    /// \param last iterator past the last element.
    template<std::random_access_iterator It>
    void secureShuffle(It first, It last) {
        auto n = static_cast<std::uint32_t>(last - first);
        while (n > 1) {
            const std::uint32_t j = uniformBelow(n--);
            using std::swap;
            swap(first[n], first[j]);
        }
    }

}  // namespace passshield
