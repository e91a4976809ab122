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

#include <new>
#include <limits>
#include <string>
#include <vector>
#include <sodium.h>

namespace passshield {

    /// \brief Allocator for STL containers holding secrets.
    /// Every block is locked into RAM on allocation, and zeroized and unlocked on release,
    /// so generated passwords never reach swap and do not linger in freed memory.
    /// \tparam T the element type.
    template<typename T>
    struct SecureAllocator {
        using value_type = T;

        SecureAllocator() noexcept = default;

        template<class U>
        SecureAllocator(const SecureAllocator<U> &) noexcept {}

        [[nodiscard]] T *allocate(const std::size_t n) {
            if (n > std::numeric_limits<std::size_t>::max() / sizeof(T))
                throw std::bad_array_new_length();

            auto *p = static_cast<T *>(::operator new(n * sizeof(T)));

            // Locking may fail under a tight RLIMIT_MEMLOCK; the block is still zeroized on release.
            sodium_mlock(p, n * sizeof(T));
            return p;
        }

        void deallocate(T *p, const std::size_t n) noexcept {
            sodium_munlock(p, n * sizeof(T)); // Zeroizes before unlocking
            ::operator delete(p);
        }
    };

    template<class T, class U>
    constexpr bool operator==(const SecureAllocator<T> &, const SecureAllocator<U> &) noexcept {
        return true;
    }

    template<class T, class U>
    constexpr bool operator!=(const SecureAllocator<T> &, const SecureAllocator<U> &) noexcept {
        return false;
    }

    /// A string whose storage is locked and wiped.
    using SecureString = std::basic_string<char, std::char_traits<char>, SecureAllocator<char> >;

    template<typename T>
    using SecureVector = std::vector<T, SecureAllocator<T> >;

}  // namespace passshield
