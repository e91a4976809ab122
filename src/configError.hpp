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

#include <stdexcept>
#include <string>

namespace passshield {

    /// \brief Thrown when generation parameters are invalid.
    class ConfigError : public std::invalid_argument {
    public:
        explicit ConfigError(const std::string &what) : std::invalid_argument(what) {}
    };

    /// \brief Thrown when the command line cannot be understood.
    class UsageError : public std::runtime_error {
    public:
        explicit UsageError(const std::string &what) : std::runtime_error(what) {}
    };

}  // namespace passshield
