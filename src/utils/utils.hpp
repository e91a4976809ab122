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
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

namespace passshield {

    /// \class ColorConfig
    /// \brief A singleton holding the terminal color configuration.
    /// There is only one \p suppressColor flag for the whole program.
    class ColorConfig {
    public:
        /// \brief Gets the instance of the \p ColorConfig singleton.
        static ColorConfig &getInstance() noexcept {
            static ColorConfig instance;
            return instance;
        }

        ColorConfig(ColorConfig const &) = delete;

        void operator=(ColorConfig const &) = delete;

        [[nodiscard]] bool getSuppressColor() const noexcept {
            return suppressColor;
        }

        void setSuppressColor(const bool value) noexcept {
            suppressColor = value;
        }

    private:
        ColorConfig() : suppressColor(false) {
        }

        bool suppressColor;
    };

    // Describes a type that can be written to an output stream
    template<typename T>
    concept PrintableToStream = requires(std::ostream &os, const T &t) {
        os << t;
    };

    /// \brief Returns the ANSI color code for the given character.
    /// \param color one of 'r', 'g', 'y', 'b', 'm', 'c', 'w'.
    /// \return the ANSI escape sequence, or an empty string for unknown characters.
    constexpr const char *getColorCode(const char color) noexcept {
        switch (color) {
            case 'r': // Red
                return "\033[1;31m";
            case 'g': // Green
                return "\033[1;32m";
            case 'y': // Yellow
                return "\033[1;33m";
            case 'b': // Blue
                return "\033[1;34m";
            case 'm': // Magenta
                return "\033[1;35m";
            case 'c': // Cyan
                return "\033[1;36m";
            case 'w': // White
                return "\033[1;37m";
            default: // No color
                return "";
        }
    }

    /// \brief Writes colored text to a stream, honoring the color configuration.
    /// \param os the stream to write to.
    /// \param color the color code for the output.
    /// \param args the values to print, in order.
    template<PrintableToStream... Args>
    void printColored(std::ostream &os, const char color, const Args &... args) {
        if (ColorConfig::getInstance().getSuppressColor()) {
            (os << ... << args);
        } else {
            os << getColorCode(color);
            (os << ... << args);
            os << "\033[0m";
        }
    }

    template<PrintableToStream... Args>
    void printColoredErrorln(const char color, const Args &... args) {
        printColored(std::cerr, color, args...);
        std::cerr << std::endl;
    }

    std::optional<std::string> getEnv(const char *var);

    void configureColor(bool disable = false) noexcept;

    std::optional<int> parseInt(std::string_view str) noexcept;

    SecureString getSensitiveInfo(std::string_view prompt = "");

    [[nodiscard]] bool isEchoSuppressed() noexcept;

    void restoreTerminal() noexcept;

    std::u32string decodeUtf8(std::string_view str);

}  // namespace passshield
