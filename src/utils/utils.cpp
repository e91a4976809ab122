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

#include "utils.hpp"
#include <charconv>
#include <csignal>
#include <cstdlib>
#include <stdexcept>
#include <termios.h>
#include <unistd.h>
#include <sodium.h>

namespace passshield {

    constexpr int MAX_PASSPHRASE_LEN = 1024; ///< Maximum length of a password read from the terminal

    namespace {
        // Terminal state saved while echo is off, for restoreTerminal() in a signal handler
        termios savedTerminal{};
        volatile std::sig_atomic_t echoSuppressed{0};
    }

    /// \brief Retrieves the value of an environment variable.
    /// \param var the name of the variable.
    /// \return the value of the variable, or std::nullopt if it is not set.
    std::optional<std::string> getEnv(const char *const var) {
        // Use secure_getenv() if available
#if _GNU_SOURCE
        if (const char *value = secure_getenv(var))
            return value;
#else
        if (const char *value = std::getenv(var))
            return value;
#endif
        return std::nullopt;
    }

    /// \brief Configures the color output of the terminal.
    /// \param disable a flag to indicate whether color output should be disabled.
    void configureColor(const bool disable) noexcept {
        // Check if the user has requested no color
        if (disable) {
            ColorConfig::getInstance().setSuppressColor(true);
            return;
        }
        // Process the environment variables to suppress color output
        try {
            const auto noColorEnv = getEnv("NO_COLOR");
            const auto termEnv = getEnv("TERM");
            const bool suppressColor = noColorEnv.has_value() ||
                                       (termEnv.has_value() && (*termEnv == "dumb" || *termEnv == "emacs")) ||
                                       !isatty(STDOUT_FILENO);
            ColorConfig::getInstance().setSuppressColor(suppressColor);
        } catch (const std::bad_alloc &) {
            ColorConfig::getInstance().setSuppressColor(true);
        }
    }

    /// \brief Parses a decimal integer, rejecting trailing garbage.
    /// \param str the text to parse.
    /// \return the value, or std::nullopt if the text is not an integer in range.
    std::optional<int> parseInt(const std::string_view str) noexcept {
        int value{};
        const char *const end = str.data() + str.size();
        if (const auto [ptr, ec] = std::from_chars(str.data(), end, value); ec == std::errc{} && ptr == end)
            return value;
        return std::nullopt;
    }

    /// \brief Reads sensitive input from a terminal without echoing it.
    /// \param prompt the prompt to display.
    /// \return the user's input.
    /// \throws std::bad_alloc if memory allocation fails.
    /// \throws std::runtime_error if memory locking/unlocking fails.
    SecureString getSensitiveInfo(const std::string_view prompt) {
        // Allocate a guarded buffer for the password
        auto *buffer = static_cast<char *>(sodium_malloc(MAX_PASSPHRASE_LEN));
        if (buffer == nullptr)
            throw std::bad_alloc();

        if (sodium_mlock(buffer, MAX_PASSPHRASE_LEN) == -1) {
            sodium_free(buffer);
            throw std::runtime_error("Failed to lock memory.");
        }

        // Turn off terminal echoing, if reading from a terminal
        const bool interactive = isatty(STDIN_FILENO) != 0 && tcgetattr(STDIN_FILENO, &savedTerminal) == 0;

        if (interactive) {
            termios newSettings = savedTerminal;
            newSettings.c_lflag &= ~ECHO;
            echoSuppressed = 1;
            tcsetattr(STDIN_FILENO, TCSANOW, &newSettings);
        }

        std::cerr << prompt;

        int index = 0; // current position in the buffer
        char ch;
        while (std::cin.get(ch) && ch != '\n') {
            if (ch == '\b') {
                if (index > 0) --index;
            } else if (index < MAX_PASSPHRASE_LEN - 1) {
                buffer[index++] = ch;
            }
        }
        buffer[index] = '\0';

        if (interactive) {
            restoreTerminal();
            std::cerr << std::endl;
        }

        SecureString password{buffer};

        if (sodium_munlock(buffer, MAX_PASSPHRASE_LEN) == -1) {
            sodium_free(buffer);
            throw std::runtime_error("Failed to unlock memory.");
        }
        sodium_free(buffer);

        return password;
    }

    /// \brief Tells whether getSensitiveInfo() currently has terminal echo turned off.
    bool isEchoSuppressed() noexcept {
        return echoSuppressed != 0;
    }

    /// \brief Restores the terminal settings saved by getSensitiveInfo(), if echo is off.
    /// \note Async-signal-safe: it only calls tcsetattr().
    void restoreTerminal() noexcept {
        if (echoSuppressed) {
            tcsetattr(STDIN_FILENO, TCSANOW, &savedTerminal);
            echoSuppressed = 0;
        }
    }

    /// \brief Decodes UTF-8 text into code points.
    /// A byte that does not start a well-formed sequence is kept as a code point of its own,
    /// so every input byte is accounted for.
    /// \param str the text to decode.
    /// \return the code points.
    std::u32string decodeUtf8(const std::string_view str) {
        std::u32string result;
        result.reserve(str.size());

        for (std::size_t i = 0; i < str.size();) {
            const auto lead = static_cast<unsigned char>(str[i]);

            std::size_t extra;
            char32_t cp;
            char32_t minimum;
            if (lead < 0x80) {
                extra = 0, cp = lead, minimum = 0;
            } else if ((lead & 0xE0) == 0xC0) {
                extra = 1, cp = lead & 0x1F, minimum = 0x80;
            } else if ((lead & 0xF0) == 0xE0) {
                extra = 2, cp = lead & 0x0F, minimum = 0x800;
            } else if ((lead & 0xF8) == 0xF0) {
                extra = 3, cp = lead & 0x07, minimum = 0x10000;
            } else {
                result.push_back(lead);
                ++i;
                continue;
            }

            bool valid = i + extra < str.size();
            for (std::size_t k = 1; valid && k <= extra; ++k) {
                const auto next = static_cast<unsigned char>(str[i + k]);
                if ((next & 0xC0) != 0x80)
                    valid = false;
                else cp = (cp << 6) | (next & 0x3F);
            }

            // Reject overlong forms, surrogates and values past U+10FFFF
            if (valid && (cp < minimum || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)))
                valid = false;

            if (valid) {
                result.push_back(cp);
                i += extra + 1;
            } else {
                result.push_back(lead);
                ++i;
            }
        }
        return result;
    }

}  // namespace passshield
