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

#include "../generator/passwordGenerator.hpp"
#include "../strength/passwordStrength.hpp"
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace passshield {

    enum class Mode {
        Passwords,
        Passphrase,
        Analyze,
        Help
    };

    /// \brief Everything the command line asked for.
    struct CliOptions {
        Mode mode{Mode::Passwords};
        GenerationConfig config{};
        int count{1};
        int words{4};
        std::string separator{"-"};
        bool capitalize{true};
        bool noColor{false};
        /// The password given to --analyze; "-" means it is read from the terminal.
        std::optional<SecureString> analyzeTarget;
    };

    CliOptions parseArguments(int argc, const char *const *argv);

    void printUsage(std::ostream &os, std::string_view program);

    void printAnalysis(std::ostream &os, std::string_view password, const StrengthReport &report);

    void run(const CliOptions &options, std::ostream &os);

    int runMain(int argc, const char *const *argv, std::ostream &out, std::ostream &err);

}  // namespace passshield
