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

#include "cli/cli.hpp"
#include "utils/utils.hpp"
#include <csignal>
#include <cstdio>
#include <iostream>
#include <unistd.h>
#include <sys/resource.h>

using namespace passshield;

int main(const int argc, const char **argv) {
    // Disable core dumping, so generated passwords cannot end up in a core file
    if (constexpr rlimit coreLimit{0, 0}; setrlimit(RLIMIT_CORE, &coreLimit) != 0) {
        printColoredErrorln('r', "Failed to disable core dumps.");
        return 1;
    }

    // Handle the keyboard interrupt (SIGINT) signal (i.e., Ctrl+C)
    struct sigaction act{};
    act.sa_handler = [](int /* unused */) noexcept -> void {
        constexpr char message[] = "\nOperation cancelled by user.\n";
        // Only async-signal-safe calls here. Echo may be off while a password is typed.
        restoreTerminal();
        [[maybe_unused]] const auto written = write(STDERR_FILENO, message, sizeof message - 1);
        _exit(1);
    };

    // Block all other signals while the signal handler is running
    sigfillset(&act.sa_mask);

    if (sigaction(SIGINT, &act, nullptr) == -1) {
        perror("sigaction");
        return 1;
    }

    return runMain(argc, argv, std::cout, std::cerr);
}
