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

#include "cli.hpp"
#include "../generator/passphrase.hpp"
#include "../random/secureRandom.hpp"
#include "../utils/utils.hpp"
#include <ostream>

namespace passshield {

    /// \brief Parses the command line.
    ///
    /// Valued options take their value from the next argument, or after '=' for long options
    /// (e.g. "--length=20"). When both --analyze and --passphrase are given, --analyze wins.
    ///
    /// \param argc the argument count.
    /// \param argv the arguments, including the program name.
    /// \return the parsed options.
    /// \throws UsageError on an unknown option, a missing value, or a non-numeric count.
    CliOptions parseArguments(const int argc, const char *const *argv) {
        CliOptions options;
        bool passphrase{false};

        for (int i = 1; i < argc; ++i) {
            std::string_view arg{argv[i]};
            std::optional<std::string_view> inlineValue;

            if (arg.starts_with("--")) {
                if (const auto eq = arg.find('='); eq != std::string_view::npos) {
                    inlineValue = arg.substr(eq + 1);
                    arg = arg.substr(0, eq);
                }
            }

            const auto value = [&]() -> std::string_view {
                if (inlineValue) return *inlineValue;
                if (i + 1 < argc) return argv[++i];
                throw UsageError("argument " + std::string{arg} + ": expected one argument");
            };

            const auto number = [&]() -> int {
                const std::string_view text = value();
                if (const auto n = parseInt(text)) return *n;
                throw UsageError("argument " + std::string{arg} + ": invalid int value: '" + std::string{text} + "'");
            };

            // Switches do not take a value
            const auto flag = [&] {
                if (inlineValue)
                    throw UsageError("argument " + std::string{arg} + ": ignored explicit argument '" +
                                     std::string{*inlineValue} + "'");
            };

            if (arg == "-l" || arg == "--length") {
                options.config.length = number();
            } else if (arg == "-c" || arg == "--count") {
                options.count = number();
            } else if (arg == "--no-uppercase") {
                flag();
                options.config.uppercase.include = false;
            } else if (arg == "--no-lowercase") {
                flag();
                options.config.lowercase.include = false;
            } else if (arg == "--no-digits") {
                flag();
                options.config.digits.include = false;
            } else if (arg == "--no-symbols") {
                flag();
                options.config.symbols.include = false;
            } else if (arg == "--exclude-ambiguous") {
                flag();
                options.config.excludeAmbiguous = true;
            } else if (arg == "-p" || arg == "--passphrase") {
                flag();
                passphrase = true;
            } else if (arg == "-w" || arg == "--words") {
                options.words = number();
            } else if (arg == "-s" || arg == "--separator") {
                options.separator = value();
            } else if (arg == "--no-capitalize") {
                flag();
                options.capitalize = false;
            } else if (arg == "-a" || arg == "--analyze") {
                const std::string_view target = value();
                options.analyzeTarget.emplace(target.begin(), target.end());
            } else if (arg == "-nc" || arg == "--no-color") {
                flag();
                options.noColor = true;
            } else if (arg == "-h" || arg == "--help") {
                options.mode = Mode::Help;
                return options;
            } else {
                throw UsageError("unrecognized argument: " + std::string{argv[i]});
            }
        }

        if (options.analyzeTarget)
            options.mode = Mode::Analyze;
        else if (passphrase)
            options.mode = Mode::Passphrase;

        return options;
    }

    void printUsage(std::ostream &os, const std::string_view program) {
        os << "Usage: " << program << " [options]\n\n"
                "Generate random passwords and passphrases, or analyze password strength.\n\n"
                "Options:\n"
                "  -l, --length N          password length (default: 12)\n"
                "  -c, --count N           number of passwords or passphrases (default: 1)\n"
                "      --no-uppercase      exclude uppercase letters\n"
                "      --no-lowercase      exclude lowercase letters\n"
                "      --no-digits         exclude digits\n"
                "      --no-symbols        exclude symbols\n"
                "      --exclude-ambiguous exclude ambiguous characters (il1Lo0O)\n"
                "  -p, --passphrase        generate passphrases instead of passwords\n"
                "  -w, --words N           words per passphrase (default: 4)\n"
                "  -s, --separator S       passphrase separator (default: -)\n"
                "      --no-capitalize     keep passphrase words in lowercase\n"
                "  -a, --analyze PASSWORD  analyze the strength of PASSWORD ('-' to type it in)\n"
                "  -nc, --no-color         disable colored output\n"
                "  -h, --help              show this help and exit\n";
    }

    namespace {
        constexpr char strengthColor(const int score) noexcept {
            if (score >= 70) return 'g';
            if (score >= 50) return 'y';
            return 'r';
        }

        constexpr const char *mark(const bool present) noexcept {
            return present ? "✓" : "✗";
        }
    }

    /// \brief Prints a strength report. The password itself is masked.
    void printAnalysis(std::ostream &os, const std::string_view password, const StrengthReport &report) {
        os << "\nPassword Analysis for: " << std::string(decodeUtf8(password).size(), '*') << '\n';
        os << "Length: " << report.length << '\n';
        os << "Strength: ";
        printColored(os, strengthColor(report.score), report.strength);
        os << '\n';
        os << "Score: " << report.score << "/100\n";

        if (!report.feedback.empty()) {
            printColored(os, 'y', "\nSuggestions for improvement:\n");
            for (const auto &suggestion: report.feedback)
                os << "  • " << suggestion << '\n';
        }

        os << "\nCharacter types present:\n";
        os << "  • Lowercase: " << mark(report.hasLowercase) << '\n';
        os << "  • Uppercase: " << mark(report.hasUppercase) << '\n';
        os << "  • Digits: " << mark(report.hasDigits) << '\n';
        os << "  • Symbols: " << mark(report.hasSymbols) << '\n';
        os.flush();
    }

    /// \brief Carries out the command described by the options.
    /// \param options the parsed command line.
    /// \param os the stream results are written to.
    /// \throws ConfigError if the generation parameters are invalid.
    void run(const CliOptions &options, std::ostream &os) {
        switch (options.mode) {
            case Mode::Help:
                printUsage(os, "passshield");
                return;

            case Mode::Analyze: {
                const SecureString password = *options.analyzeTarget == "-"
                                                  ? getSensitiveInfo("Enter the password to analyze: ")
                                                  : *options.analyzeTarget;
                printAnalysis(os, password, analyzeStrength(password));
                return;
            }

            case Mode::Passphrase:
                if (options.count < 1)
                    throw ConfigError("Count must be at least 1");

                for (int i = 1; i <= options.count; ++i) {
                    const SecureString phrase = generatePassphrase(options.words, options.separator,
                                                                   options.capitalize);
                    printColored(os, 'c', "Passphrase ", i, ": ");
                    printColored(os, 'g', phrase);
                    os << std::endl;
                }
                return;

            case Mode::Passwords: {
                if (options.count < 1)
                    throw ConfigError("Count must be at least 1");

                const auto passwords = generatePasswords(options.count, options.config);
                for (std::size_t i = 0; i < passwords.size(); ++i) {
                    printColored(os, 'c', "Password ", i + 1, ": ");
                    printColored(os, 'g', passwords[i]);
                    os << std::endl;

                    // A single password also gets its strength
                    if (options.count == 1) {
                        const StrengthReport report = analyzeStrength(passwords[i]);
                        os << "Strength: ";
                        printColored(os, strengthColor(report.score), report.strength, " (", report.score, "/100)");
                        os << std::endl;
                    }
                }
                return;
            }
        }
    }

    /// \brief Runs the program: parses the command line, executes it, and maps failures to exit codes.
    /// \param argc the argument count.
    /// \param argv the arguments, including the program name.
    /// \param out the stream results are written to.
    /// \param err the stream usage and errors are written to.
    /// \return 0 on success, 1 on invalid parameters or a runtime failure, 2 on a bad command line.
    int runMain(const int argc, const char *const *argv, std::ostream &out, std::ostream &err) {
        const std::string_view program = argc > 0 ? argv[0] : "passshield";

        configureColor();

        CliOptions options;
        try {
            options = parseArguments(argc, argv);
        } catch (const UsageError &ex) {
            printUsage(err, program);
            printColored(err, 'r', program, ": error: ", ex.what());
            err << std::endl;
            return 2;
        }

        if (options.noColor)
            configureColor(true);

        try {
            initRandom();

            run(options, out);

            return 0;
        } catch (const std::exception &ex) {
            // ConfigError and library failures alike
            printColored(err, 'r', "Error: ", ex.what());
            err << std::endl;
            return 1;
        }
    }

}  // namespace passshield
