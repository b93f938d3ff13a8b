#pragma once

#include <algorithm>
#include <array>
#include <charconv>
#include <ostream>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <cstdint>
#include <utcnow.hpp>

namespace utcnow::cli {

enum class Mode : uint8_t { normalize, unixtime, diff, help, version };

/// Parsed command line: the selected mode, its values, and stray options
struct CommandLine {
    Mode mode{Mode::normalize};
    std::vector<std::string> values;
    std::vector<std::string> invalid_options;
};

// === Argument classification ===

/// "-x" and "--xyz" are options, "-1.5" and "-1000" are negative values
inline bool is_option(std::string_view arg) noexcept {
    return !arg.empty() && arg.front() == '-' &&
           !(arg.size() >= 2 && utcnow::detail::is_digit(arg[1]));
}

using FlagSet = std::span<const std::string_view>;

inline bool is_any_of(std::string_view arg, FlagSet names) {
    return std::find(names.begin(), names.end(), arg) != names.end();
}

// "version" and "help" are commands even as bare words
inline constexpr std::array<std::string_view, 3> VERSION_FLAGS = {"-v", "--version", "version"};
inline constexpr std::array<std::string_view, 3> HELP_FLAGS = {"-h", "--help", "help"};
inline constexpr std::array<std::string_view, 2> DIFF_FLAGS = {"-d", "--diff"};
inline constexpr std::array<std::string_view, 4> UNIXTIME_FLAGS = {
    "-u", "--unixtime", "--unixtimestamp", "--unix-timestamp"};

/**
 * Classify arguments.
 *
 * The first matching flag anywhere on the line picks the mode, in the order
 * version, help, diff, unixtime. Mode flags are then dropped; any other
 * option before "--" is collected as invalid, and the first "--" is removed.
 */
inline CommandLine parse_command_line(const std::vector<std::string>& args) {
    CommandLine cmd;
    auto has_flag = [&args](FlagSet flags) {
        return std::any_of(args.begin(), args.end(),
                           [&flags](const std::string& a) { return is_any_of(a, flags); });
    };

    FlagSet mode_flags;
    if (has_flag(VERSION_FLAGS)) {
        cmd.mode = Mode::version;
        return cmd;
    }
    if (has_flag(HELP_FLAGS)) {
        cmd.mode = Mode::help;
        return cmd;
    }
    if (has_flag(DIFF_FLAGS)) {
        cmd.mode = Mode::diff;
        mode_flags = DIFF_FLAGS;
    } else if (has_flag(UNIXTIME_FLAGS)) {
        cmd.mode = Mode::unixtime;
        mode_flags = UNIXTIME_FLAGS;
    }

    bool options_ended = false;
    for (const auto& arg : args) {
        if (is_any_of(arg, mode_flags)) {
            continue;
        }
        if (!options_ended && arg == "--") {
            options_ended = true;
            continue;
        }
        if (!options_ended && is_option(arg)) {
            cmd.invalid_options.push_back(arg);
            continue;
        }
        cmd.values.push_back(arg);
    }
    return cmd;
}

// === Output formatting ===

/// Shortest round-trip fixed notation, always with a fraction ("1000.0")
inline std::string format_unixtime(double value) {
    std::array<char, 64> buf{};
    auto [ptr, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), value,
                                   std::chars_format::fixed);
    std::string out(buf.data(), ec == std::errc{} ? ptr : buf.data());
    if (out.find('.') == std::string::npos) {
        out += ".0";
    }
    return out;
}

/// Seconds with up to six decimals, trailing zeros and dot removed ("1", "0.000001")
inline std::string format_seconds(int64_t micros) {
    std::string out;
    if (micros < 0) {
        out.push_back('-');
    }
    const uint64_t magnitude =
        micros < 0 ? 0 - static_cast<uint64_t>(micros) : static_cast<uint64_t>(micros);
    out += std::to_string(magnitude / 1'000'000);
    std::string fraction = std::to_string(magnitude % 1'000'000);
    fraction.insert(0, 6 - fraction.size(), '0');
    while (!fraction.empty() && fraction.back() == '0') {
        fraction.pop_back();
    }
    if (!fraction.empty()) {
        out += '.';
        out += fraction;
    }
    return out;
}

inline void print_usage(std::ostream& out) {
    out << "usage:\n"
        << "  utcnow [values ...]              | default     output in rfc3339 format\n"
        << "  utcnow --unixtime [values ...]   | short: -u   output as unixtime\n"
        << "  utcnow --diff <from> <to>        | short: -d   diff in seconds: from -> to\n"
        << "\n"
        << "help:\n"
        << "  utcnow --help                    | short: -h   display this message\n"
        << "  utcnow --version                 | short: -v   installed version ("
        << utcnow::version() << ")\n";
}

inline int fail(std::ostream& err, const std::string& detail, std::string_view usage) {
    err << "error:\n  " << detail << "\n";
    if (!usage.empty()) {
        err << "\nusage:\n  " << usage << "\n";
    }
    return 1;
}

inline std::string join(const std::vector<std::string>& parts) {
    std::string out;
    for (const auto& p : parts) {
        if (!out.empty()) {
            out += ' ';
        }
        out += p;
    }
    return out;
}

// === Entry point ===

/**
 * Run the command line tool.
 *
 * Output is written to `out` only when every value converts; otherwise a
 * message goes to `err` and nothing is printed to `out`.
 *
 * @param args Arguments without the program name
 * @param convert Converter to use (tests pass one bound to a frozen Synchronizer)
 * @return Process exit status, 0 on success and 1 on any error
 */
inline int run(const std::vector<std::string>& args, std::ostream& out, std::ostream& err,
               const Converter& convert = Converter{}) {
    const CommandLine cmd = parse_command_line(args);

    switch (cmd.mode) {
        case Mode::version:
            out << utcnow::version() << "\n";
            return 0;

        case Mode::help:
            print_usage(out);
            return 0;

        case Mode::diff: {
            constexpr std::string_view usage = "utcnow --diff <from> <to>";
            if (!cmd.invalid_options.empty()) {
                return fail(err, "invalid option(s) for --diff: " + join(cmd.invalid_options),
                            usage);
            }
            if (cmd.values.size() != 2) {
                return fail(err, "invalid number of arguments, 'from' and 'to' are required.",
                            usage);
            }
            auto from = convert.instant(cmd.values[0]);
            if (!from) {
                return fail(err,
                            "invalid input value for 'from' argument: \"" + cmd.values[0] +
                                "\" (" + from.error().message() + ").",
                            usage);
            }
            auto to = convert.instant(cmd.values[1]);
            if (!to) {
                return fail(err,
                            "invalid input value for 'to' argument: \"" + cmd.values[1] +
                                "\" (" + to.error().message() + ").",
                            usage);
            }
            out << format_seconds((*to - *from).microseconds()) << "\n";
            return 0;
        }

        case Mode::unixtime:
        case Mode::normalize:
        default:
            break;
    }

    const bool as_unixtime = cmd.mode == Mode::unixtime;
    if (!cmd.invalid_options.empty()) {
        return fail(err,
                    std::string(as_unixtime ? "invalid option(s) for --unixtime: "
                                            : "invalid option(s): ") +
                        join(cmd.invalid_options) + ".",
                    as_unixtime ? "utcnow --unixtime [values ...]" : "utcnow [values ...]");
    }

    std::vector<TimestampInput> inputs;
    if (cmd.values.empty()) {
        inputs.emplace_back(Now{});
    }
    for (const auto& v : cmd.values) {
        inputs.emplace_back(v);
    }

    std::string buffer;
    for (const auto& input : inputs) {
        auto instant = convert.instant(input);
        Result<CanonicalString> text =
            instant.and_then([](const Instant& i) { return CanonicalString::from_instant(i); });
        if (!text) {
            return fail(err,
                        "invalid input value: \"" + input.describe() + "\" (" +
                            text.error().message() + ").",
                        {});
        }
        buffer += as_unixtime ? format_unixtime(instant->to_unixtime()) : text->str();
        buffer += '\n';
    }
    out << buffer;
    return 0;
}

} // namespace utcnow::cli
