#include "passgen/entropy_reporter.hpp"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

#ifndef _WIN32
#include <sys/wait.h>
#endif

#include "passgen/text_util.hpp"

namespace passgen {

namespace {

struct GuessRate {
    std::string_view label;
    double work_bits;
};

constexpr std::array<GuessRate, 3> kGuessRates = {{
    {"1 billion / second", 31.0},
    {"1 quadrillion / second", 51.0},
    {"1 sextillion / second", 71.0},
}};

constexpr double kExponentialThreshold = 1e6;

// "2e+09" -> "2e+9"
std::string StripExponentPadding(const std::string& value) {
    const std::size_t marker = value.find("e+");
    if (marker == std::string::npos) {
        return value;
    }
    std::size_t digits = marker + 2;
    while (digits + 1 < value.size() && value[digits] == '0') {
        ++digits;
    }
    return value.substr(0, marker + 2) + value.substr(digits);
}

bool ParseWidth(const std::string_view text, std::size_t& out_width) {
    const std::string trimmed = TrimAsciiWhitespace(text);
    if (trimmed.empty()) {
        return false;
    }
    for (const char c : trimmed) {
        if (std::isdigit(static_cast<unsigned char>(c)) == 0) {
            return false;
        }
    }
    try {
        const unsigned long parsed = std::stoul(trimmed);
        if (parsed == 0) {
            return false;
        }
        out_width = static_cast<std::size_t>(parsed);
        return true;
    } catch (const std::out_of_range&) {
        return false;
    }
}

void PrintLine(std::ostream& out, const std::string_view label, const std::string& value) {
    out << std::left << std::setw(28) << label << value << "\n";
}

}  // namespace

EntropyReport EntropyReporter::Compute(const double pool_size, const double token_count) {
    EntropyReport report;
    report.entropy_per_token = std::log2(pool_size);
    report.total_entropy = report.entropy_per_token * token_count;
    for (std::size_t i = 0; i < kGuessRates.size(); ++i) {
        report.guess_times[i].label = kGuessRates[i].label;
        report.guess_times[i].seconds = std::exp2(report.total_entropy - kGuessRates[i].work_bits);
    }
    return report;
}

std::string EntropyReporter::FormatDuration(const double seconds) {
    if (seconds < 1.0) {
        return "less than a second";
    }
    if (seconds < kMinute) {
        return FormatUnit(seconds, "seconds");
    }
    if (seconds < kHour) {
        return FormatUnit(seconds / kMinute, "minutes");
    }
    if (seconds < kDay) {
        return FormatUnit(seconds / kHour, "hours");
    }
    if (seconds < kYear) {
        return FormatUnit(seconds / kDay, "days");
    }
    if (seconds < kCentury) {
        return FormatUnit(seconds / kYear, "years");
    }
    return FormatUnit(seconds / kCentury, "centuries");
}

std::string EntropyReporter::FormatUnit(const double value, const std::string_view unit) {
    std::ostringstream out;
    if (value < kExponentialThreshold) {
        out << std::fixed << std::setprecision(0) << value;
    } else {
        std::ostringstream scientific;
        scientific << std::scientific << std::setprecision(0) << value;
        out << StripExponentPadding(scientific.str());
    }
    out << ' ' << unit;
    return out.str();
}

void EntropyReporter::Print(
    const EntropyReport& report,
    std::ostream& out,
    const TerminalWidthProvider& width_provider) {
    std::ostringstream per_token;
    per_token << std::fixed << std::setprecision(1) << report.entropy_per_token << " bits";
    std::ostringstream total;
    total << std::fixed << std::setprecision(0) << report.total_entropy << " bits";

    PrintLine(out, "entropy per token:", per_token.str());
    PrintLine(out, "total entropy:", total.str());
    out << "guess times:\n";
    for (const auto& guess : report.guess_times) {
        PrintLine(out, "  " + std::string(guess.label) + ":", FormatDuration(guess.seconds));
    }

    const std::size_t width = width_provider ? width_provider() : kDefaultTerminalWidth;
    out << std::string(width, '-') << "\n";
}

void EntropyReporter::Print(const EntropyReport& report, std::ostream& out) {
    Print(report, out, &EntropyReporter::QueryTerminalWidth);
}

std::size_t EntropyReporter::QueryTerminalWidth() {
#ifdef _WIN32
    std::FILE* pipe = _popen("tput cols", "r");
#else
    std::FILE* pipe = popen("tput cols", "r");
#endif
    if (pipe == nullptr) {
        return kDefaultTerminalWidth;
    }

    std::string output;
    char buffer[64];
    while (std::fgets(buffer, sizeof(buffer), pipe) != nullptr) {
        output += buffer;
    }

#ifdef _WIN32
    const int status = _pclose(pipe);
    const bool exited_ok = status == 0;
#else
    const int status = pclose(pipe);
    const bool exited_ok = status != -1 && WIFEXITED(status) && WEXITSTATUS(status) == 0;
#endif
    if (!exited_ok) {
        return kDefaultTerminalWidth;
    }

    std::size_t width = 0;
    if (!ParseWidth(output, width)) {
        return kDefaultTerminalWidth;
    }
    return width;
}

}  // namespace passgen
