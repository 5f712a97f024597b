#pragma once

#include <array>
#include <cstddef>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace passgen {

constexpr double kMinute = 60.0;
constexpr double kHour = kMinute * 60.0;
constexpr double kDay = kHour * 24.0;
constexpr double kYear = kDay * 365.25;
constexpr double kCentury = kYear * 100.0;

constexpr std::size_t kDefaultTerminalWidth = 80;

struct GuessEstimate {
    std::string_view label;
    double seconds = 0.0;
};

struct EntropyReport {
    double entropy_per_token = 0.0;
    double total_entropy = 0.0;
    std::array<GuessEstimate, 3> guess_times{};
};

using TerminalWidthProvider = std::function<std::size_t()>;

class EntropyReporter {
public:
    // Guess rates of 1e9, 1e15 and 1e21 per second are approximated as
    // 2^31, 2^51 and 2^71 bits of work.
    static EntropyReport Compute(double pool_size, double token_count);

    static std::string FormatDuration(double seconds);
    static std::string FormatUnit(double value, std::string_view unit);

    // Writes the report followed by a separator line as wide as the terminal.
    static void Print(const EntropyReport& report, std::ostream& out, const TerminalWidthProvider& width_provider);
    static void Print(const EntropyReport& report, std::ostream& out);

    // Runs `tput cols`. Falls back to kDefaultTerminalWidth on any failure.
    static std::size_t QueryTerminalWidth();
};

}  // namespace passgen
