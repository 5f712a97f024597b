#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>

#include "passgen/token_pool.hpp"

namespace passgen {

constexpr std::size_t kMaxTokenCount = std::numeric_limits<std::uint32_t>::max();

struct GenConfig {
    bool report = false;
    bool log = false;
    bool help = false;
    std::size_t token_count = 0;
    std::string token_separator;
    TokenPool token_pool;

    // Defaults of the word preset.
    GenConfig();
};

// Folds argv[1..argc) into out_config, left to right. A --preset resets the
// pool, count and separator; report and log survive it. Returns false with a
// human readable message in error on the first bad argument.
bool ParseArgs(int argc, const char* const argv[], GenConfig& out_config, std::string& error);

}  // namespace passgen
