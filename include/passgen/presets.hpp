#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "passgen/token_pool.hpp"

namespace passgen {

constexpr std::size_t kDefaultWordCount = 6;
constexpr std::size_t kDefaultAsciiCount = 16;
constexpr std::size_t kDefaultNumberCount = 8;

struct Preset {
    std::string_view name;
    std::size_t token_count;
    std::string_view separator;
    const std::vector<std::string>* tokens;

    TokenPool Pool() const;
};

// word, ascii, number. The token lists live for the whole process.
const std::vector<Preset>& BuiltInPresets();
const Preset* FindPreset(std::string_view name);
const Preset& DefaultPreset();

}  // namespace passgen
