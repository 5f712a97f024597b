#pragma once

#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>

namespace passgen {

inline std::string TrimAsciiWhitespace(const std::string_view input) {
    std::size_t start = 0;
    std::size_t end = input.size();
    while (start < end && std::isspace(static_cast<unsigned char>(input[start])) != 0) {
        ++start;
    }
    while (end > start && std::isspace(static_cast<unsigned char>(input[end - 1])) != 0) {
        --end;
    }
    return std::string(input.substr(start, end - start));
}

}  // namespace passgen
