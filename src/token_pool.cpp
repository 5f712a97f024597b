#include "passgen/token_pool.hpp"

#include <cctype>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <string_view>
#include <system_error>
#include <utility>

#include "cryptlib.h"
#include "passgen/text_util.hpp"

namespace passgen {

namespace {

constexpr std::uint64_t kMaxPoolSize = static_cast<std::uint64_t>(std::numeric_limits<std::uint32_t>::max()) + 1ULL;

}  // namespace

TokenPool::TokenPool() : tokens_(OwnedTokens{}) {}

TokenPool::TokenPool(std::variant<StaticTokens, OwnedTokens> tokens) : tokens_(std::move(tokens)) {}

TokenPool TokenPool::FromPreset(const std::vector<std::string>& tokens) {
    return TokenPool(StaticTokens{&tokens});
}

TokenPool TokenPool::FromLines(std::vector<std::string> lines) {
    return TokenPool(OwnedTokens(std::move(lines)));
}

std::size_t TokenPool::Size() const {
    if (const auto* borrowed = std::get_if<StaticTokens>(&tokens_)) {
        return (*borrowed)->size();
    }
    return std::get<OwnedTokens>(tokens_).size();
}

const std::string& TokenPool::At(const std::size_t index) const {
    if (const auto* borrowed = std::get_if<StaticTokens>(&tokens_)) {
        return (*borrowed)->at(index);
    }
    return std::get<OwnedTokens>(tokens_).at(index);
}

const std::string& TokenPool::Sample(CryptoPP::RandomNumberGenerator& rng) const {
    const std::size_t size = Size();
    if (size == 0) {
        throw std::out_of_range("cannot sample from an empty token pool");
    }
    if (static_cast<std::uint64_t>(size) > kMaxPoolSize) {
        throw std::length_error("token pool exceeds 32-bit sampling range");
    }
    const auto max_index = static_cast<CryptoPP::word32>(size - 1);
    return At(static_cast<std::size_t>(rng.GenerateWord32(0, max_index)));
}

GenStatus LoadTokenFile(const std::string& path, TokenPool& out_pool) {
    std::error_code ec;
    if (std::filesystem::is_directory(std::filesystem::path(path), ec)) {
        return GenStatus::FileIOError;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return GenStatus::FileIOError;
    }

    std::vector<std::string> tokens;
    std::string line;
    while (std::getline(file, line)) {
        std::string token = TrimAsciiWhitespace(line);
        if (token.empty()) {
            continue;
        }
        tokens.push_back(std::move(token));
    }
    if (file.bad()) {
        return GenStatus::FileIOError;
    }

    if (tokens.empty()) {
        return GenStatus::EmptyPool;
    }
    if (static_cast<std::uint64_t>(tokens.size()) > kMaxPoolSize) {
        return GenStatus::InvalidLength;
    }
    out_pool = TokenPool::FromLines(std::move(tokens));
    return GenStatus::Ok;
}

}  // namespace passgen
