#pragma once

#include <cstddef>
#include <string>
#include <variant>
#include <vector>

#include "passgen/gen_status.hpp"

namespace CryptoPP {
class RandomNumberGenerator;
}

namespace passgen {

// Ordered set of tokens. Either borrows a built-in preset list that lives for
// the whole process or owns lines loaded from a file.
class TokenPool {
public:
    using StaticTokens = const std::vector<std::string>*;
    using OwnedTokens = std::vector<std::string>;

    TokenPool();

    static TokenPool FromPreset(const std::vector<std::string>& tokens);
    static TokenPool FromLines(std::vector<std::string> lines);

    std::size_t Size() const;
    bool Empty() const { return Size() == 0; }
    bool IsOwned() const { return std::holds_alternative<OwnedTokens>(tokens_); }

    // Throws std::out_of_range when index >= Size().
    const std::string& At(std::size_t index) const;

    // Uniform draw from [0, Size()). The pool must not be empty and must hold
    // at most 2^32 tokens.
    const std::string& Sample(CryptoPP::RandomNumberGenerator& rng) const;

private:
    explicit TokenPool(std::variant<StaticTokens, OwnedTokens> tokens);

    std::variant<StaticTokens, OwnedTokens> tokens_;
};

// Reads a newline-delimited token file. Lines are trimmed and blank lines are
// dropped. On any failure out_pool is left untouched.
GenStatus LoadTokenFile(const std::string& path, TokenPool& out_pool);

}  // namespace passgen
