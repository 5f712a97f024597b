#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "passgen/gen_status.hpp"
#include "passgen/token_pool.hpp"

namespace CryptoPP {
class RandomNumberGenerator;
}

namespace passgen {

class PassphraseGenerator {
public:
    // Draws count tokens from pool with replacement, each draw independent.
    static GenStatus Generate(
        const TokenPool& pool,
        std::size_t count,
        CryptoPP::RandomNumberGenerator& rng,
        std::vector<std::string>& out_tokens);

    // Same as above with a process-local AutoSeededRandomPool.
    static GenStatus Generate(const TokenPool& pool, std::size_t count, std::vector<std::string>& out_tokens);

    // Streams count tokens with separator between them, without holding the
    // passphrase in memory.
    static GenStatus Write(
        const TokenPool& pool,
        std::size_t count,
        std::string_view separator,
        CryptoPP::RandomNumberGenerator& rng,
        std::ostream& out);

    // Same as above with a process-local AutoSeededRandomPool.
    static GenStatus Write(const TokenPool& pool, std::size_t count, std::string_view separator, std::ostream& out);

    static std::string Join(const std::vector<std::string>& tokens, std::string_view separator);
};

}  // namespace passgen
