#include "passgen/passphrase_generator.hpp"

#include <new>
#include <stdexcept>
#include <utility>

#include "cryptlib.h"
#include "osrng.h"

namespace passgen {

GenStatus PassphraseGenerator::Generate(
    const TokenPool& pool,
    const std::size_t count,
    CryptoPP::RandomNumberGenerator& rng,
    std::vector<std::string>& out_tokens) {
    if (count == 0) {
        return GenStatus::InvalidLength;
    }
    if (pool.Empty()) {
        return GenStatus::EmptyPool;
    }

    std::vector<std::string> tokens;
    try {
        tokens.reserve(count);
        for (std::size_t i = 0; i < count; ++i) {
            tokens.push_back(pool.Sample(rng));
        }
    } catch (const CryptoPP::Exception&) {
        return GenStatus::MissingRngBytes;
    } catch (const std::bad_alloc&) {
        return GenStatus::InvalidLength;
    } catch (const std::length_error&) {
        return GenStatus::InvalidLength;
    }
    out_tokens = std::move(tokens);
    return GenStatus::Ok;
}

GenStatus PassphraseGenerator::Write(
    const TokenPool& pool,
    const std::size_t count,
    const std::string_view separator,
    CryptoPP::RandomNumberGenerator& rng,
    std::ostream& out) {
    if (count == 0) {
        return GenStatus::InvalidLength;
    }
    if (pool.Empty()) {
        return GenStatus::EmptyPool;
    }

    try {
        for (std::size_t i = 0; i < count; ++i) {
            if (i > 0) {
                out << separator;
            }
            out << pool.Sample(rng);
        }
    } catch (const CryptoPP::Exception&) {
        return GenStatus::MissingRngBytes;
    }
    if (!out) {
        return GenStatus::FileIOError;
    }
    return GenStatus::Ok;
}

GenStatus PassphraseGenerator::Write(
    const TokenPool& pool,
    const std::size_t count,
    const std::string_view separator,
    std::ostream& out) {
    try {
        CryptoPP::AutoSeededRandomPool rng;
        return Write(pool, count, separator, rng, out);
    } catch (const CryptoPP::Exception&) {
        return GenStatus::MissingRngBytes;
    }
}

GenStatus PassphraseGenerator::Generate(
    const TokenPool& pool,
    const std::size_t count,
    std::vector<std::string>& out_tokens) {
    try {
        CryptoPP::AutoSeededRandomPool rng;
        return Generate(pool, count, rng, out_tokens);
    } catch (const CryptoPP::Exception&) {
        return GenStatus::MissingRngBytes;
    }
}

std::string PassphraseGenerator::Join(const std::vector<std::string>& tokens, const std::string_view separator) {
    std::string out;
    if (tokens.empty()) {
        return out;
    }
    std::size_t total = 0;
    for (const auto& token : tokens) {
        total += token.size();
    }
    total += (tokens.size() - 1) * separator.size();
    out.reserve(total);

    for (std::size_t i = 0; i < tokens.size(); ++i) {
        if (i > 0) {
            out += separator;
        }
        out += tokens[i];
    }
    return out;
}

}  // namespace passgen
