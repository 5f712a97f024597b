#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "osrng.h"
#include "passgen/token_pool.hpp"
#include "test_rng.hpp"

using passgen::GenStatus;
using passgen::TokenPool;

namespace {

std::filesystem::path WriteTempFile(const std::string& name, const std::string& contents) {
    const auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << contents;
    return path;
}

const std::vector<std::string>& Letters() {
    static const std::vector<std::string> letters = {"a", "b", "c", "d", "e"};
    return letters;
}

}  // namespace

TEST(TokenPoolTest, DefaultPoolIsEmpty) {
    TokenPool pool;
    EXPECT_EQ(pool.Size(), 0u);
    EXPECT_TRUE(pool.Empty());
    EXPECT_THROW(pool.At(0), std::out_of_range);
}

TEST(TokenPoolTest, PresetPoolBorrowsList) {
    const TokenPool pool = TokenPool::FromPreset(Letters());
    EXPECT_FALSE(pool.IsOwned());
    ASSERT_EQ(pool.Size(), 5u);
    EXPECT_EQ(pool.At(0), "a");
    EXPECT_EQ(pool.At(4), "e");
    EXPECT_EQ(&pool.At(2), &Letters()[2]);
}

TEST(TokenPoolTest, OwnedPoolKeepsOrder) {
    const TokenPool pool = TokenPool::FromLines({"red", "green", "blue"});
    EXPECT_TRUE(pool.IsOwned());
    ASSERT_EQ(pool.Size(), 3u);
    EXPECT_EQ(pool.At(1), "green");
}

TEST(TokenPoolTest, AtRejectsOutOfRangeIndex) {
    const TokenPool pool = TokenPool::FromLines({"only"});
    EXPECT_THROW(pool.At(1), std::out_of_range);
}

TEST(TokenPoolTest, SampleAlwaysReturnsPoolMember) {
    const TokenPool pool = TokenPool::FromPreset(Letters());
    CryptoPP::AutoSeededRandomPool rng;
    const std::set<std::string> members(Letters().begin(), Letters().end());
    std::set<std::string> seen;
    for (int i = 0; i < 2000; ++i) {
        const std::string& token = pool.Sample(rng);
        ASSERT_TRUE(members.count(token)) << "unexpected token " << token;
        seen.insert(token);
    }
    // 2000 uniform draws over 5 tokens miss one with negligible probability.
    EXPECT_EQ(seen.size(), members.size());
}

TEST(TokenPoolTest, SampleSingleTokenPool) {
    const TokenPool pool = TokenPool::FromLines({"solo"});
    CryptoPP::AutoSeededRandomPool rng;
    for (int i = 0; i < 16; ++i) {
        EXPECT_EQ(pool.Sample(rng), "solo");
    }
}

TEST(TokenPoolTest, SampleUsesInjectedGenerator) {
    const TokenPool pool = TokenPool::FromPreset(Letters());
    passgen_test::FixedByteRng zeros(0x00);
    EXPECT_EQ(pool.Sample(zeros), "a");
    passgen_test::FixedByteRng threes(0x03);
    EXPECT_EQ(pool.Sample(threes), "d");
}

TEST(TokenPoolTest, SampleFromEmptyPoolThrows) {
    const TokenPool pool;
    CryptoPP::AutoSeededRandomPool rng;
    EXPECT_THROW(pool.Sample(rng), std::out_of_range);
}

TEST(TokenPoolFileTest, LoadsFiveLines) {
    const auto path = WriteTempFile("passgen_five.txt", "alpha\nbravo\ncharlie\ndelta\necho\n");
    TokenPool pool;
    ASSERT_EQ(passgen::LoadTokenFile(path.string(), pool), GenStatus::Ok);
    EXPECT_TRUE(pool.IsOwned());
    ASSERT_EQ(pool.Size(), 5u);
    EXPECT_EQ(pool.At(0), "alpha");
    EXPECT_EQ(pool.At(4), "echo");
    std::filesystem::remove(path);
}

TEST(TokenPoolFileTest, TrimsAndSkipsBlankLines) {
    const auto path = WriteTempFile("passgen_messy.txt", "  one \r\n\r\n\ttwo\n   \nthree");
    TokenPool pool;
    ASSERT_EQ(passgen::LoadTokenFile(path.string(), pool), GenStatus::Ok);
    ASSERT_EQ(pool.Size(), 3u);
    EXPECT_EQ(pool.At(0), "one");
    EXPECT_EQ(pool.At(1), "two");
    EXPECT_EQ(pool.At(2), "three");
    std::filesystem::remove(path);
}

TEST(TokenPoolFileTest, EmptyFileIsRejected) {
    const auto path = WriteTempFile("passgen_blank.txt", "\n  \n\t\n");
    TokenPool pool = TokenPool::FromLines({"kept"});
    EXPECT_EQ(passgen::LoadTokenFile(path.string(), pool), GenStatus::EmptyPool);
    ASSERT_EQ(pool.Size(), 1u);
    EXPECT_EQ(pool.At(0), "kept");
    std::filesystem::remove(path);
}

TEST(TokenPoolFileTest, MissingFileIsIOError) {
    const auto path = std::filesystem::temp_directory_path() / "passgen_does_not_exist.txt";
    std::filesystem::remove(path);
    TokenPool pool;
    EXPECT_EQ(passgen::LoadTokenFile(path.string(), pool), GenStatus::FileIOError);
    EXPECT_TRUE(pool.Empty());
}

TEST(TokenPoolFileTest, DirectoryIsIOError) {
    TokenPool pool;
    EXPECT_EQ(
        passgen::LoadTokenFile(std::filesystem::temp_directory_path().string(), pool),
        GenStatus::FileIOError);
}
