#include "util.hpp"
#include "errors.hpp"
#include "fakes.hpp"
#include <gtest/gtest.h>
#include <cstdlib>
#include <fstream>
#include <sstream>

using namespace util;

namespace {

std::vector<uint8_t> bytes_of(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

std::string read_file(const std::string& path) {
    std::ifstream in(path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

// Sets a variable for the lifetime of the object
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) { ::setenv(name, value, 1); }
    ~ScopedEnv() { ::unsetenv(name_); }

private:
    const char* name_;
};

} // namespace

TEST(Base58Test, KnownVectors) {
    EXPECT_EQ(base58_encode({}), "");
    EXPECT_EQ(base58_encode(bytes_of("Hello World!")), "2NEpo7TZRRrLZSi2U");
    EXPECT_EQ(base58_encode({0, 0, 1}), "112");
    EXPECT_EQ(base58_encode(std::vector<uint8_t>(32, 0)), "11111111111111111111111111111111");
    EXPECT_EQ(base58_encode(counting_bytes(1, 32)), "4wBqpZM9xaSheZzJSMawUKKwhdpChKbZ5eu5ky4Vigw");
}

TEST(Base58Test, DecodeKeepsLeadingZeros) {
    EXPECT_EQ(base58_decode("112"), (std::vector<uint8_t>{0, 0, 1}));
    EXPECT_EQ(base58_decode("2NEpo7TZRRrLZSi2U"), bytes_of("Hello World!"));
    EXPECT_EQ(base58_decode("4wBqpZM9xaSheZzJSMawUKKwhdpChKbZ5eu5ky4Vigw"), counting_bytes(1, 32));
}

TEST(Base58Test, RejectsCharactersOutsideAlphabet) {
    EXPECT_THROW(base58_decode("0OIl"), DecodeError);
    EXPECT_THROW(base58_decode("abc+"), DecodeError);
}

TEST(Base64Test, EncodesAndDecodesPadding) {
    EXPECT_EQ(base64_encode(bytes_of("hello")), "aGVsbG8=");
    EXPECT_EQ(base64_encode({0xfb, 0xff}), "+/8=");
    EXPECT_EQ(base64_encode({}), "");
    EXPECT_EQ(base64_decode("aGVsbG8="), bytes_of("hello"));
    EXPECT_EQ(base64_decode("aGVs\nbG8="), bytes_of("hello"));
    EXPECT_EQ(base64_decode("+/8="), (std::vector<uint8_t>{0xfb, 0xff}));
    EXPECT_EQ(base64_decode("aGk="), bytes_of("hi"));
}

TEST(Base64Test, RejectsMalformedInput) {
    EXPECT_THROW(base64_decode("abc"), DecodeError);
    EXPECT_THROW(base64_decode("a*c="), DecodeError);
}

TEST(HexTest, RoundTripAndErrors) {
    EXPECT_EQ(to_hex({0x00, 0xab, 0xff}), "00abff");
    EXPECT_EQ(from_hex("00ABff"), (std::vector<uint8_t>{0x00, 0xab, 0xff}));
    EXPECT_THROW(from_hex("abc"), DecodeError);
    EXPECT_THROW(from_hex("zz"), DecodeError);
    EXPECT_THROW(from_hex("-1"), DecodeError);
}

TEST(TimeTest, FormatsMillisecondsInUtc) {
    auto tp = at_utc("2025-03-04T05:06:07.089Z");
    EXPECT_EQ(format_iso8601(tp), "2025-03-04T05:06:07.089Z");
    EXPECT_EQ(format_iso8601(at_utc("2025-03-04T05:06:07Z")), "2025-03-04T05:06:07.000Z");
}

TEST(TimeTest, ParseRejectsGarbage) {
    EXPECT_THROW(parse_iso8601("yesterday"), DecodeError);
}

TEST(TimeTest, NextUtcMidnightIsStrictlyLater) {
    EXPECT_EQ(next_utc_midnight(at_utc("2025-01-01T23:59:59Z")), at_utc("2025-01-02T00:00:00Z"));
    EXPECT_EQ(next_utc_midnight(at_utc("2025-01-02T00:00:00Z")), at_utc("2025-01-03T00:00:00Z"));
    EXPECT_EQ(next_utc_midnight(at_utc("2024-12-31T12:00:00Z")), at_utc("2025-01-01T00:00:00Z"));
}

TEST(AmountTest, SolToLamports) {
    EXPECT_EQ(sol_to_lamports(0.0), 0u);
    EXPECT_EQ(sol_to_lamports(0.01), 10000000u);
    EXPECT_EQ(sol_to_lamports(0.0001), 100000u);
    EXPECT_EQ(sol_to_lamports(1.5), 1500000000u);
    EXPECT_THROW(sol_to_lamports(-0.1), FieldTooLarge);
    EXPECT_THROW(sol_to_lamports(2e10), FieldTooLarge);
    EXPECT_DOUBLE_EQ(lamports_to_sol(-3000000), -0.003);
}

TEST(AmountTest, ParseU64) {
    EXPECT_EQ(parse_u64("0"), 0u);
    EXPECT_EQ(parse_u64("18446744073709551615"), 18446744073709551615ULL);
    EXPECT_THROW(parse_u64("18446744073709551616"), FieldTooLarge);
    EXPECT_THROW(parse_u64("12a"), DecodeError);
    EXPECT_THROW(parse_u64("-1"), DecodeError);
    EXPECT_THROW(parse_u64(""), DecodeError);
}

TEST(StringTest, TrimSplitPrefix) {
    EXPECT_EQ(trim("  x y \n"), "x y");
    EXPECT_EQ(trim(" \t"), "");
    EXPECT_EQ(split_string("a,,b,c", ','), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_TRUE(starts_with("https://node", "https://"));
    EXPECT_FALSE(starts_with("http", "https://"));
}

TEST(AtomicWriteTest, ReplacesContentsWithoutLeftovers) {
    TempDir dir;
    auto path = dir.file("state.json");
    write_file_atomic(path, "first");
    write_file_atomic(path, "second");
    EXPECT_EQ(read_file(path), "second");
    EXPECT_FALSE(std::ifstream(path + ".tmp").good());
}

TEST(AtomicWriteTest, MissingDirectoryIsAPersistenceError) {
    TempDir dir;
    EXPECT_THROW(write_file_atomic(dir.file("absent/state.json"), "x"), PersistenceError);
}

TEST(EnvTest, TypedReaders) {
    ScopedEnv a("LAUNCHER_TEST_INT", "42");
    ScopedEnv b("LAUNCHER_TEST_DOUBLE", "0.25");
    ScopedEnv c("LAUNCHER_TEST_BOOL", "Yes");
    EXPECT_EQ(get_env_int("LAUNCHER_TEST_INT", 1), 42);
    EXPECT_DOUBLE_EQ(get_env_double("LAUNCHER_TEST_DOUBLE", 1.0), 0.25);
    EXPECT_TRUE(get_env_bool("LAUNCHER_TEST_BOOL", false));
    EXPECT_EQ(get_env_int("LAUNCHER_TEST_UNSET", 7), 7);
    EXPECT_EQ(get_env_var("LAUNCHER_TEST_UNSET", "fallback"), "fallback");
    EXPECT_THROW(get_required_env_var("LAUNCHER_TEST_UNSET"), ValidationError);
}

TEST(EnvTest, MalformedValuesAreRejected) {
    ScopedEnv a("LAUNCHER_TEST_INT", "12abc");
    ScopedEnv b("LAUNCHER_TEST_BOOL", "maybe");
    EXPECT_THROW(get_env_int("LAUNCHER_TEST_INT", 1), ValidationError);
    EXPECT_THROW(get_env_bool("LAUNCHER_TEST_BOOL", false), ValidationError);
}
