#pragma once
#include <string>
#include <vector>
#include <chrono>
#include <cstdint>

namespace util {

// Environment variable helpers
std::string get_env_var(const std::string& name, const std::string& default_value = "");
std::string get_required_env_var(const std::string& name);
int get_env_int(const std::string& name, int default_value);
double get_env_double(const std::string& name, double default_value);
bool get_env_bool(const std::string& name, bool default_value);

// String utilities
std::vector<std::string> split_string(const std::string& str, char delimiter);
std::string trim(const std::string& str);
bool starts_with(const std::string& str, const std::string& prefix);

// Time utilities (UTC)
std::string current_iso8601();
std::string format_iso8601(const std::chrono::system_clock::time_point& tp);
std::chrono::system_clock::time_point parse_iso8601(const std::string& iso_string);
std::chrono::system_clock::time_point next_utc_midnight(const std::chrono::system_clock::time_point& tp);

// Amounts. Conversions throw FieldTooLarge when the value does not fit in 64 bits.
constexpr uint64_t LAMPORTS_PER_SOL = 1000000000ULL;
uint64_t sol_to_lamports(double sol);
double lamports_to_sol(int64_t lamports);
uint64_t parse_u64(const std::string& decimal);

// Codecs
std::string base58_encode(const std::vector<uint8_t>& bytes);
std::vector<uint8_t> base58_decode(const std::string& text);
std::string base64_encode(const std::vector<uint8_t>& bytes);
std::vector<uint8_t> base64_decode(const std::string& text);
std::string to_hex(const std::vector<uint8_t>& bytes);
std::vector<uint8_t> from_hex(const std::string& hex);

// Writes to "<path>.tmp" then renames over path. Throws PersistenceError.
void write_file_atomic(const std::string& path, const std::string& contents);

} // namespace util
