#include "util.hpp"
#include "errors.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace util {

namespace {
const char* BASE58_ALPHABET = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";
}

std::string get_env_var(const std::string& name, const std::string& default_value) {
    const char* value = std::getenv(name.c_str());
    return value ? std::string(value) : default_value;
}

std::string get_required_env_var(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (!value || std::string(value).empty()) {
        throw ValidationError("Required environment variable " + name + " is not set");
    }
    return std::string(value);
}

int get_env_int(const std::string& name, int default_value) {
    const char* value = std::getenv(name.c_str());
    if (!value || *value == '\0') {
        return default_value;
    }
    try {
        size_t pos = 0;
        int result = std::stoi(value, &pos);
        if (pos != std::string(value).size()) {
            throw std::invalid_argument(value);
        }
        return result;
    } catch (const std::exception&) {
        throw ValidationError("Invalid integer value for env var " + name + ": " + value);
    }
}

double get_env_double(const std::string& name, double default_value) {
    const char* value = std::getenv(name.c_str());
    if (!value || *value == '\0') {
        return default_value;
    }
    try {
        size_t pos = 0;
        double result = std::stod(value, &pos);
        if (pos != std::string(value).size()) {
            throw std::invalid_argument(value);
        }
        return result;
    } catch (const std::exception&) {
        throw ValidationError("Invalid numeric value for env var " + name + ": " + value);
    }
}

bool get_env_bool(const std::string& name, bool default_value) {
    std::string value = get_env_var(name);
    if (value.empty()) {
        return default_value;
    }
    std::transform(value.begin(), value.end(), value.begin(), ::tolower);
    if (value == "1" || value == "true" || value == "yes" || value == "on") {
        return true;
    }
    if (value == "0" || value == "false" || value == "no" || value == "off") {
        return false;
    }
    throw ValidationError("Invalid boolean value for env var " + name + ": " + value);
}

std::vector<std::string> split_string(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;
    std::stringstream ss(str);
    std::string token;

    while (std::getline(ss, token, delimiter)) {
        if (!token.empty()) {
            tokens.push_back(token);
        }
    }

    return tokens;
}

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";

    auto end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

bool starts_with(const std::string& str, const std::string& prefix) {
    return str.length() >= prefix.length() &&
           str.compare(0, prefix.length(), prefix) == 0;
}

std::string current_iso8601() {
    return format_iso8601(std::chrono::system_clock::now());
}

std::string format_iso8601(const std::chrono::system_clock::time_point& tp) {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;
    if (ms.count() < 0) {
        ms += std::chrono::milliseconds(1000);
        time_t -= 1;
    }

    std::tm tm = {};
    gmtime_r(&time_t, &tm);

    std::stringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return ss.str();
}

std::chrono::system_clock::time_point parse_iso8601(const std::string& iso_string) {
    std::tm tm = {};
    std::istringstream ss(iso_string);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");

    if (ss.fail()) {
        throw DecodeError("Failed to parse ISO8601 timestamp: " + iso_string);
    }

    // Optional fractional seconds, milliseconds precision
    int millis = 0;
    if (ss.peek() == '.') {
        ss.get();
        std::string digits;
        while (std::isdigit(ss.peek())) {
            digits.push_back(static_cast<char>(ss.get()));
        }
        digits = (digits + "000").substr(0, 3);
        millis = std::stoi(digits);
    }

    auto tp = std::chrono::system_clock::from_time_t(timegm(&tm));
    return tp + std::chrono::milliseconds(millis);
}

std::chrono::system_clock::time_point next_utc_midnight(const std::chrono::system_clock::time_point& tp) {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm = {};
    gmtime_r(&time_t, &tm);
    tm.tm_hour = 0;
    tm.tm_min = 0;
    tm.tm_sec = 0;
    auto midnight = std::chrono::system_clock::from_time_t(timegm(&tm));
    return midnight + std::chrono::hours(24);
}

uint64_t sol_to_lamports(double sol) {
    if (std::isnan(sol) || sol < 0) {
        throw FieldTooLarge("SOL amount out of range: " + std::to_string(sol));
    }
    double lamports = std::floor(sol * static_cast<double>(LAMPORTS_PER_SOL) + 0.5);
    // 2^64 is exactly representable; anything at or above it does not fit
    if (lamports >= 18446744073709551616.0) {
        throw FieldTooLarge("SOL amount does not fit in u64 lamports: " + std::to_string(sol));
    }
    return static_cast<uint64_t>(lamports);
}

double lamports_to_sol(int64_t lamports) {
    return static_cast<double>(lamports) / static_cast<double>(LAMPORTS_PER_SOL);
}

uint64_t parse_u64(const std::string& decimal) {
    if (decimal.empty()) {
        throw DecodeError("Empty integer string");
    }
    uint64_t value = 0;
    for (char c : decimal) {
        if (c < '0' || c > '9') {
            throw DecodeError("Invalid integer string: " + decimal);
        }
        uint64_t digit = static_cast<uint64_t>(c - '0');
        if (value > (std::numeric_limits<uint64_t>::max() - digit) / 10) {
            throw FieldTooLarge("Integer does not fit in u64: " + decimal);
        }
        value = value * 10 + digit;
    }
    return value;
}

std::string base58_encode(const std::vector<uint8_t>& bytes) {
    size_t zeros = 0;
    while (zeros < bytes.size() && bytes[zeros] == 0) {
        ++zeros;
    }

    // Big-endian base-58 digits, repeated division of the byte string
    std::vector<uint8_t> digits((bytes.size() - zeros) * 138 / 100 + 1, 0);
    size_t length = 0;
    for (size_t i = zeros; i < bytes.size(); ++i) {
        int carry = bytes[i];
        size_t j = 0;
        for (auto it = digits.rbegin(); (carry != 0 || j < length) && it != digits.rend(); ++it, ++j) {
            carry += 256 * (*it);
            *it = static_cast<uint8_t>(carry % 58);
            carry /= 58;
        }
        length = j;
    }

    auto it = digits.begin() + (digits.size() - length);
    while (it != digits.end() && *it == 0) {
        ++it;
    }

    std::string result(zeros, '1');
    for (; it != digits.end(); ++it) {
        result.push_back(BASE58_ALPHABET[*it]);
    }
    return result;
}

std::vector<uint8_t> base58_decode(const std::string& text) {
    size_t zeros = 0;
    while (zeros < text.size() && text[zeros] == '1') {
        ++zeros;
    }

    std::vector<uint8_t> bytes((text.size() - zeros) * 733 / 1000 + 1, 0);
    size_t length = 0;
    for (size_t i = zeros; i < text.size(); ++i) {
        const char* pos = std::strchr(BASE58_ALPHABET, text[i]);
        if (pos == nullptr || text[i] == '\0') {
            throw DecodeError("Invalid base58 character in: " + text);
        }
        int carry = static_cast<int>(pos - BASE58_ALPHABET);
        size_t j = 0;
        for (auto it = bytes.rbegin(); (carry != 0 || j < length) && it != bytes.rend(); ++it, ++j) {
            carry += 58 * (*it);
            *it = static_cast<uint8_t>(carry % 256);
            carry /= 256;
        }
        length = j;
    }

    auto it = bytes.begin() + (bytes.size() - length);
    while (it != bytes.end() && *it == 0) {
        ++it;
    }

    std::vector<uint8_t> result(zeros, 0);
    result.insert(result.end(), it, bytes.end());
    return result;
}

std::string base64_encode(const std::vector<uint8_t>& bytes) {
    if (bytes.empty()) {
        return "";
    }
    std::string out(4 * ((bytes.size() + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                  bytes.data(), static_cast<int>(bytes.size()));
    out.resize(static_cast<size_t>(written));
    return out;
}

std::vector<uint8_t> base64_decode(const std::string& text) {
    std::string clean;
    clean.reserve(text.size());
    for (char c : text) {
        if (c != '\n' && c != '\r' && c != ' ') {
            clean.push_back(c);
        }
    }
    if (clean.empty()) {
        return {};
    }
    if (clean.size() % 4 != 0) {
        throw DecodeError("Invalid base64 length");
    }

    std::vector<uint8_t> out(3 * clean.size() / 4);
    int written = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(clean.data()),
                                  static_cast<int>(clean.size()));
    if (written < 0) {
        throw DecodeError("Invalid base64 data");
    }

    // EVP_DecodeBlock keeps the zero bytes produced by '=' padding
    size_t padding = 0;
    if (clean[clean.size() - 1] == '=') ++padding;
    if (clean[clean.size() - 2] == '=') ++padding;
    out.resize(static_cast<size_t>(written) - padding);
    return out;
}

std::string to_hex(const std::vector<uint8_t>& bytes) {
    static const char* digits = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (uint8_t b : bytes) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0f]);
    }
    return out;
}

std::vector<uint8_t> from_hex(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        throw DecodeError("Odd-length hex string");
    }
    std::vector<uint8_t> out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        if (!std::isxdigit(static_cast<unsigned char>(hex[i])) ||
            !std::isxdigit(static_cast<unsigned char>(hex[i + 1]))) {
            throw DecodeError("Invalid hex string: " + hex);
        }
        out.push_back(static_cast<uint8_t>(std::stoi(hex.substr(i, 2), nullptr, 16)));
    }
    return out;
}

void write_file_atomic(const std::string& path, const std::string& contents) {
    std::string tmp_path = path + ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw PersistenceError("Cannot open " + tmp_path + " for writing");
        }
        out << contents;
        out.flush();
        if (!out) {
            throw PersistenceError("Failed writing " + tmp_path);
        }
    }
    if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
        std::remove(tmp_path.c_str());
        throw PersistenceError("Failed to rename " + tmp_path + " to " + path);
    }
}

} // namespace util
