#include "util.hpp"
#include <sstream>
#include <iomanip>
#include <random>
#include <regex>
#include <stdexcept>
#include <cctype>

namespace util {

std::string generate_uuid() {
    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(0, 15);
    std::uniform_int_distribution<> variant(8, 11);

    std::stringstream ss;
    ss << std::hex;
    for (int i = 0; i < 8; i++) ss << dis(gen);
    ss << "-";
    for (int i = 0; i < 4; i++) ss << dis(gen);
    ss << "-4";
    for (int i = 0; i < 3; i++) ss << dis(gen);
    ss << "-";
    ss << variant(gen);
    for (int i = 0; i < 3; i++) ss << dis(gen);
    ss << "-";
    for (int i = 0; i < 12; i++) ss << dis(gen);
    return ss.str();
}

std::string current_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto itt = std::chrono::system_clock::to_time_t(now);
    std::tm tm_utc{};
    gmtime_r(&itt, &tm_utc);
    std::ostringstream ss;
    ss << std::put_time(&tm_utc, "%FT%TZ");
    return ss.str();
}

int64_t current_timestamp_s() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

std::string trim(const std::string& str) {
    size_t start = 0;
    while (start < str.size() && std::isspace(static_cast<unsigned char>(str[start]))) start++;
    size_t end = str.size();
    while (end > start && std::isspace(static_cast<unsigned char>(str[end - 1]))) end--;
    return str.substr(start, end - start);
}

std::vector<std::string> split(const std::string& str, char delim) {
    std::vector<std::string> tokens;
    std::stringstream ss(str);
    std::string token;
    while (std::getline(ss, token, delim)) {
        token = trim(token);
        if (!token.empty()) {
            tokens.push_back(token);
        }
    }
    return tokens;
}

bool is_valid_solana_address(const std::string& address) {
    if (address.length() < 32 || address.length() > 44) {
        return false;
    }
    static const std::regex base58_regex("^[1-9A-HJ-NP-Za-km-z]+$");
    return std::regex_match(address, base58_regex);
}

std::string redact_url(const std::string& url) {
    auto scheme_end = url.find("://");
    auto at = url.find('@');
    if (scheme_end == std::string::npos || at == std::string::npos || at < scheme_end) {
        return url;
    }
    return url.substr(0, scheme_end + 3) + "***" + url.substr(at);
}

std::vector<uint8_t> base64_decode(const std::string& encoded) {
    static const std::string alphabet =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::vector<uint8_t> out;
    out.reserve(encoded.size() * 3 / 4);

    uint32_t buffer = 0;
    int bits = 0;
    for (char c : encoded) {
        if (c == '=') break;
        if (std::isspace(static_cast<unsigned char>(c))) continue;
        auto pos = alphabet.find(c);
        if (pos == std::string::npos) {
            throw std::invalid_argument("invalid base64 character");
        }
        buffer = (buffer << 6) | static_cast<uint32_t>(pos);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<uint8_t>((buffer >> bits) & 0xFF));
        }
    }
    return out;
}

std::string short_address(const std::string& address) {
    if (address.size() <= 8) return address;
    return address.substr(0, 8) + "...";
}

} // namespace util
