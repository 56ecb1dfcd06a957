#include "statpatch/Util.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstdio>

namespace statpatch {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n\f\v");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n\f\v");
    return s.substr(start, end - start + 1);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::toupper(c); });
    return s;
}

bool is_truthy_flag(const std::string& s) {
    return s == "1" || s == "true" || s == "TRUE" || s == "yes" || s == "YES";
}

std::optional<std::string> decode_base64(const std::string& encoded) {
    auto sextet = [](char c) -> int {
        if (c >= 'A' && c <= 'Z') return c - 'A';
        if (c >= 'a' && c <= 'z') return c - 'a' + 26;
        if (c >= '0' && c <= '9') return c - '0' + 52;
        if (c == '+') return 62;
        if (c == '/') return 63;
        return -1;
    };

    std::string input;
    input.reserve(encoded.size());
    for (char c : encoded) {
        if (!std::isspace(static_cast<unsigned char>(c))) input += c;
    }
    // Padding only at the end, at most two characters.
    auto pad = input.find('=');
    if (pad != std::string::npos) {
        if (input.size() - pad > 2) return std::nullopt;
        for (size_t i = pad; i < input.size(); ++i) {
            if (input[i] != '=') return std::nullopt;
        }
        if (input.size() % 4 != 0) return std::nullopt;
        input.erase(pad);
    }
    if (input.size() % 4 == 1) return std::nullopt;

    std::string out;
    out.reserve(input.size() * 3 / 4);
    std::uint32_t buffer = 0;
    int bits = 0;
    for (char c : input) {
        int v = sextet(c);
        if (v < 0) return std::nullopt;
        buffer = (buffer << 6) | static_cast<std::uint32_t>(v);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out += static_cast<char>((buffer >> bits) & 0xFF);
        }
    }
    return out;
}

std::uint64_t fnv1a64(const std::string& data) {
    std::uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : data) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return hash;
}

std::string content_tag(const std::string& data) {
    char buf[19];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(fnv1a64(data)));
    return "\"" + std::string(buf) + "\"";
}

std::optional<std::string> get_env_var(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (!value) return std::nullopt;
    return std::string(value);
}

} // namespace statpatch
