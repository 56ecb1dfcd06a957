#ifndef STATPATCH_UTIL_HPP
#define STATPATCH_UTIL_HPP

#include <cstdint>
#include <optional>
#include <string>

namespace statpatch {

// Strip leading/trailing ASCII whitespace.
std::string trim(const std::string& s);

std::string to_lower(std::string s);
std::string to_upper(std::string s);

// True for the flag spellings accepted in the environment: 1, true, TRUE, yes, YES.
bool is_truthy_flag(const std::string& s);

// Decode standard (RFC 4648) base64, padding optional. nullopt on bad input.
std::optional<std::string> decode_base64(const std::string& encoded);

// 64-bit FNV-1a digest of data.
std::uint64_t fnv1a64(const std::string& data);

// Version tag for a serialized blob: FNV-1a digest as quoted hex, ETag style.
std::string content_tag(const std::string& data);

// Environment lookup: value if the variable is set (even if empty).
std::optional<std::string> get_env_var(const std::string& name);

} // namespace statpatch

#endif // STATPATCH_UTIL_HPP
