#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace chatbridge::utils {

/// Lowercase hex encoding of `bytes` cryptographically random bytes.
auto random_hex(std::size_t bytes = 12) -> std::string;
/// Seconds since the unix epoch.
auto unix_timestamp() -> int64_t;
auto trim(std::string_view s) -> std::string;
auto contains(std::string_view haystack, std::string_view needle) -> bool;
auto to_lower(std::string_view s) -> std::string;

} // namespace chatbridge::utils
