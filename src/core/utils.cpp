#include "chatbridge/core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <random>
#include <vector>

#include <openssl/rand.h>

namespace chatbridge::utils {

auto random_hex(std::size_t bytes) -> std::string {
    static constexpr std::string_view digits = "0123456789abcdef";

    std::vector<unsigned char> buf(bytes);
    if (bytes > 0 && RAND_bytes(buf.data(), static_cast<int>(bytes)) != 1) {
        // RAND_bytes only fails when the CSPRNG is unseeded; ids do not
        // need cryptographic strength, so fall back to the std engine.
        static thread_local std::mt19937 rng(std::random_device{}());
        std::uniform_int_distribution<int> dist(0, 255);
        for (auto& b : buf) {
            b = static_cast<unsigned char>(dist(rng));
        }
    }

    std::string result;
    result.reserve(bytes * 2);
    for (auto b : buf) {
        result += digits[(b >> 4) & 0x0F];
        result += digits[b & 0x0F];
    }
    return result;
}

auto unix_timestamp() -> int64_t {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

auto trim(std::string_view s) -> std::string {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos) return "";
    auto end = s.find_last_not_of(" \t\n\r");
    return std::string(s.substr(start, end - start + 1));
}

auto contains(std::string_view haystack, std::string_view needle) -> bool {
    return haystack.find(needle) != std::string_view::npos;
}

auto to_lower(std::string_view s) -> std::string {
    std::string result(s);
    std::ranges::transform(result, result.begin(), ::tolower);
    return result;
}

} // namespace chatbridge::utils
