#include "types.hh"
#include <algorithm>
#include <atomic>
#include <cstdio>

namespace fairplay {

// ============================================================================
// UTC Day Formatting
// ============================================================================

std::string utc_day_string(utc_day_t day) {
    using namespace std::chrono;
    const year_month_day ymd{sys_days{days{day}}};

    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u",
                  static_cast<int>(ymd.year()),
                  static_cast<unsigned>(ymd.month()),
                  static_cast<unsigned>(ymd.day()));
    return buf;
}

// ============================================================================
// Hex Encoding/Decoding
// ============================================================================

std::string bytes_to_hex(std::span<const std::uint8_t> bytes) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(bytes.size() * 2);
    for (auto byte : bytes) {
        result.push_back(hex_chars[byte >> 4]);
        result.push_back(hex_chars[byte & 0x0F]);
    }
    return result;
}

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

}  // namespace

std::optional<std::vector<std::uint8_t>> hex_to_bytes(std::string_view hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex = hex.substr(2);
    }

    if (hex.size() % 2 != 0) {
        return std::nullopt;
    }

    std::vector<std::uint8_t> result;
    result.reserve(hex.size() / 2);

    for (std::size_t i = 0; i < hex.size(); i += 2) {
        int high = hex_value(hex[i]);
        int low = hex_value(hex[i + 1]);
        if (high < 0 || low < 0) {
            return std::nullopt;
        }
        result.push_back(static_cast<std::uint8_t>((high << 4) | low));
    }

    return result;
}

std::optional<hash_t> hex_to_hash(std::string_view hex) {
    auto bytes = hex_to_bytes(hex);
    if (!bytes || bytes->size() != HASH_SIZE) {
        return std::nullopt;
    }
    hash_t h;
    std::copy(bytes->begin(), bytes->end(), h.begin());
    return h;
}

std::string short_hex(std::span<const std::uint8_t> bytes) {
    auto hex = bytes_to_hex(bytes.first(std::min<std::size_t>(bytes.size(), 8)));
    return hex + "...";
}

bool is_zero(const hash_t& h) {
    return std::all_of(h.begin(), h.end(), [](std::uint8_t b) { return b == 0; });
}

// ============================================================================
// Secure Zero
// ============================================================================

void secure_zero(void* ptr, std::size_t len) {
    volatile std::uint8_t* p = static_cast<volatile std::uint8_t*>(ptr);
    while (len--) {
        *p++ = 0;
    }
    std::atomic_thread_fence(std::memory_order_seq_cst);
}

}  // namespace fairplay
