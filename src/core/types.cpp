#include "core/types.hpp"

#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>
#include <type_traits>

namespace quire {

static_assert(sizeof(Uuid) == 16, "Uuid should be 16 bytes");
static_assert(std::is_trivially_copyable_v<Uuid>, "Uuid should be trivially copyable");
static_assert(std::is_trivially_copyable_v<Timestamp>, "Timestamp should be trivially copyable");

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

Uuid Uuid::generate() {
    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());
    static thread_local std::uniform_int_distribution<uint64_t> dist;

    Bytes bytes{};
    for (size_t half = 0; half < 2; ++half) {
        uint64_t word = dist(gen);
        for (size_t i = 0; i < 8; ++i) {
            bytes[half * 8 + i] = static_cast<uint8_t>(word >> (i * 8));
        }
    }

    // Version 4, RFC 4122 variant
    bytes[6] = (bytes[6] & 0x0F) | 0x40;
    bytes[8] = (bytes[8] & 0x3F) | 0x80;

    return Uuid(bytes);
}

std::optional<Uuid> Uuid::parse(std::string_view str) {
    Bytes bytes{};
    size_t nibble = 0;
    for (char c : str) {
        if (c == '-') continue;
        int v = hex_value(c);
        if (v < 0 || nibble >= BYTE_SIZE * 2) return std::nullopt;
        if (nibble % 2 == 0) {
            bytes[nibble / 2] = static_cast<uint8_t>(v << 4);
        } else {
            bytes[nibble / 2] |= static_cast<uint8_t>(v);
        }
        ++nibble;
    }
    if (nibble != BYTE_SIZE * 2) return std::nullopt;
    return Uuid(bytes);
}

std::string Uuid::to_string() const {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < BYTE_SIZE; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            oss << '-';
        }
        oss << std::setw(2) << static_cast<int>(bytes_[i]);
    }
    return oss.str();
}

std::string Uuid::short_hex(size_t digits) const {
    std::string out;
    for (char c : to_string()) {
        if (out.size() >= digits) break;
        if (c != '-') out += c;
    }
    return out;
}

Timestamp Timestamp::now() {
    return Timestamp(std::chrono::time_point_cast<Duration>(Clock::now()).time_since_epoch().count());
}

std::string Timestamp::to_iso_string() const {
    auto secs = static_cast<std::time_t>(millis_ / 1000);
    auto ms = millis_ % 1000;
    if (ms < 0) {
        ms += 1000;
        --secs;
    }
    std::tm tm{};
    gmtime_r(&secs, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms << 'Z';
    return oss.str();
}

} // namespace quire
