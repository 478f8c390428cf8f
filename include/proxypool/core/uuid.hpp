#pragma once

#include <array>
#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>

namespace proxypool::core {

// UUID v4
class UUID {
public:
    UUID() : bytes_{} {}

    static UUID generate() {
        UUID uuid;

        static thread_local std::random_device rd;
        static thread_local std::mt19937_64 gen(rd());
        static thread_local std::uniform_int_distribution<uint64_t> dist;

        uint64_t high = dist(gen);
        uint64_t low = dist(gen);

        high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;  // Version 4
        low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;   // Variant 1

        for (int i = 0; i < 8; ++i) {
            uuid.bytes_[i] = static_cast<uint8_t>((high >> (56 - i * 8)) & 0xFF);
            uuid.bytes_[i + 8] = static_cast<uint8_t>((low >> (56 - i * 8)) & 0xFF);
        }

        return uuid;
    }

    std::string to_string() const {
        std::ostringstream ss;
        ss << std::hex << std::setfill('0');

        for (size_t i = 0; i < 16; ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) {
                ss << '-';
            }
            ss << std::setw(2) << static_cast<int>(bytes_[i]);
        }

        return ss.str();
    }

    // Hex digits only, no dashes
    std::string to_hex() const {
        std::ostringstream ss;
        ss << std::hex << std::setfill('0');
        for (auto b : bytes_) {
            ss << std::setw(2) << static_cast<int>(b);
        }
        return ss.str();
    }

private:
    std::array<uint8_t, 16> bytes_;
};

// Caller-protocol message id
inline std::string generate_message_id() {
    return "msg_" + UUID::generate().to_hex().substr(0, 24);
}

// Used when an upstream tool call arrives without an id
inline std::string generate_tool_use_id() {
    return "toolu_" + UUID::generate().to_hex().substr(0, 24);
}

inline std::string generate_request_id() {
    return "req_" + UUID::generate().to_hex().substr(0, 12);
}

}  // namespace proxypool::core
