#include <oplog-cpp/ids.hpp>

#include <array>
#include <chrono>
#include <cstddef>
#include <random>
#include <string>

namespace oplog_cpp {

namespace {

auto bytes_to_hex(const std::uint8_t* data, std::size_t len) -> std::string {
    static constexpr char hex_chars[] = "0123456789abcdef";
    auto result = std::string{};
    result.reserve(len * 2);
    for (std::size_t i = 0; i < len; ++i) {
        result.push_back(hex_chars[data[i] >> 4]);
        result.push_back(hex_chars[data[i] & 0x0F]);
    }
    return result;
}

auto id_engine() -> std::mt19937_64& {
    static auto engine = [] {
        auto seed = std::random_device{};
        auto seq = std::seed_seq{seed(), seed(), seed(), seed()};
        return std::mt19937_64{seq};
    }();
    return engine;
}

}  // anonymous namespace

auto system_clock_ms() -> std::int64_t {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

auto generate_operation_id() -> OperationId {
    auto& engine = id_engine();
    auto bytes = std::array<std::uint8_t, 16>{};
    for (std::size_t i = 0; i < bytes.size(); i += 8) {
        auto word = engine();
        for (std::size_t b = 0; b < 8; ++b) {
            bytes[i + b] = static_cast<std::uint8_t>(word >> (b * 8));
        }
    }
    bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0F) | 0x40);  // version 4
    bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3F) | 0x80);  // RFC 4122 variant

    auto hex = bytes_to_hex(bytes.data(), bytes.size());
    return hex.substr(0, 8) + '-' + hex.substr(8, 4) + '-' + hex.substr(12, 4) + '-'
         + hex.substr(16, 4) + '-' + hex.substr(20);
}

}  // namespace oplog_cpp
