// Fuzz target for the operation wire format: decoding must never throw,
// and anything that decodes must re-encode to text that decodes to the
// same operation.

#include <oplog-cpp/json.hpp>

#include <spdlog/spdlog.h>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    static const bool quiet = [] {
        spdlog::set_level(spdlog::level::off);
        return true;
    }();
    (void)quiet;

    const auto text = std::string_view(reinterpret_cast<const char*>(data), size);
    auto op = oplog_cpp::decode_operation(text);
    if (!op) return 0;

    auto again = oplog_cpp::decode_operation(oplog_cpp::encode_operation(*op));
    if (again && !(*again == *op)) std::abort();

    return 0;
}
