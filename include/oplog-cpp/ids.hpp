/// @file ids.hpp
/// @brief Operation id generation and the timestamp clock.

#pragma once

#include <oplog-cpp/types.hpp>

#include <cstdint>
#include <functional>

namespace oplog_cpp {

/// Source of operation timestamps, in milliseconds.
using Clock = std::function<std::int64_t()>;

/// Milliseconds since the Unix epoch from the system clock.
auto system_clock_ms() -> std::int64_t;

/// A random 128-bit id formatted as a version 4 UUID.
auto generate_operation_id() -> OperationId;

}  // namespace oplog_cpp
