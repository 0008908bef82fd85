/// @file inverse.hpp
/// @brief Inverse construction for operations.

#pragma once

#include <oplog-cpp/op.hpp>

namespace oplog_cpp {

/// Build the operation that undoes `op`.
///
/// Pure and deterministic: the inverse is derived from the payload only,
/// never from live document state. Add and remove kinds swap (carrying
/// the same snapshot), moves and reparents swap their before/after
/// fields. The inverse keeps the document, actor and timestamp of `op`
/// and gets the id `<op.id>:inverse`.
auto make_inverse(const Operation& op) -> Operation;

/// Pair an operation with its inverse.
auto make_entry(Operation op) -> OperationEntry;

}  // namespace oplog_cpp
