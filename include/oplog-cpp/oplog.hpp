/// @file oplog.hpp
/// @brief Umbrella header for the oplog-cpp library.
///
/// Include this single header for access to all public types:
/// Session, Recorder, RemoteDispatcher, Ledger, OperationQueue,
/// OrderingFilter, RemoteApplicationGuard, EventLoop, Operation,
/// DocumentStore, Transport, LocalServer and Error.

#pragma once

#include <oplog-cpp/apply.hpp>
#include <oplog-cpp/document_store.hpp>
#include <oplog-cpp/error.hpp>
#include <oplog-cpp/event_loop.hpp>
#include <oplog-cpp/graph.hpp>
#include <oplog-cpp/guard.hpp>
#include <oplog-cpp/ids.hpp>
#include <oplog-cpp/inverse.hpp>
#include <oplog-cpp/ledger.hpp>
#include <oplog-cpp/local_server.hpp>
#include <oplog-cpp/logging.hpp>
#include <oplog-cpp/op.hpp>
#include <oplog-cpp/operation_queue.hpp>
#include <oplog-cpp/ordering_filter.hpp>
#include <oplog-cpp/recorder.hpp>
#include <oplog-cpp/referents.hpp>
#include <oplog-cpp/remote_dispatcher.hpp>
#include <oplog-cpp/session.hpp>
#include <oplog-cpp/transport.hpp>
#include <oplog-cpp/types.hpp>
#include <oplog-cpp/value.hpp>
