// ============================================================================
// fanin/fanin.hpp - Main Include Header
// ============================================================================
//
// This convenience header includes the complete fanin library.
//
// USAGE:
// ------
//   #include <fanin/fanin.hpp>
//   using namespace fanin;
//
// ============================================================================

#pragma once

// Core
#include "fanin/core/check.hpp"
#include "fanin/core/defer.hpp"
#include "fanin/core/error.hpp"
#include "fanin/core/multi_error.hpp"
#include "fanin/core/result_group.hpp"

// Cancellation
#include "fanin/core/cancellation.hpp"
#include "fanin/execution/stop_token_adapter.hpp"

// Synchronization
#include "fanin/sync/wait_group.hpp"

// Threads
#include "fanin/io/unit_thread.hpp"
