#pragma once

// Global work-stealing thread pool via Taskflow.
//
// Provides a process-global tf::Executor singleton sized to
// std::thread::hardware_concurrency(). The receiver's possession checks are
// submitted here; how many run at once is bounded by the caller.
//
// Internal header, not installed.

#include <taskflow/taskflow.hpp>

namespace remotesync_cpp::detail {

// Process-global executor. Created on first use, destroyed at exit.
inline auto global_executor() -> tf::Executor& {
    static auto executor = tf::Executor{};
    return executor;
}

}  // namespace remotesync_cpp::detail
