#pragma once

// Thread pool running the stages of a sync session. Each session owns one;
// the stages block on each other, so their workers are never shared.

#include <BS_thread_pool.hpp>

namespace remotesync_cpp {

using thread_pool = BS::thread_pool;

}  // namespace remotesync_cpp
