/// @file remotesync.hpp
/// @brief Umbrella header for the remotesync-cpp library.
///
/// Include this single header for the protocol phases (sender, Builder),
/// the session driver, storage interfaces with RamStorage, byte channels,
/// permutations, configuration, logging and errors.

#pragma once

#include <remotesync-cpp/builder.hpp>
#include <remotesync-cpp/config.hpp>
#include <remotesync-cpp/error.hpp>
#include <remotesync-cpp/io.hpp>
#include <remotesync-cpp/logging.hpp>
#include <remotesync-cpp/permutation.hpp>
#include <remotesync-cpp/pipe.hpp>
#include <remotesync-cpp/ram_storage.hpp>
#include <remotesync-cpp/sender.hpp>
#include <remotesync-cpp/session.hpp>
#include <remotesync-cpp/storage.hpp>
#include <remotesync-cpp/stream_shuffler.hpp>
#include <remotesync-cpp/thread_pool.hpp>
#include <remotesync-cpp/types.hpp>
