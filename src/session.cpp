#include <remotesync-cpp/session.hpp>

#include <remotesync-cpp/error.hpp>
#include <remotesync-cpp/logging.hpp>
#include <remotesync-cpp/pipe.hpp>
#include <remotesync-cpp/sender.hpp>
#include <remotesync-cpp/thread_pool.hpp>

#include <exception>
#include <future>
#include <mutex>
#include <utility>
#include <vector>

namespace remotesync_cpp {

namespace {

constexpr unsigned session_threads = 3;

auto describe(const std::exception_ptr& error) -> std::string {
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown exception";
    }
}

// Keeps the first failure of any stage.
class FirstError {
public:
    void record(std::exception_ptr error) {
        auto lock = std::scoped_lock{mutex_};
        if (!error_) error_ = std::move(error);
    }

    auto get() -> std::exception_ptr {
        auto lock = std::scoped_lock{mutex_};
        return error_;
    }

private:
    std::mutex mutex_;
    std::exception_ptr error_;
};

}  // namespace

auto run_session(FileStorage& source_storage, std::shared_ptr<File> source, Builder& builder,
                 const Permutation& perm, SessionOptions options) -> std::shared_ptr<File> {
    if (!source) {
        throw SyncError{ErrorKind::invalid_state, "run_session needs a source file"};
    }
    log_event(LogLevel::info, "session_begin",
              {{"file", source->key().short_hex()}, {"size", source->size()},
               {"slots", perm.size()}});

    // Every stage batches its pipe traffic; the pipes themselves hand over
    // each write synchronously.
    auto hashes = Pipe{};
    auto wishlist = Pipe{};
    auto data = Pipe{};
    auto first_error = FirstError{};

    // Runs `body`; on failure records the exception and closes `inbound` for
    // reading and `outbound` for writing with it.
    auto stage = [&](const char* name, Pipe* inbound, Pipe* outbound, auto body) {
        try {
            body();
            if (outbound) outbound->close_write();
        } catch (...) {
            auto error = std::current_exception();
            first_error.record(error);
            if (inbound) inbound->close_read(error);
            if (outbound) outbound->close_write(error);
            log_event(LogLevel::error, "session_stage_failed",
                      {{"stage", name}, {"error", describe(error)}});
        }
    };

    // Every stage blocks on its pipes until its peer runs, so the stages of
    // one session need workers no other work can occupy. Declared after the
    // pipes: destroying the pool joins its workers first.
    auto pool = thread_pool{session_threads};
    auto stages = std::vector<std::future<void>>{};
    stages.push_back(pool.submit([&] {
        stage("hashes", nullptr, &hashes, [&] {
            auto out = BufferedWriter{hashes.writer()};
            write_chunk_hashes(*source, perm, out);
        });
    }));
    stages.push_back(pool.submit([&] {
        stage("wishlist", &hashes, &wishlist, [&] {
            auto in = BufferedReader{hashes.reader()};
            auto out = BufferedWriter{wishlist.writer()};
            builder.write_wishlist(in, out);
        });
    }));
    stages.push_back(pool.submit([&] {
        stage("data", &wishlist, &data, [&] {
            auto in = BufferedReader{wishlist.reader()};
            auto out = BufferedWriter{data.writer()};
            write_chunk_data(source_storage, *source, in, perm, out, options.on_status);
        });
    }));

    auto result = std::shared_ptr<File>{};
    stage("reconstruct", &data, nullptr, [&] {
        auto in = BufferedReader{data.reader()};
        result = builder.reconstruct_file(in);
    });

    for (auto& f : stages) {
        f.wait();
    }

    if (auto error = first_error.get()) {
        std::rethrow_exception(error);
    }

    log_event(LogLevel::info, "session_end",
              {{"file", result->key().short_hex()}, {"size", result->size()},
               {"requested", builder.requested_chunks()},
               {"requested_bytes", builder.requested_bytes()}});
    return result;
}

auto transfer_file(FileStorage& source_storage, std::shared_ptr<File> source,
                   FileStorage& destination, const SyncConfig& config, std::string info,
                   SessionOptions options) -> std::shared_ptr<File> {
    auto perm = make_permutation(config);
    auto builder = Builder{destination, *perm, config.concurrency, std::move(info)};
    return run_session(source_storage, std::move(source), builder, *perm, std::move(options));
}

}  // namespace remotesync_cpp
