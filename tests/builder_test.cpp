#include <remotesync-cpp/builder.hpp>

#include <remotesync-cpp/error.hpp>
#include <remotesync-cpp/ram_storage.hpp>
#include <remotesync-cpp/sender.hpp>

#include "crypto/sha256.hpp"
#include "encoding/bit_stream.hpp"
#include "encoding/leb128.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <random>
#include <thread>
#include <vector>

using namespace remotesync_cpp;

namespace {

constexpr std::size_t chunk_size = 1000;

auto random_bytes(std::size_t n, std::uint64_t seed) -> std::vector<std::byte> {
    auto rng = std::mt19937_64{seed};
    auto v = std::vector<std::byte>(n);
    for (auto& b : v) b = static_cast<std::byte>(rng());
    return v;
}

auto store_bytes(FileStorage& store, std::span<const std::byte> bytes) -> std::shared_ptr<File> {
    auto temp = store.create("test");
    temp->write(bytes);
    temp->close();
    return temp->file();
}

auto read_all(const File& file) -> std::vector<std::byte> {
    auto out = MemoryWriter{};
    copy_stream(*file.open(), out);
    return out.take();
}

auto read_bits(const std::vector<std::byte>& bytes, std::size_t n) -> std::vector<bool> {
    auto in = MemoryReader{bytes};
    auto reader = encoding::BitReader{in};
    auto bits = std::vector<bool>{};
    for (std::size_t i = 0; i < n; ++i) bits.push_back(reader.read_bit());
    reader.expect_end();
    return bits;
}

// Counts concurrent lookups and temporaries on top of a RamStorage.
class ObservedStorage : public FileStorage {
public:
    explicit ObservedStorage(RamStorage& inner) : inner_{inner} {}

    auto create(std::string_view info) -> std::unique_ptr<Temporary> override {
        ++creates;
        return inner_.create(info);
    }

    auto get(const SKey& key) -> std::shared_ptr<File> override {
        auto now = ++active;
        auto seen = max_active.load();
        while (now > seen && !max_active.compare_exchange_weak(seen, now)) {}
        std::this_thread::sleep_for(std::chrono::milliseconds{2});
        auto result = inner_.get(key);
        --active;
        ++lookups;
        return result;
    }

    std::atomic<int> active{0};
    std::atomic<int> max_active{0};
    std::atomic<int> lookups{0};
    std::atomic<int> creates{0};

private:
    RamStorage& inner_;
};

class BuilderTest : public ::testing::Test {
protected:
    BuilderTest()
        : sender_store{1 << 22, ChunkingParams::fixed(chunk_size)},
          receiver_store{1 << 22, ChunkingParams::fixed(chunk_size)} {}

    // Three chunks K1, K2, K3; the receiver already holds K2.
    void SetUp() override {
        source_bytes = random_bytes(3 * chunk_size, 1);
        source = store_bytes(sender_store, source_bytes);
        prior = store_bytes(receiver_store,
                            std::span<const std::byte>{source_bytes}.subspan(chunk_size, chunk_size));
    }

    auto hash_list(const Permutation& perm) -> std::vector<std::byte> {
        auto out = MemoryWriter{};
        write_chunk_hashes(*source, perm, out);
        return out.take();
    }

    auto chunk_data(const Permutation& perm, const std::vector<std::byte>& wishlist)
        -> std::vector<std::byte> {
        auto in = MemoryReader{wishlist};
        auto out = MemoryWriter{};
        write_chunk_data(sender_store, *source, in, perm, out);
        return out.take();
    }

    RamStorage sender_store;
    RamStorage receiver_store;
    std::vector<std::byte> source_bytes;
    std::shared_ptr<File> source;
    std::shared_ptr<File> prior;
};

template <typename F>
void expect_error(ErrorKind kind, F&& f) {
    try {
        f();
        FAIL() << "expected " << to_string_view(kind);
    } catch (const SyncError& e) {
        EXPECT_EQ(e.kind(), kind) << e.what();
    }
}

}  // namespace

TEST_F(BuilderTest, requests_only_missing_chunks) {
    auto perm = RandomPermutation{17, 8};
    auto hashes = hash_list(perm);

    auto builder = Builder{receiver_store, perm, 4, "copy"};
    auto in = MemoryReader{hashes};
    auto wishlist = MemoryWriter{};
    builder.write_wishlist(in, wishlist);

    auto bits = read_bits(wishlist.data(), 8);
    for (std::size_t slot = 0; slot < 8; ++slot) {
        auto k = perm.inverse(slot);
        EXPECT_EQ(bits[slot], k == 0 || k == 2) << "slot " << slot;
    }
    EXPECT_EQ(builder.advertised_chunks(), 3u);
    EXPECT_EQ(builder.requested_chunks(), 2u);
    EXPECT_EQ(builder.requested_bytes(), 2 * chunk_size);
    EXPECT_EQ(builder.expected_size(), 3 * chunk_size);
}

TEST_F(BuilderTest, reconstructs_byte_identical_file) {
    auto perm = RandomPermutation{17, 8};
    auto hashes = hash_list(perm);

    auto builder = Builder{receiver_store, perm, 4, "copy"};
    auto hash_in = MemoryReader{hashes};
    auto wishlist = MemoryWriter{};
    builder.write_wishlist(hash_in, wishlist);

    auto data = chunk_data(perm, wishlist.data());
    // Two requested chunks: two size prefixes of two bytes each.
    EXPECT_EQ(data.size(), 2 * chunk_size + 4);

    auto data_in = MemoryReader{data};
    auto file = builder.reconstruct_file(data_in);
    ASSERT_NE(file, nullptr);
    EXPECT_EQ(file->key(), source->key());
    EXPECT_EQ(file->num_chunks(), 3u);
    EXPECT_EQ(read_all(*file), source_bytes);
}

TEST_F(BuilderTest, received_chunks_are_staged_in_storage) {
    auto perm = RandomPermutation{17, 8};
    auto hashes = hash_list(perm);

    auto observed = ObservedStorage{receiver_store};
    auto builder = Builder{observed, perm, 4, "copy"};
    auto hash_in = MemoryReader{hashes};
    auto wishlist = MemoryWriter{};
    builder.write_wishlist(hash_in, wishlist);
    auto data = chunk_data(perm, wishlist.data());

    auto data_in = MemoryReader{data};
    auto file = builder.reconstruct_file(data_in);
    EXPECT_EQ(read_all(*file), source_bytes);

    // One temporary per received chunk plus the file itself.
    EXPECT_EQ(observed.creates.load(), 3);
    // Staged chunks share keys with the file's chunks: K1, K2, K3 only.
    EXPECT_EQ(receiver_store.chunk_count(), 3u);
}

TEST_F(BuilderTest, empty_file_round_trip) {
    auto empty = store_bytes(sender_store, {});
    auto perm = IdentityPermutation{4};
    auto hashes = MemoryWriter{};
    write_chunk_hashes(*empty, perm, hashes);

    auto builder = Builder{receiver_store, perm, 1, "empty"};
    auto hash_in = MemoryReader{hashes.data()};
    auto wishlist = MemoryWriter{};
    builder.write_wishlist(hash_in, wishlist);
    EXPECT_EQ(read_bits(wishlist.data(), 4), std::vector<bool>(4, false));

    auto data_in = MemoryReader{std::span<const std::byte>{}};
    auto file = builder.reconstruct_file(data_in);
    EXPECT_EQ(file->size(), 0u);
    EXPECT_EQ(file->key(), empty->key());
}

TEST_F(BuilderTest, zero_concurrency_is_rejected) {
    auto perm = IdentityPermutation{4};
    expect_error(ErrorKind::invalid_config, [&] { Builder{receiver_store, perm, 0, "x"}; });
}

TEST_F(BuilderTest, lookups_stay_within_concurrency) {
    auto big_bytes = random_bytes(40 * chunk_size, 2);
    auto big = store_bytes(sender_store, big_bytes);
    auto perm = RandomPermutation{4, 64};
    auto hashes = MemoryWriter{};
    write_chunk_hashes(*big, perm, hashes);

    auto observed = ObservedStorage{receiver_store};
    auto builder = Builder{observed, perm, 3, "observed"};
    auto hash_in = MemoryReader{hashes.data()};
    auto wishlist = MemoryWriter{};
    builder.write_wishlist(hash_in, wishlist);

    EXPECT_EQ(observed.lookups.load(), 40);
    EXPECT_LE(observed.max_active.load(), 3);
    EXPECT_EQ(builder.requested_chunks(), 40u);
}

// -- Malformed hash lists -----------------------------------------------------

TEST_F(BuilderTest, truncated_hash_list) {
    auto perm = IdentityPermutation{4};
    auto hashes = hash_list(perm);
    hashes.resize(hashes.size() - 10);

    auto builder = Builder{receiver_store, perm, 2, "copy"};
    auto in = MemoryReader{hashes};
    auto wishlist = MemoryWriter{};
    expect_error(ErrorKind::hash_list_malformed, [&] { builder.write_wishlist(in, wishlist); });
}

TEST_F(BuilderTest, hash_list_with_trailing_bytes) {
    auto perm = IdentityPermutation{4};
    auto hashes = hash_list(perm);
    hashes.push_back(std::byte{0});

    auto builder = Builder{receiver_store, perm, 2, "copy"};
    auto in = MemoryReader{hashes};
    auto wishlist = MemoryWriter{};
    expect_error(ErrorKind::hash_list_malformed, [&] { builder.write_wishlist(in, wishlist); });
}

TEST_F(BuilderTest, placeholder_with_size) {
    auto perm = IdentityPermutation{4};
    auto hashes = hash_list(perm);
    // The last slot is a placeholder; its size byte is the final byte.
    hashes.back() = std::byte{5};

    auto builder = Builder{receiver_store, perm, 2, "copy"};
    auto in = MemoryReader{hashes};
    auto wishlist = MemoryWriter{};
    expect_error(ErrorKind::hash_list_malformed, [&] { builder.write_wishlist(in, wishlist); });
}

TEST_F(BuilderTest, placeholders_inconsistent_with_permutation) {
    // Written with one permutation, read with another.
    auto sender_perm = RandomPermutation{1, 16};
    auto receiver_perm = RandomPermutation{2, 16};
    auto hashes = hash_list(sender_perm);

    auto builder = Builder{receiver_store, receiver_perm, 2, "copy"};
    auto in = MemoryReader{hashes};
    auto wishlist = MemoryWriter{};
    expect_error(ErrorKind::hash_list_malformed, [&] { builder.write_wishlist(in, wishlist); });
}

TEST_F(BuilderTest, malformed_size_varint) {
    auto perm = IdentityPermutation{1};
    auto hashes = std::vector<std::byte>(SKey::size, std::byte{0x11});
    hashes.push_back(std::byte{0x80});

    auto builder = Builder{receiver_store, perm, 2, "copy"};
    auto in = MemoryReader{hashes};
    auto wishlist = MemoryWriter{};
    expect_error(ErrorKind::malformed_varint, [&] { builder.write_wishlist(in, wishlist); });
}

// -- Reconstruction failures --------------------------------------------------

class BuilderFailureTest : public BuilderTest {
protected:
    void SetUp() override {
        BuilderTest::SetUp();
        builder = std::make_unique<Builder>(receiver_store, perm, 2, "copy");
        auto hashes = hash_list(perm);
        auto in = MemoryReader{hashes};
        auto wishlist = MemoryWriter{};
        builder->write_wishlist(in, wishlist);
        data = chunk_data(perm, wishlist.data());
        chunks_before = receiver_store.chunk_count();
    }

    // Nothing built from the failed attempt may stay referenced.
    void expect_no_file() {
        builder.reset();
        EXPECT_EQ(receiver_store.get(source->key()), nullptr);
        EXPECT_EQ(receiver_store.unreferenced_chunk_count(), receiver_store.chunk_count() - 1);
    }

    RandomPermutation perm{99, 8};
    std::unique_ptr<Builder> builder;
    std::vector<std::byte> data;
    std::size_t chunks_before = 0;
};

TEST_F(BuilderFailureTest, truncated_chunk_body) {
    data.resize(data.size() - 1);
    auto in = MemoryReader{data};
    expect_error(ErrorKind::short_chunk_read, [&] { (void)builder->reconstruct_file(in); });
    expect_no_file();
}

TEST_F(BuilderFailureTest, missing_chunk) {
    data.resize(chunk_size + 2);
    auto in = MemoryReader{data};
    expect_error(ErrorKind::short_chunk_read, [&] { (void)builder->reconstruct_file(in); });
    expect_no_file();
}

TEST_F(BuilderFailureTest, size_mismatch) {
    // First size prefix: 1000 = [0xE8, 0x07]; claim 999 instead.
    ASSERT_EQ(data[0], std::byte{0xE8});
    data[0] = std::byte{0xE7};
    auto in = MemoryReader{data};
    expect_error(ErrorKind::short_chunk_read, [&] { (void)builder->reconstruct_file(in); });
    expect_no_file();
}

TEST_F(BuilderFailureTest, trailing_data) {
    data.push_back(std::byte{0});
    auto in = MemoryReader{data};
    expect_error(ErrorKind::short_chunk_read, [&] { (void)builder->reconstruct_file(in); });
    expect_no_file();
}

TEST_F(BuilderFailureTest, second_reconstruction_is_rejected) {
    auto in = MemoryReader{data};
    auto file = builder->reconstruct_file(in);
    EXPECT_EQ(read_all(*file), source_bytes);

    auto again = MemoryReader{data};
    expect_error(ErrorKind::invalid_state, [&] { (void)builder->reconstruct_file(again); });
}

TEST_F(BuilderFailureTest, second_wishlist_is_rejected) {
    auto hashes = hash_list(perm);
    auto in = MemoryReader{hashes};
    auto wishlist = MemoryWriter{};
    expect_error(ErrorKind::invalid_state, [&] { builder->write_wishlist(in, wishlist); });
}

TEST_F(BuilderTest, wishlist_failure_is_rethrown_by_reconstruction) {
    auto perm = IdentityPermutation{4};
    auto hashes = hash_list(perm);
    hashes.resize(20);  // inside the first key: no slot is ever published

    auto builder = Builder{receiver_store, perm, 2, "copy"};
    auto in = MemoryReader{hashes};
    auto wishlist = MemoryWriter{};
    expect_error(ErrorKind::hash_list_malformed, [&] { builder.write_wishlist(in, wishlist); });

    auto data = MemoryReader{std::span<const std::byte>{}};
    expect_error(ErrorKind::hash_list_malformed, [&] { (void)builder.reconstruct_file(data); });
}

TEST_F(BuilderTest, reconstruction_can_start_before_the_wishlist) {
    auto perm = RandomPermutation{5, 8};
    auto hashes = hash_list(perm);
    auto builder = Builder{receiver_store, perm, 2, "copy"};

    // Compute the data stream up front from a second builder's wishlist.
    auto planner = Builder{receiver_store, perm, 2, "planner"};
    auto planner_in = MemoryReader{hashes};
    auto planner_wishlist = MemoryWriter{};
    planner.write_wishlist(planner_in, planner_wishlist);
    auto data = chunk_data(perm, planner_wishlist.data());

    auto file = std::shared_ptr<File>{};
    auto reconstruct = std::jthread{[&] {
        auto in = MemoryReader{data};
        file = builder.reconstruct_file(in);
    }};
    std::this_thread::sleep_for(std::chrono::milliseconds{20});

    auto in = MemoryReader{hashes};
    auto wishlist = MemoryWriter{};
    builder.write_wishlist(in, wishlist);
    reconstruct.join();

    ASSERT_NE(file, nullptr);
    EXPECT_EQ(read_all(*file), source_bytes);
}
