// Helper to generate valid seed corpus files for fuzz testing.
// Build and run once: ./generate_seeds
// Not a fuzz target itself, just a corpus generator.

#include <remotesync-cpp/remotesync.hpp>

#include "src/encoding/bit_stream.hpp"
#include "src/encoding/leb128.hpp"

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace rs = remotesync_cpp;

static void write_seed(const std::string& path, const std::vector<std::byte>& data) {
    auto ofs = std::ofstream{path, std::ios::binary};
    ofs.write(reinterpret_cast<const char*>(data.data()),
              static_cast<std::streamsize>(data.size()));
}

int main() {
    namespace fs = std::filesystem;
    const auto dir = std::string{"fuzz/corpus"};
    fs::create_directories(dir + "/leb128");
    fs::create_directories(dir + "/wishlist");
    fs::create_directories(dir + "/hash_list");

    // Varints: boundaries of each encoded length
    for (auto v : {0ULL, 127ULL, 128ULL, 16383ULL, 16384ULL, ~0ULL}) {
        write_seed(dir + "/leb128/seed_" + std::to_string(v) + ".bin", rs::encoding::encode_uleb128(v));
    }

    // Wishlists for the 16-slot fuzz permutation: none, all real, one spurious
    {
        auto store = rs::RamStorage{1 << 20, rs::ChunkingParams::fixed(64)};
        auto bytes = std::vector<std::byte>(5 * 64 - 10);
        for (std::size_t i = 0; i < bytes.size(); ++i) bytes[i] = static_cast<std::byte>(i * 13);
        auto temp = store.create("seed");
        temp->write(bytes);
        temp->close();
        auto file = temp->file();
        auto perm = rs::RandomPermutation{7, 16};

        auto make = [&](auto wants) {
            auto out = rs::MemoryWriter{};
            auto bits = rs::encoding::BitWriter{out};
            for (std::size_t slot = 0; slot < perm.size(); ++slot) bits.write_bit(wants(perm.inverse(slot)));
            bits.finish();
            return out.take();
        };
        write_seed(dir + "/wishlist/seed_none.bin", make([](std::size_t) { return false; }));
        write_seed(dir + "/wishlist/seed_all.bin", make([&](std::size_t k) { return k < file->num_chunks(); }));
        write_seed(dir + "/wishlist/seed_spurious.bin", make([](std::size_t k) { return k == 15; }));
    }

    // Hash lists for the 4-slot fuzz permutation, prefixed by the split byte
    {
        auto store = rs::RamStorage{1 << 20, rs::ChunkingParams::fixed(16)};
        auto temp = store.create("seed");
        auto bytes = std::vector<std::byte>(40, std::byte{0x5A});
        temp->write(bytes);
        temp->close();
        auto file = temp->file();
        auto perm = rs::RandomPermutation{3, 4};

        auto hashes = rs::MemoryWriter{};
        rs::write_chunk_hashes(*file, perm, hashes);

        // The chunk data an empty receiver asks for
        auto receiver = rs::RamStorage{1 << 20};
        auto builder = rs::Builder{receiver, perm, 2, "seed"};
        auto hash_in = rs::MemoryReader{hashes.data()};
        auto wishlist = rs::MemoryWriter{};
        builder.write_wishlist(hash_in, wishlist);
        auto wish_in = rs::MemoryReader{wishlist.data()};
        auto chunk_data = rs::MemoryWriter{};
        rs::write_chunk_data(store, *file, wish_in, perm, chunk_data);

        // The split offset counts in units of four bytes
        auto seed = std::vector<std::byte>{static_cast<std::byte>((hashes.data().size() + 3) / 4)};
        seed.insert(seed.end(), hashes.data().begin(), hashes.data().end());
        seed.resize(1 + std::to_integer<std::size_t>(seed[0]) * 4, std::byte{0});
        write_seed(dir + "/hash_list/seed_padded_split.bin", seed);
        seed.insert(seed.end(), chunk_data.data().begin(), chunk_data.data().end());
        write_seed(dir + "/hash_list/seed_three_chunks.bin", seed);
    }

    return 0;
}
