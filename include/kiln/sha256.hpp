#pragma once

#include <kiln/result.hpp>
#include <array>
#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <filesystem>

namespace kiln {

// Incremental SHA-256 (FIPS 180-4). Used for manifest fingerprints,
// artifact tree digests and build output digests.
class SHA256 {
public:
    using Digest = std::array<uint8_t, 32>;

    SHA256();

    void update(const uint8_t* data, size_t len);
    void update(std::string_view s);

    // Object must not be reused after this call.
    Digest finalize();

    static std::string hash_hex(std::string_view input);
    static Result<std::string> hash_file(const std::filesystem::path& path);
    static std::string to_hex(const Digest& digest);

private:
    void compress(const uint8_t* block);

    std::array<uint32_t, 8> state_;
    uint64_t length_;           // bytes consumed so far
    uint8_t  pending_[64];
    size_t   pending_len_;
};

} // namespace kiln
