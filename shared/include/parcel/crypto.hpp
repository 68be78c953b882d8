/**
 * Parcel - Digest and password helpers built on libsodium.
 *
 * Digests are SHA-256 rendered as lowercase hex. They verify integrity of
 * chunks and finalized files; they are not used for confidentiality.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <span>
#include <string>
#include <string_view>

#include <sodium.h>

namespace parcel::crypto
{

    void ensure_sodium_init();

    /// Incremental SHA-256 over a sequence of byte ranges.
    class Digest
    {
    public:
        Digest();

        void update(std::span<const std::byte> data);

        /// Hex digest of everything fed so far; the digest can keep growing afterwards.
        std::string hex() const;

        std::uint64_t bytes_fed() const noexcept { return bytes_fed_; }

    private:
        crypto_hash_sha256_state state_{};
        std::uint64_t bytes_fed_{};
    };

    std::string hash_bytes(std::span<const std::byte> data);

    std::string hash_stream(std::istream &input);

    std::string hash_file(const std::filesystem::path &path);

    std::string hash_password(std::string_view password);

    bool verify_password(std::string_view password, std::string_view password_hash);

    std::string random_hex(std::size_t byte_count);

} // namespace parcel::crypto
