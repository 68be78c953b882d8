#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <map>
#include <span>
#include <string>

#include "parcel/crypto.hpp"

namespace parcel::server
{

    enum class ChunkWriteStatus : std::uint8_t
    {
        Written,
        Duplicate,
        DigestMismatch,
        WriteFailed,
        Conflict
    };

    struct ChunkWriteResult
    {
        ChunkWriteStatus status{ChunkWriteStatus::Written};
        std::string message{};
    };

    /**
     * Scratch file for one upload. Chunks land at index * chunk_size after
     * their digest has been checked, so a corrupted chunk never reaches the file.
     *
     * The write handle is opened on the first accepted chunk and closed exactly
     * once; close() and discard() may be called repeatedly.
     */
    class ChunkStore
    {
    public:
        ChunkStore(std::filesystem::path temp_path, std::uint64_t chunk_size);
        ~ChunkStore();

        ChunkStore(const ChunkStore &) = delete;
        ChunkStore &operator=(const ChunkStore &) = delete;

        void open();

        ChunkWriteResult write_chunk(std::uint64_t index, std::span<const std::byte> data,
                                     const std::string &expected_digest);

        void close() noexcept;

        // Closes the handle and removes the scratch file.
        void discard() noexcept;

        bool is_open() const noexcept { return file_.is_open(); }
        bool was_opened() const noexcept { return opened_once_; }

        const std::filesystem::path &path() const noexcept { return temp_path_; }
        std::uint64_t chunk_size() const noexcept { return chunk_size_; }
        std::uint64_t received_size() const noexcept { return received_size_; }
        std::uint64_t chunks_received() const noexcept { return chunk_hashes_.size(); }
        const std::map<std::uint64_t, std::string> &chunk_hashes() const noexcept { return chunk_hashes_; }
        std::chrono::system_clock::time_point last_update() const noexcept { return last_update_; }

        // Digest of the accepted bytes in acceptance order; equals the file digest only for in-order uploads.
        std::string arrival_digest() const { return arrival_digest_.hex(); }

    private:
        std::filesystem::path temp_path_;
        std::uint64_t chunk_size_;
        std::fstream file_;
        bool opened_once_{false};

        std::uint64_t received_size_{};
        std::map<std::uint64_t, std::string> chunk_hashes_;
        crypto::Digest arrival_digest_;
        std::chrono::system_clock::time_point last_update_{};
    };

} // namespace parcel::server
