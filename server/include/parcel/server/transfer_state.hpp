#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>

#include "parcel/protocol.hpp"
#include "parcel/server/chunk_store.hpp"
#include "parcel/server/transfer_outcome.hpp"

namespace parcel::server
{

    /**
     * State machine of one upload.
     *
     *   Pending --chunk--> InProgress --chunk--> InProgress
     *   Pending/InProgress --retries exhausted--> Failed
     *   Pending/InProgress --finalize--> Complete | Failed
     *   Pending/InProgress --cancel--> Cancelled
     *
     * Terminal phases are sinks. The ChunkStore is owned here until the
     * Finalizer takes it with release_store(); whichever path ends the transfer
     * closes it, and only once.
     *
     * Not thread safe: callers hold the owning registry entry's mutex.
     */
    class TransferState
    {
    public:
        TransferState(std::string transfer_id, std::string filename, std::uint64_t total_size, std::string sender,
                      std::filesystem::path temp_path, std::uint64_t chunk_size = protocol::kChunkSize,
                      std::uint32_t max_retries = protocol::kMaxRetries);

        ChunkOutcome accept_chunk(std::uint64_t index, std::span<const std::byte> data, const std::string &digest);

        void cancel() noexcept;

        void fail(parcel::ErrorCode code, std::string message) noexcept;

        std::unique_ptr<ChunkStore> release_store();

        void mark_complete();

        protocol::TransferProgress progress() const;

        bool is_terminal() const noexcept;

        protocol::TransferPhase phase() const noexcept { return phase_; }
        const std::string &transfer_id() const noexcept { return transfer_id_; }
        const std::string &filename() const noexcept { return filename_; }
        const std::string &sender() const noexcept { return sender_; }
        std::uint64_t total_size() const noexcept { return total_size_; }
        std::uint64_t chunk_size() const noexcept { return chunk_size_; }
        std::uint64_t received_size() const noexcept { return received_size_; }
        std::uint64_t chunks_received() const noexcept { return chunks_received_; }
        const std::filesystem::path &temp_path() const noexcept { return temp_path_; }
        const std::optional<std::string> &error() const noexcept { return error_; }
        std::optional<parcel::ErrorCode> error_code() const noexcept { return error_code_; }
        std::chrono::system_clock::time_point start_time() const noexcept { return start_time_; }
        std::chrono::system_clock::time_point last_update_time() const noexcept { return last_update_; }
        std::uint32_t retries_for(std::uint64_t index) const;

    private:
        std::optional<TransferRejected> validate_chunk(std::uint64_t index, std::size_t length) const;

        std::string transfer_id_;
        std::string filename_;
        std::uint64_t total_size_;
        std::string sender_;
        std::filesystem::path temp_path_;
        std::uint64_t chunk_size_;
        std::uint32_t max_retries_;

        std::unique_ptr<ChunkStore> store_;
        std::uint64_t received_size_{};
        std::uint64_t chunks_received_{};
        std::map<std::uint64_t, std::uint32_t> retries_;

        protocol::TransferPhase phase_{protocol::TransferPhase::Pending};
        std::optional<std::string> error_;
        std::optional<parcel::ErrorCode> error_code_;
        std::chrono::system_clock::time_point start_time_;
        std::chrono::system_clock::time_point last_update_;
    };

} // namespace parcel::server
