/**
 * Parcel - Closed result sets returned by the transfer engine.
 *
 * Each operation returns a std::variant over the outcomes it can produce so
 * callers handle every case with std::visit instead of inspecting message text:
 *  - TransferRejected: client error (unknown id, foreign transfer, bad request); nothing changed.
 *  - ChunkRetry:       retryable, chunk-local failure; resend the same chunk.
 *  - TransferFailed:   fatal, transfer-local failure; the transfer no longer exists.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "parcel/error_codes.hpp"
#include "parcel/protocol.hpp"

namespace parcel::server
{

    template <typename... Handlers>
    struct overloaded : Handlers...
    {
        using Handlers::operator()...;
    };

    template <typename... Handlers>
    overloaded(Handlers...) -> overloaded<Handlers...>;

    struct TransferRejected
    {
        parcel::ErrorCode code{parcel::ErrorCode::InvalidPayload};
        std::string message;
    };

    struct TransferFailed
    {
        std::string transfer_id;
        parcel::ErrorCode code{parcel::ErrorCode::InternalError};
        std::string message;
        std::optional<std::uint64_t> chunk_index{};
    };

    struct ChunkRetry
    {
        std::string transfer_id;
        std::uint64_t chunk_index{};
        std::uint32_t attempts{};
        parcel::ErrorCode code{parcel::ErrorCode::ChunkDigestMismatch};
        std::string message;
    };

    struct ChunkAccepted
    {
        std::string transfer_id;
        std::uint64_t chunk_index{};
        std::uint64_t received_size{};
        bool duplicate{};
        protocol::TransferProgress progress{};
    };

    struct UploadTicket
    {
        std::string transfer_id;
        std::uint64_t chunk_size{protocol::kChunkSize};
    };

    struct CancelledTransfer
    {
        std::string transfer_id;
        std::uint64_t received_size{};
    };

    struct DownloadTicket
    {
        std::string transfer_id;
        std::string filename;
        std::uint64_t total_size{};
        std::uint64_t chunk_size{protocol::kChunkSize};
        std::uint64_t start_position{};
    };

    struct OutgoingChunk
    {
        std::string transfer_id;
        std::uint64_t chunk_index{};
        std::vector<std::byte> data;
        std::string digest;
        bool end_of_file{};
    };

    struct FileDeleted
    {
        std::string filename;
        bool was_quarantined{};
    };

    using StartUploadOutcome = std::variant<UploadTicket, TransferFailed, TransferRejected>;
    using ChunkOutcome = std::variant<ChunkAccepted, ChunkRetry, TransferFailed, TransferRejected>;
    using CompleteOutcome = std::variant<protocol::FileMetadata, TransferFailed, TransferRejected>;
    using CancelOutcome = std::variant<CancelledTransfer, TransferRejected>;
    using StartDownloadOutcome = std::variant<DownloadTicket, TransferRejected>;
    using SendChunkOutcome = std::variant<OutgoingChunk, TransferFailed, TransferRejected>;
    using DeleteOutcome = std::variant<FileDeleted, TransferRejected>;

} // namespace parcel::server
