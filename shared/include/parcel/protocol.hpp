/**
 * Parcel - Wire protocol schema and serialization helpers.
 *
 * Every frame is a type-tagged JSON object {"type", "payload", "id"}. Requests
 * carry a Command tag, replies a MessageType tag.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "parcel/error_codes.hpp"

namespace parcel::protocol
{

    // Both peers assume these; they are not negotiated per transfer.
    constexpr std::uint64_t kChunkSize = 4096;
    constexpr std::uint32_t kMaxRetries = 3;

    enum class Command : std::uint8_t
    {
        Authenticate,
        StartUpload,
        UploadChunk,
        CompleteUpload,
        CancelTransfer,
        StartDownload,
        DownloadChunk,
        ListFiles,
        FileInfo,
        DeleteFile,
        ListTransfers,
        Ping
    };

    std::string_view to_string(Command command) noexcept;
    std::optional<Command> command_from_string(std::string_view value) noexcept;

    enum class MessageType : std::uint8_t
    {
        AuthOk,
        UploadReady,
        ChunkAck,
        ChunkFailed,
        UploadComplete,
        UploadFailed,
        TransferCancelled,
        DownloadReady,
        FileChunk,
        FileList,
        FileInfo,
        FileDeleted,
        TransferList,
        Pong,
        Error
    };

    std::string_view to_string(MessageType type) noexcept;
    std::optional<MessageType> message_type_from_string(std::string_view value) noexcept;

    struct RequestEnvelope
    {
        Command command{};
        nlohmann::json payload{nlohmann::json::object()};
        std::optional<std::string> request_id{};
    };

    void to_json(nlohmann::json &json, const RequestEnvelope &envelope);
    void from_json(const nlohmann::json &json, RequestEnvelope &envelope);

    struct ResponseEnvelope
    {
        MessageType type{MessageType::Pong};
        nlohmann::json payload{nlohmann::json::object()};
        std::optional<std::string> request_id{};
    };

    void to_json(nlohmann::json &json, const ResponseEnvelope &envelope);
    void from_json(const nlohmann::json &json, ResponseEnvelope &envelope);

    struct ErrorPayload
    {
        ErrorCode code{ErrorCode::InternalError};
        ErrorKind kind{ErrorKind::Fatal};
        std::string message;
    };

    void to_json(nlohmann::json &json, const ErrorPayload &payload);
    void from_json(const nlohmann::json &json, ErrorPayload &payload);

    struct AuthenticateRequest
    {
        std::string username{};
        std::string password{};
        bool register_user{};
    };

    void to_json(nlohmann::json &json, const AuthenticateRequest &request);
    void from_json(const nlohmann::json &json, AuthenticateRequest &request);

    struct AuthenticateResponse
    {
        std::string identity{};
        bool newly_registered{};
    };

    void to_json(nlohmann::json &json, const AuthenticateResponse &response);
    void from_json(const nlohmann::json &json, AuthenticateResponse &response);

    // Outcome of the external security scan, stored with each finalized file.
    struct ScanResult
    {
        bool is_safe{true};
        std::optional<std::string> reason{};
        std::string size_check{"PASSED"};
        std::string extension_check{"PASSED"};
        std::string mime_type{};
        std::string mime_check{"PASSED"};
    };

    void to_json(nlohmann::json &json, const ScanResult &result);
    void from_json(const nlohmann::json &json, ScanResult &result);

    // Durable record of one finalized file, keyed by its storage filename.
    struct FileMetadata
    {
        std::string filename;
        std::string original_filename;
        std::uint64_t size{};
        std::string hash;
        std::string uploaded_by;
        std::uint64_t timestamp{};
        std::string transfer_id;
        ScanResult security_scan{};
        bool quarantined{};
    };

    void to_json(nlohmann::json &json, const FileMetadata &metadata);
    void from_json(const nlohmann::json &json, FileMetadata &metadata);

    bool operator==(const ScanResult &lhs, const ScanResult &rhs);
    bool operator==(const FileMetadata &lhs, const FileMetadata &rhs);

    enum class TransferPhase : std::uint8_t
    {
        Pending,
        InProgress,
        Complete,
        Failed,
        Cancelled
    };

    std::string_view to_string(TransferPhase phase) noexcept;
    std::optional<TransferPhase> transfer_phase_from_string(std::string_view value) noexcept;

    struct TransferProgress
    {
        std::string transfer_id;
        std::string filename;
        std::uint64_t total_size{};
        std::uint64_t received_size{};
        double percent{};
        double elapsed_seconds{};
        double bytes_per_second{};
        std::uint64_t chunks_received{};
        TransferPhase phase{TransferPhase::Pending};
        std::optional<std::string> error{};
    };

    void to_json(nlohmann::json &json, const TransferProgress &progress);
    void from_json(const nlohmann::json &json, TransferProgress &progress);

    struct StartUploadRequest
    {
        std::string filename;
        std::uint64_t total_size{};
    };

    void to_json(nlohmann::json &json, const StartUploadRequest &request);
    void from_json(const nlohmann::json &json, StartUploadRequest &request);

    struct UploadReady
    {
        std::string transfer_id;
        std::uint64_t chunk_size{kChunkSize};
    };

    void to_json(nlohmann::json &json, const UploadReady &message);
    void from_json(const nlohmann::json &json, UploadReady &message);

    struct UploadChunkRequest
    {
        std::string transfer_id;
        std::uint64_t chunk_index{};
        std::string chunk_data; // base64
        std::string chunk_hash;
    };

    void to_json(nlohmann::json &json, const UploadChunkRequest &request);
    void from_json(const nlohmann::json &json, UploadChunkRequest &request);

    struct ChunkAck
    {
        std::string transfer_id;
        std::uint64_t chunk_index{};
        std::uint64_t received_size{};
        bool duplicate{};
        TransferProgress progress{};
    };

    void to_json(nlohmann::json &json, const ChunkAck &message);
    void from_json(const nlohmann::json &json, ChunkAck &message);

    struct ChunkFailed
    {
        std::string transfer_id;
        std::uint64_t chunk_index{};
        std::string error;
        ErrorCode code{ErrorCode::ChunkDigestMismatch};
        bool retryable{};
        std::uint32_t attempts{};
    };

    void to_json(nlohmann::json &json, const ChunkFailed &message);
    void from_json(const nlohmann::json &json, ChunkFailed &message);

    struct TransferRequest
    {
        std::string transfer_id;
    };

    void to_json(nlohmann::json &json, const TransferRequest &request);
    void from_json(const nlohmann::json &json, TransferRequest &request);

    struct UploadComplete
    {
        std::string transfer_id;
        std::string filename;
        std::uint64_t size{};
        std::string hash;
        bool is_safe{true};
        bool quarantined{};
    };

    void to_json(nlohmann::json &json, const UploadComplete &message);
    void from_json(const nlohmann::json &json, UploadComplete &message);

    struct UploadFailed
    {
        std::string transfer_id;
        std::string error;
        ErrorCode code{ErrorCode::FinalizeFailed};
    };

    void to_json(nlohmann::json &json, const UploadFailed &message);
    void from_json(const nlohmann::json &json, UploadFailed &message);

    struct TransferCancelled
    {
        std::string transfer_id;
    };

    void to_json(nlohmann::json &json, const TransferCancelled &message);
    void from_json(const nlohmann::json &json, TransferCancelled &message);

    struct StartDownloadRequest
    {
        std::string filename;
        std::uint64_t start_position{};
    };

    void to_json(nlohmann::json &json, const StartDownloadRequest &request);
    void from_json(const nlohmann::json &json, StartDownloadRequest &request);

    struct DownloadReady
    {
        std::string transfer_id;
        std::string filename;
        std::uint64_t total_size{};
        std::uint64_t chunk_size{kChunkSize};
        std::uint64_t start_position{};
    };

    void to_json(nlohmann::json &json, const DownloadReady &message);
    void from_json(const nlohmann::json &json, DownloadReady &message);

    struct DownloadChunkRequest
    {
        std::string transfer_id;
        std::uint64_t chunk_index{};
    };

    void to_json(nlohmann::json &json, const DownloadChunkRequest &request);
    void from_json(const nlohmann::json &json, DownloadChunkRequest &request);

    // Header of one downloaded chunk; the raw bytes follow as a payload block.
    struct FileChunkHeader
    {
        std::string transfer_id;
        std::uint64_t chunk_index{};
        std::uint64_t chunk_size{};
        std::string chunk_hash;
        bool end_of_file{};
    };

    void to_json(nlohmann::json &json, const FileChunkHeader &header);
    void from_json(const nlohmann::json &json, FileChunkHeader &header);

    struct FileNameRequest
    {
        std::string filename;
    };

    void to_json(nlohmann::json &json, const FileNameRequest &request);
    void from_json(const nlohmann::json &json, FileNameRequest &request);

} // namespace parcel::protocol
