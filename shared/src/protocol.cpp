#include "parcel/protocol.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>

namespace parcel::protocol
{

    namespace
    {

        struct CommandMapping
        {
            Command command;
            std::string_view label;
        };

        constexpr std::array<CommandMapping, 12> kCommandMappings{{
            {Command::Authenticate, "authenticate"},
            {Command::StartUpload, "start_upload"},
            {Command::UploadChunk, "upload_chunk"},
            {Command::CompleteUpload, "complete_upload"},
            {Command::CancelTransfer, "cancel_transfer"},
            {Command::StartDownload, "start_download"},
            {Command::DownloadChunk, "download_chunk"},
            {Command::ListFiles, "list_files"},
            {Command::FileInfo, "file_info"},
            {Command::DeleteFile, "delete_file"},
            {Command::ListTransfers, "list_transfers"},
            {Command::Ping, "ping"},
        }};

        struct MessageTypeMapping
        {
            MessageType type;
            std::string_view label;
        };

        constexpr std::array<MessageTypeMapping, 15> kMessageMappings{{
            {MessageType::AuthOk, "auth_ok"},
            {MessageType::UploadReady, "upload_ready"},
            {MessageType::ChunkAck, "chunk_ack"},
            {MessageType::ChunkFailed, "chunk_failed"},
            {MessageType::UploadComplete, "upload_complete"},
            {MessageType::UploadFailed, "upload_failed"},
            {MessageType::TransferCancelled, "transfer_cancelled"},
            {MessageType::DownloadReady, "download_ready"},
            {MessageType::FileChunk, "file_chunk"},
            {MessageType::FileList, "file_list"},
            {MessageType::FileInfo, "file_info"},
            {MessageType::FileDeleted, "file_deleted"},
            {MessageType::TransferList, "transfer_list"},
            {MessageType::Pong, "pong"},
            {MessageType::Error, "error"},
        }};

        struct PhaseMapping
        {
            TransferPhase phase;
            std::string_view label;
        };

        constexpr std::array<PhaseMapping, 5> kPhaseMappings{{
            {TransferPhase::Pending, "pending"},
            {TransferPhase::InProgress, "in_progress"},
            {TransferPhase::Complete, "complete"},
            {TransferPhase::Failed, "failed"},
            {TransferPhase::Cancelled, "cancelled"},
        }};

        std::optional<std::string> optional_string(const nlohmann::json &json, const char *key)
        {
            if (auto it = json.find(key); it != json.end() && !it->is_null())
            {
                return it->get<std::string>();
            }
            return std::nullopt;
        }

        void read_request_id(const nlohmann::json &json, std::optional<std::string> &request_id)
        {
            if (auto it = json.find("id"); it != json.end())
            {
                request_id = it->get<std::string>();
            }
            else
            {
                request_id.reset();
            }
        }

    } // namespace

    std::string_view to_string(Command command) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.command == command)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<Command> command_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.label == value)
            {
                return mapping.command;
            }
        }
        return std::nullopt;
    }

    std::string_view to_string(MessageType type) noexcept
    {
        for (const auto &mapping : kMessageMappings)
        {
            if (mapping.type == type)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<MessageType> message_type_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kMessageMappings)
        {
            if (mapping.label == value)
            {
                return mapping.type;
            }
        }
        return std::nullopt;
    }

    std::string_view to_string(TransferPhase phase) noexcept
    {
        for (const auto &mapping : kPhaseMappings)
        {
            if (mapping.phase == phase)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<TransferPhase> transfer_phase_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kPhaseMappings)
        {
            if (mapping.label == value)
            {
                return mapping.phase;
            }
        }
        return std::nullopt;
    }

    void to_json(nlohmann::json &json, const RequestEnvelope &envelope)
    {
        json = {
            {"type", to_string(envelope.command)},
            {"payload", envelope.payload},
        };
        if (envelope.request_id)
        {
            json["id"] = *envelope.request_id;
        }
    }

    void from_json(const nlohmann::json &json, RequestEnvelope &envelope)
    {
        const auto type_label = json.at("type").get<std::string>();
        auto command = command_from_string(type_label);
        if (!command)
        {
            throw std::runtime_error("Unknown command: " + type_label);
        }
        envelope.command = *command;
        envelope.payload = json.value("payload", nlohmann::json::object());
        read_request_id(json, envelope.request_id);
    }

    void to_json(nlohmann::json &json, const ResponseEnvelope &envelope)
    {
        json = {
            {"type", to_string(envelope.type)},
            {"payload", envelope.payload},
        };
        if (envelope.request_id)
        {
            json["id"] = *envelope.request_id;
        }
    }

    void from_json(const nlohmann::json &json, ResponseEnvelope &envelope)
    {
        const auto type_label = json.at("type").get<std::string>();
        auto type = message_type_from_string(type_label);
        if (!type)
        {
            throw std::runtime_error("Unknown message type: " + type_label);
        }
        envelope.type = *type;
        envelope.payload = json.value("payload", nlohmann::json::object());
        read_request_id(json, envelope.request_id);
    }

    void to_json(nlohmann::json &json, const ErrorPayload &payload)
    {
        json = {
            {"code", to_int(payload.code)},
            {"kind", to_string(payload.kind)},
            {"label", to_string(payload.code)},
            {"message", payload.message},
        };
    }

    void from_json(const nlohmann::json &json, ErrorPayload &payload)
    {
        payload.code = error_code_from_int(json.value("code", static_cast<std::uint16_t>(0)));
        payload.kind = kind_of(payload.code);
        payload.message = json.value("message", std::string{});
    }

    void to_json(nlohmann::json &json, const AuthenticateRequest &request)
    {
        json = {
            {"username", request.username},
            {"password", request.password},
            {"register", request.register_user},
        };
    }

    void from_json(const nlohmann::json &json, AuthenticateRequest &request)
    {
        request.username = json.value("username", std::string{});
        request.password = json.value("password", std::string{});
        request.register_user = json.value("register", false);
    }

    void to_json(nlohmann::json &json, const AuthenticateResponse &response)
    {
        json = {
            {"identity", response.identity},
            {"newly_registered", response.newly_registered},
        };
    }

    void from_json(const nlohmann::json &json, AuthenticateResponse &response)
    {
        response.identity = json.value("identity", std::string{});
        response.newly_registered = json.value("newly_registered", false);
    }

    void to_json(nlohmann::json &json, const ScanResult &result)
    {
        json = {
            {"is_safe", result.is_safe},
            {"size_check", result.size_check},
            {"extension_check", result.extension_check},
            {"mime_type", result.mime_type},
            {"mime_check", result.mime_check},
            {"reason", nullptr},
        };
        if (result.reason)
        {
            json["reason"] = *result.reason;
        }
    }

    void from_json(const nlohmann::json &json, ScanResult &result)
    {
        result.is_safe = json.value("is_safe", true);
        result.size_check = json.value("size_check", std::string{"PASSED"});
        result.extension_check = json.value("extension_check", std::string{"PASSED"});
        result.mime_type = json.value("mime_type", std::string{});
        result.mime_check = json.value("mime_check", std::string{"PASSED"});
        result.reason = optional_string(json, "reason");
    }

    void to_json(nlohmann::json &json, const FileMetadata &metadata)
    {
        json = {
            {"filename", metadata.filename},
            {"original_filename", metadata.original_filename},
            {"size", metadata.size},
            {"hash", metadata.hash},
            {"uploaded_by", metadata.uploaded_by},
            {"timestamp", metadata.timestamp},
            {"transfer_id", metadata.transfer_id},
            {"security_scan", metadata.security_scan},
            {"quarantined", metadata.quarantined},
        };
    }

    void from_json(const nlohmann::json &json, FileMetadata &metadata)
    {
        metadata.filename = json.at("filename").get<std::string>();
        metadata.original_filename = json.value("original_filename", metadata.filename);
        metadata.size = json.value("size", 0ULL);
        metadata.hash = json.value("hash", std::string{});
        metadata.uploaded_by = json.value("uploaded_by", std::string{});
        metadata.timestamp = json.value("timestamp", 0ULL);
        metadata.transfer_id = json.value("transfer_id", std::string{});
        metadata.security_scan = json.value("security_scan", ScanResult{});
        metadata.quarantined = json.value("quarantined", false);
    }

    bool operator==(const ScanResult &lhs, const ScanResult &rhs)
    {
        return lhs.is_safe == rhs.is_safe && lhs.reason == rhs.reason && lhs.size_check == rhs.size_check &&
               lhs.extension_check == rhs.extension_check && lhs.mime_type == rhs.mime_type &&
               lhs.mime_check == rhs.mime_check;
    }

    bool operator==(const FileMetadata &lhs, const FileMetadata &rhs)
    {
        return lhs.filename == rhs.filename && lhs.original_filename == rhs.original_filename &&
               lhs.size == rhs.size && lhs.hash == rhs.hash && lhs.uploaded_by == rhs.uploaded_by &&
               lhs.timestamp == rhs.timestamp && lhs.transfer_id == rhs.transfer_id &&
               lhs.security_scan == rhs.security_scan && lhs.quarantined == rhs.quarantined;
    }

    void to_json(nlohmann::json &json, const TransferProgress &progress)
    {
        json = {
            {"transfer_id", progress.transfer_id},
            {"filename", progress.filename},
            {"total_size", progress.total_size},
            {"received_size", progress.received_size},
            {"percent", progress.percent},
            {"elapsed", progress.elapsed_seconds},
            {"speed", progress.bytes_per_second},
            {"chunks_received", progress.chunks_received},
            {"state", to_string(progress.phase)},
            {"error", nullptr},
        };
        if (progress.error)
        {
            json["error"] = *progress.error;
        }
    }

    void from_json(const nlohmann::json &json, TransferProgress &progress)
    {
        progress.transfer_id = json.value("transfer_id", std::string{});
        progress.filename = json.value("filename", std::string{});
        progress.total_size = json.value("total_size", 0ULL);
        progress.received_size = json.value("received_size", 0ULL);
        progress.percent = json.value("percent", 0.0);
        progress.elapsed_seconds = json.value("elapsed", 0.0);
        progress.bytes_per_second = json.value("speed", 0.0);
        progress.chunks_received = json.value("chunks_received", 0ULL);
        const auto state_label = json.value("state", std::string{"pending"});
        auto phase = transfer_phase_from_string(state_label);
        if (!phase)
        {
            throw std::runtime_error("Unknown transfer state: " + state_label);
        }
        progress.phase = *phase;
        progress.error = optional_string(json, "error");
    }

    void to_json(nlohmann::json &json, const StartUploadRequest &request)
    {
        json = {
            {"filename", request.filename},
            {"total_size", request.total_size},
        };
    }

    void from_json(const nlohmann::json &json, StartUploadRequest &request)
    {
        request.filename = json.at("filename").get<std::string>();
        request.total_size = json.at("total_size").get<std::uint64_t>();
    }

    void to_json(nlohmann::json &json, const UploadReady &message)
    {
        json = {
            {"transfer_id", message.transfer_id},
            {"chunk_size", message.chunk_size},
        };
    }

    void from_json(const nlohmann::json &json, UploadReady &message)
    {
        message.transfer_id = json.at("transfer_id").get<std::string>();
        message.chunk_size = json.value("chunk_size", kChunkSize);
    }

    void to_json(nlohmann::json &json, const UploadChunkRequest &request)
    {
        json = {
            {"transfer_id", request.transfer_id},
            {"chunk_index", request.chunk_index},
            {"chunk_data", request.chunk_data},
            {"chunk_hash", request.chunk_hash},
        };
    }

    void from_json(const nlohmann::json &json, UploadChunkRequest &request)
    {
        request.transfer_id = json.at("transfer_id").get<std::string>();
        request.chunk_index = json.at("chunk_index").get<std::uint64_t>();
        request.chunk_data = json.at("chunk_data").get<std::string>();
        request.chunk_hash = json.at("chunk_hash").get<std::string>();
    }

    void to_json(nlohmann::json &json, const ChunkAck &message)
    {
        json = {
            {"transfer_id", message.transfer_id},
            {"chunk_index", message.chunk_index},
            {"received_size", message.received_size},
            {"duplicate", message.duplicate},
            {"progress", message.progress},
        };
    }

    void from_json(const nlohmann::json &json, ChunkAck &message)
    {
        message.transfer_id = json.at("transfer_id").get<std::string>();
        message.chunk_index = json.at("chunk_index").get<std::uint64_t>();
        message.received_size = json.value("received_size", 0ULL);
        message.duplicate = json.value("duplicate", false);
        message.progress = json.value("progress", TransferProgress{});
    }

    void to_json(nlohmann::json &json, const ChunkFailed &message)
    {
        json = {
            {"transfer_id", message.transfer_id},
            {"chunk_index", message.chunk_index},
            {"error", message.error},
            {"code", to_int(message.code)},
            {"retryable", message.retryable},
            {"attempts", message.attempts},
        };
    }

    void from_json(const nlohmann::json &json, ChunkFailed &message)
    {
        message.transfer_id = json.at("transfer_id").get<std::string>();
        message.chunk_index = json.at("chunk_index").get<std::uint64_t>();
        message.error = json.value("error", std::string{});
        message.code = error_code_from_int(json.value("code", static_cast<std::uint16_t>(0)));
        message.retryable = json.value("retryable", false);
        message.attempts = json.value("attempts", 0u);
    }

    void to_json(nlohmann::json &json, const TransferRequest &request)
    {
        json = {{"transfer_id", request.transfer_id}};
    }

    void from_json(const nlohmann::json &json, TransferRequest &request)
    {
        request.transfer_id = json.at("transfer_id").get<std::string>();
    }

    void to_json(nlohmann::json &json, const UploadComplete &message)
    {
        json = {
            {"transfer_id", message.transfer_id},
            {"filename", message.filename},
            {"size", message.size},
            {"hash", message.hash},
            {"is_safe", message.is_safe},
            {"quarantined", message.quarantined},
        };
    }

    void from_json(const nlohmann::json &json, UploadComplete &message)
    {
        message.transfer_id = json.at("transfer_id").get<std::string>();
        message.filename = json.at("filename").get<std::string>();
        message.size = json.value("size", 0ULL);
        message.hash = json.value("hash", std::string{});
        message.is_safe = json.value("is_safe", true);
        message.quarantined = json.value("quarantined", false);
    }

    void to_json(nlohmann::json &json, const UploadFailed &message)
    {
        json = {
            {"transfer_id", message.transfer_id},
            {"error", message.error},
            {"code", to_int(message.code)},
        };
    }

    void from_json(const nlohmann::json &json, UploadFailed &message)
    {
        message.transfer_id = json.at("transfer_id").get<std::string>();
        message.error = json.value("error", std::string{});
        message.code = error_code_from_int(json.value("code", static_cast<std::uint16_t>(0)));
    }

    void to_json(nlohmann::json &json, const TransferCancelled &message)
    {
        json = {{"transfer_id", message.transfer_id}};
    }

    void from_json(const nlohmann::json &json, TransferCancelled &message)
    {
        message.transfer_id = json.at("transfer_id").get<std::string>();
    }

    void to_json(nlohmann::json &json, const StartDownloadRequest &request)
    {
        json = {
            {"filename", request.filename},
            {"start_position", request.start_position},
        };
    }

    void from_json(const nlohmann::json &json, StartDownloadRequest &request)
    {
        request.filename = json.at("filename").get<std::string>();
        request.start_position = json.value("start_position", 0ULL);
    }

    void to_json(nlohmann::json &json, const DownloadReady &message)
    {
        json = {
            {"transfer_id", message.transfer_id},
            {"filename", message.filename},
            {"total_size", message.total_size},
            {"chunk_size", message.chunk_size},
            {"start_position", message.start_position},
        };
    }

    void from_json(const nlohmann::json &json, DownloadReady &message)
    {
        message.transfer_id = json.at("transfer_id").get<std::string>();
        message.filename = json.at("filename").get<std::string>();
        message.total_size = json.value("total_size", 0ULL);
        message.chunk_size = json.value("chunk_size", kChunkSize);
        message.start_position = json.value("start_position", 0ULL);
    }

    void to_json(nlohmann::json &json, const DownloadChunkRequest &request)
    {
        json = {
            {"transfer_id", request.transfer_id},
            {"chunk_index", request.chunk_index},
        };
    }

    void from_json(const nlohmann::json &json, DownloadChunkRequest &request)
    {
        request.transfer_id = json.at("transfer_id").get<std::string>();
        request.chunk_index = json.at("chunk_index").get<std::uint64_t>();
    }

    void to_json(nlohmann::json &json, const FileChunkHeader &header)
    {
        json = {
            {"transfer_id", header.transfer_id},
            {"chunk_index", header.chunk_index},
            {"chunk_size", header.chunk_size},
            {"chunk_hash", header.chunk_hash},
            {"end_of_file", header.end_of_file},
        };
    }

    void from_json(const nlohmann::json &json, FileChunkHeader &header)
    {
        header.transfer_id = json.at("transfer_id").get<std::string>();
        header.chunk_index = json.at("chunk_index").get<std::uint64_t>();
        header.chunk_size = json.value("chunk_size", 0ULL);
        header.chunk_hash = json.value("chunk_hash", std::string{});
        header.end_of_file = json.value("end_of_file", false);
    }

    void to_json(nlohmann::json &json, const FileNameRequest &request)
    {
        json = {{"filename", request.filename}};
    }

    void from_json(const nlohmann::json &json, FileNameRequest &request)
    {
        request.filename = json.at("filename").get<std::string>();
    }

} // namespace parcel::protocol
