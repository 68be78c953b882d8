#include "session_common.hpp"

#include "parcel/protocol.hpp"

namespace parcel::server::session_common
{

    using protocol::MessageType;

    protocol::ResponseEnvelope make_message(MessageType type, nlohmann::json payload, const RequestId &request_id)
    {
        protocol::ResponseEnvelope envelope;
        envelope.type = type;
        envelope.payload = std::move(payload);
        envelope.request_id = request_id;
        return envelope;
    }

    protocol::ResponseEnvelope make_error(parcel::ErrorCode code, std::string message, const RequestId &request_id)
    {
        const protocol::ErrorPayload payload{
            .code = code,
            .kind = parcel::kind_of(code),
            .message = std::move(message),
        };
        return make_message(MessageType::Error, payload, request_id);
    }

    protocol::ResponseEnvelope reply_for(const StartUploadOutcome &outcome, const RequestId &request_id)
    {
        return std::visit(
            overloaded{
                [&](const UploadTicket &ticket)
                {
                    const protocol::UploadReady ready{.transfer_id = ticket.transfer_id, .chunk_size = ticket.chunk_size};
                    return make_message(MessageType::UploadReady, ready, request_id);
                },
                [&](const TransferFailed &failed)
                {
                    const protocol::UploadFailed message{
                        .transfer_id = failed.transfer_id, .error = failed.message, .code = failed.code};
                    return make_message(MessageType::UploadFailed, message, request_id);
                },
                [&](const TransferRejected &rejected)
                { return make_error(rejected.code, rejected.message, request_id); },
            },
            outcome);
    }

    protocol::ResponseEnvelope reply_for(const ChunkOutcome &outcome, const RequestId &request_id)
    {
        return std::visit(
            overloaded{
                [&](const ChunkAccepted &accepted)
                {
                    const protocol::ChunkAck ack{
                        .transfer_id = accepted.transfer_id,
                        .chunk_index = accepted.chunk_index,
                        .received_size = accepted.received_size,
                        .duplicate = accepted.duplicate,
                        .progress = accepted.progress,
                    };
                    return make_message(MessageType::ChunkAck, ack, request_id);
                },
                [&](const ChunkRetry &retry)
                {
                    const protocol::ChunkFailed failed{
                        .transfer_id = retry.transfer_id,
                        .chunk_index = retry.chunk_index,
                        .error = retry.message,
                        .code = retry.code,
                        .retryable = true,
                        .attempts = retry.attempts,
                    };
                    return make_message(MessageType::ChunkFailed, failed, request_id);
                },
                [&](const TransferFailed &fatal)
                {
                    const protocol::ChunkFailed failed{
                        .transfer_id = fatal.transfer_id,
                        .chunk_index = fatal.chunk_index.value_or(0),
                        .error = fatal.message,
                        .code = fatal.code,
                        .retryable = false,
                        .attempts = protocol::kMaxRetries,
                    };
                    return make_message(MessageType::ChunkFailed, failed, request_id);
                },
                [&](const TransferRejected &rejected)
                { return make_error(rejected.code, rejected.message, request_id); },
            },
            outcome);
    }

    protocol::ResponseEnvelope reply_for(const CompleteOutcome &outcome, const RequestId &request_id)
    {
        return std::visit(
            overloaded{
                [&](const protocol::FileMetadata &metadata)
                {
                    const protocol::UploadComplete complete{
                        .transfer_id = metadata.transfer_id,
                        .filename = metadata.filename,
                        .size = metadata.size,
                        .hash = metadata.hash,
                        .is_safe = metadata.security_scan.is_safe,
                        .quarantined = metadata.quarantined,
                    };
                    return make_message(MessageType::UploadComplete, complete, request_id);
                },
                [&](const TransferFailed &failed)
                {
                    const protocol::UploadFailed message{
                        .transfer_id = failed.transfer_id, .error = failed.message, .code = failed.code};
                    return make_message(MessageType::UploadFailed, message, request_id);
                },
                [&](const TransferRejected &rejected)
                { return make_error(rejected.code, rejected.message, request_id); },
            },
            outcome);
    }

    protocol::ResponseEnvelope reply_for(const CancelOutcome &outcome, const RequestId &request_id)
    {
        return std::visit(
            overloaded{
                [&](const CancelledTransfer &cancelled)
                {
                    const protocol::TransferCancelled message{.transfer_id = cancelled.transfer_id};
                    return make_message(MessageType::TransferCancelled, message, request_id);
                },
                [&](const TransferRejected &rejected)
                { return make_error(rejected.code, rejected.message, request_id); },
            },
            outcome);
    }

    protocol::ResponseEnvelope reply_for(const StartDownloadOutcome &outcome, const RequestId &request_id)
    {
        return std::visit(
            overloaded{
                [&](const DownloadTicket &ticket)
                {
                    const protocol::DownloadReady ready{
                        .transfer_id = ticket.transfer_id,
                        .filename = ticket.filename,
                        .total_size = ticket.total_size,
                        .chunk_size = ticket.chunk_size,
                        .start_position = ticket.start_position,
                    };
                    return make_message(MessageType::DownloadReady, ready, request_id);
                },
                [&](const TransferRejected &rejected)
                { return make_error(rejected.code, rejected.message, request_id); },
            },
            outcome);
    }

    protocol::ResponseEnvelope reply_for(const DeleteOutcome &outcome, const RequestId &request_id)
    {
        return std::visit(
            overloaded{
                [&](const FileDeleted &deleted)
                {
                    nlohmann::json payload{
                        {"filename", deleted.filename},
                        {"quarantined", deleted.was_quarantined},
                    };
                    return make_message(MessageType::FileDeleted, std::move(payload), request_id);
                },
                [&](const TransferRejected &rejected)
                { return make_error(rejected.code, rejected.message, request_id); },
            },
            outcome);
    }

} // namespace parcel::server::session_common
