#include "parcel/server/session.hpp"

#include <nlohmann/json.hpp>

#include "parcel/encoding/base64.hpp"
#include "session_common.hpp"

namespace parcel::server
{

    void Session::handle_start_upload(const protocol::RequestEnvelope &envelope)
    {
        const auto request = envelope.payload.get<protocol::StartUploadRequest>();
        const auto outcome = services_.engine.start_upload(request.filename, request.total_size, *identity_);
        send_response(session_common::reply_for(outcome, envelope.request_id));
    }

    void Session::handle_upload_chunk(const protocol::RequestEnvelope &envelope)
    {
        const auto request = envelope.payload.get<protocol::UploadChunkRequest>();
        const auto data = encoding::decode_base64(request.chunk_data);
        if (!data)
        {
            send_error(parcel::ErrorCode::InvalidPayload, "Chunk data is not valid base64", envelope.request_id);
            return;
        }
        const auto outcome =
            services_.engine.handle_chunk(request.transfer_id, request.chunk_index, *data, request.chunk_hash, *identity_);
        send_response(session_common::reply_for(outcome, envelope.request_id));
    }

    void Session::handle_complete_upload(const protocol::RequestEnvelope &envelope)
    {
        const auto request = envelope.payload.get<protocol::TransferRequest>();
        const auto outcome = services_.engine.complete_upload(request.transfer_id, *identity_);
        send_response(session_common::reply_for(outcome, envelope.request_id));
    }

    void Session::handle_cancel_transfer(const protocol::RequestEnvelope &envelope)
    {
        const auto request = envelope.payload.get<protocol::TransferRequest>();
        const auto outcome = services_.engine.cancel_transfer(request.transfer_id, *identity_);
        send_response(session_common::reply_for(outcome, envelope.request_id));
    }

} // namespace parcel::server
