#include "parcel/server/session.hpp"

#include <nlohmann/json.hpp>

#include "parcel/version.hpp"
#include "session_common.hpp"

namespace parcel::server
{

    void Session::handle_list_files(const protocol::RequestEnvelope &envelope)
    {
        nlohmann::json payload;
        payload["files"] = services_.engine.list_files();
        send_response(session_common::make_message(protocol::MessageType::FileList, std::move(payload),
                                                   envelope.request_id));
    }

    void Session::handle_file_info(const protocol::RequestEnvelope &envelope)
    {
        const auto request = envelope.payload.get<protocol::FileNameRequest>();
        const auto metadata = services_.engine.file_info(request.filename);
        if (!metadata)
        {
            send_error(parcel::ErrorCode::NotFound, "File not found: " + request.filename, envelope.request_id);
            return;
        }
        send_response(session_common::make_message(protocol::MessageType::FileInfo, *metadata, envelope.request_id));
    }

    void Session::handle_delete_file(const protocol::RequestEnvelope &envelope)
    {
        const auto request = envelope.payload.get<protocol::FileNameRequest>();
        const auto outcome = services_.engine.delete_file(request.filename, *identity_);
        send_response(session_common::reply_for(outcome, envelope.request_id));
    }

    void Session::handle_list_transfers(const protocol::RequestEnvelope &envelope)
    {
        nlohmann::json payload;
        payload["transfers"] = services_.engine.active_transfers(*identity_);
        send_response(session_common::make_message(protocol::MessageType::TransferList, std::move(payload),
                                                   envelope.request_id));
    }

    void Session::handle_ping(const protocol::RequestEnvelope &envelope)
    {
        nlohmann::json payload;
        payload["version"] = std::string(parcel::version());
        send_response(session_common::make_message(protocol::MessageType::Pong, std::move(payload),
                                                   envelope.request_id));
    }

} // namespace parcel::server
