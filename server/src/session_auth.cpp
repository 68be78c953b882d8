#include "parcel/server/session.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "session_common.hpp"

namespace parcel::server
{

    void Session::handle_authenticate(const protocol::RequestEnvelope &envelope)
    {
        if (identity_)
        {
            send_error(parcel::ErrorCode::Conflict, "Already authenticated", envelope.request_id);
            return;
        }

        const auto request = envelope.payload.get<protocol::AuthenticateRequest>();
        if (request.username.empty())
        {
            send_error(parcel::ErrorCode::InvalidPayload, "Username is required", envelope.request_id);
            return;
        }

        if (request.register_user)
        {
            std::string message;
            if (!services_.user_store.register_user(request.username, request.password, message))
            {
                send_error(parcel::ErrorCode::Conflict, message, envelope.request_id);
                return;
            }
        }
        if (!services_.user_store.authenticate(request.username, request.password))
        {
            spdlog::warn("Failed login for {} from {}", request.username, endpoint_label_);
            send_error(parcel::ErrorCode::AuthenticationFailed, "Invalid credentials", envelope.request_id);
            return;
        }

        identity_ = request.username;
        const protocol::AuthenticateResponse response{
            .identity = request.username,
            .newly_registered = request.register_user,
        };
        send_response(session_common::make_message(protocol::MessageType::AuthOk, response, envelope.request_id));
        spdlog::info("Session authenticated as {} ({})", *identity_, endpoint_label_);
    }

} // namespace parcel::server
