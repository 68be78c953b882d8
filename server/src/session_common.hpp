#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "parcel/error_codes.hpp"
#include "parcel/protocol.hpp"
#include "parcel/server/transfer_outcome.hpp"

namespace parcel::server::session_common
{

    using RequestId = std::optional<std::string>;

    protocol::ResponseEnvelope make_message(protocol::MessageType type, nlohmann::json payload,
                                            const RequestId &request_id);

    protocol::ResponseEnvelope make_error(parcel::ErrorCode code, std::string message, const RequestId &request_id);

    // One reply per engine outcome; the download data path is framed by the session itself.
    protocol::ResponseEnvelope reply_for(const StartUploadOutcome &outcome, const RequestId &request_id);
    protocol::ResponseEnvelope reply_for(const ChunkOutcome &outcome, const RequestId &request_id);
    protocol::ResponseEnvelope reply_for(const CompleteOutcome &outcome, const RequestId &request_id);
    protocol::ResponseEnvelope reply_for(const CancelOutcome &outcome, const RequestId &request_id);
    protocol::ResponseEnvelope reply_for(const StartDownloadOutcome &outcome, const RequestId &request_id);
    protocol::ResponseEnvelope reply_for(const DeleteOutcome &outcome, const RequestId &request_id);

} // namespace parcel::server::session_common
