#include "parcel/server/session.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "parcel/framing.hpp"
#include "session_common.hpp"

namespace parcel::server
{

    void Session::handle_start_download(const protocol::RequestEnvelope &envelope)
    {
        const auto request = envelope.payload.get<protocol::StartDownloadRequest>();
        const auto outcome = services_.engine.start_download(request.filename, *identity_, request.start_position);
        if (const auto *ticket = std::get_if<DownloadTicket>(&outcome))
        {
            downloads_.insert(ticket->transfer_id);
        }
        send_response(session_common::reply_for(outcome, envelope.request_id));
    }

    // A file_chunk header is followed by one payload block with the chunk bytes. The
    // last chunk is additionally followed by the end-of-transfer sentinel; a request
    // past the end gets an empty header and the sentinel alone.
    void Session::handle_download_chunk(const protocol::RequestEnvelope &envelope)
    {
        const auto request = envelope.payload.get<protocol::DownloadChunkRequest>();
        const auto outcome = services_.engine.send_chunk(request.transfer_id, request.chunk_index, *identity_);

        std::visit(overloaded{
                       [&](const OutgoingChunk &chunk)
                       {
                           const protocol::FileChunkHeader header{
                               .transfer_id = chunk.transfer_id,
                               .chunk_index = chunk.chunk_index,
                               .chunk_size = chunk.data.size(),
                               .chunk_hash = chunk.digest,
                               .end_of_file = chunk.end_of_file,
                           };
                           send_response(session_common::make_message(protocol::MessageType::FileChunk, header,
                                                                      envelope.request_id));
                           if (!chunk.data.empty())
                           {
                               enqueue(protocol::encode_payload(chunk.data));
                           }
                           if (chunk.end_of_file)
                           {
                               enqueue(protocol::encode_end_of_transfer());
                           }
                           if (chunk.data.empty())
                           {
                               downloads_.erase(chunk.transfer_id);
                               spdlog::debug("Download {} drained by {}", chunk.transfer_id, endpoint_label_);
                           }
                       },
                       [&](const TransferFailed &failed)
                       {
                           services_.engine.finish_download(failed.transfer_id);
                           downloads_.erase(failed.transfer_id);
                           send_error(failed.code, failed.message, envelope.request_id);
                       },
                       [&](const TransferRejected &rejected)
                       { send_error(rejected.code, rejected.message, envelope.request_id); },
                   },
                   outcome);
    }

} // namespace parcel::server
