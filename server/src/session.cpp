#include "parcel/server/session.hpp"

#include <asio/read.hpp>
#include <asio/write.hpp>
#include <nlohmann/json.hpp>

#include <string>

#include <spdlog/spdlog.h>

#include "parcel/framing.hpp"
#include "parcel/server/storage_layout.hpp"
#include "session_common.hpp"

namespace parcel::server
{

    namespace
    {

        // A chunk request carries kChunkSize bytes as base64; anything far larger is not a peer we speak to.
        constexpr std::uint32_t kMaxFrameSize = 1024 * 1024;

        std::optional<std::string> request_id_of(const nlohmann::json &json)
        {
            if (json.is_object())
            {
                if (const auto it = json.find("id"); it != json.end() && it->is_string())
                {
                    return it->get<std::string>();
                }
            }
            return std::nullopt;
        }

    } // namespace

    Session::Session(asio::ip::tcp::socket socket, ServerServices services)
        : socket_(std::move(socket)), services_(services)
    {
        endpoint_label_ = remote_endpoint();
    }

    Session::~Session()
    {
        on_disconnect();
    }

    void Session::start()
    {
        spdlog::info("Client connected from {}", endpoint_label_);
        read_frame_header();
    }

    void Session::stop()
    {
        if (closed_)
        {
            return;
        }
        closed_ = true;
        std::error_code ec;
        spdlog::info("Closing connection for {}", endpoint_label_);
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
        on_disconnect();
    }

    void Session::read_frame_header()
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(header_buffer_),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 stop();
                                 return;
                             }
                             const std::uint32_t payload_size = protocol::read_u32_be(header_buffer_);
                             if (payload_size == 0)
                             {
                                 read_frame_header();
                                 return;
                             }
                             if (payload_size > kMaxFrameSize)
                             {
                                 spdlog::warn("Dropping {}: frame of {} bytes exceeds the limit", endpoint_label_,
                                              payload_size);
                                 stop();
                                 return;
                             }
                             buffer_.resize(payload_size);
                             read_frame_payload(payload_size);
                         });
    }

    void Session::read_frame_payload(std::size_t size)
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(buffer_.data(), size),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 stop();
                                 return;
                             }
                             const auto json = nlohmann::json::parse(buffer_.begin(), buffer_.end(), nullptr, false);
                             if (json.is_discarded())
                             {
                                 send_error(parcel::ErrorCode::InvalidPayload, "Frame is not valid JSON");
                             }
                             else
                             {
                                 process_message(json);
                             }
                             read_frame_header();
                         });
    }

    void Session::process_message(const nlohmann::json &json)
    {
        protocol::RequestEnvelope envelope;
        try
        {
            envelope = json.get<protocol::RequestEnvelope>();
        }
        catch (const std::exception &ex)
        {
            send_error(parcel::ErrorCode::InvalidCommand, ex.what(), request_id_of(json));
            return;
        }

        spdlog::debug("{} -> command {}", endpoint_label_, protocol::to_string(envelope.command));

        try
        {
            dispatch(envelope);
        }
        catch (const nlohmann::json::exception &ex)
        {
            send_error(parcel::ErrorCode::InvalidPayload, ex.what(), envelope.request_id);
        }
        catch (const TransferError &ex)
        {
            send_error(ex.code(), ex.what(), envelope.request_id);
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Command {} from {} failed: {}", protocol::to_string(envelope.command), endpoint_label_,
                          ex.what());
            send_error(parcel::ErrorCode::InternalError, ex.what(), envelope.request_id);
        }
    }

    void Session::dispatch(const protocol::RequestEnvelope &envelope)
    {
        using protocol::Command;

        if (envelope.command != Command::Authenticate && envelope.command != Command::Ping &&
            !require_authentication(envelope))
        {
            return;
        }

        switch (envelope.command)
        {
        case Command::Authenticate:
            handle_authenticate(envelope);
            break;
        case Command::StartUpload:
            handle_start_upload(envelope);
            break;
        case Command::UploadChunk:
            handle_upload_chunk(envelope);
            break;
        case Command::CompleteUpload:
            handle_complete_upload(envelope);
            break;
        case Command::CancelTransfer:
            handle_cancel_transfer(envelope);
            break;
        case Command::StartDownload:
            handle_start_download(envelope);
            break;
        case Command::DownloadChunk:
            handle_download_chunk(envelope);
            break;
        case Command::ListFiles:
            handle_list_files(envelope);
            break;
        case Command::FileInfo:
            handle_file_info(envelope);
            break;
        case Command::DeleteFile:
            handle_delete_file(envelope);
            break;
        case Command::ListTransfers:
            handle_list_transfers(envelope);
            break;
        case Command::Ping:
            handle_ping(envelope);
            break;
        default:
            send_error(parcel::ErrorCode::Unsupported, "Command not supported", envelope.request_id);
            break;
        }
    }

    bool Session::require_authentication(const protocol::RequestEnvelope &envelope)
    {
        if (identity_)
        {
            return true;
        }
        send_error(parcel::ErrorCode::AuthenticationRequired, "Authentication required", envelope.request_id);
        return false;
    }

    void Session::send_response(const protocol::ResponseEnvelope &envelope)
    {
        const nlohmann::json json = envelope;
        enqueue(protocol::encode_frame(json));
    }

    void Session::send_error(parcel::ErrorCode code, std::string message, std::optional<std::string> request_id)
    {
        send_response(session_common::make_error(code, std::move(message), request_id));
    }

    void Session::enqueue(std::vector<std::uint8_t> bytes)
    {
        if (closed_)
        {
            return;
        }
        outbox_.push_back(std::move(bytes));
        if (outbox_.size() == 1)
        {
            write_next();
        }
    }

    void Session::write_next()
    {
        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(outbox_.front()),
                          [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                          {
                              if (ec)
                              {
                                  stop();
                                  return;
                              }
                              outbox_.pop_front();
                              if (!outbox_.empty() && !closed_)
                              {
                                  write_next();
                              }
                          });
    }

    void Session::on_disconnect()
    {
        // Uploads stay registered so the same identity can continue them from another connection.
        for (const auto &transfer_id : downloads_)
        {
            services_.engine.finish_download(transfer_id);
        }
        downloads_.clear();
        identity_.reset();
    }

    std::string Session::remote_endpoint() const
    {
        std::error_code ec;
        const auto endpoint = socket_.remote_endpoint(ec);
        if (ec)
        {
            return "unknown";
        }
        return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

} // namespace parcel::server
