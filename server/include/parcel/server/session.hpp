#pragma once

#include <asio/ip/tcp.hpp>
#include <array>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include <nlohmann/json.hpp>

#include "parcel/error_codes.hpp"
#include "parcel/framing.hpp"
#include "parcel/protocol.hpp"
#include "parcel/server/transfer_engine.hpp"
#include "parcel/server/user_store.hpp"

namespace parcel::server
{

    struct ServerServices
    {
        TransferEngine &engine;
        UserStore &user_store;
    };

    /**
     * One client connection. The socket is created on a strand, so every read
     * completion and every handler below runs serialized on it; outbound frames
     * are queued and written one at a time.
     */
    class Session : public std::enable_shared_from_this<Session>
    {
    public:
        Session(asio::ip::tcp::socket socket, ServerServices services);
        ~Session();

        void start();

        void stop();

    private:
        void read_frame_header();
        void read_frame_payload(std::size_t size);
        void process_message(const nlohmann::json &json);
        void dispatch(const protocol::RequestEnvelope &envelope);

        void send_response(const protocol::ResponseEnvelope &envelope);
        void send_error(parcel::ErrorCode code, std::string message,
                        std::optional<std::string> request_id = std::nullopt);
        void enqueue(std::vector<std::uint8_t> bytes);
        void write_next();

        bool require_authentication(const protocol::RequestEnvelope &envelope);
        void on_disconnect();

        // Command handlers
        void handle_authenticate(const protocol::RequestEnvelope &envelope);
        void handle_start_upload(const protocol::RequestEnvelope &envelope);
        void handle_upload_chunk(const protocol::RequestEnvelope &envelope);
        void handle_complete_upload(const protocol::RequestEnvelope &envelope);
        void handle_cancel_transfer(const protocol::RequestEnvelope &envelope);
        void handle_start_download(const protocol::RequestEnvelope &envelope);
        void handle_download_chunk(const protocol::RequestEnvelope &envelope);
        void handle_list_files(const protocol::RequestEnvelope &envelope);
        void handle_file_info(const protocol::RequestEnvelope &envelope);
        void handle_delete_file(const protocol::RequestEnvelope &envelope);
        void handle_list_transfers(const protocol::RequestEnvelope &envelope);
        void handle_ping(const protocol::RequestEnvelope &envelope);

        std::string remote_endpoint() const;

        asio::ip::tcp::socket socket_;
        ServerServices services_;
        std::string endpoint_label_;

        std::array<std::uint8_t, protocol::kFrameHeaderSize> header_buffer_{};
        std::vector<std::uint8_t> buffer_;
        std::deque<std::vector<std::uint8_t>> outbox_;
        bool closed_{false};

        std::optional<std::string> identity_;
        std::unordered_set<std::string> downloads_;
    };

} // namespace parcel::server
