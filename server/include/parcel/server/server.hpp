#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/signal_set.hpp>
#include <memory>
#include <thread>
#include <vector>

#include "parcel/server/config.hpp"
#include "parcel/server/security_scanner.hpp"
#include "parcel/server/transfer_engine.hpp"
#include "parcel/server/user_store.hpp"

namespace parcel::server
{

    class Server
    {
    public:
        explicit Server(ServerConfig config);

        void run();

    private:
        void accept_next();
        void on_accept(std::error_code ec, asio::ip::tcp::socket socket);
        void handle_signal();

        ServerConfig config_;

        // Declared before the io_context so they outlive sessions still queued on it.
        PolicyScanner scanner_;
        TransferEngine engine_;
        UserStore user_store_;

        asio::io_context io_context_;
        asio::ip::tcp::acceptor acceptor_;
        asio::signal_set signals_;

        std::vector<std::thread> workers_;
    };

} // namespace parcel::server
