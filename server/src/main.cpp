#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "parcel/server/server.hpp"
#include "parcel/version.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace
{

    void print_usage(const char *program_name)
    {
        std::cout << "Parcel server " << parcel::version() << "\n"
                  << "Usage: " << program_name
                  << " --port <PORT> --root <ROOT> [--address <ADDRESS>] [--threads <N>] "
                     "[--max-file-size <BYTES>] [--log <FILE>] [--log-level <LEVEL>]\n";
    }

    std::optional<std::string> read_option(int &index, int argc, char *argv[])
    {
        if (index + 1 >= argc)
        {
            return std::nullopt;
        }
        ++index;
        return std::string(argv[index]);
    }

    bool apply_option(parcel::server::ServerConfig &config, const std::string &arg, const std::string &value)
    {
        if (arg == "--port")
        {
            const auto port = std::stoul(value);
            if (port == 0 || port > 65535)
            {
                throw std::out_of_range("port must be between 1 and 65535");
            }
            config.port = static_cast<std::uint16_t>(port);
        }
        else if (arg == "--root")
        {
            config.root = std::filesystem::path(value);
        }
        else if (arg == "--address")
        {
            config.address = value;
        }
        else if (arg == "--threads")
        {
            config.worker_threads = static_cast<std::size_t>(std::stoul(value));
        }
        else if (arg == "--max-file-size")
        {
            config.max_file_size = std::stoull(value);
        }
        else if (arg == "--log")
        {
            config.log_file = std::filesystem::path(value);
        }
        else if (arg == "--log-level")
        {
            const auto level = spdlog::level::from_str(value);
            if (level == spdlog::level::off && value != "off")
            {
                throw std::invalid_argument("unknown log level " + value);
            }
            config.log_level = level;
        }
        else
        {
            return false;
        }
        return true;
    }

} // namespace

int main(int argc, char *argv[])
{
    using parcel::server::Server;
    using parcel::server::ServerConfig;

    ServerConfig config;

    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            print_usage(argv[0]);
            return EXIT_SUCCESS;
        }
        const auto value = read_option(i, argc, argv);
        if (!value)
        {
            std::cerr << "Missing value for " << arg << std::endl;
            print_usage(argv[0]);
            return EXIT_FAILURE;
        }
        try
        {
            if (!apply_option(config, arg, *value))
            {
                std::cerr << "Unknown argument: " << arg << std::endl;
                print_usage(argv[0]);
                return EXIT_FAILURE;
            }
        }
        catch (const std::exception &ex)
        {
            std::cerr << "Invalid value for " << arg << ": " << ex.what() << std::endl;
            return EXIT_FAILURE;
        }
    }

    if (config.port == 0 || config.root.empty())
    {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    try
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (config.log_file)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file->string(), true));
        }
        auto logger = std::make_shared<spdlog::logger>("server", sinks.begin(), sinks.end());
        logger->set_level(config.log_level);
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        spdlog::set_default_logger(logger);
        spdlog::info("Starting Parcel server {} on {}:{}", parcel::version(), config.address, config.port);

        Server server(std::move(config));
        server.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Server failed: " << ex.what() << std::endl;
        spdlog::error("Fatal error: {}", ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
