#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include <spdlog/common.h>

namespace parcel::server
{

    struct ServerConfig
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{0};
        std::filesystem::path root;
        std::size_t worker_threads{0};
        std::uint64_t max_file_size{100ULL * 1024 * 1024};
        std::optional<std::filesystem::path> log_file;
        spdlog::level::level_enum log_level{spdlog::level::info};
    };

} // namespace parcel::server
