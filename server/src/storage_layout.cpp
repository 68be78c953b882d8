#include "parcel/server/storage_layout.hpp"

#include <system_error>

#include <spdlog/spdlog.h>

namespace parcel::server
{

    namespace
    {
        constexpr auto kFilesDir = "files";
        constexpr auto kQuarantineDir = "quarantine";
        constexpr auto kTempDir = "temp";
        constexpr auto kMetadataFile = "file_metadata.json";
        constexpr auto kUsersFile = "users.json";
    } // namespace

    TransferError::TransferError(parcel::ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

    StorageLayout StorageLayout::under(const std::filesystem::path &root)
    {
        return StorageLayout{
            .files = root / kFilesDir,
            .quarantine = root / kQuarantineDir,
            .temp = root / kTempDir,
            .metadata_file = root / kMetadataFile,
            .users_file = root / kUsersFile,
        };
    }

    void StorageLayout::ensure_directories() const
    {
        std::filesystem::create_directories(files);
        std::filesystem::create_directories(quarantine);
        std::filesystem::create_directories(temp);
        if (metadata_file.has_parent_path())
        {
            std::filesystem::create_directories(metadata_file.parent_path());
        }
    }

    std::size_t StorageLayout::purge_temp() const
    {
        std::size_t removed = 0;
        std::error_code ec;
        for (const auto &entry : std::filesystem::directory_iterator(temp, ec))
        {
            if (!entry.is_regular_file() || entry.path().extension() != ".part")
            {
                continue;
            }
            std::error_code remove_ec;
            if (std::filesystem::remove(entry.path(), remove_ec))
            {
                ++removed;
            }
            else if (remove_ec)
            {
                spdlog::warn("Could not remove stale temp file {}: {}", entry.path().string(), remove_ec.message());
            }
        }
        return removed;
    }

    std::string sanitize_filename(const std::string &requested)
    {
        if (requested.find('\0') != std::string::npos)
        {
            throw TransferError(parcel::ErrorCode::InvalidPayload, "Invalid filename");
        }
        // Only the last component is kept so a name can never escape the storage directory.
        const auto name = std::filesystem::path(requested).filename().string();
        if (name.empty() || name == "." || name == "..")
        {
            throw TransferError(parcel::ErrorCode::InvalidPayload, "Invalid filename");
        }
        return name;
    }

} // namespace parcel::server
