#include "parcel/server/file_catalog.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "parcel/server/storage_layout.hpp"

namespace parcel::server
{

    FileCatalog::FileCatalog(std::filesystem::path metadata_file) : metadata_file_(std::move(metadata_file))
    {
        if (metadata_file_.has_parent_path())
        {
            std::filesystem::create_directories(metadata_file_.parent_path());
        }
        std::lock_guard lock(mutex_);
        load_locked();
    }

    void FileCatalog::append(const protocol::FileMetadata &metadata)
    {
        std::lock_guard lock(mutex_);
        records_.push_back(metadata);
        try
        {
            persist_locked();
        }
        catch (...)
        {
            records_.pop_back();
            throw;
        }
    }

    std::optional<protocol::FileMetadata> FileCatalog::find(const std::string &filename) const
    {
        std::lock_guard lock(mutex_);
        const auto it = std::find_if(records_.rbegin(), records_.rend(), [&](const protocol::FileMetadata &record)
                                     { return record.filename == filename; });
        if (it == records_.rend())
        {
            return std::nullopt;
        }
        return *it;
    }

    std::vector<protocol::FileMetadata> FileCatalog::list() const
    {
        std::lock_guard lock(mutex_);
        return records_;
    }

    bool FileCatalog::remove(const std::string &filename)
    {
        std::lock_guard lock(mutex_);
        const auto previous = records_;
        const auto erased = std::erase_if(records_, [&](const protocol::FileMetadata &record)
                                          { return record.filename == filename; });
        if (erased == 0)
        {
            return false;
        }
        try
        {
            persist_locked();
        }
        catch (...)
        {
            records_ = previous;
            throw;
        }
        return true;
    }

    void FileCatalog::load_locked()
    {
        records_.clear();
        if (!std::filesystem::exists(metadata_file_))
        {
            persist_locked();
            return;
        }
        std::ifstream in(metadata_file_);
        if (!in.is_open())
        {
            throw TransferError(parcel::ErrorCode::InternalError,
                                "Failed to open file metadata " + metadata_file_.string());
        }
        const auto json = nlohmann::json::parse(in, nullptr, false);
        if (json.is_discarded() || !json.is_array())
        {
            // Keep the unreadable file for inspection and start a fresh collection.
            auto backup = metadata_file_;
            backup += ".corrupt";
            std::error_code ec;
            std::filesystem::rename(metadata_file_, backup, ec);
            spdlog::warn("File metadata {} is unreadable, moved to {}", metadata_file_.string(), backup.string());
            persist_locked();
            return;
        }
        records_ = json.get<std::vector<protocol::FileMetadata>>();
    }

    void FileCatalog::persist_locked() const
    {
        // Write beside the target and rename so readers never observe a half written collection.
        auto staging = metadata_file_;
        staging += ".tmp";
        {
            std::ofstream out(staging, std::ios::trunc);
            if (!out.is_open())
            {
                throw TransferError(parcel::ErrorCode::InternalError,
                                    "Failed to write file metadata " + staging.string());
            }
            out << nlohmann::json(records_).dump(2);
            out.flush();
            if (!out)
            {
                throw TransferError(parcel::ErrorCode::InternalError,
                                    "Failed to write file metadata " + staging.string());
            }
        }
        std::error_code ec;
        std::filesystem::rename(staging, metadata_file_, ec);
        if (ec)
        {
            throw TransferError(parcel::ErrorCode::InternalError, "Failed to store file metadata: " + ec.message());
        }
    }

} // namespace parcel::server
