#include "parcel/server/sender_path.hpp"

#include <chrono>
#include <fstream>
#include <system_error>
#include <vector>

#include <spdlog/spdlog.h>

#include "parcel/crypto.hpp"

namespace parcel::server
{

    SenderPath::SenderPath(StorageLayout layout, FileCatalog &catalog, std::uint64_t chunk_size)
        : layout_(std::move(layout)), catalog_(catalog), chunk_size_(chunk_size)
    {
    }

    StartDownloadOutcome SenderPath::start_download(const std::string &filename, const std::string &requester,
                                                    std::uint64_t start_position)
    {
        std::string name;
        try
        {
            name = sanitize_filename(filename);
        }
        catch (const TransferError &ex)
        {
            return TransferRejected{ex.code(), ex.what()};
        }
        if (name != filename)
        {
            return TransferRejected{parcel::ErrorCode::InvalidPayload, "Filename must not contain a path"};
        }

        if (const auto metadata = catalog_.find(name))
        {
            if (metadata->quarantined)
            {
                return TransferRejected{parcel::ErrorCode::Quarantined, "File is quarantined: " + name};
            }
            if (!metadata->security_scan.is_safe)
            {
                return TransferRejected{parcel::ErrorCode::Quarantined,
                                        "File failed security scan: " +
                                            metadata->security_scan.reason.value_or("Unknown reason")};
            }
        }

        const auto path = layout_.files / name;
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec))
        {
            return TransferRejected{parcel::ErrorCode::NotFound, "File not found: " + name};
        }
        const auto total_size = std::filesystem::file_size(path, ec);
        if (ec)
        {
            return TransferRejected{parcel::ErrorCode::NotFound, "File not found: " + name};
        }
        if (start_position > total_size)
        {
            return TransferRejected{parcel::ErrorCode::InvalidPayload, "Start position beyond end of file"};
        }

        const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
                                std::chrono::system_clock::now().time_since_epoch())
                                .count();
        const auto transfer_id = "download_" + name + "_" + std::to_string(micros) + "_" + std::to_string(++sequence_);
        {
            std::lock_guard lock(mutex_);
            downloads_[transfer_id] = Download{
                .filename = name,
                .path = path,
                .total_size = total_size,
                .requester = requester,
            };
        }

        spdlog::info("Started download of {} ({} bytes) for {} from position {}", name, total_size, requester,
                     start_position);
        return DownloadTicket{
            .transfer_id = transfer_id,
            .filename = name,
            .total_size = total_size,
            .chunk_size = chunk_size_,
            .start_position = start_position,
        };
    }

    SendChunkOutcome SenderPath::send_chunk(const std::string &transfer_id, std::uint64_t index,
                                            const std::string &requester)
    {
        Download download;
        {
            std::lock_guard lock(mutex_);
            const auto it = downloads_.find(transfer_id);
            if (it == downloads_.end())
            {
                return TransferRejected{parcel::ErrorCode::NotFound, "Unknown transfer"};
            }
            if (it->second.requester != requester)
            {
                return TransferRejected{parcel::ErrorCode::PermissionDenied, "Transfer belongs to another user"};
            }
            download = it->second;
        }

        if (index > download.total_size / chunk_size_ ||
            index * chunk_size_ >= download.total_size)
        {
            finish(transfer_id);
            return OutgoingChunk{transfer_id, index, {}, crypto::hash_bytes({}), true};
        }

        std::ifstream file(download.path, std::ios::binary);
        if (!file.is_open())
        {
            finish(transfer_id);
            return TransferFailed{transfer_id, parcel::ErrorCode::NotFound,
                                  "Stored file is no longer available: " + download.filename, index};
        }
        const auto offset = index * chunk_size_;
        file.seekg(static_cast<std::streamoff>(offset));
        std::vector<std::byte> buffer(static_cast<std::size_t>(chunk_size_));
        file.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
        const auto read_bytes = static_cast<std::size_t>(file.gcount());
        if (read_bytes == 0 && file.bad())
        {
            return TransferFailed{transfer_id, parcel::ErrorCode::InternalError,
                                  "Failed to read chunk " + std::to_string(index), index};
        }
        buffer.resize(read_bytes);

        const bool end_of_file = offset + read_bytes >= download.total_size;
        auto digest = crypto::hash_bytes(buffer);
        spdlog::debug("Sending chunk {} of {} ({} bytes)", index, transfer_id, read_bytes);
        return OutgoingChunk{transfer_id, index, std::move(buffer), std::move(digest), end_of_file};
    }

    bool SenderPath::finish(const std::string &transfer_id)
    {
        std::lock_guard lock(mutex_);
        return downloads_.erase(transfer_id) > 0;
    }

    std::size_t SenderPath::active() const
    {
        std::lock_guard lock(mutex_);
        return downloads_.size();
    }

} // namespace parcel::server
