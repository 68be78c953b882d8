#include "parcel/server/chunk_store.hpp"

#include <system_error>

#include <spdlog/spdlog.h>

#include "parcel/server/storage_layout.hpp"

namespace parcel::server
{

    ChunkStore::ChunkStore(std::filesystem::path temp_path, std::uint64_t chunk_size)
        : temp_path_(std::move(temp_path)), chunk_size_(chunk_size), last_update_(std::chrono::system_clock::now())
    {
    }

    ChunkStore::~ChunkStore()
    {
        close();
    }

    void ChunkStore::open()
    {
        if (file_.is_open())
        {
            return;
        }
        if (opened_once_)
        {
            throw TransferError(parcel::ErrorCode::InternalError, "Chunk store already closed");
        }
        std::filesystem::create_directories(temp_path_.parent_path());
        file_.open(temp_path_, std::ios::binary | std::ios::in | std::ios::out | std::ios::trunc);
        if (!file_.is_open())
        {
            throw TransferError(parcel::ErrorCode::ChunkWriteFailed, "Failed to open temp file " + temp_path_.string());
        }
        opened_once_ = true;
    }

    ChunkWriteResult ChunkStore::write_chunk(std::uint64_t index, std::span<const std::byte> data,
                                             const std::string &expected_digest)
    {
        const auto computed = crypto::hash_bytes(data);
        if (computed != expected_digest)
        {
            return {ChunkWriteStatus::DigestMismatch, "Chunk hash mismatch"};
        }

        if (auto it = chunk_hashes_.find(index); it != chunk_hashes_.end())
        {
            if (it->second == expected_digest)
            {
                return {ChunkWriteStatus::Duplicate, {}};
            }
            return {ChunkWriteStatus::Conflict, "Chunk " + std::to_string(index) + " already accepted with different content"};
        }

        try
        {
            open();
        }
        catch (const TransferError &ex)
        {
            return {ChunkWriteStatus::WriteFailed, ex.what()};
        }

        file_.seekp(static_cast<std::streamoff>(index * chunk_size_));
        file_.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
        file_.flush();
        if (!file_)
        {
            file_.clear();
            return {ChunkWriteStatus::WriteFailed, "Failed to write chunk " + std::to_string(index)};
        }

        received_size_ += static_cast<std::uint64_t>(data.size());
        chunk_hashes_.emplace(index, expected_digest);
        arrival_digest_.update(data);
        last_update_ = std::chrono::system_clock::now();
        return {ChunkWriteStatus::Written, {}};
    }

    void ChunkStore::close() noexcept
    {
        if (!file_.is_open())
        {
            return;
        }
        file_.close();
        if (file_.fail())
        {
            spdlog::warn("Closing temp file {} reported an error", temp_path_.string());
        }
    }

    void ChunkStore::discard() noexcept
    {
        close();
        std::error_code ec;
        std::filesystem::remove(temp_path_, ec);
        if (ec)
        {
            spdlog::warn("Failed to remove temp file {}: {}", temp_path_.string(), ec.message());
        }
    }

} // namespace parcel::server
