#include "parcel/server/transfer_engine.hpp"

#include <mutex>
#include <system_error>

#include <spdlog/spdlog.h>

namespace parcel::server
{

    namespace
    {

        StorageLayout prepared(StorageLayout layout)
        {
            layout.ensure_directories();
            if (const auto purged = layout.purge_temp(); purged > 0)
            {
                spdlog::info("Discarded {} partial upload(s) from a previous run", purged);
            }
            return layout;
        }

        enum class Access
        {
            Regular,
            Cancel
        };

        // Runs `operation` on the transfer's state under its lock. A transfer that
        // ends up terminal is detached and removed before the lock is released.
        // A pending cancel from the owner is served before any queued regular access.
        template <typename Outcome, typename Operation>
        Outcome with_transfer(TransferRegistry &registry, const std::string &transfer_id, const std::string &caller,
                              Access access, Operation &&operation)
        {
            auto entry = registry.get(transfer_id);
            if (!entry)
            {
                return TransferRejected{parcel::ErrorCode::NotFound, "Unknown transfer: " + transfer_id};
            }
            if (access == Access::Cancel && entry->sender == caller)
            {
                entry->cancel_requested = true;
            }
            std::lock_guard lock(entry->mutex);
            if (entry->detached)
            {
                return TransferRejected{parcel::ErrorCode::NotFound, "Unknown transfer: " + transfer_id};
            }
            if (entry->sender != caller)
            {
                return TransferRejected{parcel::ErrorCode::PermissionDenied, "Transfer belongs to another user"};
            }
            if (access == Access::Regular && entry->cancel_requested)
            {
                return TransferRejected{parcel::ErrorCode::NotFound, "Transfer is being cancelled: " + transfer_id};
            }
            Outcome outcome = operation(entry->state);
            if (entry->state.is_terminal())
            {
                entry->detached = true;
                registry.remove(transfer_id);
            }
            return outcome;
        }

    } // namespace

    TransferEngine::TransferEngine(StorageLayout layout, SecurityScanner &scanner, TransferRegistry::Clock clock)
        : layout_(prepared(std::move(layout))),
          catalog_(layout_.metadata_file),
          registry_(layout_.temp, std::move(clock)),
          finalizer_(layout_, catalog_, scanner),
          sender_(layout_, catalog_)
    {
    }

    StartUploadOutcome TransferEngine::start_upload(const std::string &filename, std::uint64_t total_size,
                                                    const std::string &sender)
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

        try
        {
            auto transfer_id = registry_.create(name, total_size, sender);
            spdlog::info("Started upload {} for {} ({} bytes) from {}", transfer_id, name, total_size, sender);
            return UploadTicket{std::move(transfer_id), protocol::kChunkSize};
        }
        catch (const TransferError &ex)
        {
            spdlog::error("Could not start upload of {} for {}: {}", name, sender, ex.what());
            return TransferFailed{{}, ex.code(), ex.what(), std::nullopt};
        }
    }

    ChunkOutcome TransferEngine::handle_chunk(const std::string &transfer_id, std::uint64_t chunk_index,
                                              std::span<const std::byte> data, const std::string &chunk_hash,
                                              const std::string &caller)
    {
        return with_transfer<ChunkOutcome>(registry_, transfer_id, caller, Access::Regular, [&](TransferState &state)
                                           { return state.accept_chunk(chunk_index, data, chunk_hash); });
    }

    CompleteOutcome TransferEngine::complete_upload(const std::string &transfer_id, const std::string &caller)
    {
        return with_transfer<CompleteOutcome>(registry_, transfer_id, caller, Access::Regular,
                                              [&](TransferState &state)
                                              { return finalizer_.finalize(state); });
    }

    CancelOutcome TransferEngine::cancel_transfer(const std::string &transfer_id, const std::string &caller)
    {
        return with_transfer<CancelOutcome>(registry_, transfer_id, caller, Access::Cancel, [&](TransferState &state)
                                            {
            const auto received = state.received_size();
            state.cancel();
            spdlog::info("Transfer cancelled: {}", transfer_id);
            return CancelledTransfer{transfer_id, received}; });
    }

    StartDownloadOutcome TransferEngine::start_download(const std::string &filename, const std::string &requester,
                                                        std::uint64_t start_position)
    {
        return sender_.start_download(filename, requester, start_position);
    }

    SendChunkOutcome TransferEngine::send_chunk(const std::string &transfer_id, std::uint64_t chunk_index,
                                                const std::string &requester)
    {
        return sender_.send_chunk(transfer_id, chunk_index, requester);
    }

    bool TransferEngine::finish_download(const std::string &transfer_id)
    {
        return sender_.finish(transfer_id);
    }

    std::vector<protocol::FileMetadata> TransferEngine::list_files() const
    {
        return catalog_.list();
    }

    std::optional<protocol::FileMetadata> TransferEngine::file_info(const std::string &filename) const
    {
        return catalog_.find(filename);
    }

    DeleteOutcome TransferEngine::delete_file(const std::string &filename, const std::string &requester)
    {
        const auto metadata = catalog_.find(filename);
        if (!metadata)
        {
            return TransferRejected{parcel::ErrorCode::NotFound, "File not found: " + filename};
        }
        if (metadata->uploaded_by != requester)
        {
            return TransferRejected{parcel::ErrorCode::PermissionDenied, "Only the uploader may delete a file"};
        }

        // Storage names are validated file names, so both joins stay inside their directories.
        for (const auto &path : {layout_.files / metadata->filename, layout_.quarantine / metadata->filename})
        {
            std::error_code ec;
            std::filesystem::remove(path, ec);
            if (ec)
            {
                return TransferRejected{parcel::ErrorCode::InternalError,
                                        "Failed to delete " + metadata->filename + ": " + ec.message()};
            }
        }
        try
        {
            catalog_.remove(metadata->filename);
        }
        catch (const TransferError &ex)
        {
            return TransferRejected{ex.code(), ex.what()};
        }
        spdlog::info("Deleted file {} for {}", metadata->filename, requester);
        return FileDeleted{metadata->filename, metadata->quarantined};
    }

    std::vector<protocol::TransferProgress> TransferEngine::active_transfers(
        const std::optional<std::string> &sender) const
    {
        return registry_.snapshot(sender);
    }

} // namespace parcel::server
