#include "parcel/server/finalizer.hpp"

#include <chrono>
#include <system_error>

#include <spdlog/spdlog.h>

#include "parcel/crypto.hpp"

namespace parcel::server
{

    namespace
    {
        std::uint64_t unix_seconds()
        {
            return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(
                                                  std::chrono::system_clock::now().time_since_epoch())
                                                  .count());
        }

        void remove_quietly(const std::filesystem::path &path)
        {
            std::error_code ec;
            std::filesystem::remove(path, ec);
            if (ec)
            {
                spdlog::warn("Failed to remove {}: {}", path.string(), ec.message());
            }
        }
    } // namespace

    Finalizer::Finalizer(StorageLayout layout, FileCatalog &catalog, SecurityScanner &scanner)
        : layout_(std::move(layout)), catalog_(catalog), scanner_(scanner)
    {
        layout_.ensure_directories();
    }

    bool Finalizer::name_taken(const std::string &name) const
    {
        return std::filesystem::exists(layout_.files / name) || std::filesystem::exists(layout_.quarantine / name) ||
               catalog_.find(name).has_value();
    }

    std::filesystem::path Finalizer::reserve_destination(const std::string &filename) const
    {
        if (!name_taken(filename))
        {
            return layout_.files / filename;
        }
        const std::filesystem::path original(filename);
        const auto stem = original.stem().string();
        const auto extension = original.extension().string();
        const auto generation = std::to_string(unix_seconds());
        auto candidate = stem + "_" + generation + extension;
        for (std::size_t attempt = 1; name_taken(candidate); ++attempt)
        {
            candidate = stem + "_" + generation + "_" + std::to_string(attempt) + extension;
        }
        return layout_.files / candidate;
    }

    CompleteOutcome Finalizer::finalize(TransferState &state)
    {
        std::unique_ptr<ChunkStore> store;
        try
        {
            store = state.release_store();
        }
        catch (const TransferError &ex)
        {
            return TransferRejected{ex.code(), ex.what()};
        }

        const auto transfer_id = state.transfer_id();
        const auto fail = [&](parcel::ErrorCode code, std::string message) -> CompleteOutcome
        {
            store->discard();
            spdlog::error("Finalizing {} failed: {}", transfer_id, message);
            state.fail(code, message);
            return TransferFailed{transfer_id, code, std::move(message), std::nullopt};
        };

        if (!store->was_opened())
        {
            // Nothing was written (empty upload); materialize the empty scratch file.
            try
            {
                store->open();
            }
            catch (const TransferError &ex)
            {
                return fail(parcel::ErrorCode::FinalizeFailed, ex.what());
            }
        }
        store->close();

        const auto realized_size = state.received_size();
        if (realized_size != state.total_size())
        {
            return fail(parcel::ErrorCode::SizeMismatch, "Received " + std::to_string(realized_size) + " of " +
                                                             std::to_string(state.total_size()) + " bytes");
        }

        std::filesystem::path destination;
        {
            std::lock_guard lock(promote_mutex_);
            try
            {
                destination = reserve_destination(state.filename());
            }
            catch (const std::filesystem::filesystem_error &ex)
            {
                return fail(parcel::ErrorCode::FinalizeFailed, ex.what());
            }
            std::error_code ec;
            std::filesystem::rename(store->path(), destination, ec);
            if (ec)
            {
                return fail(parcel::ErrorCode::FinalizeFailed, "Failed to move upload into storage: " + ec.message());
            }
        }

        protocol::FileMetadata metadata{
            .filename = destination.filename().string(),
            .original_filename = state.filename(),
            .size = realized_size,
            .hash = {},
            .uploaded_by = state.sender(),
            .timestamp = unix_seconds(),
            .transfer_id = transfer_id,
            .security_scan = {},
            .quarantined = false,
        };

        try
        {
            metadata.hash = crypto::hash_file(destination);
        }
        catch (const std::exception &ex)
        {
            remove_quietly(destination);
            return fail(parcel::ErrorCode::FinalizeFailed, ex.what());
        }

        try
        {
            metadata.security_scan = scanner_.scan(destination, state.filename(), realized_size);
        }
        catch (const std::exception &ex)
        {
            metadata.security_scan.is_safe = false;
            metadata.security_scan.reason = std::string("Security scan failed: ") + ex.what();
        }

        auto stored_path = destination;
        if (!metadata.security_scan.is_safe)
        {
            const auto quarantine_path = layout_.quarantine / metadata.filename;
            std::error_code ec;
            std::filesystem::rename(destination, quarantine_path, ec);
            if (ec)
            {
                spdlog::error("Could not quarantine {}: {}", metadata.filename, ec.message());
            }
            else
            {
                stored_path = quarantine_path;
                metadata.quarantined = true;
            }
            spdlog::warn("Upload {} flagged unsafe: {}", metadata.filename,
                         metadata.security_scan.reason.value_or("no reason given"));
        }

        try
        {
            catalog_.append(metadata);
        }
        catch (const std::exception &ex)
        {
            remove_quietly(stored_path);
            return fail(parcel::ErrorCode::FinalizeFailed, std::string("Failed to save file metadata: ") + ex.what());
        }

        state.mark_complete();
        spdlog::info("Completed upload of {} as {} ({} bytes) from {}, safe: {}", state.filename(), metadata.filename,
                     metadata.size, metadata.uploaded_by, metadata.security_scan.is_safe);
        return metadata;
    }

} // namespace parcel::server
