#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "parcel/protocol.hpp"
#include "parcel/server/file_catalog.hpp"
#include "parcel/server/finalizer.hpp"
#include "parcel/server/security_scanner.hpp"
#include "parcel/server/sender_path.hpp"
#include "parcel/server/storage_layout.hpp"
#include "parcel/server/transfer_outcome.hpp"
#include "parcel/server/transfer_registry.hpp"

namespace parcel::server
{

    /**
     * Entry point the session layer calls into. Owns the registry, the file
     * catalog, the finalizer and the read path for one storage root.
     *
     * Every upload operation looks the transfer up, takes that transfer's lock
     * and checks ownership before touching it; an operation that leaves the
     * transfer in a terminal phase removes it from the registry before the
     * lock is released.
     */
    class TransferEngine
    {
    public:
        TransferEngine(StorageLayout layout, SecurityScanner &scanner,
                       TransferRegistry::Clock clock = []
                       { return std::chrono::system_clock::now(); });

        StartUploadOutcome start_upload(const std::string &filename, std::uint64_t total_size,
                                        const std::string &sender);

        ChunkOutcome handle_chunk(const std::string &transfer_id, std::uint64_t chunk_index,
                                  std::span<const std::byte> data, const std::string &chunk_hash,
                                  const std::string &caller);

        CompleteOutcome complete_upload(const std::string &transfer_id, const std::string &caller);

        CancelOutcome cancel_transfer(const std::string &transfer_id, const std::string &caller);

        StartDownloadOutcome start_download(const std::string &filename, const std::string &requester,
                                            std::uint64_t start_position = 0);

        SendChunkOutcome send_chunk(const std::string &transfer_id, std::uint64_t chunk_index,
                                    const std::string &requester);

        bool finish_download(const std::string &transfer_id);

        std::vector<protocol::FileMetadata> list_files() const;

        std::optional<protocol::FileMetadata> file_info(const std::string &filename) const;

        DeleteOutcome delete_file(const std::string &filename, const std::string &requester);

        std::vector<protocol::TransferProgress> active_transfers(
            const std::optional<std::string> &sender = std::nullopt) const;

        const StorageLayout &layout() const noexcept { return layout_; }
        TransferRegistry &registry() noexcept { return registry_; }

    private:
        StorageLayout layout_;
        FileCatalog catalog_;
        TransferRegistry registry_;
        Finalizer finalizer_;
        SenderPath sender_;
    };

} // namespace parcel::server
