#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <unordered_map>

#include "parcel/protocol.hpp"
#include "parcel/server/file_catalog.hpp"
#include "parcel/server/storage_layout.hpp"
#include "parcel/server/transfer_outcome.hpp"

namespace parcel::server
{

    /**
     * Read side of the engine: serves fixed-size chunks of finalized files.
     * Quarantined files and files whose scan failed are never served. There is
     * no retry bookkeeping; a peer re-requests any chunk it needs again.
     */
    class SenderPath
    {
    public:
        SenderPath(StorageLayout layout, FileCatalog &catalog, std::uint64_t chunk_size = protocol::kChunkSize);

        StartDownloadOutcome start_download(const std::string &filename, const std::string &requester,
                                            std::uint64_t start_position = 0);

        /// Reads chunk `index`. A short or empty read at the end of the file reports end_of_file.
        SendChunkOutcome send_chunk(const std::string &transfer_id, std::uint64_t index, const std::string &requester);

        bool finish(const std::string &transfer_id);

        std::size_t active() const;

    private:
        struct Download
        {
            std::string filename;
            std::filesystem::path path;
            std::uint64_t total_size{};
            std::string requester;
        };

        StorageLayout layout_;
        FileCatalog &catalog_;
        std::uint64_t chunk_size_;

        mutable std::mutex mutex_;
        std::unordered_map<std::string, Download> downloads_;
        std::atomic<std::uint64_t> sequence_{0};
    };

} // namespace parcel::server
