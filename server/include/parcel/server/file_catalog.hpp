#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "parcel/protocol.hpp"

namespace parcel::server
{

    /**
     * Durable collection of FileMetadata records, one per finalized file,
     * stored as a JSON array. Records are appended by the Finalizer and
     * removed when their file is deleted.
     */
    class FileCatalog
    {
    public:
        explicit FileCatalog(std::filesystem::path metadata_file);

        void append(const protocol::FileMetadata &metadata);

        std::optional<protocol::FileMetadata> find(const std::string &filename) const;

        std::vector<protocol::FileMetadata> list() const;

        bool remove(const std::string &filename);

    private:
        void load_locked();
        void persist_locked() const;

        std::filesystem::path metadata_file_;
        mutable std::mutex mutex_;
        std::vector<protocol::FileMetadata> records_;
    };

} // namespace parcel::server
