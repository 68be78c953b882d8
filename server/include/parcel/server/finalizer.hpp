#pragma once

#include <filesystem>
#include <mutex>
#include <string>

#include "parcel/protocol.hpp"
#include "parcel/server/file_catalog.hpp"
#include "parcel/server/security_scanner.hpp"
#include "parcel/server/storage_layout.hpp"
#include "parcel/server/transfer_outcome.hpp"
#include "parcel/server/transfer_state.hpp"

namespace parcel::server
{

    /**
     * Promotes a received upload into the durable store.
     *
     * finalize() must run under the transfer's registry entry lock. It takes
     * the ChunkStore from the state, checks the realized size, renames the
     * scratch file into place (never overwriting an existing file), runs the
     * security scan, relocates unsafe files into quarantine and appends the
     * metadata record. Any failure leaves the state Failed with no partial
     * destination file; success leaves it Complete. Removing the transfer from
     * the registry is the caller's job in both cases.
     */
    class Finalizer
    {
    public:
        Finalizer(StorageLayout layout, FileCatalog &catalog, SecurityScanner &scanner);

        CompleteOutcome finalize(TransferState &state);

    private:
        std::filesystem::path reserve_destination(const std::string &filename) const;
        bool name_taken(const std::string &name) const;

        StorageLayout layout_;
        FileCatalog &catalog_;
        SecurityScanner &scanner_;
        // Serializes choosing a storage name and renaming into it across transfers.
        std::mutex promote_mutex_;
    };

} // namespace parcel::server
