#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

#include "parcel/error_codes.hpp"

namespace parcel::server
{

    /// Exception thrown inside the engine; converted to a typed outcome at the TransferEngine boundary.
    class TransferError : public std::runtime_error
    {
    public:
        TransferError(parcel::ErrorCode code, std::string message);

        parcel::ErrorCode code() const noexcept { return code_; }

    private:
        parcel::ErrorCode code_;
    };

    /// On-disk locations used by the engine, all below one root directory.
    struct StorageLayout
    {
        std::filesystem::path files;
        std::filesystem::path quarantine;
        std::filesystem::path temp;
        std::filesystem::path metadata_file;
        std::filesystem::path users_file;

        static StorageLayout under(const std::filesystem::path &root);

        void ensure_directories() const;

        // Deletes scratch files left by a previous process; partial uploads never survive a restart.
        std::size_t purge_temp() const;
    };

    /// Reduces a client supplied name to a plain file name, or throws InvalidPayload.
    std::string sanitize_filename(const std::string &requested);

} // namespace parcel::server
