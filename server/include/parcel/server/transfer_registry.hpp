#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "parcel/protocol.hpp"
#include "parcel/server/transfer_state.hpp"

namespace parcel::server
{

    /// One registry slot: the state plus the mutex that serializes every access to it.
    struct TransferEntry
    {
        explicit TransferEntry(TransferState initial) : state(std::move(initial)), sender(state.sender()) {}

        std::mutex mutex;
        TransferState state;
        const std::string sender;
        // Set under `mutex` by whoever removes the entry; holders of a stale handle must treat it as gone.
        bool detached{false};
        // Raised by the owner's cancel before it queues on `mutex`; later chunk and complete calls back off.
        std::atomic<bool> cancel_requested{false};
    };

    /**
     * Concurrent map from transfer id to TransferEntry.
     *
     * The registry mutex only guards the map structure and is never held while
     * an entry mutex is taken or any file I/O happens. Lock order is always
     * entry mutex, then registry mutex (remove() under an entry lock).
     */
    class TransferRegistry
    {
    public:
        using Clock = std::function<std::chrono::system_clock::time_point()>;

        explicit TransferRegistry(std::filesystem::path temp_dir,
                                  Clock clock = []
                                  { return std::chrono::system_clock::now(); });

        ~TransferRegistry();

        TransferRegistry(const TransferRegistry &) = delete;
        TransferRegistry &operator=(const TransferRegistry &) = delete;

        /// Throws TransferError(InternalError) if the generated id is already taken.
        std::string create(const std::string &filename, std::uint64_t total_size, const std::string &sender);

        /// The handle is only meaningful while its mutex is held and `detached` is false.
        std::shared_ptr<TransferEntry> get(const std::string &transfer_id) const;

        bool remove(const std::string &transfer_id);

        std::vector<protocol::TransferProgress> snapshot(const std::optional<std::string> &sender = std::nullopt) const;

        std::size_t size() const;

    private:
        std::string generate_transfer_id(const std::string &filename, const std::string &sender) const;

        std::filesystem::path temp_dir_;
        Clock clock_;

        mutable std::mutex mutex_;
        std::unordered_map<std::string, std::shared_ptr<TransferEntry>> transfers_;
    };

} // namespace parcel::server
