#include "parcel/server/transfer_registry.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "parcel/crypto.hpp"
#include "parcel/server/storage_layout.hpp"

namespace parcel::server
{

    TransferRegistry::TransferRegistry(std::filesystem::path temp_dir, Clock clock)
        : temp_dir_(std::move(temp_dir)), clock_(std::move(clock))
    {
        std::filesystem::create_directories(temp_dir_);
    }

    TransferRegistry::~TransferRegistry()
    {
        // In-flight uploads do not survive the process.
        std::unordered_map<std::string, std::shared_ptr<TransferEntry>> remaining;
        {
            std::lock_guard lock(mutex_);
            remaining.swap(transfers_);
        }
        for (auto &[transfer_id, entry] : remaining)
        {
            std::lock_guard entry_lock(entry->mutex);
            entry->state.cancel();
            entry->detached = true;
        }
    }

    std::string TransferRegistry::create(const std::string &filename, std::uint64_t total_size,
                                         const std::string &sender)
    {
        auto transfer_id = generate_transfer_id(filename, sender);
        // Scratch names are random so the id (which embeds client text) never becomes a path.
        const auto temp_path = temp_dir_ / (crypto::random_hex(12) + ".part");
        auto entry = std::make_shared<TransferEntry>(
            TransferState(transfer_id, filename, total_size, sender, temp_path));

        std::lock_guard lock(mutex_);
        const auto [it, inserted] = transfers_.emplace(transfer_id, std::move(entry));
        if (!inserted)
        {
            throw TransferError(parcel::ErrorCode::InternalError, "Transfer id collision: " + transfer_id);
        }
        return transfer_id;
    }

    std::shared_ptr<TransferEntry> TransferRegistry::get(const std::string &transfer_id) const
    {
        std::lock_guard lock(mutex_);
        auto it = transfers_.find(transfer_id);
        if (it == transfers_.end())
        {
            return nullptr;
        }
        return it->second;
    }

    bool TransferRegistry::remove(const std::string &transfer_id)
    {
        std::lock_guard lock(mutex_);
        return transfers_.erase(transfer_id) > 0;
    }

    std::vector<protocol::TransferProgress> TransferRegistry::snapshot(const std::optional<std::string> &sender) const
    {
        std::vector<std::shared_ptr<TransferEntry>> entries;
        {
            std::lock_guard lock(mutex_);
            entries.reserve(transfers_.size());
            for (const auto &[transfer_id, entry] : transfers_)
            {
                entries.push_back(entry);
            }
        }

        std::vector<protocol::TransferProgress> result;
        result.reserve(entries.size());
        for (const auto &entry : entries)
        {
            std::lock_guard entry_lock(entry->mutex);
            if (entry->detached || (sender && entry->state.sender() != *sender))
            {
                continue;
            }
            result.push_back(entry->state.progress());
        }
        std::sort(result.begin(), result.end(), [](const auto &lhs, const auto &rhs)
                  { return lhs.transfer_id < rhs.transfer_id; });
        return result;
    }

    std::size_t TransferRegistry::size() const
    {
        std::lock_guard lock(mutex_);
        return transfers_.size();
    }

    std::string TransferRegistry::generate_transfer_id(const std::string &filename, const std::string &sender) const
    {
        const auto micros =
            std::chrono::duration_cast<std::chrono::microseconds>(clock_().time_since_epoch()).count();
        return sender + "_" + filename + "_" + std::to_string(micros);
    }

} // namespace parcel::server
