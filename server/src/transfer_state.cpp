#include "parcel/server/transfer_state.hpp"

#include <spdlog/spdlog.h>

#include "parcel/server/storage_layout.hpp"

namespace parcel::server
{

    TransferState::TransferState(std::string transfer_id, std::string filename, std::uint64_t total_size,
                                 std::string sender, std::filesystem::path temp_path, std::uint64_t chunk_size,
                                 std::uint32_t max_retries)
        : transfer_id_(std::move(transfer_id)),
          filename_(std::move(filename)),
          total_size_(total_size),
          sender_(std::move(sender)),
          temp_path_(std::move(temp_path)),
          chunk_size_(chunk_size),
          max_retries_(max_retries),
          store_(std::make_unique<ChunkStore>(temp_path_, chunk_size_)),
          start_time_(std::chrono::system_clock::now()),
          last_update_(start_time_)
    {
    }

    std::optional<TransferRejected> TransferState::validate_chunk(std::uint64_t index, std::size_t length) const
    {
        if (length == 0)
        {
            return TransferRejected{parcel::ErrorCode::InvalidPayload, "Empty chunk"};
        }
        if (length > chunk_size_)
        {
            return TransferRejected{parcel::ErrorCode::InvalidPayload, "Chunk larger than the chunk size"};
        }
        // Rounded up without forming total_size_ + chunk_size_, which wraps near UINT64_MAX.
        const auto chunk_count = total_size_ / chunk_size_ + (total_size_ % chunk_size_ != 0 ? 1 : 0);
        if (index >= chunk_count)
        {
            return TransferRejected{parcel::ErrorCode::InvalidPayload, "Chunk index beyond declared file size"};
        }
        if (length > total_size_ - index * chunk_size_)
        {
            return TransferRejected{parcel::ErrorCode::InvalidPayload, "Chunk exceeds declared file size"};
        }
        return std::nullopt;
    }

    ChunkOutcome TransferState::accept_chunk(std::uint64_t index, std::span<const std::byte> data,
                                             const std::string &digest)
    {
        if (is_terminal() || !store_)
        {
            return TransferRejected{parcel::ErrorCode::NotFound, "Unknown transfer"};
        }
        if (auto rejected = validate_chunk(index, data.size()))
        {
            return *rejected;
        }

        const auto result = store_->write_chunk(index, data, digest);
        switch (result.status)
        {
        case ChunkWriteStatus::Written:
            phase_ = protocol::TransferPhase::InProgress;
            received_size_ = store_->received_size();
            chunks_received_ = store_->chunks_received();
            last_update_ = store_->last_update();
            retries_.erase(index);
            return ChunkAccepted{transfer_id_, index, received_size_, false, progress()};
        case ChunkWriteStatus::Duplicate:
            return ChunkAccepted{transfer_id_, index, received_size_, true, progress()};
        case ChunkWriteStatus::Conflict:
            return TransferRejected{parcel::ErrorCode::Conflict, result.message};
        case ChunkWriteStatus::DigestMismatch:
        case ChunkWriteStatus::WriteFailed:
            break;
        }

        const auto code = result.status == ChunkWriteStatus::DigestMismatch ? parcel::ErrorCode::ChunkDigestMismatch
                                                                            : parcel::ErrorCode::ChunkWriteFailed;
        const auto attempts = ++retries_[index];
        spdlog::warn("Chunk {} of {} rejected ({}), attempt {}/{}", index, transfer_id_, result.message, attempts,
                     max_retries_);
        if (attempts >= max_retries_)
        {
            auto message = "Failed to write chunk " + std::to_string(index) + " after " +
                           std::to_string(max_retries_) + " retries";
            spdlog::error("{}: {}", transfer_id_, message);
            fail(parcel::ErrorCode::RetriesExhausted, message);
            return TransferFailed{transfer_id_, parcel::ErrorCode::RetriesExhausted, std::move(message), index};
        }
        return ChunkRetry{transfer_id_, index, attempts, code, result.message};
    }

    void TransferState::cancel() noexcept
    {
        if (is_terminal())
        {
            return;
        }
        phase_ = protocol::TransferPhase::Cancelled;
        error_ = "Transfer cancelled";
        if (store_)
        {
            store_->discard();
            store_.reset();
        }
    }

    void TransferState::fail(parcel::ErrorCode code, std::string message) noexcept
    {
        if (is_terminal())
        {
            return;
        }
        phase_ = protocol::TransferPhase::Failed;
        error_ = std::move(message);
        error_code_ = code;
        if (store_)
        {
            store_->discard();
            store_.reset();
        }
    }

    std::unique_ptr<ChunkStore> TransferState::release_store()
    {
        if (is_terminal() || !store_)
        {
            throw TransferError(parcel::ErrorCode::NotFound, "Transfer is no longer active");
        }
        return std::move(store_);
    }

    void TransferState::mark_complete()
    {
        if (is_terminal())
        {
            throw TransferError(parcel::ErrorCode::InternalError, "Transfer already finished");
        }
        phase_ = protocol::TransferPhase::Complete;
        last_update_ = std::chrono::system_clock::now();
    }

    bool TransferState::is_terminal() const noexcept
    {
        return phase_ == protocol::TransferPhase::Complete || phase_ == protocol::TransferPhase::Failed ||
               phase_ == protocol::TransferPhase::Cancelled;
    }

    std::uint32_t TransferState::retries_for(std::uint64_t index) const
    {
        const auto it = retries_.find(index);
        return it == retries_.end() ? 0 : it->second;
    }

    protocol::TransferProgress TransferState::progress() const
    {
        const auto elapsed = std::chrono::duration<double>(std::chrono::system_clock::now() - start_time_).count();
        protocol::TransferProgress progress{
            .transfer_id = transfer_id_,
            .filename = filename_,
            .total_size = total_size_,
            .received_size = received_size_,
            .percent = total_size_ > 0 ? static_cast<double>(received_size_) * 100.0 / static_cast<double>(total_size_)
                                       : 0.0,
            .elapsed_seconds = elapsed,
            .bytes_per_second = elapsed > 0 ? static_cast<double>(received_size_) / elapsed : 0.0,
            .chunks_received = chunks_received_,
            .phase = phase_,
            .error = error_,
        };
        return progress;
    }

} // namespace parcel::server
