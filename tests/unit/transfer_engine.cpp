#undef NDEBUG
#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <mutex>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "parcel/crypto.hpp"
#include "parcel/protocol.hpp"
#include "parcel/server/security_scanner.hpp"
#include "parcel/server/transfer_engine.hpp"
#include "session_common.hpp"

using namespace parcel;
using namespace parcel::server;

namespace
{

    constexpr auto kChunk = protocol::kChunkSize;

    struct EngineFixture
    {
        explicit EngineFixture(const std::string &name)
            : root(std::filesystem::temp_directory_path() / ("parcel_engine_" + name)),
              layout(StorageLayout::under(root))
        {
            std::error_code ec;
            std::filesystem::remove_all(root, ec);
        }

        ~EngineFixture()
        {
            std::error_code ec;
            std::filesystem::remove_all(root, ec);
        }

        std::filesystem::path root;
        StorageLayout layout;
        // Payloads are opaque byte patterns, so only size and extension are checked.
        PolicyScanner scanner{ScanPolicy{.allowed_mime_types = {}}};
    };

    std::vector<std::byte> pattern(std::size_t size, unsigned seed)
    {
        std::vector<std::byte> data(size);
        for (std::size_t i = 0; i < size; ++i)
        {
            data[i] = static_cast<std::byte>((i * 31 + seed) & 0xFF);
        }
        return data;
    }

    std::vector<std::byte> chunk_of(const std::vector<std::byte> &data, std::uint64_t index)
    {
        const auto begin = static_cast<std::size_t>(index * kChunk);
        const auto end = std::min(data.size(), begin + static_cast<std::size_t>(kChunk));
        return {data.begin() + static_cast<std::ptrdiff_t>(begin), data.begin() + static_cast<std::ptrdiff_t>(end)};
    }

    std::vector<std::byte> read_bytes(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        std::vector<char> raw((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        std::vector<std::byte> bytes(raw.size());
        std::transform(raw.begin(), raw.end(), bytes.begin(), [](char ch)
                       { return static_cast<std::byte>(ch); });
        return bytes;
    }

    std::size_t temp_files(const StorageLayout &layout)
    {
        return static_cast<std::size_t>(
            std::distance(std::filesystem::directory_iterator(layout.temp), std::filesystem::directory_iterator()));
    }

    std::string start(TransferEngine &engine, const std::string &name, std::uint64_t size, const std::string &sender)
    {
        return std::get<UploadTicket>(engine.start_upload(name, size, sender)).transfer_id;
    }

    ChunkOutcome send(TransferEngine &engine, const std::string &id, const std::vector<std::byte> &data,
                      std::uint64_t index, const std::string &sender)
    {
        const auto chunk = chunk_of(data, index);
        return engine.handle_chunk(id, index, chunk, crypto::hash_bytes(chunk), sender);
    }

    void test_out_of_order_upload()
    {
        EngineFixture fixture("out_of_order");
        TransferEngine engine(fixture.layout, fixture.scanner);

        const auto original = pattern(2 * kChunk + 100, 7);
        const auto id = start(engine, "archive.tar", original.size(), "alice");
        assert(engine.active_transfers().size() == 1);

        for (const std::uint64_t index : {2, 0, 1})
        {
            assert(std::holds_alternative<ChunkAccepted>(send(engine, id, original, index, "alice")));
        }
        const auto progress = engine.active_transfers(std::string("alice"));
        assert(progress.size() == 1);
        assert(progress.front().received_size == original.size());
        assert(progress.front().chunks_received == 3);
        assert(engine.active_transfers(std::string("bob")).empty());

        const auto outcome = engine.complete_upload(id, "alice");
        const auto &metadata = std::get<protocol::FileMetadata>(outcome);
        assert(metadata.size == original.size());
        assert(metadata.hash == crypto::hash_bytes(original));
        assert(metadata.transfer_id == id);
        assert(read_bytes(fixture.layout.files / "archive.tar") == original);

        assert(engine.active_transfers().empty());
        assert(temp_files(fixture.layout) == 0);
        assert(engine.file_info("archive.tar") == metadata);
        assert(std::get<TransferRejected>(engine.complete_upload(id, "alice")).code == ErrorCode::NotFound);
    }

    void test_idempotent_resubmission()
    {
        EngineFixture fixture("resubmit");
        TransferEngine engine(fixture.layout, fixture.scanner);

        const auto original = pattern(kChunk + 10, 3);
        const auto id = start(engine, "data.bin", original.size(), "alice");

        const auto first = send(engine, id, original, 0, "alice");
        assert(!std::get<ChunkAccepted>(first).duplicate);
        const auto again = send(engine, id, original, 0, "alice");
        const auto &duplicate = std::get<ChunkAccepted>(again);
        assert(duplicate.duplicate);
        assert(duplicate.received_size == kChunk);

        const auto forged = pattern(kChunk, 99);
        const auto conflict = engine.handle_chunk(id, 0, forged, crypto::hash_bytes(forged), "alice");
        assert(std::get<TransferRejected>(conflict).code == ErrorCode::Conflict);
        assert(engine.active_transfers().front().received_size == kChunk);
    }

    void test_retry_exhaustion()
    {
        EngineFixture fixture("exhaustion");
        TransferEngine engine(fixture.layout, fixture.scanner);

        const auto original = pattern(2 * kChunk, 5);
        const auto id = start(engine, "broken.bin", original.size(), "alice");
        assert(std::holds_alternative<ChunkAccepted>(send(engine, id, original, 1, "alice")));
        assert(temp_files(fixture.layout) == 1);

        const auto chunk = chunk_of(original, 0);
        for (std::uint32_t attempt = 1; attempt < protocol::kMaxRetries; ++attempt)
        {
            const auto retry = engine.handle_chunk(id, 0, chunk, "0000", "alice");
            assert(std::get<ChunkRetry>(retry).attempts == attempt);
        }
        const auto last = engine.handle_chunk(id, 0, chunk, "0000", "alice");
        const auto &failed = std::get<TransferFailed>(last);
        assert(failed.code == ErrorCode::RetriesExhausted);
        assert(failed.chunk_index == std::optional<std::uint64_t>(0));

        assert(temp_files(fixture.layout) == 0);
        assert(engine.active_transfers().empty());
        assert(std::get<TransferRejected>(send(engine, id, original, 0, "alice")).code == ErrorCode::NotFound);
    }

    void test_cancel()
    {
        EngineFixture fixture("cancel");
        TransferEngine engine(fixture.layout, fixture.scanner);

        const auto original = pattern(3 * kChunk, 1);
        const auto id = start(engine, "movie.mkv", original.size(), "alice");
        assert(std::holds_alternative<ChunkAccepted>(send(engine, id, original, 1, "alice")));

        assert(std::get<TransferRejected>(engine.cancel_transfer(id, "bob")).code == ErrorCode::PermissionDenied);
        assert(engine.active_transfers().size() == 1);

        const auto outcome = engine.cancel_transfer(id, "alice");
        const auto &cancelled = std::get<CancelledTransfer>(outcome);
        assert(cancelled.received_size == kChunk);
        assert(engine.active_transfers().empty());
        assert(temp_files(fixture.layout) == 0);

        assert(std::get<TransferRejected>(send(engine, id, original, 0, "alice")).code == ErrorCode::NotFound);
        assert(std::get<TransferRejected>(engine.cancel_transfer(id, "alice")).code == ErrorCode::NotFound);

        // A transfer that never received a byte cancels just the same.
        const auto idle = start(engine, "idle.bin", 10, "alice");
        assert(std::holds_alternative<CancelledTransfer>(engine.cancel_transfer(idle, "alice")));
    }

    void test_cancel_overtakes_queued_chunk()
    {
        EngineFixture fixture("cancel_overtakes");
        TransferEngine engine(fixture.layout, fixture.scanner);

        const auto original = pattern(2 * kChunk, 9);
        const auto id = start(engine, "queued.bin", original.size(), "alice");
        assert(std::holds_alternative<ChunkAccepted>(send(engine, id, original, 0, "alice")));

        auto entry = engine.registry().get(id);
        assert(entry);

        ChunkOutcome queued = TransferRejected{ErrorCode::InternalError, "not run"};
        CancelOutcome cancelled = TransferRejected{ErrorCode::InternalError, "not run"};
        {
            // Hold the transfer so both callers queue behind an in-flight operation.
            std::unique_lock hold(entry->mutex);
            std::thread writer([&]
                               { queued = send(engine, id, original, 1, "alice"); });
            std::thread canceller([&]
                                  { cancelled = engine.cancel_transfer(id, "alice"); });
            while (!entry->cancel_requested.load())
            {
                std::this_thread::yield();
            }
            hold.unlock();
            writer.join();
            canceller.join();
        }

        assert(std::get<TransferRejected>(queued).code == ErrorCode::NotFound);
        const auto result = std::get<CancelledTransfer>(cancelled);
        assert(result.received_size == kChunk);
        assert(entry->detached);
        assert(engine.active_transfers().empty());
        assert(temp_files(fixture.layout) == 0);

        // Only the owner can raise the flag.
        const auto other = start(engine, "other.bin", kChunk, "alice");
        assert(std::get<TransferRejected>(engine.cancel_transfer(other, "bob")).code == ErrorCode::PermissionDenied);
        assert(!engine.registry().get(other)->cancel_requested.load());
        const auto single = pattern(kChunk, 4);
        assert(std::holds_alternative<ChunkAccepted>(send(engine, other, single, 0, "alice")));
    }

    void test_foreign_transfer_is_untouched()
    {
        EngineFixture fixture("ownership");
        TransferEngine engine(fixture.layout, fixture.scanner);

        const auto original = pattern(kChunk, 2);
        const auto id = start(engine, "mine.bin", original.size(), "alice");
        assert(std::get<TransferRejected>(send(engine, id, original, 0, "mallory")).code ==
               ErrorCode::PermissionDenied);
        assert(std::get<TransferRejected>(engine.complete_upload(id, "mallory")).code == ErrorCode::PermissionDenied);
        assert(engine.active_transfers().front().received_size == 0);
        assert(std::get<TransferRejected>(engine.handle_chunk("nope", 0, original, "x", "alice")).code ==
               ErrorCode::NotFound);
    }

    void test_start_upload_errors()
    {
        EngineFixture fixture("start_errors");
        const auto frozen = std::chrono::system_clock::time_point(std::chrono::seconds(1'700'000'000));
        TransferEngine engine(fixture.layout, fixture.scanner, [frozen]
                              { return frozen; });

        assert(std::get<TransferRejected>(engine.start_upload("..", 1, "alice")).code == ErrorCode::InvalidPayload);

        const auto ticket = std::get<UploadTicket>(engine.start_upload("../../x.txt", 1, "alice"));
        assert(ticket.chunk_size == kChunk);
        assert(ticket.transfer_id == "alice_x.txt_1700000000000000");

        const auto clash = engine.start_upload("x.txt", 1, "alice");
        assert(std::get<TransferFailed>(clash).code == ErrorCode::InternalError);
        assert(engine.active_transfers().size() == 1);
    }

    void test_short_upload_is_reported()
    {
        EngineFixture fixture("short");
        TransferEngine engine(fixture.layout, fixture.scanner);

        const auto original = pattern(2 * kChunk, 4);
        const auto id = start(engine, "half.bin", original.size(), "alice");
        assert(std::holds_alternative<ChunkAccepted>(send(engine, id, original, 0, "alice")));

        const auto outcome = engine.complete_upload(id, "alice");
        assert(std::get<TransferFailed>(outcome).code == ErrorCode::SizeMismatch);
        assert(engine.active_transfers().empty());
        assert(temp_files(fixture.layout) == 0);
        assert(!std::filesystem::exists(fixture.layout.files / "half.bin"));
        assert(engine.list_files().empty());
    }

    void test_parallel_transfers()
    {
        EngineFixture fixture("parallel");
        TransferEngine engine(fixture.layout, fixture.scanner);

        constexpr int kTransfers = 4;
        std::vector<std::vector<std::byte>> contents;
        std::vector<std::string> ids;
        for (int i = 0; i < kTransfers; ++i)
        {
            contents.push_back(pattern(3 * kChunk + 1 + static_cast<std::size_t>(i), static_cast<unsigned>(i)));
            ids.push_back(start(engine, "file" + std::to_string(i) + ".bin", contents.back().size(),
                                "user" + std::to_string(i)));
        }

        std::atomic<int> failures{0};
        std::vector<std::thread> workers;
        for (int i = 0; i < kTransfers; ++i)
        {
            workers.emplace_back([&, i]
                                 {
                const auto sender = "user" + std::to_string(i);
                for (std::uint64_t index = 0; index < 4; ++index)
                {
                    if (!std::holds_alternative<ChunkAccepted>(send(engine, ids[i], contents[i], index, sender)))
                    {
                        ++failures;
                    }
                } });
        }
        for (auto &worker : workers)
        {
            worker.join();
        }
        assert(failures == 0);

        for (int i = 0; i < kTransfers; ++i)
        {
            const auto sender = "user" + std::to_string(i);
            const auto progress = engine.active_transfers(sender);
            assert(progress.size() == 1);
            assert(progress.front().received_size == contents[i].size());
            const auto outcome = engine.complete_upload(ids[i], sender);
            assert(std::get<protocol::FileMetadata>(outcome).hash == crypto::hash_bytes(contents[i]));
        }
        assert(engine.list_files().size() == kTransfers);
    }

    void test_same_chunk_race()
    {
        EngineFixture fixture("race");
        TransferEngine engine(fixture.layout, fixture.scanner);

        const auto original = pattern(kChunk, 11);
        const auto id = start(engine, "race.bin", original.size(), "alice");

        constexpr int kRacers = 8;
        std::atomic<int> written{0};
        std::atomic<int> duplicates{0};
        std::atomic<int> other{0};
        std::vector<std::thread> racers;
        for (int i = 0; i < kRacers; ++i)
        {
            racers.emplace_back([&]
                                {
                const auto outcome = send(engine, id, original, 0, "alice");
                if (const auto *accepted = std::get_if<ChunkAccepted>(&outcome))
                {
                    ++(accepted->duplicate ? duplicates : written);
                    if (accepted->received_size != kChunk)
                    {
                        ++other;
                    }
                }
                else
                {
                    ++other;
                } });
        }
        for (auto &racer : racers)
        {
            racer.join();
        }
        assert(written == 1);
        assert(duplicates == kRacers - 1);
        assert(other == 0);
        assert(std::holds_alternative<protocol::FileMetadata>(engine.complete_upload(id, "alice")));
    }

    void test_download_and_delete()
    {
        EngineFixture fixture("download");
        TransferEngine engine(fixture.layout, fixture.scanner);

        const auto original = pattern(kChunk + 50, 8);
        const auto id = start(engine, "photo.png", original.size(), "alice");
        for (const std::uint64_t index : {1, 0})
        {
            assert(std::holds_alternative<ChunkAccepted>(send(engine, id, original, index, "alice")));
        }
        assert(std::holds_alternative<protocol::FileMetadata>(engine.complete_upload(id, "alice")));

        const auto ticket = std::get<DownloadTicket>(engine.start_download("photo.png", "bob"));
        assert(ticket.total_size == original.size());

        std::vector<std::byte> received;
        for (std::uint64_t index = 0;; ++index)
        {
            const auto chunk = std::get<OutgoingChunk>(engine.send_chunk(ticket.transfer_id, index, "bob"));
            assert(chunk.digest == crypto::hash_bytes(chunk.data));
            received.insert(received.end(), chunk.data.begin(), chunk.data.end());
            if (chunk.end_of_file)
            {
                assert(index == 1);
                break;
            }
        }
        assert(received == original);
        assert(engine.finish_download(ticket.transfer_id));
        assert(!engine.finish_download(ticket.transfer_id));

        assert(std::get<TransferRejected>(engine.delete_file("photo.png", "bob")).code == ErrorCode::PermissionDenied);
        assert(std::get<TransferRejected>(engine.delete_file("ghost.png", "alice")).code == ErrorCode::NotFound);

        const auto deleted = engine.delete_file("photo.png", "alice");
        assert(std::get<FileDeleted>(deleted).filename == "photo.png");
        assert(!std::get<FileDeleted>(deleted).was_quarantined);
        assert(!engine.file_info("photo.png").has_value());
        assert(!std::filesystem::exists(fixture.layout.files / "photo.png"));
        assert(std::get<TransferRejected>(engine.start_download("photo.png", "bob")).code == ErrorCode::NotFound);
    }

    void test_stale_scratch_files_are_purged()
    {
        EngineFixture fixture("purge");
        std::filesystem::create_directories(fixture.layout.temp);
        std::ofstream(fixture.layout.temp / "left_over.part") << "partial";

        TransferEngine engine(fixture.layout, fixture.scanner);
        assert(temp_files(fixture.layout) == 0);
        assert(std::filesystem::is_directory(fixture.layout.quarantine));
    }

    void test_replies()
    {
        using session_common::reply_for;
        const std::optional<std::string> request_id = std::string("r-1");

        const auto retry = reply_for(ChunkOutcome{ChunkRetry{"t", 4, 2, ErrorCode::ChunkDigestMismatch, "bad"}},
                                     request_id);
        assert(retry.type == protocol::MessageType::ChunkFailed);
        assert(retry.request_id == request_id);
        const auto retry_payload = retry.payload.get<protocol::ChunkFailed>();
        assert(retry_payload.retryable);
        assert(retry_payload.attempts == 2);
        assert(retry_payload.chunk_index == 4);

        const auto fatal = reply_for(
            ChunkOutcome{TransferFailed{"t", ErrorCode::RetriesExhausted, "gave up", std::uint64_t{4}}}, request_id);
        const auto fatal_payload = fatal.payload.get<protocol::ChunkFailed>();
        assert(!fatal_payload.retryable);
        assert(fatal_payload.code == ErrorCode::RetriesExhausted);

        const auto rejected = reply_for(CancelOutcome{TransferRejected{ErrorCode::NotFound, "Unknown transfer: t"}},
                                        std::nullopt);
        assert(rejected.type == protocol::MessageType::Error);
        assert(rejected.payload.at("kind") == "client");
        assert(!rejected.request_id.has_value());

        protocol::FileMetadata metadata{.filename = "a.exe", .size = 3, .hash = "h", .transfer_id = "t"};
        metadata.security_scan.is_safe = false;
        metadata.quarantined = true;
        const auto complete = reply_for(CompleteOutcome{metadata}, request_id);
        const auto complete_payload = complete.payload.get<protocol::UploadComplete>();
        assert(complete.type == protocol::MessageType::UploadComplete);
        assert(!complete_payload.is_safe);
        assert(complete_payload.quarantined);

        const auto failed = reply_for(CompleteOutcome{TransferFailed{"t", ErrorCode::SizeMismatch, "short", {}}},
                                      request_id);
        assert(failed.type == protocol::MessageType::UploadFailed);
        assert(failed.payload.get<protocol::UploadFailed>().code == ErrorCode::SizeMismatch);
    }

} // namespace

void run_transfer_engine_tests()
{
    test_out_of_order_upload();
    test_idempotent_resubmission();
    test_retry_exhaustion();
    test_cancel();
    test_cancel_overtakes_queued_chunk();
    test_foreign_transfer_is_untouched();
    test_start_upload_errors();
    test_short_upload_is_reported();
    test_parallel_transfers();
    test_same_chunk_race();
    test_download_and_delete();
    test_stale_scratch_files_are_purged();
    test_replies();
}
