#undef NDEBUG
#include <algorithm>
#include <array>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <span>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "parcel/crypto.hpp"
#include "parcel/encoding/base64.hpp"
#include "parcel/error_codes.hpp"
#include "parcel/framing.hpp"
#include "parcel/protocol.hpp"

using namespace parcel;
using namespace parcel::protocol;

void run_server_component_tests();
void run_transfer_engine_tests();

namespace
{

    std::vector<std::byte> bytes_of(const std::string &text)
    {
        std::vector<std::byte> bytes(text.size());
        std::transform(text.begin(), text.end(), bytes.begin(), [](char ch)
                       { return static_cast<std::byte>(ch); });
        return bytes;
    }

    void test_error_taxonomy()
    {
        assert(kind_of(ErrorCode::ChunkDigestMismatch) == ErrorKind::Retryable);
        assert(kind_of(ErrorCode::ChunkWriteFailed) == ErrorKind::Retryable);
        assert(kind_of(ErrorCode::RetriesExhausted) == ErrorKind::Fatal);
        assert(kind_of(ErrorCode::FinalizeFailed) == ErrorKind::Fatal);
        assert(kind_of(ErrorCode::NotFound) == ErrorKind::Client);
        assert(kind_of(ErrorCode::PermissionDenied) == ErrorKind::Client);
        assert(kind_of(ErrorCode::Ok) == ErrorKind::None);

        assert(error_code_from_int(to_int(ErrorCode::SizeMismatch)) == ErrorCode::SizeMismatch);
        assert(error_code_from_int(999) == ErrorCode::InternalError);
    }

    void test_request_envelope()
    {
        RequestEnvelope envelope{};
        envelope.command = Command::StartUpload;
        envelope.payload = StartUploadRequest{.filename = "report.pdf", .total_size = 8192};
        envelope.request_id = std::string("req-42");

        const auto json = nlohmann::json(envelope);
        assert(json.at("type") == "start_upload");
        assert(json.at("id") == "req-42");

        const auto decoded = json.get<RequestEnvelope>();
        assert(decoded.command == Command::StartUpload);
        assert(decoded.request_id == envelope.request_id);
        const auto request = decoded.payload.get<StartUploadRequest>();
        assert(request.filename == "report.pdf");
        assert(request.total_size == 8192);

        bool rejected = false;
        try
        {
            nlohmann::json{{"type", "format_disk"}}.get<RequestEnvelope>();
        }
        catch (const std::exception &)
        {
            rejected = true;
        }
        assert(rejected);
    }

    void test_error_payload()
    {
        ResponseEnvelope envelope{};
        envelope.type = MessageType::Error;
        envelope.payload = ErrorPayload{
            .code = ErrorCode::ChunkDigestMismatch,
            .kind = ErrorKind::Retryable,
            .message = "Chunk hash mismatch",
        };

        const auto json = nlohmann::json(envelope);
        assert(json.at("type") == "error");
        assert(!json.contains("id"));
        assert(json.at("payload").at("kind") == "retryable");
        assert(json.at("payload").at("label") == "chunk_digest_mismatch");

        const auto decoded = json.get<ResponseEnvelope>().payload.get<ErrorPayload>();
        assert(decoded.code == ErrorCode::ChunkDigestMismatch);
        assert(decoded.kind == ErrorKind::Retryable);
        assert(decoded.message == "Chunk hash mismatch");
    }

    void test_authentication_payload()
    {
        const auto request = nlohmann::json{
            {"username", "alice"},
            {"password", "secret"},
            {"register", true},
        }
                                 .get<AuthenticateRequest>();
        assert(request.username == "alice");
        assert(request.register_user);

        const AuthenticateResponse response{.identity = "alice", .newly_registered = true};
        const auto decoded = nlohmann::json(response).get<AuthenticateResponse>();
        assert(decoded.identity == "alice");
        assert(decoded.newly_registered);
    }

    void test_file_metadata()
    {
        FileMetadata metadata{
            .filename = "notes_1700000000.txt",
            .original_filename = "notes.txt",
            .size = 10,
            .hash = "abc",
            .uploaded_by = "alice",
            .timestamp = 1700000000,
            .transfer_id = "alice_notes.txt_1",
            .security_scan = ScanResult{.is_safe = false,
                                        .reason = std::string("Dangerous file extension"),
                                        .size_check = "PASSED",
                                        .extension_check = "FAILED",
                                        .mime_type = "text/plain",
                                        .mime_check = "PASSED"},
            .quarantined = true,
        };

        const auto json = nlohmann::json(metadata);
        assert(json.at("security_scan").at("extension_check") == "FAILED");
        assert(json.at("security_scan").at("mime_type") == "text/plain");
        assert(json.get<FileMetadata>() == metadata);
    }

    void test_progress_and_chunk_messages()
    {
        TransferProgress progress{
            .transfer_id = "t-1",
            .filename = "a.bin",
            .total_size = 10,
            .received_size = 5,
            .percent = 50.0,
            .elapsed_seconds = 2.0,
            .bytes_per_second = 2.5,
            .chunks_received = 1,
            .phase = TransferPhase::InProgress,
            .error = std::nullopt,
        };

        const ChunkAck ack{
            .transfer_id = "t-1",
            .chunk_index = 1,
            .received_size = 5,
            .duplicate = false,
            .progress = progress,
        };
        const auto json = nlohmann::json(ack);
        assert(json.at("progress").at("state") == "in_progress");
        assert(json.at("progress").at("speed") == 2.5);
        assert(json.at("progress").at("error").is_null());

        const auto decoded = json.get<ChunkAck>();
        assert(decoded.progress.phase == TransferPhase::InProgress);
        assert(decoded.progress.received_size == 5);

        const FileChunkHeader header{
            .transfer_id = "download_a.bin_1_1",
            .chunk_index = 2,
            .chunk_size = 17,
            .chunk_hash = "ff",
            .end_of_file = true,
        };
        const auto header_back = nlohmann::json(header).get<FileChunkHeader>();
        assert(header_back.chunk_size == 17);
        assert(header_back.end_of_file);
    }

    void test_framing()
    {
        RequestEnvelope envelope{};
        envelope.command = Command::DownloadChunk;
        envelope.payload = DownloadChunkRequest{.transfer_id = "t-9", .chunk_index = 3};

        const auto frame = encode_frame(nlohmann::json(envelope));
        assert(read_u32_be(frame) == frame.size() - kFrameHeaderSize);

        const auto partial = try_decode_frame(std::span<const std::uint8_t>(frame.data(), frame.size() - 1));
        assert(!partial.has_value());

        const auto decoded = try_decode_frame(frame);
        assert(decoded.has_value());
        assert(decoded->bytes_consumed == frame.size());
        assert(decoded->message.get<RequestEnvelope>().command == Command::DownloadChunk);
    }

    void test_payload_blocks()
    {
        const auto data = bytes_of("hello");
        auto stream = encode_payload(data);
        const auto sentinel = encode_end_of_transfer();
        stream.insert(stream.end(), sentinel.begin(), sentinel.end());

        assert(read_u64_be(stream) == 5);

        const auto first = try_decode_payload(stream);
        assert(first.has_value());
        assert(!first->end_of_transfer);
        assert(first->data == data);
        assert(first->bytes_consumed == kPayloadHeaderSize + 5);

        const auto rest = std::span<const std::uint8_t>(stream).subspan(first->bytes_consumed);
        const auto second = try_decode_payload(rest);
        assert(second.has_value());
        assert(second->end_of_transfer);
        assert(second->data.empty());
        assert(second->bytes_consumed == kPayloadHeaderSize);

        assert(!try_decode_payload(std::span<const std::uint8_t>(stream.data(), 7)).has_value());
        assert(!try_decode_payload(std::span<const std::uint8_t>(stream.data(), 10)).has_value());
    }

    void test_base64()
    {
        assert(encoding::encode_base64(bytes_of("data")) == "ZGF0YQ==");
        assert(encoding::encode_base64({}).empty());

        const auto decoded = encoding::decode_base64("ZGF0\nYQ==");
        assert(decoded.has_value());
        assert(*decoded == bytes_of("data"));

        assert(!encoding::decode_base64("not base64!").has_value());
    }

    void test_crypto()
    {
        const std::string password = "correct horse battery staple";
        const auto hashed = crypto::hash_password(password);
        assert(crypto::verify_password(password, hashed));
        assert(!crypto::verify_password("wrong password", hashed));

        assert(crypto::hash_bytes(bytes_of("abc")) ==
               "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

        crypto::Digest digest;
        digest.update(bytes_of("hello "));
        const auto partial = digest.hex();
        digest.update(bytes_of("world"));
        assert(partial == crypto::hash_bytes(bytes_of("hello ")));
        assert(digest.hex() == crypto::hash_bytes(bytes_of("hello world")));
        assert(digest.bytes_fed() == 11);

        std::istringstream stream("hello world");
        assert(crypto::hash_stream(stream) == digest.hex());

        const auto file_path = std::filesystem::temp_directory_path() / "parcel_crypto_test.bin";
        {
            std::ofstream file(file_path, std::ios::binary);
            file << "hello world";
        }
        assert(crypto::hash_file(file_path) == digest.hex());
        std::filesystem::remove(file_path);

        const auto token = crypto::random_hex(12);
        assert(token.size() == 24);
        assert(token != crypto::random_hex(12));
    }

} // namespace

int main()
{
    try
    {
        test_error_taxonomy();
        test_request_envelope();
        test_error_payload();
        test_authentication_payload();
        test_file_metadata();
        test_progress_and_chunk_messages();
        test_framing();
        test_payload_blocks();
        test_base64();
        test_crypto();
        run_server_component_tests();
        run_transfer_engine_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    std::cout << "All parcel unit tests passed\n";
    return 0;
}
