/**
 * Parcel - Length-prefixed framing.
 *
 * Control messages travel as JSON frames: a 4-byte big-endian length followed by
 * the JSON text. Raw file data that follows a file_chunk header travels as a
 * payload block: an 8-byte big-endian length followed by the bytes. A block
 * whose length is kEndOfTransfer carries no bytes and marks the end of a download.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <span>
#include <vector>

#include <nlohmann/json.hpp>

namespace parcel::protocol
{

    constexpr std::size_t kFrameHeaderSize = sizeof(std::uint32_t);
    constexpr std::size_t kPayloadHeaderSize = sizeof(std::uint64_t);
    constexpr std::uint64_t kEndOfTransfer = std::numeric_limits<std::uint64_t>::max();

    struct DecodedFrame
    {
        nlohmann::json message;
        std::size_t bytes_consumed{};
    };

    struct DecodedPayload
    {
        std::vector<std::byte> data;
        bool end_of_transfer{};
        std::size_t bytes_consumed{};
    };

    std::vector<std::uint8_t> encode_frame(const nlohmann::json &message);

    std::optional<DecodedFrame> try_decode_frame(std::span<const std::uint8_t> buffer);

    std::vector<std::uint8_t> encode_payload(std::span<const std::byte> data);

    std::vector<std::uint8_t> encode_end_of_transfer();

    std::optional<DecodedPayload> try_decode_payload(std::span<const std::uint8_t> buffer);

    std::uint32_t read_u32_be(std::span<const std::uint8_t> buffer);

    std::uint64_t read_u64_be(std::span<const std::uint8_t> buffer);

} // namespace parcel::protocol
