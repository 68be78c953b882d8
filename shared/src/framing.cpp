#include "parcel/framing.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace parcel::protocol
{

    namespace
    {
        void write_u32_be(std::uint32_t value, std::span<std::uint8_t> buffer)
        {
            buffer[0] = static_cast<std::uint8_t>((value >> 24) & 0xFF);
            buffer[1] = static_cast<std::uint8_t>((value >> 16) & 0xFF);
            buffer[2] = static_cast<std::uint8_t>((value >> 8) & 0xFF);
            buffer[3] = static_cast<std::uint8_t>(value & 0xFF);
        }

        void write_u64_be(std::uint64_t value, std::span<std::uint8_t> buffer)
        {
            for (std::size_t i = 0; i < kPayloadHeaderSize; ++i)
            {
                buffer[i] = static_cast<std::uint8_t>((value >> (8 * (kPayloadHeaderSize - 1 - i))) & 0xFF);
            }
        }
    } // namespace

    std::uint32_t read_u32_be(std::span<const std::uint8_t> buffer)
    {
        return (static_cast<std::uint32_t>(buffer[0]) << 24) |
               (static_cast<std::uint32_t>(buffer[1]) << 16) |
               (static_cast<std::uint32_t>(buffer[2]) << 8) |
               static_cast<std::uint32_t>(buffer[3]);
    }

    std::uint64_t read_u64_be(std::span<const std::uint8_t> buffer)
    {
        std::uint64_t value = 0;
        for (std::size_t i = 0; i < kPayloadHeaderSize; ++i)
        {
            value = (value << 8) | static_cast<std::uint64_t>(buffer[i]);
        }
        return value;
    }

    std::vector<std::uint8_t> encode_frame(const nlohmann::json &message)
    {
        const auto text = message.dump();
        if (text.size() > std::numeric_limits<std::uint32_t>::max())
        {
            throw std::length_error("JSON message too large to frame");
        }
        std::vector<std::uint8_t> frame(kFrameHeaderSize + text.size());
        write_u32_be(static_cast<std::uint32_t>(text.size()), std::span<std::uint8_t>(frame).first<kFrameHeaderSize>());
        std::copy(text.begin(), text.end(), frame.begin() + static_cast<std::ptrdiff_t>(kFrameHeaderSize));
        return frame;
    }

    std::optional<DecodedFrame> try_decode_frame(std::span<const std::uint8_t> buffer)
    {
        if (buffer.size() < kFrameHeaderSize)
        {
            return std::nullopt;
        }
        const auto payload_size = read_u32_be(buffer.first<kFrameHeaderSize>());
        if (buffer.size() < kFrameHeaderSize + payload_size)
        {
            return std::nullopt;
        }
        const auto payload_begin = buffer.begin() + static_cast<std::ptrdiff_t>(kFrameHeaderSize);
        const std::string payload(payload_begin, payload_begin + payload_size);
        DecodedFrame result{
            .message = nlohmann::json::parse(payload),
            .bytes_consumed = kFrameHeaderSize + payload_size,
        };
        return result;
    }

    std::vector<std::uint8_t> encode_payload(std::span<const std::byte> data)
    {
        if (data.size() >= kEndOfTransfer)
        {
            throw std::length_error("Payload collides with the end-of-transfer marker");
        }
        std::vector<std::uint8_t> block(kPayloadHeaderSize + data.size());
        write_u64_be(static_cast<std::uint64_t>(data.size()), std::span<std::uint8_t>(block).first<kPayloadHeaderSize>());
        std::transform(data.begin(), data.end(), block.begin() + static_cast<std::ptrdiff_t>(kPayloadHeaderSize),
                       [](std::byte value)
                       { return static_cast<std::uint8_t>(value); });
        return block;
    }

    std::vector<std::uint8_t> encode_end_of_transfer()
    {
        std::vector<std::uint8_t> block(kPayloadHeaderSize);
        write_u64_be(kEndOfTransfer, block);
        return block;
    }

    std::optional<DecodedPayload> try_decode_payload(std::span<const std::uint8_t> buffer)
    {
        if (buffer.size() < kPayloadHeaderSize)
        {
            return std::nullopt;
        }
        const auto length = read_u64_be(buffer.first<kPayloadHeaderSize>());
        if (length == kEndOfTransfer)
        {
            return DecodedPayload{.data = {}, .end_of_transfer = true, .bytes_consumed = kPayloadHeaderSize};
        }
        if (buffer.size() - kPayloadHeaderSize < length)
        {
            return std::nullopt;
        }
        DecodedPayload result{};
        result.data.resize(static_cast<std::size_t>(length));
        const auto begin = buffer.begin() + static_cast<std::ptrdiff_t>(kPayloadHeaderSize);
        std::transform(begin, begin + static_cast<std::ptrdiff_t>(length), result.data.begin(),
                       [](std::uint8_t value)
                       { return static_cast<std::byte>(value); });
        result.bytes_consumed = kPayloadHeaderSize + static_cast<std::size_t>(length);
        return result;
    }

} // namespace parcel::protocol
