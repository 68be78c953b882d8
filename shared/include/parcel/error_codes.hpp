/**
 * Parcel - Error codes shared by the transfer engine and the wire protocol.
 */
#pragma once

#include <cstdint>
#include <string_view>

namespace parcel
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidCommand = 1,
        InvalidPayload = 2,
        PermissionDenied = 3,
        NotFound = 4,
        AlreadyExists = 5,
        AuthenticationRequired = 6,
        AuthenticationFailed = 7,
        Conflict = 8,
        ChunkDigestMismatch = 9,
        ChunkWriteFailed = 10,
        RetriesExhausted = 11,
        SizeMismatch = 12,
        FinalizeFailed = 13,
        Quarantined = 14,
        Unsupported = 15,
        InternalError = 16
    };

    /**
     * How a failure should be handled by the peer:
     *  - Retryable: resend the same chunk.
     *  - Fatal: the transfer is gone, start over.
     *  - Client: the request itself was wrong, nothing changed server side.
     */
    enum class ErrorKind : std::uint8_t
    {
        None,
        Retryable,
        Fatal,
        Client
    };

    std::string_view to_string(ErrorCode code) noexcept;

    std::string_view to_string(ErrorKind kind) noexcept;

    ErrorKind kind_of(ErrorCode code) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept;

} // namespace parcel
