#include "parcel/error_codes.hpp"

#include <array>

namespace parcel
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
            ErrorKind kind;
        };

        constexpr std::array<ErrorCodeDescription, 17> kDescriptions{{
            {ErrorCode::Ok, "ok", ErrorKind::None},
            {ErrorCode::InvalidCommand, "invalid_command", ErrorKind::Client},
            {ErrorCode::InvalidPayload, "invalid_payload", ErrorKind::Client},
            {ErrorCode::PermissionDenied, "permission_denied", ErrorKind::Client},
            {ErrorCode::NotFound, "not_found", ErrorKind::Client},
            {ErrorCode::AlreadyExists, "already_exists", ErrorKind::Client},
            {ErrorCode::AuthenticationRequired, "authentication_required", ErrorKind::Client},
            {ErrorCode::AuthenticationFailed, "authentication_failed", ErrorKind::Client},
            {ErrorCode::Conflict, "conflict", ErrorKind::Client},
            {ErrorCode::ChunkDigestMismatch, "chunk_digest_mismatch", ErrorKind::Retryable},
            {ErrorCode::ChunkWriteFailed, "chunk_write_failed", ErrorKind::Retryable},
            {ErrorCode::RetriesExhausted, "retries_exhausted", ErrorKind::Fatal},
            {ErrorCode::SizeMismatch, "size_mismatch", ErrorKind::Fatal},
            {ErrorCode::FinalizeFailed, "finalize_failed", ErrorKind::Fatal},
            {ErrorCode::Quarantined, "quarantined", ErrorKind::Client},
            {ErrorCode::Unsupported, "unsupported", ErrorKind::Client},
            {ErrorCode::InternalError, "internal_error", ErrorKind::Fatal},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

    std::string_view to_string(ErrorKind kind) noexcept
    {
        switch (kind)
        {
        case ErrorKind::None:
            return "none";
        case ErrorKind::Retryable:
            return "retryable";
        case ErrorKind::Fatal:
            return "fatal";
        case ErrorKind::Client:
            return "client";
        }
        return "unknown";
    }

    ErrorKind kind_of(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.kind;
            }
        }
        return ErrorKind::Fatal;
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (static_cast<std::uint16_t>(entry.code) == value)
            {
                return entry.code;
            }
        }
        return ErrorCode::InternalError;
    }

} // namespace parcel
