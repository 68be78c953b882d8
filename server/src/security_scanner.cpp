#include "parcel/server/security_scanner.hpp"

#include <algorithm>
#include <cctype>

#include <magic.h>
#include <spdlog/spdlog.h>

namespace parcel::server
{

    namespace
    {
        constexpr auto kPassed = "PASSED";
        constexpr auto kFailed = "FAILED";
        constexpr auto kSkipped = "SKIPPED";
        constexpr auto kUnknownMime = "unknown/error";

        std::string lowercase(std::string value)
        {
            std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch)
                           { return static_cast<char>(std::tolower(ch)); });
            return value;
        }

        bool contains(const std::vector<std::string> &values, const std::string &value)
        {
            return std::find(values.begin(), values.end(), value) != values.end();
        }
    } // namespace

    PolicyScanner::PolicyScanner(ScanPolicy policy) : policy_(std::move(policy)), magic_(nullptr, &magic_close)
    {
        for (auto &extension : policy_.blocked_extensions)
        {
            extension = lowercase(extension);
        }
        if (policy_.allowed_mime_types.empty())
        {
            return;
        }

        magic_.reset(magic_open(MAGIC_MIME_TYPE | MAGIC_ERROR));
        if (!magic_)
        {
            spdlog::warn("libmagic unavailable; every upload will fail the content type check");
            return;
        }
        if (magic_load(magic_.get(), nullptr) != 0)
        {
            spdlog::warn("Failed to load the libmagic database: {}", magic_error(magic_.get()));
            magic_.reset();
        }
    }

    bool PolicyScanner::has_blocked_extension(const std::string &name) const
    {
        const auto extension = lowercase(std::filesystem::path(name).extension().string());
        if (extension.empty())
        {
            return false;
        }
        return contains(policy_.blocked_extensions, extension);
    }

    std::string PolicyScanner::detect_mime_type(const std::filesystem::path &path)
    {
        std::lock_guard lock(magic_mutex_);
        if (!magic_)
        {
            return kUnknownMime;
        }
        const char *type = magic_file(magic_.get(), path.c_str());
        if (type == nullptr)
        {
            const char *error = magic_error(magic_.get());
            spdlog::warn("Content type detection failed for {}: {}", path.string(), error ? error : "unknown error");
            return kUnknownMime;
        }
        return type;
    }

    protocol::ScanResult PolicyScanner::scan(const std::filesystem::path &path, const std::string &name,
                                             std::uint64_t size)
    {
        protocol::ScanResult result;
        const bool too_large = size > policy_.max_file_size;
        const bool blocked = has_blocked_extension(name);
        result.size_check = too_large ? kFailed : kPassed;
        result.extension_check = blocked ? kFailed : kPassed;

        bool mime_rejected = false;
        if (policy_.allowed_mime_types.empty())
        {
            result.mime_check = kSkipped;
        }
        else
        {
            result.mime_type = detect_mime_type(path);
            mime_rejected = !contains(policy_.allowed_mime_types, result.mime_type);
            result.mime_check = mime_rejected ? kFailed : kPassed;
        }

        // The last failing check names the reason.
        if (too_large)
        {
            result.is_safe = false;
            result.reason = "File exceeds maximum size limit of " + std::to_string(policy_.max_file_size) + " bytes";
        }
        if (blocked)
        {
            result.is_safe = false;
            result.reason = "File has a potentially dangerous extension";
        }
        if (mime_rejected)
        {
            result.is_safe = false;
            result.reason = "File type " + result.mime_type + " is not allowed";
        }
        return result;
    }

} // namespace parcel::server
