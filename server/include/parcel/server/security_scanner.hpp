#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "parcel/protocol.hpp"

struct magic_set;

namespace parcel::server
{

    /// Classifies a finalized file as safe or unsafe. Called once per upload by the Finalizer.
    class SecurityScanner
    {
    public:
        virtual ~SecurityScanner() = default;

        virtual protocol::ScanResult scan(const std::filesystem::path &path, const std::string &name,
                                          std::uint64_t size) = 0;
    };

    struct ScanPolicy
    {
        std::uint64_t max_file_size{100ULL * 1024 * 1024};
        std::vector<std::string> blocked_extensions{
            ".exe", ".bat", ".cmd", ".msi", ".vbs", ".js", ".jar", ".ps1",
            ".scr", ".dll", ".com", ".pif", ".application", ".gadget", ".msc", ".hta",
            ".cpl", ".msp", ".inf", ".reg", ".sh", ".py", ".pl", ".php"};
        // Content types accepted by libmagic detection. Empty disables the check.
        std::vector<std::string> allowed_mime_types{
            "application/pdf",
            "application/msword",
            "application/vnd.openxmlformats-officedocument.wordprocessingml.document",
            "application/vnd.ms-excel",
            "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet",
            "application/vnd.ms-powerpoint",
            "application/vnd.openxmlformats-officedocument.presentationml.presentation",
            "application/rtf",
            "application/x-rtf",
            "text/plain",
            "text/csv",
            "text/markdown",
            "image/jpeg",
            "image/png",
            "image/gif",
            "image/bmp",
            "image/tiff",
            "image/webp",
            "image/svg+xml",
            "audio/mpeg",
            "audio/wav",
            "audio/ogg",
            "audio/flac",
            "audio/aac",
            "video/mp4",
            "video/mpeg",
            "video/quicktime",
            "video/x-msvideo",
            "video/webm",
            "application/zip",
            "application/x-rar-compressed",
            "application/x-tar",
            "application/gzip",
            "application/x-7z-compressed"};
    };

    /// Size limit, extension blocklist and a libmagic content-type allowlist.
    class PolicyScanner final : public SecurityScanner
    {
    public:
        explicit PolicyScanner(ScanPolicy policy = {});

        PolicyScanner(const PolicyScanner &) = delete;
        PolicyScanner &operator=(const PolicyScanner &) = delete;

        protocol::ScanResult scan(const std::filesystem::path &path, const std::string &name,
                                  std::uint64_t size) override;

        bool has_blocked_extension(const std::string &name) const;

        /// libmagic MIME type of `path`, or "unknown/error" when detection fails.
        std::string detect_mime_type(const std::filesystem::path &path);

    private:
        ScanPolicy policy_;
        // A magic cookie is not thread-safe; finalizations of different transfers share it.
        std::mutex magic_mutex_;
        std::unique_ptr<magic_set, void (*)(magic_set *)> magic_;
    };

} // namespace parcel::server
