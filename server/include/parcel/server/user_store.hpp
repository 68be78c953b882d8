#pragma once

#include <filesystem>
#include <mutex>
#include <string>
#include <unordered_map>

namespace parcel::server
{

    /// Credentials kept in a JSON object mapping user name to libsodium password hash.
    class UserStore
    {
    public:
        explicit UserStore(std::filesystem::path database_path);

        bool authenticate(const std::string &username, const std::string &password) const;
        bool register_user(const std::string &username, const std::string &password, std::string &message);

        static bool valid_username(const std::string &username);

    private:
        void load_locked() const;
        void persist_locked() const;

        std::filesystem::path database_path_;

        mutable std::mutex mutex_;
        mutable bool loaded_{false};
        mutable std::unordered_map<std::string, std::string> users_;
    };

} // namespace parcel::server
