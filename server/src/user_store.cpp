#include "parcel/server/user_store.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <system_error>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "parcel/crypto.hpp"
#include "parcel/server/storage_layout.hpp"

namespace parcel::server
{

    namespace
    {
        constexpr std::size_t kMaxUsernameLength = 64;
    } // namespace

    UserStore::UserStore(std::filesystem::path database_path)
        : database_path_(std::move(database_path))
    {
        if (database_path_.has_parent_path())
        {
            std::filesystem::create_directories(database_path_.parent_path());
        }
    }

    bool UserStore::valid_username(const std::string &username)
    {
        if (username.empty() || username.size() > kMaxUsernameLength)
        {
            return false;
        }
        return std::all_of(username.begin(), username.end(), [](char ch)
                           { return std::isalnum(static_cast<unsigned char>(ch)) || ch == '-' || ch == '.'; });
    }

    bool UserStore::authenticate(const std::string &username, const std::string &password) const
    {
        std::lock_guard lock(mutex_);
        load_locked();
        const auto it = users_.find(username);
        if (it == users_.end())
        {
            return false;
        }
        return crypto::verify_password(password, it->second);
    }

    bool UserStore::register_user(const std::string &username, const std::string &password, std::string &message)
    {
        if (!valid_username(username))
        {
            message = "User names may only contain letters, digits, '-' and '.'";
            return false;
        }
        if (password.empty())
        {
            message = "Password must not be empty";
            return false;
        }

        std::lock_guard lock(mutex_);
        load_locked();
        if (users_.contains(username))
        {
            message = "User already exists";
            return false;
        }
        users_.emplace(username, crypto::hash_password(password));
        try
        {
            persist_locked();
        }
        catch (const TransferError &ex)
        {
            users_.erase(username);
            message = ex.what();
            return false;
        }
        spdlog::info("Registered user {}", username);
        message.clear();
        return true;
    }

    void UserStore::load_locked() const
    {
        if (loaded_)
        {
            return;
        }
        users_.clear();
        loaded_ = true;

        std::ifstream in(database_path_);
        if (!in.is_open())
        {
            return;
        }
        const auto json = nlohmann::json::parse(in, nullptr, false);
        if (!json.is_object())
        {
            spdlog::warn("Ignoring malformed user database {}", database_path_.string());
            return;
        }
        for (const auto &[user, hash] : json.items())
        {
            if (hash.is_string())
            {
                users_[user] = hash.get<std::string>();
            }
        }
    }

    void UserStore::persist_locked() const
    {
        nlohmann::json json = nlohmann::json::object();
        for (const auto &[user, hash] : users_)
        {
            json[user] = hash;
        }

        auto staging = database_path_;
        staging += ".tmp";
        {
            std::ofstream out(staging, std::ios::trunc);
            out << json.dump(2);
            if (!out)
            {
                throw TransferError(parcel::ErrorCode::InternalError, "Failed to write user database");
            }
        }
        std::error_code ec;
        std::filesystem::rename(staging, database_path_, ec);
        if (ec)
        {
            throw TransferError(parcel::ErrorCode::InternalError, "Failed to save user database: " + ec.message());
        }
    }

} // namespace parcel::server
