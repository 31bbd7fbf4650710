#include "calculation_history.hpp"
#include "crypto.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

using json = nlohmann::json;

namespace calculator
{

    namespace
    {
        constexpr const char *kHistoryDir = "history";
        constexpr const char *kHistoryExt = ".tcalc";
        constexpr int kFormatVersion = 1;

        // Signature over the CBOR encoding of the document (signature field excluded)
        std::string sign_document(const json &doc)
        {
            std::vector<uint8_t> cbor = json::to_cbor(doc);
            std::string payload(cbor.begin(), cbor.end());
            const char *secret_env = std::getenv("TOUCHCALC_SECRET");
            if (secret_env && *secret_env)
                return crypto::hmac_sha256_hex(payload, std::string(secret_env));
            return crypto::sha256_hex(payload);
        }
    } // namespace

    HistoryLog::HistoryLog(std::string name) : name_(std::move(name)) {}

    void HistoryLog::add(const std::string &entry)
    {
        entries_.push_back(entry);
        while (entries_.size() > kMaxHistoryEntries)
            entries_.pop_front();
    }

    void HistoryLog::clear()
    {
        entries_.clear();
    }

    std::vector<std::string> HistoryLog::recent(size_t count) const
    {
        size_t n = std::min(count, entries_.size());
        return std::vector<std::string>(entries_.end() - static_cast<std::ptrdiff_t>(n), entries_.end());
    }

    std::string HistoryLog::resolve_path(const std::string &base_filename)
    {
        std::string full_path = (base_filename.find('/') == std::string::npos)
                                    ? std::string(kHistoryDir) + "/" + base_filename
                                    : base_filename;
        if (full_path.size() < std::strlen(kHistoryExt) ||
            full_path.compare(full_path.size() - std::strlen(kHistoryExt), std::string::npos, kHistoryExt) != 0)
            full_path += kHistoryExt;
        return full_path;
    }

    std::string HistoryLog::to_json() const
    {
        json j;
        j["version"] = kFormatVersion;
        j["name"] = name_;
        j["entries"] = json::array();
        for (const auto &e : entries_)
            j["entries"].push_back(e);
        return j.dump(2);
    }

    bool HistoryLog::from_json(const std::string &json_str)
    {
        try
        {
            json j = json::parse(json_str);
            if (!j.is_object() || !j.contains("entries") || !j["entries"].is_array())
            {
                last_error_ = "History JSON has no entries array";
                return false;
            }
            std::deque<std::string> loaded;
            for (const auto &e : j["entries"])
            {
                loaded.push_back(e.get<std::string>());
                if (loaded.size() > kMaxHistoryEntries)
                    loaded.pop_front();
            }
            name_ = j.value("name", name_);
            entries_ = std::move(loaded);
            return true;
        }
        catch (const std::exception &e)
        {
            last_error_ = std::string("JSON error: ") + e.what();
            std::cerr << "[History] " << last_error_ << "\n";
            return false;
        }
    }

    bool HistoryLog::save(const std::string &base_filename)
    {
        std::string full_path = resolve_path(base_filename.empty() ? name_ : base_filename);

        // Ensure directory
        if (full_path.compare(0, std::strlen(kHistoryDir) + 1, std::string(kHistoryDir) + "/") == 0)
        {
            struct stat st = {};
            if (stat(kHistoryDir, &st) != 0)
            {
                if (mkdir(kHistoryDir, 0755) != 0 && errno != EEXIST)
                {
                    last_error_ = std::string("Failed to create history/ directory: ") + strerror(errno);
                    std::cerr << "[History] " << last_error_ << "\n";
                    return false;
                }
            }
        }

        json j = json::parse(to_json());
        j["signature"] = sign_document(j);

        // Write atomically to a temp file then rename (user read/write only)
        std::string tmp_path = full_path + ".tmp";
        std::string payload = j.dump(2) + "\n";

        int fd = open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, S_IRUSR | S_IWUSR);
        if (fd < 0)
        {
            last_error_ = "Failed to open temp file for writing: " + tmp_path + " (" + strerror(errno) + ")";
            std::cerr << "[History] " << last_error_ << "\n";
            return false;
        }

        const char *buf = payload.data();
        size_t to_write = payload.size();
        while (to_write > 0)
        {
            ssize_t written = ::write(fd, buf, to_write);
            if (written < 0)
            {
                if (errno == EINTR)
                    continue;
                last_error_ = std::string("Write error: ") + strerror(errno);
                std::cerr << "[History] " << last_error_ << "\n";
                close(fd);
                unlink(tmp_path.c_str());
                return false;
            }
            to_write -= static_cast<size_t>(written);
            buf += written;
        }

        if (fsync(fd) != 0)
        {
            last_error_ = std::string("fsync failed: ") + strerror(errno);
            std::cerr << "[History] " << last_error_ << "\n";
            close(fd);
            unlink(tmp_path.c_str());
            return false;
        }

        if (close(fd) != 0)
        {
            last_error_ = std::string("close failed: ") + strerror(errno);
            std::cerr << "[History] " << last_error_ << "\n";
            unlink(tmp_path.c_str());
            return false;
        }

        if (rename(tmp_path.c_str(), full_path.c_str()) != 0)
        {
            last_error_ = std::string("rename failed: ") + strerror(errno);
            std::cerr << "[History] " << last_error_ << "\n";
            unlink(tmp_path.c_str());
            return false;
        }

        std::cerr << "[History] Saved " << entries_.size() << " entries to '" << full_path << "'\n";
        return true;
    }

    bool HistoryLog::load(const std::string &base_filename)
    {
        std::string full_path = resolve_path(base_filename.empty() ? name_ : base_filename);

        std::ifstream file(full_path);
        if (!file.is_open())
        {
            last_error_ = "Failed to open file for reading: " + full_path;
            std::cerr << "[History] " << last_error_ << "\n";
            return false;
        }
        json j;
        try
        {
            file >> j;
        }
        catch (const std::exception &e)
        {
            last_error_ = std::string("JSON parse error: ") + e.what();
            std::cerr << "[History] " << last_error_ << "\n";
            return false;
        }
        file.close();

        if (!j.is_object() || !j.contains("signature") || !j["signature"].is_string())
        {
            last_error_ = "Missing signature in file: " + full_path;
            std::cerr << "[History] " << last_error_ << "\n";
            return false;
        }
        std::string sig = j["signature"].get<std::string>();
        json jcopy = j;
        jcopy.erase("signature");
        if (sign_document(jcopy) != sig)
        {
            last_error_ = "Signature mismatch (file may be tampered): " + full_path;
            std::cerr << "[History] " << last_error_ << "\n";
            return false;
        }

        if (!from_json(jcopy.dump()))
            return false;

        std::cerr << "[History] Loaded " << entries_.size() << " entries from '" << full_path << "'\n";
        return true;
    }

} // namespace calculator
