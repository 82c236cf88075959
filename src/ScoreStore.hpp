#pragma once
#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include "logger.hpp"

/* --------------------------------------------------------------------------
   Durable key -> value persistence. The game keeps exactly one record in
   it; the store itself knows nothing about scores.
---------------------------------------------------------------------------- */
struct KeyValueStore {
    virtual ~KeyValueStore() = default;
    // nullopt when the key is absent or the store could not be read.
    virtual std::optional<std::string> get(const std::string& key) = 0;
    // false when the value could not be made durable.
    virtual bool set(const std::string& key, const std::string& value) = 0;
};

class MemoryStore : public KeyValueStore {
public:
    std::optional<std::string> get(const std::string& key) override {
        auto it = values_.find(key);
        if (it == values_.end()) return std::nullopt;
        return it->second;
    }
    bool set(const std::string& key, const std::string& value) override {
        values_[key] = value;
        return true;
    }
private:
    std::map<std::string, std::string> values_;
};

// `key=value` lines in a text file. Writes go to a sibling temp file that
// is renamed over the original.
class FileStore : public KeyValueStore {
public:
    explicit FileStore(std::string path) : path_(std::move(path)) {}

    void setLogger(Logger* l) { logger_ = l; }
    const std::string& path() const { return path_; }

    std::optional<std::string> get(const std::string& key) override {
        std::map<std::string, std::string> entries;
        if (load(entries) != Load::Ok) return std::nullopt;
        auto it = entries.find(key);
        if (it == entries.end()) return std::nullopt;
        return it->second;
    }

    bool set(const std::string& key, const std::string& value) override {
        std::map<std::string, std::string> entries;
        Load state = load(entries);
        // Rewriting from a partial read would drop the other records.
        if (state == Load::Failed) {
            LOG_WARN(logger_, "FileStore '{}' unreadable, not rewritten", path_);
            return false;
        }
        entries[key] = value;
        LOG_TRACE(logger_, "FileStore set '{}' existed={} entries={}", key, state == Load::Ok, entries.size());

        std::string tmp = path_ + ".tmp";
        {
            std::ofstream out(tmp, std::ios::trunc);
            if (!out) {
                LOG_WARN(logger_, "FileStore cannot open '{}' for writing", tmp);
                return false;
            }
            for (auto& kv : entries) out << kv.first << '=' << kv.second << '\n';
            out.flush();
            if (!out) {
                LOG_WARN(logger_, "FileStore write to '{}' failed", tmp);
                return false;
            }
        }
        if (std::rename(tmp.c_str(), path_.c_str()) != 0) {
            LOG_WARN(logger_, "FileStore rename '{}' -> '{}' failed errno={}", tmp, path_, errno);
            std::remove(tmp.c_str());
            return false;
        }
        return true;
    }

private:
    enum class Load { Ok, Missing, Failed };

    // A missing file is an empty store, not an error.
    Load load(std::map<std::string, std::string>& entries) {
        std::ifstream in(path_);
        if (!in) {
            LOG_DEBUG(logger_, "FileStore '{}' not present", path_);
            return Load::Missing;
        }
        std::string line;
        while (std::getline(in, line)) {
            auto eq = line.find('=');
            if (eq == std::string::npos || eq == 0) continue;
            entries[line.substr(0, eq)] = line.substr(eq + 1);
        }
        if (in.bad()) {
            LOG_WARN(logger_, "FileStore read of '{}' failed", path_);
            return Load::Failed;
        }
        return Load::Ok;
    }

    std::string path_;
    Logger*     logger_ = nullptr;
};

/* --------------------------------------------------------------------------
   The persisted best distance. Reads once on load(); anything missing or
   unparsable counts as 0. Only ever moves up. A failed write leaves the
   in-memory value correct and is reported, not raised.
---------------------------------------------------------------------------- */
class BestScore {
public:
    static constexpr const char* kDefaultKey = "neon-sprint-best";

    explicit BestScore(KeyValueStore* store, std::string key = kDefaultKey)
        : store_(store), key_(std::move(key)) {}

    void setLogger(Logger* l) { logger_ = l; }

    std::int64_t value() const { return best_; }
    bool lastWriteFailed() const { return lastWriteFailed_; }

    std::int64_t load() {
        best_ = 0;
        if (!store_) return best_;
        auto raw = store_->get(key_);
        if (!raw) {
            LOG_DEBUG(logger_, "No stored best under '{}'", key_);
            return best_;
        }
        std::int64_t parsed = 0;
        if (!parse(*raw, parsed)) {
            LOG_WARN(logger_, "Ignoring malformed best '{}' under '{}'", *raw, key_);
            return best_;
        }
        best_ = parsed;
        LOG_INFO(logger_, "Loaded best={}", best_);
        return best_;
    }

    // Raises best to `candidate` if larger and persists it. True if raised.
    bool offer(std::int64_t candidate) {
        if (candidate <= best_) return false;
        best_ = candidate;
        lastWriteFailed_ = !(store_ && store_->set(key_, std::to_string(best_)));
        if (lastWriteFailed_)
            LOG_WARN(logger_, "Best {} not persisted; keeping it in memory", best_);
        else
            LOG_INFO(logger_, "New best={} saved", best_);
        return true;
    }

    static bool parse(const std::string& s, std::int64_t& out) {
        // Digits only: strtoll alone would take leading blanks and a sign.
        if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos) return false;
        errno = 0;
        char* e = nullptr;
        long long v = std::strtoll(s.c_str(), &e, 10);
        if (errno != 0 || !e || *e != 0 || v < 0) return false;
        out = static_cast<std::int64_t>(v);
        return true;
    }

private:
    KeyValueStore* store_;
    std::string    key_;
    std::int64_t   best_ = 0;
    bool           lastWriteFailed_ = false;
    Logger*        logger_ = nullptr;
};
