#pragma once
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace soulwire {

// A durable, resumable conversation bound to a working directory.
struct Session {
    std::string id;
    std::string work_dir;   // canonical absolute path
    std::string dir;        // <share>/sessions/<sha256(work_dir)>/<id>
    std::string log_path;   // <dir>/wire.jsonl
    uint64_t created_at = 0; // epoch millis

    std::string subagent_dir() const;
};

// Locates, creates and deletes sessions under a share directory and keeps
// <share>/soulwire.json, which remembers the last session per directory.
class SessionStore {
public:
    explicit SessionStore(std::string share_dir);

    // New session with a fresh id; recorded as the directory's last session.
    Session create(const std::string& work_dir);

    // Last session recorded for the directory, if its directory still exists.
    std::optional<Session> continue_last(const std::string& work_dir);

    std::optional<Session> find(const std::string& work_dir, const std::string& id) const;

    // Sessions of a directory, oldest first.
    std::vector<Session> list(const std::string& work_dir) const;

    // Delete the persisted session directory. Returns false if it was absent.
    bool remove(const Session& session);

    std::string work_dir_dir(const std::string& work_dir) const;
    std::string metadata_path() const;
    const std::string& share_dir() const { return share_dir_; }

    static std::string normalize_work_dir(const std::string& work_dir);

private:
    nlohmann::json load_metadata() const;
    void save_metadata(const nlohmann::json& meta) const;
    void set_last_session(const std::string& work_dir, const std::string& id);
    Session make_session(const std::string& work_dir, const std::string& id) const;

    std::string share_dir_;
    mutable std::mutex mutex_;
};

// Exclusive advisory lock on <session_dir>/.lock, held for the lifetime of
// the soul that writes the session's log.
class SessionLock {
public:
    // Waits up to `timeout`, then throws SessionBusyError.
    SessionLock(const std::string& session_dir, std::chrono::milliseconds timeout);
    ~SessionLock();

    SessionLock(const SessionLock&) = delete;
    SessionLock& operator=(const SessionLock&) = delete;

    const std::string& path() const { return path_; }

private:
    std::string path_;
    int fd_ = -1;
};

} // namespace soulwire
