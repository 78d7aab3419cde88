#include "session.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <thread>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace soulwire {

static constexpr const char* kLogName = "wire.jsonl";
static constexpr const char* kSessionInfoName = "session.json";

std::string Session::subagent_dir() const {
    return (fs::path(dir) / "subagents").string();
}

// ── SessionStore ────────────────────────────────────────────────

SessionStore::SessionStore(std::string share_dir) : share_dir_(std::move(share_dir)) {}

std::string SessionStore::normalize_work_dir(const std::string& work_dir) {
    std::error_code ec;
    fs::path abs = fs::absolute(work_dir.empty() ? fs::path(".") : fs::path(work_dir), ec);
    if (ec) return work_dir;
    fs::path canon = fs::weakly_canonical(abs, ec);
    std::string s = ec ? abs.lexically_normal().string() : canon.string();
    // "/a/b/" and "/a/b" are the same directory
    while (s.size() > 1 && s.back() == '/') s.pop_back();
    return s;
}

std::string SessionStore::work_dir_dir(const std::string& work_dir) const {
    return (fs::path(share_dir_) / "sessions" / sha256_hex(normalize_work_dir(work_dir))).string();
}

std::string SessionStore::metadata_path() const {
    return (fs::path(share_dir_) / "soulwire.json").string();
}

Session SessionStore::make_session(const std::string& work_dir, const std::string& id) const {
    Session s;
    s.id = id;
    s.work_dir = normalize_work_dir(work_dir);
    s.dir = (fs::path(work_dir_dir(work_dir)) / id).string();
    s.log_path = (fs::path(s.dir) / kLogName).string();
    return s;
}

nlohmann::json SessionStore::load_metadata() const {
    nlohmann::json meta = {{"work_dirs", nlohmann::json::array()}};
    std::ifstream file(metadata_path());
    if (!file.is_open()) return meta;
    try {
        nlohmann::json parsed = nlohmann::json::parse(file);
        if (parsed.is_object() && parsed.contains("work_dirs") && parsed["work_dirs"].is_array()) {
            meta = std::move(parsed);
        }
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[session] Ignoring malformed " << metadata_path() << ": " << e.what() << '\n';
    }
    return meta;
}

void SessionStore::save_metadata(const nlohmann::json& meta) const {
    if (!atomic_write_file(metadata_path(), meta.dump(2) + "\n")) {
        std::cerr << "[session] Failed to write " << metadata_path() << '\n';
    }
}

void SessionStore::set_last_session(const std::string& work_dir, const std::string& id) {
    std::string path = normalize_work_dir(work_dir);
    auto meta = load_metadata();
    bool found = false;
    for (auto& entry : meta["work_dirs"]) {
        if (entry.value("path", "") == path) {
            if (id.empty()) entry.erase("last_session_id");
            else entry["last_session_id"] = id;
            found = true;
        }
    }
    if (!found && !id.empty()) {
        meta["work_dirs"].push_back({{"path", path}, {"last_session_id", id}});
    }
    save_metadata(meta);
}

Session SessionStore::create(const std::string& work_dir) {
    std::lock_guard<std::mutex> lock(mutex_);
    Session s = make_session(work_dir, generate_uuid());
    s.created_at = epoch_millis();

    std::error_code ec;
    fs::create_directories(s.dir, ec);
    if (ec) {
        throw std::runtime_error("Failed to create session directory " + s.dir + ": " + ec.message());
    }
    nlohmann::json info = {{"id", s.id}, {"work_dir", s.work_dir}, {"created_at", s.created_at}};
    if (!atomic_write_file((fs::path(s.dir) / kSessionInfoName).string(), info.dump(2) + "\n")) {
        throw std::runtime_error("Failed to write session info in " + s.dir);
    }

    set_last_session(work_dir, s.id);
    std::cerr << "[session] Created " << s.id << " for " << s.work_dir << '\n';
    return s;
}

std::optional<Session> SessionStore::find(const std::string& work_dir, const std::string& id) const {
    if (id.empty()) return std::nullopt;
    Session s = make_session(work_dir, id);
    std::error_code ec;
    if (!fs::is_directory(s.dir, ec)) return std::nullopt;

    std::ifstream file(fs::path(s.dir) / kSessionInfoName);
    if (file.is_open()) {
        try {
            auto info = nlohmann::json::parse(file);
            s.created_at = info.value("created_at", uint64_t{0});
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[session] Bad session info in " << s.dir << ": " << e.what() << '\n';
        }
    }
    return s;
}

std::optional<Session> SessionStore::continue_last(const std::string& work_dir) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string path = normalize_work_dir(work_dir);
    auto meta = load_metadata();
    for (const auto& entry : meta["work_dirs"]) {
        if (entry.value("path", "") != path) continue;
        auto s = find(work_dir, entry.value("last_session_id", ""));
        if (s) std::cerr << "[session] Continuing " << s->id << '\n';
        return s;
    }
    return std::nullopt;
}

std::vector<Session> SessionStore::list(const std::string& work_dir) const {
    std::vector<Session> sessions;
    std::error_code ec;
    fs::directory_iterator it(work_dir_dir(work_dir), ec);
    if (ec) return sessions;
    for (const auto& entry : it) {
        if (!entry.is_directory()) continue;
        if (auto s = find(work_dir, entry.path().filename().string())) {
            sessions.push_back(std::move(*s));
        }
    }
    std::sort(sessions.begin(), sessions.end(), [](const Session& a, const Session& b) {
        return a.created_at != b.created_at ? a.created_at < b.created_at : a.id < b.id;
    });
    return sessions;
}

bool SessionStore::remove(const Session& session) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    auto removed = fs::remove_all(session.dir, ec);
    if (ec) {
        throw std::runtime_error("Failed to delete session " + session.id + ": " + ec.message());
    }

    auto meta = load_metadata();
    for (const auto& entry : meta["work_dirs"]) {
        if (entry.value("path", "") == session.work_dir &&
            entry.value("last_session_id", "") == session.id) {
            set_last_session(session.work_dir, "");
            break;
        }
    }
    if (removed > 0) {
        std::cerr << "[session] Deleted " << session.id << '\n';
    }
    return removed > 0;
}

// ── SessionLock ─────────────────────────────────────────────────

SessionLock::SessionLock(const std::string& session_dir, std::chrono::milliseconds timeout)
    : path_((fs::path(session_dir) / ".lock").string())
{
    std::error_code ec;
    fs::create_directories(session_dir, ec);

    fd_ = ::open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        throw SessionBusyError("Cannot open session lock " + path_ + ": " + std::strerror(errno));
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (flock(fd_, LOCK_EX | LOCK_NB) != 0) {
        if (errno != EWOULDBLOCK && errno != EINTR) {
            int err = errno;
            ::close(fd_);
            fd_ = -1;
            throw SessionBusyError("Cannot lock " + path_ + ": " + std::strerror(err));
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            ::close(fd_);
            fd_ = -1;
            throw SessionBusyError("Session is in use by another process: " + session_dir);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
}

SessionLock::~SessionLock() {
    if (fd_ >= 0) {
        flock(fd_, LOCK_UN);
        ::close(fd_);
    }
}

} // namespace soulwire
