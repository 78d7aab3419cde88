#include <catch2/catch.hpp>
#include "session.hpp"
#include "errors.hpp"
#include "util.hpp"
#include "mock_provider.hpp"
#include <filesystem>
#include <fstream>
#include <thread>

using namespace soulwire;

namespace fs = std::filesystem;

// Share dir plus a working dir, both removed at scope exit
struct StoreFixture {
    std::string share = make_temp_dir();
    std::string work = make_temp_dir();
    SessionStore store{share};

    ~StoreFixture() {
        fs::remove_all(share);
        fs::remove_all(work);
    }
};

// ── SessionStore ────────────────────────────────────────────────

TEST_CASE("SessionStore: create lays out the session directory", "[session]") {
    StoreFixture f;
    REQUIRE_FALSE(f.share.empty());

    auto s = f.store.create(f.work);

    REQUIRE(s.id.size() == 36);
    REQUIRE(s.work_dir == SessionStore::normalize_work_dir(f.work));
    REQUIRE(s.dir == f.store.work_dir_dir(f.work) + "/" + s.id);
    REQUIRE(s.log_path == s.dir + "/wire.jsonl");
    REQUIRE(s.subagent_dir() == s.dir + "/subagents");
    REQUIRE(s.created_at > 0);
    REQUIRE(fs::is_directory(s.dir));
    REQUIRE(fs::exists(s.dir + "/session.json"));
}

TEST_CASE("SessionStore: work dirs hash into the share dir", "[session]") {
    StoreFixture f;
    auto expected = f.share + "/sessions/" + sha256_hex(SessionStore::normalize_work_dir(f.work));
    REQUIRE(f.store.work_dir_dir(f.work) == expected);
    REQUIRE(f.store.work_dir_dir(f.work + "/") == expected);
}

TEST_CASE("SessionStore: normalize_work_dir", "[session]") {
    REQUIRE(SessionStore::normalize_work_dir("/tmp/") == SessionStore::normalize_work_dir("/tmp"));
    REQUIRE(SessionStore::normalize_work_dir("/") == "/");
    REQUIRE(fs::path(SessionStore::normalize_work_dir("relative")).is_absolute());
}

TEST_CASE("SessionStore: metadata remembers the last session", "[session]") {
    StoreFixture f;
    f.store.create(f.work);
    auto second = f.store.create(f.work);

    std::ifstream meta_file(f.store.metadata_path());
    auto meta = nlohmann::json::parse(meta_file);
    REQUIRE(meta["work_dirs"].size() == 1);
    REQUIRE(meta["work_dirs"][0]["path"] == second.work_dir);
    REQUIRE(meta["work_dirs"][0]["last_session_id"] == second.id);
}

TEST_CASE("SessionStore: continue_last finds the latest session", "[session]") {
    StoreFixture f;
    REQUIRE_FALSE(f.store.continue_last(f.work).has_value());

    f.store.create(f.work);
    auto latest = f.store.create(f.work);

    // A fresh store over the same share dir sees the same metadata
    SessionStore reopened(f.share);
    auto found = reopened.continue_last(f.work);
    REQUIRE(found.has_value());
    REQUIRE(found->id == latest.id);
    REQUIRE(found->log_path == latest.log_path);
    REQUIRE(found->created_at == latest.created_at);
}

TEST_CASE("SessionStore: continue_last ignores a deleted directory", "[session]") {
    StoreFixture f;
    auto s = f.store.create(f.work);
    fs::remove_all(s.dir);
    REQUIRE_FALSE(f.store.continue_last(f.work).has_value());
}

TEST_CASE("SessionStore: find by id", "[session]") {
    StoreFixture f;
    auto s = f.store.create(f.work);

    auto found = f.store.find(f.work, s.id);
    REQUIRE(found.has_value());
    REQUIRE(found->dir == s.dir);
    REQUIRE_FALSE(f.store.find(f.work, "no-such-session").has_value());
    REQUIRE_FALSE(f.store.find(f.work, "").has_value());
}

TEST_CASE("SessionStore: list is oldest first", "[session]") {
    StoreFixture f;
    REQUIRE(f.store.list(f.work).empty());

    auto a = f.store.create(f.work);
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    auto b = f.store.create(f.work);
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    auto c = f.store.create(f.work);

    auto sessions = f.store.list(f.work);
    REQUIRE(sessions.size() == 3);
    REQUIRE(sessions[0].id == a.id);
    REQUIRE(sessions[1].id == b.id);
    REQUIRE(sessions[2].id == c.id);
}

TEST_CASE("SessionStore: directories are kept apart", "[session]") {
    StoreFixture f;
    auto other = make_temp_dir();
    f.store.create(f.work);
    f.store.create(other);

    REQUIRE(f.store.list(f.work).size() == 1);
    REQUIRE(f.store.list(other).size() == 1);
    REQUIRE(f.store.continue_last(other)->work_dir == SessionStore::normalize_work_dir(other));

    fs::remove_all(other);
}

TEST_CASE("SessionStore: remove deletes the session and forgets it", "[session]") {
    StoreFixture f;
    auto s = f.store.create(f.work);

    REQUIRE(f.store.remove(s));
    REQUIRE_FALSE(fs::exists(s.dir));
    REQUIRE_FALSE(f.store.continue_last(f.work).has_value());
    REQUIRE_FALSE(f.store.remove(s));
}

TEST_CASE("SessionStore: malformed metadata is ignored", "[session]") {
    StoreFixture f;
    {
        std::ofstream bad(f.store.metadata_path());
        bad << "{ nope";
    }
    REQUIRE_FALSE(f.store.continue_last(f.work).has_value());
    auto s = f.store.create(f.work);
    REQUIRE(f.store.continue_last(f.work)->id == s.id);
}

// ── SessionLock ─────────────────────────────────────────────────

TEST_CASE("SessionLock: second holder times out", "[session]") {
    auto dir = make_temp_dir();
    REQUIRE_FALSE(dir.empty());
    {
        SessionLock first(dir, std::chrono::milliseconds(100));
        REQUIRE(fs::exists(first.path()));

        auto start = std::chrono::steady_clock::now();
        REQUIRE_THROWS_AS(SessionLock(dir, std::chrono::milliseconds(120)), SessionBusyError);
        REQUIRE(std::chrono::steady_clock::now() - start >= std::chrono::milliseconds(100));
    }
    fs::remove_all(dir);
}

TEST_CASE("SessionLock: released on destruction", "[session]") {
    auto dir = make_temp_dir();
    REQUIRE_FALSE(dir.empty());
    {
        SessionLock first(dir, std::chrono::milliseconds(100));
    }
    REQUIRE_NOTHROW(SessionLock(dir, std::chrono::milliseconds(0)));
    fs::remove_all(dir);
}

TEST_CASE("SessionLock: waits for a holder that lets go", "[session]") {
    auto dir = make_temp_dir();
    REQUIRE_FALSE(dir.empty());
    auto first = std::make_unique<SessionLock>(dir, std::chrono::milliseconds(100));
    std::thread releaser([&first]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        first.reset();
    });

    REQUIRE_NOTHROW(SessionLock(dir, std::chrono::seconds(5)));
    releaser.join();
    fs::remove_all(dir);
}
