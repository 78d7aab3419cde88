#pragma once
#include "wire.hpp"
#include <string>
#include <vector>

namespace soulwire {

// Append-only, line-delimited durable log of wire messages.
// Single writer: the owner must hold the session lock.
class WireLog {
public:
    // Opens (creating parent directories) for appending.
    // Throws LogWriteError if the file cannot be opened.
    explicit WireLog(const std::string& path, bool sync = true);
    ~WireLog();

    WireLog(const WireLog&) = delete;
    WireLog& operator=(const WireLog&) = delete;

    // Writes one encoded line and flushes it to disk before returning.
    // Throws LogWriteError on failure; nothing is considered committed then.
    void append(const WireMessage& msg);

    const std::string& path() const { return path_; }

    // Read every known message in file order. A torn final line (crash
    // mid-append) is dropped; a corrupt line elsewhere throws ProtocolError.
    // A missing file yields an empty vector.
    static std::vector<WireMessage> read(const std::string& path);

private:
    std::string path_;
    int fd_ = -1;
    bool sync_ = true;
};

} // namespace soulwire
