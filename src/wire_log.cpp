#include "wire_log.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace soulwire {

static void read_exact(int fd, char* buf, size_t len, off_t offset, const std::string& path) {
    size_t done = 0;
    while (done < len) {
        ssize_t n = ::pread(fd, buf + done, len - done, offset + static_cast<off_t>(done));
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            throw LogWriteError("cannot read wire log " + path + ": " +
                                (n < 0 ? std::strerror(errno) : "unexpected end of file"));
        }
        done += static_cast<size_t>(n);
    }
}

// Make the file end on a complete, decodable line so the next append starts
// a line of its own. A final line that read() would drop as torn is cut off;
// a decodable final line that only lacks its newline gets one.
static void repair_tail(int fd, const std::string& path) {
    struct stat st{};
    if (::fstat(fd, &st) != 0) {
        throw LogWriteError("cannot stat wire log " + path + ": " + std::strerror(errno));
    }
    const off_t size = st.st_size;
    if (size == 0) return;

    char last = 0;
    read_exact(fd, &last, 1, size - 1, path);
    const off_t end = last == '\n' ? size - 1 : size;

    // Start of the final line: one past the previous newline, or 0.
    off_t start = end;
    char chunk[4096];
    while (start > 0) {
        off_t len = std::min<off_t>(start, static_cast<off_t>(sizeof(chunk)));
        read_exact(fd, chunk, static_cast<size_t>(len), start - len, path);
        off_t i = len;
        while (i > 0 && chunk[i - 1] != '\n') i--;
        if (i > 0) {
            start = start - len + i;
            break;
        }
        start -= len;
    }

    std::string tail(static_cast<size_t>(end - start), '\0');
    if (!tail.empty()) read_exact(fd, &tail[0], tail.size(), start, path);

    bool decodable = true;
    if (!tail.empty()) {
        try {
            decode_wire_message(tail);
        } catch (const ProtocolError&) {
            decodable = false;
        }
    }

    if (decodable) {
        if (last != '\n' && ::write(fd, "\n", 1) != 1) {
            throw LogWriteError("cannot terminate last line of " + path + ": " +
                                std::strerror(errno));
        }
        return;
    }
    if (::ftruncate(fd, start) != 0) {
        throw LogWriteError("cannot truncate torn line of " + path + ": " +
                            std::strerror(errno));
    }
    std::cerr << "[wire] Removed torn final line (" << (size - start) << " bytes) from "
              << path << '\n';
}

WireLog::WireLog(const std::string& path, bool sync)
    : path_(path), sync_(sync)
{
    std::error_code ec;
    auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
    }
    fd_ = ::open(path_.c_str(), O_RDWR | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        throw LogWriteError("cannot open wire log " + path_ + ": " + std::strerror(errno));
    }
    try {
        repair_tail(fd_, path_);
    } catch (const LogWriteError&) {
        ::close(fd_);
        fd_ = -1;
        throw;
    }
}

WireLog::~WireLog() {
    if (fd_ >= 0) ::close(fd_);
}

void WireLog::append(const WireMessage& msg) {
    std::string line = encode_wire_message(msg);
    line += '\n';

    size_t written = 0;
    while (written < line.size()) {
        ssize_t n = ::write(fd_, line.data() + written, line.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw LogWriteError("write to " + path_ + " failed: " + std::strerror(errno));
        }
        written += static_cast<size_t>(n);
    }
    if (sync_ && ::fdatasync(fd_) != 0) {
        throw LogWriteError("fdatasync on " + path_ + " failed: " + std::strerror(errno));
    }
}

std::vector<WireMessage> WireLog::read(const std::string& path) {
    std::vector<WireMessage> out;
    std::ifstream file(path);
    if (!file.is_open()) return out;

    std::string line;
    size_t line_no = 0;
    while (std::getline(file, line)) {
        line_no++;
        if (line.empty()) continue;
        try {
            auto msg = decode_wire_message(line);
            if (msg) out.push_back(std::move(*msg));
        } catch (const ProtocolError&) {
            // Only the last line may be torn by a crash during append
            if (file.peek() == std::char_traits<char>::eof()) {
                std::cerr << "[wire] Dropping torn final line " << line_no
                          << " of " << path << '\n';
                break;
            }
            throw ProtocolError("corrupt wire log " + path + " at line " +
                                std::to_string(line_no));
        }
    }
    return out;
}

} // namespace soulwire
