#include "storage/LocalBackend.hpp"
#include "storage/Errors.hpp"

#include <cerrno>
#include <fcntl.h>
#include <fstream>
#include <sstream>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <unistd.h>

using namespace mg::storage::model;

namespace mg::storage {

namespace {

Clock::time_point toTimePoint(const statx_timestamp& ts) {
    return Clock::time_point(std::chrono::duration_cast<Clock::duration>(
        std::chrono::seconds(ts.tv_sec) + std::chrono::nanoseconds(ts.tv_nsec)));
}

timespec toTimespec(const Clock::time_point tp) {
    const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()).count();
    timespec ts{};
    ts.tv_sec = static_cast<time_t>(ns / 1'000'000'000);
    ts.tv_nsec = static_cast<long>(ns % 1'000'000'000);
    if (ts.tv_nsec < 0) {
        ts.tv_nsec += 1'000'000'000;
        --ts.tv_sec;
    }
    return ts;
}

class FileDescriptor {
public:
    FileDescriptor(const fs::path& path, const int flags, const mode_t mode = 0644)
        : fd_(::open(path.c_str(), flags | O_CLOEXEC, mode)) {
        if (fd_ < 0) throwErrno(errno, "open " + path.string());
    }
    ~FileDescriptor() { if (fd_ >= 0) ::close(fd_); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    void writeAll(const std::vector<uint8_t>& data, const fs::path& path) const {
        size_t off = 0;
        while (off < data.size()) {
            const auto n = ::write(fd_, data.data() + off, data.size() - off);
            if (n < 0) {
                if (errno == EINTR) continue;
                throwErrno(errno, "write " + path.string());
            }
            off += static_cast<size_t>(n);
        }
    }

    void close(const fs::path& path) {
        const int fd = fd_;
        fd_ = -1;
        if (::close(fd) != 0) throwErrno(errno, "close " + path.string());
    }

    [[nodiscard]] int get() const { return fd_; }

private:
    int fd_;
};

void writeWithFlags(const fs::path& path, const std::vector<uint8_t>& data, const int flags) {
    FileDescriptor fd(path, flags);
    fd.writeAll(data, path);
    fd.close(path);
}

}

std::vector<uint8_t> LocalBackend::read(const fs::path& path, const ReadOptions& opts) const {
    const FileDescriptor fd(path, O_RDONLY);

    struct stat st{};
    if (::fstat(fd.get(), &st) != 0) throwErrno(errno, "stat " + path.string());

    const auto size = static_cast<uintmax_t>(st.st_size);
    if (opts.position >= size) return {};

    auto toRead = size - opts.position;
    if (opts.length && *opts.length < toRead) toRead = *opts.length;

    std::vector<uint8_t> buffer(toRead);
    size_t done = 0;
    while (done < toRead) {
        const auto n = ::pread(fd.get(), buffer.data() + done, toRead - done,
                               static_cast<off_t>(opts.position + done));
        if (n < 0) {
            if (errno == EINTR) continue;
            throwErrno(errno, "read " + path.string());
        }
        if (n == 0) break;
        done += static_cast<size_t>(n);
    }
    buffer.resize(done);
    return buffer;
}

std::string LocalBackend::readText(const fs::path& path) const {
    const auto bytes = read(path);
    return {bytes.begin(), bytes.end()};
}

ReadStream LocalBackend::createReadStream(const fs::path& path) const {
    const auto st = stat(path);
    if (::access(path.c_str(), R_OK) != 0) throwErrno(errno, "access " + path.string());

    auto in = std::make_unique<std::ifstream>(path, std::ios::binary);
    if (!in->is_open()) throwErrno(errno ? errno : EIO, "open " + path.string());

    return {.stream = std::move(in), .length = st.size, .type = std::nullopt};
}

void LocalBackend::write(const fs::path& path, const std::vector<uint8_t>& data) const {
    writeWithFlags(path, data, O_WRONLY | O_CREAT | O_TRUNC);
}

void LocalBackend::overwrite(const fs::path& path, const std::vector<uint8_t>& data) const {
    writeWithFlags(path, data, O_WRONLY);
}

void LocalBackend::createExclusive(const fs::path& path, const std::vector<uint8_t>& data) const {
    writeWithFlags(path, data, O_WRONLY | O_CREAT | O_EXCL);
}

std::unique_ptr<std::ostream> LocalBackend::createWriteStream(const fs::path& path) const {
    errno = 0;
    auto out = std::make_unique<std::ofstream>(path, std::ios::binary | std::ios::trunc);
    if (!out->is_open()) throwErrno(errno ? errno : EIO, "open " + path.string());
    return out;
}

FileStat LocalBackend::stat(const fs::path& path) const {
    struct statx stx{};
    if (::statx(AT_FDCWD, path.c_str(), 0, STATX_BASIC_STATS | STATX_BTIME, &stx) != 0)
        throwErrno(errno, "stat " + path.string());

    FileStat st;
    st.size = stx.stx_size;
    st.mtime = toTimePoint(stx.stx_mtime);
    st.atime = toTimePoint(stx.stx_atime);
    st.birthtime = (stx.stx_mask & STATX_BTIME) ? toTimePoint(stx.stx_btime) : toTimePoint(stx.stx_ctime);
    st.isDirectory = S_ISDIR(stx.stx_mode);
    return st;
}

bool LocalBackend::exists(const fs::path& path) const {
    return ::access(path.c_str(), F_OK) == 0;
}

void LocalBackend::utimes(const fs::path& path, const Clock::time_point atime, const Clock::time_point mtime) const {
    const timespec times[2] = {toTimespec(atime), toTimespec(mtime)};
    if (::utimensat(AT_FDCWD, path.c_str(), times, 0) != 0)
        throwErrno(errno, "utimes " + path.string());
}

fs::path LocalBackend::realpath(const fs::path& path) const {
    std::error_code ec;
    auto resolved = fs::canonical(path, ec);
    if (ec) throwSystemError(ec, "realpath " + path.string());
    return resolved;
}

std::vector<std::string> LocalBackend::readdir(const fs::path& dir) const {
    std::error_code ec;
    std::vector<std::string> names;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec))
        names.push_back(it->path().filename().string());
    if (ec) throwSystemError(ec, "readdir " + dir.string());
    return names;
}

DiskUsage LocalBackend::diskUsage(const fs::path& path) const {
    struct statvfs sv{};
    if (::statvfs(path.c_str(), &sv) != 0) throwErrno(errno, "statfs " + path.string());
    return {
        .available = static_cast<uintmax_t>(sv.f_bavail) * sv.f_frsize,
        .free = static_cast<uintmax_t>(sv.f_bfree) * sv.f_frsize,
        .total = static_cast<uintmax_t>(sv.f_blocks) * sv.f_frsize
    };
}

void LocalBackend::rename(const fs::path& from, const fs::path& to) const {
    if (::rename(from.c_str(), to.c_str()) != 0)
        throwErrno(errno, "rename " + from.string() + " -> " + to.string());
}

void LocalBackend::copy(const fs::path& from, const fs::path& to) const {
    std::error_code ec;
    fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
    if (ec) throwSystemError(ec, "copy " + from.string() + " -> " + to.string());
}

void LocalBackend::unlink(const fs::path& path) const {
    if (::unlink(path.c_str()) != 0) throwErrno(errno, "unlink " + path.string());
}

void LocalBackend::unlinkDir(const fs::path& dir, const bool recursive) const {
    std::error_code ec;
    if (recursive) fs::remove_all(dir, ec);
    else if (!fs::remove(dir, ec) && !ec) ec = std::make_error_code(std::errc::no_such_file_or_directory);
    if (ec) throwSystemError(ec, "rmdir " + dir.string());
}

void LocalBackend::mkdirs(const fs::path& dir) const {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) throwSystemError(ec, "mkdir " + dir.string());
}

void LocalBackend::removeEmptyDirs(const fs::path& dir, const bool includeSelf) const {
    std::error_code ec;
    if (!fs::is_directory(fs::symlink_status(dir, ec))) return;

    for (const auto& name : readdir(dir)) removeEmptyDirs(dir / name, true);

    if (includeSelf && fs::is_empty(dir, ec) && !ec && ::rmdir(dir.c_str()) != 0)
        throwErrno(errno, "rmdir " + dir.string());
}

}
