#include "controlhub/utils/file_io.hpp"
#include "controlhub/utils/logging.hpp"
#include "controlhub/utils/types.hpp"

#include <atomic>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iterator>
#include <sstream>

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

namespace scoreboard::controlhub::utils {

namespace fs = std::filesystem;

DECLARE_LOGGER("FileIO");

namespace {

std::string errno_message(const std::string& what, const fs::path& path) {
    return what + " '" + path.string() + "': " + std::strerror(errno);
}

}  // namespace

Result<std::string> read_file(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return unexpected(MAKE_ERROR(CONFIG_FILE_NOT_FOUND, "File not found: " + path.string()));
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return unexpected(MAKE_ERROR(IO_READ_FAILED, "Cannot open file: " + path.string()));
    }

    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    if (file.bad()) {
        return unexpected(MAKE_ERROR(IO_READ_FAILED, "Error reading file: " + path.string()));
    }
    return content;
}

Result<void> write_file_synced(const fs::path& path, const std::string& contents) {
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        return unexpected(MAKE_ERROR(IO_WRITE_FAILED, errno_message("Cannot create", path)));
    }

    const char* data = contents.data();
    size_t remaining = contents.size();
    while (remaining > 0) {
        ssize_t written = ::write(fd, data, remaining);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            auto message = errno_message("Write failed for", path);
            ::close(fd);
            return unexpected(MAKE_ERROR(IO_WRITE_FAILED, message));
        }
        data += written;
        remaining -= static_cast<size_t>(written);
    }

    if (::fsync(fd) != 0) {
        auto message = errno_message("fsync failed for", path);
        ::close(fd);
        return unexpected(MAKE_ERROR(IO_WRITE_FAILED, message));
    }

    if (::close(fd) != 0) {
        return unexpected(MAKE_ERROR(IO_WRITE_FAILED, errno_message("close failed for", path)));
    }
    return {};
}

Result<void> sync_directory(const fs::path& directory) {
    const fs::path dir = directory.empty() ? fs::path(".") : directory;
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        return unexpected(MAKE_ERROR(IO_WRITE_FAILED, errno_message("Cannot open directory", dir)));
    }
    int rc = ::fsync(fd);
    auto message = rc != 0 ? errno_message("fsync failed for directory", dir) : std::string();
    ::close(fd);
    if (rc != 0) {
        return unexpected(MAKE_ERROR(IO_WRITE_FAILED, message));
    }
    return {};
}

Result<void> ensure_directory(const fs::path& directory) {
    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec) {
        return unexpected(MAKE_ERROR(FILE_ERROR,
            "Cannot create directory '" + directory.string() + "': " + ec.message()));
    }
    return {};
}

fs::path temp_path_for(const fs::path& path) {
    static std::atomic<u64> counter{0};
    std::ostringstream name;
    name << path.filename().string() << ".tmp." << ::getpid() << "." << counter.fetch_add(1);
    return path.parent_path() / name.str();
}

Result<void> atomic_replace(const fs::path& from, const fs::path& to) {
    return atomic_replace(from, to, sync_directory);
}

Result<void> atomic_replace(const fs::path& from, const fs::path& to, const DirectorySync& sync) {
    if (std::rename(from.c_str(), to.c_str()) != 0) {
        return unexpected(MAKE_ERROR(IO_WRITE_FAILED,
            errno_message("Cannot rename '" + from.string() + "' over", to)));
    }
    // The new name is visible from here on; only its durability is in question.
    if (auto synced = sync(to.parent_path()); !synced) {
        COMPONENT_LOG_WARN("Replaced {} but the directory sync failed: {}", to.string(),
                           synced.error().message());
    }
    return {};
}

Result<void> atomic_write_file(const fs::path& path, const std::string& contents) {
    RETURN_IF_ERROR(ensure_directory(path.parent_path().empty() ? fs::path(".") : path.parent_path()));

    const auto temp = temp_path_for(path);
    auto written = write_file_synced(temp, contents);
    if (!written) {
        remove_quietly(temp);
        return written;
    }

    auto replaced = atomic_replace(temp, path);
    if (!replaced) {
        remove_quietly(temp);
        return replaced;
    }
    return {};
}

bool remove_quietly(const fs::path& path, std::string* reason) {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
        if (reason) {
            *reason = ec.message();
        }
        return false;
    }
    return true;
}

FileLock::~FileLock() {
    release();
}

FileLock::FileLock(FileLock&& other) noexcept : fd_(other.fd_) {
    other.fd_ = -1;
}

FileLock& FileLock::operator=(FileLock&& other) noexcept {
    if (this != &other) {
        release();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

void FileLock::release() noexcept {
    if (fd_ >= 0) {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
        fd_ = -1;
    }
}

Result<FileLock> FileLock::try_acquire(const fs::path& path) {
    RETURN_IF_ERROR(ensure_directory(path.parent_path().empty() ? fs::path(".") : path.parent_path()));

    int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        return unexpected(MAKE_ERROR(FILE_ERROR, errno_message("Cannot open lock file", path)));
    }

    while (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
        if (errno == EINTR) {
            continue;
        }
        const int error = errno;
        auto message = errno_message("Cannot lock", path);
        ::close(fd);
        if (error == EWOULDBLOCK) {
            return unexpected(MAKE_ERROR(LOCK_HELD, "Lock is held: " + path.string()));
        }
        return unexpected(MAKE_ERROR(FILE_ERROR, message));
    }
    return FileLock(fd);
}

bool FileLock::is_held(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return false;
    }
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return false;
    }
    int rc = ::flock(fd, LOCK_EX | LOCK_NB);
    const bool held = rc != 0 && errno == EWOULDBLOCK;
    if (rc == 0) {
        ::flock(fd, LOCK_UN);
    }
    ::close(fd);
    return held;
}

std::string backup_timestamp() {
    std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y%m%d%H%M%S", &local);
    return buffer;
}

}  // namespace scoreboard::controlhub::utils
