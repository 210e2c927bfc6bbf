#include "atomic_file.h"

#include "plshare_util.h"

#include <cerrno>
#include <cstring>
#include <iostream>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <sodium.h>

namespace plshare {

/*
================================================================================
Atomic file primitives
================================================================================

Both primitives stage the bytes in a temp file that lives in the SAME directory
as the target, so that the final step is a single metadata operation on one
filesystem:

  create_unique_file():  tmp --link(2)--> target     (EEXIST => "exists")
  replace_file_atomic(): tmp --rename(2)--> target   (unconditional)

Readers therefore observe either "no file" / "old file" or the complete new
file, never a partially written one.

Durability:
  - tmp is fsync()ed before it is published
  - the parent directory is fsync()ed after link/rename so the new directory
    entry survives power loss

The temp file is removed on every exit path of both primitives.
================================================================================
*/

static std::string errno_msg(const std::string& what, const std::filesystem::path& p, int e) {
    return what + " " + p.string() + ": " + std::strerror(e);
}

std::filesystem::path temp_path_for(const std::filesystem::path& target) {
    unsigned char rnd[6];
    randombytes_buf(rnd, sizeof(rnd));
    std::filesystem::path tmp = target;
    tmp += "." + std::to_string(now_epoch_ms()) + "." + to_hex(rnd, sizeof(rnd)) + ".tmp";
    return tmp;
}

bool is_temp_path(const std::filesystem::path& p) {
    return p.extension() == ".tmp";
}

// Write all bytes to fd, retrying on EINTR / short writes.
static bool write_all(int fd, const std::string& bytes, int* out_errno) {
    const char* p = bytes.data();
    size_t left = bytes.size();
    while (left > 0) {
        ssize_t n = ::write(fd, p, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            *out_errno = errno;
            return false;
        }
        p += n;
        left -= (size_t)n;
    }
    return true;
}

// Create path exclusively and fill it. On failure the partially written file
// is unlinked. Returns 0 or an errno value.
static int write_new_file(const std::filesystem::path& path, const std::string& bytes) {
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd < 0) return errno;

    int e = 0;
    if (!write_all(fd, bytes, &e)) {
        ::close(fd);
        ::unlink(path.c_str());
        return e;
    }
    if (::fsync(fd) != 0) {
        e = errno;
        ::close(fd);
        ::unlink(path.c_str());
        return e;
    }
    if (::close(fd) != 0) {
        e = errno;
        ::unlink(path.c_str());
        return e;
    }
    return 0;
}

// Best-effort: a failing directory fsync does not undo the publish.
static void fsync_dir(const std::filesystem::path& dir) {
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) return;
    if (::fsync(fd) != 0) {
        std::cerr << "[store] WARNING: " << errno_msg("fsync dir", dir, errno) << std::endl;
    }
    ::close(fd);
}

static bool ensure_parent(const std::filesystem::path& target, std::string* err) {
    std::error_code ec;
    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec) {
        if (err) *err = "create_directories " + target.parent_path().string() + ": " + ec.message();
        return false;
    }
    return true;
}

static bool link_unsupported(int e) {
    return e == EPERM || e == EACCES || e == EXDEV || e == ENOSYS || e == EMLINK || e == ENOTSUP;
}

CreateStatus create_unique_file(const std::filesystem::path& target,
                                const std::string& bytes,
                                std::string* err) {
    if (!ensure_parent(target, err)) return CreateStatus::failed;

    const std::filesystem::path tmp = temp_path_for(target);
    int e = write_new_file(tmp, bytes);
    if (e != 0) {
        if (err) *err = errno_msg("write tmp", tmp, e);
        return CreateStatus::failed;
    }

    int rc = ::link(tmp.c_str(), target.c_str());
    int link_errno = (rc == 0) ? 0 : errno;
    ::unlink(tmp.c_str());

    if (rc == 0) {
        fsync_dir(target.parent_path());
        return CreateStatus::created;
    }
    if (link_errno == EEXIST) return CreateStatus::exists;

    if (link_unsupported(link_errno)) {
        // No hard links here: O_EXCL on the target still gives exactly one winner,
        // at the cost of a window where a reader can see a short file.
        e = write_new_file(target, bytes);
        if (e == 0) {
            fsync_dir(target.parent_path());
            return CreateStatus::created;
        }
        if (e == EEXIST) return CreateStatus::exists;
        if (err) *err = errno_msg("exclusive create", target, e);
        return CreateStatus::failed;
    }

    if (err) *err = errno_msg("link", target, link_errno);
    return CreateStatus::failed;
}

bool replace_file_atomic(const std::filesystem::path& target,
                         const std::string& bytes,
                         std::string* err) {
    if (!ensure_parent(target, err)) return false;

    const std::filesystem::path tmp = temp_path_for(target);
    int e = write_new_file(tmp, bytes);
    if (e != 0) {
        if (err) *err = errno_msg("write tmp", tmp, e);
        return false;
    }

    if (::rename(tmp.c_str(), target.c_str()) != 0) {
        e = errno;
        ::unlink(tmp.c_str());
        if (err) *err = errno_msg("rename over", target, e);
        return false;
    }

    fsync_dir(target.parent_path());
    return true;
}

ReadStatus read_file_bytes(const std::filesystem::path& p,
                           std::string* out,
                           std::string* err) {
    int fd = ::open(p.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        if (errno == ENOENT) return ReadStatus::missing;
        if (err) *err = errno_msg("open", p, errno);
        return ReadStatus::failed;
    }

    std::string data;
    char buf[16384];
    for (;;) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            int e = errno;
            ::close(fd);
            if (err) *err = errno_msg("read", p, e);
            return ReadStatus::failed;
        }
        if (n == 0) break;
        data.append(buf, (size_t)n);
    }
    ::close(fd);

    if (out) *out = std::move(data);
    return ReadStatus::ok;
}

bool remove_file_if_present(const std::filesystem::path& p,
                            bool* removed,
                            std::string* err) {
    if (removed) *removed = false;
    if (::unlink(p.c_str()) == 0) {
        if (removed) *removed = true;
        return true;
    }
    if (errno == ENOENT) return true;
    if (err) *err = errno_msg("unlink", p, errno);
    return false;
}

} // namespace plshare
