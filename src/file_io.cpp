#include "file_io.hpp"
#include "edit_error.hpp"
#include "hash.hpp"
#include "util.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <utility>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace collab {

namespace {

std::string errno_message(const std::string& what, const std::string& path) {
    return what + " " + path + ": " + std::strerror(errno);
}

std::string parent_dir(const std::string& path) {
    std::filesystem::path p(path);
    return p.has_parent_path() ? p.parent_path().string() : std::string(".");
}

// Make a completed rename durable. Failure here does not undo the rename,
// so it is only logged.
void sync_directory(const std::string& dir) {
    int dfd = open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (dfd < 0) return;
    if (fsync(dfd) != 0) {
        std::cerr << "[file] fsync of directory " << dir << " failed: "
                  << std::strerror(errno) << "\n";
    }
    close(dfd);
}

} // namespace

std::string read_file_bytes(const std::string& path) {
    std::error_code ec;
    auto st = std::filesystem::symlink_status(path, ec);
    if (ec || !std::filesystem::exists(st)) {
        if (ec && ec != std::errc::no_such_file_or_directory) {
            throw EditError(ErrorKind::IOFailure,
                            "Failed to stat " + path + ": " + ec.message());
        }
        throw EditError(ErrorKind::NotFound, "File not found: " + path);
    }
    if (std::filesystem::is_symlink(st)) {
        throw EditError(ErrorKind::InvalidArgument, "Path is a symbolic link: " + path);
    }
    if (std::filesystem::is_directory(st)) {
        throw EditError(ErrorKind::InvalidArgument, "Path is a directory: " + path);
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw EditError(ErrorKind::IOFailure, errno_message("Failed to open file", path));
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        throw EditError(ErrorKind::IOFailure, "Failed to read file: " + path);
    }
    return ss.str();
}

// ── AtomicWriter ────────────────────────────────────────────────

AtomicWriter::AtomicWriter(std::string target) : target_(std::move(target)) {
    std::string dir = parent_dir(target_);
    std::string name = std::filesystem::path(target_).filename().string();

    // O_EXCL with a random suffix; 0666 so the process umask applies as it
    // would for a plainly created file.
    for (int attempt = 0; attempt < 8; ++attempt) {
        std::string candidate = dir + "/." + name + ".tmp." + generate_id();
        fd_ = open(candidate.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0666);
        if (fd_ >= 0) {
            temp_ = candidate;
            return;
        }
        if (errno != EEXIST) {
            throw EditError(ErrorKind::IOFailure,
                            errno_message("Failed to create temporary file for", target_));
        }
    }
    throw EditError(ErrorKind::IOFailure,
                    "Failed to create a unique temporary file for " + target_);
}

AtomicWriter::~AtomicWriter() {
    if (fd_ >= 0) close(fd_);
    if (!committed_ && !temp_.empty()) unlink(temp_.c_str());
}

void AtomicWriter::write(const std::string& bytes) {
    if (fd_ < 0) {
        throw EditError(ErrorKind::IOFailure, "Temporary file already closed: " + temp_);
    }
    size_t written = 0;
    while (written < bytes.size()) {
        ssize_t n = ::write(fd_, bytes.data() + written, bytes.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw EditError(ErrorKind::IOFailure, errno_message("Failed to write", temp_));
        }
        written += static_cast<size_t>(n);
    }
}

void AtomicWriter::sync_and_close() {
    if (fd_ < 0) return;
    if (fsync(fd_) != 0) {
        throw EditError(ErrorKind::IOFailure, errno_message("Failed to sync", temp_));
    }
    int fd = fd_;
    fd_ = -1;
    if (close(fd) != 0) {
        throw EditError(ErrorKind::IOFailure, errno_message("Failed to close", temp_));
    }
}

void AtomicWriter::rename_into_place() {
    if (rename(temp_.c_str(), target_.c_str()) != 0) {
        throw EditError(ErrorKind::IOFailure, errno_message("Failed to replace", target_));
    }
    committed_ = true;
    sync_directory(parent_dir(target_));
}

void AtomicWriter::commit_replace(const std::string& expected_hash) {
    sync_and_close();

    // lstat: rename() replaces a symlink itself, never the file it points to
    struct stat st;
    if (lstat(target_.c_str(), &st) != 0) {
        throw EditError(ErrorKind::Conflict,
                        "File was removed since it was read: " + target_);
    }
    if (S_ISLNK(st.st_mode)) {
        throw EditError(ErrorKind::InvalidArgument, "Path is a symbolic link: " + target_);
    }
    if (chmod(temp_.c_str(), st.st_mode & 07777) != 0) {
        throw EditError(ErrorKind::IOFailure, errno_message("Failed to set mode on", temp_));
    }

    // The comparison and the rename are not one syscall; the window between
    // them is the residual race of lock-free optimistic concurrency.
    if (verify_file_hash(target_, expected_hash) == VerifyStatus::Conflict) {
        throw EditError(ErrorKind::Conflict,
                        "File was modified concurrently, re-read and retry: " + target_);
    }
    rename_into_place();
}

void AtomicWriter::commit_new() {
    sync_and_close();

    // link() fails with EEXIST instead of replacing, unlike rename()
    if (link(temp_.c_str(), target_.c_str()) != 0) {
        if (errno == EEXIST) {
            throw EditError(ErrorKind::AlreadyExists, "File already exists: " + target_);
        }
        throw EditError(ErrorKind::IOFailure, errno_message("Failed to create", target_));
    }
    committed_ = true;
    if (unlink(temp_.c_str()) != 0) {
        std::cerr << "[file] Failed to remove " << temp_ << ": "
                  << std::strerror(errno) << "\n";
    }
    sync_directory(parent_dir(target_));
}

void AtomicWriter::commit() {
    sync_and_close();
    rename_into_place();
}

bool atomic_write_file(const std::string& path, const std::string& content) {
    try {
        std::filesystem::path fs_path(path);
        if (fs_path.has_parent_path()) {
            std::filesystem::create_directories(fs_path.parent_path());
        }
        AtomicWriter writer(path);
        writer.write(content);
        writer.commit();
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[file] Failed to write " << path << ": " << e.what() << "\n";
        return false;
    }
}

} // namespace collab
