#pragma once
#include <string>

namespace collab {

// Read a whole file as raw bytes.
// Throws EditError(NotFound) if it does not exist, EditError(InvalidArgument)
// for directories and symbolic links and EditError(IOFailure) for any other
// read error.
std::string read_file_bytes(const std::string& path);

// Writes a new version of `target` through a temporary file in the same
// directory. Readers see either the old or the new content, never a
// partial write. The temporary file is removed and its descriptor closed
// on every exit path unless a commit succeeded.
class AtomicWriter {
public:
    // Throws EditError(IOFailure) if the temporary file cannot be created
    explicit AtomicWriter(std::string target);
    ~AtomicWriter();

    AtomicWriter(const AtomicWriter&) = delete;
    AtomicWriter& operator=(const AtomicWriter&) = delete;

    void write(const std::string& bytes);

    // Compare-and-swap: rename over the target only if its current content
    // still hashes to `expected_hash`. EditError(Conflict) otherwise, and
    // EditError(InvalidArgument) if the target is a symbolic link.
    void commit_replace(const std::string& expected_hash);

    // Publish as a new file. EditError(AlreadyExists) if the target appeared.
    void commit_new();

    // Unconditional rename over the target
    void commit();

    const std::string& temp_path() const { return temp_; }

private:
    void sync_and_close();
    void rename_into_place();

    std::string target_;
    std::string temp_;
    int fd_ = -1;
    bool committed_ = false;
};

// Write a whole file atomically, creating parent directories.
// Returns false (and logs) on failure.
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace collab
