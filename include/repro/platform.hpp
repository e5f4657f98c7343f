#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace repro {

// ============================================================================
// Atomic File Operations
// ============================================================================

struct AtomicWriteResult {
    bool ok = false;
    std::string error;
};

// Write content atomically using temp file + fsync + rename + fsync(dir)
AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content);

// ============================================================================
// File Reading
// ============================================================================

struct ReadResult {
    bool ok = false;
    std::string error;
    std::vector<uint8_t> data;
};

// Read a whole file into memory
ReadResult read_binary_file(const std::string& path);

// ============================================================================
// Path Utilities
// ============================================================================

// Convert a path to use forward slashes (portable format).
// All relative paths handed between components use forward slashes.
std::string to_portable_path(const std::string& path);

// Get the directory containing a file path
std::string get_parent_directory(const std::string& path);

// Get the filename from a path
std::string get_filename(const std::string& path);

// Join path components
std::string join_path(const std::string& base, const std::string& rel);

bool path_exists(const std::string& path);
bool is_directory(const std::string& path);
bool is_regular_file(const std::string& path);

// Size in bytes, nullopt if the path is not a readable regular file
std::optional<uint64_t> file_size(const std::string& path);

// Create directories recursively
bool create_directories(const std::string& path);

// True if path ends with suffix (case-sensitive)
bool ends_with(const std::string& path, const std::string& suffix);

// ============================================================================
// Scratch Directories
// ============================================================================

// A uniquely named directory under the system temp dir, exclusively owned by
// one run. Removed recursively on destruction, whatever the outcome.
class ScratchDirectory {
public:
    explicit ScratchDirectory(const std::string& label);
    ~ScratchDirectory();

    ScratchDirectory(const ScratchDirectory&) = delete;
    ScratchDirectory& operator=(const ScratchDirectory&) = delete;

    const std::string& path() const { return path_; }
    bool ok() const { return ok_; }
    const std::string& error() const { return error_; }

private:
    std::string path_;
    bool ok_ = false;
    std::string error_;
};

// ============================================================================
// Environment
// ============================================================================

// Get an environment variable
std::optional<std::string> get_env(const std::string& name);

// Get current timestamp as "YYYY-MM-DDTHH:MM:SS+0000" (UTC)
std::string get_current_timestamp();

// Generate a UUID string
std::string generate_uuid();

} // namespace repro
