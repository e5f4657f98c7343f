#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace repro {

// ============================================================================
// SHA-256 Hashing
// ============================================================================
//
// Digests are lowercase hex strings (64 chars). A failed hash never aborts a
// comparison: callers treat ok == false as "no digest available" and report
// which file could not be read.

struct HashResult {
    bool ok = false;
    std::string error;
    std::string hex_digest;
};

// Compute SHA-256 hash of data
HashResult compute_sha256(const std::vector<uint8_t>& data);

// Compute SHA-256 hash of a file, streamed in 8 KiB blocks
HashResult compute_sha256(const std::string& file_path);

// ============================================================================
// Batch Hashing
// ============================================================================

// Hash each relative path under root using up to `jobs` worker threads.
// results[i] corresponds to rel_paths[i]. Returns after every worker has
// finished, so callers can consume all digests immediately.
std::vector<HashResult> hash_files(const std::string& root,
                                   const std::vector<std::string>& rel_paths,
                                   unsigned jobs = 1);

} // namespace repro
