#pragma once

#include "repro/hasher.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace repro {

// ============================================================================
// File Entry
// ============================================================================

// A regular file inside an artifact tree. The digest is computed on first
// request only; listing a tree never hashes anything.
class FileEntry {
public:
    FileEntry(std::string root, std::string rel_path, uint64_t size);

    const std::string& path() const { return rel_path_; }
    std::string absolute_path() const;
    uint64_t size() const { return size_; }

    // SHA-256 of the file content, computed lazily and cached
    const HashResult& digest() const;
    bool has_digest() const { return digest_.has_value(); }

private:
    std::string root_;
    std::string rel_path_;
    uint64_t size_ = 0;
    mutable std::optional<HashResult> digest_;
};

// ============================================================================
// Artifact Tree
// ============================================================================

// A named root plus its sorted, duplicate-free relative file paths.
// Rebuilt for every comparison run.
struct ArtifactTree {
    std::string name;               // "built", "official", "built:modules", ...
    std::string root;
    std::vector<std::string> paths; // forward slashes, strictly increasing

    size_t size() const { return paths.size(); }
    bool contains(const std::string& rel_path) const;

    // Build a FileEntry for a listed path; nullopt if not listed or unreadable
    std::optional<FileEntry> entry(const std::string& rel_path) const;
};

struct ListResult {
    bool ok = false;
    std::string error;
    ArtifactTree tree;
};

// List every regular file below root (symlinks and special files are not
// followed or listed). Paths are relative, use '/', sorted byte-wise.
ListResult list_artifact_tree(const std::string& name, const std::string& root);

// ============================================================================
// Tree Digest
// ============================================================================

// SHA-256 over the sha256sum-style manifest of the tree:
//   "<hex digest>  <relative path>\n" for every path in sorted order.
// Used as the whole-artifact hash when no release bundle is available.
HashResult compute_tree_digest(const ArtifactTree& tree, unsigned jobs = 1);

} // namespace repro
