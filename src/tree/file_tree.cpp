#include "repro/file_tree.hpp"
#include "repro/platform.hpp"

#include <algorithm>
#include <filesystem>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace repro {

// ============================================================================
// FileEntry
// ============================================================================

FileEntry::FileEntry(std::string root, std::string rel_path, uint64_t size)
    : root_(std::move(root)), rel_path_(std::move(rel_path)), size_(size) {}

std::string FileEntry::absolute_path() const {
    return join_path(root_, rel_path_);
}

const HashResult& FileEntry::digest() const {
    if (!digest_) {
        digest_ = compute_sha256(absolute_path());
    }
    return *digest_;
}

// ============================================================================
// ArtifactTree
// ============================================================================

bool ArtifactTree::contains(const std::string& rel_path) const {
    return std::binary_search(paths.begin(), paths.end(), rel_path);
}

std::optional<FileEntry> ArtifactTree::entry(const std::string& rel_path) const {
    if (!contains(rel_path)) {
        return std::nullopt;
    }
    auto size = file_size(join_path(root, rel_path));
    if (!size) {
        return std::nullopt;
    }
    return FileEntry(root, rel_path, *size);
}

ListResult list_artifact_tree(const std::string& name, const std::string& root) {
    ListResult result;
    result.tree.name = name;
    result.tree.root = to_portable_path(root);

    if (!path_exists(root)) {
        result.error = name + " root not found: " + root;
        return result;
    }
    if (!is_directory(root)) {
        result.error = name + " root is not a directory: " + root;
        return result;
    }

    fs::path base_path(root);
    std::error_code ec;
    fs::recursive_directory_iterator it(base_path, fs::directory_options::none, ec);
    if (ec) {
        result.error = "failed to read " + name + " root " + root + ": " + ec.message();
        return result;
    }

    size_t skipped = 0;
    for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            result.error = "failed to walk " + name + " tree: " + ec.message();
            return result;
        }

        const auto& dir_entry = *it;
        std::error_code status_ec;
        if (dir_entry.is_symlink(status_ec) || !dir_entry.is_regular_file(status_ec)) {
            if (!dir_entry.is_directory(status_ec)) {
                ++skipped;
            }
            continue;
        }

        std::string rel = to_portable_path(
            dir_entry.path().lexically_relative(base_path).generic_string());
        result.tree.paths.push_back(std::move(rel));
    }

    if (ec) {
        result.error = "failed to walk " + name + " tree: " + ec.message();
        return result;
    }

    std::sort(result.tree.paths.begin(), result.tree.paths.end());
    result.tree.paths.erase(std::unique(result.tree.paths.begin(), result.tree.paths.end()),
                            result.tree.paths.end());

    if (skipped > 0) {
        spdlog::debug("{}: {} non-regular entries not listed", name, skipped);
    }
    spdlog::debug("{}: listed {} files under {}", name, result.tree.paths.size(), root);

    result.ok = true;
    return result;
}

// ============================================================================
// Tree Digest
// ============================================================================

HashResult compute_tree_digest(const ArtifactTree& tree, unsigned jobs) {
    HashResult result;

    auto digests = hash_files(tree.root, tree.paths, jobs);

    std::string manifest;
    for (size_t i = 0; i < tree.paths.size(); ++i) {
        if (!digests[i].ok) {
            result.error = digests[i].error;
            return result;
        }
        manifest += digests[i].hex_digest;
        manifest += "  ";
        manifest += tree.paths[i];
        manifest += '\n';
    }

    return compute_sha256(std::vector<uint8_t>(manifest.begin(), manifest.end()));
}

} // namespace repro
