#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace repro {

// ============================================================================
// Archive Extraction
// ============================================================================

struct ExtractResult {
    bool ok = false;
    std::string error;
    size_t file_count = 0;   // regular files written (0 if unknown)
    size_t skipped = 0;      // entries not materialized (links, devices)
};

// Unpacks one container file into an existing, empty directory.
class ArchiveExtractor {
public:
    virtual ~ArchiveExtractor() = default;

    virtual ExtractResult extract(const std::string& archive_path,
                                  const std::string& dest_dir) const = 0;

    // Format name for logs and report details ("tar.gz", "jimage", ...)
    virtual std::string name() const = 0;
};

// ============================================================================
// Tar + Gzip (in process)
// ============================================================================

// POSIX ustar reader over a gzip stream. Rejects absolute and traversing
// paths; links and special files are skipped.
class TarGzExtractor : public ArchiveExtractor {
public:
    ExtractResult extract(const std::string& archive_path,
                          const std::string& dest_dir) const override;
    std::string name() const override { return "tar.gz"; }
};

// ============================================================================
// External Tool
// ============================================================================

// Runs an external tool. The argv template may contain "{archive}" and
// "{dir}", substituted per call. Exit status 127 means the tool was not found.
class CommandExtractor : public ArchiveExtractor {
public:
    CommandExtractor(std::string format, std::vector<std::string> argv_template);

    ExtractResult extract(const std::string& archive_path,
                          const std::string& dest_dir) const override;
    std::string name() const override { return format_; }

    const std::vector<std::string>& argv_template() const { return argv_template_; }

    // Substitute placeholders in the template
    std::vector<std::string> build_argv(const std::string& archive_path,
                                        const std::string& dest_dir) const;

private:
    std::string format_;
    std::vector<std::string> argv_template_;
};

// ============================================================================
// Extractor Lookup
// ============================================================================

using ExtractorTable = std::map<std::string, std::vector<std::string>>;

// Built-in command templates ("jimage", "zip", "jar")
const ExtractorTable& builtin_extractor_templates();

// Resolve a container format. Custom templates win over built-ins;
// "tar.gz" and "tgz" map to TarGzExtractor. Returns nullptr if unknown.
std::unique_ptr<ArchiveExtractor> make_extractor(const std::string& format,
                                                 const ExtractorTable& custom = {});

// True if make_extractor would resolve the format
bool is_known_format(const std::string& format, const ExtractorTable& custom = {});

// True for "*.tar.gz" / "*.tgz" file names
bool is_tar_gz_path(const std::string& path);

} // namespace repro
