#include "repro/archive.hpp"
#include "repro/platform.hpp"

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <system_error>

#include <spdlog/spdlog.h>
#include <zlib.h>

namespace fs = std::filesystem;

namespace repro {

namespace {

// ============================================================================
// Tar Format Constants (POSIX ustar)
// ============================================================================

constexpr size_t TAR_BLOCK_SIZE = 512;
constexpr size_t TAR_NAME_SIZE = 100;
constexpr size_t TAR_MODE_SIZE = 8;
constexpr size_t TAR_SIZE_SIZE = 12;
constexpr size_t TAR_CHKSUM_SIZE = 8;
constexpr size_t TAR_PREFIX_SIZE = 155;

// Tar type flags
constexpr char TAR_REGTYPE = '0';
constexpr char TAR_AREGTYPE = '\0';
constexpr char TAR_CONTTYPE = '7';
constexpr char TAR_DIRTYPE = '5';
constexpr char TAR_GNU_LONGNAME = 'L';
constexpr char TAR_PAX_HEADER = 'x';
constexpr char TAR_PAX_GLOBAL = 'g';

// ============================================================================
// Tar Header Structure
// ============================================================================

#pragma pack(push, 1)
struct TarHeader {
    char name[TAR_NAME_SIZE];       // 0
    char mode[TAR_MODE_SIZE];       // 100
    char uid[8];                    // 108
    char gid[8];                    // 116
    char size[TAR_SIZE_SIZE];       // 124
    char mtime[12];                 // 136
    char chksum[TAR_CHKSUM_SIZE];   // 148
    char typeflag;                  // 156
    char linkname[100];             // 157
    char magic[6];                  // 257
    char version[2];                // 263
    char uname[32];                 // 265
    char gname[32];                 // 297
    char devmajor[8];               // 329
    char devminor[8];               // 337
    char prefix[TAR_PREFIX_SIZE];   // 345
    char padding[12];               // 500
};
#pragma pack(pop)

static_assert(sizeof(TarHeader) == TAR_BLOCK_SIZE, "TarHeader must be 512 bytes");

uint64_t parse_octal(const char* data, size_t size) {
    uint64_t result = 0;
    size_t i = 0;
    while (i < size && data[i] == ' ') ++i;
    for (; i < size && data[i] != '\0' && data[i] != ' '; ++i) {
        if (data[i] >= '0' && data[i] <= '7') {
            result = (result << 3) | static_cast<uint64_t>(data[i] - '0');
        }
    }
    return result;
}

bool checksum_valid(const TarHeader& header) {
    const auto* bytes = reinterpret_cast<const uint8_t*>(&header);
    uint32_t sum = 0;
    for (size_t i = 0; i < sizeof(TarHeader); ++i) {
        // Checksum field is treated as spaces during calculation
        sum += (i >= 148 && i < 156) ? static_cast<uint32_t>(' ') : bytes[i];
    }
    return sum == parse_octal(header.chksum, TAR_CHKSUM_SIZE);
}

bool is_zero_block(const uint8_t* block) {
    for (size_t i = 0; i < TAR_BLOCK_SIZE; ++i) {
        if (block[i] != 0) return false;
    }
    return true;
}

// ============================================================================
// Gzip Stream
// ============================================================================

// RAII wrapper for gzFile. Plain (uncompressed) input is read transparently.
class GzReader {
public:
    explicit GzReader(const std::string& path) : file_(gzopen(path.c_str(), "rb")) {}
    ~GzReader() { if (file_) gzclose(file_); }

    GzReader(const GzReader&) = delete;
    GzReader& operator=(const GzReader&) = delete;

    explicit operator bool() const { return file_ != nullptr; }

    // Read up to len bytes; returns bytes read, or -1 on a stream error
    int64_t read(void* buf, size_t len) {
        size_t total = 0;
        auto* out = static_cast<uint8_t*>(buf);
        while (total < len) {
            unsigned chunk = static_cast<unsigned>(std::min<size_t>(len - total, 1u << 20));
            int n = gzread(file_, out + total, chunk);
            if (n < 0) {
                int errnum = 0;
                const char* msg = gzerror(file_, &errnum);
                error_ = msg ? msg : "gzip stream error";
                return -1;
            }
            if (n == 0) break;
            total += static_cast<size_t>(n);
        }
        return static_cast<int64_t>(total);
    }

    bool read_exact(void* buf, size_t len) {
        int64_t n = read(buf, len);
        if (n < 0) return false;
        if (static_cast<size_t>(n) != len) {
            error_ = "unexpected end of archive";
            return false;
        }
        return true;
    }

    bool skip(uint64_t len) {
        uint8_t buffer[TAR_BLOCK_SIZE * 16];
        while (len > 0) {
            size_t chunk = static_cast<size_t>(std::min<uint64_t>(len, sizeof(buffer)));
            if (!read_exact(buffer, chunk)) return false;
            len -= chunk;
        }
        return true;
    }

    const std::string& error() const { return error_; }

private:
    gzFile file_;
    std::string error_;
};

uint64_t padded_size(uint64_t size) {
    return ((size + TAR_BLOCK_SIZE - 1) / TAR_BLOCK_SIZE) * TAR_BLOCK_SIZE;
}

// ============================================================================
// Path Safety
// ============================================================================

struct PathValidation {
    bool safe = false;
    std::string error;
    std::string normalized_path;
};

PathValidation validate_extraction_path(const std::string& entry_path,
                                        const std::string& extraction_root) {
    PathValidation result;

    // Reject absolute paths
    if (!entry_path.empty() && (entry_path[0] == '/' || entry_path[0] == '\\')) {
        result.error = "absolute path not allowed: " + entry_path;
        return result;
    }

    // Normalize path and check for traversal
    fs::path normalized;
    for (const auto& component : fs::path(entry_path)) {
        std::string comp = component.string();
        if (comp == "..") {
            result.error = "path traversal not allowed: " + entry_path;
            return result;
        }
        if (comp != "." && !comp.empty()) {
            normalized /= comp;
        }
    }

    // Verify the path stays within extraction root
    std::error_code ec;
    fs::path canonical_root = fs::weakly_canonical(extraction_root, ec);
    if (ec) {
        result.error = "cannot resolve extraction root: " + ec.message();
        return result;
    }
    fs::path canonical_full = fs::weakly_canonical(fs::path(extraction_root) / normalized, ec);
    if (ec) {
        result.error = "cannot resolve entry path: " + ec.message();
        return result;
    }
    if (canonical_full.string().rfind(canonical_root.string(), 0) != 0) {
        result.error = "path escapes extraction root: " + entry_path;
        return result;
    }

    result.safe = true;
    result.normalized_path = normalized.generic_string();
    return result;
}

// "<len> <key>=<value>\n" records; returns the value of "path", if any
std::string pax_path(const std::string& records) {
    size_t pos = 0;
    while (pos < records.size()) {
        size_t space = records.find(' ', pos);
        if (space == std::string::npos) break;
        size_t len = static_cast<size_t>(std::strtoul(records.c_str() + pos, nullptr, 10));
        if (len == 0 || pos + len > records.size()) break;

        std::string record = records.substr(space + 1, pos + len - space - 1);
        if (!record.empty() && record.back() == '\n') record.pop_back();
        auto eq = record.find('=');
        if (eq != std::string::npos && record.compare(0, eq, "path") == 0) {
            return record.substr(eq + 1);
        }
        pos += len;
    }
    return "";
}

bool read_string_payload(GzReader& in, uint64_t size, std::string& out) {
    out.assign(static_cast<size_t>(size), '\0');
    if (size > 0 && !in.read_exact(&out[0], out.size())) return false;
    out.resize(strnlen(out.c_str(), out.size()));
    return in.skip(padded_size(size) - size);
}

void set_mode(const std::string& path, uint64_t mode) {
    std::error_code ec;
    if ((mode & 0111) != 0) {
        fs::permissions(path, fs::perms::owner_all | fs::perms::group_read |
                        fs::perms::group_exec | fs::perms::others_read |
                        fs::perms::others_exec, ec);
    } else {
        fs::permissions(path, fs::perms::owner_read | fs::perms::owner_write |
                        fs::perms::group_read | fs::perms::others_read, ec);
    }
}

} // namespace

// ============================================================================
// TarGzExtractor
// ============================================================================

ExtractResult TarGzExtractor::extract(const std::string& archive_path,
                                      const std::string& dest_dir) const {
    ExtractResult result;

    if (!is_regular_file(archive_path)) {
        result.error = "archive not found: " + archive_path;
        return result;
    }

    GzReader in(archive_path);
    if (!in) {
        result.error = "failed to open archive: " + archive_path;
        return result;
    }

    if (!create_directories(dest_dir)) {
        result.error = "failed to create directory: " + dest_dir;
        return result;
    }

    std::string long_name;
    bool seen_entry = false;
    std::vector<char> buffer(64 * 1024);

    while (true) {
        TarHeader header;
        int64_t n = in.read(&header, sizeof(header));
        if (n < 0) {
            result.error = "failed to decompress archive: " + in.error();
            return result;
        }
        if (n == 0 && seen_entry) break;  // end of stream without end marker
        if (static_cast<size_t>(n) != sizeof(header)) {
            result.error = seen_entry ? "truncated archive" : "empty or truncated archive";
            return result;
        }
        if (is_zero_block(reinterpret_cast<const uint8_t*>(&header))) break;

        if (!checksum_valid(header)) {
            result.error = "invalid tar header checksum";
            return result;
        }
        seen_entry = true;

        uint64_t size = parse_octal(header.size, TAR_SIZE_SIZE);
        char typeflag = header.typeflag;

        if (typeflag == TAR_GNU_LONGNAME || typeflag == TAR_PAX_HEADER) {
            std::string payload;
            if (!read_string_payload(in, size, payload)) {
                result.error = "truncated archive: " + in.error();
                return result;
            }
            long_name = typeflag == TAR_GNU_LONGNAME ? payload : pax_path(payload);
            continue;
        }
        if (typeflag == TAR_PAX_GLOBAL) {
            if (!in.skip(padded_size(size))) {
                result.error = "truncated archive: " + in.error();
                return result;
            }
            continue;
        }

        std::string path;
        if (!long_name.empty()) {
            path = long_name;
            long_name.clear();
        } else {
            if (header.prefix[0] != '\0') {
                path = std::string(header.prefix, strnlen(header.prefix, TAR_PREFIX_SIZE));
                path += '/';
            }
            path += std::string(header.name, strnlen(header.name, TAR_NAME_SIZE));
        }

        while (!path.empty() && path.back() == '/') {
            path.pop_back();
        }
        while (path.rfind("./", 0) == 0) {
            path = path.substr(2);
        }

        bool regular = typeflag == TAR_REGTYPE || typeflag == TAR_AREGTYPE ||
                       typeflag == TAR_CONTTYPE;

        if (path.empty() || path == ".") {
            if (!in.skip(regular ? padded_size(size) : 0)) {
                result.error = "truncated archive: " + in.error();
                return result;
            }
            continue;
        }

        auto validation = validate_extraction_path(path, dest_dir);
        if (!validation.safe) {
            result.error = validation.error;
            return result;
        }
        std::string full_path = join_path(dest_dir, validation.normalized_path);

        if (typeflag == TAR_DIRTYPE) {
            if (!create_directories(full_path)) {
                result.error = "failed to create directory: " + path;
                return result;
            }
            continue;
        }

        if (!regular) {
            spdlog::warn("{}: skipping non-regular entry '{}' (type '{}')",
                         get_filename(archive_path), path, typeflag);
            ++result.skipped;
            // Links and devices carry no payload, but honor a declared size
            if (!in.skip(padded_size(size))) {
                result.error = "truncated archive: " + in.error();
                return result;
            }
            continue;
        }

        std::string parent = get_parent_directory(full_path);
        if (!parent.empty() && !create_directories(parent)) {
            result.error = "failed to create parent directory for: " + path;
            return result;
        }

        std::ofstream file(full_path, std::ios::binary | std::ios::trunc);
        if (!file) {
            result.error = "failed to create file: " + path;
            return result;
        }

        uint64_t remaining = size;
        while (remaining > 0) {
            size_t chunk = static_cast<size_t>(std::min<uint64_t>(remaining, buffer.size()));
            if (!in.read_exact(buffer.data(), chunk)) {
                result.error = "truncated archive: " + path;
                return result;
            }
            file.write(buffer.data(), static_cast<std::streamsize>(chunk));
            remaining -= chunk;
        }
        file.close();
        if (!file) {
            result.error = "failed to write file: " + path;
            return result;
        }

        if (!in.skip(padded_size(size) - size)) {
            result.error = "truncated archive: " + path;
            return result;
        }

        set_mode(full_path, parse_octal(header.mode, TAR_MODE_SIZE));
        ++result.file_count;
    }

    spdlog::debug("extracted {} files from {}", result.file_count, archive_path);
    result.ok = true;
    return result;
}

bool is_tar_gz_path(const std::string& path) {
    return ends_with(path, ".tar.gz") || ends_with(path, ".tgz");
}

} // namespace repro
