#include "repro/signature.hpp"
#include "repro/platform.hpp"

#include <cstdint>

#include <spdlog/spdlog.h>

namespace repro {

namespace {

// ============================================================================
// PE/COFF Layout
// ============================================================================

// All PE fields are little-endian; they are decoded byte by byte so the
// result does not depend on the host byte order.

constexpr uint16_t DOS_MAGIC = 0x5A4D;        // "MZ"
constexpr uint32_t PE_SIGNATURE = 0x00004550; // "PE\0\0"
constexpr uint16_t PE32_MAGIC = 0x10b;
constexpr uint16_t PE32_PLUS_MAGIC = 0x20b;

constexpr size_t DOS_LFANEW_OFFSET = 60;
constexpr size_t PE_HEADER_SIZE = 24;         // signature + COFF file header
constexpr size_t OPTIONAL_HEADER_SIZE_OFFSET = 20;
constexpr size_t DATA_DIRECTORY_SIZE = 8;

constexpr size_t CHECKSUM_OFFSET = 64;        // same for PE32 and PE32+
constexpr size_t PE32_RVA_COUNT_OFFSET = 92;
constexpr size_t PE32_PLUS_RVA_COUNT_OFFSET = 108;
constexpr uint32_t SECURITY_DIRECTORY = 4;

bool in_bounds(const std::vector<uint8_t>& data, size_t offset, size_t len) {
    return offset <= data.size() && data.size() - offset >= len;
}

bool read_le16(const std::vector<uint8_t>& data, size_t offset, uint16_t& out) {
    if (!in_bounds(data, offset, 2)) return false;
    out = static_cast<uint16_t>(data[offset] | (data[offset + 1] << 8));
    return true;
}

bool read_le32(const std::vector<uint8_t>& data, size_t offset, uint32_t& out) {
    if (!in_bounds(data, offset, 4)) return false;
    out = static_cast<uint32_t>(data[offset]) |
          (static_cast<uint32_t>(data[offset + 1]) << 8) |
          (static_cast<uint32_t>(data[offset + 2]) << 16) |
          (static_cast<uint32_t>(data[offset + 3]) << 24);
    return true;
}

void write_le32(std::vector<uint8_t>& data, size_t offset, uint32_t value) {
    for (size_t i = 0; i < 4; ++i) {
        data[offset + i] = static_cast<uint8_t>(value >> (8 * i));
    }
}

struct DataDirectory {
    uint32_t virtual_address = 0;  // a file offset for the certificate table
    uint32_t size = 0;
};

bool read_directory(const std::vector<uint8_t>& data, size_t offset, DataDirectory& out) {
    return read_le32(data, offset, out.virtual_address) &&
           read_le32(data, offset + 4, out.size);
}

// Offset of the optional header, or 0 if the image is not PE.
// optional_size receives the declared optional header size.
size_t locate_optional_header(const std::vector<uint8_t>& data, uint16_t& optional_size) {
    uint16_t dos_magic = 0;
    uint32_t lfanew = 0;
    if (!read_le16(data, 0, dos_magic) || dos_magic != DOS_MAGIC ||
        !read_le32(data, DOS_LFANEW_OFFSET, lfanew)) {
        return 0;
    }
    uint32_t signature = 0;
    if (!read_le32(data, lfanew, signature) || signature != PE_SIGNATURE ||
        !read_le16(data, static_cast<size_t>(lfanew) + OPTIONAL_HEADER_SIZE_OFFSET,
                   optional_size)) {
        return 0;
    }
    return static_cast<size_t>(lfanew) + PE_HEADER_SIZE;
}

} // namespace

bool is_pe_image(const std::vector<uint8_t>& data) {
    uint16_t optional_size = 0;
    return locate_optional_header(data, optional_size) != 0;
}

// ============================================================================
// Authenticode Stripping
// ============================================================================

StripResult strip_authenticode(const std::vector<uint8_t>& image) {
    StripResult result;

    uint16_t optional_size = 0;
    size_t opt_offset = locate_optional_header(image, optional_size);
    if (opt_offset == 0) {
        result.error = "not a PE image";
        return result;
    }

    uint16_t magic = 0;
    if (!read_le16(image, opt_offset, magic)) {
        result.error = "optional header out of bounds";
        return result;
    }

    size_t rva_count_offset;
    if (magic == PE32_MAGIC) {
        rva_count_offset = PE32_RVA_COUNT_OFFSET;
    } else if (magic == PE32_PLUS_MAGIC) {
        rva_count_offset = PE32_PLUS_RVA_COUNT_OFFSET;
    } else {
        result.error = "unknown optional header magic";
        return result;
    }

    uint32_t rva_count = 0;
    if (!read_le32(image, opt_offset + rva_count_offset, rva_count)) {
        result.error = "optional header truncated";
        return result;
    }

    size_t dir_offset = opt_offset + rva_count_offset + sizeof(uint32_t) +
                        SECURITY_DIRECTORY * DATA_DIRECTORY_SIZE;
    size_t opt_end = opt_offset + optional_size;

    result.data = image;
    write_le32(result.data, opt_offset + CHECKSUM_OFFSET, 0);

    DataDirectory security;
    bool has_entry = rva_count > SECURITY_DIRECTORY &&
                     dir_offset + DATA_DIRECTORY_SIZE <= opt_end &&
                     read_directory(image, dir_offset, security);

    if (!has_entry || (security.virtual_address == 0 && security.size == 0)) {
        result.ok = true;
        return result;
    }

    uint64_t table_start = security.virtual_address;
    uint64_t table_end = table_start + security.size;
    if (table_start < opt_end || table_end > image.size()) {
        result.error = "certificate table out of bounds";
        result.data.clear();
        return result;
    }

    // Signing tools pad the table to an 8-byte boundary
    uint64_t trailing = image.size() - table_end;
    if (trailing >= 8) {
        result.error = "certificate table is not at the end of the file";
        result.data.clear();
        return result;
    }
    for (uint64_t i = table_end; i < image.size(); ++i) {
        if (image[i] != 0) {
            result.error = "unexpected data after certificate table";
            result.data.clear();
            return result;
        }
    }

    result.data.resize(static_cast<size_t>(table_start));
    write_le32(result.data, dir_offset, 0);
    write_le32(result.data, dir_offset + 4, 0);

    result.stripped = true;
    result.ok = true;
    return result;
}

// ============================================================================
// Signed File Normalization
// ============================================================================

NormalizeResult normalize_signed_file(const std::string& path) {
    NormalizeResult result;

    auto read = read_binary_file(path);
    if (!read.ok) {
        result.error = read.error;
        return result;
    }

    auto strip = strip_authenticode(read.data);
    if (!strip.ok) {
        result.warning = "signature strip failed (" + strip.error + "), using original";
        spdlog::warn("{}: {}", path, result.warning);
        result.data = std::move(read.data);
        result.ok = true;
        return result;
    }

    if (strip.stripped) {
        spdlog::debug("{}: removed signature, {} -> {} bytes", path,
                      read.data.size(), strip.data.size());
    }

    result.data = std::move(strip.data);
    result.stripped = strip.stripped;
    result.ok = true;
    return result;
}

} // namespace repro
