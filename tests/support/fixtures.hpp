#pragma once

#include <repro/platform.hpp>

#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <zlib.h>

namespace repro::test {

namespace fs = std::filesystem;

// Helper to create temporary directory
class TempDir {
public:
    TempDir() {
        path_ = fs::temp_directory_path() / ("repro_test_" + generate_uuid());
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    std::string path() const { return path_.generic_string(); }
    std::string sub(const std::string& rel) const { return (path_ / rel).generic_string(); }

private:
    fs::path path_;
};

inline void write_file(const std::string& path, const std::string& content) {
    fs::create_directories(fs::path(path).parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline void write_bytes(const std::string& path, const std::vector<uint8_t>& content) {
    fs::create_directories(fs::path(path).parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(content.data()),
              static_cast<std::streamsize>(content.size()));
}

// ============================================================================
// Tar.gz Fixtures
// ============================================================================

struct TarFixtureEntry {
    std::string path;
    std::string data;
    char typeflag = '0';
    std::string linkname;
};

inline void write_octal(char* dest, size_t size, uint64_t value) {
    size_t digits = size - 1;
    dest[digits] = '\0';
    for (size_t i = digits; i > 0; --i) {
        dest[i - 1] = static_cast<char>('0' + (value & 7));
        value >>= 3;
    }
}

// 512-byte ustar header block
inline std::vector<char> make_tar_header(const TarFixtureEntry& entry) {
    std::vector<char> header(512, '\0');
    std::strncpy(&header[0], entry.path.c_str(), 99);
    write_octal(&header[100], 8, entry.typeflag == '5' ? 0755 : 0644);
    write_octal(&header[108], 8, 0);
    write_octal(&header[116], 8, 0);
    bool has_payload = entry.typeflag == '0' || entry.typeflag == 'x';
    write_octal(&header[124], 12, has_payload ? entry.data.size() : 0);
    write_octal(&header[136], 12, 0);
    header[156] = entry.typeflag;
    std::strncpy(&header[157], entry.linkname.c_str(), 99);
    std::memcpy(&header[257], "ustar", 5);
    header[263] = '0';
    header[264] = '0';

    uint32_t sum = 0;
    for (size_t i = 0; i < 512; ++i) {
        sum += (i >= 148 && i < 156) ? ' ' : static_cast<uint8_t>(header[i]);
    }
    char chksum[8];
    std::snprintf(chksum, sizeof(chksum), "%06o", sum);
    std::memcpy(&header[148], chksum, 6);
    header[154] = '\0';
    header[155] = ' ';
    return header;
}

// Write a gzip-compressed tar archive
inline bool write_tar_gz(const std::string& path, const std::vector<TarFixtureEntry>& entries) {
    fs::create_directories(fs::path(path).parent_path());
    gzFile out = gzopen(path.c_str(), "wb");
    if (!out) return false;

    for (const auto& entry : entries) {
        auto header = make_tar_header(entry);
        gzwrite(out, header.data(), 512);
        if (entry.typeflag == '0' && !entry.data.empty()) {
            gzwrite(out, entry.data.data(), static_cast<unsigned>(entry.data.size()));
            size_t pad = (512 - entry.data.size() % 512) % 512;
            std::vector<char> zeros(pad, '\0');
            if (pad > 0) gzwrite(out, zeros.data(), static_cast<unsigned>(pad));
        }
    }
    std::vector<char> end(1024, '\0');
    gzwrite(out, end.data(), 1024);
    return gzclose(out) == Z_OK;
}

// Single regular file whose name travels in a pax extended header
inline bool write_pax_tar_gz(const std::string& path, const std::string& long_path,
                             const std::string& data) {
    std::string body = " path=" + long_path + "\n";
    size_t len = body.size() + 1;
    while (std::to_string(len).size() + body.size() != len) {
        len = std::to_string(len).size() + body.size();
    }
    std::string record = std::to_string(len) + body;

    TarFixtureEntry pax{"PaxHeaders/entry", record, 'x', ""};
    auto pax_header = make_tar_header(pax);

    fs::create_directories(fs::path(path).parent_path());
    gzFile out = gzopen(path.c_str(), "wb");
    if (!out) return false;

    auto write_padded = [&](const std::string& payload) {
        gzwrite(out, payload.data(), static_cast<unsigned>(payload.size()));
        size_t pad = (512 - payload.size() % 512) % 512;
        std::vector<char> zeros(pad, '\0');
        if (pad > 0) gzwrite(out, zeros.data(), static_cast<unsigned>(pad));
    };

    gzwrite(out, pax_header.data(), 512);
    write_padded(record);

    auto header = make_tar_header({"placeholder", data, '0', ""});
    gzwrite(out, header.data(), 512);
    write_padded(data);

    std::vector<char> end(1024, '\0');
    gzwrite(out, end.data(), 1024);
    return gzclose(out) == Z_OK;
}

// ============================================================================
// PE Fixtures
// ============================================================================

// PE fields are little-endian on every host
inline void put_le(std::vector<uint8_t>& image, size_t offset, uint32_t value, size_t width) {
    for (size_t i = 0; i < width; ++i) {
        image[offset + i] = static_cast<uint8_t>(value >> (8 * i));
    }
}

// Minimal PE32+ image: DOS header, PE header, optional header with 16 data
// directories, and some body bytes. No sections are needed by the stripper.
inline std::vector<uint8_t> make_pe_image(const std::string& body, uint32_t checksum = 0x1234) {
    const size_t pe_offset = 0x80;
    const size_t opt_size = 240;  // PE32+ optional header with 16 directories
    std::vector<uint8_t> image(pe_offset + 24 + opt_size, 0);

    image[0] = 'M';
    image[1] = 'Z';
    put_le(image, 0x3C, static_cast<uint32_t>(pe_offset), 4);

    std::memcpy(&image[pe_offset], "PE\0\0", 4);
    put_le(image, pe_offset + 4, 0x8664, 2);
    put_le(image, pe_offset + 20, static_cast<uint32_t>(opt_size), 2);

    size_t opt = pe_offset + 24;
    put_le(image, opt, 0x20b, 2);
    put_le(image, opt + 64, checksum, 4);
    put_le(image, opt + 108, 16, 4);

    image.insert(image.end(), body.begin(), body.end());
    return image;
}

// Append an 8-byte aligned certificate table and point directory 4 at it
inline std::vector<uint8_t> sign_pe_image(std::vector<uint8_t> image, const std::string& cert,
                                          uint32_t checksum = 0xBEEF) {
    while (image.size() % 8 != 0) image.push_back(0);
    uint32_t offset = static_cast<uint32_t>(image.size());

    std::string table = cert;
    while (table.size() % 8 != 0) table.push_back('\0');
    image.insert(image.end(), table.begin(), table.end());

    size_t opt = 0x80 + 24;
    put_le(image, opt + 112 + 4 * 8, offset, 4);
    put_le(image, opt + 112 + 4 * 8 + 4, static_cast<uint32_t>(table.size()), 4);
    put_le(image, opt + 64, checksum, 4);
    return image;
}

} // namespace repro::test
