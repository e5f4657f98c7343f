#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace repro {

// ============================================================================
// Authenticode Stripping (PE/COFF)
// ============================================================================

struct StripResult {
    bool ok = false;
    std::string error;
    bool stripped = false;      // a certificate table was removed
    std::vector<uint8_t> data;  // normalized image (valid only if ok)
};

// Remove the embedded Authenticode certificate table from a PE image and
// clear the fields signing rewrites (security directory entry, CheckSum).
// Unsigned images come back with only the CheckSum cleared.
StripResult strip_authenticode(const std::vector<uint8_t>& image);

// True if data starts with a DOS header pointing at a "PE\0\0" signature
bool is_pe_image(const std::vector<uint8_t>& data);

// ============================================================================
// Signed File Normalization
// ============================================================================

struct NormalizeResult {
    bool ok = false;            // false only if the file could not be read
    std::string error;
    std::vector<uint8_t> data;  // normalized bytes, or the original bytes
    bool stripped = false;
    std::string warning;        // set when normalization fell back to the original
};

// Read a signed file and strip its signature. Never fails on a malformed
// image: the original bytes are returned together with a warning.
NormalizeResult normalize_signed_file(const std::string& path);

} // namespace repro
