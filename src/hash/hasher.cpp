#include "repro/hasher.hpp"
#include "repro/platform.hpp"

#include <algorithm>
#include <atomic>
#include <fstream>
#include <system_error>
#include <thread>

#include <openssl/evp.h>
#include <spdlog/spdlog.h>

namespace repro {

// ============================================================================
// SHA-256 Implementation (using OpenSSL 3.0+ EVP API)
// ============================================================================

namespace {

// RAII wrapper for EVP_MD_CTX
class EvpMdCtx {
public:
    EvpMdCtx() : ctx_(EVP_MD_CTX_new()) {}
    ~EvpMdCtx() { if (ctx_) EVP_MD_CTX_free(ctx_); }

    EvpMdCtx(const EvpMdCtx&) = delete;
    EvpMdCtx& operator=(const EvpMdCtx&) = delete;

    EVP_MD_CTX* get() { return ctx_; }
    explicit operator bool() const { return ctx_ != nullptr; }

private:
    EVP_MD_CTX* ctx_;
};

std::string bytes_to_hex(const unsigned char* data, size_t len) {
    static const char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        result.push_back(hex_chars[(data[i] >> 4) & 0x0F]);
        result.push_back(hex_chars[data[i] & 0x0F]);
    }
    return result;
}

bool finish_digest(EvpMdCtx& ctx, HashResult& result) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    if (EVP_DigestFinal_ex(ctx.get(), hash, &hash_len) != 1) {
        result.error = "EVP_DigestFinal_ex failed";
        return false;
    }

    result.hex_digest = bytes_to_hex(hash, hash_len);
    result.ok = true;
    return true;
}

} // namespace

HashResult compute_sha256(const std::vector<uint8_t>& data) {
    HashResult result;

    EvpMdCtx ctx;
    if (!ctx) {
        result.error = "EVP_MD_CTX_new failed";
        return result;
    }

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        result.error = "EVP_DigestInit_ex failed";
        return result;
    }

    if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        result.error = "EVP_DigestUpdate failed";
        return result;
    }

    finish_digest(ctx, result);
    return result;
}

HashResult compute_sha256(const std::string& file_path) {
    HashResult result;

    if (!is_regular_file(file_path)) {
        result.error = "no such file: " + file_path;
        return result;
    }

    std::ifstream file(file_path, std::ios::binary);
    if (!file) {
        result.error = "failed to open file: " + file_path;
        return result;
    }

    EvpMdCtx ctx;
    if (!ctx) {
        result.error = "EVP_MD_CTX_new failed";
        return result;
    }

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        result.error = "EVP_DigestInit_ex failed";
        return result;
    }

    char buffer[8192];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
        if (EVP_DigestUpdate(ctx.get(), buffer, static_cast<size_t>(file.gcount())) != 1) {
            result.error = "EVP_DigestUpdate failed";
            return result;
        }
    }

    if (file.bad()) {
        result.error = "failed to read file: " + file_path;
        return result;
    }

    finish_digest(ctx, result);
    return result;
}

// ============================================================================
// Batch Hashing
// ============================================================================

std::vector<HashResult> hash_files(const std::string& root,
                                   const std::vector<std::string>& rel_paths,
                                   unsigned jobs) {
    std::vector<HashResult> results(rel_paths.size());
    if (rel_paths.empty()) {
        return results;
    }

    size_t workers = std::min<size_t>(std::max(jobs, 1u), rel_paths.size());
    unsigned cores = std::thread::hardware_concurrency();
    if (cores > 0) {
        workers = std::min<size_t>(workers, cores);
    }

    if (workers == 1) {
        for (size_t i = 0; i < rel_paths.size(); ++i) {
            results[i] = compute_sha256(join_path(root, rel_paths[i]));
        }
        return results;
    }

    // Each slot is written by exactly one worker; join() is the barrier.
    std::atomic<size_t> next{0};
    std::vector<std::thread> pool;
    pool.reserve(workers);

    auto work = [&]() {
        for (size_t i = next.fetch_add(1); i < rel_paths.size(); i = next.fetch_add(1)) {
            results[i] = compute_sha256(join_path(root, rel_paths[i]));
        }
    };

    for (size_t w = 0; w < workers; ++w) {
        try {
            pool.emplace_back(work);
        } catch (const std::system_error& e) {
            // Workers already running drain the remaining indices
            spdlog::warn("started {} of {} hashing threads: {}", pool.size(), workers, e.what());
            break;
        }
    }
    if (pool.empty()) {
        work();
    }

    for (auto& t : pool) {
        t.join();
    }

    return results;
}

} // namespace repro
