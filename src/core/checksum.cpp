/**
 * @file checksum.cpp
 * @brief Implementation of SHA-256 helpers
 */

#include <kcenon/batch_import/core/checksum.h>

#include <openssl/evp.h>

#include <array>
#include <fstream>
#include <memory>

namespace kcenon::batch_import {

namespace {

constexpr std::size_t read_buffer_size = 64 * 1024;

struct md_ctx_deleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, md_ctx_deleter>;

auto digest_to_hex(const unsigned char* digest, unsigned int length) -> std::string {
    static constexpr char hex[] = "0123456789abcdef";
    std::string out;
    out.reserve(length * 2);
    for (unsigned int i = 0; i < length; ++i) {
        out.push_back(hex[digest[i] >> 4]);
        out.push_back(hex[digest[i] & 0x0F]);
    }
    return out;
}

auto new_sha256_context() -> result<md_ctx_ptr> {
    md_ctx_ptr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        return unexpected(error{error_code::internal_error, "failed to allocate digest context"});
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        return unexpected(error{error_code::internal_error, "failed to initialize SHA-256"});
    }
    return result<md_ctx_ptr>(std::move(ctx));
}

auto finish(EVP_MD_CTX* ctx) -> result<std::string> {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx, digest.data(), &length) != 1) {
        return unexpected(error{error_code::internal_error, "failed to finalize SHA-256"});
    }
    return digest_to_hex(digest.data(), length);
}

}  // namespace

auto checksum::sha256_file(const std::filesystem::path& path) -> result<std::string> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return unexpected(
            error{error_code::file_not_found, "cannot open file: " + path.string()});
    }

    auto ctx = new_sha256_context();
    if (!ctx) {
        return unexpected(ctx.error());
    }

    std::array<char, read_buffer_size> buffer{};
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto bytes_read = file.gcount();
        if (bytes_read > 0 &&
            EVP_DigestUpdate(ctx.value().get(), buffer.data(),
                             static_cast<std::size_t>(bytes_read)) != 1) {
            return unexpected(error{error_code::internal_error, "failed to update SHA-256"});
        }
    }
    if (file.bad()) {
        return unexpected(
            error{error_code::file_access_denied, "failed to read file: " + path.string()});
    }

    return finish(ctx.value().get());
}

auto checksum::sha256(std::span<const std::byte> data) -> result<std::string> {
    auto ctx = new_sha256_context();
    if (!ctx) {
        return unexpected(ctx.error());
    }
    if (EVP_DigestUpdate(ctx.value().get(), data.data(), data.size()) != 1) {
        return unexpected(error{error_code::internal_error, "failed to update SHA-256"});
    }
    return finish(ctx.value().get());
}

}  // namespace kcenon::batch_import
