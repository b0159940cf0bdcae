// Copyright (c) 2026 changcheng967. All rights reserved.

#include <scribe/disk/checksum.hpp>
#include <openssl/evp.h>
#include <fstream>
#include <memory>
#include <vector>

namespace scribe::disk {

namespace {

struct DigestCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};

using DigestCtx = std::unique_ptr<EVP_MD_CTX, DigestCtxDeleter>;

std::string to_hex(const unsigned char* digest, unsigned int length) {
    static constexpr char HEX[] = "0123456789abcdef";
    std::string out;
    out.reserve(length * 2);
    for (unsigned int i = 0; i < length; ++i) {
        out += HEX[digest[i] >> 4];
        out += HEX[digest[i] & 0x0F];
    }
    return out;
}

std::expected<DigestCtx, std::error_code> begin_sha256() noexcept {
    DigestCtx ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        return std::unexpected(make_error_code(DiskErrc::digest_error));
    }
    return ctx;
}

std::expected<std::string, std::error_code> finish(EVP_MD_CTX* ctx) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx, digest, &length) != 1) {
        return std::unexpected(make_error_code(DiskErrc::digest_error));
    }
    return to_hex(digest, length);
}

} // namespace

std::expected<std::string, std::error_code>
sha256_file(std::string_view path) noexcept {
    try {
        std::ifstream file{std::string(path), std::ios::binary};
        if (!file) {
            return std::unexpected(make_error_code(DiskErrc::file_not_found));
        }

        auto ctx = begin_sha256();
        if (!ctx) {
            return std::unexpected(ctx.error());
        }

        std::vector<char> buffer(DIGEST_BUFFER_SIZE);
        while (file) {
            file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            auto got = file.gcount();
            if (got > 0 && EVP_DigestUpdate(ctx->get(), buffer.data(), static_cast<std::size_t>(got)) != 1) {
                return std::unexpected(make_error_code(DiskErrc::digest_error));
            }
        }
        if (file.bad()) {
            return std::unexpected(make_error_code(DiskErrc::read_error));
        }

        return finish(ctx->get());
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(DiskErrc::read_error));
    }
}

std::expected<std::string, std::error_code>
sha256_hex(std::span<const std::byte> data) noexcept {
    try {
        auto ctx = begin_sha256();
        if (!ctx) {
            return std::unexpected(ctx.error());
        }
        if (!data.empty() && EVP_DigestUpdate(ctx->get(), data.data(), data.size()) != 1) {
            return std::unexpected(make_error_code(DiskErrc::digest_error));
        }
        return finish(ctx->get());
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(DiskErrc::digest_error));
    }
}

} // namespace scribe::disk
