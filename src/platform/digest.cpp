#include "digest.hpp"
#include <core/constants.hpp>
#include <openssl/evp.h>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <vector>

namespace fs = std::filesystem;

namespace platform {

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

MdCtxPtr new_md5_ctx() {
    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) throw std::runtime_error("Failed to allocate digest context");
    if (EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1) {
        throw std::runtime_error("MD5 digest unavailable in this OpenSSL build");
    }
    return ctx;
}

std::string finish_hex(EVP_MD_CTX* ctx) {
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx, md, &len) != 1) {
        throw std::runtime_error("MD5 finalization failed");
    }
    static const char HEX[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (unsigned int i = 0; i < len; ++i) {
        out += HEX[(md[i] >> 4) & 0x0F];
        out += HEX[md[i] & 0x0F];
    }
    return out;
}

} // namespace

std::string md5_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Cannot open file for hashing: " + path.string());
    }

    auto ctx = new_md5_ctx();
    std::vector<char> buf(ARCHIVE_BUF_SIZE);
    while (in.read(buf.data(), static_cast<std::streamsize>(buf.size())) || in.gcount() > 0) {
        EVP_DigestUpdate(ctx.get(), buf.data(), static_cast<size_t>(in.gcount()));
    }
    if (in.bad()) {
        throw std::runtime_error("Error reading file: " + path.string());
    }
    return finish_hex(ctx.get());
}

std::string md5_hex(const std::string& data) {
    auto ctx = new_md5_ctx();
    EVP_DigestUpdate(ctx.get(), data.data(), data.size());
    return finish_hex(ctx.get());
}

bool md5_available() {
    try {
        new_md5_ctx();
        return true;
    } catch (const std::runtime_error&) {
        return false;
    }
}

} // namespace platform
