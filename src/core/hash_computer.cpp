#include "hash_computer.hpp"
#include <fmt/format.h>
#include <vector>

namespace {

struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

std::string to_hex(const unsigned char* data, unsigned int len) {
    static const char* digits = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (unsigned int i = 0; i < len; i++) {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0F]);
    }
    return out;
}

} // namespace

EvpHashComputer::EvpHashComputer(std::size_t chunk_size)
    : chunk_size_(chunk_size > 0 ? chunk_size : HASH_CHUNK_SIZE) {
}

Result<std::string> EvpHashComputer::compute_hash(ByteStream& stream) const {
    std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx) return Result<std::string>::Err("EVP_MD_CTX_new failed");
    if (EVP_DigestInit_ex(ctx.get(), digest(), nullptr) != 1) {
        return Result<std::string>::Err(fmt::format("{} digest init failed", algorithm_name()));
    }

    std::vector<char> buf(chunk_size_);
    while (true) {
        auto n = stream.read(buf.data(), buf.size());
        if (n.is_err()) {
            return Result<std::string>::Err("read failed: " + n.error);
        }
        if (n.value == 0) break;
        if (EVP_DigestUpdate(ctx.get(), buf.data(), n.value) != 1) {
            return Result<std::string>::Err(fmt::format("{} digest update failed", algorithm_name()));
        }
    }

    auto done = stream.finish();
    if (done.is_err()) {
        return Result<std::string>::Err("read failed: " + done.error);
    }

    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int out_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), out, &out_len) != 1) {
        return Result<std::string>::Err(fmt::format("{} digest final failed", algorithm_name()));
    }
    return Result<std::string>::Ok(to_hex(out, out_len));
}

const EVP_MD* Md5HashComputer::digest() const {
    return EVP_md5();
}

const EVP_MD* Sha256HashComputer::digest() const {
    return EVP_sha256();
}

Result<std::unique_ptr<HashComputer>> make_hash_computer(const std::string& name,
                                                         std::size_t chunk_size) {
    using R = Result<std::unique_ptr<HashComputer>>;
    if (name == "md5") return R::Ok(std::make_unique<Md5HashComputer>(chunk_size));
    if (name == "sha256") return R::Ok(std::make_unique<Sha256HashComputer>(chunk_size));
    return R::Err(fmt::format("unknown hash algorithm '{}' (expected md5 or sha256)", name));
}
