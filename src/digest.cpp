#include "arcwalk/digest.hpp"

#include "arcwalk/constants.hpp"
#include "arcwalk/errors.hpp"

#include <openssl/evp.h>

#include <array>
#include <cstdint>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

namespace arcwalk::digest {

namespace {

struct EVPMDCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept {
        if (ctx) EVP_MD_CTX_free(ctx);
    }
};

using UniqueMDCtx = std::unique_ptr<EVP_MD_CTX, EVPMDCtxDeleter>;

std::string HexEncode(const std::uint8_t* data, std::size_t len) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (std::size_t i = 0; i < len; ++i) {
        out.push_back(kHex[(data[i] >> 4) & 0x0F]);
        out.push_back(kHex[data[i] & 0x0F]);
    }
    return out;
}

}  // namespace

std::string Sha256File(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw ArchiveError("Failed to open file for hashing: " + path.string());
    }
    UniqueMDCtx ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw ArchiveError("Digest context allocation failed");
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw ArchiveError("Digest init failed");
    }
    std::vector<char> buffer(constants::kStreamChunkSize);
    while (input) {
        input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize got = input.gcount();
        if (got > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<std::size_t>(got)) != 1) {
            throw ArchiveError("Digest update failed");
        }
    }
    if (input.bad()) {
        throw ArchiveError("Failed to read file for hashing: " + path.string());
    }
    std::array<std::uint8_t, EVP_MAX_MD_SIZE> out{};
    unsigned int out_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), out.data(), &out_len) != 1) {
        throw ArchiveError("Digest final failed");
    }
    return HexEncode(out.data(), out_len);
}

}  // namespace arcwalk::digest
