#include "FileHasher.hpp"
#include "Utils.hpp"

#include <fstream>
#include <memory>
#include <vector>

#include <openssl/evp.h>

namespace FileHasher {

std::optional<std::string> sha256_file(const std::filesystem::path& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::nullopt;
    }

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        return std::nullopt;
    }

    std::vector<char> buffer(kChunkSize);
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const std::streamsize read = in.gcount();
        if (read > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<std::size_t>(read)) != 1) {
            return std::nullopt;
        }
    }
    if (in.bad()) {
        return std::nullopt;
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_size = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &digest_size) != 1) {
        return std::nullopt;
    }
    return Utils::hex_encode(digest, digest_size);
}

} // namespace FileHasher
