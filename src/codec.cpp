#include "codec.hpp"
#include "exception.hpp"
#include "localization.hpp"

#include <openssl/evp.h>

#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <vector>

namespace {

// Custom deleters for OpenSSL contexts
struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const {
        if (ctx) {
            EVP_MD_CTX_free(ctx);
        }
    }
};

struct EvpEncodeCtxDeleter {
    void operator()(EVP_ENCODE_CTX* ctx) const {
        if (ctx) {
            EVP_ENCODE_CTX_free(ctx);
        }
    }
};

using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;
using EvpEncodeCtxPtr = std::unique_ptr<EVP_ENCODE_CTX, EvpEncodeCtxDeleter>;

}

std::string calculate_sha256(const std::filesystem::path& file_path) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file) {
        throw HotpackException(string_format("error.open_file_failed", file_path.string()));
    }

    EvpMdCtxPtr md_ctx(EVP_MD_CTX_new());
    if (!md_ctx) {
        throw HotpackException(get_string("error.openssl_ctx_failed"));
    }

    if (EVP_DigestInit_ex(md_ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw HotpackException(get_string("error.openssl_init_failed"));
    }

    char buffer[8192];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
        if (EVP_DigestUpdate(md_ctx.get(), buffer, static_cast<size_t>(file.gcount())) != 1) {
            throw HotpackException(get_string("error.openssl_update_failed"));
        }
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(md_ctx.get(), hash, &hash_len) != 1) {
        throw HotpackException(get_string("error.openssl_final_failed"));
    }

    std::stringstream ss;
    for (unsigned int i = 0; i < hash_len; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }

    return ss.str();
}

std::string base64_decode(std::string_view encoded) {
    EvpEncodeCtxPtr ctx(EVP_ENCODE_CTX_new());
    if (!ctx) {
        throw HotpackException(get_string("error.openssl_ctx_failed"));
    }
    EVP_DecodeInit(ctx.get());

    // Every 4 input characters decode to at most 3 bytes
    std::vector<unsigned char> out(encoded.size() / 4 * 3 + 3);
    int written = 0;
    if (EVP_DecodeUpdate(ctx.get(), out.data(), &written,
                         reinterpret_cast<const unsigned char*>(encoded.data()),
                         static_cast<int>(encoded.size())) < 0) {
        throw HotpackException(get_string("error.base64_invalid"));
    }
    int tail = 0;
    if (EVP_DecodeFinal(ctx.get(), out.data() + written, &tail) != 1) {
        throw HotpackException(get_string("error.base64_invalid"));
    }
    return std::string(reinterpret_cast<const char*>(out.data()), static_cast<size_t>(written + tail));
}
