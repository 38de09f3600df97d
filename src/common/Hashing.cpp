#include "../../include/sitewatch/common/Hashing.h"

#include <openssl/evp.h>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace sitewatch::common {

namespace {

using MdContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

std::string digestSha256(const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;
    MdContext ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx ||
        EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &digestLen) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }
    return std::string(reinterpret_cast<const char*>(digest), digestLen);
}

} // namespace

std::string sha256Raw(const std::string& data) {
    return digestSha256(data);
}

std::string sha256Hex(const std::string& data) {
    const std::string digest = digestSha256(data);
    std::ostringstream ss;
    ss << std::hex << std::setfill('0');
    for (unsigned char c : digest) {
        ss << std::setw(2) << static_cast<int>(c);
    }
    return ss.str();
}

std::string base64Encode(const std::string& bytes) {
    if (bytes.empty()) return {};
    std::string out(4 * ((bytes.size() + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                  reinterpret_cast<const unsigned char*>(bytes.data()),
                                  static_cast<int>(bytes.size()));
    out.resize(static_cast<size_t>(written));
    return out;
}

std::string base64Decode(const std::string& text) {
    if (text.empty()) return {};
    if (text.size() % 4 != 0) {
        throw std::invalid_argument("base64 input length must be a multiple of 4");
    }
    std::string out(3 * text.size() / 4, '\0');
    int written = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                  reinterpret_cast<const unsigned char*>(text.data()),
                                  static_cast<int>(text.size()));
    if (written < 0) {
        throw std::invalid_argument("invalid base64 input");
    }
    // EVP_DecodeBlock keeps the zero bytes produced by '=' padding.
    size_t padding = 0;
    if (text[text.size() - 1] == '=') padding++;
    if (text[text.size() - 2] == '=') padding++;
    out.resize(static_cast<size_t>(written) - padding);
    return out;
}

} // namespace sitewatch::common
