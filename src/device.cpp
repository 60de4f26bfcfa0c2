#include "hwident/device.hpp"

#include "platform.hpp"

#include <openssl/evp.h>
#include <openssl/sha.h>

#include <iomanip>
#include <sstream>

#if defined(HWIDENT_PLATFORM_WINDOWS)
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace hwident {
namespace device {

namespace {

// Hash a string using SHA-256 and return hex string
std::string sha256_hex(const std::string& input) {
    if (input.empty()) {
        return "";
    }

    unsigned char hash[SHA256_DIGEST_LENGTH];
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();

    if (ctx == nullptr) {
        return "";
    }

    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx);
        return "";
    }

    if (EVP_DigestUpdate(ctx, input.c_str(), input.length()) != 1) {
        EVP_MD_CTX_free(ctx);
        return "";
    }

    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx, hash, &len) != 1) {
        EVP_MD_CTX_free(ctx);
        return "";
    }

    EVP_MD_CTX_free(ctx);

    std::ostringstream ss;
    for (unsigned int i = 0; i < len; i++) {
        ss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(hash[i]);
    }

    return ss.str();
}

// One "key=value" line per identifier, in key order
std::string canonical_form(const Identifiers& identifiers, const std::string& prefix) {
    std::string out;
    for (const auto& [key, value] : identifiers) {
        out += prefix + key + "=" + value + "\n";
    }
    return out;
}

}  // namespace

std::string fingerprint(const IdentifierResult& result) {
    std::string canonical = result.identifiers.empty()
                                ? canonical_form(result.fallback, "fallback.")
                                : canonical_form(result.identifiers, "");

    std::string hash = sha256_hex(canonical);

    // First 32 chars (128 bits) are plenty for an identifier
    if (hash.length() > 32) {
        return hash.substr(0, 32);
    }

    return hash;
}

std::string get_platform_name() {
#if defined(HWIDENT_PLATFORM_MACOS)
    return "macos";
#elif defined(HWIDENT_PLATFORM_LINUX)
    return "linux";
#elif defined(HWIDENT_PLATFORM_WINDOWS)
    return "windows";
#else
    return "unknown";
#endif
}

std::string get_hostname() {
#if defined(HWIDENT_PLATFORM_WINDOWS)
    char hostname[256] = {0};
    DWORD size = sizeof(hostname);
    if (GetComputerNameA(hostname, &size) && hostname[0] != '\0') {
        return std::string(hostname);
    }
#else
    char hostname[256] = {0};
    if (gethostname(hostname, sizeof(hostname) - 1) == 0 && hostname[0] != '\0') {
        return std::string(hostname);
    }
#endif
    return "unknown";
}

}  // namespace device
}  // namespace hwident
