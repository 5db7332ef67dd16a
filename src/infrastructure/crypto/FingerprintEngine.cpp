#include "infrastructure/crypto/FingerprintEngine.hpp"

#include <sodium.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <stdexcept>

namespace portsy::infra {

namespace {

constexpr char kFieldSeparator = '\x1f';

std::string toLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

} // namespace

FingerprintEngine::FingerprintEngine(size_t shortLength)
    : shortLength_(std::clamp<size_t>(shortLength, 1, crypto_hash_sha256_BYTES * 2)) {
    if (sodium_init() < 0) {
        throw std::runtime_error("Failed to initialize libsodium");
    }
}

std::string FingerprintEngine::headerValue(const core::HeaderMap& headers,
                                           const std::string& name) {
    auto wanted = toLower(name);
    for (const auto& [key, value] : headers) {
        if (toLower(key) == wanted) {
            return value;
        }
    }
    return {};
}

std::string FingerprintEngine::normalize(const core::HeaderMap& headers,
                                         const std::set<std::string>& routes) {
    std::string joined;
    for (const auto& route : routes) {
        if (!joined.empty()) {
            joined += ',';
        }
        joined += route;
    }

    return headerValue(headers, "Server") + kFieldSeparator +
           headerValue(headers, "X-Powered-By") + kFieldSeparator + joined;
}

core::Fingerprint FingerprintEngine::compute(const core::HeaderMap& headers,
                                             const std::set<std::string>& routes) const {
    auto input = normalize(headers, routes);

    std::array<unsigned char, crypto_hash_sha256_BYTES> hash{};
    crypto_hash_sha256(hash.data(), reinterpret_cast<const unsigned char*>(input.data()),
                       input.size());

    std::array<char, crypto_hash_sha256_BYTES * 2 + 1> hex{};
    sodium_bin2hex(hex.data(), hex.size(), hash.data(), hash.size());

    core::Fingerprint fingerprint;
    fingerprint.digest = hex.data();
    fingerprint.shortId = fingerprint.digest.substr(0, shortLength_);
    return fingerprint;
}

} // namespace portsy::infra
