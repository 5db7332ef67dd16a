#pragma once

#include "core/types/Service.hpp"

#include <set>
#include <string>

namespace portsy::infra {

/**
 * @brief Derives a short deterministic signature from observable HTTP signals.
 *
 * The signature covers the Server header, the X-Powered-By header and the
 * sorted confirmed route list. The triple is hashed with SHA-256 (libsodium)
 * and the first shortLength hex characters form the clustering key. Equal
 * triples always give equal fingerprints; the truncated key may collide, so
 * it is a grouping heuristic and not an identity.
 */
class FingerprintEngine {
public:
    static constexpr size_t kDefaultShortLength = 8;

    /**
     * @brief Constructs an engine.
     * @param shortLength Number of hex characters kept as the short id.
     * @throws std::runtime_error if libsodium cannot be initialized.
     */
    explicit FingerprintEngine(size_t shortLength = kDefaultShortLength);

    /**
     * @brief Computes the fingerprint for a header set and route set.
     * @param headers Root response headers; names are matched case-insensitively.
     * @param routes Confirmed routes.
     * @return Full digest and short id.
     */
    [[nodiscard]] core::Fingerprint compute(const core::HeaderMap& headers,
                                            const std::set<std::string>& routes) const;

    /**
     * @brief Builds the normalized text that is hashed.
     *
     * Fields are separated by a unit separator (0x1F) so that moving text
     * between fields changes the result.
     */
    static std::string normalize(const core::HeaderMap& headers,
                                 const std::set<std::string>& routes);

    /**
     * @brief Case-insensitive header lookup.
     * @return Header value, or an empty string if absent.
     */
    static std::string headerValue(const core::HeaderMap& headers, const std::string& name);

private:
    size_t shortLength_;
};

} // namespace portsy::infra
