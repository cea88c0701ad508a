/**
 * @file source_classifier.hpp
 * @brief URL to source tier
 */

#pragma once

#include <core/types.hpp>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace MineSpec {

/**
 * @brief Assigns a SourceTier from the document URL and the brand being researched
 *
 * oem_primary: the brand's own domains. oem_secondary: another OEM's domain,
 * or a PDF brochure on a host that is not a dealer or known third party.
 * third_party: spec databases and trade press. dealer: hosts or paths with
 * dealer/rental/used vocabulary. Everything else is unknown.
 */
class SourceClassifier {
public:
    SourceClassifier();

    SourceTier classify(const std::string& url, const std::string& brand) const;

    /**
     * @brief Lowercase alphanumerics of a brand name ("P&H" -> "ph")
     */
    static std::string brand_key(const std::string& brand);

private:
    static bool matches(const std::string& host, const std::set<std::string>& domains);

    std::map<std::string, std::set<std::string>> oem_domains_; // brand key -> domains
    std::set<std::string> all_oem_domains_;
    std::set<std::string> third_party_domains_;
};

} // namespace MineSpec
