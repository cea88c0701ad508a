/**
 * @file source_classifier.cpp
 * @brief Domain tables for source tiers
 */

#include <scoring/source_classifier.hpp>
#include <gate/url.hpp>
#include <algorithm>
#include <cctype>
#include <regex>

namespace MineSpec {

SourceClassifier::SourceClassifier() {
    oem_domains_ = {
        {"caterpillar", {"cat.com", "caterpillar.com"}},
        {"cat", {"cat.com", "caterpillar.com"}},
        {"komatsu", {"komatsu.com", "komatsu-mining.com", "mining.komatsu", "komatsuamerica.com"}},
        {"liebherr", {"liebherr.com"}},
        {"hitachi", {"hitachicm.com", "hitachi-c-m.com"}},
        {"volvo", {"volvoce.com", "volvo.com"}},
        {"johndeere", {"deere.com", "johndeere.com"}},
        {"deere", {"deere.com", "johndeere.com"}},
        {"xcmg", {"xcmg.com"}},
        {"sany", {"sanygroup.com", "sany.com.cn", "sanyglobal.com"}},
        {"zoomlion", {"zoomlion.com"}},
        {"liugong", {"liugong.com"}},
        {"sdlg", {"sdlg.com"}},
        {"shantui", {"shantui.com"}},
        {"belaz", {"belaz.by", "belaz.com"}},
        {"epiroc", {"epiroc.com"}},
        {"sandvik", {"sandvik.com", "rocktechnology.sandvik"}},
        {"metso", {"metso.com"}},
        {"terex", {"terex.com"}},
        {"doosan", {"doosan.com", "doosanequipment.com", "develon-ce.com"}},
        {"hyundai", {"hyundai-ce.com"}},
        {"bucyrus", {"bucyrus.com", "cat.com"}},
        {"ph", {"komatsu-mining.com", "mining.komatsu"}},
        {"komatsumining", {"komatsu-mining.com", "mining.komatsu"}},
    };
    for (const auto& [brand, domains] : oem_domains_) {
        all_oem_domains_.insert(domains.begin(), domains.end());
    }

    third_party_domains_ = {
        // Spec databases
        "lectura-specs.com", "lectura.specs", "ritchiespecs.com", "specguideonline.com",
        "machinemarket.co.za", "equipmentwatch.com", "ironplanet.com", "mascus.com",
        "machinerytrader.com", "heavyequipments.net", "heavyequipmentguide.ca",
        // Trade press
        "mining.com", "miningmagazine.com", "mining-technology.com", "e-mj.com", "miningglobal.com",
        "australianmining.com.au", "im-mining.com", "miningweekly.com", "international-mining.com",
        "mining-journal.com"};
}

std::string SourceClassifier::brand_key(const std::string& brand) {
    std::string key;
    for (char c : brand) {
        if (std::isalnum(static_cast<unsigned char>(c))) {
            key.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }
    return key;
}

bool SourceClassifier::matches(const std::string& host, const std::set<std::string>& domains) {
    // Walk up the hierarchy: a.b.example.com, b.example.com, example.com
    std::string h = host;
    while (true) {
        if (domains.count(h)) return true;
        size_t dot = h.find('.');
        if (dot == std::string::npos) return false;
        h = h.substr(dot + 1);
    }
}

SourceTier SourceClassifier::classify(const std::string& url, const std::string& brand) const {
    auto parsed = parse_url(url, 8192);
    if (!parsed) return SourceTier::Unknown;

    const std::string& host = parsed->host;
    std::string path;
    path.reserve(parsed->path.size());
    for (char c : parsed->path) path.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

    auto own = oem_domains_.find(brand_key(brand));
    if (own != oem_domains_.end() && matches(host, own->second)) return SourceTier::OemPrimary;
    if (matches(host, all_oem_domains_)) return SourceTier::OemSecondary;
    if (matches(host, third_party_domains_)) return SourceTier::ThirdParty;

    static const std::regex dealer(R"(dealer|parts|rental|used|second.?hand|pre.?owned|distribuidor|concesionario|haendler)",
                                   std::regex::ECMAScript | std::regex::icase | std::regex::optimize);
    // Bounded inputs: host is at most 253 characters, path is truncated.
    std::string haystack = host + " " + path.substr(0, 512);
    if (std::regex_search(haystack, dealer)) return SourceTier::Dealer;

    bool pdf = path.size() >= 4 && path.compare(path.size() - 4, 4, ".pdf") == 0;
    if (pdf) return SourceTier::OemSecondary;

    return SourceTier::Unknown;
}

} // namespace MineSpec
