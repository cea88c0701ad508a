/**
 * @file cross_validator.cpp
 * @brief Reconciliation
 */

#include <validation/cross_validator.hpp>
#include <core/parameters.hpp>
#include <extraction/rimpull_extractor.hpp>
#include <utils/logger.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>
#include <sstream>

namespace MineSpec {

namespace {

constexpr double MASS_EPSILON = 1e-9;

std::string text_key(const std::string& s) {
    std::string key;
    for (char c : s) {
        if (std::isalnum(static_cast<unsigned char>(c))) {
            key.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }
    return key;
}

std::string fmt(double v) {
    std::ostringstream oss;
    oss << v;
    return oss.str();
}

double round_to(double v, double scale) {
    return std::round(v * scale) / scale;
}

// true when a should come before b
bool heavier(const CandidateCluster& a, const CandidateCluster& b) {
    if (std::fabs(a.mass - b.mass) > MASS_EPSILON) return a.mass > b.mass;
    if (a.tiers.size() != b.tiers.size()) return a.tiers.size() > b.tiers.size();
    if (a.members.size() != b.members.size()) return a.members.size() > b.members.size();
    if (!a.text_key.empty() || !b.text_key.empty()) return a.text_key < b.text_key;
    return a.min_value() < b.min_value();
}

} // namespace

double CandidateCluster::min_value() const {
    double v = members.front()->candidate.number();
    for (const auto* m : members) v = std::min(v, m->candidate.number());
    return v;
}

double CandidateCluster::max_value() const {
    double v = members.front()->candidate.number();
    for (const auto* m : members) v = std::max(v, m->candidate.number());
    return v;
}

CrossValidator::CrossValidator(const Settings& settings) : settings_(settings) {}

std::vector<CandidateCluster> CrossValidator::cluster(const std::string& parameter,
                                                      const std::vector<ScoredCandidate>& group) const {
    std::vector<CandidateCluster> clusters;
    if (group.empty()) return clusters;

    std::vector<const ScoredCandidate*> items;
    items.reserve(group.size());
    for (const auto& c : group) items.push_back(&c);

    bool text = !group.front().candidate.is_numeric();
    if (text) {
        std::map<std::string, CandidateCluster> by_key;
        for (const auto* item : items) {
            if (item->candidate.is_numeric()) continue;
            std::string key = text_key(item->candidate.text());
            auto& cl = by_key[key];
            cl.text_key = key;
            cl.members.push_back(item);
        }
        for (auto& [key, cl] : by_key) clusters.push_back(std::move(cl));
    } else {
        std::stable_sort(items.begin(), items.end(), [](const ScoredCandidate* a, const ScoredCandidate* b) {
            const auto& ca = a->candidate;
            const auto& cb = b->candidate;
            if (ca.unit != cb.unit) return ca.unit < cb.unit;
            if (ca.number() != cb.number()) return ca.number() < cb.number();
            return ca.id < cb.id;
        });

        double tol = settings_.tolerance_for(parameter) / 100.0;

        for (const auto* item : items) {
            if (!item->candidate.is_numeric()) continue;
            bool joined = false;
            if (!clusters.empty()) {
                auto& open = clusters.back();
                const auto& first = open.members.front()->candidate;
                double lo = first.number();
                double hi = item->candidate.number();
                if (first.unit == item->candidate.unit &&
                    (hi - lo) <= tol * (std::fabs(hi) + std::fabs(lo)) + MASS_EPSILON) {
                    open.members.push_back(item);
                    joined = true;
                }
            }
            if (!joined) {
                clusters.emplace_back();
                clusters.back().members.push_back(item);
            }
        }
    }

    for (auto& cl : clusters) {
        for (const auto* m : cl.members) {
            cl.mass += m->confidence;
            cl.tiers.insert(m->tier);
        }
    }

    std::sort(clusters.begin(), clusters.end(), heavier);
    return clusters;
}

std::optional<ValidatedSpec> CrossValidator::reconcile_group(const SpecKey& key,
                                                             std::vector<ScoredCandidate> group) const {
    // Same candidate seen twice counts once; order of arrival is irrelevant.
    std::sort(group.begin(), group.end(), [](const ScoredCandidate& a, const ScoredCandidate& b) {
        return a.candidate.id < b.candidate.id;
    });
    group.erase(std::unique(group.begin(), group.end(), [](const ScoredCandidate& a, const ScoredCandidate& b) {
                    return a.candidate.id == b.candidate.id;
                }),
                group.end());
    if (group.empty()) return std::nullopt;

    // A parameter is either text or numeric; stray values of the other kind are ignored.
    const ParameterSpec* spec = ParameterCatalog::builtin().find(key.parameter);
    bool want_text = spec ? spec->is_text() : !group.front().candidate.is_numeric();
    group.erase(std::remove_if(group.begin(), group.end(), [&](const ScoredCandidate& c) {
                    return c.candidate.is_numeric() == want_text;
                }),
                group.end());
    if (group.empty()) return std::nullopt;

    auto clusters = cluster(key.parameter, group);
    const CandidateCluster& winner = clusters.front();
    const auto& rc = settings_.reconciliation;

    ValidatedSpec spec_out;
    spec_out.brand = key.brand;
    spec_out.model = key.model;
    spec_out.parameter = key.parameter;
    spec_out.unit = winner.members.front()->candidate.unit;

    // Value
    if (want_text) {
        std::map<std::string, std::pair<int, double>> votes; // display form -> (count, mass)
        for (const auto* m : winner.members) {
            auto& v = votes[m->candidate.text()];
            v.first += 1;
            v.second += m->confidence;
        }
        auto best = votes.begin();
        for (auto it = votes.begin(); it != votes.end(); ++it) {
            if (it->second.first > best->second.first ||
                (it->second.first == best->second.first && it->second.second > best->second.second + MASS_EPSILON)) {
                best = it;
            }
        }
        spec_out.value = best->first;
    } else {
        double weighted = 0.0;
        double plain = 0.0;
        for (const auto* m : winner.members) {
            weighted += m->confidence * m->candidate.number();
            plain += m->candidate.number();
        }
        double v = winner.mass > MASS_EPSILON ? weighted / winner.mass : plain / winner.members.size();
        spec_out.value = round_to(v, 1e6);
    }

    // Confidence: agreement inside the winner, discounted by the share of mass it holds
    double total_mass = 0.0;
    for (const auto& cl : clusters) total_mass += cl.mass;
    double disbelief = 1.0;
    for (const auto* m : winner.members) disbelief *= (1.0 - std::clamp(m->confidence, 0.0, 1.0));
    double share = total_mass > MASS_EPSILON ? winner.mass / total_mass : 0.0;
    spec_out.confidence = round_to((1.0 - disbelief) * share, 1e3);

    // Membership
    for (const auto* m : winner.members) spec_out.supporting_candidates.push_back(m->candidate.id);
    for (size_t i = 1; i < clusters.size(); ++i) {
        if (clusters[i].mass > rc.visibility_threshold) {
            for (const auto* m : clusters[i].members) spec_out.conflicting_candidates.push_back(m->candidate.id);
        }
    }
    std::sort(spec_out.supporting_candidates.begin(), spec_out.supporting_candidates.end());
    std::sort(spec_out.conflicting_candidates.begin(), spec_out.conflicting_candidates.end());

    // Status
    double best_member = 0.0;
    for (const auto* m : winner.members) best_member = std::max(best_member, m->confidence);

    std::string reason;
    if (!(winner.mass > rc.acceptance_threshold)) {
        reason = "winning cluster mass " + fmt(winner.mass) + " does not exceed acceptance threshold " +
                 fmt(rc.acceptance_threshold);
    } else if (!(best_member > rc.acceptance_threshold)) {
        reason = "no supporting candidate above acceptance threshold " + fmt(rc.acceptance_threshold);
    } else if (!want_text && spec && spec->kind == ParameterKind::Numeric &&
               (!spec_out.unit || *spec_out.unit != spec->canonical_unit)) {
        reason = "unit not recognized";
    } else {
        for (size_t i = 1; i < clusters.size() && reason.empty(); ++i) {
            if (clusters[i].mass > rc.disagreement_ratio * winner.mass + MASS_EPSILON) {
                reason = "competing cluster mass " + fmt(clusters[i].mass) + " exceeds " +
                         fmt(rc.disagreement_ratio) + " x winning mass " + fmt(winner.mass);
            }
            for (const auto* m : clusters[i].members) {
                if (reason.empty() && m->confidence > rc.acceptance_threshold) {
                    reason = "conflicting candidate " + m->candidate.id.substr(0, 8) + " has confidence " +
                             fmt(m->confidence);
                }
            }
        }
    }

    spec_out.status = reason.empty() ? SpecStatus::Validated : SpecStatus::Flagged;
    spec_out.reason = reason;
    return spec_out;
}

std::vector<ValidatedSpec> CrossValidator::reconcile(const std::vector<ScoredCandidate>& candidates) const {
    std::map<SpecKey, std::vector<ScoredCandidate>> groups;
    for (const auto& c : candidates) {
        groups[{c.candidate.brand, c.candidate.model, c.candidate.parameter}].push_back(c);
    }

    std::vector<ValidatedSpec> out;
    for (auto& [key, group] : groups) {
        if (auto spec = reconcile_group(key, std::move(group))) out.push_back(std::move(*spec));
    }
    return out;
}

namespace {

// Points one source gives for one gear, ordered by speed
struct GearSegment {
    size_t source = 0; // index into the ranked curves, 0 is the best source
    double weight = 0.0;
    std::vector<RimpullPoint> points;

    double peak() const {
        double f = 0.0;
        for (const auto& p : points) f = std::max(f, p.force_kn);
        return f;
    }
};

using SegmentCluster = std::vector<const GearSegment*>;

double cluster_weight(const SegmentCluster& cluster) {
    double w = 0.0;
    for (const auto* seg : cluster) w += seg->weight;
    return w;
}

double cluster_peak(const SegmentCluster& cluster) {
    double f = 0.0;
    for (const auto* seg : cluster) f += seg->peak();
    return f / static_cast<double>(cluster.size());
}

// Agreeing sources with the same point count are averaged point by point,
// weighted by tier. Otherwise the best source's points are kept.
std::vector<RimpullPoint> merge_segments(const SegmentCluster& cluster) {
    const GearSegment* best = *std::min_element(cluster.begin(), cluster.end(),
                                                [](const GearSegment* a, const GearSegment* b) {
                                                    return a->source < b->source;
                                                });
    for (const auto* seg : cluster) {
        if (seg->points.size() != best->points.size()) return best->points;
    }

    double total = cluster_weight(cluster);
    std::vector<RimpullPoint> out = best->points;
    for (size_t i = 0; i < out.size(); ++i) {
        double speed = 0.0;
        double force = 0.0;
        for (const auto* seg : cluster) {
            double w = total > MASS_EPSILON ? seg->weight / total : 1.0 / static_cast<double>(cluster.size());
            speed += w * seg->points[i].speed_kph;
            force += w * seg->points[i].force_kn;
        }
        out[i].speed_kph = round_to(speed, 1e6);
        out[i].force_kn = round_to(force, 1e6);
    }
    return out;
}

} // namespace

std::optional<RimpullCurve> CrossValidator::reconcile_curves(std::vector<RimpullCurve> curves) const {
    curves.erase(std::remove_if(curves.begin(), curves.end(),
                                [](const RimpullCurve& c) { return c.points.empty(); }),
                 curves.end());
    if (curves.empty()) return std::nullopt;

    const auto& weights = settings_.scoring.tier_weights;
    auto tier_weight = [&](SourceTier t) {
        auto it = weights.find(t);
        return it == weights.end() ? 0.0 : it->second;
    };

    std::sort(curves.begin(), curves.end(), [&](const RimpullCurve& a, const RimpullCurve& b) {
        double wa = tier_weight(a.tier);
        double wb = tier_weight(b.tier);
        if (wa != wb) return wa > wb;
        if (a.points.size() != b.points.size()) return a.points.size() > b.points.size();
        if (a.violations.size() != b.violations.size()) return a.violations.size() < b.violations.size();
        return a.source_url < b.source_url;
    });
    if (curves.size() == 1) return curves.front();

    std::map<int, std::vector<GearSegment>> by_gear;
    for (size_t i = 0; i < curves.size(); ++i) {
        std::map<int, std::vector<RimpullPoint>> own;
        for (const auto& p : curves[i].points) own[p.gear].push_back(p);
        for (auto& [gear, points] : own) {
            std::sort(points.begin(), points.end(), [](const RimpullPoint& a, const RimpullPoint& b) {
                if (a.speed_kph != b.speed_kph) return a.speed_kph < b.speed_kph;
                return a.force_kn > b.force_kn;
            });
            by_gear[gear].push_back({i, tier_weight(curves[i].tier), std::move(points)});
        }
    }

    const RimpullCurve& primary = curves.front();
    RimpullCurve out;
    out.brand = primary.brand;
    out.model = primary.model;
    out.source_url = primary.source_url;
    out.tier = primary.tier;

    const double tolerance = settings_.reconciliation.curve_tolerance_pct / 100.0;
    for (const auto& [gear, segments] : by_gear) {
        SegmentCluster sorted;
        for (const auto& seg : segments) sorted.push_back(&seg);
        std::sort(sorted.begin(), sorted.end(), [](const GearSegment* a, const GearSegment* b) {
            if (a->peak() != b->peak()) return a->peak() < b->peak();
            return a->source < b->source;
        });

        std::vector<SegmentCluster> clusters;
        for (const auto* seg : sorted) {
            if (!clusters.empty()) {
                double mean = cluster_peak(clusters.back());
                if (mean > 0.0 && std::fabs(seg->peak() - mean) <= tolerance * mean) {
                    clusters.back().push_back(seg);
                    continue;
                }
            }
            clusters.push_back({seg});
        }

        auto winner = std::min_element(clusters.begin(), clusters.end(),
                                     [](const SegmentCluster& a, const SegmentCluster& b) {
                                         double wa = cluster_weight(a);
                                         double wb = cluster_weight(b);
                                         if (std::fabs(wa - wb) > MASS_EPSILON) return wa > wb;
                                         if (a.size() != b.size()) return a.size() > b.size();
                                         return cluster_peak(a) < cluster_peak(b);
                                     });

        if (clusters.size() > 1) {
            std::ostringstream oss;
            oss << "Rimpull " << primary.model << " gear " << gear << ": " << winner->size() << "/"
                << segments.size() << " sources agree near " << cluster_peak(*winner) << " kN; outliers:";
            for (const auto& cl : clusters) {
                if (&cl == &*winner) continue;
                for (const auto* seg : cl) oss << " " << seg->peak() << " kN (" << curves[seg->source].source_url << ")";
            }
            Logger::warn(oss.str());
        }

        auto merged = merge_segments(*winner);
        out.points.insert(out.points.end(), merged.begin(), merged.end());
    }

    out.violations = RimpullExtractor::order_and_check(out.points);
    return out;
}

} // namespace MineSpec
