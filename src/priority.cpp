#include "viewcache/priority.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace viewcache {

namespace {
constexpr double DISCOVERY_SATURATION_DAYS = 30.0;
constexpr double DISCOVERY_ISOLATION_BONUS = 0.3;
constexpr double DISCOVERY_GENERATION_BASE = 0.1;
constexpr double DISCOVERY_GENERATION_STEP = 0.05;

// Age in days of a record created at `created_at` seconds; nullopt if unknown.
std::optional<double> record_age_days(const GeoRecord& record, int64_t now_ms) {
    if (record.created_at <= 0) return std::nullopt;
    double age_ms = static_cast<double>(now_ms - record.created_at * 1000);
    return std::max(0.0, age_ms / MS_PER_DAY);
}
}

RetentionScorer::RetentionScorer(PriorityWeights weights) : weights_(std::move(weights)) {}

double RetentionScorer::score(const GeoRecord& record, std::optional<int64_t> last_access_ms,
                              int64_t now_ms) const {
    const auto& w = weights_;

    int64_t generation = std::clamp<int64_t>(record.generation, 0, w.generation_cap);
    int64_t references = std::clamp<int64_t>(record.reference_count, 0, w.reference_count_cap);

    double total = generation * w.generation + references * w.reference_count;
    if (record.has_content()) {
        total += w.content;
    }

    // Never accessed contributes nothing; future stamps count as "now".
    if (last_access_ms) {
        double access_age_days = std::max<int64_t>(0, now_ms - *last_access_ms) / static_cast<double>(MS_PER_DAY);
        total += w.recency * std::exp(-access_age_days);
    }

    if (auto age_days = record_age_days(record, now_ms)) {
        if (w.freshness_half_life_days > 0.0) {
            total += w.freshness * std::exp(-*age_days / w.freshness_half_life_days);
        }
        if (*age_days < w.exploration_bonus_days) {
            total += w.exploration_bonus;
        }
    }

    return total;
}

double DiscoveryScorer::score(const GeoRecord& record, std::optional<int64_t> /*last_access_ms*/,
                              int64_t now_ms) const {
    double age_days = record_age_days(record, now_ms).value_or(0.0);
    double age_boost = std::log1p(age_days) / std::log1p(DISCOVERY_SATURATION_DAYS);
    double isolation = record.reference_count == 0 ? DISCOVERY_ISOLATION_BONUS : 0.0;
    double generation = DISCOVERY_GENERATION_BASE +
                        static_cast<double>(std::max<int64_t>(0, record.generation)) * DISCOVERY_GENERATION_STEP;
    return age_boost + isolation + generation;
}

double score_priority(const GeoRecord& record, std::optional<int64_t> last_access_ms,
                      int64_t now_ms, const PriorityWeights& weights) {
    return RetentionScorer(weights).score(record, last_access_ms, now_ms);
}

std::vector<std::string> rank_top(const std::vector<RankCandidate>& candidates,
                                  const AccessTimestamps& access,
                                  const RankingFunction& ranking,
                                  size_t limit, int64_t now_ms) {
    std::vector<std::pair<double, const RankCandidate*>> scored;
    scored.reserve(candidates.size());
    for (const auto& candidate : candidates) {
        std::optional<int64_t> last_access;
        auto it = access.find(std::string(candidate.id));
        if (it != access.end()) last_access = it->second;
        scored.emplace_back(ranking.score(*candidate.record, last_access, now_ms), &candidate);
    }

    limit = std::min(limit, scored.size());
    std::partial_sort(scored.begin(), scored.begin() + limit, scored.end(),
                      [](const auto& a, const auto& b) {
                          if (a.first != b.first) return a.first > b.first;
                          return a.second->id < b.second->id;
                      });

    std::vector<std::string> ids;
    ids.reserve(limit);
    for (size_t i = 0; i < limit; i++) {
        ids.emplace_back(scored[i].second->id);
    }
    return ids;
}

std::vector<std::string> rank_top(const std::vector<const GeoRecord*>& records,
                                  const AccessTimestamps& access,
                                  const RankingFunction& ranking,
                                  size_t limit, int64_t now_ms) {
    std::vector<RankCandidate> candidates;
    candidates.reserve(records.size());
    for (const auto* record : records) {
        candidates.push_back({record->id, record});
    }
    return rank_top(candidates, access, ranking, limit, now_ms);
}

std::vector<std::string> limit_markers(const std::vector<const GeoRecord*>& records,
                                       size_t max_markers, int64_t now_ms) {
    return rank_top(records, AccessTimestamps{}, DiscoveryScorer{}, max_markers, now_ms);
}

} // namespace viewcache
