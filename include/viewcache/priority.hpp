#pragma once

#include "viewcache/config.hpp"
#include "viewcache/geo_record.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace viewcache {

constexpr int64_t MS_PER_DAY = 1000LL * 60 * 60 * 24;

// Common interface for ranking records. Higher scores rank first; equal
// scores fall back to ascending id.
class RankingFunction {
public:
    virtual ~RankingFunction() = default;

    virtual double score(const GeoRecord& record, std::optional<int64_t> last_access_ms,
                         int64_t now_ms) const = 0;
};

// What to cache: favors connected, content-bearing, recently touched and
// freshly created records.
class RetentionScorer : public RankingFunction {
public:
    explicit RetentionScorer(PriorityWeights weights = {});

    double score(const GeoRecord& record, std::optional<int64_t> last_access_ms,
                 int64_t now_ms) const override;

    const PriorityWeights& weights() const { return weights_; }

private:
    PriorityWeights weights_;
};

// What to draw: older, unreferenced records grow more visible over time.
class DiscoveryScorer : public RankingFunction {
public:
    double score(const GeoRecord& record, std::optional<int64_t> last_access_ms,
                 int64_t now_ms) const override;
};

double score_priority(const GeoRecord& record, std::optional<int64_t> last_access_ms,
                      int64_t now_ms, const PriorityWeights& weights = {});

// A record under the id it is known by in the caller's table.
struct RankCandidate {
    std::string_view id;
    const GeoRecord* record;
};

// Ids of the top `limit` candidates by `ranking`, score descending then id
// ascending.
std::vector<std::string> rank_top(const std::vector<RankCandidate>& candidates,
                                  const AccessTimestamps& access,
                                  const RankingFunction& ranking,
                                  size_t limit, int64_t now_ms);

std::vector<std::string> rank_top(const std::vector<const GeoRecord*>& records,
                                  const AccessTimestamps& access,
                                  const RankingFunction& ranking,
                                  size_t limit, int64_t now_ms);

// Marker selection for the rendering layer, ranked by discovery score.
std::vector<std::string> limit_markers(const std::vector<const GeoRecord*>& records,
                                       size_t max_markers, int64_t now_ms);

} // namespace viewcache
