#include <gtest/gtest.h>
#include "viewcache/errors.hpp"
#include "viewcache/eviction_engine.hpp"
#include "viewcache/priority.hpp"

#include <algorithm>
#include <random>
#include <set>

using viewcache::AccessTimestamps;
using viewcache::CacheConfig;
using viewcache::GeoRecord;
using viewcache::MS_PER_DAY;
using viewcache::RecordTable;
using viewcache::TrackedSpatialKeys;
using viewcache::Viewport;

class EvictionEngineTest : public ::testing::Test {
protected:
    const int64_t now = 1'760'000'000'000LL;
    CacheConfig config;
    Viewport viewport;
    TrackedSpatialKeys no_keys;

    void SetUp() override {
        viewport.center_lon = 139.5;
        viewport.center_lat = 35.5;
        viewport.zoom = 10;
        viewport.bounds = {139.0, 35.0, 140.0, 36.0};
    }

    GeoRecord make_record(const std::string& id, double lat, double lon) {
        GeoRecord r;
        r.id = id;
        r.position = viewcache::Position::from_degrees(lat, lon);
        r.spatial_keys = {"r6-" + id, "r8-" + id, "r10-" + id, "r12-" + id};
        r.created_at = now / 1000;
        return r;
    }

    void add(RecordTable& table, GeoRecord record) {
        auto id = record.id;
        table.emplace(id, std::move(record));
    }

    static void expect_partition(const RecordTable& records, const viewcache::CleanupResult& result) {
        std::set<std::string> keep(result.keep.begin(), result.keep.end());
        std::set<std::string> evict(result.evict.begin(), result.evict.end());

        EXPECT_EQ(keep.size(), result.keep.size()) << "duplicate ids in keep";
        EXPECT_EQ(evict.size(), result.evict.size()) << "duplicate ids in evict";
        EXPECT_EQ(keep.size() + evict.size(), records.size());
        for (const auto& id : keep) {
            EXPECT_EQ(evict.count(id), 0u) << id;
            EXPECT_EQ(records.count(id), 1u) << id;
        }
        for (const auto& id : evict) {
            EXPECT_EQ(records.count(id), 1u) << id;
        }
    }

    static bool contains(const std::vector<std::string>& ids, const std::string& id) {
        return std::find(ids.begin(), ids.end(), id) != ids.end();
    }
};

TEST_F(EvictionEngineTest, KeepsRecordsInCacheZone) {
    RecordTable records;
    add(records, make_record("1", 35.5, 139.5)); // visible
    add(records, make_record("2", 34.8, 138.8)); // padded zone only
    add(records, make_record("3", 34.0, 138.0));
    add(records, make_record("4", 37.0, 141.0));

    AccessTimestamps access;
    for (const auto& id : {"1", "2", "3", "4"}) access[id] = now - 120000;

    auto result = viewcache::cleanup(records, access, viewport, no_keys, config, now);

    EXPECT_EQ(result.keep, (std::vector<std::string>{"1", "2"}));
    EXPECT_EQ(result.evict, (std::vector<std::string>{"3", "4"}));
    EXPECT_EQ(result.stats.initial_count, 4);
    EXPECT_EQ(result.stats.kept_count, 2);
    EXPECT_EQ(result.stats.evicted_count, 2);
    EXPECT_DOUBLE_EQ(result.stats.memory_freed_mb, 0.0);
    expect_partition(records, result);
}

TEST_F(EvictionEngineTest, RecencyOverridesZone) {
    RecordTable records;
    add(records, make_record("1", 35.5, 139.5));
    add(records, make_record("2", 34.0, 138.0));
    add(records, make_record("3", 37.0, 141.0));

    AccessTimestamps access{
        {"1", now - 30000},
        {"2", now - 30000},
        {"3", now - 120000},
    };

    auto result = viewcache::cleanup(records, access, viewport, no_keys, config, now);

    EXPECT_EQ(result.keep, (std::vector<std::string>{"1", "2"}));
    EXPECT_EQ(result.evict, (std::vector<std::string>{"3"}));
}

TEST_F(EvictionEngineTest, RecencyWindowIsInclusive) {
    RecordTable records;
    add(records, make_record("edge", 10.0, 10.0));
    add(records, make_record("late", 10.0, 10.0));

    AccessTimestamps access{
        {"edge", now - config.recency_window_ms},
        {"late", now - config.recency_window_ms - 1},
    };

    auto result = viewcache::cleanup(records, access, viewport, no_keys, config, now);

    EXPECT_EQ(result.keep, (std::vector<std::string>{"edge"}));
    EXPECT_EQ(result.evict, (std::vector<std::string>{"late"}));
}

TEST_F(EvictionEngineTest, MissingAccessEntryIsNeverAccessed) {
    RecordTable records;
    add(records, make_record("far", 0.0, 0.0));

    auto result = viewcache::cleanup(records, {}, viewport, no_keys, config, now);

    EXPECT_TRUE(result.keep.empty());
    EXPECT_EQ(result.evict, (std::vector<std::string>{"far"}));
}

TEST_F(EvictionEngineTest, HighPriorityDoesNotSaveIneligibleRecord) {
    RecordTable records;
    auto r = make_record("valuable", 10.0, 10.0);
    r.generation = 100;
    r.reference_count = 100;
    r.content = "important";
    add(records, r);

    AccessTimestamps access{{"valuable", now - 10 * 60 * 1000}};
    auto result = viewcache::cleanup(records, access, viewport, no_keys, config, now);

    EXPECT_EQ(result.evict, (std::vector<std::string>{"valuable"}));
}

TEST_F(EvictionEngineTest, NullViewportKeepsEverything) {
    RecordTable records;
    add(records, make_record("a", 35.5, 139.5));
    add(records, make_record("b", -40.0, 20.0));
    add(records, make_record("c", 89.0, -170.0));

    auto result = viewcache::cleanup(records, {}, std::nullopt, no_keys, config, now);

    EXPECT_TRUE(result.evict.empty());
    EXPECT_EQ(result.keep.size(), 3u);
    EXPECT_EQ(result.stats.evicted_count, 0);
    EXPECT_DOUBLE_EQ(result.stats.memory_freed_mb, 0.0);
}

TEST_F(EvictionEngineTest, NullViewportSkipsCapacityTrim) {
    config.hard_capacity = 10;
    config.soft_capacity = 5;

    RecordTable records;
    for (int i = 0; i < 50; i++) {
        add(records, make_record("r" + std::to_string(i), 35.5, 139.5));
    }

    auto result = viewcache::cleanup(records, {}, std::nullopt, no_keys, config, now);

    EXPECT_EQ(result.keep.size(), 50u);
    EXPECT_TRUE(result.evict.empty());
}

TEST_F(EvictionEngineTest, DegenerateViewportKeepsEverything) {
    Viewport uninitialized;
    RecordTable records;
    add(records, make_record("a", 35.5, 139.5));
    add(records, make_record("b", 0.0, 0.0));

    auto result = viewcache::cleanup(records, {}, uninitialized, no_keys, config, now);

    EXPECT_TRUE(result.evict.empty());
    EXPECT_EQ(result.keep.size(), 2u);
}

TEST_F(EvictionEngineTest, EmptyTable) {
    auto result = viewcache::cleanup({}, {}, viewport, no_keys, config, now);

    EXPECT_TRUE(result.keep.empty());
    EXPECT_TRUE(result.evict.empty());
    EXPECT_EQ(result.stats.initial_count, 0);
}

TEST_F(EvictionEngineTest, ForceCleanupKeepsHighValueRecords) {
    RecordTable records;
    AccessTimestamps access;

    for (int i = 0; i < 4500; i++) {
        auto r = make_record("token-" + std::to_string(i), 35.5, 139.5);
        bool high_value = i < 1000;
        r.generation = high_value ? 5 : 0;
        r.reference_count = high_value ? 8 : 0;
        if (high_value) r.content = "Important location";
        r.created_at = (now - (high_value ? 30 : 60) * MS_PER_DAY) / 1000;
        access[r.id] = now - 120000;
        add(records, std::move(r));
    }

    auto result = viewcache::cleanup(records, access, viewport, no_keys, config, now);

    EXPECT_EQ(result.stats.kept_count, config.soft_capacity);
    EXPECT_EQ(result.keep.size(), 3000u);
    EXPECT_EQ(result.evict.size(), 1500u);
    EXPECT_NEAR(result.stats.memory_freed_mb, 2.64, 1e-9);

    int kept_high = 0;
    for (const auto& id : result.keep) {
        if (std::stoi(id.substr(6)) < 1000) kept_high++;
    }
    EXPECT_GT(kept_high, 950);
    expect_partition(records, result);
}

TEST_F(EvictionEngineTest, ZoomOutWithManyVisibleRecords) {
    viewport.bounds = {138.0, 34.0, 141.0, 37.0};

    std::mt19937 rng(7);
    std::uniform_real_distribution<double> lat(34.0, 37.0);
    std::uniform_real_distribution<double> lon(138.0, 141.0);
    std::uniform_int_distribution<int> gen(0, 9);
    std::uniform_int_distribution<int> refs(0, 14);

    RecordTable records;
    AccessTimestamps access;
    for (int i = 0; i < 5000; i++) {
        auto r = make_record("token-" + std::to_string(i), lat(rng), lon(rng));
        r.generation = gen(rng);
        r.reference_count = refs(rng);
        if (i % 3 == 0) r.content = "note";
        access[r.id] = now - 120000;
        add(records, std::move(r));
    }

    auto result = viewcache::cleanup(records, access, viewport, no_keys, config, now);

    EXPECT_EQ(result.keep.size(), 3000u);
    EXPECT_EQ(result.evict.size(), 2000u);
    expect_partition(records, result);
}

TEST_F(EvictionEngineTest, AtHardCapacityNoTrim) {
    config.hard_capacity = 100;
    config.soft_capacity = 60;

    RecordTable records;
    for (int i = 0; i < 100; i++) {
        add(records, make_record("r" + std::to_string(i), 35.5, 139.5));
    }

    auto result = viewcache::cleanup(records, {}, viewport, no_keys, config, now);

    EXPECT_EQ(result.keep.size(), 100u);
    EXPECT_TRUE(result.evict.empty());
}

TEST_F(EvictionEngineTest, OverHardCapacityTrimsToSoft) {
    config.hard_capacity = 100;
    config.soft_capacity = 60;

    RecordTable records;
    for (int i = 0; i < 101; i++) {
        add(records, make_record("r" + std::to_string(i), 35.5, 139.5));
    }
    // Ineligible records are evicted in addition to the trimmed ones.
    add(records, make_record("far", 0.0, 0.0));

    auto result = viewcache::cleanup(records, {}, viewport, no_keys, config, now);

    EXPECT_EQ(result.keep.size(), 60u);
    EXPECT_EQ(result.evict.size(), 42u);
    EXPECT_TRUE(contains(result.evict, "far"));
    expect_partition(records, result);
}

TEST_F(EvictionEngineTest, RecentlyAccessedRecordsCountTowardCapacity) {
    config.hard_capacity = 4;
    config.soft_capacity = 2;

    RecordTable records;
    AccessTimestamps access;
    for (int i = 0; i < 5; i++) {
        auto r = make_record("out" + std::to_string(i), 0.0, 0.0);
        access[r.id] = now - 1000;
        add(records, std::move(r));
    }

    auto result = viewcache::cleanup(records, access, viewport, no_keys, config, now);

    EXPECT_EQ(result.keep.size(), 2u);
    EXPECT_EQ(result.evict.size(), 3u);
}

TEST_F(EvictionEngineTest, TrimIsDeterministic) {
    config.hard_capacity = 20;
    config.soft_capacity = 10;

    RecordTable records;
    for (int i = 0; i < 30; i++) {
        auto r = make_record("r" + std::to_string(i), 35.5, 139.5);
        r.generation = i % 2;
        add(records, std::move(r));
    }

    auto first = viewcache::cleanup(records, {}, viewport, no_keys, config, now);
    auto second = viewcache::cleanup(records, {}, viewport, no_keys, config, now);

    EXPECT_EQ(first.keep, second.keep);
    EXPECT_EQ(first.evict, second.evict);

    // Fifteen generation-1 records compete for ten slots; ids decide.
    std::vector<std::string> expected{"r1", "r11", "r13", "r15", "r17", "r19", "r21", "r23", "r25", "r27"};
    EXPECT_EQ(first.keep, expected);
}

TEST_F(EvictionEngineTest, UsesTableKeysAsIdentity) {
    RecordTable records;
    auto r = make_record("stale-id", 35.5, 139.5);
    records.emplace("table-key", r);

    auto result = viewcache::cleanup(records, {}, viewport, no_keys, config, now);

    EXPECT_EQ(result.keep, (std::vector<std::string>{"table-key"}));
}

TEST_F(EvictionEngineTest, SpatialKeyFiltering) {
    config.use_spatial_key_filtering = true;

    RecordTable records;
    add(records, make_record("a", 0.0, 0.0));      // far away, key tracked
    add(records, make_record("b", 35.5, 139.5));   // in zone, key not tracked
    add(records, make_record("c", 0.0, 0.0));      // neither, but recent

    TrackedSpatialKeys keys;
    keys.add(2, "r10-a");
    AccessTimestamps access{{"b", now - 120000}, {"c", now - 1000}};

    auto result = viewcache::cleanup(records, access, viewport, keys, config, now);

    EXPECT_EQ(result.keep, (std::vector<std::string>{"a", "c"}));
    EXPECT_EQ(result.evict, (std::vector<std::string>{"b"}));
}

TEST_F(EvictionEngineTest, InvalidCapacitiesThrow) {
    RecordTable records;
    add(records, make_record("a", 35.5, 139.5));

    config.hard_capacity = 0;
    EXPECT_THROW(viewcache::cleanup(records, {}, viewport, no_keys, config, now), viewcache::ConfigError);

    config.hard_capacity = 10;
    config.soft_capacity = -1;
    EXPECT_THROW(viewcache::cleanup(records, {}, viewport, no_keys, config, now), viewcache::ConfigError);

    config.soft_capacity = 11;
    EXPECT_THROW(viewcache::cleanup(records, {}, viewport, no_keys, config, now), viewcache::ConfigError);

    // Even without a viewport the configuration is checked.
    EXPECT_THROW(viewcache::cleanup(records, {}, std::nullopt, no_keys, config, now), viewcache::ConfigError);
}

TEST_F(EvictionEngineTest, ZeroExpansionFactorIsRejected) {
    config.expansion_factor = 0.0;
    config.hard_capacity = 10;
    config.soft_capacity = 5;

    RecordTable records;
    for (int i = 0; i < 20; i++) {
        add(records, make_record("far" + std::to_string(i), 0.0, 0.0));
    }

    EXPECT_THROW(viewcache::cleanup(records, {}, viewport, no_keys, config, now), viewcache::ConfigError);
}

TEST_F(EvictionEngineTest, NarrowZoneStillEvictsAndTrims) {
    config.expansion_factor = 1e-9;
    config.hard_capacity = 10;
    config.soft_capacity = 5;

    RecordTable records;
    AccessTimestamps access;
    for (int i = 0; i < 20; i++) {
        add(records, make_record("far" + std::to_string(i), 0.0, 0.0));
    }
    for (int i = 0; i < 12; i++) {
        auto r = make_record("recent" + std::to_string(i), 0.0, 0.0);
        access[r.id] = now - 1000;
        add(records, std::move(r));
    }

    auto result = viewcache::cleanup(records, access, viewport, no_keys, config, now);

    EXPECT_EQ(result.keep.size(), 5u);
    EXPECT_EQ(result.evict.size(), 27u);
    for (const auto& id : result.keep) {
        EXPECT_EQ(id.rfind("recent", 0), 0u) << id;
    }
    expect_partition(records, result);
}

TEST_F(EvictionEngineTest, WallClockOverload) {
    RecordTable records;
    add(records, make_record("a", 35.5, 139.5));

    auto result = viewcache::cleanup(records, {}, viewport, no_keys, config);

    EXPECT_EQ(result.keep, (std::vector<std::string>{"a"}));
}

TEST_F(EvictionEngineTest, TotalityAcrossRandomInputs) {
    std::mt19937 rng(42);
    std::uniform_real_distribution<double> lat(30.0, 40.0);
    std::uniform_real_distribution<double> lon(134.0, 145.0);
    std::uniform_int_distribution<int64_t> age(0, 300000);

    config.hard_capacity = 150;
    config.soft_capacity = 100;

    for (int round = 0; round < 20; round++) {
        RecordTable records;
        AccessTimestamps access;
        int n = 50 + round * 15;
        for (int i = 0; i < n; i++) {
            auto r = make_record("r" + std::to_string(i), lat(rng), lon(rng));
            r.generation = i % 7;
            if (i % 4 != 0) access[r.id] = now - age(rng);
            add(records, std::move(r));
        }

        auto result = viewcache::cleanup(records, access, viewport, no_keys, config, now);
        expect_partition(records, result);

        auto zone = viewcache::BoundingBox{138.625, 34.625, 140.375, 36.375};
        for (const auto& id : result.keep) {
            const auto& r = records.at(id);
            auto it = access.find(id);
            bool recent = it != access.end() && now - it->second <= config.recency_window_ms;
            bool in_zone = zone.contains(r.position.lon(), r.position.lat());
            EXPECT_TRUE(recent || in_zone) << id;
        }
    }
}
