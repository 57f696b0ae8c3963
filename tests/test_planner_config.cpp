#include <doctest/doctest.h>
#include "planner/PlannerConfig.h"

using namespace RoadNet;

TEST_SUITE("PlannerConfig") {
    TEST_CASE("empty object keeps the defaults") {
        PlannerConfig config;
        REQUIRE(applyConfigOverrides("{}", config));
        CHECK(config.cost.bridgeCostMultiplier == doctest::Approx(8.0f));
        CHECK(config.branching.maxDepth == 3);
        CHECK(config.weightMode == WeightMode::EconomicCost);
    }

    TEST_CASE("overrides reach their stage configs") {
        PlannerConfig config;
        REQUIRE(applyConfigOverrides(R"({
            "bridge_cost_multiplier": 12.5,
            "loop_factor": 3,
            "max_depth": 2,
            "max_farms": 4,
            "seed": 99,
            "enable_density": false,
            "detect_segment_crossings": true,
            "urban_threshold": 0.5
        })", config));

        CHECK(config.cost.bridgeCostMultiplier == doctest::Approx(12.5f));
        CHECK(config.graph.loopFactor == doctest::Approx(3.0f));
        CHECK(config.branching.maxDepth == 2);
        CHECK(config.destinations.maxFarms == 4);
        CHECK(config.seed == 99);
        CHECK_FALSE(config.enableDensity);
        CHECK(config.density.detectSegmentCrossings);
        CHECK(config.density.thresholds.urban == doctest::Approx(0.5f));
    }

    TEST_CASE("unknown keys are skipped") {
        PlannerConfig config;
        CHECK(applyConfigOverrides(R"({"no_such_key": 1, "merge_distance": 40})", config));
        CHECK(config.consolidation.mergeDistance == doctest::Approx(40.0f));
    }

    TEST_CASE("wrong value types fail without touching the config") {
        const char* bad[] = {
            R"({"merge_distance": 40, "max_depth": "deep"})",
            R"({"merge_distance": 40, "max_depth": 2.5})",
            R"({"merge_distance": 40, "seed": -1})",
            R"({"merge_distance": 40, "enable_branching": 1})",
            R"({"merge_distance": 40, "cost_aware": "yes"})",
        };

        for (const char* text : bad) {
            CAPTURE(text);
            PlannerConfig config;
            CHECK_FALSE(applyConfigOverrides(text, config));
            CHECK(config.consolidation.mergeDistance == doctest::Approx(80.0f));
            CHECK(config.branching.maxDepth == 3);
            CHECK(config.seed == 12345);
        }
    }

    TEST_CASE("malformed documents fail") {
        PlannerConfig config;
        CHECK_FALSE(applyConfigOverrides("{not json", config));
        CHECK_FALSE(applyConfigOverrides("[1, 2, 3]", config));
        CHECK_FALSE(applyConfigOverrides("42", config));
    }

    TEST_CASE("cost_aware selects the MST weight") {
        PlannerConfig config;
        REQUIRE(applyConfigOverrides(R"({"cost_aware": false})", config));
        CHECK(config.weightMode == WeightMode::Distance);
        REQUIRE(applyConfigOverrides(R"({"cost_aware": true})", config));
        CHECK(config.weightMode == WeightMode::EconomicCost);
    }

    TEST_CASE("shared settings propagate to the stages") {
        PlannerConfig config;
        config.terrainSize = 4096.0f;
        config.seaLevel = 3.0f;
        config.seed = 7;
        config.applyShared();

        CHECK(config.destinations.terrainSize == doctest::Approx(4096.0f));
        CHECK(config.destinations.seaLevel == doctest::Approx(3.0f));
        CHECK(config.destinations.seed == 7);
        CHECK(config.cost.seaLevel == doctest::Approx(3.0f));
        CHECK(config.demand.terrainSize == doctest::Approx(4096.0f));
        CHECK(config.pathfinder.seaLevel == doctest::Approx(3.0f));
        CHECK(config.branching.terrainSize == doctest::Approx(4096.0f));
        CHECK(config.branching.seaLevel == doctest::Approx(3.0f));
        CHECK(config.branching.seed == 7);
        CHECK(config.exclusion.seaLevel == doctest::Approx(3.0f));
    }

    TEST_CASE("missing config file fails") {
        PlannerConfig config;
        CHECK_FALSE(loadPlannerConfig("/nonexistent/planner_config.json", config));
    }
}
