#include <doctest/doctest.h>
#include "roads/HierarchicalBrancher.h"
#include <cmath>

using namespace RoadNet;

namespace {

RoadRecord makeTrunk(glm::vec2 from, glm::vec2 to, RoadClass type = RoadClass::Highway) {
    RoadRecord road;
    road.type = type;
    road.width = getRoadWidth(type);
    road.path = {glm::vec3(from.x, 10.0f, from.y), glm::vec3(to.x, 10.0f, to.y)};
    road.from = road.path.front();
    road.to = road.path.back();
    road.demand = 100.0f;
    return road;
}

BranchConfig deterministicConfig() {
    BranchConfig config;
    config.branchInterval = 300.0f;
    config.branchProbability = 1.0f;
    config.subBranchProbability = 0.0f;
    config.seed = 7;
    return config;
}

} // namespace

TEST_SUITE("HierarchicalBrancher") {
    TEST_CASE("width narrows with depth down to the minimum") {
        FunctionTerrain terrain = FunctionTerrain::flat(10.0f);
        RoadPathBuilder builder(terrain, nullptr, PathBuilderConfig());
        HierarchicalBrancher brancher(terrain, builder, BranchConfig());

        CHECK(brancher.widthAtDepth(0) == doctest::Approx(5.0f));
        CHECK(brancher.widthAtDepth(1) == doctest::Approx(4.0f));
        CHECK(brancher.widthAtDepth(5) == doctest::Approx(2.5f));
    }

    TEST_CASE("sub-branch probability decays with depth") {
        FunctionTerrain terrain = FunctionTerrain::flat(10.0f);
        RoadPathBuilder builder(terrain, nullptr, PathBuilderConfig());
        HierarchicalBrancher brancher(terrain, builder, BranchConfig());

        CHECK(brancher.childProbability(0) == doctest::Approx(0.15f));
        CHECK(brancher.childProbability(1) == doctest::Approx(0.10f));
        CHECK(brancher.childProbability(10) == doctest::Approx(0.0f));
    }

    TEST_CASE("branch points fall at every interval inside the trunk") {
        FunctionTerrain terrain = FunctionTerrain::flat(10.0f);
        RoadPathBuilder builder(terrain, nullptr, PathBuilderConfig());
        HierarchicalBrancher brancher(terrain, builder, deterministicConfig());

        auto distances = brancher.branchPointDistances(makeTrunk({-1000, 0}, {1000, 0}));
        REQUIRE(distances.size() == 6);
        CHECK(distances.front() == doctest::Approx(300.0f));
        CHECK(distances.back() == doctest::Approx(1800.0f));
    }

    TEST_CASE("dense areas shorten the branch interval") {
        FunctionTerrain terrain = FunctionTerrain::flat(10.0f);
        RoadPathBuilder builder(terrain, nullptr, PathBuilderConfig());
        HierarchicalBrancher brancher(terrain, builder, deterministicConfig());

        // Interval halves where density is 2 with the default scale
        brancher.setDensityLookup([](glm::vec2) { return 2.0f; });
        CHECK(brancher.branchPointDistances(makeTrunk({-1000, 0}, {1000, 0})).size() == 13);
    }

    TEST_CASE("a 2000m trunk grows one root branch per branch point") {
        FunctionTerrain terrain = FunctionTerrain::flat(10.0f);
        RoadPathBuilder builder(terrain, nullptr, PathBuilderConfig());
        HierarchicalBrancher brancher(terrain, builder, deterministicConfig());

        auto branches = brancher.generate({makeTrunk({-1000, 0}, {1000, 0})});

        CHECK(brancher.getStats().branchPoints == 6);
        CHECK(brancher.getStats().rootBranches == 6);
        REQUIRE(branches.size() == 6);

        for (const auto& branch : branches) {
            CHECK(branch.type == RoadClass::Branch);
            CHECK(branch.depth == 0);
            CHECK(branch.width == doctest::Approx(5.0f));
            CHECK_FALSE(branch.demand.has_value());

            // Starts on the trunk, heads away from it
            CHECK(branch.startPoint().z == doctest::Approx(0.0f));
            CHECK(std::abs(branch.endPoint().z) > 100.0f);
        }
    }

    TEST_CASE("branches alternate sides of the trunk") {
        FunctionTerrain terrain = FunctionTerrain::flat(10.0f);
        RoadPathBuilder builder(terrain, nullptr, PathBuilderConfig());
        HierarchicalBrancher brancher(terrain, builder, deterministicConfig());

        auto branches = brancher.generate({makeTrunk({-1000, 0}, {1000, 0})});
        REQUIRE(branches.size() == 6);
        for (size_t i = 1; i < branches.size(); i++) {
            CHECK(branches[i].endPoint().z * branches[i - 1].endPoint().z < 0.0f);
        }
    }

    TEST_CASE("only primary roads seed branches") {
        FunctionTerrain terrain = FunctionTerrain::flat(10.0f);
        RoadPathBuilder builder(terrain, nullptr, PathBuilderConfig());
        HierarchicalBrancher brancher(terrain, builder, deterministicConfig());

        auto branches = brancher.generate({makeTrunk({-1000, 0}, {1000, 0}, RoadClass::Lane)});
        CHECK(branches.empty());
        CHECK(brancher.getStats().branchPoints == 0);
    }

    TEST_CASE("branch depth stays below the maximum") {
        FunctionTerrain terrain = FunctionTerrain::flat(10.0f);
        RoadPathBuilder builder(terrain, nullptr, PathBuilderConfig());

        BranchConfig config = deterministicConfig();
        config.maxDepth = 2;
        config.subBranchProbability = 1.0f;
        config.subBranchDecay = 0.0f;
        HierarchicalBrancher brancher(terrain, builder, config);

        auto branches = brancher.generate({makeTrunk({-3000, 0}, {3000, 0})});
        CHECK(brancher.getStats().subBranches > 0);
        for (const auto& branch : branches) {
            CHECK(branch.depth < config.maxDepth);
        }
    }

    TEST_CASE("zero maximum depth grows no branches") {
        FunctionTerrain terrain = FunctionTerrain::flat(10.0f);
        RoadPathBuilder builder(terrain, nullptr, PathBuilderConfig());

        BranchConfig config = deterministicConfig();
        config.maxDepth = 0;
        HierarchicalBrancher brancher(terrain, builder, config);

        CHECK(brancher.generate({makeTrunk({-3000, 0}, {3000, 0})}).empty());
        CHECK(brancher.getStats().branchPoints == 0);
        CHECK(brancher.getStats().rootBranches == 0);
    }

    TEST_CASE("branches ending in water are rejected") {
        // Only a narrow dry strip along the trunk
        FunctionTerrain terrain([](float, float z) { return std::abs(z) < 50.0f ? 10.0f : -5.0f; },
                                [](float, float) { return 0.0f; });
        RoadPathBuilder builder(terrain, nullptr, PathBuilderConfig());
        HierarchicalBrancher brancher(terrain, builder, deterministicConfig());

        auto branches = brancher.generate({makeTrunk({-1000, 0}, {1000, 0})});
        CHECK(branches.empty());
        CHECK(brancher.getStats().rejectedWater == 6);
    }

    TEST_CASE("branches leaving the map are rejected") {
        FunctionTerrain terrain = FunctionTerrain::flat(10.0f);
        RoadPathBuilder builder(terrain, nullptr, PathBuilderConfig());

        BranchConfig config = deterministicConfig();
        config.terrainSize = 600.0f;
        config.boundaryMargin = 100.0f;
        config.branchInterval = 100.0f;
        config.minBranchLength = 300.0f;
        config.maxBranchLength = 400.0f;
        HierarchicalBrancher brancher(terrain, builder, config);

        auto branches = brancher.generate({makeTrunk({-150, 0}, {150, 0})});
        CHECK(branches.empty());
        CHECK(brancher.getStats().rejectedBoundary == 2);
    }

    TEST_CASE("branch ends snap onto nearby road endpoints") {
        FunctionTerrain terrain = FunctionTerrain::flat(10.0f);
        RoadPathBuilder builder(terrain, nullptr, PathBuilderConfig());

        BranchConfig config = deterministicConfig();
        config.angleVariance = 0.0f;
        config.minBranchLength = 200.0f;
        config.maxBranchLength = 200.0f;
        config.mergeRadius = 60.0f;
        HierarchicalBrancher brancher(terrain, builder, config);

        // A short lane whose end sits next to where the first branch will land
        RoadRecord trunk = makeTrunk({0, 0}, {500, 0});
        RoadRecord lane = makeTrunk({300, 400}, {300, 230}, RoadClass::Lane);

        auto branches = brancher.generate({trunk, lane});
        REQUIRE_FALSE(branches.empty());
        CHECK(brancher.getStats().snapped >= 1);
        CHECK(branches[0].endPoint().x == doctest::Approx(300.0f));
        CHECK(branches[0].endPoint().z == doctest::Approx(230.0f));
    }

    TEST_CASE("same seed gives the same branches") {
        FunctionTerrain terrain = FunctionTerrain::flat(10.0f);
        RoadPathBuilder builder(terrain, nullptr, PathBuilderConfig());

        BranchConfig config;
        config.seed = 99;
        HierarchicalBrancher first(terrain, builder, config);
        HierarchicalBrancher second(terrain, builder, config);

        std::vector<RoadRecord> trunks = {makeTrunk({-2000, 0}, {2000, 0}), makeTrunk({0, -2000}, {0, 2000})};
        auto a = first.generate(trunks);
        auto b = second.generate(trunks);

        REQUIRE(a.size() == b.size());
        for (size_t i = 0; i < a.size(); i++) {
            CHECK(a[i].endPoint() == b[i].endPoint());
        }
    }
}
