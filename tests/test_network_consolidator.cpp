#include <doctest/doctest.h>
#include "roads/NetworkConsolidator.h"
#include <limits>

using namespace RoadNet;

namespace {

RoadRecord makeRoad(glm::vec2 from, glm::vec2 to, RoadClass type, std::optional<float> demand) {
    RoadRecord road;
    road.type = type;
    road.width = getRoadWidth(type);
    road.path = {glm::vec3(from.x, 0.0f, from.y), glm::vec3(to.x, 0.0f, to.y)};
    road.from = road.path.front();
    road.to = road.path.back();
    road.demand = demand;
    return road;
}

} // namespace

TEST_SUITE("NetworkConsolidator") {
    TEST_CASE("parallel detection works in both directions") {
        RoadRecord a = makeRoad({0, 0}, {1000, 0}, RoadClass::Lane, 1.0f);
        RoadRecord sameWay = makeRoad({10, 5}, {990, -5}, RoadClass::Lane, 1.0f);
        RoadRecord reversed = makeRoad({1005, 0}, {-5, 0}, RoadClass::Lane, 1.0f);
        RoadRecord other = makeRoad({0, 0}, {0, 1000}, RoadClass::Lane, 1.0f);

        CHECK(NetworkConsolidator::areParallel(a, sameWay, 80.0f));
        CHECK(NetworkConsolidator::areParallel(a, reversed, 80.0f));
        CHECK_FALSE(NetworkConsolidator::areParallel(a, other, 80.0f));
        CHECK_FALSE(NetworkConsolidator::areParallel(a, sameWay, 5.0f));
    }

    TEST_CASE("higher demand road survives a merge") {
        NetworkConsolidator consolidator;

        std::vector<RoadRecord> roads = {
            makeRoad({0, 0}, {1000, 0}, RoadClass::Lane, 5.0f),
            makeRoad({1000, 10}, {0, 10}, RoadClass::Arterial, 12.0f),
            makeRoad({0, 0}, {0, 1000}, RoadClass::Lane, 3.0f)
        };

        auto result = consolidator.consolidate(roads, 50.0f);
        REQUIRE(result.size() == 2);
        CHECK(consolidator.getStats().merged == 1);
        CHECK(result[0].type == RoadClass::Arterial);
        CHECK(*result[0].demand == doctest::Approx(12.0f));
        CHECK(*result[1].demand == doctest::Approx(3.0f));
    }

    TEST_CASE("output contains no parallel pair and is idempotent") {
        NetworkConsolidator consolidator;

        std::vector<RoadRecord> roads;
        for (int i = 0; i < 6; i++) {
            float offset = static_cast<float>(i) * 15.0f;
            roads.push_back(makeRoad({offset, 0}, {1000 + offset, 0}, RoadClass::Lane, static_cast<float>(i)));
        }
        roads.push_back(makeRoad({0, 500}, {0, 1500}, RoadClass::Lane, 1.0f));
        roads.push_back(makeRoad({2000, 0}, {2000, 900}, RoadClass::Lane, 1.0f));

        auto once = consolidator.consolidate(roads, 40.0f);
        for (size_t i = 0; i < once.size(); i++) {
            for (size_t j = i + 1; j < once.size(); j++) {
                CHECK_FALSE(NetworkConsolidator::areParallel(once[i], once[j], 40.0f));
            }
        }

        auto twice = consolidator.consolidate(once, 40.0f);
        CHECK(consolidator.getStats().merged == 0);
        REQUIRE(twice.size() == once.size());
        for (size_t i = 0; i < once.size(); i++) {
            CHECK(twice[i].startPoint() == once[i].startPoint());
            CHECK(twice[i].endPoint() == once[i].endPoint());
        }
    }

    TEST_CASE("road value is demand per hundred meters") {
        CHECK(NetworkConsolidator::roadValue(makeRoad({0, 0}, {1000, 0}, RoadClass::Lane, 10.0f)) ==
              doctest::Approx(1.0f));
        CHECK(NetworkConsolidator::roadValue(makeRoad({0, 0}, {1000, 0}, RoadClass::Lane, std::nullopt)) == 0.0f);
        CHECK(NetworkConsolidator::roadValue(makeRoad({5, 5}, {5, 5}, RoadClass::Lane, 10.0f)) == 0.0f);
    }

    TEST_CASE("pruning drops low-value roads") {
        NetworkConsolidator consolidator;

        std::vector<RoadRecord> roads = {
            makeRoad({0, 0}, {1000, 0}, RoadClass::Lane, 50.0f),    // value 5
            makeRoad({0, 0}, {0, 1000}, RoadClass::Lane, 0.5f),     // value 0.05
            makeRoad({0, 0}, {500, 500}, RoadClass::Branch, std::nullopt)
        };

        auto result = consolidator.prune(roads, 1.0f);
        REQUIRE(result.size() == 2);
        CHECK(consolidator.getStats().pruned == 1);
        CHECK(*result[0].demand == doctest::Approx(50.0f));
        CHECK(result[1].type == RoadClass::Branch);
    }

    TEST_CASE("top tier roads are never pruned") {
        NetworkConsolidator consolidator;

        std::vector<RoadRecord> roads = {
            makeRoad({0, 0}, {5000, 0}, RoadClass::Highway, 0.0f),
            makeRoad({0, 0}, {0, 5000}, RoadClass::Highway, 0.001f),
            makeRoad({0, 0}, {100, 0}, RoadClass::Arterial, 1000.0f)
        };

        auto result = consolidator.prune(roads, std::numeric_limits<float>::infinity());
        REQUIRE(result.size() == 2);
        for (const auto& road : result) {
            CHECK(road.type == RoadClass::Highway);
        }
    }
}
