#pragma once

#include "RoadTypes.h"

namespace RoadNet {

struct ClassificationConfig {
    int highwayMaxPriority = 2;         // Both ends at least this important
    int highwayMinPopulation = 1500;    // Population served by a highway
    int arterialMaxPriority = 3;        // Better end at least this important
    int minorPriority = 4;              // Ends at or below this never get bridges
};

// Road tier a corridor may receive, from its endpoints' priority and population
RoadClass classifyCorridor(const Destination& a, const Destination& b, int populationServed,
                           const ClassificationConfig& config);

// Minor destinations only get land routes
bool allowsWaterCrossing(const Destination& a, const Destination& b, const ClassificationConfig& config);

} // namespace RoadNet
