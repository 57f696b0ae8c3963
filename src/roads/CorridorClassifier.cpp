#include "CorridorClassifier.h"
#include <algorithm>

namespace RoadNet {

RoadClass classifyCorridor(const Destination& a, const Destination& b, int populationServed,
                           const ClassificationConfig& config) {
    int best = std::min(a.priority, b.priority);
    int worst = std::max(a.priority, b.priority);

    if (worst <= config.highwayMaxPriority && populationServed >= config.highwayMinPopulation) {
        return RoadClass::Highway;
    }

    if (best <= config.arterialMaxPriority) {
        return RoadClass::Arterial;
    }

    if (a.kind == DestinationKind::Settlement && b.kind == DestinationKind::Settlement) {
        return RoadClass::SettlementRoad;
    }

    return RoadClass::Lane;
}

bool allowsWaterCrossing(const Destination& a, const Destination& b, const ClassificationConfig& config) {
    return a.priority < config.minorPriority && b.priority < config.minorPriority;
}

} // namespace RoadNet
