#pragma once

#include <vector>
#include <glm/glm.hpp>

namespace RoadNet {

struct PathRequest {
    float gridResolution = 16.0f;   // Meters per pathfinding cell
    bool allowBridges = true;       // Whether water cells may be crossed
};

// Terrain-aware route finder between two world points.
// A result with fewer than 2 points means no path was found.
class Pathfinder {
public:
    virtual ~Pathfinder() = default;

    virtual std::vector<glm::vec3> findPath(const glm::vec3& from, const glm::vec3& to,
                                            const PathRequest& request) = 0;
};

} // namespace RoadNet
