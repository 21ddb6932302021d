#pragma once

#include <cstdint>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <glm/vec3.hpp>

#include "parkour/scene/Components.hpp"

namespace parkour::physics
{
struct SolidBox
{
    parkour::scene::Entity entity = 0;
    glm::vec3 center{0.0F};
    glm::vec3 halfExtents{0.5F};
};

// Triangle used for ramps and other non axis-aligned surfaces.
// Both sides collide; the reported normal always faces the incoming ray.
struct SolidTriangle
{
    parkour::scene::Entity entity = 0;
    glm::vec3 a{0.0F};
    glm::vec3 b{0.0F};
    glm::vec3 c{0.0F};
};

struct RaycastHit
{
    parkour::scene::Entity entity = 0;
    float t = 1.0F;          // Fraction along the segment
    float distance = 0.0F;   // World units from the origin
    glm::vec3 position{0.0F};
    glm::vec3 normal{0.0F, 1.0F, 0.0F};
};

using EntityFilter = std::unordered_set<parkour::scene::Entity>;

class PhysicsWorld
{
public:
    void AddSolidBox(const SolidBox& box);
    void AddSolidTriangle(const SolidTriangle& triangle);
    // Adds two triangles spanning the quad a-b-c-d
    void AddSolidQuad(parkour::scene::Entity entity, const glm::vec3& a, const glm::vec3& b, const glm::vec3& c, const glm::vec3& d);

    /// Moves every box owned by `entity`. Returns true if any was found.
    bool UpdateBoxCenter(parkour::scene::Entity entity, const glm::vec3& newCenter);

    /// Direction does not need to be normalized. Entities in `exclude` are never reported.
    /// A box the ray starts inside has no entry surface and is not reported either.
    [[nodiscard]] std::optional<RaycastHit> CastRay(
        const glm::vec3& origin,
        const glm::vec3& direction,
        float maxDistance,
        const EntityFilter& exclude
    ) const;

private:
    struct CellKey
    {
        int x = 0;
        int y = 0;
        int z = 0;

        [[nodiscard]] bool operator==(const CellKey& other) const
        {
            return x == other.x && y == other.y && z == other.z;
        }
    };

    struct CellKeyHash
    {
        [[nodiscard]] std::size_t operator()(const CellKey& key) const
        {
            const std::size_t hx = static_cast<std::size_t>(key.x) * 73856093U;
            const std::size_t hy = static_cast<std::size_t>(key.y) * 19349663U;
            const std::size_t hz = static_cast<std::size_t>(key.z) * 83492791U;
            return hx ^ hy ^ hz;
        }
    };

    // Box indices occupy [0, solids) and triangle indices [solids, solids + triangles)
    [[nodiscard]] std::size_t ShapeCount() const { return m_solids.size() + m_triangles.size(); }
    void ShapeBounds(std::size_t shapeIndex, glm::vec3& outMin, glm::vec3& outMax) const;

    void RebuildSpatialIndex() const;
    void AppendShapeCandidates(const glm::vec3& minBounds, const glm::vec3& maxBounds, std::vector<std::size_t>& outIndices) const;

    [[nodiscard]] std::optional<RaycastHit> SegmentQuery(const glm::vec3& from, const glm::vec3& to, const EntityFilter& exclude) const;

    static bool SegmentIntersectsAabb3D(
        const glm::vec3& from,
        const glm::vec3& to,
        const glm::vec3& minBounds,
        const glm::vec3& maxBounds,
        float* outT,
        glm::vec3* outNormal
    );

    static bool SegmentIntersectsTriangle(
        const glm::vec3& from,
        const glm::vec3& to,
        const SolidTriangle& triangle,
        float* outT,
        glm::vec3* outNormal
    );

    std::vector<SolidBox> m_solids;
    std::vector<SolidTriangle> m_triangles;

    mutable std::unordered_map<CellKey, std::vector<std::size_t>, CellKeyHash> m_spatialCells;
    mutable std::vector<std::size_t> m_spatialScratch;
    mutable std::vector<std::uint32_t> m_spatialVisitStamp;
    mutable std::uint32_t m_spatialCurrentStamp = 1;
    mutable bool m_spatialDirty = true;
    float m_spatialCellSize = 8.0F;
};
} // namespace parkour::physics
