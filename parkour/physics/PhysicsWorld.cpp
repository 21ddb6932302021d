#include "parkour/physics/PhysicsWorld.hpp"

#include <algorithm>
#include <cmath>

#include <glm/common.hpp>
#include <glm/geometric.hpp>
#include <glm/vector_relational.hpp>

namespace parkour::physics
{
namespace
{
constexpr float kParallelEpsilon = 1.0e-7F;

int CellCoord(float value, float cellSize)
{
    return static_cast<int>(std::floor(value / std::max(0.001F, cellSize)));
}
} // namespace

void PhysicsWorld::AddSolidBox(const SolidBox& box)
{
    m_solids.push_back(box);
    m_spatialDirty = true;
}

void PhysicsWorld::AddSolidTriangle(const SolidTriangle& triangle)
{
    m_triangles.push_back(triangle);
    m_spatialDirty = true;
}

void PhysicsWorld::AddSolidQuad(
    parkour::scene::Entity entity,
    const glm::vec3& a,
    const glm::vec3& b,
    const glm::vec3& c,
    const glm::vec3& d
)
{
    AddSolidTriangle(SolidTriangle{entity, a, b, c});
    AddSolidTriangle(SolidTriangle{entity, a, c, d});
}

bool PhysicsWorld::UpdateBoxCenter(parkour::scene::Entity entity, const glm::vec3& newCenter)
{
    bool found = false;
    for (SolidBox& box : m_solids)
    {
        if (box.entity == entity)
        {
            box.center = newCenter;
            found = true;
        }
    }
    if (found)
    {
        m_spatialDirty = true;
    }
    return found;
}

std::optional<RaycastHit> PhysicsWorld::CastRay(
    const glm::vec3& origin,
    const glm::vec3& direction,
    float maxDistance,
    const EntityFilter& exclude
) const
{
    const float length = glm::length(direction);
    if (length < kParallelEpsilon || maxDistance <= 0.0F)
    {
        return std::nullopt;
    }

    const glm::vec3 to = origin + (direction / length) * maxDistance;
    std::optional<RaycastHit> hit = SegmentQuery(origin, to, exclude);
    if (hit.has_value())
    {
        hit->distance = hit->t * maxDistance;
    }
    return hit;
}

std::optional<RaycastHit> PhysicsWorld::SegmentQuery(const glm::vec3& from, const glm::vec3& to, const EntityFilter& exclude) const
{
    std::optional<RaycastHit> best;

    const glm::vec3 queryMinBounds = glm::min(from, to);
    const glm::vec3 queryMaxBounds = glm::max(from, to);
    AppendShapeCandidates(queryMinBounds, queryMaxBounds, m_spatialScratch);

    const float segmentLength = glm::length(to - from);

    for (const std::size_t index : m_spatialScratch)
    {
        parkour::scene::Entity entity = 0;
        float hitT = 1.0F;
        glm::vec3 hitNormal{0.0F, 1.0F, 0.0F};
        bool intersects = false;

        if (index < m_solids.size())
        {
            const SolidBox& box = m_solids[index];
            entity = box.entity;
            if (exclude.contains(entity))
            {
                continue;
            }
            intersects = SegmentIntersectsAabb3D(from, to, box.center - box.halfExtents, box.center + box.halfExtents, &hitT, &hitNormal);
        }
        else
        {
            const SolidTriangle& triangle = m_triangles[index - m_solids.size()];
            entity = triangle.entity;
            if (exclude.contains(entity))
            {
                continue;
            }
            intersects = SegmentIntersectsTriangle(from, to, triangle, &hitT, &hitNormal);
        }

        if (!intersects)
        {
            continue;
        }

        if (!best.has_value() || hitT < best->t)
        {
            RaycastHit hit;
            hit.entity = entity;
            hit.t = hitT;
            hit.distance = hitT * segmentLength;
            hit.normal = hitNormal;
            hit.position = from + (to - from) * hitT;
            best = hit;
        }
    }

    return best;
}

bool PhysicsWorld::SegmentIntersectsAabb3D(
    const glm::vec3& from,
    const glm::vec3& to,
    const glm::vec3& minBounds,
    const glm::vec3& maxBounds,
    float* outT,
    glm::vec3* outNormal
)
{
    // Starting strictly inside there is no face the segment enters through
    if (glm::all(glm::greaterThan(from, minBounds)) && glm::all(glm::lessThan(from, maxBounds)))
    {
        return false;
    }

    const glm::vec3 direction = to - from;

    float tMin = 0.0F;
    float tMax = 1.0F;
    glm::vec3 bestNormal{0.0F, 1.0F, 0.0F};

    for (int axis = 0; axis < 3; ++axis)
    {
        const float start = from[axis];
        const float dir = direction[axis];
        const float minAxis = minBounds[axis];
        const float maxAxis = maxBounds[axis];

        if (std::abs(dir) < kParallelEpsilon)
        {
            if (start < minAxis || start > maxAxis)
            {
                return false;
            }
            continue;
        }

        const float invDir = 1.0F / dir;
        float t1 = (minAxis - start) * invDir;
        float t2 = (maxAxis - start) * invDir;

        glm::vec3 nearNormal{0.0F};
        nearNormal[axis] = (invDir >= 0.0F) ? -1.0F : 1.0F;

        if (t1 > t2)
        {
            std::swap(t1, t2);
        }

        // >= so a segment starting on a face still reports that face
        if (t1 >= tMin)
        {
            tMin = t1;
            bestNormal = nearNormal;
        }

        tMax = std::min(tMax, t2);
        if (tMin > tMax)
        {
            return false;
        }
    }

    if (tMin < 0.0F || tMin > 1.0F)
    {
        return false;
    }

    if (outT != nullptr)
    {
        *outT = tMin;
    }
    if (outNormal != nullptr)
    {
        *outNormal = bestNormal;
    }

    return true;
}

bool PhysicsWorld::SegmentIntersectsTriangle(
    const glm::vec3& from,
    const glm::vec3& to,
    const SolidTriangle& triangle,
    float* outT,
    glm::vec3* outNormal
)
{
    // Moller-Trumbore, two-sided
    const glm::vec3 direction = to - from;
    const glm::vec3 edge1 = triangle.b - triangle.a;
    const glm::vec3 edge2 = triangle.c - triangle.a;

    const glm::vec3 p = glm::cross(direction, edge2);
    const float det = glm::dot(edge1, p);
    if (std::abs(det) < kParallelEpsilon)
    {
        return false;
    }

    const float invDet = 1.0F / det;
    const glm::vec3 s = from - triangle.a;
    const float u = glm::dot(s, p) * invDet;
    if (u < 0.0F || u > 1.0F)
    {
        return false;
    }

    const glm::vec3 q = glm::cross(s, edge1);
    const float v = glm::dot(direction, q) * invDet;
    if (v < 0.0F || u + v > 1.0F)
    {
        return false;
    }

    const float t = glm::dot(edge2, q) * invDet;
    if (t < 0.0F || t > 1.0F)
    {
        return false;
    }

    glm::vec3 normal = glm::cross(edge1, edge2);
    const float normalLength = glm::length(normal);
    if (normalLength < kParallelEpsilon)
    {
        return false;
    }
    normal /= normalLength;
    if (glm::dot(normal, direction) > 0.0F)
    {
        normal = -normal;
    }

    if (outT != nullptr)
    {
        *outT = t;
    }
    if (outNormal != nullptr)
    {
        *outNormal = normal;
    }
    return true;
}

void PhysicsWorld::ShapeBounds(std::size_t shapeIndex, glm::vec3& outMin, glm::vec3& outMax) const
{
    if (shapeIndex < m_solids.size())
    {
        const SolidBox& box = m_solids[shapeIndex];
        outMin = box.center - box.halfExtents;
        outMax = box.center + box.halfExtents;
        return;
    }

    const SolidTriangle& triangle = m_triangles[shapeIndex - m_solids.size()];
    outMin = glm::min(triangle.a, glm::min(triangle.b, triangle.c));
    outMax = glm::max(triangle.a, glm::max(triangle.b, triangle.c));
}

void PhysicsWorld::RebuildSpatialIndex() const
{
    if (!m_spatialDirty)
    {
        return;
    }

    m_spatialCells.clear();
    m_spatialVisitStamp.assign(ShapeCount(), 0U);

    for (std::size_t index = 0; index < ShapeCount(); ++index)
    {
        glm::vec3 minBounds{0.0F};
        glm::vec3 maxBounds{0.0F};
        ShapeBounds(index, minBounds, maxBounds);

        const int minX = CellCoord(minBounds.x, m_spatialCellSize);
        const int minY = CellCoord(minBounds.y, m_spatialCellSize);
        const int minZ = CellCoord(minBounds.z, m_spatialCellSize);
        const int maxX = CellCoord(maxBounds.x, m_spatialCellSize);
        const int maxY = CellCoord(maxBounds.y, m_spatialCellSize);
        const int maxZ = CellCoord(maxBounds.z, m_spatialCellSize);

        for (int z = minZ; z <= maxZ; ++z)
        {
            for (int y = minY; y <= maxY; ++y)
            {
                for (int x = minX; x <= maxX; ++x)
                {
                    m_spatialCells[CellKey{x, y, z}].push_back(index);
                }
            }
        }
    }

    m_spatialCurrentStamp = 1;
    m_spatialDirty = false;
}

void PhysicsWorld::AppendShapeCandidates(
    const glm::vec3& minBounds,
    const glm::vec3& maxBounds,
    std::vector<std::size_t>& outIndices
) const
{
    RebuildSpatialIndex();
    outIndices.clear();

    if (ShapeCount() == 0)
    {
        return;
    }

    if (m_spatialVisitStamp.size() != ShapeCount())
    {
        m_spatialVisitStamp.assign(ShapeCount(), 0U);
    }

    ++m_spatialCurrentStamp;
    if (m_spatialCurrentStamp == 0)
    {
        std::fill(m_spatialVisitStamp.begin(), m_spatialVisitStamp.end(), 0U);
        m_spatialCurrentStamp = 1;
    }

    const int minX = CellCoord(minBounds.x, m_spatialCellSize);
    const int minY = CellCoord(minBounds.y, m_spatialCellSize);
    const int minZ = CellCoord(minBounds.z, m_spatialCellSize);
    const int maxX = CellCoord(maxBounds.x, m_spatialCellSize);
    const int maxY = CellCoord(maxBounds.y, m_spatialCellSize);
    const int maxZ = CellCoord(maxBounds.z, m_spatialCellSize);

    for (int z = minZ; z <= maxZ; ++z)
    {
        for (int y = minY; y <= maxY; ++y)
        {
            for (int x = minX; x <= maxX; ++x)
            {
                const auto cellIt = m_spatialCells.find(CellKey{x, y, z});
                if (cellIt == m_spatialCells.end())
                {
                    continue;
                }

                for (const std::size_t shapeIndex : cellIt->second)
                {
                    if (shapeIndex >= m_spatialVisitStamp.size())
                    {
                        continue;
                    }
                    if (m_spatialVisitStamp[shapeIndex] == m_spatialCurrentStamp)
                    {
                        continue;
                    }
                    m_spatialVisitStamp[shapeIndex] = m_spatialCurrentStamp;
                    outIndices.push_back(shapeIndex);
                }
            }
        }
    }
}
} // namespace parkour::physics
