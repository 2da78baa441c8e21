// Ticket: 0002_polygon_mesh

#include "sepax-sim/src/Physics/Collision/PolygonMesh.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace sepax_sim
{

namespace
{

// Vertices closer than this to a face plane count as lying on it
constexpr double kFlatMeshTolerance{1e-9};

// True if the face loop walks directly between vertices a and b (either way)
bool faceContainsEdge(const MeshFace& face, const MeshEdge& edge)
{
  const auto& loop = face.vertexIndices;
  for (size_t i = 0; i < loop.size(); ++i)
  {
    size_t const current = loop[i];
    size_t const next = loop[(i + 1) % loop.size()];
    if ((current == edge.first && next == edge.second) ||
        (current == edge.second && next == edge.first))
    {
      return true;
    }
  }
  return false;
}

}  // namespace

PolygonMesh::PolygonMesh(std::vector<Point> vertices,
                         std::vector<MeshFace> faces,
                         std::vector<MeshEdge> edges)
  : vertices_{std::move(vertices)},
    faces_{std::move(faces)},
    edges_{std::move(edges)},
    centroid_{Point::averageOf(vertices_)}
{
  for (const auto& face : faces_)
  {
    if (face.vertexIndices.size() < 3)
    {
      throw std::invalid_argument("Mesh face needs at least three vertices");
    }
    for (size_t index : face.vertexIndices)
    {
      if (index >= vertices_.size())
      {
        throw std::out_of_range("Mesh face references vertex " +
                                std::to_string(index) + " of " +
                                std::to_string(vertices_.size()));
      }
    }
  }

  for (const auto& [start, end] : edges_)
  {
    if (start >= vertices_.size() || end >= vertices_.size())
    {
      throw std::out_of_range("Mesh edge (" + std::to_string(start) + ", " +
                              std::to_string(end) +
                              ") references a missing vertex");
    }
    if (start == end)
    {
      throw std::invalid_argument("Mesh edge must join two distinct vertices");
    }
  }

  buildCollisionFaces();
}

PolygonMesh PolygonMesh::createRectangle(const Point& center,
                                         const Direction& tangent,
                                         const Direction& bitangent)
{
  Direction const normal =
    tangent.normalized().cross(bitangent.normalized()).normalized();

  Direction const halfTangent{tangent / 2.0};
  Direction const halfBitangent{bitangent / 2.0};

  std::vector<Point> vertices{
    Point{center + halfTangent + halfBitangent},
    Point{center - halfTangent + halfBitangent},
    Point{center - halfTangent - halfBitangent},
    Point{center + halfTangent - halfBitangent}};

  std::vector<MeshFace> faces{MeshFace{Plane{normal, center}, {0, 1, 2, 3}}};

  std::vector<MeshEdge> edges{{0, 1}, {1, 2}, {2, 3}, {3, 0}};

  return PolygonMesh{std::move(vertices), std::move(faces), std::move(edges)};
}

PolygonMesh PolygonMesh::createCuboid(const Point& center,
                                      const Direction& tangent,
                                      const Direction& bitangent,
                                      double depth)
{
  if (!(depth > 0.0))
  {
    throw std::invalid_argument("Cuboid depth must be positive, got: " +
                                std::to_string(depth));
  }

  Direction const unitTangent = tangent.normalized();
  Direction const unitBitangent = bitangent.normalized();
  Direction const normal = unitTangent.cross(unitBitangent).normalized();

  Direction const halfTangent{tangent / 2.0};
  Direction const halfBitangent{bitangent / 2.0};
  Direction const halfDepth{normal * (depth / 2.0)};

  std::vector<Point> vertices{
    // Top face (+normal)
    Point{center + halfTangent + halfBitangent + halfDepth},
    Point{center - halfTangent + halfBitangent + halfDepth},
    Point{center - halfTangent - halfBitangent + halfDepth},
    Point{center + halfTangent - halfBitangent + halfDepth},
    // Bottom face (-normal)
    Point{center + halfTangent + halfBitangent - halfDepth},
    Point{center + halfTangent - halfBitangent - halfDepth},
    Point{center - halfTangent - halfBitangent - halfDepth},
    Point{center - halfTangent + halfBitangent - halfDepth}};

  std::vector<MeshFace> faces{
    MeshFace{Plane{unitTangent, center.displace(halfTangent)}, {0, 3, 5, 4}},
    MeshFace{Plane{unitTangent.opposite(), center.displace(halfTangent.opposite())},
             {2, 1, 7, 6}},
    MeshFace{Plane{unitBitangent, center.displace(halfBitangent)}, {0, 1, 7, 4}},
    MeshFace{Plane{unitBitangent.opposite(),
                   center.displace(halfBitangent.opposite())},
             {3, 2, 6, 5}},
    MeshFace{Plane{normal, center.displace(halfDepth)}, {0, 1, 2, 3}},
    MeshFace{Plane{normal.opposite(), center.displace(halfDepth.opposite())},
             {4, 5, 6, 7}}};

  std::vector<MeshEdge> edges{
    // Top face
    {0, 1},
    {1, 2},
    {2, 3},
    {3, 0},
    // Bottom face
    {4, 5},
    {5, 6},
    {6, 7},
    {7, 4},
    // Sides
    {0, 4},
    {3, 5},
    {2, 6},
    {1, 7}};

  return PolygonMesh{std::move(vertices), std::move(faces), std::move(edges)};
}

LineSegment PolygonMesh::getEdgeSegment(size_t edgeIndex) const
{
  const MeshEdge& edge = edges_.at(edgeIndex);
  return LineSegment{vertices_[edge.first], vertices_[edge.second]};
}

std::vector<std::vector<Point>> PolygonMesh::getFaceVertices() const
{
  std::vector<std::vector<Point>> loops;
  loops.reserve(faces_.size());
  for (const auto& face : faces_)
  {
    std::vector<Point> loop;
    loop.reserve(face.vertexIndices.size());
    for (size_t index : face.vertexIndices)
    {
      loop.push_back(vertices_[index]);
    }
    loops.push_back(std::move(loop));
  }
  return loops;
}

void PolygonMesh::buildCollisionFaces()
{
  collisionFaces_.clear();
  collisionFaces_.reserve(2 * faces_.size() + edges_.size());

  for (const auto& face : faces_)
  {
    collisionFaces_.push_back(face.plane);
  }

  for (const auto& edge : edges_)
  {
    const MeshFace* owner = nullptr;
    size_t ownerCount = 0;
    for (const auto& face : faces_)
    {
      if (faceContainsEdge(face, edge))
      {
        owner = &face;
        ++ownerCount;
      }
    }

    // Interior edges of a closed solid are already covered by both faces
    if (ownerCount != 1)
    {
      continue;
    }

    const Point& start = vertices_[edge.first];
    Direction const edgeDirection =
      Direction::between(start, vertices_[edge.second]);
    Direction bevelNormal = owner->plane.getNormal().cross(edgeDirection);
    if (bevelNormal.isZero())
    {
      continue;
    }

    if (bevelNormal.dot(Direction::between(start, centroid_)) > 0.0)
    {
      bevelNormal = bevelNormal.opposite();
    }
    collisionFaces_.emplace_back(bevelNormal, start);
  }

  // Every vertex of a flat mesh lies on its face, so the reversed face
  // bounds the mesh from behind
  for (const auto& face : faces_)
  {
    bool const flat =
      std::all_of(vertices_.begin(), vertices_.end(), [&face](const Point& vertex) {
        return std::abs(face.plane.distanceTo(vertex)) <= kFlatMeshTolerance;
      });
    if (flat)
    {
      collisionFaces_.push_back(face.plane.opposite());
    }
  }
}

}  // namespace sepax_sim
