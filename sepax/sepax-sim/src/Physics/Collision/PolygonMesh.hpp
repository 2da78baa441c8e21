// Ticket: 0002_polygon_mesh

#ifndef SEPAX_SIM_PHYSICS_POLYGON_MESH_HPP
#define SEPAX_SIM_PHYSICS_POLYGON_MESH_HPP

#include <cstddef>
#include <utility>
#include <vector>

#include "sepax-sim/src/Geometry/Direction.hpp"
#include "sepax-sim/src/Geometry/LineSegment.hpp"
#include "sepax-sim/src/Geometry/Plane.hpp"
#include "sepax-sim/src/Geometry/Point.hpp"

namespace sepax_sim
{

/**
 * @brief A planar face of a mesh: its outward plane and vertex loop
 */
struct MeshFace
{
  Plane plane;
  std::vector<size_t> vertexIndices;
};

/// Pair of vertex indices (start, end)
using MeshEdge = std::pair<size_t, size_t>;

/**
 * @brief Convex polygon mesh used as a collision shape.
 *
 * Stores vertices, faces and edges in the object's local frame. On
 * construction the mesh derives its collision faces: every face plane, then
 * one bevel plane per boundary edge (an edge used by exactly one face), then
 * the reversed plane of every face that all vertices lie on. Bevel planes
 * give flat shapes such as rectangles the side axes that face-only SAT would
 * miss, and the reversed plane covers objects behind a flat shape. A closed
 * solid such as a cuboid has neither.
 *
 * Face planes are expected to point outward. Bevel normals are
 * face-normal × edge-direction, flipped if necessary so they point away from
 * the mesh interior.
 *
 * Usage:
 * @code
 * auto ground = PolygonMesh::createRectangle(Point{0, 0, 0},
 *                                            Direction{0, 0, 10},
 *                                            Direction{10, 0, 0});
 * auto box = PolygonMesh::createCuboid(Point{0, 0, 0},
 *                                      Direction{1, 0, 0},
 *                                      Direction{0, 1, 0},
 *                                      1.0);
 * @endcode
 *
 * @ticket 0002_polygon_mesh
 */
class PolygonMesh
{
public:
  /**
   * @brief Construct a mesh from explicit vertices, faces and edges
   *
   * @throws std::out_of_range if a face or edge references a missing vertex
   * @throws std::invalid_argument if a face has fewer than three vertices or
   *         an edge joins a vertex to itself
   */
  PolygonMesh(std::vector<Point> vertices,
              std::vector<MeshFace> faces,
              std::vector<MeshEdge> edges);

  /**
   * @brief Create a flat rectangle (4 vertices, 1 face, 4 edges)
   *
   * @param center Rectangle center
   * @param tangent First side; its length is the full side length
   * @param bitangent Second side; its length is the full side length
   * @return Mesh whose face normal is tangent × bitangent (normalized)
   */
  static PolygonMesh createRectangle(const Point& center,
                                     const Direction& tangent,
                                     const Direction& bitangent);

  /**
   * @brief Create a cuboid (8 vertices, 6 faces, 12 edges)
   *
   * @param center Cuboid center
   * @param tangent First side (full length)
   * @param bitangent Second side (full length)
   * @param depth Extent along tangent × bitangent (full length)
   * @throws std::invalid_argument if depth is not positive
   */
  static PolygonMesh createCuboid(const Point& center,
                                  const Direction& tangent,
                                  const Direction& bitangent,
                                  double depth);

  [[nodiscard]] const std::vector<Point>& getVertices() const
  {
    return vertices_;
  }

  [[nodiscard]] const std::vector<MeshFace>& getFaces() const
  {
    return faces_;
  }

  /**
   * @brief Face planes, boundary-edge bevels, then reversed flat faces
   */
  [[nodiscard]] const std::vector<Plane>& getCollisionFaces() const
  {
    return collisionFaces_;
  }

  [[nodiscard]] const std::vector<MeshEdge>& getEdges() const
  {
    return edges_;
  }

  /**
   * @brief Edge as a local-frame segment
   * @throws std::out_of_range if @p edgeIndex is invalid
   */
  [[nodiscard]] LineSegment getEdgeSegment(size_t edgeIndex) const;

  /**
   * @brief Vertex positions of every face loop, in loop order
   *
   * Intended for render collaborators that draw the collision shape.
   */
  [[nodiscard]] std::vector<std::vector<Point>> getFaceVertices() const;

  /**
   * @brief Average of the mesh vertices (local frame)
   */
  [[nodiscard]] const Point& getCentroid() const
  {
    return centroid_;
  }

private:
  void buildCollisionFaces();

  std::vector<Point> vertices_;
  std::vector<MeshFace> faces_;
  std::vector<MeshEdge> edges_;
  std::vector<Plane> collisionFaces_;
  Point centroid_;
};

}  // namespace sepax_sim

#endif  // SEPAX_SIM_PHYSICS_POLYGON_MESH_HPP
