#ifndef HYDRO_MESH_FACE_HPP
#define HYDRO_MESH_FACE_HPP

#include <array>
#include <cstddef>
#include <utility>
#include <vector>

namespace hydro_mesh
{

/**
 * @brief A mesh face stored as 4 vertex-index slots.
 *
 * Quadrangles use the 4 slots in counterclockwise order (seen from outside).
 * Triangles repeat their first index in the last slot, so that
 * `vertexIndices[0] == vertexIndices[3]` holds iff the face is a triangle.
 */
struct Face
{
  static constexpr size_t kFaceSlots = 4;

  std::array<size_t, kFaceSlots> vertexIndices{};

  Face() = default;

  /// Triangle (v0, v1, v2), stored as (v0, v1, v2, v0)
  Face(size_t v0, size_t v1, size_t v2) : vertexIndices{v0, v1, v2, v0}
  {
  }

  /// Quadrangle (v0, v1, v2, v3)
  Face(size_t v0, size_t v1, size_t v2, size_t v3)
    : vertexIndices{v0, v1, v2, v3}
  {
  }

  [[nodiscard]] bool isTriangle() const
  {
    return vertexIndices[0] == vertexIndices[3];
  }

  /// Number of geometric vertices (3 or 4)
  [[nodiscard]] size_t vertexCount() const
  {
    return isTriangle() ? 3 : 4;
  }

  /**
   * @brief Reverse the winding, keeping the first vertex in place.
   *
   * A triangle (a, b, c, a) becomes (a, c, b, a) and a quadrangle
   * (a, b, c, d) becomes (a, d, c, b). Keeping the first vertex keeps the
   * (v0, v2) splitting diagonal of quadrangles, so areas and centers do not
   * change.
   */
  void reverse()
  {
    if (isTriangle())
    {
      std::swap(vertexIndices[1], vertexIndices[2]);
    }
    else
    {
      std::swap(vertexIndices[1], vertexIndices[3]);
    }
  }

  [[nodiscard]] Face reversed() const
  {
    Face face{*this};
    face.reverse();
    return face;
  }

  size_t& operator[](size_t slot)
  {
    return vertexIndices[slot];
  }

  size_t operator[](size_t slot) const
  {
    return vertexIndices[slot];
  }

  bool operator==(const Face& other) const = default;
};

using FaceList = std::vector<Face>;

}  // namespace hydro_mesh

#endif  // HYDRO_MESH_FACE_HPP
