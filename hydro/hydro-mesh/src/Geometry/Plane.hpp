#ifndef HYDRO_MESH_GEOMETRY_PLANE_HPP
#define HYDRO_MESH_GEOMETRY_PLANE_HPP

#include <vector>

#include "hydro-mesh/src/DataTypes/Coordinate.hpp"
#include "hydro-mesh/src/DataTypes/Vector3D.hpp"

namespace hydro_mesh
{

/**
 * @brief Oriented plane defined by a unit normal n and a scalar offset c.
 *
 * A point p lies on the plane when n . p == c. Used for orthogonal projection
 * (conformality check) and for mirroring / symmetrizing meshes.
 */
class Plane
{
public:
  /**
   * @brief Default constructor - the Oxy plane (normal +z, offset 0)
   */
  Plane();

  /**
   * @brief Construct a plane from a normal and an offset
   *
   * The normal is normalized on construction.
   *
   * @param normal Plane normal (any non-zero length)
   * @param offset Signed distance c from the origin along the unit normal
   * @throws std::invalid_argument if normal has zero length
   */
  explicit Plane(const Vector3D& normal, double offset = 0.0);

  [[nodiscard]] const Vector3D& getNormal() const;
  [[nodiscard]] double getOffset() const;

  /**
   * @brief Replace the plane normal, keeping the offset
   * @throws std::invalid_argument if normal has zero length
   */
  void setNormal(const Vector3D& normal);

  void setOffset(double offset);

  /**
   * @brief Signed distance from a point to the plane (positive on the normal
   * side)
   */
  [[nodiscard]] double distanceTo(const Coordinate& point) const;

  [[nodiscard]] Coordinate orthogonalProjection(const Coordinate& point) const;

  /**
   * @brief Project a point set orthogonally onto the plane
   * @param points Points to project
   * @return Projected points, same order as the input
   */
  [[nodiscard]] std::vector<Coordinate> orthogonalProjection(
    const std::vector<Coordinate>& points) const;

  /**
   * @brief Mirror image of a point: p' = p - 2 n (n . p - c)
   */
  [[nodiscard]] Coordinate reflect(const Coordinate& point) const;

private:
  Vector3D normal_;
  double offset_;
};

}  // namespace hydro_mesh

#endif  // HYDRO_MESH_GEOMETRY_PLANE_HPP
