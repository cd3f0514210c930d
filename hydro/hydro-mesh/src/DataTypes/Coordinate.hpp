#ifndef HYDRO_MESH_COORDINATE_HPP
#define HYDRO_MESH_COORDINATE_HPP

#include <format>
#include <vector>

#include "hydro-mesh/src/DataTypes/Vec3DBase.hpp"

namespace hydro_mesh
{

/**
 * @brief A point in 3D space (mesh vertex, face center, center of gravity)
 *
 * Thin wrapper around Eigen::Vector3d. Use Vector3D for directions.
 */
struct Coordinate final : detail::Vec3DBase<Coordinate>
{
  using Vec3DBase::Vec3DBase;
  using Vec3DBase::operator=;

  template <typename OtherDerived>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Coordinate(const Eigen::MatrixBase<OtherDerived>& other) : Vec3DBase{other}
  {
  }
};

using CoordinateList = std::vector<Coordinate>;

}  // namespace hydro_mesh

template <>
struct std::formatter<hydro_mesh::Coordinate>
  : hydro_mesh::detail::Vec3Formatter<hydro_mesh::Coordinate>
{
};

#endif  // HYDRO_MESH_COORDINATE_HPP
