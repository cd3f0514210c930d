#ifndef HYDRO_MESH_VECTOR3D_HPP
#define HYDRO_MESH_VECTOR3D_HPP

#include <format>

#include "hydro-mesh/src/DataTypes/Vec3DBase.hpp"

namespace hydro_mesh
{

/**
 * @brief Generic 3D vector type (normals, translations, rotation vectors)
 *
 * Memory footprint: 24 bytes (same as Eigen::Vector3d)
 */
struct Vector3D final : detail::Vec3DBase<Vector3D>
{
  using Vec3DBase::Vec3DBase;
  using Vec3DBase::operator=;

  template <typename OtherDerived>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Vector3D(const Eigen::MatrixBase<OtherDerived>& other) : Vec3DBase{other}
  {
  }
};

}  // namespace hydro_mesh

template <>
struct std::formatter<hydro_mesh::Vector3D>
  : hydro_mesh::detail::Vec3Formatter<hydro_mesh::Vector3D>
{
};

#endif  // HYDRO_MESH_VECTOR3D_HPP
