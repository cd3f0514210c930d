#ifndef HYDRO_MESH_GEOMETRY_ROTATION_HPP
#define HYDRO_MESH_GEOMETRY_ROTATION_HPP

#include <Eigen/Dense>

#include "hydro-mesh/src/DataTypes/Vector3D.hpp"

namespace hydro_mesh
{

/**
 * @brief Rotation matrix for a rotation vector (Rodrigues' formula).
 *
 * The rotation angle is |angles| and the rotation axis is angles / |angles|,
 * expressed in the fixed frame. Rotations about the three coordinate axes are
 * the special cases (theta, 0, 0), (0, theta, 0) and (0, 0, theta).
 *
 * @param angles Rotation vector [rad]
 * @return 3x3 rotation matrix; identity for a zero vector
 */
Eigen::Matrix3d rotationMatrixFromVector(const Vector3D& angles);

}  // namespace hydro_mesh

#endif  // HYDRO_MESH_GEOMETRY_ROTATION_HPP
