#include "hydro-mesh/src/Geometry/Rotation.hpp"

#include <Eigen/Geometry>

namespace hydro_mesh
{

Eigen::Matrix3d rotationMatrixFromVector(const Vector3D& angles)
{
  const double theta = angles.norm();
  if (theta == 0.0)
  {
    return Eigen::Matrix3d::Identity();
  }

  // R = cos(t) I + (1 - cos(t)) n n^T + sin(t) [n]x
  return Eigen::AngleAxisd{theta, angles / theta}.toRotationMatrix();
}

}  // namespace hydro_mesh
