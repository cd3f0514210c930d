#include "hydro-mesh/src/Geometry/TriangleIntegrals.hpp"

namespace hydro_mesh
{

FaceSurfaceIntegrals computeTriangleIntegrals(const Coordinate& p0,
                                              const Coordinate& p1,
                                              const Coordinate& p2)
{
  const Eigen::Array3d a0 = p0.array();
  const Eigen::Array3d a1 = p1.array();
  const Eigen::Array3d a2 = p2.array();

  // Subexpressions, evaluated for x, y and z at once
  const Eigen::Array3d t0 = a0 + a1;
  const Eigen::Array3d f1 = t0 + a2;
  const Eigen::Array3d t1 = a0 * a0;
  const Eigen::Array3d t2 = t1 + a1 * t0;
  const Eigen::Array3d f2 = t2 + a2 * f1;
  const Eigen::Array3d f3 = a0 * t1 + a1 * t2 + a2 * f2;
  const Eigen::Array3d g0 = f2 + a0 * (f1 + a0);
  const Eigen::Array3d g1 = f2 + a1 * (f1 + a1);
  const Eigen::Array3d g2 = f2 + a2 * (f1 + a2);

  const double delta = (p1 - p0).cross(p2 - p0).norm();

  // int u v dS = delta / 24 * (sum_i u_i v_i + (sum_i u_i)(sum_i v_i))
  auto mixedSecondOrder = [&](Eigen::Index u, Eigen::Index v)
  {
    const double diagonal =
      a0[u] * a0[v] + a1[u] * a1[v] + a2[u] * a2[v];
    return delta * (diagonal + f1[u] * f1[v]) / 24.0;
  };

  FaceSurfaceIntegrals integrals;
  integrals.segment<3>(kIntX) = delta * f1.matrix() / 6.0;

  integrals[kIntYZ] = mixedSecondOrder(1, 2);
  integrals[kIntXZ] = mixedSecondOrder(0, 2);
  integrals[kIntXY] = mixedSecondOrder(0, 1);

  integrals.segment<3>(kIntXX) = delta * f2.matrix() / 12.0;
  integrals.segment<3>(kIntXXX) = delta * f3.matrix() / 20.0;

  integrals[kIntXXY] =
    delta * (a0[1] * g0[0] + a1[1] * g1[0] + a2[1] * g2[0]) / 60.0;
  integrals[kIntYYZ] =
    delta * (a0[2] * g0[1] + a1[2] * g1[1] + a2[2] * g2[1]) / 60.0;
  integrals[kIntZZX] =
    delta * (a0[0] * g0[2] + a1[0] * g1[2] + a2[0] * g2[2]) / 60.0;

  return integrals;
}

}  // namespace hydro_mesh
