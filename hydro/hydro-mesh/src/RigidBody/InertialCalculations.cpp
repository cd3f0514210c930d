#include "hydro-mesh/src/RigidBody/InertialCalculations.hpp"

#include <format>
#include <stdexcept>

#include "hydro-mesh/src/Geometry/TriangleIntegrals.hpp"
#include "hydro-mesh/src/Mesh/Mesh.hpp"

namespace hydro_mesh
{
namespace InertialCalculations
{

RigidBodyInertia evalPlainMeshInertias(const Mesh& mesh, double density)
{
  if (density <= 0.0)
  {
    throw std::invalid_argument(
      std::format("Density must be positive, got {}", density));
  }

  const double volume = mesh.getVolume();
  if (volume <= 0.0)
  {
    throw std::runtime_error(std::format(
      "Cannot compute plain inertia of mesh '{}': enclosed volume is {}",
      mesh.getName(),
      volume));
  }

  const auto& normals = mesh.getFacesNormals();
  const auto& integrals = mesh.getSurfaceIntegrals();

  // Divergence theorem: volume integrals as flux of the surface integrals
  Eigen::Vector3d secondOrder = Eigen::Vector3d::Zero();  // int x^2 n_x, ...
  Eigen::Vector3d thirdOrder = Eigen::Vector3d::Zero();   // int x^3 n_x, ...
  Eigen::Vector3d mixed = Eigen::Vector3d::Zero();  // x^2y n_x, y^2z n_y, z^2x n_z
  for (Eigen::Index faceId = 0; faceId < integrals.cols(); ++faceId)
  {
    const Eigen::Vector3d& n = normals[static_cast<size_t>(faceId)];
    secondOrder += n.cwiseProduct(integrals.block<3, 1>(kIntXX, faceId));
    thirdOrder += n.cwiseProduct(integrals.block<3, 1>(kIntXXX, faceId));
    mixed += n.cwiseProduct(integrals.block<3, 1>(kIntXXY, faceId));
  }

  const double mass = density * volume;
  const Coordinate cog = secondOrder / (2.0 * volume);

  const double xx = density * (thirdOrder.y() + thirdOrder.z()) / 3.0;
  const double yy = density * (thirdOrder.x() + thirdOrder.z()) / 3.0;
  const double zz = density * (thirdOrder.x() + thirdOrder.y()) / 3.0;
  const double xy = density * mixed.x() / 2.0;
  const double yz = density * mixed.y() / 2.0;
  const double xz = density * mixed.z() / 2.0;

  return RigidBodyInertia{mass, cog, xx, yy, zz, yz, xz, xy};
}

RigidBodyInertia evalShellMeshInertias(const Mesh& mesh,
                                       double density,
                                       double thickness)
{
  if (density <= 0.0)
  {
    throw std::invalid_argument(
      std::format("Density must be positive, got {}", density));
  }
  if (thickness <= 0.0)
  {
    throw std::invalid_argument(
      std::format("Shell thickness must be positive, got {}", thickness));
  }

  const double area = mesh.getSurfaceArea();
  if (area <= 0.0)
  {
    throw std::runtime_error(std::format(
      "Cannot compute shell inertia of mesh '{}': surface area is {}",
      mesh.getName(),
      area));
  }

  const FaceSurfaceIntegrals sums = mesh.getSurfaceIntegrals().rowwise().sum();
  const double surfaceDensity = density * thickness;

  const double mass = surfaceDensity * area;
  const Coordinate cog{
    sums(kIntX) / area, sums(kIntY) / area, sums(kIntZ) / area};

  const double xx = surfaceDensity * (sums(kIntYY) + sums(kIntZZ));
  const double yy = surfaceDensity * (sums(kIntXX) + sums(kIntZZ));
  const double zz = surfaceDensity * (sums(kIntXX) + sums(kIntYY));
  const double yz = surfaceDensity * sums(kIntYZ);
  const double xz = surfaceDensity * sums(kIntXZ);
  const double xy = surfaceDensity * sums(kIntXY);

  return RigidBodyInertia{mass, cog, xx, yy, zz, yz, xz, xy};
}

}  // namespace InertialCalculations
}  // namespace hydro_mesh
