#ifndef HYDRO_MESH_INERTIAL_CALCULATIONS_HPP
#define HYDRO_MESH_INERTIAL_CALCULATIONS_HPP

#include "hydro-mesh/src/RigidBody/RigidBodyInertia.hpp"

namespace hydro_mesh
{

class Mesh;

/**
 * @brief Rigid body inertia of homogeneous bodies bounded by a mesh.
 *
 * Both evaluations derive mass, center of gravity and the 6 independent
 * inertia coefficients from the mesh surface integrals, at the origin.
 */
namespace InertialCalculations
{

/// Sea water density [kg/m^3]
constexpr double kSeaWaterDensity = 1023.0;

/// Steel density [kg/m^3]
constexpr double kSteelDensity = 7850.0;

/// Default hull plating thickness [m]
constexpr double kDefaultShellThickness = 0.02;

/**
 * @brief Inertia of the solid filling the volume enclosed by the mesh.
 *
 * The mesh must be closed and oriented outward.
 *
 * @param mesh The closed surface mesh
 * @param density Medium density [kg/m^3]
 * @return Inertia at the origin
 * @throws std::invalid_argument if density <= 0
 * @throws std::runtime_error if the enclosed volume is not positive
 */
RigidBodyInertia evalPlainMeshInertias(const Mesh& mesh,
                                       double density = kSeaWaterDensity);

/**
 * @brief Inertia of a thin homogeneous shell covering the mesh surface.
 *
 * @param mesh The surface mesh (need not be closed)
 * @param density Shell material density [kg/m^3]
 * @param thickness Shell thickness [m]
 * @return Inertia at the origin
 * @throws std::invalid_argument if density <= 0 or thickness <= 0
 * @throws std::runtime_error if the mesh has no area
 */
RigidBodyInertia evalShellMeshInertias(
  const Mesh& mesh,
  double density = kSteelDensity,
  double thickness = kDefaultShellThickness);

}  // namespace InertialCalculations

}  // namespace hydro_mesh

#endif  // HYDRO_MESH_INERTIAL_CALCULATIONS_HPP
