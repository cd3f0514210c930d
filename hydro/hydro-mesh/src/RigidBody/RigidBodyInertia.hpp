#ifndef HYDRO_MESH_RIGID_BODY_INERTIA_HPP
#define HYDRO_MESH_RIGID_BODY_INERTIA_HPP

#include <Eigen/Dense>

#include "hydro-mesh/src/DataTypes/Coordinate.hpp"

namespace hydro_mesh
{

/**
 * @brief Mass, center of gravity and inertia tensor of a rigid body,
 * expressed at a reference point.
 *
 * Products of inertia are stored with the positive convention
 * (xy = int x y dm); the tensor is
 *
 *   | xx  -xy  -xz |
 *   | -xy  yy  -yz |
 *   | -xz -yz   zz |
 */
class RigidBodyInertia
{
public:
  /**
   * @brief Construct from the 6 independent inertia coefficients.
   *
   * @param mass Mass [kg]
   * @param cog Center of gravity [m]
   * @param xx Moment about x [kg.m^2]
   * @param yy Moment about y [kg.m^2]
   * @param zz Moment about z [kg.m^2]
   * @param yz Product of inertia int y z dm [kg.m^2]
   * @param xz Product of inertia int x z dm [kg.m^2]
   * @param xy Product of inertia int x y dm [kg.m^2]
   * @param point Reduction point of the tensor [m]
   * @throws std::invalid_argument if mass < 0
   */
  RigidBodyInertia(double mass,
                   const Coordinate& cog,
                   double xx,
                   double yy,
                   double zz,
                   double yz,
                   double xz,
                   double xy,
                   const Coordinate& point = Coordinate{0.0, 0.0, 0.0});

  [[nodiscard]] double getMass() const;
  [[nodiscard]] const Coordinate& getCenterOfGravity() const;
  [[nodiscard]] const Coordinate& getReductionPoint() const;

  [[nodiscard]] double getXX() const;
  [[nodiscard]] double getYY() const;
  [[nodiscard]] double getZZ() const;
  [[nodiscard]] double getYZ() const;
  [[nodiscard]] double getXZ() const;
  [[nodiscard]] double getXY() const;

  /**
   * @brief 3x3 symmetric inertia tensor at the reduction point
   */
  [[nodiscard]] Eigen::Matrix3d getInertiaMatrix() const;

  /**
   * @brief Express the tensor at another point (Huygens theorem).
   *
   * @param point New reduction point [m]
   * @return Inertia with the same mass and center of gravity
   */
  [[nodiscard]] RigidBodyInertia transportTo(const Coordinate& point) const;

  /**
   * @brief Express the tensor at the center of gravity
   */
  [[nodiscard]] RigidBodyInertia atCenterOfGravity() const;

private:
  RigidBodyInertia(double mass,
                   const Coordinate& cog,
                   const Eigen::Matrix3d& inertia,
                   const Coordinate& point);

  /// Huygens term m ((d . d) I - d d^T)
  [[nodiscard]] Eigen::Matrix3d steinerTerm(const Coordinate& offset) const;

  double mass_;
  Coordinate cog_;
  Eigen::Matrix3d inertia_;
  Coordinate point_;
};

}  // namespace hydro_mesh

#endif  // HYDRO_MESH_RIGID_BODY_INERTIA_HPP
