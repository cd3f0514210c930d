#include "hydro-mesh/src/RigidBody/RigidBodyInertia.hpp"

#include <stdexcept>

namespace hydro_mesh
{

RigidBodyInertia::RigidBodyInertia(double mass,
                                   const Coordinate& cog,
                                   double xx,
                                   double yy,
                                   double zz,
                                   double yz,
                                   double xz,
                                   double xy,
                                   const Coordinate& point)
  : mass_{mass}, cog_{cog}, inertia_{}, point_{point}
{
  if (mass < 0.0)
  {
    throw std::invalid_argument("Mass must be non-negative");
  }

  inertia_ << xx, -xy, -xz,  //
    -xy, yy, -yz,            //
    -xz, -yz, zz;
}

RigidBodyInertia::RigidBodyInertia(double mass,
                                   const Coordinate& cog,
                                   const Eigen::Matrix3d& inertia,
                                   const Coordinate& point)
  : mass_{mass}, cog_{cog}, inertia_{inertia}, point_{point}
{
}

double RigidBodyInertia::getMass() const
{
  return mass_;
}

const Coordinate& RigidBodyInertia::getCenterOfGravity() const
{
  return cog_;
}

const Coordinate& RigidBodyInertia::getReductionPoint() const
{
  return point_;
}

double RigidBodyInertia::getXX() const
{
  return inertia_(0, 0);
}

double RigidBodyInertia::getYY() const
{
  return inertia_(1, 1);
}

double RigidBodyInertia::getZZ() const
{
  return inertia_(2, 2);
}

double RigidBodyInertia::getYZ() const
{
  return -inertia_(1, 2);
}

double RigidBodyInertia::getXZ() const
{
  return -inertia_(0, 2);
}

double RigidBodyInertia::getXY() const
{
  return -inertia_(0, 1);
}

Eigen::Matrix3d RigidBodyInertia::getInertiaMatrix() const
{
  return inertia_;
}

Eigen::Matrix3d RigidBodyInertia::steinerTerm(const Coordinate& offset) const
{
  return mass_ * (offset.squaredNorm() * Eigen::Matrix3d::Identity() -
                  offset * offset.transpose());
}

RigidBodyInertia RigidBodyInertia::transportTo(const Coordinate& point) const
{
  // Back to the center of gravity, then out to the new point
  const Eigen::Matrix3d atCog = inertia_ - steinerTerm(cog_ - point_);
  const Eigen::Matrix3d atPoint = atCog + steinerTerm(cog_ - point);
  return RigidBodyInertia{mass_, cog_, atPoint, point};
}

RigidBodyInertia RigidBodyInertia::atCenterOfGravity() const
{
  return transportTo(cog_);
}

}  // namespace hydro_mesh
