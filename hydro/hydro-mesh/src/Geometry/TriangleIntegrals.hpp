#ifndef HYDRO_MESH_GEOMETRY_TRIANGLE_INTEGRALS_HPP
#define HYDRO_MESH_GEOMETRY_TRIANGLE_INTEGRALS_HPP

#include <Eigen/Dense>

#include "hydro-mesh/src/DataTypes/Coordinate.hpp"

namespace hydro_mesh
{

/// Number of polynomial surface integrals evaluated per face
constexpr Eigen::Index kSurfaceIntegralCount = 15;

/// Polynomial surface integrals of one face, indexed by SurfaceIntegral
using FaceSurfaceIntegrals = Eigen::Matrix<double, kSurfaceIntegralCount, 1>;

/**
 * @brief Row layout of the surface integral vectors.
 *
 * Every entry is the integral of a monomial over the face surface (dS),
 * independent of the face orientation.
 */
enum SurfaceIntegral : Eigen::Index
{
  kIntX = 0,    ///< int x dS
  kIntY = 1,    ///< int y dS
  kIntZ = 2,    ///< int z dS
  kIntYZ = 3,   ///< int yz dS
  kIntXZ = 4,   ///< int xz dS
  kIntXY = 5,   ///< int xy dS
  kIntXX = 6,   ///< int x^2 dS
  kIntYY = 7,   ///< int y^2 dS
  kIntZZ = 8,   ///< int z^2 dS
  kIntXXX = 9,  ///< int x^3 dS
  kIntYYY = 10, ///< int y^3 dS
  kIntZZZ = 11, ///< int z^3 dS
  kIntXXY = 12, ///< int x^2 y dS
  kIntYYZ = 13, ///< int y^2 z dS
  kIntZZX = 14  ///< int z^2 x dS
};

/**
 * @brief Evaluate the 15 closed-form polynomial integrals over a triangle.
 *
 * Uses the recursive subexpression scheme of Eberly ("Polyhedral Mass
 * Properties"): per-axis partial sums f1, f2, f3 of the vertex coordinate
 * powers and the per-vertex weights g0, g1, g2, scaled by
 * delta = |(p1 - p0) x (p2 - p0)| (twice the triangle area).
 *
 * A degenerate triangle (delta == 0) yields all zeros.
 *
 * @param p0 First vertex
 * @param p1 Second vertex
 * @param p2 Third vertex
 * @return The 15 integrals in SurfaceIntegral order
 */
FaceSurfaceIntegrals computeTriangleIntegrals(const Coordinate& p0,
                                              const Coordinate& p1,
                                              const Coordinate& p2);

}  // namespace hydro_mesh

#endif  // HYDRO_MESH_GEOMETRY_TRIANGLE_INTEGRALS_HPP
