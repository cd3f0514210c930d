#ifndef HYDRO_MESH_MESH_FACTORY_HPP
#define HYDRO_MESH_MESH_FACTORY_HPP

#include <array>
#include <cstddef>

#include "hydro-mesh/src/DataTypes/Coordinate.hpp"
#include "hydro-mesh/src/Mesh/Mesh.hpp"

namespace hydro_mesh
{

/**
 * @brief Factory class for creating common surface meshes
 *
 * All meshes are wound counterclockwise seen from outside.
 */
class MeshFactory
{
public:
  /**
   * @brief Create a rectangular box made of 6 quadrangles
   *
   * @param lx Length along x
   * @param ly Length along y
   * @param lz Length along z
   * @param center Center of the box
   * @return Closed mesh with 8 vertices and 6 faces
   * @throws std::invalid_argument if a length is not positive
   */
  static Mesh createBox(double lx,
                        double ly,
                        double lz,
                        const Coordinate& center = Coordinate{0.0, 0.0, 0.0});

  /**
   * @brief Create a cube centered at origin
   * @param size Side length of the cube
   */
  static Mesh createCube(double size);

  /**
   * @brief Create a box made of 12 triangles (each side split along a
   * diagonal)
   */
  static Mesh createTriangulatedBox(
    double lx,
    double ly,
    double lz,
    const Coordinate& center = Coordinate{0.0, 0.0, 0.0});

  /**
   * @brief Create a flat rectangular plate in the z = 0 plane
   *
   * The plate spans [0, lx] x [0, ly], is split into nx * ny quadrangles and
   * faces +z. It has a single boundary loop.
   *
   * @throws std::invalid_argument if a length or a division count is zero
   */
  static Mesh createRectangularPlate(double lx,
                                     double ly,
                                     size_t nx,
                                     size_t ny);

private:
  /**
   * @brief Helper to create the 8 corner vertices of a box
   */
  static std::array<Coordinate, 8> getBoxCorners(double lx,
                                                 double ly,
                                                 double lz,
                                                 const Coordinate& center);
};

}  // namespace hydro_mesh

#endif  // HYDRO_MESH_MESH_FACTORY_HPP
