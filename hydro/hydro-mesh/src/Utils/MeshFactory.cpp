#include "hydro-mesh/src/Utils/MeshFactory.hpp"

#include <format>
#include <stdexcept>
#include <utility>
#include <vector>

namespace hydro_mesh
{

std::array<Coordinate, 8> MeshFactory::getBoxCorners(double lx,
                                                      double ly,
                                                      double lz,
                                                      const Coordinate& center)
{
  if (lx <= 0.0 || ly <= 0.0 || lz <= 0.0)
  {
    throw std::invalid_argument(
      std::format("Box lengths must be positive, got ({}, {}, {})", lx, ly, lz));
  }

  const double hx = lx / 2.0;
  const double hy = ly / 2.0;
  const double hz = lz / 2.0;

  // Bottom (z = -hz) counterclockwise from (-x, -y), then top
  return {Coordinate{center + Eigen::Vector3d{-hx, -hy, -hz}},  // 0
          Coordinate{center + Eigen::Vector3d{hx, -hy, -hz}},   // 1
          Coordinate{center + Eigen::Vector3d{hx, hy, -hz}},    // 2
          Coordinate{center + Eigen::Vector3d{-hx, hy, -hz}},   // 3
          Coordinate{center + Eigen::Vector3d{-hx, -hy, hz}},   // 4
          Coordinate{center + Eigen::Vector3d{hx, -hy, hz}},    // 5
          Coordinate{center + Eigen::Vector3d{hx, hy, hz}},     // 6
          Coordinate{center + Eigen::Vector3d{-hx, hy, hz}}};   // 7
}

Mesh MeshFactory::createBox(double lx,
                            double ly,
                            double lz,
                            const Coordinate& center)
{
  const auto corners = getBoxCorners(lx, ly, lz, center);

  std::vector<Face> faces{
    Face{0, 3, 2, 1},  // z = -hz
    Face{4, 5, 6, 7},  // z = +hz
    Face{0, 1, 5, 4},  // y = -hy
    Face{3, 7, 6, 2},  // y = +hy
    Face{0, 4, 7, 3},  // x = -hx
    Face{1, 2, 6, 5}   // x = +hx
  };

  return Mesh{std::vector<Coordinate>(corners.begin(), corners.end()),
              std::move(faces),
              "box"};
}

Mesh MeshFactory::createCube(double size)
{
  Mesh cube = createBox(size, size, size);
  cube.setName("cube");
  return cube;
}

Mesh MeshFactory::createTriangulatedBox(double lx,
                                        double ly,
                                        double lz,
                                        const Coordinate& center)
{
  Mesh box = createBox(lx, ly, lz, center);
  box.triangulateQuadrangles();
  return box;
}

Mesh MeshFactory::createRectangularPlate(double lx,
                                         double ly,
                                         size_t nx,
                                         size_t ny)
{
  if (lx <= 0.0 || ly <= 0.0 || nx == 0 || ny == 0)
  {
    throw std::invalid_argument(std::format(
      "Invalid plate: lengths ({}, {}), divisions ({}, {})", lx, ly, nx, ny));
  }

  std::vector<Coordinate> vertices;
  vertices.reserve((nx + 1) * (ny + 1));
  for (size_t j = 0; j <= ny; ++j)
  {
    for (size_t i = 0; i <= nx; ++i)
    {
      vertices.emplace_back(lx * static_cast<double>(i) / static_cast<double>(nx),
                            ly * static_cast<double>(j) / static_cast<double>(ny),
                            0.0);
    }
  }

  const auto vertexId = [nx](size_t i, size_t j) { return j * (nx + 1) + i; };

  std::vector<Face> faces;
  faces.reserve(nx * ny);
  for (size_t j = 0; j < ny; ++j)
  {
    for (size_t i = 0; i < nx; ++i)
    {
      faces.emplace_back(vertexId(i, j),
                         vertexId(i + 1, j),
                         vertexId(i + 1, j + 1),
                         vertexId(i, j + 1));
    }
  }

  return Mesh{std::move(vertices), std::move(faces), "plate"};
}

}  // namespace hydro_mesh
