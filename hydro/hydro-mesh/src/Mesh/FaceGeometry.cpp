#include "hydro-mesh/src/Mesh/FaceGeometry.hpp"

#include <algorithm>

namespace hydro_mesh
{

namespace
{

Vector3D normalizedOrZero(const Vector3D& vec)
{
  const double norm = vec.norm();
  if (norm == 0.0)
  {
    return Vector3D{0.0, 0.0, 0.0};
  }
  return vec / norm;
}

}  // namespace

FaceGeometry computeFaceGeometry(const std::vector<Coordinate>& vertices,
                                 const std::vector<Face>& faces)
{
  FaceGeometry geometry;
  geometry.areas.reserve(faces.size());
  geometry.normals.reserve(faces.size());
  geometry.centers.reserve(faces.size());

  for (const auto& face : faces)
  {
    const Coordinate& v0 = vertices[face[0]];
    const Coordinate& v1 = vertices[face[1]];
    const Coordinate& v2 = vertices[face[2]];

    if (face.isTriangle())
    {
      const Vector3D normal = (v1 - v0).cross(v2 - v0);
      geometry.areas.push_back(0.5 * normal.norm());
      geometry.normals.push_back(normalizedOrZero(normal));
      geometry.centers.push_back((v0 + v1 + v2) / 3.0);
      continue;
    }

    const Coordinate& v3 = vertices[face[3]];

    const Vector3D normal = (v2 - v0).cross(v3 - v1);
    geometry.normals.push_back(normalizedOrZero(normal));

    // Split along the (v0, v2) diagonal
    const double a1 = 0.5 * (v1 - v0).cross(v2 - v0).norm();
    const double a2 = 0.5 * (v3 - v0).cross(v2 - v0).norm();
    const Coordinate c1 = (v0 + v1 + v2) / 3.0;
    const Coordinate c2 = (v0 + v2 + v3) / 3.0;

    const double area = a1 + a2;
    geometry.areas.push_back(area);
    if (area > 0.0)
    {
      geometry.centers.push_back((a1 * c1 + a2 * c2) / area);
    }
    else
    {
      geometry.centers.push_back((c1 + c2) / 2.0);
    }
  }

  return geometry;
}

std::vector<double> computeFaceRadii(const std::vector<Coordinate>& vertices,
                                     const std::vector<Face>& faces,
                                     const std::vector<Coordinate>& centers)
{
  std::vector<double> radii;
  radii.reserve(faces.size());

  for (size_t faceId = 0; faceId < faces.size(); ++faceId)
  {
    double radius = 0.0;
    for (const size_t vertexId : faces[faceId].vertexIndices)
    {
      radius = std::max(radius, (vertices[vertexId] - centers[faceId]).norm());
    }
    radii.push_back(radius);
  }

  return radii;
}

}  // namespace hydro_mesh
