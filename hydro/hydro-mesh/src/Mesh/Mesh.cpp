#include "hydro-mesh/src/Mesh/Mesh.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <format>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

#include "hydro-mesh/src/Geometry/Rotation.hpp"
#include "hydro-mesh/src/Geometry/TriangleIntegrals.hpp"
#include "hydro-mesh/src/Mesh/VertexMerging.hpp"
#include "hydro-mesh/src/Utils/utils.hpp"

namespace hydro_mesh
{

namespace
{

size_t distinctVertexCount(const Face& face)
{
  size_t count = 0;
  for (size_t slot = 0; slot < Face::kFaceSlots; ++slot)
  {
    bool seen = false;
    for (size_t previous = 0; previous < slot; ++previous)
    {
      seen = seen || face[previous] == face[slot];
    }
    if (!seen)
    {
      ++count;
    }
  }
  return count;
}

/**
 * @brief Twice the signed area enclosed by the projection of a loop on a
 * coordinate plane
 */
double projectedLoopArea(const std::vector<Coordinate>& loop,
                         Eigen::Index u,
                         Eigen::Index v)
{
  double area = 0.0;
  const size_t n = loop.size();
  for (size_t i = 0; i < n; ++i)
  {
    const Coordinate& current = loop[i];
    const Coordinate& next = loop[(i + 1) % n];
    area += (next[v] - current[v]) * (next[u] + current[u]);
  }
  return area;
}

}  // namespace

Mesh::Mesh(std::vector<Coordinate> vertices,
           std::vector<Face> faces,
           std::string name)
  : vertices_{std::move(vertices)},
    faces_{std::move(faces)},
    name_{std::move(name)}
{
  validateFaces();
}

Mesh Mesh::fromArrays(const Eigen::MatrixXd& vertices,
                      const Eigen::MatrixXi& faces,
                      std::string name)
{
  if (vertices.cols() != 3)
  {
    throw std::invalid_argument(std::format(
      "Vertex array must have 3 columns, got {}", vertices.cols()));
  }
  if (faces.cols() != static_cast<Eigen::Index>(Face::kFaceSlots))
  {
    throw std::invalid_argument(
      std::format("Face array must have 4 columns, got {}", faces.cols()));
  }
  if (faces.size() > 0 && faces.minCoeff() < 0)
  {
    throw std::invalid_argument("Face array holds a negative vertex index");
  }

  std::vector<Coordinate> vertexList;
  vertexList.reserve(static_cast<size_t>(vertices.rows()));
  for (Eigen::Index i = 0; i < vertices.rows(); ++i)
  {
    vertexList.emplace_back(vertices(i, 0), vertices(i, 1), vertices(i, 2));
  }

  std::vector<Face> faceList;
  faceList.reserve(static_cast<size_t>(faces.rows()));
  for (Eigen::Index i = 0; i < faces.rows(); ++i)
  {
    faceList.emplace_back(static_cast<size_t>(faces(i, 0)),
                          static_cast<size_t>(faces(i, 1)),
                          static_cast<size_t>(faces(i, 2)),
                          static_cast<size_t>(faces(i, 3)));
  }

  return Mesh{std::move(vertexList), std::move(faceList), std::move(name)};
}

void Mesh::validateFaces() const
{
  for (size_t faceId = 0; faceId < faces_.size(); ++faceId)
  {
    for (const size_t vertexId : faces_[faceId].vertexIndices)
    {
      if (vertexId >= vertices_.size())
      {
        throw std::out_of_range(
          std::format("Face {} references vertex {} but the mesh has {} "
                      "vertices",
                      faceId,
                      vertexId,
                      vertices_.size()));
      }
    }
  }
}

const std::string& Mesh::getName() const
{
  return name_;
}

void Mesh::setName(std::string name)
{
  name_ = std::move(name);
}

std::string Mesh::toString() const
{
  const BoundingBox box = axisAlignedBBox();
  return std::format(
    "Mesh '{}'\n"
    "  vertices:    {}\n"
    "  faces:       {}\n"
    "  triangles:   {}\n"
    "  quadrangles: {}\n"
    "  xmin = {:f}  xmax = {:f}\n"
    "  ymin = {:f}  ymax = {:f}\n"
    "  zmin = {:f}  zmax = {:f}\n",
    name_,
    getVertexCount(),
    getFaceCount(),
    getTriangleCount(),
    getQuadrangleCount(),
    box.xmin,
    box.xmax,
    box.ymin,
    box.ymax,
    box.zmin,
    box.zmax);
}

// ===== Raw arrays =====

size_t Mesh::getVertexCount() const
{
  return vertices_.size();
}

size_t Mesh::getFaceCount() const
{
  return faces_.size();
}

const std::vector<Coordinate>& Mesh::getVertices() const
{
  return vertices_;
}

const std::vector<Face>& Mesh::getFaces() const
{
  return faces_;
}

void Mesh::setVertices(std::vector<Coordinate> vertices)
{
  std::swap(vertices_, vertices);
  try
  {
    validateFaces();
  }
  catch (const std::out_of_range&)
  {
    std::swap(vertices_, vertices);
    throw;
  }
  cache_.apply(MeshChange::VerticesReplaced);
}

void Mesh::setFaces(std::vector<Face> faces)
{
  std::swap(faces_, faces);
  try
  {
    validateFaces();
  }
  catch (const std::out_of_range&)
  {
    std::swap(faces_, faces);
    throw;
  }
  cache_.apply(MeshChange::FacesReplaced);
}

// ===== Face classification =====

const MeshCache::FaceClassification& Mesh::faceClassification() const
{
  if (!cache_.faceClassification)
  {
    MeshCache::FaceClassification classification;
    for (size_t faceId = 0; faceId < faces_.size(); ++faceId)
    {
      if (faces_[faceId].isTriangle())
      {
        classification.triangleIds.push_back(faceId);
      }
      else
      {
        classification.quadrangleIds.push_back(faceId);
      }
    }
    cache_.faceClassification = std::move(classification);
  }
  return *cache_.faceClassification;
}

bool Mesh::isTriangle(size_t faceId) const
{
  return faces_.at(faceId).isTriangle();
}

std::vector<size_t> Mesh::getFace(size_t faceId) const
{
  const Face& face = faces_.at(faceId);
  return {face.vertexIndices.begin(),
          face.vertexIndices.begin() +
            static_cast<std::ptrdiff_t>(face.vertexCount())};
}

const std::vector<size_t>& Mesh::getTrianglesIds() const
{
  return faceClassification().triangleIds;
}

const std::vector<size_t>& Mesh::getQuadranglesIds() const
{
  return faceClassification().quadrangleIds;
}

size_t Mesh::getTriangleCount() const
{
  return getTrianglesIds().size();
}

size_t Mesh::getQuadrangleCount() const
{
  return getQuadranglesIds().size();
}

// ===== Face geometry =====

const FaceGeometry& Mesh::faceGeometry() const
{
  if (!cache_.faceGeometry)
  {
    cache_.faceGeometry = computeFaceGeometry(vertices_, faces_);
  }
  return *cache_.faceGeometry;
}

const std::vector<double>& Mesh::getFacesAreas() const
{
  return faceGeometry().areas;
}

const std::vector<Vector3D>& Mesh::getFacesNormals() const
{
  return faceGeometry().normals;
}

const std::vector<Coordinate>& Mesh::getFacesCenters() const
{
  return faceGeometry().centers;
}

const std::vector<double>& Mesh::getFacesRadii() const
{
  if (!cache_.faceRadii)
  {
    cache_.faceRadii =
      computeFaceRadii(vertices_, faces_, faceGeometry().centers);
  }
  return *cache_.faceRadii;
}

double Mesh::getSurfaceArea() const
{
  const auto& areas = getFacesAreas();
  return std::accumulate(areas.begin(), areas.end(), 0.0);
}

// ===== Connectivity =====

const Connectivity& Mesh::getConnectivity() const
{
  if (!cache_.connectivity)
  {
    cache_.connectivity = computeConnectivity(vertices_.size(), faces_);
  }
  return *cache_.connectivity;
}

const std::vector<std::set<size_t>>& Mesh::getVertexVertices() const
{
  return getConnectivity().vertexVertices;
}

const std::vector<std::set<size_t>>& Mesh::getVertexFaces() const
{
  return getConnectivity().vertexFaces;
}

const std::vector<std::set<size_t>>& Mesh::getFaceFaces() const
{
  return getConnectivity().faceFaces;
}

const std::vector<BoundaryLoop>& Mesh::getBoundaries() const
{
  return getConnectivity().boundaries;
}

const std::vector<BoundaryLoop>& Mesh::getOpenBoundaries() const
{
  return getConnectivity().openBoundaries;
}

size_t Mesh::getBoundaryCount() const
{
  return getBoundaries().size();
}

bool Mesh::isMeshClosed() const
{
  const Connectivity& connectivity = getConnectivity();
  return connectivity.boundaries.empty() &&
         connectivity.openBoundaries.empty();
}

bool Mesh::isMeshConformal() const
{
  spdlog::warn("Mesh::isMeshConformal is experimental and may misclassify");

  const std::vector<Plane> coordinatePlanes{Plane{Vector3D{0.0, 0.0, 1.0}},
                                            Plane{Vector3D{1.0, 0.0, 0.0}},
                                            Plane{Vector3D{0.0, 1.0, 0.0}}};
  // In-plane axes (u, v) of Oxy, Oyz and Oxz
  constexpr std::array<std::pair<Eigen::Index, Eigen::Index>, 3> kPlaneAxes{
    {{0, 1}, {1, 2}, {0, 2}}};

  for (const auto& boundary : getBoundaries())
  {
    std::vector<Coordinate> loop;
    loop.reserve(boundary.size());
    for (const size_t vertexId : boundary)
    {
      loop.push_back(vertices_[vertexId]);
    }

    bool collapsed = true;
    for (size_t k = 0; k < coordinatePlanes.size(); ++k)
    {
      const auto projected = coordinatePlanes[k].orthogonalProjection(loop);
      const double area = projectedLoopArea(
        projected, kPlaneAxes[k].first, kPlaneAxes[k].second);
      collapsed = collapsed && std::abs(area) < kConformalTolerance;
    }

    if (collapsed)
    {
      return false;
    }
  }
  return true;
}

// ===== Bounding boxes and edges =====

BoundingBox Mesh::axisAlignedBBox() const
{
  if (vertices_.empty())
  {
    return BoundingBox{};
  }

  Eigen::Vector3d lower = vertices_.front();
  Eigen::Vector3d upper = vertices_.front();
  for (const auto& vertex : vertices_)
  {
    lower = lower.cwiseMin(vertex);
    upper = upper.cwiseMax(vertex);
  }
  return BoundingBox{
    lower.x(), upper.x(), lower.y(), upper.y(), lower.z(), upper.z()};
}

BoundingBox Mesh::squaredAxisAlignedBBox() const
{
  const BoundingBox box = axisAlignedBBox();
  const Eigen::Vector3d center{0.5 * (box.xmin + box.xmax),
                               0.5 * (box.ymin + box.ymax),
                               0.5 * (box.zmin + box.zmax)};
  const double halfSide = 0.5 * std::max({box.xmax - box.xmin,
                                          box.ymax - box.ymin,
                                          box.zmax - box.zmin});
  return BoundingBox{center.x() - halfSide,
                     center.x() + halfSide,
                     center.y() - halfSide,
                     center.y() + halfSide,
                     center.z() - halfSide,
                     center.z() + halfSide};
}

namespace
{

struct EdgeStatistics
{
  double min{0.0};
  double max{0.0};
  double mean{0.0};
};

EdgeStatistics edgeStatistics(const std::vector<Coordinate>& vertices,
                              const std::vector<Face>& faces)
{
  EdgeStatistics stats;
  if (faces.empty())
  {
    return stats;
  }

  stats.min = std::numeric_limits<double>::max();
  double total = 0.0;
  size_t count = 0;
  for (const auto& face : faces)
  {
    const size_t n = face.vertexCount();
    for (size_t slot = 0; slot < n; ++slot)
    {
      const double length =
        (vertices[face[(slot + 1) % n]] - vertices[face[slot]]).norm();
      stats.min = std::min(stats.min, length);
      stats.max = std::max(stats.max, length);
      total += length;
      ++count;
    }
  }
  stats.mean = total / static_cast<double>(count);
  return stats;
}

}  // namespace

double Mesh::minEdgeLength() const
{
  return edgeStatistics(vertices_, faces_).min;
}

double Mesh::maxEdgeLength() const
{
  return edgeStatistics(vertices_, faces_).max;
}

double Mesh::meanEdgeLength() const
{
  return edgeStatistics(vertices_, faces_).mean;
}

// ===== Integrals =====

const MeshCache::SurfaceIntegrals& Mesh::getSurfaceIntegrals() const
{
  if (!cache_.surfaceIntegrals)
  {
    MeshCache::SurfaceIntegrals integrals{kSurfaceIntegralCount,
                                          static_cast<Eigen::Index>(
                                            faces_.size())};
    for (size_t faceId = 0; faceId < faces_.size(); ++faceId)
    {
      const Face& face = faces_[faceId];
      const Coordinate& v0 = vertices_[face[0]];
      const Coordinate& v1 = vertices_[face[1]];
      const Coordinate& v2 = vertices_[face[2]];

      FaceSurfaceIntegrals column = computeTriangleIntegrals(v0, v1, v2);
      if (!face.isTriangle())
      {
        column += computeTriangleIntegrals(v0, v2, vertices_[face[3]]);
      }
      integrals.col(static_cast<Eigen::Index>(faceId)) = column;
    }
    cache_.surfaceIntegrals = std::move(integrals);
  }
  return *cache_.surfaceIntegrals;
}

double Mesh::getVolume() const
{
  const auto& normals = getFacesNormals();
  const auto& integrals = getSurfaceIntegrals();

  double volume = 0.0;
  for (size_t faceId = 0; faceId < faces_.size(); ++faceId)
  {
    volume += normals[faceId].dot(
      integrals.block<3, 1>(kIntX, static_cast<Eigen::Index>(faceId)));
  }
  return volume / 3.0;
}

bool Mesh::hasCached(CachedProperty property) const
{
  return cache_.has(property);
}

// ===== Rigid motion and scaling =====

Eigen::Matrix3d Mesh::rotate(const Vector3D& angles)
{
  const Eigen::Matrix3d rotation = rotationMatrixFromVector(angles);
  if (angles.norm() == 0.0)
  {
    return rotation;
  }

  for (auto& vertex : vertices_)
  {
    vertex = rotation * vertex;
  }

  if (cache_.faceGeometry)
  {
    for (auto& normal : cache_.faceGeometry->normals)
    {
      normal = rotation * normal;
    }
    for (auto& center : cache_.faceGeometry->centers)
    {
      center = rotation * center;
    }
  }

  cache_.apply(MeshChange::RigidMotion);
  return rotation;
}

Eigen::Matrix3d Mesh::rotateX(double theta)
{
  return rotate(Vector3D{theta, 0.0, 0.0});
}

Eigen::Matrix3d Mesh::rotateY(double theta)
{
  return rotate(Vector3D{0.0, theta, 0.0});
}

Eigen::Matrix3d Mesh::rotateZ(double theta)
{
  return rotate(Vector3D{0.0, 0.0, theta});
}

void Mesh::translate(const Vector3D& t)
{
  for (auto& vertex : vertices_)
  {
    vertex += t;
  }

  if (cache_.faceGeometry)
  {
    for (auto& center : cache_.faceGeometry->centers)
    {
      center += t;
    }
  }

  cache_.apply(MeshChange::RigidMotion);
}

void Mesh::translateX(double tx)
{
  translate(Vector3D{tx, 0.0, 0.0});
}

void Mesh::translateY(double ty)
{
  translate(Vector3D{0.0, ty, 0.0});
}

void Mesh::translateZ(double tz)
{
  translate(Vector3D{0.0, 0.0, tz});
}

void Mesh::scaleAxes(const Eigen::Vector3d& factors)
{
  if ((factors.array() <= 0.0).any())
  {
    throw std::invalid_argument(std::format(
      "Scale factors must be positive, got ({}, {}, {})",
      factors.x(),
      factors.y(),
      factors.z()));
  }

  for (auto& vertex : vertices_)
  {
    vertex = vertex.cwiseProduct(factors);
  }
  cache_.apply(MeshChange::VertexPositions);
}

void Mesh::scale(double alpha)
{
  scaleAxes(Eigen::Vector3d{alpha, alpha, alpha});
}

void Mesh::scaleX(double alpha)
{
  scaleAxes(Eigen::Vector3d{alpha, 1.0, 1.0});
}

void Mesh::scaleY(double alpha)
{
  scaleAxes(Eigen::Vector3d{1.0, alpha, 1.0});
}

void Mesh::scaleZ(double alpha)
{
  scaleAxes(Eigen::Vector3d{1.0, 1.0, alpha});
}

void Mesh::flipNormals()
{
  for (auto& face : faces_)
  {
    face.reverse();
  }

  if (cache_.faceGeometry)
  {
    for (auto& normal : cache_.faceGeometry->normals)
    {
      normal = -normal;
    }
  }

  cache_.apply(MeshChange::GlobalFlip);
}

// ===== Plane operations =====

void Mesh::mirror(const Plane& plane)
{
  for (auto& vertex : vertices_)
  {
    vertex = plane.reflect(vertex);
  }
  for (auto& face : faces_)
  {
    face.reverse();
  }
  cache_.apply(MeshChange::VerticesReplaced);
}

void Mesh::symmetrize(const Plane& plane)
{
  const size_t vertexCount = vertices_.size();
  const size_t faceCount = faces_.size();

  vertices_.reserve(2 * vertexCount);
  for (size_t i = 0; i < vertexCount; ++i)
  {
    vertices_.push_back(plane.reflect(vertices_[i]));
  }

  faces_.reserve(2 * faceCount);
  for (size_t i = 0; i < faceCount; ++i)
  {
    Face mirrored = faces_[i].reversed();
    for (auto& vertexId : mirrored.vertexIndices)
    {
      vertexId += vertexCount;
    }
    faces_.push_back(mirrored);
  }

  cache_.apply(MeshChange::FacesReplaced);
  mergeDuplicates();
}

// ===== Compaction =====

bool Mesh::remapVertices(const std::vector<size_t>& oldToNew,
                         std::vector<Coordinate> newVertices)
{
  bool collapsed = false;
  for (auto& face : faces_)
  {
    const size_t before = distinctVertexCount(face);
    for (auto& vertexId : face.vertexIndices)
    {
      vertexId = oldToNew[vertexId];
    }
    collapsed = collapsed || distinctVertexCount(face) < before;
  }
  vertices_ = std::move(newVertices);
  return collapsed;
}

std::vector<size_t> Mesh::mergeDuplicates(double atol)
{
  VertexMergeResult merge = mergeDuplicateVertices(vertices_, atol);
  const size_t initialCount = vertices_.size();

  const bool collapsed =
    remapVertices(merge.oldToNew, std::move(merge.uniqueVertices));

  spdlog::debug("Mesh '{}': merged {} duplicate vertices",
                name_,
                initialCount - vertices_.size());

  // A face that lost a vertex changes shape and possibly kind
  cache_.apply(collapsed ? MeshChange::FacesReplaced
                         : MeshChange::VertexRenumbering);
  return std::move(merge.oldToNew);
}

Mesh Mesh::extractFaces(const std::vector<size_t>& faceIds,
                        std::vector<size_t>* oldToNew) const
{
  std::vector<bool> used(vertices_.size(), false);
  std::vector<Face> extractedFaces;
  extractedFaces.reserve(faceIds.size());
  for (const size_t faceId : faceIds)
  {
    const Face& face = faces_.at(faceId);
    extractedFaces.push_back(face);
    for (const size_t vertexId : face.vertexIndices)
    {
      used[vertexId] = true;
    }
  }

  std::vector<size_t> newIds(vertices_.size(), kUnusedVertex);
  std::vector<Coordinate> extractedVertices;
  for (size_t vertexId = 0; vertexId < vertices_.size(); ++vertexId)
  {
    if (used[vertexId])
    {
      newIds[vertexId] = extractedVertices.size();
      extractedVertices.push_back(vertices_[vertexId]);
    }
  }

  for (auto& face : extractedFaces)
  {
    for (auto& vertexId : face.vertexIndices)
    {
      vertexId = newIds[vertexId];
    }
  }

  if (oldToNew != nullptr)
  {
    *oldToNew = newIds;
  }

  return Mesh{std::move(extractedVertices),
              std::move(extractedFaces),
              "mesh_extracted_from_" + name_};
}

std::vector<size_t> Mesh::removeUnusedVertices()
{
  std::vector<bool> used(vertices_.size(), false);
  for (const auto& face : faces_)
  {
    for (const size_t vertexId : face.vertexIndices)
    {
      used[vertexId] = true;
    }
  }

  std::vector<size_t> oldToNew(vertices_.size(), kUnusedVertex);
  std::vector<Coordinate> kept;
  for (size_t vertexId = 0; vertexId < vertices_.size(); ++vertexId)
  {
    if (used[vertexId])
    {
      oldToNew[vertexId] = kept.size();
      kept.push_back(vertices_[vertexId]);
    }
  }

  const size_t removed = vertices_.size() - kept.size();
  spdlog::debug("Mesh '{}': removed {} unused vertices", name_, removed);
  if (removed == 0)
  {
    return oldToNew;
  }

  remapVertices(oldToNew, std::move(kept));
  cache_.apply(MeshChange::VertexRenumbering);
  return oldToNew;
}

std::vector<size_t> Mesh::removeDegeneratedFaces(double rtol)
{
  if (rtol <= 0.0)
  {
    throw std::invalid_argument(
      std::format("Relative tolerance must be positive, got {}", rtol));
  }
  if (faces_.empty())
  {
    return {};
  }

  const auto& areas = getFacesAreas();
  const double threshold =
    getSurfaceArea() / static_cast<double>(faces_.size()) * rtol;

  std::vector<size_t> removed;
  std::vector<Face> kept;
  kept.reserve(faces_.size());
  for (size_t faceId = 0; faceId < faces_.size(); ++faceId)
  {
    if (areas[faceId] < threshold)
    {
      removed.push_back(faceId);
    }
    else
    {
      kept.push_back(faces_[faceId]);
    }
  }

  spdlog::debug(
    "Mesh '{}': removed {} degenerated faces", name_, removed.size());
  if (!removed.empty())
  {
    faces_ = std::move(kept);
    cache_.apply(MeshChange::FacesReplaced);
  }
  return removed;
}

// ===== Repair =====

size_t Mesh::healTriangles()
{
  size_t healed = 0;
  for (size_t faceId = 0; faceId < faces_.size(); ++faceId)
  {
    Face& face = faces_[faceId];
    if (face.isTriangle() || distinctVertexCount(face) == Face::kFaceSlots)
    {
      continue;
    }

    // Repeated index in the middle slots: rotate it into slots 0 and 3
    Face rotated = face;
    for (size_t turn = 0; turn < Face::kFaceSlots - 1 && !rotated.isTriangle();
         ++turn)
    {
      std::rotate(rotated.vertexIndices.rbegin(),
                  rotated.vertexIndices.rbegin() + 1,
                  rotated.vertexIndices.rend());
    }

    if (!rotated.isTriangle())
    {
      // Repeated indices not adjacent in the cycle, e.g. (a, b, a, c)
      spdlog::warn("Mesh '{}': face {} ({}, {}, {}, {}) cannot be described "
                   "as a triangle, left unchanged",
                   name_,
                   faceId,
                   face[0],
                   face[1],
                   face[2],
                   face[3]);
      continue;
    }

    face = rotated;
    ++healed;
  }

  spdlog::debug("Mesh '{}': {} triangles described the wrong way fixed",
                name_,
                healed);
  if (healed > 0)
  {
    cache_.apply(MeshChange::FacesReplaced);
  }
  return healed;
}

NormalHealingReport Mesh::healNormals(const NormalHealer::Config& config)
{
  const Connectivity& connectivity = getConnectivity();
  const bool closed = connectivity.boundaries.empty() &&
                      connectivity.openBoundaries.empty();

  const NormalHealer::FloodFillResult flood =
    NormalHealer::floodFill(faces_, connectivity.faceFaces);

  NormalHealingReport report;
  report.reversedFaces = flood.reversedFaces;
  report.componentCount = flood.componentCount;

  if (flood.reversedFaces > 0)
  {
    cache_.apply(MeshChange::Winding);
  }

  if (!closed)
  {
    spdlog::debug(
      "Mesh '{}' is not closed, outward orientation is not checked", name_);
  }
  else
  {
    report.outwardChecked = true;

    const double zmax = axisAlignedBBox().zmax;
    const auto& areas = getFacesAreas();
    const auto& normals = getFacesNormals();
    const auto& centers = getFacesCenters();

    Eigen::Vector3d sanity = Eigen::Vector3d::Zero();
    for (size_t faceId = 0; faceId < faces_.size(); ++faceId)
    {
      sanity +=
        (centers[faceId].z() - zmax) * areas[faceId] * normals[faceId];
    }

    if (std::abs(sanity.x()) > config.watertightTolerance ||
        std::abs(sanity.y()) > config.watertightTolerance)
    {
      report.watertight = false;
      spdlog::warn(
        "Mesh '{}' does not seem watertight although closed (sanity vector "
        "{})",
        name_,
        std::format("{:.3e}", Vector3D{sanity}));
    }

    if (sanity.z() < 0.0)
    {
      flipNormals();
      report.flippedOutward = true;
    }
  }

  spdlog::debug("Mesh '{}': {} faces reversed over {} components{}",
                name_,
                report.reversedFaces,
                report.componentCount,
                report.flippedOutward ? ", whole mesh flipped outward" : "");
  return report;
}

MeshHealReport Mesh::healMesh(const MeshHealConfig& config)
{
  MeshHealReport report;

  const size_t initialVertexCount = vertices_.size();
  removeUnusedVertices();
  report.removedUnusedVertices = initialVertexCount - vertices_.size();

  report.removedDegeneratedFaces =
    removeDegeneratedFaces(config.degenerateTolerance).size();

  const size_t beforeMerge = vertices_.size();
  mergeDuplicates(config.mergeTolerance);
  report.mergedVertices = beforeMerge - vertices_.size();

  report.healedTriangles = healTriangles();
  report.normals = healNormals(config.normals);
  return report;
}

void Mesh::triangulateQuadrangles()
{
  const size_t faceCount = faces_.size();
  for (size_t faceId = 0; faceId < faceCount; ++faceId)
  {
    if (faces_[faceId].isTriangle())
    {
      continue;
    }
    const Face quad = faces_[faceId];
    faces_[faceId] = Face{quad[0], quad[2], quad[3]};
    faces_.emplace_back(quad[0], quad[1], quad[2]);
  }
  cache_.apply(MeshChange::FacesReplaced);
}

Mesh Mesh::operator+(const Mesh& other) const
{
  std::vector<Coordinate> vertices = vertices_;
  vertices.insert(vertices.end(), other.vertices_.begin(), other.vertices_.end());

  std::vector<Face> faces = faces_;
  faces.reserve(faces_.size() + other.faces_.size());
  for (Face face : other.faces_)
  {
    for (auto& vertexId : face.vertexIndices)
    {
      vertexId += vertices_.size();
    }
    faces.push_back(face);
  }

  Mesh sum{std::move(vertices), std::move(faces), name_ + "_" + other.name_};
  sum.mergeDuplicates();
  return sum;
}

}  // namespace hydro_mesh
