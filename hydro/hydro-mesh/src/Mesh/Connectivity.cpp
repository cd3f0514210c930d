#include "hydro-mesh/src/Mesh/Connectivity.hpp"

#include <algorithm>
#include <format>
#include <iterator>
#include <map>
#include <utility>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace hydro_mesh
{

namespace
{

/**
 * @brief Orient an edge (a, b) lying on the boundary of a single face.
 *
 * Boundary edges run against the face's storage cycle: if the face goes
 * a -> b, the boundary edge is b -> a.
 *
 * @return (origin, target)
 */
std::pair<size_t, size_t> orientBoundaryEdge(const Face& face,
                                             size_t a,
                                             size_t b)
{
  const size_t n = face.vertexCount();
  for (size_t slot = 0; slot < n; ++slot)
  {
    if (face[slot] == a && face[(slot + 1) % n] == b)
    {
      return {b, a};
    }
  }
  return {a, b};
}

std::vector<size_t> sharedFaces(const std::set<size_t>& facesA,
                                const std::set<size_t>& facesB)
{
  std::vector<size_t> shared;
  std::set_intersection(facesA.begin(),
                        facesA.end(),
                        facesB.begin(),
                        facesB.end(),
                        std::back_inserter(shared));
  return shared;
}

}  // namespace

Connectivity computeConnectivity(size_t vertexCount,
                                 const std::vector<Face>& faces)
{
  Connectivity connectivity;
  connectivity.vertexVertices.resize(vertexCount);
  connectivity.vertexFaces.resize(vertexCount);
  connectivity.faceFaces.resize(faces.size());

  // Step 1: vertex/vertex and vertex/face in a single pass over faces
  for (size_t faceId = 0; faceId < faces.size(); ++faceId)
  {
    const Face& face = faces[faceId];
    const size_t n = face.vertexCount();
    for (size_t slot = 0; slot < n; ++slot)
    {
      const size_t current = face[slot];
      const size_t previous = face[(slot + n - 1) % n];
      connectivity.vertexFaces[current].insert(faceId);
      if (current != previous)
      {
        connectivity.vertexVertices[current].insert(previous);
        connectivity.vertexVertices[previous].insert(current);
      }
    }
  }

  // Step 2: classify every undirected edge once
  std::multimap<size_t, size_t> boundaryEdges;

  for (size_t vertexId = 0; vertexId < vertexCount; ++vertexId)
  {
    for (const size_t adjacentId : connectivity.vertexVertices[vertexId])
    {
      if (adjacentId < vertexId)
      {
        continue;
      }

      const std::vector<size_t> shared =
        sharedFaces(connectivity.vertexFaces[vertexId],
                    connectivity.vertexFaces[adjacentId]);

      if (shared.size() == 2)
      {
        connectivity.faceFaces[shared[0]].insert(shared[1]);
        connectivity.faceFaces[shared[1]].insert(shared[0]);
      }
      else if (shared.size() == 1)
      {
        boundaryEdges.insert(
          orientBoundaryEdge(faces[shared[0]], vertexId, adjacentId));
      }
      else
      {
        throw std::runtime_error(
          std::format("Non-manifold edge ({}, {}) shared by {} faces",
                      vertexId,
                      adjacentId,
                      shared.size()));
      }
    }
  }

  // Step 3: chain directed boundary edges into loops
  while (!boundaryEdges.empty())
  {
    auto first = boundaryEdges.begin();
    const size_t start = first->first;
    size_t current = first->second;
    boundaryEdges.erase(first);

    BoundaryLoop loop{start, current};
    while (current != start)
    {
      auto next = boundaryEdges.find(current);
      if (next == boundaryEdges.end())
      {
        break;
      }
      current = next->second;
      boundaryEdges.erase(next);
      loop.push_back(current);
    }

    if (current == start)
    {
      loop.pop_back();
      connectivity.boundaries.push_back(std::move(loop));
    }
    else
    {
      spdlog::warn(
        "Boundary is not closed: open chain of {} vertices from vertex {} to "
        "vertex {}",
        loop.size(),
        start,
        current);
      connectivity.openBoundaries.push_back(std::move(loop));
    }
  }

  return connectivity;
}

}  // namespace hydro_mesh
