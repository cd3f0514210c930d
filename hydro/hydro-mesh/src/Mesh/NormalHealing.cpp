#include "hydro-mesh/src/Mesh/NormalHealing.hpp"

#include <stack>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace hydro_mesh
{

namespace
{

/**
 * @brief Geometric vertices of a face shared with another face
 */
std::vector<size_t> sharedVertices(const Face& a, const Face& b)
{
  std::vector<size_t> shared;
  for (size_t i = 0; i < a.vertexCount(); ++i)
  {
    for (size_t j = 0; j < b.vertexCount(); ++j)
    {
      if (a[i] == b[j])
      {
        shared.push_back(a[i]);
        break;
      }
    }
  }
  return shared;
}

}  // namespace

bool NormalHealer::traversesEdge(const Face& face, size_t from, size_t to)
{
  const size_t n = face.vertexCount();
  for (size_t slot = 0; slot < n; ++slot)
  {
    if (face[slot] == from && face[(slot + 1) % n] == to)
    {
      return true;
    }
  }
  return false;
}

NormalHealer::FloodFillResult NormalHealer::floodFill(
  std::vector<Face>& faces,
  const std::vector<std::set<size_t>>& faceFaces)
{
  if (faceFaces.size() != faces.size())
  {
    throw std::invalid_argument(
      "Face adjacency size does not match the number of faces");
  }

  FloodFillResult result;
  std::vector<bool> visited(faces.size(), false);
  size_t nextSeed = 0;

  while (true)
  {
    while (nextSeed < faces.size() && visited[nextSeed])
    {
      ++nextSeed;
    }
    if (nextSeed == faces.size())
    {
      break;
    }

    ++result.componentCount;
    visited[nextSeed] = true;
    std::stack<size_t> frontier;
    frontier.push(nextSeed);

    while (!frontier.empty())
    {
      const size_t faceId = frontier.top();
      frontier.pop();

      for (const size_t neighborId : faceFaces[faceId])
      {
        if (visited[neighborId])
        {
          continue;
        }

        const std::vector<size_t> shared =
          sharedVertices(faces[faceId], faces[neighborId]);
        if (shared.size() != 2)
        {
          spdlog::warn(
            "Faces {} and {} share {} vertices instead of 2, adjacency skipped",
            faceId,
            neighborId,
            shared.size());
          continue;
        }

        // Consistent neighbors run the shared edge in opposite directions
        const size_t a = shared[0];
        const size_t b = shared[1];
        const bool forward = traversesEdge(faces[faceId], a, b);
        const bool neighborForward = traversesEdge(faces[neighborId], a, b);
        if (forward == neighborForward)
        {
          faces[neighborId].reverse();
          ++result.reversedFaces;
        }

        visited[neighborId] = true;
        frontier.push(neighborId);
      }
    }
  }

  return result;
}

}  // namespace hydro_mesh
