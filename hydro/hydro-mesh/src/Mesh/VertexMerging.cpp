#include "hydro-mesh/src/Mesh/VertexMerging.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

#include "hydro-mesh/src/Utils/utils.hpp"

namespace hydro_mesh
{

namespace
{

/**
 * @brief Union-find over vertex ids where the smallest id is the root
 */
class UnionFind
{
public:
  explicit UnionFind(size_t n) : parent_(n)
  {
    std::iota(parent_.begin(), parent_.end(), size_t{0});
  }

  size_t find(size_t x)
  {
    if (parent_[x] != x)
    {
      parent_[x] = find(parent_[x]);  // Path compression
    }
    return parent_[x];
  }

  void unite(size_t a, size_t b)
  {
    const size_t ra = find(a);
    const size_t rb = find(b);
    if (ra == rb)
    {
      return;
    }
    // Keep the first occurrence as representative
    if (ra < rb)
    {
      parent_[rb] = ra;
    }
    else
    {
      parent_[ra] = rb;
    }
  }

private:
  std::vector<size_t> parent_;
};

bool withinTolerance(const Coordinate& a, const Coordinate& b, double atol)
{
  return std::abs(a.x() - b.x()) <= atol && std::abs(a.y() - b.y()) <= atol &&
         std::abs(a.z() - b.z()) <= atol;
}

}  // namespace

VertexMergeResult mergeDuplicateVertices(const std::vector<Coordinate>& vertices,
                                         double atol)
{
  if (atol < 0.0)
  {
    throw std::invalid_argument("Merge tolerance must be non-negative");
  }

  const size_t n = vertices.size();

  // Sweep along x: only vertices within atol in x can be duplicates
  std::vector<size_t> order(n);
  std::iota(order.begin(), order.end(), size_t{0});
  std::stable_sort(order.begin(),
                   order.end(),
                   [&vertices](size_t a, size_t b)
                   { return vertices[a].x() < vertices[b].x(); });

  UnionFind groups{n};
  for (size_t k = 0; k < n; ++k)
  {
    const Coordinate& current = vertices[order[k]];
    for (size_t m = k + 1; m < n; ++m)
    {
      const Coordinate& candidate = vertices[order[m]];
      if (candidate.x() - current.x() > atol)
      {
        break;
      }
      if (withinTolerance(current, candidate, atol))
      {
        groups.unite(order[k], order[m]);
      }
    }
  }

  VertexMergeResult result;
  result.oldToNew.assign(n, kUnusedVertex);
  for (size_t i = 0; i < n; ++i)
  {
    const size_t root = groups.find(i);
    if (root == i)
    {
      result.oldToNew[i] = result.uniqueVertices.size();
      result.uniqueVertices.push_back(vertices[i]);
    }
    else
    {
      // Roots are the smallest ids of their group, already numbered
      result.oldToNew[i] = result.oldToNew[root];
    }
  }

  return result;
}

}  // namespace hydro_mesh
