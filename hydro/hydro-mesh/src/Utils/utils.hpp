#ifndef HYDRO_MESH_UTILS_HPP
#define HYDRO_MESH_UTILS_HPP

#include <cstddef>
#include <limits>

namespace hydro_mesh
{

/// Marker used in old->new index maps for entries that were dropped
constexpr size_t kUnusedVertex = std::numeric_limits<size_t>::max();

}  // namespace hydro_mesh

#endif  // HYDRO_MESH_UTILS_HPP
