#ifndef HYDRO_MESH_VEC3D_BASE_HPP
#define HYDRO_MESH_VEC3D_BASE_HPP

// NOLINTBEGIN(bugprone-crtp-constructor-accessibility)

#include <format>

#include <Eigen/Dense>

namespace hydro_mesh::detail
{

/**
 * @brief Common base of the mesh vector types (Coordinate, Vector3D)
 *
 * Both types are plain Eigen::Vector3d values: vertex arrays, face centers
 * and normals are stored as std::vector of them and fed straight to Eigen
 * expressions. Assigning an Eigen expression keeps the derived type, so
 * `vertex = rotation * vertex` stays a Coordinate.
 *
 * @tparam Derived Coordinate or Vector3D
 */
template <typename Derived>
class Vec3DBase : public Eigen::Vector3d
{
public:
  Vec3DBase() : Eigen::Vector3d{0.0, 0.0, 0.0}
  {
  }

  Vec3DBase(double x, double y, double z) : Eigen::Vector3d{x, y, z}
  {
  }

  // NOLINTNEXTLINE(google-explicit-constructor)
  Vec3DBase(const Eigen::Vector3d& vec) : Eigen::Vector3d{vec}
  {
  }

  template <typename OtherDerived>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Vec3DBase(const Eigen::MatrixBase<OtherDerived>& other)
    : Eigen::Vector3d{other}
  {
  }

  template <typename OtherDerived>
  Derived& operator=(const Eigen::MatrixBase<OtherDerived>& other)
  {
    this->Eigen::Vector3d::operator=(other);
    return static_cast<Derived&>(*this);
  }
};

/**
 * @brief std::format support for Vec3DBase types, printed as "(x, y, z)".
 *
 * The format spec applies to each component as it would to a double
 * ("{:.3e}", "{:10.2f}"). An empty spec prints fixed notation with 6 digits.
 */
template <typename T>
struct Vec3Formatter : std::formatter<double>
{
  constexpr auto parse(std::format_parse_context& ctx)
  {
    auto it = ctx.begin();
    if (it == ctx.end() || *it == '}')
    {
      fixedDefault_ = true;
      return it;
    }
    return std::formatter<double>::parse(ctx);
  }

  auto format(const T& vec, std::format_context& ctx) const
  {
    auto out = ctx.out();
    for (Eigen::Index i = 0; i < vec.size(); ++i)
    {
      out = std::format_to(out, "{}", i == 0 ? "(" : ", ");
      if (fixedDefault_)
      {
        out = std::format_to(out, "{:f}", vec[i]);
      }
      else
      {
        ctx.advance_to(out);
        out = std::formatter<double>::format(vec[i], ctx);
      }
    }
    return std::format_to(out, ")");
  }

private:
  bool fixedDefault_{false};
};

}  // namespace hydro_mesh::detail

// NOLINTEND(bugprone-crtp-constructor-accessibility)

#endif  // HYDRO_MESH_VEC3D_BASE_HPP
