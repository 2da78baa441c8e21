// Ticket: 0001_geometry_kernel

#ifndef SEPAX_SIM_GEOMETRY_VEC3D_BASE_HPP
#define SEPAX_SIM_GEOMETRY_VEC3D_BASE_HPP

// NOLINTBEGIN(bugprone-crtp-constructor-accessibility)

#include <Eigen/Dense>

namespace sepax_sim::detail
{

/**
 * @brief CRTP base for the homogeneous 3D value types
 *
 * Derives from Eigen::Vector3d so Point and Direction keep full Eigen
 * arithmetic. Each derived type names the homogeneous coordinate it carries,
 * which decides how a 4x4 transform acts on it:
 *
 *   struct Point final : Vec3DBase<Point>
 *   {
 *     static constexpr double kHomogeneousW = 1.0;  // translates
 *   };
 *
 * A w of 0 applies only the rotational block.
 *
 * @tparam Derived The derived type (CRTP pattern)
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

  template <typename OtherDerived>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Vec3DBase(const Eigen::MatrixBase<OtherDerived>& other)
    : Eigen::Vector3d{other}
  {
  }

  template <typename OtherDerived>
  Vec3DBase& operator=(const Eigen::MatrixBase<OtherDerived>& other)
  {
    this->Eigen::Vector3d::operator=(other);
    return *this;
  }

  /**
   * @brief (x, y, z, w) with the derived type's homogeneous coordinate
   */
  [[nodiscard]] Eigen::Vector4d homogeneous() const
  {
    return Eigen::Vector4d{x(), y(), z(), Derived::kHomogeneousW};
  }

  /**
   * @brief Apply an affine 4x4 transform
   * @return Transformed value of the derived type
   */
  [[nodiscard]] Derived transform(const Eigen::Matrix4d& matrix) const
  {
    if constexpr (Derived::kHomogeneousW == 0.0)
    {
      return Derived{matrix.topLeftCorner<3, 3>() *
                     static_cast<const Eigen::Vector3d&>(*this)};
    }
    else
    {
      Eigen::Vector4d const transformed = matrix * homogeneous();
      return Derived{transformed.x(), transformed.y(), transformed.z()};
    }
  }

  Vec3DBase(const Vec3DBase&) = default;
  Vec3DBase(Vec3DBase&&) noexcept = default;
  Vec3DBase& operator=(const Vec3DBase&) = default;
  Vec3DBase& operator=(Vec3DBase&&) noexcept = default;
  ~Vec3DBase() = default;
};

}  // namespace sepax_sim::detail

// NOLINTEND(bugprone-crtp-constructor-accessibility)

#endif  // SEPAX_SIM_GEOMETRY_VEC3D_BASE_HPP
