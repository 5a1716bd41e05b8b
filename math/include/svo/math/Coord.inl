/**
 * @file Coord.inl
 * @brief Inline implementation of Coord operations.
 * @see   Coord.hpp
 */

#ifndef SVO_MATH_COORD_INL
    #define SVO_MATH_COORD_INL

    #include <algorithm>

namespace svo::math {

constexpr Coord::Coord(core::u8 x_, core::u8 y_, core::u8 z_) : x(x_), y(y_), z(z_) {}

constexpr Coord Coord::operator+(Coord rhs) const
{
    return {static_cast<core::u8>(x + rhs.x), static_cast<core::u8>(y + rhs.y), static_cast<core::u8>(z + rhs.z)};
}

constexpr Coord Coord::operator-(Coord rhs) const
{
    return {static_cast<core::u8>(x - rhs.x), static_cast<core::u8>(y - rhs.y), static_cast<core::u8>(z - rhs.z)};
}

constexpr Coord &Coord::operator+=(Coord rhs) { *this = *this + rhs; return *this; }

constexpr Coord &Coord::operator-=(Coord rhs) { *this = *this - rhs; return *this; }

constexpr core::u8 Coord::maxAxis() const { return std::max({x, y, z}); }

constexpr Coord Coord::zero()  { return {0, 0, 0}; }
constexpr Coord Coord::unitX() { return {1, 0, 0}; }
constexpr Coord Coord::unitY() { return {0, 1, 0}; }
constexpr Coord Coord::unitZ() { return {0, 0, 1}; }

inline std::ostream &operator<<(std::ostream &os, Coord c)
{
    return os << '(' << static_cast<unsigned>(c.x) << ", " << static_cast<unsigned>(c.y) << ", "
              << static_cast<unsigned>(c.z) << ')';
}

} // namespace svo::math

#endif // SVO_MATH_COORD_INL
