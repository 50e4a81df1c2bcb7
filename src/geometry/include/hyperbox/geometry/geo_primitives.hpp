/// @brief Geometry Primitives
#pragma once
#include <ostream>
#include <hyperbox/math_utils.hpp>
#include <hyperbox/geometry/point.hpp>

namespace hyperbox::geometry {

    /// @brief a bounding box
    /// an axis aligned ndim dimensional hyperrectangle
    ///
    /// The corners are never validated or reordered, so lower[i] > upper[i] is allowed.
    /// Seeding with from_value(NaN) is the supported way to make an "empty" box:
    /// every expansion discards NaN bounds, so the first expand(p) makes the box exactly p.
    ///
    /// @tparam T the real value type
    /// @tparam ndim the number of dimensions
    template<class T, int ndim>
    struct BoundingBox {
        using value_type = T;
        using point_type = Point<T, ndim>;
        static constexpr int dimension = ndim;

        /// @brief the minimal corner of the hypercube
        point_type lower;

        /// @brief the maximal corner of the hypercube
        point_type upper;

        /// @brief zero volume box at the origin
        constexpr BoundingBox() = default;

        /// @brief construct from the corners as given
        constexpr BoundingBox(const point_type &lower, const point_type &upper)
        : lower{lower}, upper{upper} {}

        /// @brief zero volume box containing only pt
        static constexpr auto from_point(const point_type &pt) -> BoundingBox<T, ndim> {
            return BoundingBox{pt, pt};
        }

        /// @brief both corners have every coordinate equal to value
        static constexpr auto from_value(const T &value) -> BoundingBox<T, ndim> {
            return BoundingBox{point_type::repeat(value), point_type::repeat(value)};
        }

        /// @brief every coordinate of lower is lower_value
        /// every coordinate of upper is upper_value
        static constexpr auto from_values(const T &lower_value, const T &upper_value)
        -> BoundingBox<T, ndim> {
            return BoundingBox{point_type::repeat(lower_value), point_type::repeat(upper_value)};
        }

        /// @brief the displacement from lower to upper
        constexpr auto diagonal() const -> point_type { return upper - lower; }

        /**
         * @brief check if a point is inside the box (boundary inclusive)
         * any comparison with NaN fails so a NaN coordinate or bound gives false
         * @param pt the point to test
         * @return true if lower[i] <= pt[i] <= upper[i] for every i
         */
        constexpr bool contains(const point_type &pt) const {
            for(int idim = 0; idim < ndim; ++idim){
                if(!(lower[idim] <= pt[idim])) return false;
            }
            for(int idim = 0; idim < ndim; ++idim){
                if(!(upper[idim] >= pt[idim])) return false;
            }
            return true;
        }

        /// @brief lower the minimal corner to include pt
        constexpr void expand_lower(const point_type &pt) {
            for(int idim = 0; idim < ndim; ++idim)
                lower[idim] = math::nanmin(pt[idim], lower[idim]);
        }

        /// @brief raise the maximal corner to include pt
        constexpr void expand_upper(const point_type &pt) {
            for(int idim = 0; idim < ndim; ++idim)
                upper[idim] = math::nanmax(pt[idim], upper[idim]);
        }

        /// @brief grow the box by the minimal amount to include pt
        constexpr void expand(const point_type &pt) {
            expand_lower(pt);
            expand_upper(pt);
        }

        friend constexpr bool operator==(const BoundingBox&, const BoundingBox&) = default;
    };

    template<class T>
    using BoundingRange = BoundingBox<T, 1>;

    template<class T>
    using BoundingSquare = BoundingBox<T, 2>;

    template<class T>
    using BoundingCube = BoundingBox<T, 3>;

    template<class T, int ndim>
    std::ostream &operator<<(std::ostream &os, const BoundingBox<T, ndim> &box){
        os << "[" << box.lower << ", " << box.upper << "]";
        return os;
    }
}
