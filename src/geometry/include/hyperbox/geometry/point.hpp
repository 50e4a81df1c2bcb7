/**
 * @file point.hpp
 * @brief Definition of a Point
 * a fixed size set of ndim real coordinates
 */
#pragma once
#include <array>
#include <concepts>
#include <cstddef>
#include <ostream>
#include <fmt/format.h>

namespace hyperbox::geometry {

    /**
     * @brief a point in ndim dimensional space
     * also used for displacements between points
     *
     * @tparam T the real value type
     * @tparam ndim the number of dimensions
     */
    template<typename T, int ndim>
    class Point{
        public:
        using value_type = T;
        static constexpr int dimension = ndim;

        std::array<T, ndim> data;

        /// @brief the origin
        constexpr Point() : data{} {}

        template<typename ...ArgT>
        requires(sizeof...(ArgT) == ndim && (std::convertible_to<ArgT, T> && ...))
        constexpr Point(ArgT... ts): data{static_cast<T>(ts)...} {}

        /// @brief get the point with every coordinate equal to value
        static constexpr auto repeat(const T &value) -> Point<T, ndim> {
            Point<T, ndim> pt{};
            pt.data.fill(value);
            return pt;
        }

        inline constexpr T &operator[] (int j){ return data[j]; }
        inline constexpr const T & operator[](int j) const { return data[j]; }

        inline constexpr auto begin() noexcept { return data.begin(); }
        inline constexpr auto begin() const noexcept { return data.begin(); }
        inline constexpr auto end() noexcept { return data.end(); }
        inline constexpr auto end() const noexcept { return data.end(); }

        static constexpr auto size() noexcept -> std::size_t { return ndim; }

        friend constexpr bool operator==(const Point&, const Point&) = default;
    };

    /// @brief component-wise difference a - b
    template<typename T, int ndim>
    constexpr auto operator-(const Point<T, ndim> &a, const Point<T, ndim> &b) -> Point<T, ndim> {
        Point<T, ndim> diff{};
        for(int idim = 0; idim < ndim; ++idim) diff[idim] = a[idim] - b[idim];
        return diff;
    }

    /// @brief write the point as ( x0, x1, ... )
    template<typename T, int ndim>
    std::ostream &operator<<(std::ostream &os, const Point<T, ndim> &pt){
        os << "(";
        for(int idim = 0; idim < ndim; ++idim){
            os << fmt::format(" {}", pt[idim]);
        }
        os << " )";
        return os;
    }
}
