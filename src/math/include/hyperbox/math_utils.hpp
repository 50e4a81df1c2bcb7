#pragma once
#include <concepts>

namespace hyperbox::math {

    /**
     * @brief check if a scalar is NaN
     * usable in constant expressions (unlike std::isnan)
     * non floating point types are never NaN
     *
     * @tparam T the scalar type
     * @param x the value to check
     * @return true if x is NaN
     */
    template<typename T>
    constexpr bool is_nan(const T &x) noexcept {
        if constexpr (std::floating_point<T>) {
            return x != x;
        } else {
            return false;
        }
    }

    /**
     * @brief minimum of two scalars that discards NaN
     *
     * nanmin(NaN, x) = x and nanmin(x, NaN) = x
     * so NaN behaves as "no bound yet" rather than propagating
     * nanmin(NaN, NaN) = NaN
     *
     * @tparam T the scalar type
     * @param a the first value
     * @param b the second value
     * @return the smaller of a and b ignoring NaN
     */
    template<typename T>
    constexpr T nanmin(const T &a, const T &b) noexcept {
        if(is_nan(a)) return b;
        if(is_nan(b)) return a;
        return (b < a) ? b : a;
    }

    /**
     * @brief maximum of two scalars that discards NaN
     * see nanmin()
     */
    template<typename T>
    constexpr T nanmax(const T &a, const T &b) noexcept {
        if(is_nan(a)) return b;
        if(is_nan(b)) return a;
        return (a < b) ? b : a;
    }
}
