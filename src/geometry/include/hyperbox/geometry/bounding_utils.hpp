/**
 * @brief utilities to build and diagnose bounding boxes
 */
#pragma once
#include <concepts>
#include <limits>
#include <ranges>
#include <source_location>
#include <utility>
#include <hyperbox/anomaly_log.hpp>
#include <hyperbox/geometry/geo_primitives.hpp>

namespace hyperbox::geometry {

    /// @brief compute the bounding box of a set of points
    ///
    /// The box is seeded with NaN and expanded by every point.
    /// An empty range logs an anomaly and returns the NaN seed.
    ///
    /// @tparam T the real value type
    /// @tparam ndim the number of dimensions
    /// @param points the points to enclose
    /// @param loc where the empty point set anomaly is reported from
    template<std::floating_point T, int ndim, std::ranges::input_range R>
    requires std::convertible_to<std::ranges::range_reference_t<R>, const Point<T, ndim>&>
    auto compute_bounding_box(
        R&& points,
        std::source_location loc = std::source_location::current()
    ) -> BoundingBox<T, ndim> {
        auto bbox = BoundingBox<T, ndim>::from_value(std::numeric_limits<T>::quiet_NaN());
        bool empty = true;
        for(const Point<T, ndim> &pt : points){
            bbox.expand(pt);
            empty = false;
        }
        if(empty) {
            util::AnomalyLog::log_anomaly(util::Anomaly{
                "bounding box requested for an empty point set",
                util::empty_point_set_tag{},
                loc
            });
        }
        return bbox;
    }

    /// @brief compute the bounding box of a range of Point
    /// deducing the real type and dimension from the range
    template<std::ranges::input_range R>
    auto compute_bounding_box(
        R&& points,
        std::source_location loc = std::source_location::current()
    ) {
        using point_t = std::ranges::range_value_t<R>;
        return compute_bounding_box<typename point_t::value_type, point_t::dimension>(
                std::forward<R>(points), loc);
    }

    /**
     * @brief check that every axis of the box satisfies lower <= upper
     * does not modify the box
     *
     * each failing axis (inverted or with a NaN bound) is logged as an anomaly
     *
     * @param box the box to check
     * @return true if no axis is inverted
     */
    template<class T, int ndim>
    bool check_bounds(
        const BoundingBox<T, ndim> &box,
        std::source_location loc = std::source_location::current()
    ) {
        bool ordered = true;
        for(int idim = 0; idim < ndim; ++idim){
            if(!(box.lower[idim] <= box.upper[idim])){
                ordered = false;
                util::AnomalyLog::log_anomaly(util::Anomaly{
                    "bounding box axis is inverted",
                    util::inverted_axis_tag<T>{idim, box.lower[idim], box.upper[idim]},
                    loc
                });
            }
        }
        return ordered;
    }
}
