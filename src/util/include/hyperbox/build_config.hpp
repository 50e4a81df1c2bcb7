/**
 * @file build_config.hpp
 * @brief Build configuration option integration
 *
 * The real value type is chosen with one of
 * HYPERBOX_SINGLE_PRECISION, HYPERBOX_DOUBLE_PRECISION, HYPERBOX_QUAD_PRECISION
 * (set by the HYPERBOX_PRECISION cmake cache variable)
 */
#pragma once
namespace hyperbox::build_config {
    #if defined(HYPERBOX_QUAD_PRECISION)
    using T = long double;
    #elif defined(HYPERBOX_SINGLE_PRECISION)
    using T = float;
    #else
    using T = double;
    #endif
}
