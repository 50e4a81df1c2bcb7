/**
 * @brief Template Metaprogramming (TMP) utilities
 */
#pragma once
#include <type_traits>
namespace hyperbox::tmp {

    /** @brief a compile time constant integer type
     * for template argument deduction */
    template<int ival>
    using compile_int = std::integral_constant<int, ival>;
}
