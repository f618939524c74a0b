#pragma once

#include <cstddef>
#include <string_view>
#include <type_traits>
#include <pfr/tuple_size.hpp>
#include <pfr/core.hpp>
#include <pfr/core_name.hpp>

namespace Rencode {

namespace introspection {

// Records are plain aggregates, reflected field by field through Boost.PFR.

template<std::size_t Index, class StructT>
constexpr decltype(auto) getStructElementByIndex(StructT & s) {
    return (pfr::get<Index>(s));
}

template<std::size_t Index, class StructT>
constexpr decltype(auto) getStructElementByIndex(const StructT & s) {
    return (pfr::get<Index>(s));
}

template<class StructT>
inline constexpr std::size_t structureElementsCount = pfr::tuple_size_v<std::remove_cv_t<StructT>>;

template<std::size_t Index, class StructT>
using structureElementTypeByIndex = pfr::tuple_element_t<Index, std::remove_cv_t<StructT>>;

template<std::size_t Index, class StructT>
inline constexpr std::string_view structureElementNameByIndex = pfr::get_name<Index, std::remove_cv_t<StructT>>();

} // namespace introspection

} // namespace Rencode
