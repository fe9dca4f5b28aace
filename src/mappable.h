#pragma once
#include <concepts>
#include <ranges>
#include <type_traits>
#include <utility>

#include "rect.h"

namespace squarify
{

/// @brief Anything that can be placed in a treemap: a non-negative size
/// that maps to area, and a bounds rectangle written by the layout.
template <typename T>
concept Mappable = requires(T &t, const T &ct, const Rect &r) {
    { ct.size() } -> std::convertible_to<double>;
    { ct.bounds() } -> std::convertible_to<const Rect &>;
    t.set_bounds(r);
};

// Raw pointers and smart pointers to mappable items
template <typename P>
concept MappableHandle =
    requires(P &p) { *p; } &&
    Mappable<std::remove_reference_t<decltype(*std::declval<P &>())>>;

template <typename T>
concept MappableElement = Mappable<T> || MappableHandle<T>;

template <typename R>
concept MappableRange =
    std::ranges::random_access_range<R> && std::ranges::sized_range<R> &&
    MappableElement<std::ranges::range_value_t<R>>;

/// @brief Source of the item sequence to lay out, e.g. an application's own
/// data structures exposed as a range of item handles.
template <typename M>
concept MapModel = requires(M &m) {
    { m.items() } -> MappableRange;
};

template <MappableElement T> decltype(auto) item_of(T &element)
{
    if constexpr (Mappable<T>) {
        return (element);
    } else {
        return (*element);
    }
}

template <MappableElement T> double size_of(const T &element)
{
    if constexpr (Mappable<T>) {
        return static_cast<double>(element.size());
    } else {
        return static_cast<double>(element->size());
    }
}

} // namespace squarify
