// File: types/concepts.hpp

#ifndef CONCEPTS_HPP
#define CONCEPTS_HPP

#include <concepts>
#include <type_traits>

/*
 * Numeric Concepts
 */

template<typename T>
concept FloatingPoint = std::is_floating_point_v<T>;

/*
 * Utility Concepts
 */

template<typename Base, typename Derived>
concept DerivedFrom = std::derived_from<Derived, Base>;

#endif // CONCEPTS_HPP
