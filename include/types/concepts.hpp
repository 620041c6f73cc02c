// File: types/concepts.hpp

#ifndef CONCEPTS_HPP
#define CONCEPTS_HPP

#include <concepts>
#include <cstdint>
#include <random>
#include <type_traits>

/*
 * Numeric Concepts
 */

template<typename T>
concept FloatingPoint = std::is_floating_point_v<T>;

template<typename T>
concept Integral = std::is_integral_v<T>;

/*
 * Random Concepts
 */

// Engines that can drive every stochastic component from an explicit 64-bit seed.
template<typename E>
concept SeededEngine = std::uniform_random_bit_generator<E> && std::constructible_from<E, std::uint64_t>;

#endif // CONCEPTS_HPP
