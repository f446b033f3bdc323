// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file Types.hpp
 * @brief Common type aliases and constants for the qcirc circuit library
 *
 * Provides foundational types used throughout the qcirc library including
 * qubit and classical-bit indices, angles, the complex matrix type used by
 * unitary-matrix gates, and Pauli identifiers.
 */

#pragma once

#include <Eigen/Dense>

#include <complex>
#include <cstddef>

namespace qcirc {

/// @brief Type alias for qubit indices
using QubitIndex = std::size_t;

/// @brief Type alias for classical (measurement) bit indices
using CbitIndex = std::size_t;

/// @brief Type alias for rotation angles (in radians)
using Angle = double;

/// @brief Complex scalar used for matrix entries
using Complex = std::complex<double>;

/// @brief Dense complex matrix carried by unitary-matrix gates
using Matrix = Eigen::MatrixXcd;

/// @brief Encoding of a single-qubit Pauli operator (I=0, X=1, Y=2, Z=3)
using PauliId = unsigned int;

namespace pauli {

inline constexpr PauliId I = 0;
inline constexpr PauliId X = 1;
inline constexpr PauliId Y = 2;
inline constexpr PauliId Z = 3;

}  // namespace pauli

namespace constants {

/// @brief Largest target count a matrix gate may name (side is 2^n)
inline constexpr std::size_t MAX_MATRIX_TARGETS = 30;

/// @brief Default tolerance for approximate floating-point comparisons
inline constexpr double TOLERANCE = 1e-10;

/// @brief Pi constant for rotation gates
inline constexpr double PI = 3.14159265358979323846;

/// @brief Pi/2 for common rotations
inline constexpr double PI_2 = PI / 2.0;

/// @brief Pi/4 for T gate
inline constexpr double PI_4 = PI / 4.0;

}  // namespace constants

}  // namespace qcirc
