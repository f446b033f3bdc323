// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file CircuitError.hpp
 * @brief Structured error type for gate and circuit validation
 *
 * Every validation failure in the gate catalog and in circuit construction
 * is reported as a CircuitError carrying a machine-readable kind, a
 * human-readable detail message, and, for batch operations, the position
 * of the offending gate within the batch.
 *
 * @see Gate.hpp for gate-level (structural) validation
 * @see Circuit.hpp for bounds validation at insertion time
 */

#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace qcirc::ir {

/**
 * @brief Category of a validation failure.
 */
enum class CircuitErrorKind {
    IndexOutOfRange,    ///< Qubit or classical index outside the circuit's counts
    InvalidGateIndex,   ///< Insertion position outside [0, numGates()]
    LengthMismatch,     ///< Index/parameter list has the wrong length
    DimensionMismatch,  ///< Matrix side is not 2^(number of targets)
    DuplicateIndex,     ///< Index repeated within one gate's own index list
    InvalidPauliId,     ///< Pauli identifier outside {0, 1, 2, 3}
};

/**
 * @brief Get string representation of error kind.
 */
[[nodiscard]] constexpr std::string_view errorKindName(CircuitErrorKind kind) noexcept {
    switch (kind) {
        case CircuitErrorKind::IndexOutOfRange:   return "index out of range";
        case CircuitErrorKind::InvalidGateIndex:  return "invalid gate index";
        case CircuitErrorKind::LengthMismatch:    return "length mismatch";
        case CircuitErrorKind::DimensionMismatch: return "dimension mismatch";
        case CircuitErrorKind::DuplicateIndex:    return "duplicate index";
        case CircuitErrorKind::InvalidPauliId:    return "invalid pauli id";
    }
    return "error";
}

/**
 * @brief Exception thrown when a gate or circuit fails validation.
 *
 * Inherits from std::runtime_error for compatibility with standard
 * exception handling. what() has the form
 * "[gate N: ]<kind>: <detail>".
 */
class CircuitError : public std::runtime_error {
public:
    /**
     * @brief Construct an error with kind and message.
     * @param kind Error category
     * @param detail Description of the offending index or value
     * @param gate_position Position of the failing gate within a batch
     */
    CircuitError(CircuitErrorKind kind,
                 std::string detail,
                 std::optional<std::size_t> gate_position = std::nullopt)
        : std::runtime_error(format(kind, detail, gate_position))
        , kind_(kind)
        , detail_(std::move(detail))
        , gate_position_(gate_position) {}

    // Accessors
    [[nodiscard]] CircuitErrorKind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::string& detail() const noexcept { return detail_; }
    [[nodiscard]] std::optional<std::size_t> gatePosition() const noexcept {
        return gate_position_;
    }

    /**
     * @brief Returns a copy of this error tagged with a batch position.
     *
     * Used by batch operations (construction with initial gates, extend)
     * to report which gate of the batch was rejected.
     */
    [[nodiscard]] CircuitError atGate(std::size_t position) const {
        return CircuitError(kind_, detail_, position);
    }

private:
    CircuitErrorKind kind_;
    std::string detail_;
    std::optional<std::size_t> gate_position_;

    static std::string format(CircuitErrorKind kind,
                              const std::string& detail,
                              std::optional<std::size_t> gate_position) {
        std::string result;
        if (gate_position.has_value()) {
            result = "gate " + std::to_string(*gate_position) + ": ";
        }
        result += std::string(errorKindName(kind)) + ": " + detail;
        return result;
    }
};

}  // namespace qcirc::ir
