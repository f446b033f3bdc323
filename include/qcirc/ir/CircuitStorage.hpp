// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file CircuitStorage.hpp
 * @brief Raw gate container shared by the immutable and mutable circuit forms
 *
 * CircuitStorage holds the qubit count, the classical-bit count and the
 * ordered gate sequence. It performs bounds validation but has no notion of
 * sharing; ownership and copy-on-write are handled by the circuit handles.
 *
 * @see Circuit.hpp for the handles that own a CircuitStorage
 */

#pragma once

#include "CircuitError.hpp"
#include "Gate.hpp"
#include "Types.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace qcirc::ir {

/**
 * @brief Qubit/classical-bit counts plus the gate sequence of a circuit.
 *
 * Insertion order is execution order. Every stored gate satisfies the
 * bounds of this storage; callers must run validateGate() before any of
 * the mutating members.
 */
class CircuitStorage {
public:
    /**
     * @brief Constructs an empty storage.
     * @param qubit_count Number of qubits (must be positive)
     * @param cbit_count Number of classical bits
     * @throws std::invalid_argument if qubit_count is 0
     */
    CircuitStorage(std::size_t qubit_count, std::size_t cbit_count)
        : qubit_count_(qubit_count)
        , cbit_count_(cbit_count)
    {
        if (qubit_count == 0) {
            throw std::invalid_argument("Circuit must have at least 1 qubit");
        }
    }

    [[nodiscard]] std::size_t qubitCount() const noexcept { return qubit_count_; }
    [[nodiscard]] std::size_t cbitCount() const noexcept { return cbit_count_; }
    [[nodiscard]] const std::vector<Gate>& gates() const noexcept { return gates_; }

    /**
     * @brief Validates that a gate's indices are within this storage's bounds.
     * @param g The gate to validate
     * @throws CircuitError (IndexOutOfRange) if any index is invalid
     */
    void validateGate(const Gate& g) const {
        for (auto q : g.qubitIndices()) {
            if (q >= qubit_count_) {
                throw CircuitError(
                    CircuitErrorKind::IndexOutOfRange,
                    "Gate " + std::string(g.name()) +
                    " references qubit " + std::to_string(q) +
                    " but circuit only has " + std::to_string(qubit_count_) +
                    " qubits");
            }
        }
        for (auto c : g.classicalIndices()) {
            if (c >= cbit_count_) {
                throw CircuitError(
                    CircuitErrorKind::IndexOutOfRange,
                    "Gate " + std::string(g.name()) +
                    " references classical bit " + std::to_string(c) +
                    " but circuit only has " + std::to_string(cbit_count_) +
                    " classical bits");
            }
        }
    }

    /**
     * @brief Validates every gate of a batch, in order.
     * @throws CircuitError tagged with the position of the first bad gate
     */
    void validateGates(const std::vector<Gate>& gates) const {
        for (std::size_t i = 0; i < gates.size(); ++i) {
            try {
                validateGate(gates[i]);
            } catch (const CircuitError& e) {
                throw e.atGate(i);
            }
        }
    }

    /// @brief Inserts an already-validated gate before @p position.
    void insert(std::size_t position, Gate gate) {
        gates_.insert(gates_.begin() + static_cast<std::ptrdiff_t>(position),
                      std::move(gate));
    }

    /// @brief Appends already-validated gates.
    void append(const std::vector<Gate>& gates) {
        gates_.insert(gates_.end(), gates.begin(), gates.end());
    }

private:
    std::size_t qubit_count_;
    std::size_t cbit_count_;
    std::vector<Gate> gates_;
};

}  // namespace qcirc::ir
