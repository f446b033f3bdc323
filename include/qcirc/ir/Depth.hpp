// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file Depth.hpp
 * @brief Critical-path (depth) analysis of a gate sequence
 *
 * Assigns every gate to the earliest layer in which it can run, assuming
 * gates on disjoint wires run in parallel. Wires are the qubits plus the
 * classical bits, so two measurements writing the same bit are serialized.
 *
 * @see Circuit.hpp for the depth() accessor built on this
 */

#pragma once

#include "CircuitError.hpp"
#include "Gate.hpp"

#include <algorithm>
#include <string>
#include <vector>

namespace qcirc::ir {

/**
 * @brief Computes the layer of each gate.
 *
 * Layers start at 1. A gate's layer is one more than the latest layer of
 * any wire it touches.
 *
 * @param qubit_count Number of qubit wires
 * @param cbit_count Number of classical wires
 * @param gates Gate sequence in execution order
 * @return layers[i] is the layer of gates[i]
 * @throws CircuitError (IndexOutOfRange) if a gate lies outside the wires
 */
[[nodiscard]] inline std::vector<std::size_t> gateLayers(std::size_t qubit_count,
                                                         std::size_t cbit_count,
                                                         const std::vector<Gate>& gates) {
    // Classical wire c lives at qubit_count + c.
    std::vector<std::size_t> wire_layers(qubit_count + cbit_count, 0);
    std::vector<std::size_t> layers;
    layers.reserve(gates.size());

    std::vector<std::size_t> touched;
    for (const auto& g : gates) {
        touched = g.qubitIndices();
        for (auto q : touched) {
            if (q >= qubit_count) {
                throw CircuitError(CircuitErrorKind::IndexOutOfRange,
                                   "qubit " + std::to_string(q) + " outside " +
                                   std::to_string(qubit_count) + " wires");
            }
        }
        for (auto c : g.classicalIndices()) {
            if (c >= cbit_count) {
                throw CircuitError(CircuitErrorKind::IndexOutOfRange,
                                   "classical bit " + std::to_string(c) +
                                   " outside " + std::to_string(cbit_count) + " wires");
            }
            touched.push_back(qubit_count + c);
        }

        std::size_t max_layer = 0;
        for (auto w : touched) {
            max_layer = std::max(max_layer, wire_layers[w]);
        }

        const std::size_t layer = max_layer + 1;
        for (auto w : touched) {
            wire_layers[w] = layer;
        }
        layers.push_back(layer);
    }

    return layers;
}

/**
 * @brief Calculates the depth of a gate sequence.
 *
 * Depth is the length of the longest wire-dependency chain, i.e. the
 * minimum number of sequential layers.
 *
 * @return Depth (0 for an empty sequence)
 */
[[nodiscard]] inline std::size_t circuitDepth(std::size_t qubit_count,
                                              std::size_t cbit_count,
                                              const std::vector<Gate>& gates) {
    if (gates.empty()) {
        return 0;
    }
    const auto layers = gateLayers(qubit_count, cbit_count, gates);
    return *std::max_element(layers.begin(), layers.end());
}

}  // namespace qcirc::ir
