// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file basic_usage.cpp
 * @brief Basic usage example for the qcirc circuit library
 *
 * Demonstrates:
 * - Creating circuits programmatically
 * - Matrix and Pauli gates
 * - Freezing, copying and combining circuits
 * - Handling validation errors
 */

#include "qcirc/ir/Circuit.hpp"
#include "qcirc/ir/Gate.hpp"

#include <iostream>

using namespace qcirc;

int main() {
    std::cout << "=== qcirc - Basic Usage ===\n\n";

    // =========================================================================
    // 1. Creating a circuit programmatically
    // =========================================================================
    std::cout << "1. Creating a Bell state circuit programmatically:\n";

    ir::Circuit bell(2, 2);
    bell.addGate(ir::Gate::h(0));
    bell.addGate(ir::Gate::cnot(0, 1));

    std::cout << "   Gates: " << bell.numGates() << "\n";
    std::cout << "   Depth: " << bell.depth() << "\n\n";

    // =========================================================================
    // 2. Matrix and Pauli gates
    // =========================================================================
    std::cout << "2. Adding matrix and Pauli gates:\n";

    const Complex i{0.0, 1.0};
    Matrix phase = ir::matrixFromRows({{1.0, 0.0}, {0.0, i}});

    ir::Circuit custom(3);
    custom.addSingleQubitUnitaryMatrixGate(0, phase);
    custom.addPauliGate({0, 2}, {pauli::X, pauli::Z});
    custom.addPauliRotationGate({1, 2}, {pauli::Y, pauli::Y}, constants::PI_4);

    for (const auto& gate : custom) {
        std::cout << "   " << gate << "\n";
    }
    std::cout << "\n";

    // =========================================================================
    // 3. Freezing and combining
    // =========================================================================
    std::cout << "3. Freezing a template and combining it:\n";

    ir::ImmutableCircuit prep = bell.freeze();
    ir::Circuit run = prep + std::vector<ir::Gate>{ir::Gate::measurement({0, 1}, {0, 1})};
    ir::Circuit editable = prep.getMutableCopy();
    editable.addXGate(1);

    std::cout << "   Template gates: " << prep.numGates() << "\n";
    std::cout << "   Combined gates: " << run.numGates() << "\n";
    std::cout << "   Copy gates: " << editable.numGates() << "\n";
    std::cout << "   Template unchanged: " << (prep == bell ? "yes" : "no") << "\n\n";

    // =========================================================================
    // 4. Validation errors
    // =========================================================================
    std::cout << "4. Rejecting invalid gates:\n";

    try {
        bell.addCNOTGate(0, 5);
    } catch (const ir::CircuitError& e) {
        std::cout << "   Error: " << e.what() << "\n";
    }

    try {
        bell.extend({ir::Gate::x(0), ir::Gate::x(1), ir::Gate::h(9)});
    } catch (const ir::CircuitError& e) {
        std::cout << "   Error: " << e.what() << "\n";
        std::cout << "   Gates still: " << bell.numGates() << "\n";
    }

    std::cout << "\n=== Done! ===\n";

    return 0;
}
