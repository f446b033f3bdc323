// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file main.cpp
 * @brief Quantum circuit library demonstration
 *
 * Demonstrates circuit construction, freezing and combination using the
 * qcirc::ir library.
 */

#include "qcirc/ir/Circuit.hpp"

#include <iostream>

int main() {
    using namespace qcirc::ir;

    std::cout << "=== Quantum Circuit Library ===\n\n";

    // Create a 2-qubit Bell state circuit
    std::cout << "Building Bell state circuit...\n";
    Circuit bell(2, 2);
    bell.addHGate(0);
    bell.addCNOTGate(0, 1);

    std::cout << bell << "\n";

    // Create a 3-qubit GHZ state circuit
    std::cout << "Building GHZ state circuit...\n";
    Circuit ghz(3);
    ghz.addGate(Gate::h(0));
    ghz.addGate(Gate::cnot(0, 1));
    ghz.addGate(Gate::cnot(1, 2));

    std::cout << ghz << "\n";

    // Demonstrate rotation gates
    std::cout << "Building rotation circuit...\n";
    Circuit rotations(2);
    rotations.addHGate(0);
    rotations.addRZGate(0, qcirc::constants::PI_4);
    rotations.addRXGate(1, qcirc::constants::PI_2);
    rotations.addCNOTGate(0, 1);
    rotations.addPauliRotationGate({0, 1}, {qcirc::pauli::X, qcirc::pauli::Y},
                                   qcirc::constants::PI);

    std::cout << rotations << "\n";

    // Freeze the Bell preparation and reuse it as a template
    std::cout << "=== Template Reuse ===\n";
    ImmutableCircuit prep = bell.freeze();
    Circuit measured = prep + std::vector<Gate>{Gate::measurement({0, 1}, {0, 1})};
    Circuit flipped = prep.combine({Gate::x(1), Gate::measurement({0, 1}, {0, 1})});

    // The builder diverges from the snapshot on its next mutation
    bell.addZGate(0);

    std::cout << "Template:\n" << prep << "\n";
    std::cout << "Measured:\n" << measured << "\n";
    std::cout << "Flipped:\n" << flipped << "\n";
    std::cout << "Builder after Z:\n" << bell << "\n";

    // Show circuit statistics
    std::cout << "=== Circuit Statistics ===\n";
    std::cout << "GHZ circuit:\n";
    std::cout << "  Qubits: " << ghz.qubitCount() << "\n";
    std::cout << "  Gates: " << ghz.numGates() << "\n";
    std::cout << "  Depth: " << ghz.depth() << "\n";
    std::cout << "  CNOT gates: " << ghz.countGates(GateType::CNOT) << "\n";

    std::cout << "\nMeasured circuit:\n";
    std::cout << "  Qubits: " << measured.qubitCount() << "\n";
    std::cout << "  Classical bits: " << measured.cbitCount() << "\n";
    std::cout << "  Gates: " << measured.numGates() << "\n";
    std::cout << "  Depth: " << measured.depth() << "\n";
    std::cout << "  Equal to flipped: " << (measured == flipped ? "yes" : "no") << "\n";

    // Demonstrate iteration
    std::cout << "\n=== Iterating over GHZ gates ===\n";
    for (const auto& gate : ghz) {
        std::cout << "  " << gate.toString() << "\n";
    }

    std::cout << "\nDone.\n";
    return 0;
}
