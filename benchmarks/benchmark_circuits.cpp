// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file benchmark_circuits.cpp
 * @brief Benchmark suite for circuit construction, sharing and analysis
 *
 * Times the core circuit operations on standard circuit patterns:
 * - QFT (Quantum Fourier Transform)
 * - Random circuits
 * - QAOA-style circuits built from Pauli rotations
 *
 * For each circuit it measures building, freezing, combining a frozen
 * template with a tail, deep-copying, copy-on-write after freeze, and
 * depth analysis.
 */

#include "qcirc/ir/Circuit.hpp"
#include "qcirc/ir/Gate.hpp"

#include <chrono>
#include <cmath>
#include <functional>
#include <iomanip>
#include <iostream>
#include <optional>
#include <random>
#include <string>
#include <utility>
#include <vector>

using namespace qcirc;

// ============================================================================
// Circuit Generators
// ============================================================================

/**
 * @brief Generates a Quantum Fourier Transform circuit.
 *
 * QFT on n qubits requires O(n^2) gates:
 * - n Hadamard gates
 * - n(n-1)/2 controlled rotation gates
 */
ir::Circuit generateQFT(std::size_t n) {
    ir::Circuit circuit(n, n);

    for (std::size_t i = 0; i < n; ++i) {
        circuit.addHGate(i);

        for (std::size_t j = i + 1; j < n; ++j) {
            double angle = constants::PI / std::pow(2.0, static_cast<double>(j - i));
            // Controlled phase decomposed as: CNOT + U1 + CNOT + U1
            circuit.addCNOTGate(j, i);
            circuit.addU1Gate(i, -angle / 2);
            circuit.addCNOTGate(j, i);
            circuit.addU1Gate(i, angle / 2);
        }
    }

    for (std::size_t i = 0; i < n / 2; ++i) {
        circuit.addSWAPGate(i, n - 1 - i);
    }

    std::vector<QubitIndex> qubits(n);
    std::vector<CbitIndex> cbits(n);
    for (std::size_t i = 0; i < n; ++i) {
        qubits[i] = i;
        cbits[i] = i;
    }
    circuit.measure(qubits, cbits);

    return circuit;
}

/**
 * @brief Generates a random circuit with mixed gate types.
 */
ir::Circuit generateRandom(std::size_t n_qubits, std::size_t n_gates, unsigned seed = 42) {
    std::mt19937 rng(seed);
    std::uniform_int_distribution<std::size_t> qubit_dist(0, n_qubits - 1);
    std::uniform_int_distribution<int> gate_dist(0, 6);
    std::uniform_real_distribution<double> angle_dist(0.0, 2 * constants::PI);

    ir::Circuit circuit(n_qubits);

    for (std::size_t i = 0; i < n_gates; ++i) {
        int gate_type = gate_dist(rng);
        std::size_t q0 = qubit_dist(rng);

        switch (gate_type) {
            case 0:
                circuit.addHGate(q0);
                break;
            case 1:
                circuit.addSqrtXGate(q0);
                break;
            case 2:
                circuit.addU3Gate(q0, angle_dist(rng), angle_dist(rng), angle_dist(rng));
                break;
            case 3:
            case 4:
            case 5: {
                // Two-qubit gate
                std::size_t q1 = qubit_dist(rng);
                if (q1 == q0) {
                    q1 = (q0 + 1) % n_qubits;
                }
                if (gate_type == 3) {
                    circuit.addCNOTGate(q0, q1);
                } else if (gate_type == 4) {
                    circuit.addCZGate(q0, q1);
                } else {
                    circuit.addSWAPGate(q0, q1);
                }
                break;
            }
            case 6: {
                std::size_t q1 = (q0 + 1) % n_qubits;
                std::size_t q2 = (q0 + 2) % n_qubits;
                if (n_qubits >= 3) {
                    circuit.addTOFFOLIGate(q0, q1, q2);
                } else {
                    circuit.addTGate(q0);
                }
                break;
            }
        }
    }

    return circuit;
}

/**
 * @brief Generates a QAOA-style circuit.
 *
 * Alternating layers of:
 * - Problem Hamiltonian (ZZ Pauli rotations on a ring)
 * - Mixer Hamiltonian (X rotations)
 */
ir::Circuit generateQAOA(std::size_t n_qubits, std::size_t p_layers) {
    ir::Circuit circuit(n_qubits);

    // Initial state: |+>^n
    for (std::size_t i = 0; i < n_qubits; ++i) {
        circuit.addHGate(i);
    }

    for (std::size_t layer = 0; layer < p_layers; ++layer) {
        double gamma = constants::PI / (4.0 * static_cast<double>(layer + 1));
        double beta = constants::PI / (2.0 * static_cast<double>(layer + 1));

        for (std::size_t i = 0; i < n_qubits; ++i) {
            std::size_t j = (i + 1) % n_qubits;
            circuit.addPauliRotationGate({i, j}, {pauli::Z, pauli::Z}, gamma);
        }

        for (std::size_t i = 0; i < n_qubits; ++i) {
            circuit.addRXGate(i, beta);
        }
    }

    return circuit;
}

// ============================================================================
// Benchmarking Infrastructure
// ============================================================================

struct BenchmarkResult {
    std::string name;
    std::size_t n_qubits;
    std::size_t n_gates;
    std::size_t depth;
    double build_time_ms;
    double freeze_time_ms;
    double combine_time_ms;
    double copy_time_ms;
    double cow_time_ms;
    double depth_time_ms;
};

double timeMs(const std::function<void()>& fn) {
    auto start = std::chrono::high_resolution_clock::now();
    fn();
    auto end = std::chrono::high_resolution_clock::now();
    return std::chrono::duration<double, std::milli>(end - start).count();
}

BenchmarkResult runBenchmark(
    const std::string& name,
    const std::function<ir::Circuit()>& generate) {

    BenchmarkResult result;
    result.name = name;

    std::optional<ir::Circuit> built;
    result.build_time_ms = timeMs([&] { built = generate(); });
    ir::Circuit circuit = std::move(*built);

    result.n_qubits = circuit.qubitCount();
    result.n_gates = circuit.numGates();

    std::optional<ir::ImmutableCircuit> frozen;
    result.freeze_time_ms = timeMs([&] { frozen = circuit.freeze(); });

    // Template reuse: append a short tail to the shared snapshot
    const std::vector<ir::Gate> tail{ir::Gate::h(0), ir::Gate::x(0)};
    result.combine_time_ms = timeMs([&] {
        for (int i = 0; i < 10; ++i) {
            auto combined = *frozen + tail;
            (void)combined;
        }
    });

    result.copy_time_ms = timeMs([&] {
        auto copy = frozen->getMutableCopy();
        (void)copy;
    });

    // First mutation after freeze pays for the deep copy
    result.cow_time_ms = timeMs([&] { circuit.addHGate(0); });

    result.depth_time_ms = timeMs([&] { result.depth = frozen->depth(); });

    return result;
}

void printResults(const std::vector<BenchmarkResult>& results) {
    std::cout << "\n";
    std::cout << "================================================================================\n";
    std::cout << "                           QCIRC CIRCUIT BENCHMARKS                             \n";
    std::cout << "================================================================================\n\n";

    std::cout << std::left << std::setw(20) << "Circuit"
              << std::right << std::setw(8) << "Qubits"
              << std::setw(10) << "Gates"
              << std::setw(10) << "Depth"
              << "\n";

    std::cout << std::string(48, '-') << "\n";

    for (const auto& r : results) {
        std::cout << std::left << std::setw(20) << r.name
                  << std::right << std::setw(8) << r.n_qubits
                  << std::setw(10) << r.n_gates
                  << std::setw(10) << r.depth
                  << "\n";
    }

    std::cout << "\n";
    std::cout << "Timing (ms):\n";
    std::cout << std::string(86, '-') << "\n";
    std::cout << std::left << std::setw(20) << "Circuit"
              << std::right << std::setw(11) << "Build"
              << std::setw(11) << "Freeze"
              << std::setw(11) << "Combine10"
              << std::setw(11) << "Copy"
              << std::setw(11) << "CoW"
              << std::setw(11) << "Depth"
              << "\n";

    for (const auto& r : results) {
        std::cout << std::left << std::setw(20) << r.name
                  << std::right << std::fixed << std::setprecision(3)
                  << std::setw(11) << r.build_time_ms
                  << std::setw(11) << r.freeze_time_ms
                  << std::setw(11) << r.combine_time_ms
                  << std::setw(11) << r.copy_time_ms
                  << std::setw(11) << r.cow_time_ms
                  << std::setw(11) << r.depth_time_ms
                  << "\n";
    }
    std::cout << "\n";
}

// ============================================================================
// Main
// ============================================================================

int main() {
    std::cout << "Generating benchmark circuits...\n";

    std::vector<BenchmarkResult> results;

    // QFT benchmarks
    for (std::size_t n : {4UL, 8UL, 16UL, 32UL}) {
        results.push_back(runBenchmark("QFT-" + std::to_string(n),
                                       [n] { return generateQFT(n); }));
    }

    // Random circuit benchmarks
    for (auto [n, g] : std::vector<std::pair<std::size_t, std::size_t>>{
             {10, 1000}, {20, 10000}, {50, 100000}}) {
        results.push_back(runBenchmark("Random-" + std::to_string(n) + "x" + std::to_string(g),
                                       [n = n, g = g] { return generateRandom(n, g); }));
    }

    // QAOA benchmarks
    for (auto [n, p] : std::vector<std::pair<std::size_t, std::size_t>>{{10, 2}, {20, 4}, {50, 8}}) {
        results.push_back(runBenchmark("QAOA-" + std::to_string(n) + "-p" + std::to_string(p),
                                       [n = n, p = p] { return generateQAOA(n, p); }));
    }

    printResults(results);

    return 0;
}
