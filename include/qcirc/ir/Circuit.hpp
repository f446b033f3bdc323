// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file Circuit.hpp
 * @brief Immutable and mutable quantum circuit handles
 *
 * Provides two handles over a shared CircuitStorage:
 * - ImmutableCircuit: a read-only snapshot. Copies of it share the same
 *   storage, so large circuits can be passed around and reused as templates
 *   without copying gates.
 * - Circuit: the mutable builder. It copies-on-write: if its storage is
 *   referenced by any other handle (for example after freeze()), the next
 *   mutation first takes a private deep copy, so snapshots never change.
 *
 * Composition (extend, combine, operator+) takes gate indices verbatim.
 * No qubit re-indexing is performed; indices are only checked against the
 * receiving circuit's counts, and the source circuit's counts are ignored.
 * Callers merging circuits built over different qubit spaces must make the
 * indices compatible themselves.
 *
 * Handles are not internally synchronized. Any number of threads may read
 * one storage through immutable handles, but a Circuit shared between
 * threads needs external locking.
 *
 * @see CircuitStorage.hpp for the underlying container
 * @see Depth.hpp for the depth computation
 */

#pragma once

#include "CircuitError.hpp"
#include "CircuitStorage.hpp"
#include "Depth.hpp"
#include "Gate.hpp"
#include "Types.hpp"

#include <algorithm>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace qcirc::ir {

class Circuit;

/**
 * @brief A read-only, freely-shareable quantum circuit.
 *
 * Copying an ImmutableCircuit copies the handle, not the gates. An
 * ImmutableCircuit can also be constructed from a Circuit, which is
 * equivalent to calling freeze() on it.
 *
 * Example:
 * @code
 * Circuit builder(2);
 * builder.addHGate(0);
 * builder.addCNOTGate(0, 1);
 *
 * ImmutableCircuit bell = builder.freeze();   // no copy
 * Circuit longer = bell + std::vector<Gate>{Gate::x(1)};
 * @endcode
 */
class ImmutableCircuit {
public:
    using const_iterator = std::vector<Gate>::const_iterator;

    // Copies share storage. Moves copy the handle, so the source stays usable.
    ImmutableCircuit(const ImmutableCircuit&) = default;
    ImmutableCircuit& operator=(const ImmutableCircuit&) = default;

    ~ImmutableCircuit() noexcept = default;

    // -------------------------------------------------------------------------
    // Circuit Properties
    // -------------------------------------------------------------------------

    /// @brief Returns the number of qubits in the circuit.
    [[nodiscard]] std::size_t qubitCount() const noexcept { return storage_->qubitCount(); }

    /// @brief Returns the number of classical bits in the circuit.
    [[nodiscard]] std::size_t cbitCount() const noexcept { return storage_->cbitCount(); }

    /**
     * @brief Returns all gates in the circuit.
     *
     * The reference stays valid until the next mutation through a Circuit
     * handle over the same storage.
     */
    [[nodiscard]] const std::vector<Gate>& gates() const noexcept {
        return storage_->gates();
    }

    /// @brief Returns the number of gates in the circuit.
    [[nodiscard]] std::size_t numGates() const noexcept { return gates().size(); }

    /// @brief Returns true if the circuit has no gates.
    [[nodiscard]] bool empty() const noexcept { return gates().empty(); }

    /**
     * @brief Returns the gate at the specified position.
     * @throws std::out_of_range if index >= numGates()
     */
    [[nodiscard]] const Gate& gate(std::size_t index) const {
        if (index >= numGates()) {
            throw std::out_of_range(
                "Gate index " + std::to_string(index) +
                " out of range [0, " + std::to_string(numGates()) + ")");
        }
        return gates()[index];
    }

    /**
     * @brief Calculates the circuit depth.
     *
     * Depth is the length of the longest dependency chain over qubit and
     * classical-bit wires, with gates on disjoint wires sharing a layer.
     *
     * @return Circuit depth (0 for empty circuits)
     */
    [[nodiscard]] std::size_t depth() const {
        return circuitDepth(qubitCount(), cbitCount(), gates());
    }

    /**
     * @brief Counts gates of a specific type.
     * @param type The gate type to count
     * @return Number of gates of the specified type
     */
    [[nodiscard]] std::size_t countGates(GateType type) const noexcept {
        return static_cast<std::size_t>(
            std::count_if(gates().begin(), gates().end(),
                          [type](const Gate& g) { return g.type() == type; }));
    }

    /// @brief Returns true if both handles reference the same storage.
    [[nodiscard]] bool sharesStorageWith(const ImmutableCircuit& other) const noexcept {
        return storage_ == other.storage_;
    }

    // -------------------------------------------------------------------------
    // Iteration
    // -------------------------------------------------------------------------

    [[nodiscard]] const_iterator begin() const noexcept { return gates().begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return gates().end(); }
    [[nodiscard]] const_iterator cbegin() const noexcept { return gates().cbegin(); }
    [[nodiscard]] const_iterator cend() const noexcept { return gates().cend(); }

    // -------------------------------------------------------------------------
    // Derivation
    // -------------------------------------------------------------------------

    /**
     * @brief Returns a handle to the same storage.
     *
     * Never copies. On an ImmutableCircuit this is an idempotent handle
     * copy; on a Circuit it snapshots the current gates, and the Circuit
     * copies-on-write from then on.
     */
    [[nodiscard]] ImmutableCircuit freeze() const { return ImmutableCircuit(storage_); }

    /**
     * @brief Creates an independent mutable deep copy.
     * @return New Circuit owning its own copy of the counts and gates
     */
    [[nodiscard]] Circuit getMutableCopy() const;

    /**
     * @brief Returns a new circuit with @p gates appended to a copy of this one.
     *
     * Uses the validation contract of Circuit::extend(). This circuit is
     * never modified.
     *
     * @throws CircuitError if any appended gate is out of this circuit's bounds
     */
    [[nodiscard]] Circuit combine(const std::vector<Gate>& gates) const;

    /// @brief Appends another circuit's gates; its counts are not checked.
    [[nodiscard]] Circuit combine(const ImmutableCircuit& other) const;

    [[nodiscard]] Circuit operator+(const std::vector<Gate>& gates) const;
    [[nodiscard]] Circuit operator+(const ImmutableCircuit& other) const;

    // -------------------------------------------------------------------------
    // Comparison
    // -------------------------------------------------------------------------

    /**
     * @brief Exact structural equality.
     *
     * Equal counts and pairwise-equal gates in order. Angles and matrix
     * entries compare by bit pattern; see isApprox() for tolerance comparison.
     */
    [[nodiscard]] bool operator==(const ImmutableCircuit& other) const {
        if (storage_ == other.storage_) {
            return true;
        }
        return qubitCount() == other.qubitCount() &&
               cbitCount() == other.cbitCount() &&
               gates() == other.gates();
    }

    [[nodiscard]] bool operator!=(const ImmutableCircuit& other) const {
        return !(*this == other);
    }

    /**
     * @brief Equality with angles and matrix entries compared within a tolerance.
     * @see Gate::isApprox
     */
    [[nodiscard]] bool isApprox(const ImmutableCircuit& other,
                                double tolerance = constants::TOLERANCE) const {
        if (qubitCount() != other.qubitCount() ||
            cbitCount() != other.cbitCount() ||
            numGates() != other.numGates()) {
            return false;
        }
        for (std::size_t i = 0; i < numGates(); ++i) {
            if (!gates()[i].isApprox(other.gates()[i], tolerance)) {
                return false;
            }
        }
        return true;
    }

    // -------------------------------------------------------------------------
    // Utilities
    // -------------------------------------------------------------------------

    /**
     * @brief Returns a string representation of the circuit.
     * @return Multi-line string showing circuit structure
     */
    [[nodiscard]] std::string toString() const {
        std::string result = "Circuit(" + std::to_string(qubitCount()) +
                             " qubits, " + std::to_string(cbitCount()) +
                             " cbits, " + std::to_string(numGates()) +
                             " gates, depth " + std::to_string(depth()) + "):\n";
        for (const auto& g : gates()) {
            result += "  " + g.toString() + "\n";
        }
        return result;
    }

protected:
    explicit ImmutableCircuit(std::shared_ptr<CircuitStorage> storage)
        : storage_(std::move(storage)) {}

    /// Never mutated through an ImmutableCircuit.
    std::shared_ptr<CircuitStorage> storage_;
};

/**
 * @brief A mutable quantum circuit builder.
 *
 * Gates are validated against the circuit's qubit and classical-bit counts
 * when added. Every mutating operation either fully succeeds or leaves the
 * circuit unchanged. Copying a Circuit is cheap; both copies share storage
 * until one of them is mutated.
 *
 * Example:
 * @code
 * Circuit circuit(2, 2);  // 2 qubits, 2 classical bits
 * circuit.addHGate(0);
 * circuit.addCNOTGate(0, 1);
 * circuit.measure({0, 1}, {0, 1});
 *
 * for (const auto& gate : circuit) {
 *     std::cout << gate.toString() << "\n";
 * }
 * @endcode
 */
class Circuit : public ImmutableCircuit {
public:
    /**
     * @brief Constructs a circuit, optionally with initial gates.
     * @param qubit_count Number of qubits (positive)
     * @param cbit_count Number of classical bits
     * @param gates Initial gates, validated in order
     * @throws std::invalid_argument if qubit_count is 0
     * @throws CircuitError tagged with the position of the first invalid gate
     */
    explicit Circuit(std::size_t qubit_count,
                     std::size_t cbit_count = 0,
                     const std::vector<Gate>& gates = {})
        : ImmutableCircuit(std::make_shared<CircuitStorage>(qubit_count, cbit_count))
    {
        storage_->validateGates(gates);
        storage_->append(gates);
    }

    Circuit(const Circuit&) = default;
    Circuit& operator=(const Circuit&) = default;

    ~Circuit() noexcept = default;

    // -------------------------------------------------------------------------
    // Gate Management
    // -------------------------------------------------------------------------

    /**
     * @brief Appends a gate to the circuit.
     * @param gate The gate to add
     * @throws CircuitError (IndexOutOfRange) if the gate references a qubit
     *         or classical bit beyond the circuit size
     */
    void addGate(Gate gate) {
        addGate(std::move(gate), numGates());
    }

    /**
     * @brief Inserts a gate before @p position, shifting later gates.
     * @param gate The gate to add
     * @param position Insertion point in [0, numGates()]
     * @throws CircuitError (InvalidGateIndex) if position > numGates()
     * @throws CircuitError (IndexOutOfRange) if the gate is out of bounds
     */
    void addGate(Gate gate, std::size_t position) {
        if (position > numGates()) {
            throw CircuitError(
                CircuitErrorKind::InvalidGateIndex,
                "Gate position " + std::to_string(position) +
                " out of range [0, " + std::to_string(numGates()) + "]");
        }
        storage_->validateGate(gate);
        mutableStorage().insert(position, std::move(gate));
    }

    /**
     * @brief Appends a sequence of gates, all or nothing.
     *
     * Each gate is checked against this circuit's bounds before any is
     * applied. Indices are not remapped.
     *
     * @throws CircuitError tagged with the position of the first invalid gate
     */
    void extend(const std::vector<Gate>& gates) {
        storage_->validateGates(gates);
        if (gates.empty()) {
            return;
        }
        if (&gates == &storage_->gates()) {
            const std::vector<Gate> copy = gates;
            mutableStorage().append(copy);
            return;
        }
        mutableStorage().append(gates);
    }

    /// @brief Appends another circuit's gates; its counts are not checked.
    void extend(const ImmutableCircuit& other) {
        extend(other.gates());
    }

    Circuit& operator+=(const std::vector<Gate>& gates) {
        extend(gates);
        return *this;
    }

    Circuit& operator+=(const ImmutableCircuit& other) {
        extend(other);
        return *this;
    }

    // -------------------------------------------------------------------------
    // Gate Adders
    // -------------------------------------------------------------------------

    void addIdentityGate(QubitIndex qubit) { addGate(Gate::identity(qubit)); }
    void addXGate(QubitIndex qubit) { addGate(Gate::x(qubit)); }
    void addYGate(QubitIndex qubit) { addGate(Gate::y(qubit)); }
    void addZGate(QubitIndex qubit) { addGate(Gate::z(qubit)); }
    void addHGate(QubitIndex qubit) { addGate(Gate::h(qubit)); }
    void addSGate(QubitIndex qubit) { addGate(Gate::s(qubit)); }
    void addSdagGate(QubitIndex qubit) { addGate(Gate::sdag(qubit)); }
    void addSqrtXGate(QubitIndex qubit) { addGate(Gate::sqrtX(qubit)); }
    void addSqrtXdagGate(QubitIndex qubit) { addGate(Gate::sqrtXdag(qubit)); }
    void addSqrtYGate(QubitIndex qubit) { addGate(Gate::sqrtY(qubit)); }
    void addSqrtYdagGate(QubitIndex qubit) { addGate(Gate::sqrtYdag(qubit)); }
    void addTGate(QubitIndex qubit) { addGate(Gate::t(qubit)); }
    void addTdagGate(QubitIndex qubit) { addGate(Gate::tdag(qubit)); }

    void addU1Gate(QubitIndex qubit, Angle lambda) {
        addGate(Gate::u1(qubit, lambda));
    }

    void addU2Gate(QubitIndex qubit, Angle phi, Angle lambda) {
        addGate(Gate::u2(qubit, phi, lambda));
    }

    void addU3Gate(QubitIndex qubit, Angle theta, Angle phi, Angle lambda) {
        addGate(Gate::u3(qubit, theta, phi, lambda));
    }

    void addRXGate(QubitIndex qubit, Angle angle) { addGate(Gate::rx(qubit, angle)); }
    void addRYGate(QubitIndex qubit, Angle angle) { addGate(Gate::ry(qubit, angle)); }
    void addRZGate(QubitIndex qubit, Angle angle) { addGate(Gate::rz(qubit, angle)); }

    void addCNOTGate(QubitIndex control, QubitIndex target) {
        addGate(Gate::cnot(control, target));
    }

    void addCZGate(QubitIndex control, QubitIndex target) {
        addGate(Gate::cz(control, target));
    }

    void addSWAPGate(QubitIndex qubit1, QubitIndex qubit2) {
        addGate(Gate::swap(qubit1, qubit2));
    }

    void addTOFFOLIGate(QubitIndex control1, QubitIndex control2, QubitIndex target) {
        addGate(Gate::toffoli(control1, control2, target));
    }

    void addUnitaryMatrixGate(std::vector<QubitIndex> targets, Matrix matrix) {
        addGate(Gate::unitaryMatrix(std::move(targets), std::move(matrix)));
    }

    void addSingleQubitUnitaryMatrixGate(QubitIndex target, Matrix matrix) {
        addGate(Gate::singleQubitUnitaryMatrix(target, std::move(matrix)));
    }

    void addTwoQubitUnitaryMatrixGate(QubitIndex target1, QubitIndex target2,
                                      Matrix matrix) {
        addGate(Gate::twoQubitUnitaryMatrix(target1, target2, std::move(matrix)));
    }

    void addPauliGate(std::vector<QubitIndex> targets, std::vector<PauliId> pauli_ids) {
        addGate(Gate::pauli(std::move(targets), std::move(pauli_ids)));
    }

    void addPauliRotationGate(std::vector<QubitIndex> targets,
                              std::vector<PauliId> pauli_ids,
                              Angle angle) {
        addGate(Gate::pauliRotation(std::move(targets), std::move(pauli_ids), angle));
    }

    // -------------------------------------------------------------------------
    // Measurement
    // -------------------------------------------------------------------------

    /**
     * @brief Appends a measurement of qubits[i] into cbits[i].
     * @throws CircuitError (LengthMismatch) if the lists differ in length
     * @throws CircuitError (DuplicateIndex) if either list repeats an index
     * @throws CircuitError (IndexOutOfRange) if an index exceeds its count
     */
    void measure(std::vector<QubitIndex> qubits, std::vector<CbitIndex> cbits) {
        if (qubits.size() != cbits.size()) {
            throw CircuitError(
                CircuitErrorKind::LengthMismatch,
                "measure got " + std::to_string(qubits.size()) + " qubit(s) and " +
                std::to_string(cbits.size()) + " classical bit(s)");
        }
        addGate(Gate::measurement(std::move(qubits), std::move(cbits)));
    }

    void measure(QubitIndex qubit, CbitIndex cbit) {
        measure(std::vector<QubitIndex>{qubit}, std::vector<CbitIndex>{cbit});
    }

    void measure(std::vector<QubitIndex> qubits, CbitIndex cbit) {
        measure(std::move(qubits), std::vector<CbitIndex>{cbit});
    }

    void measure(QubitIndex qubit, std::vector<CbitIndex> cbits) {
        measure(std::vector<QubitIndex>{qubit}, std::move(cbits));
    }

private:
    friend class ImmutableCircuit;

    explicit Circuit(std::shared_ptr<CircuitStorage> storage)
        : ImmutableCircuit(std::move(storage)) {}

    /// @brief Returns the storage, deep-copying it first if it is shared.
    CircuitStorage& mutableStorage() {
        if (storage_.use_count() > 1) {
            storage_ = std::make_shared<CircuitStorage>(*storage_);
        }
        return *storage_;
    }
};

// -----------------------------------------------------------------------------
// ImmutableCircuit members that produce a Circuit
// -----------------------------------------------------------------------------

inline Circuit ImmutableCircuit::getMutableCopy() const {
    return Circuit(std::make_shared<CircuitStorage>(*storage_));
}

inline Circuit ImmutableCircuit::combine(const std::vector<Gate>& gates) const {
    Circuit result = getMutableCopy();
    result.extend(gates);
    return result;
}

inline Circuit ImmutableCircuit::combine(const ImmutableCircuit& other) const {
    return combine(other.gates());
}

inline Circuit ImmutableCircuit::operator+(const std::vector<Gate>& gates) const {
    return combine(gates);
}

inline Circuit ImmutableCircuit::operator+(const ImmutableCircuit& other) const {
    return combine(other.gates());
}

/**
 * @brief Stream output operator for circuits of either form.
 * @param os Output stream
 * @param circuit The circuit to output
 * @return Reference to the output stream
 */
inline std::ostream& operator<<(std::ostream& os, const ImmutableCircuit& circuit) {
    os << circuit.toString();
    return os;
}

}  // namespace qcirc::ir
