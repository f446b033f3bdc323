// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file Gate.hpp
 * @brief Quantum gate catalog: gate kinds, factories and structural validation
 *
 * Provides the Gate class, a tagged value covering every gate kind in the
 * catalog (fixed gates, parameterized rotations, unitary-matrix gates,
 * multi-qubit Pauli operators and measurement), along with factory methods
 * and utility functions for gate properties.
 *
 * A Gate validates its own shape on construction. It never checks qubit or
 * classical-bit bounds: a gate is bound to a circuit only when it is added.
 *
 * @see Circuit.hpp for circuit-level operations
 * @see CircuitError.hpp for the errors raised here
 */

#pragma once

#include "CircuitError.hpp"
#include "Types.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace qcirc::ir {

/**
 * @brief Enumeration of supported quantum gate kinds.
 */
enum class GateType {
    // Fixed single-qubit gates
    Identity,   ///< Identity gate
    X,          ///< Pauli-X (NOT) gate
    Y,          ///< Pauli-Y gate
    Z,          ///< Pauli-Z gate
    H,          ///< Hadamard gate
    S,          ///< S gate (sqrt(Z))
    Sdag,       ///< S-dagger gate
    SqrtX,      ///< sqrt(X) gate
    SqrtXdag,   ///< sqrt(X)-dagger gate
    SqrtY,      ///< sqrt(Y) gate
    SqrtYdag,   ///< sqrt(Y)-dagger gate
    T,          ///< T gate (sqrt(S))
    Tdag,       ///< T-dagger gate

    // Parameterized single-qubit gates
    U1,         ///< U1(lambda)
    U2,         ///< U2(phi, lambda)
    U3,         ///< U3(theta, phi, lambda)
    RX,         ///< Rotation around X-axis
    RY,         ///< Rotation around Y-axis
    RZ,         ///< Rotation around Z-axis

    // Fixed multi-qubit gates
    CNOT,       ///< Controlled-NOT (control, target)
    CZ,         ///< Controlled-Z (control, target)
    SWAP,       ///< SWAP of two qubits
    TOFFOLI,    ///< Doubly-controlled NOT (control1, control2, target)

    // Generic unitary-matrix gates
    UnitaryMatrix,              ///< N-target matrix gate
    SingleQubitUnitaryMatrix,   ///< 1-target matrix gate
    TwoQubitUnitaryMatrix,      ///< 2-target matrix gate

    // Pauli operators
    Pauli,          ///< Multi-qubit Pauli string
    PauliRotation,  ///< exp(-i * theta * P / 2) for a Pauli string P

    Measurement     ///< Qubit to classical-bit measurement
};

/**
 * @brief Returns the name of a gate type as a string.
 * @param type The gate type
 * @return String representation of the gate type
 */
[[nodiscard]] constexpr std::string_view gateTypeName(GateType type) noexcept {
    switch (type) {
        case GateType::Identity:                 return "Identity";
        case GateType::X:                        return "X";
        case GateType::Y:                        return "Y";
        case GateType::Z:                        return "Z";
        case GateType::H:                        return "H";
        case GateType::S:                        return "S";
        case GateType::Sdag:                     return "Sdag";
        case GateType::SqrtX:                    return "SqrtX";
        case GateType::SqrtXdag:                 return "SqrtXdag";
        case GateType::SqrtY:                    return "SqrtY";
        case GateType::SqrtYdag:                 return "SqrtYdag";
        case GateType::T:                        return "T";
        case GateType::Tdag:                     return "Tdag";
        case GateType::U1:                       return "U1";
        case GateType::U2:                       return "U2";
        case GateType::U3:                       return "U3";
        case GateType::RX:                       return "RX";
        case GateType::RY:                       return "RY";
        case GateType::RZ:                       return "RZ";
        case GateType::CNOT:                     return "CNOT";
        case GateType::CZ:                       return "CZ";
        case GateType::SWAP:                     return "SWAP";
        case GateType::TOFFOLI:                  return "TOFFOLI";
        case GateType::UnitaryMatrix:            return "UnitaryMatrix";
        case GateType::SingleQubitUnitaryMatrix: return "SingleQubitUnitaryMatrix";
        case GateType::TwoQubitUnitaryMatrix:    return "TwoQubitUnitaryMatrix";
        case GateType::Pauli:                    return "Pauli";
        case GateType::PauliRotation:            return "PauliRotation";
        case GateType::Measurement:              return "Measurement";
    }
    return "Unknown";
}

/**
 * @brief Returns the number of target qubits a gate type acts on.
 * @param type The gate type
 * @return Number of targets, or 0 if the kind takes a variable-length list
 */
[[nodiscard]] constexpr std::size_t numTargetsFor(GateType type) noexcept {
    switch (type) {
        case GateType::SWAP:
        case GateType::TwoQubitUnitaryMatrix:
            return 2;
        case GateType::UnitaryMatrix:
        case GateType::Pauli:
        case GateType::PauliRotation:
        case GateType::Measurement:
            return 0;
        default:
            return 1;
    }
}

/**
 * @brief Returns the number of control qubits a gate type takes.
 */
[[nodiscard]] constexpr std::size_t numControlsFor(GateType type) noexcept {
    switch (type) {
        case GateType::CNOT:
        case GateType::CZ:
            return 1;
        case GateType::TOFFOLI:
            return 2;
        default:
            return 0;
    }
}

/**
 * @brief Returns the number of real parameters a gate type takes.
 */
[[nodiscard]] constexpr std::size_t numParamsFor(GateType type) noexcept {
    switch (type) {
        case GateType::U1:
        case GateType::RX:
        case GateType::RY:
        case GateType::RZ:
        case GateType::PauliRotation:
            return 1;
        case GateType::U2:
            return 2;
        case GateType::U3:
            return 3;
        default:
            return 0;
    }
}

/**
 * @brief Returns whether a gate type is parameterized.
 * @param type The gate type
 * @return true if the gate requires at least one angle parameter
 */
[[nodiscard]] constexpr bool isParameterized(GateType type) noexcept {
    return numParamsFor(type) > 0;
}

/// @brief Returns whether a gate type carries a unitary matrix.
[[nodiscard]] constexpr bool isMatrixGate(GateType type) noexcept {
    return type == GateType::UnitaryMatrix ||
           type == GateType::SingleQubitUnitaryMatrix ||
           type == GateType::TwoQubitUnitaryMatrix;
}

/// @brief Returns whether a gate type carries a Pauli-identifier list.
[[nodiscard]] constexpr bool isPauliGate(GateType type) noexcept {
    return type == GateType::Pauli || type == GateType::PauliRotation;
}

/**
 * @brief Builds a Matrix from nested rows of complex entries.
 * @param rows Row-major entries; every row must have the same length
 * @throws CircuitError (DimensionMismatch) on ragged rows
 */
[[nodiscard]] inline Matrix matrixFromRows(const std::vector<std::vector<Complex>>& rows) {
    const std::size_t num_rows = rows.size();
    const std::size_t num_cols = rows.empty() ? 0 : rows.front().size();
    Matrix m(static_cast<Eigen::Index>(num_rows), static_cast<Eigen::Index>(num_cols));
    for (std::size_t r = 0; r < num_rows; ++r) {
        if (rows[r].size() != num_cols) {
            throw CircuitError(
                CircuitErrorKind::DimensionMismatch,
                "matrix row " + std::to_string(r) + " has " +
                std::to_string(rows[r].size()) + " entries, expected " +
                std::to_string(num_cols));
        }
        for (std::size_t c = 0; c < num_cols; ++c) {
            m(static_cast<Eigen::Index>(r), static_cast<Eigen::Index>(c)) = rows[r][c];
        }
    }
    return m;
}

/**
 * @brief Represents one quantum gate operation.
 *
 * A Gate consists of a type tag plus uniform attribute lists: target qubits,
 * control qubits, classical bits, angle parameters, Pauli identifiers and a
 * unitary matrix. Lists a kind does not use are empty. Gates are value types
 * and can be copied/moved.
 *
 * No unitarity check is performed on supplied matrices; callers passing a
 * matrix are responsible for it being unitary.
 *
 * Example:
 * @code
 * auto h = Gate::h(0);                          // Hadamard on qubit 0
 * auto cx = Gate::cnot(0, 1);                   // control=0, target=1
 * auto rz = Gate::rz(0, PI/4);                  // RZ(pi/4) on qubit 0
 * auto p = Gate::pauli({0, 1}, {pauli::X, pauli::Z});
 * auto m = Gate::measurement({0, 1}, {0, 1});
 * @endcode
 */
class Gate {
public:
    /**
     * @brief Constructs a gate with the given properties.
     * @param type The gate type
     * @param target_indices Target qubit indices
     * @param control_indices Control qubit indices (CNOT, CZ, TOFFOLI)
     * @param params Angle parameters, in the order the kind defines
     * @param pauli_ids Pauli identifiers parallel to the targets
     * @param unitary_matrix Matrix for unitary-matrix gates
     * @param classical_indices Destination bits for measurement
     * @throws CircuitError if the gate's shape is invalid for its kind
     */
    Gate(GateType type,
         std::vector<QubitIndex> target_indices,
         std::vector<QubitIndex> control_indices = {},
         std::vector<Angle> params = {},
         std::vector<PauliId> pauli_ids = {},
         Matrix unitary_matrix = Matrix(),
         std::vector<CbitIndex> classical_indices = {})
        : type_(type)
        , target_indices_(std::move(target_indices))
        , control_indices_(std::move(control_indices))
        , classical_indices_(std::move(classical_indices))
        , params_(std::move(params))
        , pauli_ids_(std::move(pauli_ids))
        , unitary_matrix_(std::move(unitary_matrix))
    {
        validate();
    }

    // Default special members
    ~Gate() noexcept = default;
    Gate(const Gate&) = default;
    Gate& operator=(const Gate&) = default;
    Gate(Gate&&) noexcept = default;
    Gate& operator=(Gate&&) noexcept = default;

    // -------------------------------------------------------------------------
    // Factory Methods: fixed single-qubit gates
    // -------------------------------------------------------------------------

    /// @brief Creates an Identity gate on the specified qubit.
    [[nodiscard]] static Gate identity(QubitIndex qubit) {
        return Gate(GateType::Identity, {qubit});
    }

    /// @brief Creates a Pauli-X gate on the specified qubit.
    [[nodiscard]] static Gate x(QubitIndex qubit) {
        return Gate(GateType::X, {qubit});
    }

    /// @brief Creates a Pauli-Y gate on the specified qubit.
    [[nodiscard]] static Gate y(QubitIndex qubit) {
        return Gate(GateType::Y, {qubit});
    }

    /// @brief Creates a Pauli-Z gate on the specified qubit.
    [[nodiscard]] static Gate z(QubitIndex qubit) {
        return Gate(GateType::Z, {qubit});
    }

    /// @brief Creates a Hadamard gate on the specified qubit.
    [[nodiscard]] static Gate h(QubitIndex qubit) {
        return Gate(GateType::H, {qubit});
    }

    /// @brief Creates an S gate on the specified qubit.
    [[nodiscard]] static Gate s(QubitIndex qubit) {
        return Gate(GateType::S, {qubit});
    }

    /// @brief Creates an S-dagger gate on the specified qubit.
    [[nodiscard]] static Gate sdag(QubitIndex qubit) {
        return Gate(GateType::Sdag, {qubit});
    }

    [[nodiscard]] static Gate sqrtX(QubitIndex qubit) {
        return Gate(GateType::SqrtX, {qubit});
    }

    [[nodiscard]] static Gate sqrtXdag(QubitIndex qubit) {
        return Gate(GateType::SqrtXdag, {qubit});
    }

    [[nodiscard]] static Gate sqrtY(QubitIndex qubit) {
        return Gate(GateType::SqrtY, {qubit});
    }

    [[nodiscard]] static Gate sqrtYdag(QubitIndex qubit) {
        return Gate(GateType::SqrtYdag, {qubit});
    }

    /// @brief Creates a T gate on the specified qubit.
    [[nodiscard]] static Gate t(QubitIndex qubit) {
        return Gate(GateType::T, {qubit});
    }

    /// @brief Creates a T-dagger gate on the specified qubit.
    [[nodiscard]] static Gate tdag(QubitIndex qubit) {
        return Gate(GateType::Tdag, {qubit});
    }

    // -------------------------------------------------------------------------
    // Factory Methods: parameterized single-qubit gates
    // -------------------------------------------------------------------------

    /// @brief Creates a U1(lambda) phase gate.
    [[nodiscard]] static Gate u1(QubitIndex qubit, Angle lambda) {
        return Gate(GateType::U1, {qubit}, {}, {lambda});
    }

    /// @brief Creates a U2(phi, lambda) gate.
    [[nodiscard]] static Gate u2(QubitIndex qubit, Angle phi, Angle lambda) {
        return Gate(GateType::U2, {qubit}, {}, {phi, lambda});
    }

    /// @brief Creates a U3(theta, phi, lambda) gate.
    [[nodiscard]] static Gate u3(QubitIndex qubit, Angle theta, Angle phi, Angle lambda) {
        return Gate(GateType::U3, {qubit}, {}, {theta, phi, lambda});
    }

    /// @brief Creates an RX rotation gate.
    [[nodiscard]] static Gate rx(QubitIndex qubit, Angle angle) {
        return Gate(GateType::RX, {qubit}, {}, {angle});
    }

    /// @brief Creates an RY rotation gate.
    [[nodiscard]] static Gate ry(QubitIndex qubit, Angle angle) {
        return Gate(GateType::RY, {qubit}, {}, {angle});
    }

    /// @brief Creates an RZ rotation gate.
    [[nodiscard]] static Gate rz(QubitIndex qubit, Angle angle) {
        return Gate(GateType::RZ, {qubit}, {}, {angle});
    }

    // -------------------------------------------------------------------------
    // Factory Methods: fixed multi-qubit gates
    // -------------------------------------------------------------------------

    /// @brief Creates a CNOT gate with specified control and target qubits.
    /// @throws CircuitError (DuplicateIndex) if control == target
    [[nodiscard]] static Gate cnot(QubitIndex control, QubitIndex target) {
        return Gate(GateType::CNOT, {target}, {control});
    }

    /// @brief Creates a CZ gate with specified control and target qubits.
    /// @throws CircuitError (DuplicateIndex) if control == target
    [[nodiscard]] static Gate cz(QubitIndex control, QubitIndex target) {
        return Gate(GateType::CZ, {target}, {control});
    }

    /// @brief Creates a SWAP gate between two qubits.
    /// @throws CircuitError (DuplicateIndex) if qubit1 == qubit2
    [[nodiscard]] static Gate swap(QubitIndex qubit1, QubitIndex qubit2) {
        return Gate(GateType::SWAP, {qubit1, qubit2});
    }

    /// @brief Creates a TOFFOLI gate.
    /// @throws CircuitError (DuplicateIndex) if any two qubits coincide
    [[nodiscard]] static Gate toffoli(QubitIndex control1, QubitIndex control2,
                                      QubitIndex target) {
        return Gate(GateType::TOFFOLI, {target}, {control1, control2});
    }

    // -------------------------------------------------------------------------
    // Factory Methods: matrix, Pauli and measurement gates
    // -------------------------------------------------------------------------

    /**
     * @brief Creates an N-target unitary-matrix gate.
     * @param targets Target qubits; matrix basis order follows this list
     * @param matrix Square matrix of side 2^targets.size()
     * @throws CircuitError (DimensionMismatch) on a wrongly-sized matrix
     */
    [[nodiscard]] static Gate unitaryMatrix(std::vector<QubitIndex> targets, Matrix matrix) {
        return Gate(GateType::UnitaryMatrix, std::move(targets), {}, {}, {},
                    std::move(matrix));
    }

    /// @brief Creates a 1-target unitary-matrix gate (2x2 matrix).
    [[nodiscard]] static Gate singleQubitUnitaryMatrix(QubitIndex target, Matrix matrix) {
        return Gate(GateType::SingleQubitUnitaryMatrix, {target}, {}, {}, {},
                    std::move(matrix));
    }

    /// @brief Creates a 2-target unitary-matrix gate (4x4 matrix).
    [[nodiscard]] static Gate twoQubitUnitaryMatrix(QubitIndex target1, QubitIndex target2,
                                                    Matrix matrix) {
        return Gate(GateType::TwoQubitUnitaryMatrix, {target1, target2}, {}, {}, {},
                    std::move(matrix));
    }

    /**
     * @brief Creates a multi-qubit Pauli string gate.
     * @param targets Target qubits
     * @param pauli_ids One identifier per target (pauli::I/X/Y/Z)
     */
    [[nodiscard]] static Gate pauli(std::vector<QubitIndex> targets,
                                    std::vector<PauliId> pauli_ids) {
        return Gate(GateType::Pauli, std::move(targets), {}, {}, std::move(pauli_ids));
    }

    /// @brief Creates a Pauli rotation exp(-i * angle * P / 2).
    [[nodiscard]] static Gate pauliRotation(std::vector<QubitIndex> targets,
                                            std::vector<PauliId> pauli_ids,
                                            Angle angle) {
        return Gate(GateType::PauliRotation, std::move(targets), {}, {angle},
                    std::move(pauli_ids));
    }

    /**
     * @brief Creates a measurement of qubits into classical bits.
     *
     * qubits[i] is measured into cbits[i].
     *
     * @throws CircuitError (LengthMismatch) if the lists differ in length
     * @throws CircuitError (DuplicateIndex) if either list repeats an index
     */
    [[nodiscard]] static Gate measurement(std::vector<QubitIndex> qubits,
                                          std::vector<CbitIndex> cbits) {
        return Gate(GateType::Measurement, std::move(qubits), {}, {}, {}, Matrix(),
                    std::move(cbits));
    }

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------

    /// @brief Returns the gate type.
    [[nodiscard]] GateType type() const noexcept { return type_; }

    /// @brief Returns the gate type name.
    [[nodiscard]] std::string_view name() const noexcept { return gateTypeName(type_); }

    [[nodiscard]] const std::vector<QubitIndex>& targetIndices() const noexcept {
        return target_indices_;
    }

    [[nodiscard]] const std::vector<QubitIndex>& controlIndices() const noexcept {
        return control_indices_;
    }

    [[nodiscard]] const std::vector<CbitIndex>& classicalIndices() const noexcept {
        return classical_indices_;
    }

    [[nodiscard]] const std::vector<Angle>& params() const noexcept { return params_; }

    [[nodiscard]] const std::vector<PauliId>& pauliIds() const noexcept { return pauli_ids_; }

    /// @brief Returns the unitary matrix (0x0 for non-matrix gates).
    [[nodiscard]] const Matrix& unitaryMatrix() const noexcept { return unitary_matrix_; }

    /// @brief Returns all qubits this gate acts on, controls first.
    [[nodiscard]] std::vector<QubitIndex> qubitIndices() const {
        std::vector<QubitIndex> result;
        result.reserve(control_indices_.size() + target_indices_.size());
        result.insert(result.end(), control_indices_.begin(), control_indices_.end());
        result.insert(result.end(), target_indices_.begin(), target_indices_.end());
        return result;
    }

    /// @brief Returns the number of qubits this gate acts on.
    [[nodiscard]] std::size_t numQubits() const noexcept {
        return control_indices_.size() + target_indices_.size();
    }

    /// @brief Returns whether this gate is parameterized.
    [[nodiscard]] bool isParameterized() const noexcept {
        return !params_.empty();
    }

    /// @brief Returns the maximum qubit index referenced by this gate.
    [[nodiscard]] QubitIndex maxQubit() const noexcept {
        QubitIndex max = 0;
        for (auto q : target_indices_) {
            if (q > max) max = q;
        }
        for (auto q : control_indices_) {
            if (q > max) max = q;
        }
        return max;
    }

    // -------------------------------------------------------------------------
    // Comparison
    // -------------------------------------------------------------------------

    /**
     * @brief Exact equality: same kind, index lists, parameters and matrix.
     *
     * Angles and matrix entries are compared by bit pattern, so a NaN
     * angle equals itself and 0.0 differs from -0.0. Values that went
     * through different arithmetic may compare unequal; use isApprox()
     * for tolerance-based comparison.
     */
    [[nodiscard]] bool operator==(const Gate& other) const {
        return type_ == other.type_ &&
               target_indices_ == other.target_indices_ &&
               control_indices_ == other.control_indices_ &&
               classical_indices_ == other.classical_indices_ &&
               pauli_ids_ == other.pauli_ids_ &&
               sameParams(other) &&
               sameMatrixShape(other) &&
               sameMatrixEntries(other);
    }

    /// @brief Inequality comparison.
    [[nodiscard]] bool operator!=(const Gate& other) const {
        return !(*this == other);
    }

    /**
     * @brief Structural equality with angles and matrix entries compared
     *        within an absolute tolerance.
     * @param other Gate to compare with
     * @param tolerance Maximum absolute difference per value
     */
    [[nodiscard]] bool isApprox(const Gate& other,
                                double tolerance = constants::TOLERANCE) const {
        if (type_ != other.type_ ||
            target_indices_ != other.target_indices_ ||
            control_indices_ != other.control_indices_ ||
            classical_indices_ != other.classical_indices_ ||
            pauli_ids_ != other.pauli_ids_ ||
            params_.size() != other.params_.size() ||
            !sameMatrixShape(other)) {
            return false;
        }
        for (std::size_t i = 0; i < params_.size(); ++i) {
            if (std::abs(params_[i] - other.params_[i]) > tolerance) {
                return false;
            }
        }
        if (unitary_matrix_.size() == 0) {
            return true;
        }
        return (unitary_matrix_ - other.unitary_matrix_).cwiseAbs().maxCoeff() <= tolerance;
    }

    /// @brief Returns a string representation of the gate.
    [[nodiscard]] std::string toString() const {
        std::string result{gateTypeName(type_)};
        if (!params_.empty()) {
            result += "(";
            for (std::size_t i = 0; i < params_.size(); ++i) {
                if (i > 0) result += ", ";
                result += std::to_string(params_[i]);
            }
            result += ")";
        }
        if (!pauli_ids_.empty()) {
            static constexpr char kPauliNames[] = {'I', 'X', 'Y', 'Z'};
            result += "[";
            for (auto id : pauli_ids_) {
                result += kPauliNames[id];
            }
            result += "]";
        }
        if (unitary_matrix_.size() != 0) {
            result += "<" + std::to_string(unitary_matrix_.rows()) + "x" +
                      std::to_string(unitary_matrix_.cols()) + ">";
        }
        result += " ";
        const auto qubits = qubitIndices();
        for (std::size_t i = 0; i < qubits.size(); ++i) {
            if (i > 0) result += ", ";
            result += "q[" + std::to_string(qubits[i]) + "]";
        }
        if (!classical_indices_.empty()) {
            result += " ->";
            for (std::size_t i = 0; i < classical_indices_.size(); ++i) {
                result += (i > 0 ? ", " : " ");
                result += "c[" + std::to_string(classical_indices_[i]) + "]";
            }
        }
        return result;
    }

private:
    GateType type_;
    std::vector<QubitIndex> target_indices_;
    std::vector<QubitIndex> control_indices_;
    std::vector<CbitIndex> classical_indices_;
    std::vector<Angle> params_;
    std::vector<PauliId> pauli_ids_;
    Matrix unitary_matrix_;

    [[nodiscard]] bool sameMatrixShape(const Gate& other) const noexcept {
        return unitary_matrix_.rows() == other.unitary_matrix_.rows() &&
               unitary_matrix_.cols() == other.unitary_matrix_.cols();
    }

    [[nodiscard]] static bool sameBits(double a, double b) noexcept {
        std::uint64_t a_bits;
        std::uint64_t b_bits;
        std::memcpy(&a_bits, &a, sizeof(a));
        std::memcpy(&b_bits, &b, sizeof(b));
        return a_bits == b_bits;
    }

    [[nodiscard]] bool sameParams(const Gate& other) const noexcept {
        if (params_.size() != other.params_.size()) {
            return false;
        }
        for (std::size_t i = 0; i < params_.size(); ++i) {
            if (!sameBits(params_[i], other.params_[i])) {
                return false;
            }
        }
        return true;
    }

    /// @pre sameMatrixShape(other)
    [[nodiscard]] bool sameMatrixEntries(const Gate& other) const noexcept {
        for (Eigen::Index r = 0; r < unitary_matrix_.rows(); ++r) {
            for (Eigen::Index c = 0; c < unitary_matrix_.cols(); ++c) {
                const Complex& a = unitary_matrix_(r, c);
                const Complex& b = other.unitary_matrix_(r, c);
                if (!sameBits(a.real(), b.real()) || !sameBits(a.imag(), b.imag())) {
                    return false;
                }
            }
        }
        return true;
    }

    [[nodiscard]] std::string prefix() const {
        return "Gate " + std::string(gateTypeName(type_));
    }

    /// @brief Returns the first index that occurs more than once, if any.
    [[nodiscard]] static std::optional<std::size_t> findDuplicate(
        std::vector<std::size_t> indices) {
        std::sort(indices.begin(), indices.end());
        auto it = std::adjacent_find(indices.begin(), indices.end());
        if (it == indices.end()) {
            return std::nullopt;
        }
        return *it;
    }

    /// @brief Validates gate construction parameters.
    void validate() const {
        const std::size_t expected_targets = numTargetsFor(type_);
        if (expected_targets == 0) {
            if (target_indices_.empty()) {
                throw CircuitError(CircuitErrorKind::LengthMismatch,
                                   prefix() + " requires at least one target qubit");
            }
        } else if (target_indices_.size() != expected_targets) {
            throw CircuitError(
                CircuitErrorKind::LengthMismatch,
                prefix() + " requires " + std::to_string(expected_targets) +
                " target qubit(s), got " + std::to_string(target_indices_.size()));
        }

        const std::size_t expected_controls = numControlsFor(type_);
        if (control_indices_.size() != expected_controls) {
            throw CircuitError(
                CircuitErrorKind::LengthMismatch,
                prefix() + " requires " + std::to_string(expected_controls) +
                " control qubit(s), got " + std::to_string(control_indices_.size()));
        }

        const std::size_t expected_params = numParamsFor(type_);
        if (params_.size() != expected_params) {
            throw CircuitError(
                CircuitErrorKind::LengthMismatch,
                prefix() + " requires " + std::to_string(expected_params) +
                " parameter(s), got " + std::to_string(params_.size()));
        }

        validateClassical();
        validatePauliIds();
        validateMatrix();

        if (auto dup = findDuplicate(qubitIndices())) {
            throw CircuitError(
                CircuitErrorKind::DuplicateIndex,
                prefix() + " uses qubit " + std::to_string(*dup) + " more than once");
        }
    }

    void validateClassical() const {
        if (type_ != GateType::Measurement) {
            if (!classical_indices_.empty()) {
                throw CircuitError(CircuitErrorKind::LengthMismatch,
                                   prefix() + " takes no classical indices");
            }
            return;
        }
        if (classical_indices_.size() != target_indices_.size()) {
            throw CircuitError(
                CircuitErrorKind::LengthMismatch,
                prefix() + " pairs " + std::to_string(target_indices_.size()) +
                " qubit(s) with " + std::to_string(classical_indices_.size()) +
                " classical bit(s)");
        }
        if (auto dup = findDuplicate(classical_indices_)) {
            throw CircuitError(
                CircuitErrorKind::DuplicateIndex,
                prefix() + " writes classical bit " + std::to_string(*dup) +
                " more than once");
        }
    }

    void validatePauliIds() const {
        if (!isPauliGate(type_)) {
            if (!pauli_ids_.empty()) {
                throw CircuitError(CircuitErrorKind::LengthMismatch,
                                   prefix() + " takes no Pauli identifiers");
            }
            return;
        }
        if (pauli_ids_.size() != target_indices_.size()) {
            throw CircuitError(
                CircuitErrorKind::LengthMismatch,
                prefix() + " has " + std::to_string(target_indices_.size()) +
                " target(s) but " + std::to_string(pauli_ids_.size()) +
                " Pauli identifier(s)");
        }
        for (auto id : pauli_ids_) {
            if (id > pauli::Z) {
                throw CircuitError(
                    CircuitErrorKind::InvalidPauliId,
                    prefix() + " has Pauli identifier " + std::to_string(id) +
                    ", expected 0 (I), 1 (X), 2 (Y) or 3 (Z)");
            }
        }
    }

    void validateMatrix() const {
        if (!isMatrixGate(type_)) {
            if (unitary_matrix_.size() != 0) {
                throw CircuitError(CircuitErrorKind::DimensionMismatch,
                                   prefix() + " takes no matrix");
            }
            return;
        }
        const std::size_t n = target_indices_.size();
        if (n > constants::MAX_MATRIX_TARGETS) {
            throw CircuitError(
                CircuitErrorKind::DimensionMismatch,
                prefix() + " on " + std::to_string(n) +
                " targets exceeds the maximum of " +
                std::to_string(constants::MAX_MATRIX_TARGETS));
        }
        const auto side = static_cast<Eigen::Index>(std::size_t{1} << n);
        if (unitary_matrix_.rows() != side || unitary_matrix_.cols() != side) {
            throw CircuitError(
                CircuitErrorKind::DimensionMismatch,
                prefix() + " on " + std::to_string(n) + " target(s) requires a " +
                std::to_string(side) + "x" + std::to_string(side) + " matrix, got " +
                std::to_string(unitary_matrix_.rows()) + "x" +
                std::to_string(unitary_matrix_.cols()));
        }
    }
};

/**
 * @brief Stream output operator for Gate.
 */
inline std::ostream& operator<<(std::ostream& os, const Gate& gate) {
    os << gate.toString();
    return os;
}

}  // namespace qcirc::ir
