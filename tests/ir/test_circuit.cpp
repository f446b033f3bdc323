// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file test_circuit.cpp
 * @brief Unit tests for the mutable Circuit builder
 */

#include "qcirc/ir/Circuit.hpp"

#include <gtest/gtest.h>

#include <optional>
#include <sstream>

namespace qcirc::ir {
namespace {

/// Runs fn and returns the CircuitError it threw, if any.
template <typename Fn>
std::optional<CircuitError> thrownError(Fn&& fn) {
    try {
        fn();
    } catch (const CircuitError& e) {
        return e;
    }
    return std::nullopt;
}

// =============================================================================
// Construction Tests
// =============================================================================

TEST(CircuitConstructionTest, ConstructsWithValidQubitCount) {
    Circuit c(5);
    EXPECT_EQ(c.qubitCount(), 5);
    EXPECT_EQ(c.cbitCount(), 0);
    EXPECT_EQ(c.numGates(), 0);
    EXPECT_TRUE(c.empty());
}

TEST(CircuitConstructionTest, ConstructsWithClassicalBits) {
    Circuit c(2, 3);
    EXPECT_EQ(c.qubitCount(), 2);
    EXPECT_EQ(c.cbitCount(), 3);
}

TEST(CircuitConstructionTest, ThrowsOnZeroQubits) {
    EXPECT_THROW(Circuit(0), std::invalid_argument);
}

TEST(CircuitConstructionTest, AcceptsInitialGates) {
    Circuit c(2, 1, {Gate::h(0), Gate::cnot(0, 1), Gate::measurement({1}, {0})});
    EXPECT_EQ(c.numGates(), 3);
    EXPECT_EQ(c.gate(1), Gate::cnot(0, 1));
}

TEST(CircuitConstructionTest, InvalidInitialGateReportsPosition) {
    auto err = thrownError([] {
        Circuit c(2, 0, {Gate::h(0), Gate::x(1), Gate::cnot(0, 2), Gate::h(5)});
    });
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind(), CircuitErrorKind::IndexOutOfRange);
    ASSERT_TRUE(err->gatePosition().has_value());
    EXPECT_EQ(*err->gatePosition(), 2);
    EXPECT_NE(std::string(err->what()).find("gate 2"), std::string::npos);
}

TEST(CircuitConstructionTest, InitialMeasurementNeedsClassicalBits) {
    auto err = thrownError([] { Circuit c(2, 0, {Gate::measurement({0}, {0})}); });
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind(), CircuitErrorKind::IndexOutOfRange);
}

// =============================================================================
// Gate Management Tests
// =============================================================================

TEST(CircuitGateTest, AddGateIncreasesCount) {
    Circuit c(2);
    c.addGate(Gate::h(0));
    EXPECT_EQ(c.numGates(), 1);

    c.addGate(Gate::cnot(0, 1));
    EXPECT_EQ(c.numGates(), 2);
}

TEST(CircuitGateTest, GateAccessorReturnsCorrectGate) {
    Circuit c(2);
    c.addGate(Gate::h(0));
    c.addGate(Gate::x(1));

    EXPECT_EQ(c.gate(0).type(), GateType::H);
    EXPECT_EQ(c.gate(1).type(), GateType::X);
}

TEST(CircuitGateTest, GateAccessorThrowsOnOutOfRange) {
    Circuit c(2);
    c.addGate(Gate::h(0));

    EXPECT_THROW((void)c.gate(1), std::out_of_range);
    EXPECT_THROW((void)c.gate(100), std::out_of_range);
}

TEST(CircuitGateTest, AddGateRejectsInvalidQubitAndLeavesCircuitUnchanged) {
    Circuit c(2);  // qubits 0 and 1 only
    c.addGate(Gate::h(0));

    auto err = thrownError([&] { c.addGate(Gate::h(2)); });
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind(), CircuitErrorKind::IndexOutOfRange);
    EXPECT_THROW(c.addGate(Gate::cnot(5, 0)), CircuitError);
    EXPECT_EQ(c.numGates(), 1);
}

TEST(CircuitGateTest, AddGateInsertsAtPosition) {
    Circuit c(2);
    c.addGate(Gate::h(0));
    c.addGate(Gate::z(0));
    c.addGate(Gate::x(1), 1);
    c.addGate(Gate::y(1), 0);
    c.addGate(Gate::s(0), 4);

    std::vector<Gate> expected{Gate::y(1), Gate::h(0), Gate::x(1), Gate::z(0), Gate::s(0)};
    EXPECT_EQ(c.gates(), expected);
}

TEST(CircuitGateTest, AddGateRejectsPositionPastEnd) {
    Circuit c(2);
    c.addGate(Gate::h(0));

    auto err = thrownError([&] { c.addGate(Gate::x(0), 2); });
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind(), CircuitErrorKind::InvalidGateIndex);
    EXPECT_EQ(c.numGates(), 1);
}

TEST(CircuitGateTest, DuplicateGatesAllowed) {
    Circuit c(1);
    c.addGate(Gate::x(0));
    c.addGate(Gate::x(0));
    EXPECT_EQ(c.numGates(), 2);
}

// =============================================================================
// Gate Adder Tests
// =============================================================================

TEST(CircuitAdderTest, AddersAppendMatchingGates) {
    Circuit c(3);
    c.addIdentityGate(0);
    c.addXGate(0);
    c.addYGate(1);
    c.addZGate(2);
    c.addHGate(0);
    c.addSGate(0);
    c.addSdagGate(0);
    c.addSqrtXGate(1);
    c.addSqrtXdagGate(1);
    c.addSqrtYGate(1);
    c.addSqrtYdagGate(1);
    c.addTGate(2);
    c.addTdagGate(2);
    c.addU1Gate(0, 0.1);
    c.addU2Gate(0, 0.1, 0.2);
    c.addU3Gate(0, 0.1, 0.2, 0.3);
    c.addRXGate(1, 0.4);
    c.addRYGate(1, 0.5);
    c.addRZGate(1, 0.6);
    c.addCNOTGate(0, 1);
    c.addCZGate(1, 2);
    c.addSWAPGate(0, 2);
    c.addTOFFOLIGate(0, 1, 2);
    c.addUnitaryMatrixGate({0, 2}, Matrix::Identity(4, 4));
    c.addSingleQubitUnitaryMatrixGate(1, Matrix::Identity(2, 2));
    c.addTwoQubitUnitaryMatrixGate(1, 0, Matrix::Identity(4, 4));
    c.addPauliGate({0, 1, 2}, {pauli::X, pauli::Y, pauli::Z});
    c.addPauliRotationGate({0, 2}, {pauli::Z, pauli::Z}, 0.7);

    std::vector<Gate> expected{
        Gate::identity(0), Gate::x(0), Gate::y(1), Gate::z(2), Gate::h(0),
        Gate::s(0), Gate::sdag(0), Gate::sqrtX(1), Gate::sqrtXdag(1),
        Gate::sqrtY(1), Gate::sqrtYdag(1), Gate::t(2), Gate::tdag(2),
        Gate::u1(0, 0.1), Gate::u2(0, 0.1, 0.2), Gate::u3(0, 0.1, 0.2, 0.3),
        Gate::rx(1, 0.4), Gate::ry(1, 0.5), Gate::rz(1, 0.6),
        Gate::cnot(0, 1), Gate::cz(1, 2), Gate::swap(0, 2), Gate::toffoli(0, 1, 2),
        Gate::unitaryMatrix({0, 2}, Matrix::Identity(4, 4)),
        Gate::singleQubitUnitaryMatrix(1, Matrix::Identity(2, 2)),
        Gate::twoQubitUnitaryMatrix(1, 0, Matrix::Identity(4, 4)),
        Gate::pauli({0, 1, 2}, {pauli::X, pauli::Y, pauli::Z}),
        Gate::pauliRotation({0, 2}, {pauli::Z, pauli::Z}, 0.7),
    };
    EXPECT_EQ(c.gates(), expected);
}

TEST(CircuitAdderTest, AddersValidateBounds) {
    Circuit c(2);
    EXPECT_THROW(c.addTOFFOLIGate(0, 1, 2), CircuitError);
    EXPECT_THROW(c.addPauliGate({0, 3}, {pauli::X, pauli::X}), CircuitError);
    EXPECT_THROW(c.addRXGate(2, 0.1), CircuitError);
    EXPECT_TRUE(c.empty());
}

TEST(CircuitAdderTest, AddersValidateShape) {
    Circuit c(2);
    auto err = thrownError([&] { c.addUnitaryMatrixGate({0, 1}, Matrix::Identity(2, 2)); });
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind(), CircuitErrorKind::DimensionMismatch);
    EXPECT_TRUE(c.empty());
}

// =============================================================================
// Measurement Tests
// =============================================================================

TEST(CircuitMeasureTest, ScalarMeasurement) {
    Circuit c(2, 2);
    c.measure(1, 0);
    ASSERT_EQ(c.numGates(), 1);
    EXPECT_EQ(c.gate(0), Gate::measurement({1}, {0}));
}

TEST(CircuitMeasureTest, ListMeasurementPairsPositionally) {
    Circuit c(3, 3);
    c.measure({0, 2}, {2, 0});
    EXPECT_EQ(c.gate(0).targetIndices(), (std::vector<QubitIndex>{0, 2}));
    EXPECT_EQ(c.gate(0).classicalIndices(), (std::vector<CbitIndex>{2, 0}));
}

TEST(CircuitMeasureTest, MixedScalarAndList) {
    Circuit c(2, 2);
    c.measure(std::vector<QubitIndex>{1}, CbitIndex{1});
    c.measure(QubitIndex{0}, std::vector<CbitIndex>{0});
    EXPECT_EQ(c.numGates(), 2);
    EXPECT_EQ(c.gate(1), Gate::measurement({0}, {0}));
}

TEST(CircuitMeasureTest, LengthMismatchAppendsNothing) {
    Circuit c(2, 2);
    auto err = thrownError([&] { c.measure({0, 1}, {0}); });
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind(), CircuitErrorKind::LengthMismatch);
    EXPECT_TRUE(c.empty());
}

TEST(CircuitMeasureTest, OutOfRangeIndices) {
    Circuit c(2, 1);
    auto qubit_err = thrownError([&] { c.measure(2, 0); });
    auto cbit_err = thrownError([&] { c.measure(0, 1); });
    ASSERT_TRUE(qubit_err.has_value());
    ASSERT_TRUE(cbit_err.has_value());
    EXPECT_EQ(qubit_err->kind(), CircuitErrorKind::IndexOutOfRange);
    EXPECT_EQ(cbit_err->kind(), CircuitErrorKind::IndexOutOfRange);
    EXPECT_TRUE(c.empty());
}

TEST(CircuitMeasureTest, DuplicateIndices) {
    Circuit c(3, 3);
    auto err = thrownError([&] { c.measure({0, 0}, {0, 1}); });
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind(), CircuitErrorKind::DuplicateIndex);
    EXPECT_THROW(c.measure({0, 1}, {2, 2}), CircuitError);
    EXPECT_TRUE(c.empty());
}

// =============================================================================
// Extend Tests
// =============================================================================

TEST(CircuitExtendTest, ExtendAppendsGatesInOrder) {
    Circuit c(2);
    c.addHGate(0);
    c.extend({Gate::cnot(0, 1), Gate::x(1)});

    std::vector<Gate> expected{Gate::h(0), Gate::cnot(0, 1), Gate::x(1)};
    EXPECT_EQ(c.gates(), expected);
}

TEST(CircuitExtendTest, ExtendIsAllOrNothing) {
    Circuit c(2);
    c.addHGate(0);

    auto err = thrownError([&] { c.extend({Gate::x(0), Gate::x(1), Gate::x(2)}); });
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind(), CircuitErrorKind::IndexOutOfRange);
    EXPECT_EQ(err->gatePosition(), std::optional<std::size_t>(2));
    EXPECT_EQ(c.numGates(), 1);
}

TEST(CircuitExtendTest, ExtendFromCircuitIgnoresSourceCounts) {
    Circuit wide(5, 2);
    wide.addHGate(0);
    wide.addCNOTGate(0, 1);

    Circuit narrow(2);
    narrow.extend(wide);
    EXPECT_EQ(narrow.gates(), wide.gates());
    EXPECT_EQ(narrow.qubitCount(), 2);
}

TEST(CircuitExtendTest, ExtendDoesNotRemapIndices) {
    Circuit source(5);
    source.addXGate(4);

    Circuit target(2);
    EXPECT_THROW(target.extend(source), CircuitError);
    EXPECT_TRUE(target.empty());
}

TEST(CircuitExtendTest, ExtendWithItselfDoublesGates) {
    Circuit c(2);
    c.addHGate(0);
    c.addCNOTGate(0, 1);
    c.extend(c);

    std::vector<Gate> expected{Gate::h(0), Gate::cnot(0, 1), Gate::h(0), Gate::cnot(0, 1)};
    EXPECT_EQ(c.gates(), expected);
}

TEST(CircuitExtendTest, PlusEqualsExtends) {
    Circuit c(2);
    Circuit other(2);
    other.addXGate(1);

    c += std::vector<Gate>{Gate::h(0)};
    c += other;
    std::vector<Gate> expected{Gate::h(0), Gate::x(1)};
    EXPECT_EQ(c.gates(), expected);
}

// =============================================================================
// Gate Counting Tests
// =============================================================================

TEST(CircuitCountTest, CountGatesOfType) {
    Circuit c(2);
    c.addHGate(0);
    c.addHGate(1);
    c.addCNOTGate(0, 1);
    c.addXGate(0);

    EXPECT_EQ(c.countGates(GateType::H), 2);
    EXPECT_EQ(c.countGates(GateType::CNOT), 1);
    EXPECT_EQ(c.countGates(GateType::Z), 0);
}

// =============================================================================
// Iteration Tests
// =============================================================================

TEST(CircuitIterationTest, IteratorOrderMatchesAddOrder) {
    Circuit c(3);
    c.addHGate(0);
    c.addXGate(1);
    c.addZGate(2);

    auto it = c.begin();
    EXPECT_EQ(it->type(), GateType::H);
    ++it;
    EXPECT_EQ(it->type(), GateType::X);
    ++it;
    EXPECT_EQ(it->type(), GateType::Z);
    ++it;
    EXPECT_EQ(it, c.end());
}

// =============================================================================
// ToString Tests
// =============================================================================

TEST(CircuitToStringTest, FormatsCorrectly) {
    Circuit c(2, 1);
    c.addHGate(0);
    c.addCNOTGate(0, 1);
    c.measure(1, 0);

    std::ostringstream os;
    os << c;
    const std::string str = os.str();
    EXPECT_NE(str.find("2 qubits"), std::string::npos);
    EXPECT_NE(str.find("1 cbits"), std::string::npos);
    EXPECT_NE(str.find("3 gates"), std::string::npos);
    EXPECT_NE(str.find("H q[0]"), std::string::npos);
    EXPECT_NE(str.find("Measurement q[1] -> c[0]"), std::string::npos);
}

}  // namespace
}  // namespace qcirc::ir
