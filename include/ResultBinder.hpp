/*
 * Copyright (c) 2022, Shiv Nadar University, Delhi NCR, India. All Rights
 * Reserved. Permission to use, copy, modify and distribute this software for
 * educational, research, and not-for-profit purposes, without fee and without a
 * signed license agreement, is hereby granted, provided that this paragraph and
 * the following two paragraphs appear in all copies, modifications, and
 * distributions.
 *
 * IN NO EVENT SHALL SHIV NADAR UNIVERSITY BE LIABLE TO ANY PARTY FOR DIRECT,
 * INDIRECT, SPECIAL, INCIDENTAL, OR CONSEQUENTIAL DAMAGES, INCLUDING LOST
 * PROFITS, ARISING OUT OF THE USE OF THIS SOFTWARE.
 *
 * SHIV NADAR UNIVERSITY SPECIFICALLY DISCLAIMS ANY WARRANTIES, INCLUDING, BUT
 * NOT LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A
 * PARTICULAR PURPOSE. THE SOFTWARE PROVIDED HEREUNDER IS PROVIDED "AS IS". SHIV
 * NADAR UNIVERSITY HAS NO OBLIGATION TO PROVIDE MAINTENANCE, SUPPORT, UPDATES,
 * ENHANCEMENTS, OR MODIFICATIONS.
 */

/**
 * @file ResultBinder.hpp
 * @brief Pin-addressed queries over a typed result.
 *
 * The binder joins the node table of a resolved `Circuit` with the vectors of
 * a `TypedResult`, so that callers can ask for "the voltage at R1.n2" instead
 * of "the vector named _net3.V". All queries return one value per sweep
 * point.
 *
 * Current sign convention. A two-terminal source reports its branch current
 * `I` as the current flowing inside the component from its first terminal to
 * its second. `currentIntoPin()` returns `I` at the first terminal and `-I` at
 * the second, so the two always sum to zero.
 *
 * The binder keeps a reference to the circuit; the circuit must outlive it.
 * Editing the circuit after binding makes pin queries fail with
 * `PinNotConnectedError` until `Circuit::resolveNodes()` is run again.
 *
 * Example usage:
 * @code
 * circuit.resolveNodes();
 * Dataset ds = DatasetParser().parse(solverOutput);
 * ResultBinder binder(circuit, extractTypedResult(ds, AnalysisKind::DC));
 * Eigen::VectorXcd vr = binder.voltageAcross(*r1, "n1", "n2");
 * @endcode
 */

#pragma once

#include <Eigen/Dense>
#include <string>

#include "Circuit.hpp"
#include "Component.hpp"
#include "Pin.hpp"
#include "TypedResult.hpp"

/**
 * @class ResultBinder
 * @brief Voltages and currents addressed by component and terminal.
 */
class ResultBinder
{
   private:
    const Circuit& circuit;
    TypedResult result;

    // v(a) - v(b). A ground side takes the length of the other side.
    Eigen::VectorXcd voltageDifference(const Component& componentA,
                                       const std::string& terminalA,
                                       const Component& componentB,
                                       const std::string& terminalB) const;

   public:
    /**
     * @brief Bind a typed result to a resolved circuit.
     *
     * @param circuit Circuit whose node numbering produced the result.
     * @param result Typed view of the solver output.
     */
    ResultBinder(const Circuit& circuit, TypedResult result);

    /** @brief The bound typed result. */
    const TypedResult& getResult() const { return result; }

    /**
     * @brief Voltage at a component terminal.
     *
     * A terminal on node 0 yields zeros without looking anything up.
     *
     * @throws PinNotConnectedError if the circuit is not resolved.
     * @throws VectorNotFoundError if the node has no voltage vector.
     * @throws std::invalid_argument if the terminal does not exist.
     */
    Eigen::VectorXcd voltageAtPin(const Component& component,
                                  const std::string& terminal) const;

    /** @brief Voltage at a pin. */
    Eigen::VectorXcd voltageAtPin(const Pin& pin) const;

    /** @brief Voltage of pin `a` relative to pin `b`. */
    Eigen::VectorXcd voltageBetween(const Pin& a, const Pin& b) const;

    /**
     * @brief Voltage between two terminals of one component,
     * `V(terminalA) - V(terminalB)`.
     *
     * @throws std::logic_error if the two node vectors differ in length.
     */
    Eigen::VectorXcd voltageAcross(const Component& component,
                                   const std::string& terminalA,
                                   const std::string& terminalB) const;

    /**
     * @brief Branch current reported for a component.
     *
     * Only sources and current probes report currents.
     *
     * @throws CurrentNotAvailableError if the result has no current for it.
     */
    Eigen::VectorXcd currentThrough(const Component& component) const;

    /**
     * @brief Current entering one terminal of a two-terminal component.
     *
     * @throws std::invalid_argument if `terminal` is not the component's first
     *         or second terminal.
     * @throws CurrentNotAvailableError if the result has no current for it.
     */
    Eigen::VectorXcd currentIntoPin(const Component& component,
                                    const std::string& terminal) const;

    /**
     * @brief DC power `V(pos, neg) * I` of a component, per sweep point.
     *
     * @throws std::logic_error if the result is not a DC result.
     * @throws CurrentNotAvailableError if the component reports no current.
     */
    Eigen::VectorXd power(const Component& component, const std::string& pos,
                          const std::string& neg) const;

    /**
     * @brief Voltage measured by a voltage probe.
     * @throws VectorNotFoundError if no voltage is filed under `name`.
     */
    Eigen::VectorXcd probeVoltage(const std::string& name) const;

    /**
     * @brief Current measured by a current probe.
     * @throws VectorNotFoundError if no current is filed under `name`.
     */
    Eigen::VectorXcd probeCurrent(const std::string& name) const;
};
