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
 * @file ResultBinder.cpp
 * @brief Implementation of pin-addressed result queries.
 */

#include "ResultBinder.hpp"

#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "LookupError.hpp"

ResultBinder::ResultBinder(const Circuit& circuit, TypedResult result)
    : circuit(circuit), result(std::move(result))
{
}

Eigen::VectorXcd ResultBinder::voltageAtPin(const Component& component,
                                            const std::string& terminal) const
{
    int node = circuit.nodeOf(component, terminal);
    if (node == 0) return Eigen::VectorXcd::Zero(result.points());
    return result.voltage(Circuit::nodeName(node));
}

Eigen::VectorXcd ResultBinder::voltageAtPin(const Pin& pin) const
{
    if (!pin.component)
        throw std::invalid_argument("Pin '" + pin.label() +
                                    "' has no component");
    return voltageAtPin(*pin.component, pin.terminal);
}

Eigen::VectorXcd ResultBinder::voltageDifference(
    const Component& componentA, const std::string& terminalA,
    const Component& componentB, const std::string& terminalB) const
{
    int nodeA = circuit.nodeOf(componentA, terminalA);
    int nodeB = circuit.nodeOf(componentB, terminalB);

    if (nodeA == 0 && nodeB == 0)
        return Eigen::VectorXcd::Zero(result.points());
    if (nodeB == 0) return result.voltage(Circuit::nodeName(nodeA));
    if (nodeA == 0) return -result.voltage(Circuit::nodeName(nodeB));

    std::string nameA = Circuit::nodeName(nodeA);
    std::string nameB = Circuit::nodeName(nodeB);
    const Eigen::VectorXcd& va = result.voltage(nameA);
    const Eigen::VectorXcd& vb = result.voltage(nameB);
    if (va.size() != vb.size()) {
        std::ostringstream oss;
        oss << "Cannot subtract voltages of different lengths: " << nameA
            << " has " << va.size() << " values, " << nameB << " has "
            << vb.size();
        throw std::logic_error(oss.str());
    }
    return va - vb;
}

Eigen::VectorXcd ResultBinder::voltageBetween(const Pin& a, const Pin& b) const
{
    if (!a.component)
        throw std::invalid_argument("Pin '" + a.label() +
                                    "' has no component");
    if (!b.component)
        throw std::invalid_argument("Pin '" + b.label() +
                                    "' has no component");
    return voltageDifference(*a.component, a.terminal, *b.component,
                             b.terminal);
}

Eigen::VectorXcd ResultBinder::voltageAcross(const Component& component,
                                             const std::string& terminalA,
                                             const std::string& terminalB) const
{
    return voltageDifference(component, terminalA, component, terminalB);
}

Eigen::VectorXcd ResultBinder::currentThrough(const Component& component) const
{
    if (!result.hasCurrent(component.getName()))
        throw CurrentNotAvailableError(component.getName(),
                                       result.currentNames());
    return result.current(component.getName());
}

Eigen::VectorXcd ResultBinder::currentIntoPin(const Component& component,
                                              const std::string& terminal) const
{
    const std::vector<std::string>& terminals = circuit.terminalsOf(component);

    bool first = false;
    if (terminals.size() >= 1 && terminal == terminals[0])
        first = true;
    else if (terminals.size() >= 2 && terminal == terminals[1])
        first = false;
    else
        throw std::invalid_argument(
            "Terminal '" + terminal + "' of component '" +
            component.getName() +
            "' is not one of its two current-carrying terminals (terminals: " +
            LookupError::formatNames(terminals) + ")");

    Eigen::VectorXcd current = currentThrough(component);
    if (first) return current;
    return -current;
}

Eigen::VectorXd ResultBinder::power(const Component& component,
                                    const std::string& pos,
                                    const std::string& neg) const
{
    if (result.getKind() != AnalysisKind::DC) {
        std::ostringstream oss;
        oss << "Power is only defined for DC results, not "
            << result.getKind();
        throw std::logic_error(oss.str());
    }

    Eigen::VectorXcd i = currentThrough(component);
    Eigen::VectorXcd v = voltageAcross(component, pos, neg);
    if (v.size() != i.size()) {
        std::ostringstream oss;
        oss << "Voltage across '" << component.getName() << "' has "
            << v.size() << " values but its current has " << i.size();
        throw std::logic_error(oss.str());
    }
    return (v.array() * i.array()).real();
}

Eigen::VectorXcd ResultBinder::probeVoltage(const std::string& name) const
{
    return result.voltage(name);
}

Eigen::VectorXcd ResultBinder::probeCurrent(const std::string& name) const
{
    return result.current(name);
}
