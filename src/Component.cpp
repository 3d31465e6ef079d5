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
 * @file Component.cpp
 * @brief Field access helpers and terminal discovery for `Component`.
 *
 * Keep implementation comments concise; the public API and the terminal
 * naming convention are documented in the header (`Component.hpp`).
 */

#include "Component.hpp"

#include <algorithm>
#include <cctype>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

void Component::declareIntField(const std::string& fieldName, int value)
{
    for (auto& field : intFields) {
        if (field.first == fieldName) {
            field.second = value;
            return;
        }
    }
    intFields.emplace_back(fieldName, value);
}

void Component::declareParameter(const std::string& parameterName,
                                 double value)
{
    for (auto& parameter : parameters) {
        if (parameter.first == parameterName) {
            parameter.second = value;
            return;
        }
    }
    parameters.emplace_back(parameterName, value);
}

bool Component::hasIntField(const std::string& fieldName) const
{
    return std::any_of(
        intFields.begin(), intFields.end(),
        [&](const std::pair<std::string, int>& f) { return f.first == fieldName; });
}

int Component::getIntField(const std::string& fieldName) const
{
    for (const auto& field : intFields) {
        if (field.first == fieldName) return field.second;
    }
    throw std::invalid_argument("Component '" + name +
                                "' has no integer field '" + fieldName + "'");
}

bool Component::hasParameter(const std::string& parameterName) const
{
    return std::any_of(parameters.begin(), parameters.end(),
                       [&](const std::pair<std::string, double>& p) {
                           return p.first == parameterName;
                       });
}

double Component::getParameter(const std::string& parameterName) const
{
    for (const auto& parameter : parameters) {
        if (parameter.first == parameterName) return parameter.second;
    }
    throw std::invalid_argument("Component '" + name + "' has no parameter '" +
                                parameterName + "'");
}

bool isTerminalFieldName(const std::string& fieldName)
{
    static const std::set<std::string> aliases = {
        "nplus",  "nminus", "ref",       "anode", "cathode", "gate",
        "drain",  "source", "collector", "base",  "emitter", "input",
        "output", "bulk",   "substrate", "t1",    "t2"};

    if (fieldName.empty()) return false;
    if (fieldName == "n") return true;

    // n<digits>
    if (fieldName[0] == 'n' && fieldName.size() > 1 &&
        std::all_of(fieldName.begin() + 1, fieldName.end(),
                    [](char c) { return std::isdigit((unsigned char)c); }))
        return true;

    return aliases.find(fieldName) != aliases.end();
}

std::vector<std::string> discoverTerminals(const Component& component)
{
    // Capability first: dynamic-arity components list their own terminals.
    if (const auto* provider =
            dynamic_cast<const TerminalProvider*>(&component)) {
        return provider->terminalNames();
    }

    std::vector<std::string> terminals;
    for (const auto& field : component.getIntFields()) {
        if (isTerminalFieldName(field.first)) terminals.push_back(field.first);
    }
    return terminals;
}
