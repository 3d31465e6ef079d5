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
 * @file Dataset.cpp
 * @brief Vector accessors and summary printing for `Dataset`.
 */

#include "Dataset.hpp"

#include <string>
#include <vector>

#include "LookupError.hpp"

const DataVector& Dataset::vector(const std::string& name) const
{
    auto it = independentVectors.find(name);
    if (it != independentVectors.end()) return it->second;
    it = dependentVectors.find(name);
    if (it != dependentVectors.end()) return it->second;
    throw VectorNotFoundError(name, listVectors());
}

bool Dataset::hasVector(const std::string& name) const
{
    return independentVectors.count(name) != 0 ||
           dependentVectors.count(name) != 0;
}

Eigen::VectorXd Dataset::realVector(const std::string& name) const
{
    return vector(name).values.real();
}

Eigen::VectorXd Dataset::imagVector(const std::string& name) const
{
    return vector(name).values.imag();
}

Eigen::VectorXcd Dataset::complexVector(const std::string& name) const
{
    return vector(name).values;
}

std::vector<std::string> Dataset::listVectors() const
{
    std::vector<std::string> names;
    names.reserve(independentVectors.size() + dependentVectors.size());
    for (const auto& kv : independentVectors) names.push_back(kv.first);
    for (const auto& kv : dependentVectors) names.push_back(kv.first);
    return names;
}

bool Dataset::hasErrors() const
{
    return status != SimulationStatus::Success || !errors.empty();
}

void Dataset::printSummary(std::ostream& os) const
{
    os << "Dataset Summary" << std::endl;
    os << std::string(40, '=') << std::endl;
    os << "Status: " << status << std::endl;
    os << "Version: " << version << std::endl;

    if (!errors.empty()) {
        os << std::endl << "Errors:" << std::endl;
        for (const auto& e : errors) os << "  Error: " << e << std::endl;
    }
    if (!warnings.empty()) {
        os << std::endl << "Warnings:" << std::endl;
        for (const auto& w : warnings) os << "  Warning: " << w << std::endl;
    }

    os << std::endl
       << "Independent Variables (" << independentVectors.size()
       << "):" << std::endl;
    for (const auto& kv : independentVectors) {
        os << "  " << kv.first << ": " << kv.second.values.size() << " points"
           << std::endl;
    }

    os << std::endl
       << "Dependent Variables (" << dependentVectors.size() << "):"
       << std::endl;
    for (const auto& kv : dependentVectors) {
        os << "  " << kv.first << ": " << kv.second.values.size() << " points";
        if (!kv.second.dependencies.empty()) {
            os << " [deps: ";
            for (std::size_t i = 0; i < kv.second.dependencies.size(); ++i) {
                if (i) os << ", ";
                os << kv.second.dependencies[i];
            }
            os << "]";
        }
        os << std::endl;
    }
}
