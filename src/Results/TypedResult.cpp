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
 * @file TypedResult.cpp
 * @brief Suffix-based extraction of typed results from a dataset.
 */

#include "TypedResult.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <complex>
#include <stdexcept>
#include <string>

#include "LookupError.hpp"

namespace
{

struct NamingConvention
{
    std::string sweep;
    std::string voltageSuffix;
    std::string currentSuffix;
};

NamingConvention conventionFor(AnalysisKind kind)
{
    switch (kind) {
        case AnalysisKind::DC:
            return {"", ".V", ".I"};
        case AnalysisKind::AC:
            return {"acfrequency", ".v", ".i"};
        case AnalysisKind::Transient:
            return {"time", ".Vt", ".It"};
        case AnalysisKind::HarmonicBalance:
            return {"hbfrequency", ".Vb", ".Ib"};
        case AnalysisKind::SParameter:
            return {"frequency", "", ""};
    }
    return {"", "", ""};
}

bool stripSuffix(const std::string& name, const std::string& suffix,
                 std::string& base)
{
    if (suffix.empty() || name.size() <= suffix.size()) return false;
    if (name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0)
        return false;
    base = name.substr(0, name.size() - suffix.size());
    return true;
}

bool parsePortIndex(const std::string& s, int& out)
{
    if (s.empty() || s.size() > 6) return false;
    if (!std::all_of(s.begin(), s.end(),
                     [](unsigned char c) { return std::isdigit(c); }))
        return false;
    out = std::stoi(s);
    return out >= 1;
}

// S[i,j] with 1-based integer indices.
bool parseSName(const std::string& name, int& i, int& j)
{
    if (name.size() < 6 || name.compare(0, 2, "S[") != 0 || name.back() != ']')
        return false;
    std::string inner = name.substr(2, name.size() - 3);
    std::size_t comma = inner.find(',');
    if (comma == std::string::npos) return false;
    return parsePortIndex(inner.substr(0, comma), i) &&
           parsePortIndex(inner.substr(comma + 1), j);
}

void printValues(std::ostream& os, const Eigen::VectorXcd& values)
{
    for (Eigen::Index k = 0; k < values.size(); ++k) {
        const std::complex<double>& z = values(k);
        os << " ";
        if (z.imag() == 0.0) {
            os << z.real();
        } else {
            os << z.real() << (z.imag() < 0 ? "-j" : "+j") << std::abs(z.imag());
        }
    }
    os << std::endl;
}

}  // namespace

TypedResult extractTypedResult(const Dataset& dataset, AnalysisKind kind,
                               const BinderOptions& options)
{
    TypedResult result(kind);
    result.z0 = options.referenceImpedance;

    const NamingConvention names = conventionFor(kind);
    Eigen::Index longest = 0;

    for (const auto& kv : dataset.getDependentVectors()) {
        const std::string& name = kv.first;
        const Eigen::VectorXcd& values = kv.second.values;
        std::string base;
        bool bound = false;

        if (kind == AnalysisKind::SParameter) {
            int i = 0;
            int j = 0;
            if (parseSName(name, i, j)) {
                result.sParams[std::make_pair(i, j)] = values;
                result.ports = std::max(result.ports, std::max(i, j));
                bound = true;
            }
        } else if (stripSuffix(name, names.voltageSuffix, base)) {
            result.voltageMap[base] = values;
            bound = true;
        } else if (stripSuffix(name, names.currentSuffix, base)) {
            result.currentMap[base] = values;
            bound = true;
        }

        if (bound) longest = std::max(longest, values.size());
    }

    if (!names.sweep.empty() && dataset.hasVector(names.sweep)) {
        result.sweepName = names.sweep;
        result.sweepAxis = dataset.realVector(names.sweep);
    }
    if (result.sweepAxis.size() == 0) {
        Eigen::Index n = std::max<Eigen::Index>(longest, 1);
        result.sweepAxis = Eigen::VectorXd::LinSpaced(n, 0.0, (double)(n - 1));
    }

    return result;
}

TypedResult extractTypedResult(const Dataset& dataset,
                               const BinderOptions& options)
{
    return extractTypedResult(dataset, options.analysis, options);
}

std::vector<std::string> TypedResult::keysOf(
    const std::map<std::string, Eigen::VectorXcd>& map)
{
    std::vector<std::string> keys;
    keys.reserve(map.size());
    for (const auto& kv : map) keys.push_back(kv.first);
    return keys;
}

const Eigen::VectorXcd& TypedResult::voltage(const std::string& name) const
{
    auto it = voltageMap.find(name);
    if (it == voltageMap.end()) throw VectorNotFoundError(name, voltageNames());
    return it->second;
}

const Eigen::VectorXcd& TypedResult::current(const std::string& name) const
{
    auto it = currentMap.find(name);
    if (it == currentMap.end()) throw VectorNotFoundError(name, currentNames());
    return it->second;
}

Eigen::VectorXcd TypedResult::sParameter(int i, int j) const
{
    if (i < 1 || j < 1 || i > ports || j > ports)
        throw std::out_of_range("S[" + std::to_string(i) + "," +
                                std::to_string(j) + "] is outside ports 1.." +
                                std::to_string(ports));

    auto it = sParams.find(std::make_pair(i, j));
    if (it != sParams.end()) return it->second;
    return Eigen::VectorXcd::Zero(points());
}

Eigen::MatrixXcd TypedResult::sMatrixAt(Eigen::Index point) const
{
    if (point < 0 || point >= points())
        throw std::out_of_range("Sweep point " + std::to_string(point) +
                                " is outside 0.." +
                                std::to_string(points() - 1));

    Eigen::MatrixXcd s = Eigen::MatrixXcd::Zero(ports, ports);
    for (const auto& kv : sParams) {
        if (point < kv.second.size())
            s(kv.first.first - 1, kv.first.second - 1) = kv.second(point);
    }
    return s;
}

void TypedResult::print(std::ostream& os) const
{
    os << kind << " result: " << points() << " point(s)";
    if (!sweepName.empty()) os << " over '" << sweepName << "'";
    os << std::endl;

    if (!sweepName.empty()) {
        os << "  " << sweepName << ":";
        printValues(os, sweepAxis.cast<std::complex<double>>());
    }
    for (const auto& kv : voltageMap) {
        os << "  V(" << kv.first << "):";
        printValues(os, kv.second);
    }
    for (const auto& kv : currentMap) {
        os << "  I(" << kv.first << "):";
        printValues(os, kv.second);
    }
    if (kind == AnalysisKind::SParameter) {
        os << "  ports: " << ports << ", Z0 = " << z0 << " Ohm" << std::endl;
        for (int i = 1; i <= ports; ++i) {
            for (int j = 1; j <= ports; ++j) {
                os << "  S[" << i << "," << j << "]"
                   << (hasSParameter(i, j) ? ":" : " (no coupling):");
                printValues(os, sParameter(i, j));
            }
        }
    }
}
