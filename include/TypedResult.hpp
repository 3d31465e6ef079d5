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
 * @file TypedResult.hpp
 * @brief Analysis-shaped, read-only view of a parsed dataset.
 *
 * The solver names its output vectors after the analysis that produced them:
 *
 * | analysis        | sweep axis    | voltages | currents |
 * |-----------------|---------------|----------|----------|
 * | DC              | (none)        | `X.V`    | `X.I`    |
 * | AC              | `acfrequency` | `X.v`    | `X.i`    |
 * | Transient       | `time`        | `X.Vt`   | `X.It`   |
 * | HarmonicBalance | `hbfrequency` | `X.Vb`   | `X.Ib`   |
 * | SParameter      | `frequency`   |          |          |
 *
 * where `X` is a node name (`_net3`), a probe name or a source name. An
 * S-parameter run reports `S[i,j]` vectors with 1-based port indices.
 *
 * `extractTypedResult()` strips the suffixes and files the vectors under the
 * bare names. When the sweep axis vector is absent (always the case for DC),
 * the sweep is the sample index 0..points()-1.
 */

#pragma once

#include <Eigen/Dense>
#include <iostream>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "AnalysisKind.hpp"
#include "BinderOptions.hpp"
#include "Dataset.hpp"

class TypedResult;

/**
 * @brief Build the typed view of a dataset for one analysis kind.
 *
 * Vectors that do not follow the kind's naming convention are ignored.
 * Missing vectors never raise here; lookups raise when they are queried.
 *
 * @param dataset Parsed solver output.
 * @param kind Analysis that produced it.
 * @param options Supplies the reference impedance of S-parameter results.
 */
TypedResult extractTypedResult(const Dataset& dataset, AnalysisKind kind,
                               const BinderOptions& options = BinderOptions());

/**
 * @brief Same as above, taking the kind from `options.analysis`.
 */
TypedResult extractTypedResult(const Dataset& dataset,
                               const BinderOptions& options);

/**
 * @class TypedResult
 * @brief Voltages, currents and scattering parameters of one analysis.
 */
class TypedResult
{
   private:
    AnalysisKind kind;
    std::string sweepName;
    Eigen::VectorXd sweepAxis;
    std::map<std::string, Eigen::VectorXcd> voltageMap;
    std::map<std::string, Eigen::VectorXcd> currentMap;
    std::map<std::pair<int, int>, Eigen::VectorXcd> sParams;
    int ports = 0;
    double z0 = 50.0;

    explicit TypedResult(AnalysisKind kind) : kind(kind) {}

    static std::vector<std::string> keysOf(
        const std::map<std::string, Eigen::VectorXcd>& map);

    friend TypedResult extractTypedResult(const Dataset&, AnalysisKind,
                                          const BinderOptions&);

   public:
    /** @brief Analysis the result was built for. */
    AnalysisKind getKind() const { return kind; }

    /**
     * @brief Name of the sweep axis vector (empty for DC).
     */
    const std::string& getSweepName() const { return sweepName; }

    /** @brief Sweep axis values (real parts). */
    const Eigen::VectorXd& getSweep() const { return sweepAxis; }

    /** @brief Number of sweep points; at least 1. */
    Eigen::Index points() const { return sweepAxis.size(); }

    /** @brief Voltages by node or probe name. */
    const std::map<std::string, Eigen::VectorXcd>& getVoltages() const
    {
        return voltageMap;
    }

    /** @brief Branch currents by component name. */
    const std::map<std::string, Eigen::VectorXcd>& getCurrents() const
    {
        return currentMap;
    }

    bool hasVoltage(const std::string& name) const
    {
        return voltageMap.count(name) != 0;
    }

    bool hasCurrent(const std::string& name) const
    {
        return currentMap.count(name) != 0;
    }

    /**
     * @brief Voltage vector filed under `name`.
     * @throws VectorNotFoundError listing the available voltages.
     */
    const Eigen::VectorXcd& voltage(const std::string& name) const;

    /**
     * @brief Current vector filed under `name`.
     * @throws VectorNotFoundError listing the available currents.
     */
    const Eigen::VectorXcd& current(const std::string& name) const;

    /** @brief Names of all voltages, ascending. */
    std::vector<std::string> voltageNames() const { return keysOf(voltageMap); }

    /** @brief Names of all currents, ascending. */
    std::vector<std::string> currentNames() const { return keysOf(currentMap); }

    /**
     * @brief Number of ports: the largest port index seen in any `S[i,j]`.
     */
    int numPorts() const { return ports; }

    /** @brief Reference impedance of the S-parameters, in ohms. */
    double referenceImpedance() const { return z0; }

    /** @brief True when the solver reported `S[i,j]` itself. */
    bool hasSParameter(int i, int j) const
    {
        return sParams.count(std::make_pair(i, j)) != 0;
    }

    /**
     * @brief Scattering parameter from port `j` to port `i`.
     *
     * A pair inside 1..numPorts() that the solver did not report belongs to
     * ports with no coupling and yields zeros over the whole sweep.
     *
     * @throws std::out_of_range if `i` or `j` is outside 1..numPorts().
     */
    Eigen::VectorXcd sParameter(int i, int j) const;

    /**
     * @brief Full numPorts() x numPorts() S-matrix at one sweep point.
     * @throws std::out_of_range if `point` is not a valid sweep index.
     */
    Eigen::MatrixXcd sMatrixAt(Eigen::Index point) const;

    /**
     * @brief Print every bound vector in a readable form.
     */
    void print(std::ostream& os) const;
};
