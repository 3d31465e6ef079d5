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
 * @file Dataset.hpp
 * @brief In-memory form of a solver's textual result dump.
 *
 * A `Dataset` holds named numeric vectors split into independent vectors
 * (sweep axes such as `frequency` or `time`) and dependent vectors (measured
 * quantities such as `_net1.V`), together with the errors and warnings found
 * while parsing and the raw text they came from.
 *
 * Datasets are produced by `DatasetParser::parse()` and are read-only
 * afterwards. A vector name is never present in both maps.
 */

#pragma once

#include <Eigen/Dense>
#include <iostream>
#include <map>
#include <string>
#include <vector>

/**
 * @enum SimulationStatus
 * @brief Overall outcome recorded in a dataset.
 */
enum class SimulationStatus
{
    Success,    /**< Output parsed, no error lines seen */
    Error,      /**< Solver reported at least one error line */
    ParseError, /**< Output empty or not a dataset at all */
    NotRun      /**< Nothing has been parsed yet */
};

inline std::ostream& operator<<(std::ostream& os, SimulationStatus status)
{
    switch (status) {
        case SimulationStatus::Success:
            os << "Success";
            break;
        case SimulationStatus::Error:
            os << "Error";
            break;
        case SimulationStatus::ParseError:
            os << "ParseError";
            break;
        case SimulationStatus::NotRun:
            os << "NotRun";
            break;
        default:
            os << "UnknownStatus";
            break;
    }
    return os;
}

/**
 * @struct DataVector
 * @brief One named vector of complex samples.
 */
struct DataVector
{
    std::string name;                      /**< Vector name */
    Eigen::VectorXcd values;               /**< Samples in file order */
    std::vector<std::string> dependencies; /**< Independent vectors it spans */
    bool isIndependent = false;            /**< True for sweep axes */
};

/**
 * @class Dataset
 * @brief Parsed solver output: vectors, status and diagnostics.
 *
 * All vector accessors look in the independent map first and then in the
 * dependent map, and throw `VectorNotFoundError` (listing every known name)
 * when the name is in neither.
 */
class Dataset
{
   private:
    SimulationStatus status = SimulationStatus::NotRun;
    std::string version;
    std::map<std::string, DataVector> independentVectors;
    std::map<std::string, DataVector> dependentVectors;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    std::string rawOutput;

    friend class DatasetParser;

   public:
    /** @brief Overall status; `NotRun` for a default-constructed dataset. */
    SimulationStatus getStatus() const { return status; }

    /** @brief Version token from the dataset header, empty if none. */
    const std::string& getVersion() const { return version; }

    /** @brief Independent (sweep) vectors by name. */
    const std::map<std::string, DataVector>& getIndependentVectors() const
    {
        return independentVectors;
    }

    /** @brief Dependent vectors by name. */
    const std::map<std::string, DataVector>& getDependentVectors() const
    {
        return dependentVectors;
    }

    /** @brief Error lines and synthesized parse errors. */
    const std::vector<std::string>& getErrors() const { return errors; }

    /** @brief Data-quality warnings and solver warning lines. */
    const std::vector<std::string>& getWarnings() const { return warnings; }

    /** @brief Text the dataset was parsed from. */
    const std::string& getRawOutput() const { return rawOutput; }

    /**
     * @brief Look up a vector by name.
     * @throws VectorNotFoundError if the name is unknown.
     */
    const DataVector& vector(const std::string& name) const;

    /** @brief True when a vector with this name exists in either map. */
    bool hasVector(const std::string& name) const;

    /** @brief Real parts of a vector. */
    Eigen::VectorXd realVector(const std::string& name) const;

    /** @brief Imaginary parts of a vector. */
    Eigen::VectorXd imagVector(const std::string& name) const;

    /** @brief Complex samples of a vector. */
    Eigen::VectorXcd complexVector(const std::string& name) const;

    /**
     * @brief All vector names: independent ones first, then dependent ones,
     * each group in ascending order.
     */
    std::vector<std::string> listVectors() const;

    /**
     * @brief True when the status is not `Success` or any error was recorded.
     */
    bool hasErrors() const;

    /**
     * @brief Write a human-readable summary (status, diagnostics, vectors).
     */
    void printSummary(std::ostream& os) const;
};
