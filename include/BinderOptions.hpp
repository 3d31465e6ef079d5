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

#pragma once

#include <limits>
#include <stdexcept>
#include <string>

#include "AnalysisKind.hpp"

/*
 * BinderOptions.hpp
 *
 * Lightweight configuration container for runtime options.
 *
 * This header declares `BinderOptions`, a simple POD-style struct that carries
 * configuration knobs from the command-line driver (or tests) into node
 * resolution and result binding. The options select the analysis whose
 * vectors are bound, the reference impedance reported with S-parameters and
 * how strictly dataset findings are treated.
 *
 * Design goals:
 *  - Keep options small and trivial to copy (no heavy ownership semantics).
 *  - Provide a `validate()` method that checks for obviously invalid values
 *    and throws `std::invalid_argument` for fatal misconfiguration.
 */
/**
 * @struct BinderOptions
 * @brief Runtime options for node resolution, binding and the CLI driver.
 *
 * Fields in this struct are intentionally public to allow easy construction and
 * modification at the call-site (e.g., parsing CLI flags). Callers should
 * invoke `validate()` after setting options to ensure values are sensible.
 */
struct BinderOptions
{
    /**
     * @brief Analysis whose naming convention is used to build the typed
     * result.
     */
    AnalysisKind analysis = AnalysisKind::DC;

    /**
     * @brief Reference impedance, in ohms, reported with S-parameter results.
     *
     * The solver output does not carry the port impedance, so it is supplied
     * here. It must match the impedance the power ports were built with.
     */
    double referenceImpedance = 50.0;

    /**
     * @brief Suppress warning lines on std::cerr (a circuit without ground,
     * dataset warnings echoed by the driver).
     */
    bool quiet = false;

    /**
     * @brief Treat dataset warnings as failures in the command-line driver.
     *
     * Warnings (length mismatches, unparseable values) never stop parsing;
     * with `strictDataset` the driver still exits non-zero when any are
     * present.
     */
    bool strictDataset = false;

    /** @brief List the dataset's vector names instead of the typed result. */
    bool listVectors = false;

    /**
     * @brief Validate option values.
     *
     * Throws:
     *   - std::invalid_argument if the reference impedance is not a positive
     *     finite number.
     */
    void validate() const
    {
        if (!(referenceImpedance > 0.0) ||
            referenceImpedance == std::numeric_limits<double>::infinity())
            throw std::invalid_argument("referenceImpedance must be > 0");
    }
};
