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

/**
 * @file VoltageSource.hpp
 * @brief Declaration of the independent voltage source component.
 *
 * The voltage source covers both the DC and the small-signal AC flavour: a
 * pure DC source simply has a zero AC magnitude. Terminals are `nplus` and
 * `nminus`, in that order.
 *
 * Current convention:
 *  - The solver reports the branch current under the source name (`V1.I`,
 *    `V1.i`, `V1.It`, ...). It is the current flowing inside the source from
 *    `nplus` to `nminus`.
 *  - `ResultBinder::currentIntoPin()` turns that branch current into the
 *    current entering each pin from the external circuit.
 */

#include <string>

#include "Component.hpp"

/**
 * @class VoltageSource
 * @brief Independent voltage source with terminals `nplus` and `nminus`.
 */
class VoltageSource : public Component
{
   public:
    /**
     * @brief Construct an independent voltage source.
     *
     * @param name Unique component name (e.g., "V1").
     * @param dc DC voltage in volts.
     * @param acMagnitude Small-signal AC magnitude in volts (0 for DC only).
     * @param acPhase AC phase in degrees.
     * @param frequency AC frequency in hertz (used by harmonic balance).
     */
    VoltageSource(const std::string& name, double dc, double acMagnitude = 0.0,
                  double acPhase = 0.0, double frequency = 0.0)
        : Component(name, ComponentKind::VoltageSource)
    {
        declareIntField("nplus");
        declareIntField("nminus");
        declareParameter("dc", dc);
        declareParameter("ac_mag", acMagnitude);
        declareParameter("ac_phase", acPhase);
        declareParameter("freq", frequency);
    }

    /** @brief DC value in volts. */
    double getDC() const { return getParameter("dc"); }

    /** @brief True when the source has a non-zero AC magnitude. */
    bool isAC() const { return getParameter("ac_mag") != 0.0; }
};
