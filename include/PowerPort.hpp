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
 * @file PowerPort.hpp
 * @brief Declaration of the numbered power port used by S-parameter runs.
 *
 * A power port defines one measurement port of a scattering-parameter
 * analysis. Besides its terminals (`nplus`, `nminus`) it carries the integer
 * field `port_num`. That field is an ordinary integer, not a terminal: the
 * terminal scanner skips it because its name does not follow the terminal
 * convention, so node resolution never overwrites a port number.
 */

#include <string>

#include "Component.hpp"

/**
 * @class PowerPort
 * @brief Numbered S-parameter port with reference impedance and power.
 */
class PowerPort : public Component
{
   public:
    /**
     * @brief Construct a power port.
     *
     * @param name Component name (e.g., "P1").
     * @param portNumber Port index, 1-based.
     * @param impedance Port reference impedance in ohms.
     * @param powerDbm Available source power in dBm.
     * @throws std::invalid_argument if `portNumber < 1` or `impedance <= 0`.
     */
    PowerPort(const std::string& name, int portNumber,
              double impedance = 50.0, double powerDbm = 0.0);

    /** @brief 1-based port index. */
    int getPortNumber() const { return getIntField("port_num"); }

    /** @brief Port reference impedance in ohms. */
    double getImpedance() const { return getParameter("Z"); }
};
