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
 * @file Resistor.hpp
 * @brief Declaration of the Resistor component.
 *
 * The resistor is a plain two-terminal component. It declares the terminals
 * `n1` and `n2` (in that order) and the parameter `R` in ohms. Node
 * resolution sees it only through those integer fields.
 *
 * Usage example:
 * @code
 * auto r = std::make_shared<Resistor>("R1", 1000.0);
 * circuit.connect(r, "n2", gnd, "n");
 * @endcode
 */

#include <string>

#include "Component.hpp"

/**
 * @class Resistor
 * @brief Ideal linear resistor with terminals `n1` and `n2`.
 */
class Resistor : public Component
{
   public:
    /**
     * @brief Construct a resistor.
     *
     * @param name Unique component name (e.g., "R1").
     * @param resistance Resistance in ohms.
     */
    Resistor(const std::string& name, double resistance)
        : Component(name, ComponentKind::Resistor)
    {
        declareIntField("n1");
        declareIntField("n2");
        declareParameter("R", resistance);
    }

    /** @brief Resistance in ohms. */
    double getResistance() const { return getParameter("R"); }
};
