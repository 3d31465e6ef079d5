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
 * @file Capacitor.hpp
 * @brief Declaration of the Capacitor component.
 *
 * Two-terminal capacitor with terminals `n1`, `n2` and parameter `C` in
 * farads.
 */

#include <string>

#include "Component.hpp"

/**
 * @class Capacitor
 * @brief Ideal capacitor with terminals `n1` and `n2`.
 */
class Capacitor : public Component
{
   public:
    /**
     * @brief Construct a capacitor.
     *
     * @param name Unique component name (e.g., "C1").
     * @param capacitance Capacitance in farads.
     */
    Capacitor(const std::string& name, double capacitance)
        : Component(name, ComponentKind::Capacitor)
    {
        declareIntField("n1");
        declareIntField("n2");
        declareParameter("C", capacitance);
    }

    /** @brief Capacitance in farads. */
    double getCapacitance() const { return getParameter("C"); }
};
