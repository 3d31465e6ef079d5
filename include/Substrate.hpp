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
 * @file Substrate.hpp
 * @brief Declaration of the microstrip substrate definition.
 *
 * A substrate has parameters only and no electrical terminals. It may sit in
 * a circuit (microstrip components refer to it by name) but node resolution
 * skips it.
 */

#include <string>

#include "Component.hpp"

/**
 * @class Substrate
 * @brief Parameter-only substrate description.
 */
class Substrate : public Component
{
   public:
    /**
     * @brief Construct a substrate definition.
     *
     * @param name Component name (e.g., "Sub1").
     * @param er Relative permittivity (> 0).
     * @param height Substrate height in metres (> 0).
     * @param thickness Metal thickness in metres (>= 0).
     * @param lossTangent Dielectric loss tangent (>= 0).
     * @param resistivity Metal resistivity in ohm-metres (> 0).
     * @param roughness Surface roughness in metres (>= 0).
     * @throws std::invalid_argument when a value is out of range.
     */
    Substrate(const std::string& name, double er = 4.5, double height = 1.6e-3,
              double thickness = 35e-6, double lossTangent = 0.02,
              double resistivity = 0.022e-6, double roughness = 0.0);
};
