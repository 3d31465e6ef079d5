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
 * @file Substrate.cpp
 * @brief Implementation of the `Substrate` constructor.
 */

#include "Substrate.hpp"

#include <stdexcept>
#include <string>

Substrate::Substrate(const std::string& name, double er, double height,
                     double thickness, double lossTangent, double resistivity,
                     double roughness)
    : Component(name, ComponentKind::Substrate)
{
    if (er <= 0.0)
        throw std::invalid_argument("Substrate '" + name +
                                    "': relative permittivity must be positive");
    if (height <= 0.0)
        throw std::invalid_argument("Substrate '" + name +
                                    "': height must be positive");
    if (thickness < 0.0)
        throw std::invalid_argument("Substrate '" + name +
                                    "': metal thickness must be non-negative");
    if (lossTangent < 0.0)
        throw std::invalid_argument("Substrate '" + name +
                                    "': loss tangent must be non-negative");
    if (resistivity <= 0.0)
        throw std::invalid_argument("Substrate '" + name +
                                    "': resistivity must be positive");
    if (roughness < 0.0)
        throw std::invalid_argument("Substrate '" + name +
                                    "': roughness must be non-negative");

    declareParameter("er", er);
    declareParameter("h", height);
    declareParameter("t", thickness);
    declareParameter("tand", lossTangent);
    declareParameter("rho", resistivity);
    declareParameter("rough", roughness);
}
