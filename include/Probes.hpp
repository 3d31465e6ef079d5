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
 * @file Probes.hpp
 * @brief Declarations of the voltage and current probe components.
 *
 * Probes are measurement-only components. The solver reports a probe's
 * reading under the probe's own name (e.g. `VP1.V` for a DC voltage probe,
 * `IP1.I` for a DC current probe), so the result binder can retrieve them
 * by name with `ResultBinder::probeVoltage()` / `probeCurrent()`.
 */

#include <string>

#include "Component.hpp"

/**
 * @class VoltageProbe
 * @brief Ideal voltmeter: `n1` positive, `n2` negative (may be ground).
 */
class VoltageProbe : public Component
{
   public:
    explicit VoltageProbe(const std::string& name)
        : Component(name, ComponentKind::VoltageProbe)
    {
        declareIntField("n1");
        declareIntField("n2");
    }
};

/**
 * @class CurrentProbe
 * @brief Ideal ammeter: current flows in at `n1` and out at `n2`.
 */
class CurrentProbe : public Component
{
   public:
    explicit CurrentProbe(const std::string& name)
        : Component(name, ComponentKind::CurrentProbe)
    {
        declareIntField("n1");
        declareIntField("n2");
    }
};
