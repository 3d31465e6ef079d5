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
 * @file CurrentSource.hpp
 * @brief Declaration of the independent current source component.
 *
 * Terminals are `nplus` and `nminus`. The source drives `dc` amperes (plus an
 * optional AC component) internally from `nplus` to `nminus`; the solver
 * reports that branch current under the source name.
 */

#include <string>

#include "Component.hpp"

/**
 * @class CurrentSource
 * @brief Independent current source with terminals `nplus` and `nminus`.
 */
class CurrentSource : public Component
{
   public:
    /**
     * @brief Construct an independent current source.
     *
     * @param name Component identifier (e.g., "I1").
     * @param dc DC current in amperes.
     * @param acMagnitude Small-signal AC magnitude in amperes.
     * @param acPhase AC phase in degrees.
     * @param frequency AC frequency in hertz.
     */
    CurrentSource(const std::string& name, double dc, double acMagnitude = 0.0,
                  double acPhase = 0.0, double frequency = 0.0)
        : Component(name, ComponentKind::CurrentSource)
    {
        declareIntField("nplus");
        declareIntField("nminus");
        declareParameter("dc", dc);
        declareParameter("ac_mag", acMagnitude);
        declareParameter("ac_phase", acPhase);
        declareParameter("freq", frequency);
    }

    double getDC() const { return getParameter("dc"); }
};
