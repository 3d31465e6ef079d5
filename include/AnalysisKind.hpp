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
 * @file AnalysisKind.hpp
 * @brief Analysis kinds whose solver output the result binder understands.
 *
 * The kind selects the naming convention used to pick voltage, current and
 * scattering-parameter vectors out of a parsed dataset (see TypedResult.hpp).
 */

#pragma once

#include <iostream>
#include <stdexcept>
#include <string>

/**
 * @enum AnalysisKind
 * @brief Analysis whose result vectors are being bound.
 */
enum class AnalysisKind
{
    DC,             /**< DC operating point (`.V` / `.I`) */
    AC,             /**< Small-signal AC sweep (`.v` / `.i` vs acfrequency) */
    Transient,      /**< Time-domain run (`.Vt` / `.It` vs time) */
    SParameter,     /**< Scattering parameters (`S[i,j]` vs frequency) */
    HarmonicBalance /**< Harmonic balance (`.Vb` / `.Ib` vs hbfrequency) */
};

inline std::ostream& operator<<(std::ostream& os, AnalysisKind kind)
{
    switch (kind) {
        case AnalysisKind::DC:
            os << "DC";
            break;
        case AnalysisKind::AC:
            os << "AC";
            break;
        case AnalysisKind::Transient:
            os << "Transient";
            break;
        case AnalysisKind::SParameter:
            os << "SParameter";
            break;
        case AnalysisKind::HarmonicBalance:
            os << "HarmonicBalance";
            break;
        default:
            os << "UnknownAnalysisKind";
            break;
    }
    return os;
}

/**
 * @brief Parse a command-line analysis name.
 *
 * Accepts `dc`, `ac`, `tran`, `sp` and `hb` (case-sensitive, lowercase).
 *
 * @throws std::invalid_argument for any other name.
 */
inline AnalysisKind parseAnalysisKind(const std::string& text)
{
    if (text == "dc") return AnalysisKind::DC;
    if (text == "ac") return AnalysisKind::AC;
    if (text == "tran") return AnalysisKind::Transient;
    if (text == "sp") return AnalysisKind::SParameter;
    if (text == "hb") return AnalysisKind::HarmonicBalance;
    throw std::invalid_argument("unknown analysis '" + text +
                                "' (expected dc, ac, tran, sp or hb)");
}
