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
 * @file SParameterFile.cpp
 * @brief Implementation of the `SParameterFile` component.
 *
 * Implementation notes:
 *  - Port detection accepts `.sNp` with one or more digits for N; anything
 *    else yields 0 and the constructor then requires an explicit count.
 *  - Terminal names are generated on demand from `numPorts`.
 */

#include "SParameterFile.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>
#include <vector>

SParameterFile::SParameterFile(const std::string& name,
                               const std::string& file, int numPorts,
                               const std::string& dataFormat,
                               const std::string& interpolator,
                               const std::string& duringDC)
    : Component(name, ComponentKind::SParameterFile),
      file(file),
      numPorts(numPorts),
      dataFormat(dataFormat),
      interpolator(interpolator),
      duringDC(duringDC)
{
    if (dataFormat != "rectangular" && dataFormat != "polar")
        throw std::invalid_argument(
            "S-parameter file '" + name +
            "': data format must be 'rectangular' or 'polar'");
    if (interpolator != "linear" && interpolator != "cubic")
        throw std::invalid_argument(
            "S-parameter file '" + name +
            "': interpolator must be 'linear' or 'cubic'");
    if (duringDC != "open" && duringDC != "short" && duringDC != "unspecified")
        throw std::invalid_argument(
            "S-parameter file '" + name +
            "': duringDC must be 'open', 'short' or 'unspecified'");

    if (numPorts < 0)
        throw std::invalid_argument("S-parameter file '" + name +
                                    "': port count must be positive");
    if (numPorts == 0) {
        this->numPorts = detectTouchstonePorts(file);
        if (this->numPorts == 0)
            throw std::invalid_argument(
                "S-parameter file '" + name +
                "': cannot detect port count from '" + file +
                "', pass it explicitly");
    }
}

std::vector<std::string> SParameterFile::terminalNames() const
{
    std::vector<std::string> names;
    names.reserve(numPorts + 1);
    for (int i = 1; i <= numPorts; ++i) names.push_back("n" + std::to_string(i));
    names.push_back("ref");
    return names;
}

int SParameterFile::detectTouchstonePorts(const std::string& file)
{
    std::string lower = file;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    size_t dot = lower.find_last_of('.');
    if (dot == std::string::npos) return 0;
    std::string ext = lower.substr(dot + 1);

    // s<digits>p
    if (ext.size() < 3 || ext.front() != 's' || ext.back() != 'p') return 0;
    std::string digits = ext.substr(1, ext.size() - 2);
    if (!std::all_of(digits.begin(), digits.end(),
                     [](char c) { return std::isdigit((unsigned char)c); }))
        return 0;
    try {
        return std::stoi(digits);
    } catch (const std::out_of_range&) {
        return 0;
    }
}
