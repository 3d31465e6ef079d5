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
 * @file PowerPort.cpp
 * @brief Implementation of the `PowerPort` constructor declared in
 * PowerPort.hpp.
 */

#include "PowerPort.hpp"

#include <stdexcept>
#include <string>

PowerPort::PowerPort(const std::string& name, int portNumber, double impedance,
                     double powerDbm)
    : Component(name, ComponentKind::PowerPort)
{
    if (portNumber < 1)
        throw std::invalid_argument("Power port '" + name +
                                    "': port number must be >= 1");
    if (impedance <= 0.0)
        throw std::invalid_argument("Power port '" + name +
                                    "': impedance must be positive");

    declareIntField("nplus");
    declareIntField("nminus");
    declareIntField("port_num", portNumber);
    declareParameter("Z", impedance);
    declareParameter("P", powerDbm);
}
