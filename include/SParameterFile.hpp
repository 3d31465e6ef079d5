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
 * @file SParameterFile.hpp
 * @brief Declaration of the Touchstone-backed N-port component.
 *
 * An N-port S-parameter file has N+1 terminals: `n1` ... `nN` for the ports
 * followed by `ref`, the common reference. N is fixed at construction, either
 * explicitly or from the `.sNp` file extension, so the component implements
 * the `TerminalProvider` capability instead of relying on static fields.
 *
 * The file itself is never read here; loading and interpolating the data is
 * the solver's job.
 */

#include <string>
#include <vector>

#include "Component.hpp"

/**
 * @class SParameterFile
 * @brief N-port black box with terminals `n1..nN` and `ref`.
 */
class SParameterFile : public Component, public TerminalProvider
{
   private:
    std::string file;
    int numPorts;
    std::string dataFormat;
    std::string interpolator;
    std::string duringDC;

   public:
    /**
     * @brief Construct an S-parameter file component.
     *
     * @param name Component name (e.g., "AMP1").
     * @param file Path to the Touchstone file.
     * @param numPorts Port count; 0 means "detect from the file extension".
     * @param dataFormat "rectangular" or "polar".
     * @param interpolator "linear" or "cubic".
     * @param duringDC "open", "short" or "unspecified".
     * @throws std::invalid_argument on an invalid option or when the port
     *         count can neither be taken from `numPorts` nor detected.
     */
    SParameterFile(const std::string& name, const std::string& file,
                   int numPorts = 0,
                   const std::string& dataFormat = "rectangular",
                   const std::string& interpolator = "linear",
                   const std::string& duringDC = "open");

    /**
     * @brief Terminal names: `n1` ... `nN`, then `ref`.
     */
    std::vector<std::string> terminalNames() const override;

    /**
     * @brief Detect the port count of a Touchstone file from its extension.
     *
     * `amp.s2p` -> 2, `FILTER.S4P` -> 4. The check is case-insensitive.
     *
     * @param file File name or path.
     * @return Detected port count, or 0 if the extension is not `.sNp`.
     */
    static int detectTouchstonePorts(const std::string& file);

    int getNumPorts() const { return numPorts; }
    std::string getFile() const { return file; }
    std::string getDataFormat() const { return dataFormat; }
    std::string getInterpolator() const { return interpolator; }
    std::string getDuringDC() const { return duringDC; }
};
