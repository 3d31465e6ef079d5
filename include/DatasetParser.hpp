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
 * @file DatasetParser.hpp
 * @brief Line-oriented parser for the solver's dataset output.
 *
 * Accepted layout (blocks may appear in any order, blank lines are ignored):
 * @code
 * <Qucs Dataset 1.0.0>
 * <indep frequency 3>
 *   +1.00000000000000e+09
 *   ...
 * </indep>
 * <dep S[2,1] frequency>
 *   +5.00000000000000e-01-j5.00000000000000e-01
 *   ...
 * </dep>
 * @endcode
 *
 * Outside of blocks, lines that start with `error` or `fatal` (any case), or
 * contain `error:`, are recorded as errors and set the status to `Error`;
 * lines that start with `warning` or contain `warning:` are recorded as
 * warnings. Other free-standing lines are solver chatter and are skipped.
 *
 * Parsing never throws. Every problem ends up in the returned dataset:
 *  - empty input: status `ParseError`, error "Empty output received";
 *  - no header and no vectors: status `ParseError`, plus the error
 *    "No valid dataset found in output" when no error line was seen;
 *  - declared count differs from values read: warning, values kept;
 *  - unparseable value line: warning with its line number, line skipped;
 *  - malformed block header, stray closing tag or unterminated block:
 *    warning, whatever was read is kept.
 *
 * Example usage:
 * @code
 * DatasetParser parser;
 * Dataset ds = parser.parse(solverStdout);
 * if (!ds.hasErrors()) {
 *     Eigen::VectorXd f = ds.realVector("frequency");
 * }
 * @endcode
 */

#pragma once

#include <complex>
#include <string>
#include <vector>

#include "Dataset.hpp"

/**
 * @class DatasetParser
 * @brief Turns raw solver output into a `Dataset`.
 */
class DatasetParser
{
   private:
    /**
     * @brief Vector block currently being read.
     */
    struct OpenBlock
    {
        bool active = false;
        bool independent = false;
        std::string name;
        int expectedCount = 0;
        int headerLine = 0;
        std::vector<std::string> dependencies;
        std::vector<std::complex<double>> values;
    };

    static void closeBlock(Dataset& dataset, OpenBlock& block);

    static bool openIndependent(const std::string& line, int lineNumber,
                                OpenBlock& block, Dataset& dataset);
    static bool openDependent(const std::string& line, int lineNumber,
                              OpenBlock& block, Dataset& dataset);

    static bool isErrorLine(const std::string& lowered);
    static bool isWarningLine(const std::string& lowered);

   public:
    /**
     * @brief Parse raw solver output.
     *
     * @param text Complete solver standard output.
     * @return A fresh dataset; see the file comment for how problems are
     *         reported.
     */
    Dataset parse(const std::string& text) const;

    /**
     * @brief Parse one value line.
     *
     * Accepts a real number in exponential notation (`+1.5e-03`) or a complex
     * number whose imaginary part follows a sign and the marker `j`
     * (`+1.0e+00-j2.5e-01`). The whole token must be consumed and may not
     * contain whitespace.
     *
     * @param text Value text (leading/trailing whitespace is ignored).
     * @param valid Set to true on success, false otherwise.
     * @return The parsed value, or 0 when invalid.
     */
    static std::complex<double> parseValue(const std::string& text,
                                           bool& valid);
};
