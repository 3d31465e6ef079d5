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
 * @file Driver.hpp
 * @brief Entry points used by the `cktbind` command-line tool.
 *
 * The driver reads solver output, parses it into a `Dataset`, prints the
 * dataset summary and then either the list of vector names or the typed
 * result selected by `BinderOptions::analysis`.
 *
 * Exit codes:
 *  - 0: dataset parsed with status `Success` (and, with `strictDataset`,
 *       without warnings);
 *  - 1: the input could not be read;
 *  - 2: the dataset carries errors (or warnings under `strictDataset`).
 */

#pragma once

#include <iostream>
#include <string>

#include "BinderOptions.hpp"

/**
 * @brief Run the driver on a stream of solver output.
 *
 * Errors and warnings found in the dataset are also reported on std::cerr
 * as `Error:` / `Warning:` lines; `options.quiet` drops the warning lines.
 *
 * @param input Solver output.
 * @param options Validated options.
 * @param out Destination of the summary and result listing.
 * @return Process exit code.
 */
int runBinder(std::istream& input, const BinderOptions& options,
              std::ostream& out = std::cout);

/**
 * @brief Run the driver on a dataset file; `-` reads standard input.
 */
int runBinder(const std::string& filename, const BinderOptions& options,
              std::ostream& out = std::cout);
