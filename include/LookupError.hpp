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
 * @file LookupError.hpp
 * @brief Exceptions raised when a query names something that is not there.
 *
 * Lookup failures happen at query time (a vector, a pin's node or a branch
 * current that the result does not contain). Each exception carries the
 * requested name and the names that were available, so that a topology
 * mismatch between the circuit and the solver output can be diagnosed from
 * the message alone.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <vector>

/**
 * @class LookupError
 * @brief Base class of all query-time lookup failures.
 */
class LookupError : public std::runtime_error
{
   private:
    std::string requestedName;
    std::vector<std::string> availableNames;

   public:
    /**
     * @brief Construct a lookup error.
     *
     * @param message Human-readable description; the available names are
     *                appended to it.
     * @param requested Name that was asked for.
     * @param available Names that could have been asked for instead.
     */
    LookupError(const std::string& message, const std::string& requested,
                const std::vector<std::string>& available);

    /** @brief Name that was asked for. */
    const std::string& requested() const { return requestedName; }

    /** @brief Names that were available at the time of the query. */
    const std::vector<std::string>& available() const
    {
        return availableNames;
    }

    /**
     * @brief Format a list of names as `[a, b, c]`.
     */
    static std::string formatNames(const std::vector<std::string>& names);
};

/**
 * @class VectorNotFoundError
 * @brief A named vector is in neither the dataset nor the typed result.
 */
class VectorNotFoundError : public LookupError
{
   public:
    VectorNotFoundError(const std::string& name,
                        const std::vector<std::string>& available)
        : LookupError("Vector '" + name + "' not found", name, available)
    {
    }
};

/**
 * @class PinNotConnectedError
 * @brief A pin has no node id: its component never went through node
 * resolution, or the circuit changed since the last resolution.
 */
class PinNotConnectedError : public LookupError
{
   public:
    PinNotConnectedError(const std::string& pin, const std::string& reason,
                         const std::vector<std::string>& available)
        : LookupError("Pin '" + pin + "' is not connected (" + reason + ")",
                      pin, available)
    {
    }
};

/**
 * @class CurrentNotAvailableError
 * @brief The result does not report a branch current for a component.
 */
class CurrentNotAvailableError : public LookupError
{
   public:
    CurrentNotAvailableError(const std::string& component,
                             const std::vector<std::string>& available)
        : LookupError("Current not available for component '" + component +
                          "'; only sources and probes report currents",
                      component, available)
    {
    }
};
