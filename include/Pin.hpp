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
 * @file Pin.hpp
 * @brief A named terminal of one component instance.
 *
 * A `Pin` is a plain reference: it does not own anything beyond a shared
 * handle on its component, and two pins denote the same electrical point only
 * when the circuit has merged them into one net.
 */

#pragma once

#include <memory>
#include <string>
#include <utility>

#include "Component.hpp"

/**
 * @struct Pin
 * @brief (component, terminal name) pair.
 */
struct Pin
{
    /** @brief Owning component. */
    std::shared_ptr<Component> component;

    /** @brief Terminal name on that component (e.g. "n1", "nplus"). */
    std::string terminal;

    Pin() = default;
    Pin(std::shared_ptr<Component> component, const std::string& terminal)
        : component(std::move(component)), terminal(terminal)
    {
    }

    /**
     * @brief Printable form `COMPONENT.terminal`, used in diagnostics.
     */
    std::string label() const
    {
        return (component ? component->getName() : std::string("<null>")) +
               "." + terminal;
    }
};
