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
 * @file Ground.hpp
 * @brief Declaration of the Ground reference component.
 *
 * A ground has the single terminal `n`. Every net touching the terminal of
 * any ground component resolves to node 0, whether or not separate ground
 * components are wired to each other.
 */

#include <string>

#include "Component.hpp"

/**
 * @class Ground
 * @brief Ground reference with terminal `n`.
 */
class Ground : public Component
{
   public:
    /**
     * @brief Construct a ground reference.
     * @param name Component name (defaults to "GND").
     */
    explicit Ground(const std::string& name = "GND")
        : Component(name, ComponentKind::Ground)
    {
        declareIntField("n");
    }
};
