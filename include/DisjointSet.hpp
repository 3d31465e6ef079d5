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
 * @file DisjointSet.hpp
 * @brief Integer-keyed disjoint-set (union-find) with path compression.
 *
 * Keys are small non-negative integers handed out by the owning `Circuit`
 * (one per component terminal). Unknown keys are created lazily as singleton
 * sets by `find()`, which is what lets an isolated terminal own a net of its
 * own.
 */

#pragma once

#include <cstddef>
#include <unordered_map>

/**
 * @class DisjointSet
 * @brief Partition of integer keys into disjoint sets.
 *
 * `find()` applies path halving (every visited node is re-pointed to its
 * grandparent), which keeps trees shallow without recursion. `unite()`
 * attaches the second root under the first, so the root of `unite(a, b)` is
 * the root `a` had before the call.
 */
class DisjointSet
{
   private:
    std::unordered_map<int, int> parent;

   public:
    /**
     * @brief Find the root of the set containing `key`.
     *
     * A key seen for the first time becomes its own singleton set.
     *
     * @param key Element key.
     * @return Root key of the set.
     */
    int find(int key);

    /**
     * @brief Merge the sets containing `a` and `b`.
     *
     * Symmetric in effect; merging keys already in the same set is a no-op.
     *
     * @return Root of the merged set.
     */
    int unite(int a, int b);

    /**
     * @brief True when `a` and `b` are in the same set.
     */
    bool connected(int a, int b);

    /**
     * @brief True when `key` has been registered.
     */
    bool contains(int key) const { return parent.count(key) != 0; }

    /**
     * @brief Number of registered keys.
     */
    std::size_t size() const { return parent.size(); }

    /**
     * @brief Forget every key.
     */
    void clear() { parent.clear(); }
};
