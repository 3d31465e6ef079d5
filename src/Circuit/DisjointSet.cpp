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
 * @file DisjointSet.cpp
 * @brief Implementation of the `DisjointSet` declared in DisjointSet.hpp.
 */

#include "DisjointSet.hpp"

int DisjointSet::find(int key)
{
    auto it = parent.find(key);
    if (it == parent.end()) {
        parent.emplace(key, key);
        return key;
    }

    // Path halving
    while (parent[key] != key) {
        parent[key] = parent[parent[key]];
        key = parent[key];
    }
    return key;
}

int DisjointSet::unite(int a, int b)
{
    int rootA = find(a);
    int rootB = find(b);
    if (rootA == rootB) return rootA;
    parent[rootB] = rootA;
    return rootA;
}

bool DisjointSet::connected(int a, int b) { return find(a) == find(b); }
