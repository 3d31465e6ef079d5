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
 * @file Circuit.hpp
 * @brief Declaration of the Circuit container and its net resolution pass.
 *
 * A `Circuit` is an ordered, duplicate-free collection of components plus the
 * pin-to-pin connections declared between their terminals. Every component is
 * given a stable arena index when it is added, and every one of its terminals
 * a stable integer key; the disjoint set that tracks nets is keyed purely on
 * those integers.
 *
 * `resolveNodes()` turns the connection graph into canonical node ids:
 *  - every terminal owns a net even if it was never connected;
 *  - every net touching the terminal of a `Ground` component becomes node 0;
 *  - all other nets get dense ids 1..N in first-seen order (components in
 *    insertion order, terminals in declaration order).
 *
 * The resolved ids live in a node table owned by the circuit and indexed by
 * (component index, terminal index). Component objects are never written to.
 * Any later `addComponent()` or `connect()` invalidates the table until the
 * next `resolveNodes()`; `nodeOf()` refuses to answer in between.
 */

#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "BinderOptions.hpp"
#include "Component.hpp"
#include "DisjointSet.hpp"
#include "Pin.hpp"

/**
 * @class Circuit
 * @brief Component graph with union-find based net resolution.
 */
class Circuit
{
   private:
    /**
     * @brief Arena slot of one component.
     */
    struct Entry
    {
        std::shared_ptr<Component> component;
        std::vector<std::string> terminals; /**< Discovered at insertion */
        std::vector<int> keys;              /**< Disjoint-set key per terminal */
    };

    std::vector<Entry> entries;
    std::unordered_map<const Component*, std::size_t> indexOf;

    DisjointSet nets;
    int nextKey = 0;
    std::size_t merges = 0;

    /** @brief nodeTable[componentIndex][terminalIndex] -> node id */
    std::vector<std::vector<int>> nodeTable;
    int distinctNodes = 0;
    bool resolved = false;

    const Entry& entryFor(const Component& component) const;
    std::size_t terminalIndex(const Entry& entry,
                              const std::string& terminal) const;
    int keyOf(const std::shared_ptr<Component>& component,
              const std::string& terminal);
    std::vector<std::string> componentNames() const;

   public:
    /**
     * @brief Add a component if it is not already present.
     *
     * Presence is decided by object identity, not by name. The terminals of
     * the component are discovered here (see `discoverTerminals()`) and each
     * one receives a stable key.
     *
     * @param component Component to add.
     * @return The stored handle (the argument itself).
     * @throws std::invalid_argument if `component` is null.
     */
    std::shared_ptr<Component> addComponent(
        const std::shared_ptr<Component>& component);

    /**
     * @brief Connect two terminals, adding their components if needed.
     *
     * Symmetric; repeating a connection, or connecting two terminals already
     * on the same net, changes nothing.
     *
     * @throws std::invalid_argument if a component is null or a terminal name
     *         does not exist on its component.
     */
    void connect(const std::shared_ptr<Component>& componentA,
                 const std::string& terminalA,
                 const std::shared_ptr<Component>& componentB,
                 const std::string& terminalB);

    /**
     * @brief Connect two pins.
     * @see connect(const std::shared_ptr<Component>&, const std::string&,
     *              const std::shared_ptr<Component>&, const std::string&)
     */
    void connect(const Pin& a, const Pin& b);

    /**
     * @brief Assign node ids to every net.
     *
     * Recomputes the whole node table from the current connections; running
     * it again without intervening edits yields the same assignment.
     * Components without terminals are skipped. A circuit without any ground
     * component is resolved normally (no net gets id 0) and a warning is
     * written to std::cerr unless `options.quiet` is set.
     *
     * @param options Resolver options.
     */
    void resolveNodes(const BinderOptions& options = BinderOptions());

    /**
     * @brief Node id of a component terminal.
     *
     * @throws PinNotConnectedError if the component is not part of the
     *         circuit or the circuit has not been resolved since its last
     *         change.
     * @throws std::invalid_argument if the terminal does not exist.
     */
    int nodeOf(const Component& component, const std::string& terminal) const;

    /**
     * @brief Node id of a pin.
     * @throws std::invalid_argument if the pin has no component.
     */
    int nodeOf(const Pin& pin) const;

    /** @brief True when the node table matches the current connections. */
    bool isResolved() const { return resolved; }

    /**
     * @brief Number of distinct non-ground node ids of the last resolution.
     */
    int nodeCount() const { return distinctNodes; }

    /** @brief True when at least one `Ground` component is present. */
    bool hasGround() const;

    /** @brief True when this exact component object was added. */
    bool contains(const Component& component) const;

    /**
     * @brief Terminal names of a component as recorded by the circuit.
     * @throws std::invalid_argument if the component is not in the circuit.
     */
    const std::vector<std::string>& terminalsOf(
        const Component& component) const;

    /** @brief Components in insertion order. */
    std::vector<std::shared_ptr<Component>> getComponents() const;

    /**
     * @brief Number of `connect()` calls that merged two separate nets.
     */
    std::size_t connectionCount() const { return merges; }

    /**
     * @brief Solver-side name of a node: `gnd` for 0, `_net<id>` otherwise.
     */
    static std::string nodeName(int nodeId);
};
