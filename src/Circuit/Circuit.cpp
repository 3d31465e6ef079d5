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
 * @file Circuit.cpp
 * @brief Implementation of component bookkeeping and node resolution.
 *
 * Implementation notes:
 *  - Terminal keys are handed out sequentially at insertion and never reused,
 *    so the disjoint set only ever sees small integers.
 *  - Resolution walks components in insertion order and their terminals in
 *    declaration order; that walk order fixes the numbering.
 */

#include "Circuit.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "LookupError.hpp"

std::shared_ptr<Component> Circuit::addComponent(
    const std::shared_ptr<Component>& component)
{
    if (!component)
        throw std::invalid_argument("Cannot add a null component to a circuit");

    auto it = indexOf.find(component.get());
    if (it != indexOf.end()) return entries[it->second].component;

    Entry entry;
    entry.component = component;
    entry.terminals = discoverTerminals(*component);
    for (std::size_t i = 0; i < entry.terminals.size(); ++i) {
        entry.keys.push_back(nextKey++);
    }

    indexOf[component.get()] = entries.size();
    entries.push_back(std::move(entry));
    resolved = false;
    return component;
}

const Circuit::Entry& Circuit::entryFor(const Component& component) const
{
    auto it = indexOf.find(&component);
    if (it == indexOf.end())
        throw std::invalid_argument("Component '" + component.getName() +
                                    "' is not part of the circuit");
    return entries[it->second];
}

std::size_t Circuit::terminalIndex(const Entry& entry,
                                   const std::string& terminal) const
{
    for (std::size_t i = 0; i < entry.terminals.size(); ++i) {
        if (entry.terminals[i] == terminal) return i;
    }
    throw std::invalid_argument(
        "Component '" + entry.component->getName() + "' has no terminal '" +
        terminal + "' (terminals: " + LookupError::formatNames(entry.terminals) +
        ")");
}

int Circuit::keyOf(const std::shared_ptr<Component>& component,
                   const std::string& terminal)
{
    const Entry& entry = entryFor(*addComponent(component));
    return entry.keys[terminalIndex(entry, terminal)];
}

void Circuit::connect(const std::shared_ptr<Component>& componentA,
                      const std::string& terminalA,
                      const std::shared_ptr<Component>& componentB,
                      const std::string& terminalB)
{
    if (!componentA || !componentB)
        throw std::invalid_argument("Cannot connect a pin without a component");

    // Validate both ends before touching the disjoint set.
    int keyA = keyOf(componentA, terminalA);
    int keyB = keyOf(componentB, terminalB);

    if (nets.find(keyA) != nets.find(keyB)) {
        nets.unite(keyA, keyB);
        ++merges;
    }
    resolved = false;
}

void Circuit::connect(const Pin& a, const Pin& b)
{
    connect(a.component, a.terminal, b.component, b.terminal);
}

void Circuit::resolveNodes(const BinderOptions& options)
{
    // Roots reachable from any ground terminal.
    std::unordered_set<int> groundRoots;
    for (const auto& entry : entries) {
        if (!entry.component->isGround()) continue;
        for (int key : entry.keys) groundRoots.insert(nets.find(key));
    }

    std::unordered_map<int, int> idOfRoot;
    int nextId = 1;

    nodeTable.assign(entries.size(), std::vector<int>());
    for (std::size_t c = 0; c < entries.size(); ++c) {
        const Entry& entry = entries[c];
        nodeTable[c].assign(entry.keys.size(), -1);
        for (std::size_t t = 0; t < entry.keys.size(); ++t) {
            int root = nets.find(entry.keys[t]);
            if (groundRoots.count(root)) {
                nodeTable[c][t] = 0;
                continue;
            }
            auto it = idOfRoot.find(root);
            if (it == idOfRoot.end()) it = idOfRoot.emplace(root, nextId++).first;
            nodeTable[c][t] = it->second;
        }
    }

    distinctNodes = nextId - 1;
    resolved = true;

    if (!entries.empty() && groundRoots.empty() && !options.quiet) {
        std::cerr << "Warning: circuit has no ground component; no net is "
                     "mapped to node 0"
                  << std::endl;
    }
}

std::vector<std::string> Circuit::componentNames() const
{
    std::vector<std::string> names;
    names.reserve(entries.size());
    for (const auto& entry : entries) {
        names.push_back(entry.component->getName());
    }
    return names;
}

int Circuit::nodeOf(const Component& component,
                    const std::string& terminal) const
{
    const std::string pin = component.getName() + "." + terminal;

    auto it = indexOf.find(&component);
    if (it == indexOf.end())
        throw PinNotConnectedError(pin, "component is not part of the circuit",
                                   componentNames());

    const Entry& entry = entries[it->second];
    std::size_t t = terminalIndex(entry, terminal);

    if (!resolved || it->second >= nodeTable.size())
        throw PinNotConnectedError(
            pin, "circuit has not been resolved since its last change",
            entry.terminals);

    return nodeTable[it->second][t];
}

int Circuit::nodeOf(const Pin& pin) const
{
    if (!pin.component)
        throw std::invalid_argument("Pin '" + pin.label() +
                                    "' has no component");
    return nodeOf(*pin.component, pin.terminal);
}

bool Circuit::hasGround() const
{
    for (const auto& entry : entries) {
        if (entry.component->isGround()) return true;
    }
    return false;
}

bool Circuit::contains(const Component& component) const
{
    return indexOf.count(&component) != 0;
}

const std::vector<std::string>& Circuit::terminalsOf(
    const Component& component) const
{
    return entryFor(component).terminals;
}

std::vector<std::shared_ptr<Component>> Circuit::getComponents() const
{
    std::vector<std::shared_ptr<Component>> components;
    components.reserve(entries.size());
    for (const auto& entry : entries) components.push_back(entry.component);
    return components;
}

std::string Circuit::nodeName(int nodeId)
{
    if (nodeId == 0) return "gnd";
    return "_net" + std::to_string(nodeId);
}
