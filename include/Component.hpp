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
 * @file Component.hpp
 * @brief Defines the Component base class, its kind enum and terminal
 * discovery.
 *
 * A `Component` is an opaque bag of named fields as far as net resolution is
 * concerned. Two kinds of field are declared by concrete components:
 *
 *  - integer fields: terminals (`n`, `n1`, `nplus`, ...) and plain integers
 *    such as a port number;
 *  - real parameters: resistance, capacitance, source amplitude, ...
 *
 * Terminals are found either through the `TerminalProvider` capability (for
 * components whose terminal count is fixed only at construction time) or by
 * scanning the integer fields for the terminal naming convention.
 */

#pragma once

#include <iostream>
#include <string>
#include <utility>
#include <vector>

/**
 * @enum ComponentKind
 * @brief Enumerates the component categories known to the library.
 *
 * The kind is used to recognise ground components during node resolution and
 * for diagnostics. Everything else about a component is carried in its
 * fields.
 */
enum class ComponentKind
{
    Resistor,       /**< Ideal resistor */
    Capacitor,      /**< Ideal capacitor */
    Inductor,       /**< Ideal inductor */
    VoltageSource,  /**< Independent voltage source (DC and/or AC) */
    CurrentSource,  /**< Independent current source (DC and/or AC) */
    Ground,         /**< Ground reference, always node 0 */
    PowerPort,      /**< Numbered power port for S-parameter analysis */
    VoltageProbe,   /**< Ideal voltmeter between two terminals */
    CurrentProbe,   /**< Ideal ammeter in series between two terminals */
    SParameterFile, /**< Touchstone-backed N-port black box */
    Substrate       /**< Parameter-only substrate definition (no pins) */
};

inline std::ostream& operator<<(std::ostream& os, ComponentKind kind)
{
    switch (kind) {
        case ComponentKind::Resistor:
            os << "Resistor";
            break;
        case ComponentKind::Capacitor:
            os << "Capacitor";
            break;
        case ComponentKind::Inductor:
            os << "Inductor";
            break;
        case ComponentKind::VoltageSource:
            os << "VoltageSource";
            break;
        case ComponentKind::CurrentSource:
            os << "CurrentSource";
            break;
        case ComponentKind::Ground:
            os << "Ground";
            break;
        case ComponentKind::PowerPort:
            os << "PowerPort";
            break;
        case ComponentKind::VoltageProbe:
            os << "VoltageProbe";
            break;
        case ComponentKind::CurrentProbe:
            os << "CurrentProbe";
            break;
        case ComponentKind::SParameterFile:
            os << "SParameterFile";
            break;
        case ComponentKind::Substrate:
            os << "Substrate";
            break;
        default:
            os << "UnknownComponentKind";
            break;
    }
    return os;
}

/**
 * @class Component
 * @brief Base class of every circuit component.
 *
 * Concrete components declare their fields in their constructor through
 * `declareIntField()` and `declareParameter()`. Field order is preserved and
 * determines terminal order, which in turn fixes the "first" and "second"
 * terminal used by the current sign convention of the result binder.
 *
 * Components are shared between the caller and any `Circuit` holding them
 * (`std::shared_ptr`). The identity of a component is the object itself; a
 * circuit never copies one.
 */
class Component
{
   protected:
    /**
     * @brief Name of the component (e.g. "R1"); also the key of its branch
     * current in solver output.
     */
    std::string name;
    /**
     * @brief Category of the component
     */
    ComponentKind kind;
    /**
     * @brief Integer fields in declaration order (terminals and plain ints)
     */
    std::vector<std::pair<std::string, int>> intFields;
    /**
     * @brief Real-valued parameters in declaration order
     */
    std::vector<std::pair<std::string, double>> parameters;

    /**
     * @brief Declare an integer field.
     *
     * Terminal fields should be declared with the value 0, the conventional
     * "unassigned" sentinel. Re-declaring an existing field replaces its
     * value.
     *
     * @param fieldName Field name (e.g. "n1", "nplus", "port_num").
     * @param value Initial value.
     */
    void declareIntField(const std::string& fieldName, int value = 0);

    /**
     * @brief Declare a real-valued parameter.
     * @param parameterName Parameter name (e.g. "R", "C", "dc").
     * @param value Parameter value.
     */
    void declareParameter(const std::string& parameterName, double value);

   public:
    /**
     * @brief Construct a Component
     * @param name Name of the component
     * @param kind Category of the component
     */
    Component(const std::string& name, ComponentKind kind)
        : name(name), kind(kind)
    {
    }

    /**
     * @brief Virtual destructor
     */
    virtual ~Component() = default;

    /**
     * @brief Gets the component name
     * @return Name of the component
     */
    std::string getName() const { return name; }

    /**
     * @brief Gets the component kind
     * @return ComponentKind enum value
     */
    ComponentKind getKind() const { return kind; }

    /**
     * @brief True for ground reference components
     */
    bool isGround() const { return kind == ComponentKind::Ground; }

    /**
     * @brief Gets all integer fields in declaration order
     */
    const std::vector<std::pair<std::string, int>>& getIntFields() const
    {
        return intFields;
    }

    /**
     * @brief Gets all real parameters in declaration order
     */
    const std::vector<std::pair<std::string, double>>& getParameters() const
    {
        return parameters;
    }

    /**
     * @brief Checks whether an integer field with the given name exists
     */
    bool hasIntField(const std::string& fieldName) const;

    /**
     * @brief Reads an integer field.
     * @throws std::invalid_argument if the component has no such field.
     */
    int getIntField(const std::string& fieldName) const;

    /**
     * @brief Checks whether a real parameter with the given name exists
     */
    bool hasParameter(const std::string& parameterName) const;

    /**
     * @brief Reads a real parameter.
     * @throws std::invalid_argument if the component has no such parameter.
     */
    double getParameter(const std::string& parameterName) const;
};

/**
 * @class TerminalProvider
 * @brief Capability implemented by components that list their own terminals.
 *
 * Components whose terminal count is decided at construction time (e.g. an
 * N-port S-parameter file with N+1 terminals) implement this interface. Node
 * resolution asks the capability first and only falls back to the generic
 * field-name scanner when a component does not provide it.
 */
class TerminalProvider
{
   public:
    virtual ~TerminalProvider() = default;

    /**
     * @brief Ordered terminal names of the component.
     */
    virtual std::vector<std::string> terminalNames() const = 0;
};

/**
 * @brief Check whether an integer field name follows the terminal convention.
 *
 * Accepted names are `n`, `n` followed by one or more digits, and the aliases
 * `nplus`, `nminus`, `ref`, `anode`, `cathode`, `gate`, `drain`, `source`,
 * `collector`, `base`, `emitter`, `input`, `output`, `bulk`, `substrate`,
 * `t1` and `t2`.
 *
 * @param fieldName Field name to test.
 * @return True if the field is a terminal.
 */
bool isTerminalFieldName(const std::string& fieldName);

/**
 * @brief List the terminals of a component in a stable order.
 *
 * Uses `TerminalProvider::terminalNames()` when the component implements the
 * capability; otherwise returns the names of the integer fields that pass
 * `isTerminalFieldName()`, in declaration order. A component with no
 * terminals yields an empty vector.
 *
 * @param component Component to inspect.
 * @return Ordered terminal names.
 */
std::vector<std::string> discoverTerminals(const Component& component);
