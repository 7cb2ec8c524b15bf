/** @file
 *****************************************************************************

 Declaration of interfaces for diagnostic protoboard

 A protoboard that remembers which part of a circuit emitted which
 constraints. Constraints added between begin_scope() and end_scope() are
 labelled with a group name (e.g. "staleness") and an optional index (slot,
 entry or pair). Scopes may be nested, a constraint belongs to the innermost
 scope containing it.

 unsatisfied_constraints() evaluates every constraint against the current
 assignment and reports the failing ones with their labels. Constraint
 annotations are only available if libsnark is built with DEBUG.
 *****************************************************************************/

#ifndef PRICESNARK_DIAGNOSTIC_PROTOBOARD_HPP_
#define PRICESNARK_DIAGNOSTIC_PROTOBOARD_HPP_

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "libsnark/gadgetlib1/protoboard.hpp"

struct constraint_scope {
    static const long NO_INDEX = -1;

    std::string group;
    long index;
    size_t begin;
    size_t end;  // exclusive, valid once the scope is closed
};

struct unsatisfied_constraint {
    size_t constraint_index;
    std::string group;
    long index;
    std::string annotation;
};

std::ostream& operator<<(std::ostream &out, const unsatisfied_constraint &c);

/**
 * Thrown if a witness does not satisfy the circuit
 */
class unsatisfied_circuit_error : public std::runtime_error {
public:
    const std::string group;
    const long index;
    const size_t constraint_index;

    unsatisfied_circuit_error(const unsatisfied_constraint &c);
};

template<typename FieldT>
class diagnostic_protoboard : public libsnark::protoboard<FieldT> {
private:
    std::vector<constraint_scope> scopes;
    std::vector<size_t> open_scopes;

public:
    diagnostic_protoboard() = default;

    void begin_scope(const std::string &group, long index=constraint_scope::NO_INDEX);
    void end_scope();

    /**
     * innermost scope containing the constraint, nullptr if none
     */
    const constraint_scope* locate(size_t constraint_index) const;

    std::vector<unsatisfied_constraint> unsatisfied_constraints() const;

    /**
     * throws unsatisfied_circuit_error for the first unsatisfied constraint
     */
    void assert_satisfied() const;
};

#include "diagnostic_protoboard.tcc"

#endif // PRICESNARK_DIAGNOSTIC_PROTOBOARD_HPP_
