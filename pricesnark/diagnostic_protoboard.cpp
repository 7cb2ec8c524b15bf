/** @file
 *****************************************************************************

 Implementation of the non-template parts of the diagnostic protoboard.

 See diagnostic_protoboard.hpp .

 *****************************************************************************/

#include <sstream>

#include "diagnostic_protoboard.hpp"

const long constraint_scope::NO_INDEX;

std::ostream& operator<<(std::ostream &out, const unsatisfied_constraint &c)
{
    out << "constraint " << c.constraint_index << " in " << c.group;
    if (c.index != constraint_scope::NO_INDEX){
        out << "[" << c.index << "]";
    }
    if (!c.annotation.empty()){
        out << " (" << c.annotation << ")";
    }
    return out;
}

static std::string describe(const unsatisfied_constraint &c)
{
    std::stringstream ss;
    ss << "unsatisfied " << c;
    return ss.str();
}

unsatisfied_circuit_error::unsatisfied_circuit_error(const unsatisfied_constraint &c) :
    std::runtime_error(describe(c)), group(c.group), index(c.index), constraint_index(c.constraint_index)
{
}
