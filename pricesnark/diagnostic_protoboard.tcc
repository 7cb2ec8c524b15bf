/** @file
 *****************************************************************************

 Implementation of interfaces for diagnostic protoboard.

 See diagnostic_protoboard.hpp .

 *****************************************************************************/

#include "diagnostic_protoboard.hpp"

template<typename FieldT>
void diagnostic_protoboard<FieldT>::begin_scope(const std::string &group, long index)
{
    constraint_scope scope;
    scope.group = group;
    scope.index = index;
    scope.begin = this->num_constraints();
    scope.end = scope.begin;
    open_scopes.push_back(scopes.size());
    scopes.push_back(scope);
}

template<typename FieldT>
void diagnostic_protoboard<FieldT>::end_scope()
{
    if (open_scopes.empty()){
        throw std::logic_error("end_scope without matching begin_scope");
    }
    scopes[open_scopes.back()].end = this->num_constraints();
    open_scopes.pop_back();
}

template<typename FieldT>
const constraint_scope* diagnostic_protoboard<FieldT>::locate(size_t constraint_index) const
{
    const constraint_scope *result = nullptr;
    for (size_t i = 0; i < scopes.size(); ++i){
        const constraint_scope &s = scopes[i];
        if (constraint_index < s.begin || constraint_index >= s.end){
            continue;
        }
        // later scopes with the same or a smaller range are nested deeper
        if (result == nullptr || s.end - s.begin <= result->end - result->begin){
            result = &s;
        }
    }
    return result;
}

template<typename FieldT>
std::vector<unsatisfied_constraint> diagnostic_protoboard<FieldT>::unsatisfied_constraints() const
{
    std::vector<unsatisfied_constraint> result;
    const libsnark::r1cs_constraint_system<FieldT> cs = this->get_constraint_system();
    const libsnark::r1cs_variable_assignment<FieldT> assignment = this->full_variable_assignment();

    for (size_t c = 0; c < cs.constraints.size(); ++c){
        const libsnark::r1cs_constraint<FieldT> &constraint = cs.constraints[c];
        const FieldT a = constraint.a.evaluate(assignment);
        const FieldT b = constraint.b.evaluate(assignment);
        const FieldT out = constraint.c.evaluate(assignment);
        if (a * b == out){
            continue;
        }

        unsatisfied_constraint u;
        u.constraint_index = c;
        const constraint_scope *scope = locate(c);
        u.group = scope ? scope->group : "unscoped";
        u.index = scope ? scope->index : (long) constraint_scope::NO_INDEX;
#ifdef DEBUG
        auto it = cs.constraint_annotations.find(c);
        if (it != cs.constraint_annotations.end()){
            u.annotation = it->second;
        }
#endif
        result.push_back(u);
    }
    return result;
}

template<typename FieldT>
void diagnostic_protoboard<FieldT>::assert_satisfied() const
{
    const std::vector<unsatisfied_constraint> failures = unsatisfied_constraints();
    if (!failures.empty()){
        throw unsatisfied_circuit_error(failures.front());
    }
}
