// filament/mono/lift.hpp - Concrete components back into the semantic model
#pragma once

#include "filament/basic/diagnostic.hpp"
#include "filament/mono/mono_component.hpp"
#include "filament/sema/model/component.hpp"

namespace filament
{

/**
 * Add one parameterless definition per specialization of `program` to
 * `table`, named by its mangled name. Existentials become literal
 * definitions, so the lifted model has no free existentials and checking it
 * needs no solver.
 *
 * Returns false if a name is already taken in `table`.
 */
bool lift_to_model(const MonoProgram & program, ComponentTable & table, DiagnosticBag * diags = nullptr);

/**
 * Check every lifted definition of `table` in order and discharge what is
 * left. Returns the number of components with errors.
 */
size_t check_lifted(const ComponentTable & table, DiagnosticBag * diags, size_t * solver_queries = nullptr);

}  // namespace filament
