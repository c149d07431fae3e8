#pragma once

#include <string>

#include <symengine/basic.h>

#include "errors.hpp"
#include "term.h"

namespace quizterm {

// Lowers a term into a SymEngine expression. Integral constants become
// SymEngine integers, other constants real or complex doubles; pi, e, i,
// true and false map to pi, E, I, 1 and 0.
SymEngine::RCP<const SymEngine::Basic> to_symengine(const Term& term);

std::string to_symengine_string(const Term& term);

// Evaluates through SymEngine (subs + eval_complex_double). Every free
// variable must be bound; throws UnknownVariableError otherwise.
Complex reference_eval(const Term& term, const Bindings& bindings = Bindings());

}
