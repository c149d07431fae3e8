#include "quizterm/symbolic.h"

#include <symengine/add.h>
#include <symengine/complex_double.h>
#include <symengine/constants.h>
#include <symengine/eval_double.h>
#include <symengine/functions.h>
#include <symengine/integer.h>
#include <symengine/mul.h>
#include <symengine/pow.h>
#include <symengine/real_double.h>
#include <symengine/subs.h>
#include <symengine/symbol.h>
#include <symengine/symengine_exception.h>

#include <cmath>
#include <limits>

namespace quizterm {

namespace {

using SymEngine::Basic;
using SymEngine::RCP;

RCP<const Basic> lower_constant(const Complex& value) {
	const double re = value.real();
	const double im = value.imag();
	if (im != 0.0) {
		return SymEngine::complex_double(value);
	}
	if (std::floor(re) == re && std::fabs(re) <= std::numeric_limits<int>::max()) {
		return SymEngine::integer(static_cast<int>(re));
	}
	return SymEngine::real_double(re);
}

RCP<const Basic> lower_variable(const std::string& name) {
	if (name == "pi") {
		return SymEngine::pi;
	}
	if (name == "e") {
		return SymEngine::E;
	}
	if (name == "i") {
		return SymEngine::I;
	}
	if (name == "true") {
		return SymEngine::one;
	}
	if (name == "false") {
		return SymEngine::zero;
	}
	return SymEngine::symbol(name);
}

RCP<const Basic> lower(const Node& node);

RCP<const Basic> lower_apply(const Node& node) {
	const RCP<const Basic> u = lower(node.operands[0]);
	RCP<const Basic> v = SymEngine::zero;
	if (node.operands.size() == 2) {
		v = lower(node.operands[1]);
	}
	switch (node.op) {
		case Operator::Add:
			return SymEngine::add(u, v);
		case Operator::Sub:
			return SymEngine::sub(u, v);
		case Operator::Mul:
			return SymEngine::mul(u, v);
		case Operator::Div:
			return SymEngine::div(u, v);
		case Operator::Pow:
			return SymEngine::pow(u, v);
		case Operator::Neg:
			return SymEngine::neg(u);
		case Operator::Abs:
			return SymEngine::abs(u);
		case Operator::Sin:
			return SymEngine::sin(u);
		case Operator::Cos:
			return SymEngine::cos(u);
		case Operator::Tan:
			return SymEngine::tan(u);
		case Operator::Cot:
			return SymEngine::cot(u);
		case Operator::Sinc:
			return SymEngine::div(SymEngine::sin(u), u);
		case Operator::Exp:
			return SymEngine::exp(u);
		case Operator::Ln:
		case Operator::Log:
			return SymEngine::log(u);
		case Operator::Log2:
			return SymEngine::div(SymEngine::log(u), SymEngine::log(SymEngine::integer(2)));
		case Operator::Log10:
			return SymEngine::div(SymEngine::log(u), SymEngine::log(SymEngine::integer(10)));
		case Operator::Sqrt:
			return SymEngine::sqrt(u);
		case Operator::Sinh:
			return SymEngine::sinh(u);
		case Operator::Cosh:
			return SymEngine::cosh(u);
		case Operator::Tanh:
			return SymEngine::tanh(u);
		case Operator::Asin:
			return SymEngine::asin(u);
		case Operator::Acos:
			return SymEngine::acos(u);
		case Operator::Atan:
			return SymEngine::atan(u);
		case Operator::Asinh:
			return SymEngine::asinh(u);
		case Operator::Acosh:
			return SymEngine::acosh(u);
		case Operator::Atanh:
			return SymEngine::atanh(u);
		case Operator::Floor:
			return SymEngine::floor(u);
		case Operator::Ceil:
			return SymEngine::ceiling(u);
		case Operator::Round:
			return SymEngine::floor(SymEngine::add(u, SymEngine::div(SymEngine::one, SymEngine::integer(2))));
	}
	throw UnimplementedOperatorError(operator_name(node.op));
}

RCP<const Basic> lower(const Node& node) {
	switch (node.kind) {
		case Node::Kind::Const:
			return lower_constant(node.value);
		case Node::Kind::Variable:
			return lower_variable(node.name);
		case Node::Kind::Apply:
			break;
	}
	if (node.operands.empty() || node.operands.size() > 2) {
		throw UnimplementedOperatorError(operator_name(node.op));
	}
	return lower_apply(node);
}

}

RCP<const Basic> to_symengine(const Term& term) {
	try {
		return lower(term.root());
	} catch (const SymEngine::SymEngineException& ex) {
		throw SymbolicError(ex.what());
	}
}

std::string to_symengine_string(const Term& term) {
	return to_symengine(term)->__str__();
}

Complex reference_eval(const Term& term, const Bindings& bindings) {
	for (const auto& name : term.variables()) {
		if (bindings.find(name) == bindings.end()) {
			throw UnknownVariableError(name);
		}
	}
	try {
		SymEngine::map_basic_basic values;
		for (const auto& binding : bindings) {
			values[SymEngine::symbol(binding.first)] = SymEngine::complex_double(binding.second);
		}
		const auto expr = SymEngine::subs(to_symengine(term), values);
		return SymEngine::eval_complex_double(*expr);
	} catch (const SymEngine::SymEngineException& ex) {
		throw SymbolicError(ex.what());
	}
}

}
