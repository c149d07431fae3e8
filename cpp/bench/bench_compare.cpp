#include <benchmark/benchmark.h>
#include <random>

#include "quizterm/numeric.h"
#include "quizterm/ode.h"
#include "quizterm/term.h"

static void BM_Parse_Simple(benchmark::State& state) {
    for (auto _ : state) {
        quizterm::Term term = quizterm::parse("x^2 + 2x + 1");
        benchmark::DoNotOptimize(term);
    }
}
BENCHMARK(BM_Parse_Simple);

static void BM_Parse_Functions(benchmark::State& state) {
    for (auto _ : state) {
        quizterm::Term term = quizterm::parse("-sin 3x + cos(x^5+1) / 7 + |1/(x+x)|");
        benchmark::DoNotOptimize(term);
    }
}
BENCHMARK(BM_Parse_Functions);

static void BM_Eval_Trig(benchmark::State& state) {
    const quizterm::Term term = quizterm::parse("sin(x)^2 + cos(x)^2");
    const quizterm::Bindings point = {{"x", quizterm::Complex(0.3, 0.7)}};
    for (auto _ : state) {
        quizterm::Complex value = term.eval(point);
        benchmark::DoNotOptimize(value);
    }
}
BENCHMARK(BM_Eval_Trig);

static void BM_Compare_Polynomial(benchmark::State& state) {
    const quizterm::Term lhs = quizterm::parse("(x + 1)^2");
    const quizterm::Term rhs = quizterm::parse("x^2 + 2*x + 1");
    std::mt19937 rng(42);
    for (auto _ : state) {
        bool result = quizterm::compare(lhs, rhs, {}, rng);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_Compare_Polynomial);

static void BM_CompareOde_Rescaled(benchmark::State& state) {
    const quizterm::Term lhs = quizterm::parse("sqrt(C-12*x^3)/3");
    const quizterm::Term rhs = quizterm::parse("sqrt(2/3)*sqrt(C-2*x^3)");
    const quizterm::StepHalvingMinimizer minimizer;
    std::mt19937 rng(42);
    for (auto _ : state) {
        bool result = quizterm::compare_ode(lhs, rhs, rng, minimizer);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_CompareOde_Rescaled);

static void BM_CompareOde_Swapped(benchmark::State& state) {
    const quizterm::Term lhs = quizterm::parse("C1 * exp(2x) + C2 * exp(-4x)");
    const quizterm::Term rhs = quizterm::parse("C2 * exp(2x) + C1 * exp(-4x)");
    const quizterm::StepHalvingMinimizer minimizer;
    std::mt19937 rng(42);
    for (auto _ : state) {
        bool result = quizterm::compare_ode(lhs, rhs, rng, minimizer);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_CompareOde_Swapped);

BENCHMARK_MAIN();
