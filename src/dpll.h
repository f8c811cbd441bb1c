#ifndef __DPLL_H__
#define __DPLL_H__

#include <cstdint>

#include "cnf.h"
#include "types.h"

// Result of one solver call. result is SATISFIABLE, UNSATISFIABLE, or UNKNOWN
// when the step budget ran out. model is only meaningful for SATISFIABLE and
// holds exactly the variables the search assigned; every other variable can
// take either value. steps counts search nodes visited and backtracks counts
// second branches tried. Both are diagnostics only.
struct Outcome {
    Outcome() : result(UNKNOWN), steps(0), backtracks(0) {}

    ReturnValue result;
    Assignment model;
    uint64_t steps;
    uint64_t backtracks;
};

// Decides f with DPLL: unit propagation to a fixpoint, then branching on the
// literal with the most occurrences in the remaining clauses (ties go to the
// literal seen first, scanning clauses in order), trying that literal before
// its negation. The search keeps its choice points on an explicit stack, so
// search depth is bounded by memory rather than by the call stack.
//
// solve is a pure function of its arguments: the same formula always yields
// the same outcome and model. If max_steps is non-zero, visiting more than
// max_steps search nodes stops the search with UNKNOWN.
//
// Every literal of f must be non-zero; magnitudes beyond f.nvars are
// tolerated and treated as additional variables.
Outcome solve(const Formula& f, uint64_t max_steps = 0);

#endif  // __DPLL_H__
