#ifndef __BACKBONE_H__
#define __BACKBONE_H__

#include <cstdint>
#include <vector>

#include "cnf.h"
#include "dpll.h"
#include "types.h"

// Frozen variables mapped to the value they take in every model.
typedef Assignment Backbone;

struct BackboneOptions {
    BackboneOptions() : max_steps(0), threads(1) {}

    // Step budget applied to each solver call separately. 0: no limit.
    uint64_t max_steps;

    // Number of worker threads running refutations. Values below 2 run them
    // on the calling thread.
    int threads;
};

// Tallies of the solver calls made while computing a backbone.
struct SolverCalls {
    SolverCalls() : total(0), sat(0), unsat(0), unknown(0) {}

    uint64_t total;
    uint64_t sat;
    uint64_t unsat;
    uint64_t unknown;
};

struct BackboneResult {
    BackboneResult() : result(UNKNOWN), steps(0), backtracks(0) {}

    // SATISFIABLE: every variable of the reference model was decided.
    // UNSATISFIABLE: the formula has no model and frozen is empty.
    // UNKNOWN: the reference solve or some refutation ran out of budget.
    ReturnValue result;

    Backbone frozen;

    // The first solver call. Its model is the one whose variables are tested.
    Outcome reference;

    // Variables of the reference model whose refutation ran out of budget.
    // They are neither known to be frozen nor known to be free.
    std::vector<lit_t> undecided;

    // Sums over every solver call, the reference call included.
    uint64_t steps;
    uint64_t backtracks;
    SolverCalls calls;
};

// Computes the frozen backbone of f. One solver call finds a reference model;
// then, for each variable v in that model, f plus the unit clause asserting
// the opposite of v's value is solved. If that is unsatisfiable, v is frozen.
// Variables that the reference model leaves unassigned are free and never
// tested. The frozen map does not depend on opts.threads.
BackboneResult find_backbone(const Formula& f,
                             const BackboneOptions& opts = BackboneOptions());

// Fraction of the nvars variables that are frozen, or 0 if nvars is 0.
double rigidity(const Backbone& backbone, lit_t nvars);

#endif  // __BACKBONE_H__
