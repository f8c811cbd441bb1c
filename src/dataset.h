#ifndef __DATASET_H__
#define __DATASET_H__

#include <cstdint>
#include <string>
#include <vector>

#include "backbone.h"
#include "cnf.h"
#include "types.h"

// One labeled instance: a satisfiable random formula together with its frozen
// backbone. rigidity = backbone_size / nvars.
struct Sample {
    Sample() : id(0), nvars(0), alpha(0), backbone_size(0), rigidity(0) {}

    long id;
    lit_t nvars;
    double alpha;
    std::vector<Clause> clauses;
    Backbone backbone;
    std::size_t backbone_size;
    double rigidity;
};

// Generates nsamples satisfiable random 3-SAT instances over nvars variables
// at clause/variable ratio alpha and labels each with its backbone. Attempts
// that turn out unsatisfiable, or whose backbone could not be decided within
// opts.max_steps, are skipped and do not use up an id. Ids run 0, 1, ... in
// generation order.
//
// Returns false with a message in *error if the generator rejects nvars or
// alpha, or if max_attempts (when non-zero) attempts were made before
// nsamples samples were found. *out holds the samples found so far either
// way.
bool generate_dataset(long nsamples, lit_t nvars, double alpha,
                      const BackboneOptions& opts, long max_attempts,
                      std::vector<Sample>* out, std::string* error);

// JSON object with the fields id, n_vars, alpha, clauses, backbone,
// backbone_size and rigidity. backbone maps variable indexes, as strings, to
// true or false.
std::string to_json(const Sample& s);

// JSON array of samples, one per line.
std::string to_json(const std::vector<Sample>& samples);

// Aggregate solver behavior at one clause/variable ratio.
struct SweepPoint {
    SweepPoint() : alpha(0), trials(0), avg_steps(0), max_steps(0),
                   sat_ratio(0), unknown(0), avg_rigidity(0) {}

    double alpha;
    long trials;
    double avg_steps;       // Steps of the deciding solver call.
    uint64_t max_steps;
    double sat_ratio;       // Fraction of trials that were satisfiable.
    long unknown;           // Trials that ran out of budget.
    double avg_rigidity;    // Over satisfiable trials whose backbone was
                            // fully decided; 0 if there were none.
};

// Runs trials random instances over nvars variables at each alpha from
// min_alpha to max_alpha (inclusive, up to rounding) in increments of step.
// Returns false with a message in *error if the range is empty or not
// positive, if step or trials is not positive, or if the generator rejects
// the parameters.
bool phase_sweep(lit_t nvars, double min_alpha, double max_alpha, double step,
                 long trials, const BackboneOptions& opts,
                 std::vector<SweepPoint>* out, std::string* error);

// Fixed-width table of sweep results, one row per alpha.
std::string sweep_table(const std::vector<SweepPoint>& points);

#endif  // __DATASET_H__
