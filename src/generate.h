#ifndef __GENERATE_H__
#define __GENERATE_H__

#include <string>

#include "cnf.h"
#include "types.h"

// Seeds the generator's random source. A seed of 0 is replaced by the
// current time and the seed actually used is returned, so runs can be
// replayed with --seed.
unsigned long init_random(unsigned long seed);

// Fills *f with a random 3-SAT formula over nvars variables. The formula has
// round(nvars * alpha) clauses, with halves rounded to even. Each clause
// holds three distinct variables drawn uniformly from [1, nvars], each
// negated with probability 1/2. Returns false with a message in *error if
// nvars < 3, if alpha is not a positive finite number, or if the clause count
// does not fit in clause_t.
//
// Draws from rand(); call init_random (or srand) first for reproducible
// output.
bool generate_3sat(lit_t nvars, double alpha, Formula* f, std::string* error);

#endif  // __GENERATE_H__
