#ifndef __CNF_H__
#define __CNF_H__

#include <map>
#include <string>
#include <utility>
#include <vector>

#include "types.h"

// A clause is a disjunction of literals. Duplicate literals are allowed and
// an empty clause is unsatisfiable.
typedef std::vector<lit_t> Clause;

// Maps a variable to its value. Partial during search; a model only needs to
// cover the variables the search actually had to decide.
typedef std::map<lit_t, bool> Assignment;

// A CNF formula over variables 1..nvars. Formulas are plain values: nothing
// in this project modifies a Formula it was handed, and solver calls work on
// their own derived clause lists.
struct Formula {
    Formula() : nvars(0) {}
    Formula(lit_t nvars, std::vector<Clause> clauses) :
        nvars(nvars), clauses(std::move(clauses)) {}

    bool operator==(const Formula& other) const {
        return nvars == other.nvars && clauses == other.clauses;
    }
    bool operator!=(const Formula& other) const { return !(*this == other); }

    // Returns a copy of this formula with one more clause at the end.
    Formula with_clause(const Clause& c) const;

    // Number of variables in the formula. Valid variables range from 1 to
    // nvars, inclusive.
    lit_t nvars;

    std::vector<Clause> clauses;
};

// Returns true iff every clause of f has a literal made true by a. Variables
// missing from a make all of their literals false.
bool satisfies(const Formula& f, const Assignment& a);

// Returns true iff every literal of f is non-zero with magnitude <= f.nvars.
// If not, *error (when non-null) names the first offending clause.
bool well_formed(const Formula& f, std::string* error);

std::string clause_debug_string(const Clause& c);
std::string assignment_debug_string(const Assignment& a);

#endif  // __CNF_H__
