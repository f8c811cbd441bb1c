#ifndef __PARSE_H__
#define __PARSE_H__

#include <ostream>
#include <string>

#include "cnf.h"
#include "types.h"

// Reader and writer for DIMACS cnf text. Text starts with zero or more
// comments followed by a line declaring the number of variables and clauses.
// Each subsequent line is the zero-terminated definition of a disjunction.
// Clauses are specified by integers representing literals, starting at 1.
// Negated literals are represented with a leading minus.
//
// Example: The following CNF formula:
//
//   (x_1 OR x_2) AND (x_3) AND (NOT x_2 OR NOT x_3 OR x_4)
//
// Can be represented with the following text:
//
// c Header comment
// p cnf 4 3
// 1 2 0
// 3 0
// -2 -3 4 0
//
// Blank lines and lines starting with 'c' may appear anywhere. Every clause
// occupies exactly one line, so the empty clause is written as a lone "0".
// This is the layout to_dimacs produces, which makes
// parse_dimacs(to_dimacs(f)) == f for every well-formed f.

// Serializes f, one clause per line.
std::string to_dimacs(const Formula& f);

// Parses DIMACS text into *f. Returns false and leaves *f untouched if the
// problem line is missing, duplicated or malformed, if a clause line holds
// anything other than integers ending in a single terminating 0, if a literal
// is outside [1, nvars] in magnitude, or if the clause count disagrees with
// the problem line. *error then holds a message naming the offending line.
bool parse_dimacs(const std::string& text, Formula* f, std::string* error);

// Like parse_dimacs, reading the text from filename.
bool read_dimacs(const char* filename, Formula* f, std::string* error);

// Writes a's values in the "v" line layout of the SAT competition: tag
// followed by up to ten signed literals per line and a terminating 0. If
// fill is set, every variable 1..nvars is written and variables missing from
// a are written as false; otherwise only the variables in a are written.
void print_assignment(std::ostream& out, char tag, lit_t nvars,
                      const Assignment& a, bool fill);

#endif  // __PARSE_H__
