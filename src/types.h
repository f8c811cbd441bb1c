#ifndef __TYPES_H__
#define __TYPES_H__

#include <cassert>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <limits>

// Literals are DIMACS integers: the magnitude is a 1-based variable index and
// the sign is the polarity. Variables share the same type.
typedef int32_t lit_t;
typedef uint32_t clause_t;

// Common #defines
#define var(x) (abs(x))
#define STRING_TOKEN(x) #x
#define STRING(x) STRING_TOKEN(x)
#define VARNAME1(x,y) x##y
#define VARNAME(x,y) VARNAME1(x,y)

// nil value
constexpr lit_t lit_nil = lit_t(0);

// UNKNOWN doubles as the outcome of a search that ran out of budget.
enum ReturnValue {
    UNKNOWN = 0,
    SATISFIABLE = 10,
    UNSATISFIABLE = 20
};

// Comparison functor for using const char* in maps
struct cstrcmp {
    bool operator()(const char* x, const char* y) const {
        return std::strcmp(x, y) < 0;
    }
};

#endif  // __TYPES_H__
