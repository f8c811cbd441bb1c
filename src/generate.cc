#include "generate.h"

#include <cmath>
#include <cstdlib>
#include <ctime>
#include <sstream>

#include "logging.h"

// Returns a value drawn uniformly from [0, n). Dividing rand() by a bucket
// width avoids the modulo bias of rand() % n.
static lit_t uniform(lit_t n) {
    uint64_t divisor = (static_cast<uint64_t>(RAND_MAX) + 1) / n;
    uint64_t q;
    do {
        q = static_cast<uint64_t>(std::rand()) / divisor;
    } while (q >= static_cast<uint64_t>(n));
    return static_cast<lit_t>(q);
}

unsigned long init_random(unsigned long seed) {
    if (seed == 0) seed = time(NULL);
    srand(seed);
    return seed;
}

bool generate_3sat(lit_t nvars, double alpha, Formula* f, std::string* error) {
    if (nvars < 3) {
        std::ostringstream oss;
        oss << "3-SAT needs at least 3 variables, got " << nvars;
        *error = oss.str();
        return false;
    }
    if (!std::isfinite(alpha) || alpha <= 0) {
        std::ostringstream oss;
        oss << "clause/variable ratio must be positive, got " << alpha;
        *error = oss.str();
        return false;
    }
    // nearbyint uses the default round-half-to-even mode.
    double m = std::nearbyint(nvars * alpha);
    if (m > static_cast<double>(std::numeric_limits<clause_t>::max())) {
        std::ostringstream oss;
        oss << nvars << " * " << alpha << " clauses is too many";
        *error = oss.str();
        return false;
    }
    CHECK(static_cast<uint64_t>(nvars) <=
          static_cast<uint64_t>(RAND_MAX) + 1)
        << "rand() cannot address " << nvars << " variables.";

    clause_t nclauses = static_cast<clause_t>(m);
    LOG(2) << "Generating " << nclauses << " clauses over " << nvars
           << " variables (alpha = " << alpha << ")";

    Formula out;
    out.nvars = nvars;
    out.clauses.reserve(nclauses);
    for (clause_t i = 0; i < nclauses; ++i) {
        Clause c(3, lit_nil);
        for (int k = 0; k < 3; ++k) {
            lit_t v;
            do {
                v = 1 + uniform(nvars);
            } while ((k > 0 && var(c[0]) == v) || (k > 1 && var(c[1]) == v));
            c[k] = uniform(2) ? v : -v;
        }
        LOG(4) << "Clause " << i << ": " << clause_debug_string(c);
        out.clauses.push_back(std::move(c));
    }
    *f = std::move(out);
    return true;
}
