#include "cnf.h"

#include <sstream>

Formula Formula::with_clause(const Clause& c) const {
    Formula f(*this);
    f.clauses.push_back(c);
    return f;
}

bool satisfies(const Formula& f, const Assignment& a) {
    for (const Clause& c : f.clauses) {
        bool sat = false;
        for (lit_t l : c) {
            auto itr = a.find(var(l));
            if (itr != a.end() && itr->second == (l > 0)) {
                sat = true;
                break;
            }
        }
        if (!sat) return false;
    }
    return true;
}

bool well_formed(const Formula& f, std::string* error) {
    if (f.nvars < 0) {
        if (error) *error = "negative variable count";
        return false;
    }
    for (std::size_t i = 0; i < f.clauses.size(); ++i) {
        for (lit_t l : f.clauses[i]) {
            if (l == lit_nil || l == std::numeric_limits<lit_t>::min() ||
                var(l) > f.nvars) {
                if (error) {
                    std::ostringstream oss;
                    oss << "clause " << i << " has literal " << l
                        << " outside [1, " << f.nvars << "]";
                    *error = oss.str();
                }
                return false;
            }
        }
    }
    return true;
}

std::string clause_debug_string(const Clause& c) {
    std::ostringstream oss;
    oss << "(";
    for (std::size_t i = 0; i < c.size(); ++i) {
        oss << c[i];
        if (i + 1 != c.size()) oss << " ";
    }
    oss << ")";
    return oss.str();
}

std::string assignment_debug_string(const Assignment& a) {
    std::ostringstream oss;
    for (const auto& kv : a) {
        oss << (kv.second ? "" : "-") << kv.first << " ";
    }
    return oss.str();
}
