// Davis-Putnam-Logemann-Loveland search with the DLIS branching heuristic.
//
// Each search node owns a list of the clauses that are not yet satisfied, with
// the false literals already stripped from them. Clauses are immutable and
// reference counted, so simplifying a list only allocates the clauses that
// actually lose a literal; everything else is shared with the parent node.
// Backtracking is then just a matter of going back to the list saved at the
// choice point.

#include "dpll.h"

#include <memory>
#include <sstream>
#include <vector>

#include "logging.h"

typedef std::shared_ptr<const Clause> ClauseRef;
typedef std::vector<ClauseRef> ClauseList;

// What a node's clause list says about the partial assignment that produced
// it.
enum Status {
    OPEN = 0,      // Some clauses remain and none of them is empty.
    SOLVED = 1,    // No clauses remain.
    CONFLICT = 2   // Some clause has no literal left.
};

// An entry on the explicit search stack: the clause list as it was before the
// branch literal was applied, the length of the trail at that point, and the
// literal to try once the first branch fails.
struct ChoicePoint {
    ClauseList clauses;
    std::size_t trail_size;
    lit_t alternative;
};

static Status status(const ClauseList& clauses) {
    if (clauses.empty()) return SOLVED;
    for (const ClauseRef& c : clauses) {
        if (c->empty()) return CONFLICT;
    }
    return OPEN;
}

// Makes l true: drops every clause containing l and removes -l from the rest.
// Clauses that contain neither are shared with the input list.
static ClauseList simplify(const ClauseList& clauses, lit_t l) {
    ClauseList out;
    out.reserve(clauses.size());
    for (const ClauseRef& c : clauses) {
        bool sat = false;
        bool shrinks = false;
        for (lit_t x : *c) {
            if (x == l) { sat = true; break; }
            if (x == -l) shrinks = true;
        }
        if (sat) continue;
        if (!shrinks) {
            out.push_back(c);
            continue;
        }
        std::shared_ptr<Clause> nc = std::make_shared<Clause>();
        nc->reserve(c->size() - 1);
        for (lit_t x : *c) {
            if (x != -l) nc->push_back(x);
        }
        out.push_back(nc);
    }
    return out;
}

// Repeatedly takes the first clause with a single literal, records that
// literal on the trail and simplifies, until no unit clause is left or the
// list is solved or in conflict.
static Status propagate(ClauseList* clauses, std::vector<lit_t>* trail) {
    Status s = status(*clauses);
    while (s == OPEN) {
        lit_t unit = lit_nil;
        for (const ClauseRef& c : *clauses) {
            if (c->size() == 1) { unit = (*c)[0]; break; }
        }
        if (unit == lit_nil) break;
        LOG(3) << "Unit clause forces " << unit;
        trail->push_back(unit);
        *clauses = simplify(*clauses, unit);
        s = status(*clauses);
    }
    return s;
}

// DLIS: returns the literal with the most occurrences in clauses. Among
// literals with equal counts, the one whose first occurrence comes first wins.
// tally must be zero on entry for every literal in clauses and is left zeroed.
static lit_t choose_literal(const ClauseList& clauses, clause_t* tally) {
    for (const ClauseRef& c : clauses) {
        for (lit_t x : *c) ++tally[x];
    }
    // Revisit the literals in the same order. The first visit of each literal
    // reads its full count and clears it, so later visits read 0 and a strict
    // comparison keeps the earliest literal among equals.
    lit_t best = lit_nil;
    clause_t best_count = 0;
    for (const ClauseRef& c : clauses) {
        for (lit_t x : *c) {
            clause_t n = tally[x];
            tally[x] = 0;
            if (n > best_count) {
                best = x;
                best_count = n;
            }
        }
    }
    return best;
}

static std::string clauses_debug_string(const ClauseList& clauses) {
    std::ostringstream oss;
    for (const ClauseRef& c : clauses) {
        oss << clause_debug_string(*c) << " ";
    }
    return oss.str();
}

Outcome solve(const Formula& f, uint64_t max_steps) {
    Outcome out;
    if (f.clauses.empty()) {
        out.result = SATISFIABLE;
        return out;
    }

    // Install the clauses and size the literal tally for the largest variable
    // actually present.
    lit_t max_var = f.nvars > 0 ? f.nvars : 0;
    ClauseList clauses;
    clauses.reserve(f.clauses.size());
    for (const Clause& c : f.clauses) {
        for (lit_t x : c) {
            CHECK(x != lit_nil && x != std::numeric_limits<lit_t>::min())
                << "Invalid literal " << x << " in clause "
                << clause_debug_string(c);
            if (var(x) > max_var) max_var = var(x);
        }
        clauses.push_back(std::make_shared<const Clause>(c));
    }
    std::vector<clause_t> tally_storage(2 * static_cast<std::size_t>(max_var)
                                        + 1, 0);
    clause_t* tally = &tally_storage[max_var];

    // Literals made true so far, in the order they were set: decisions and the
    // unit literals they forced. Choice points remember how much of the trail
    // to keep when their alternative is tried.
    std::vector<lit_t> trail;
    std::vector<ChoicePoint> stack;

    // Each iteration visits one search node: propagate units, then either
    // finish, branch on a new literal, or resume the most recent choice point
    // with its untried alternative.
    while (true) {
        if (max_steps != 0 && out.steps >= max_steps) {
            LOG(1) << "Step budget of " << max_steps << " exhausted at depth "
                   << stack.size();
            out.result = UNKNOWN;
            return out;
        }
        ++out.steps;
        LOG(4) << "clauses: " << clauses_debug_string(clauses);

        Status s = propagate(&clauses, &trail);
        if (s == SOLVED) {
            for (lit_t l : trail) out.model[var(l)] = l > 0;
            CHECK(satisfies(f, out.model))
                << "Search produced a non-model: "
                << assignment_debug_string(out.model);
            LOG(1) << "Satisfiable after " << out.steps << " steps, "
                   << out.backtracks << " backtracks";
            out.result = SATISFIABLE;
            return out;
        }

        if (s == OPEN) {
            lit_t l = choose_literal(clauses, tally);
            CHECK(l != lit_nil) << "No branch literal in a non-empty formula.";
            LOG(2) << "Branching on " << l << " at depth " << stack.size();
            stack.push_back(ChoicePoint{clauses, trail.size(), -l});
            trail.push_back(l);
            clauses = simplify(clauses, l);
            continue;
        }

        // Conflict. Resume the most recent choice point with the other value
        // of its variable; if there is none, the formula is unsatisfiable.
        if (stack.empty()) {
            LOG(1) << "Unsatisfiable after " << out.steps << " steps, "
                   << out.backtracks << " backtracks";
            out.result = UNSATISFIABLE;
            return out;
        }
        ++out.backtracks;
        ChoicePoint& cp = stack.back();
        LOG(2) << "Backtracking to depth " << stack.size() - 1 << ", trying "
               << cp.alternative;
        trail.resize(cp.trail_size);
        trail.push_back(cp.alternative);
        clauses = simplify(cp.clauses, cp.alternative);
        stack.pop_back();
    }
}
