#include <string>

#include "cnf.h"
#include "dpll.h"
#include "generate.h"
#include "test.h"

// Decides f by trying all 2^nvars total assignments.
static bool brute_force_sat(const Formula& f) {
    for (uint64_t bits = 0; bits < (uint64_t(1) << f.nvars); ++bits) {
        Assignment a;
        for (lit_t v = 1; v <= f.nvars; ++v) a[v] = (bits >> (v - 1)) & 1;
        if (satisfies(f, a)) return true;
    }
    return false;
}

static Assignment make_assignment(std::initializer_list<lit_t> lits) {
    Assignment a;
    for (lit_t l : lits) a[var(l)] = l > 0;
    return a;
}

TEST(worked_example,
     Outcome o = solve(Formula(2, {{1, 2}, {-1, 2}, {1, -2}}));
     EXPECT_EQ(o.result, SATISFIABLE);
     EXPECT_EQ(o.model, make_assignment({1, 2}));
     EXPECT_EQ(o.steps, 2u);
     EXPECT_EQ(o.backtracks, 0u);
    )

TEST(empty_formula,
     Outcome o = solve(Formula());
     EXPECT_EQ(o.result, SATISFIABLE);
     EXPECT_TRUE(o.model.empty());
     o = solve(Formula(5, {}));
     EXPECT_EQ(o.result, SATISFIABLE);
     EXPECT_TRUE(o.model.empty());
     EXPECT_EQ(o.steps, 0u);
    )

TEST(empty_clause,
     Outcome o = solve(Formula(0, {Clause()}));
     EXPECT_EQ(o.result, UNSATISFIABLE);
     EXPECT_EQ(o.steps, 1u);
     o = solve(Formula(2, {{1, 2}, {}}));
     EXPECT_EQ(o.result, UNSATISFIABLE);
    )

TEST(all_four_clauses_over_two_variables,
     Outcome o = solve(Formula(2, {{1, 2}, {1, -2}, {-1, 2}, {-1, -2}}));
     EXPECT_EQ(o.result, UNSATISFIABLE);
     EXPECT_EQ(o.steps, 3u);
     EXPECT_EQ(o.backtracks, 1u);
    )

TEST(unit_propagation_alone,
     Outcome o = solve(Formula(3, {{1}, {-1, 2}, {-2, -3}}));
     EXPECT_EQ(o.result, SATISFIABLE);
     EXPECT_EQ(o.model, make_assignment({1, 2, -3}));
     EXPECT_EQ(o.steps, 1u);
    )

TEST(contradictory_units,
     Outcome o = solve(Formula(1, {{1}, {-1}}));
     EXPECT_EQ(o.result, UNSATISFIABLE);
     EXPECT_EQ(o.backtracks, 0u);
    )

// -1 occurs twice and everything else once, so -1 is tried first. Variable 3
// is never needed and stays out of the model.
TEST(most_frequent_literal_first,
     Outcome o = solve(Formula(3, {{-1, 2}, {-1, 3}, {1, -2}}));
     EXPECT_EQ(o.result, SATISFIABLE);
     EXPECT_EQ(o.model, make_assignment({-1, -2}));
     EXPECT_EQ(o.steps, 2u);
    )

// 2 and 1 both occur twice; 2 is seen first.
TEST(ties_go_to_first_seen_literal,
     Outcome o = solve(Formula(2, {{2, 1}, {1, 2}}));
     EXPECT_EQ(o.result, SATISFIABLE);
     EXPECT_EQ(o.model, make_assignment({2}));
     EXPECT_EQ(o.steps, 2u);
    )

TEST(step_budget,
     Formula f(2, {{1, 2}, {-1, 2}, {1, -2}});
     Outcome o = solve(f, 1);
     EXPECT_EQ(o.result, UNKNOWN);
     EXPECT_EQ(o.steps, 1u);
     EXPECT_TRUE(o.model.empty());
     o = solve(f, 2);
     EXPECT_EQ(o.result, SATISFIABLE);
     o = solve(Formula(2, {{1, 2}, {1, -2}, {-1, 2}, {-1, -2}}), 2);
     EXPECT_EQ(o.result, UNKNOWN);
     EXPECT_EQ(o.steps, 2u);
     EXPECT_EQ(o.backtracks, 1u);
    )

TEST(literals_beyond_nvars,
     Outcome o = solve(Formula(1, {{5}, {-5, -7}}));
     EXPECT_EQ(o.result, SATISFIABLE);
     EXPECT_EQ(o.model, make_assignment({5, -7}));
    )

// A chain of implications that takes one choice point per variable.
TEST(deep_search,
     const lit_t n = 1000;
     Formula f;
     f.nvars = n;
     for (lit_t i = 1; i < n; ++i) f.clauses.push_back({-i, i + 1});
     Outcome o = solve(f);
     EXPECT_EQ(o.result, SATISFIABLE);
     EXPECT_EQ(o.steps, static_cast<uint64_t>(n));
     EXPECT_EQ(o.backtracks, 0u);
     EXPECT_TRUE(satisfies(f, o.model));
    )

TEST(agrees_with_brute_force,
     init_random(11);
     const double alphas[] = {2.0, 3.5, 4.26, 5.0, 7.0};
     int sat = 0, unsat = 0;
     std::string error;
     for (double alpha : alphas) {
         for (int i = 0; i < 40; ++i) {
             Formula f;
             EXPECT_TRUE(generate_3sat(10, alpha, &f, &error));
             Outcome o = solve(f);
             EXPECT_EQ(o.result == SATISFIABLE, brute_force_sat(f));
             if (o.result == SATISFIABLE) {
                 ++sat;
                 EXPECT_TRUE(satisfies(f, o.model));
             } else {
                 ++unsat;
                 EXPECT_EQ(o.result, UNSATISFIABLE);
             }
         }
     }
     EXPECT_TRUE(sat > 0);
     EXPECT_TRUE(unsat > 0);
    )

TEST(deterministic,
     init_random(12);
     std::string error;
     for (int i = 0; i < 10; ++i) {
         Formula f;
         EXPECT_TRUE(generate_3sat(30, 4.26, &f, &error));
         Outcome a = solve(f);
         Outcome b = solve(f);
         EXPECT_EQ(a.result, b.result);
         EXPECT_EQ(a.model, b.model);
         EXPECT_EQ(a.steps, b.steps);
         EXPECT_EQ(a.backtracks, b.backtracks);
     }
    )

int main(int argc, char** argv) {
    INIT_TEST(argc, argv);
    RUN(worked_example);
    RUN(empty_formula);
    RUN(empty_clause);
    RUN(all_four_clauses_over_two_variables);
    RUN(unit_propagation_alone);
    RUN(contradictory_units);
    RUN(most_frequent_literal_first);
    RUN(ties_go_to_first_seen_literal);
    RUN(step_budget);
    RUN(literals_beyond_nvars);
    RUN(deep_search);
    RUN(agrees_with_brute_force);
    RUN(deterministic);
    return test_failures > 0;
}
