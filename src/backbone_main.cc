// Computes the frozen backbone of a DIMACS cnf formula.
//
// Output for a satisfiable formula:
//
//   s SATISFIABLE
//   b 1 -4 7 0
//   c backbone size: 3
//   c rigidity: 0.3
//
// where each literal on the "b" lines is a variable fixed to the given
// polarity in every model.

#include <cstdlib>
#include <string>

#include "backbone.h"
#include "counters.h"
#include "flags.h"
#include "logging.h"
#include "parse.h"
#include "timer.h"

static const char kUsage[] =
    "FILE\n\n"
    "FILE must be in DIMACS cnf format. For a satisfiable formula the\n"
    "backbone is written on \"b\" lines and the program returns 10; an\n"
    "unsatisfiable formula returns 20. If any solver call exceeds\n"
    "--max_steps, the variables that were proved frozen are still written,\n"
    "the undecided ones are listed, and the program returns 0.";

int main(int argc, char** argv) {
    int oidx;
    if (!parse_flags(argc, argv, kUsage, &oidx) || oidx >= argc) {
        PRINT << "c Usage: " << argv[0] << " [OPTIONS]... FILE" << std::endl;
        return EXIT_FAILURE;
    }
    init_counters();
    init_timers();

    Formula f;
    std::string error;
    if (!read_dimacs(argv[oidx], &f, &error)) {
        PRINT << "c " << error << std::endl;
        return EXIT_FAILURE;
    }

    BackboneOptions opts;
    opts.max_steps = FLAGS_max_steps;
    opts.threads = FLAGS_threads;
    BackboneResult r = find_backbone(f, opts);

    PRINT << "c solver calls: " << r.calls.total << " (sat " << r.calls.sat
          << ", unsat " << r.calls.unsat << ", unknown " << r.calls.unknown
          << ")" << std::endl;
    PRINT << "c steps: " << r.steps << std::endl;
    PRINT << "c backtracks: " << r.backtracks << std::endl;
    print_status(r.result);
    if (r.reference.result != SATISFIABLE) return r.result;

    print_assignment(PRINT, 'b', f.nvars, r.frozen, false);
    PRINT << "c backbone size: " << r.frozen.size() << std::endl;
    PRINT << "c rigidity: " << rigidity(r.frozen, f.nvars) << std::endl;
    if (!r.undecided.empty()) {
        PRINT << "c undecided:";
        for (lit_t v : r.undecided) PRINT << " " << v;
        PRINT << std::endl;
    }
    return r.result;
}
