// Decides a DIMACS cnf formula with DPLL and prints the result in the format
// of the SAT competition.

#include <cstdlib>
#include <string>

#include "counters.h"
#include "dpll.h"
#include "flags.h"
#include "logging.h"
#include "parse.h"
#include "timer.h"

static const char kUsage[] =
    "FILE\n\n"
    "FILE must be in DIMACS cnf format. If the input formula is satisfiable,\n"
    "\"s SATISFIABLE\" and a model are written to stdout and the program\n"
    "returns 10. If the input formula is unsatisfiable, \"s UNSATISFIABLE\"\n"
    "is written to stdout and the program returns 20. If the search exceeds\n"
    "--max_steps, \"s UNKNOWN\" is written and the program returns 0.";

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
    LOG(1) << "Read " << f.nvars << " variables and " << f.clauses.size()
           << " clauses from " << argv[oidx];

    Outcome o;
    {
        Timer t("solve");
        o = solve(f, FLAGS_max_steps);
    }
    INC(solver_steps, o.steps);
    INC(solver_backtracks, o.backtracks);

    PRINT << "c steps: " << o.steps << std::endl;
    PRINT << "c backtracks: " << o.backtracks << std::endl;
    print_status(o.result);
    if (o.result == SATISFIABLE) {
        print_assignment(PRINT, 'v', f.nvars, o.model, true);
    }
    return o.result;
}
