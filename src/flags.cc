#include "flags.h"

#include <getopt.h>

#include <cstdlib>
#include <iostream>
#include <limits>

#include "logging.h"
#include "params.h"

int FLAGS_verbosity = 0;
unsigned long FLAGS_seed = 0;
bool FLAGS_time = false;
bool FLAGS_counters = false;
uint64_t FLAGS_max_steps = 0;
int FLAGS_threads = 1;
long FLAGS_nvars = 50;
double FLAGS_alpha = 4.26;
long FLAGS_samples = 0;
bool FLAGS_sweep = false;
std::string FLAGS_output = "";

// Parses optarg as a base-10 integer in [lo, hi]. Returns false if optarg has
// trailing garbage or is out of range.
static bool parse_long(const char* name, long lo, long hi, long* out) {
    char* end = nullptr;
    long v = strtol(optarg, &end, 10);
    if (*optarg == '\0' || *end != '\0' || v < lo || v > hi) {
        std::cerr << "c Invalid value for --" << name << ": '" << optarg
                  << "' (expected an integer in [" << lo << ", " << hi
                  << "])" << std::endl;
        return false;
    }
    *out = v;
    return true;
}

bool parse_flags(int argc, char* argv[], const char* usage,
                 int* option_index) {
    *option_index = 0;
    int c;
    long v = 0;
    char* end = nullptr;
    std::string error;

    struct option long_options[] = {
        { "verbosity",      required_argument,  NULL, 'v' },
        { "seed",           required_argument,  NULL, 's' },
        { "time",           no_argument,        NULL, 't' },
        { "counters",       no_argument,        NULL, 'c' },
        { "help",           no_argument,        NULL, 'h' },
        { "params",         required_argument,  NULL, 'p' },
        { "max_steps",      required_argument,  NULL, 'm' },
        { "threads",        required_argument,  NULL, 'j' },
        { "nvars",          required_argument,  NULL, 'n' },
        { "alpha",          required_argument,  NULL, 'a' },
        { "samples",        required_argument,  NULL, 'k' },
        { "sweep",          no_argument,        NULL, 'w' },
        { "output",         required_argument,  NULL, 'o' },
        { 0, 0, 0, 0}
    };

    char optstring[] = "v:s:p:m:j:n:a:k:o:tchw";

    // Allow parse_flags to be called more than once, e.g. from tests. Setting
    // optind to 0 makes glibc reset all of its scanning state.
    optind = 0;
    while (1) {
        c = getopt_long(argc, argv, optstring, long_options, nullptr);
        if (c == -1)
            break;

        switch (c) {
        case 'h':
            PRINT << "Usage: " << argv[0] << " [OPTIONS]... "
                  << (usage ? usage : "") << std::endl << std::endl;
            PRINT << "OPTIONS include:" << std::endl << std::endl;
            PRINT << "  -sN    Set the random seed to N (0 picks one from the "
                  << "clock)" << std::endl << std::endl;
            PRINT << "  -vN    Set the verbosity to N" << std::endl
                  << std::endl;
            PRINT << "  -t     Collect and print timing information"
                  << std::endl << std::endl;
            PRINT << "  -c     Collect and print counters" << std::endl
                  << std::endl;
            PRINT << "  -mN    Give up on each solver call after N search "
                  << "nodes (0: no limit)" << std::endl << std::endl;
            PRINT << "  -jN    Run backbone refutations on N threads"
                  << std::endl << std::endl;
            PRINT << "  -nN    Number of variables in generated instances"
                  << std::endl << std::endl;
            PRINT << "  -aX    Clause/variable ratio of generated instances"
                  << std::endl << std::endl;
            PRINT << "  -kK    Generate a dataset of K satisfiable samples"
                  << std::endl << std::endl;
            PRINT << "  -w     Run a phase-transition sweep" << std::endl
                  << std::endl;
            PRINT << "  -oF    Write output to file F instead of stdout"
                  << std::endl << std::endl;
            PRINT << "  -h     Display this message" << std::endl << std::endl;
            if (!Params::singleton().empty()) {
                PRINT << "  -p     Set various double-valued params. Param "
                      << "overrides must be provided as" << std::endl
                      << "         key=value pairs, separated by semicolons. "
                      << "Example: \"foo=1.0;bar=2.0\"." << std::endl
                      << "         Available params include:" << std::endl
                      << std::endl;
                PRINT << Params::singleton().help_string();
            }
            exit(0);
            break;
        case 'v':
            if (!parse_long("verbosity", 0, 100, &v)) return false;
            FLAGS_verbosity = static_cast<int>(v);
            PRINT << "c Setting verbosity = " << FLAGS_verbosity
                  << std::endl;
            break;
        case 's':
            if (!parse_long("seed", 0, std::numeric_limits<unsigned int>::max(),
                            &v)) {
                return false;
            }
            FLAGS_seed = static_cast<unsigned long>(v);
            PRINT << "c Setting random seed = " << FLAGS_seed
                  << std::endl;
            break;
        case 'p':
            if (!Params::singleton().parse(optarg, &error)) {
                std::cerr << "c " << error << std::endl;
                return false;
            }
            break;
        case 't':
            PRINT << "c Timing enabled" << std::endl;
            FLAGS_time = true;
            break;
        case 'c':
            PRINT << "c Counters enabled" << std::endl;
            FLAGS_counters = true;
            break;
        case 'm':
            if (!parse_long("max_steps", 0, std::numeric_limits<long>::max(),
                            &v)) {
                return false;
            }
            FLAGS_max_steps = static_cast<uint64_t>(v);
            break;
        case 'j':
            if (!parse_long("threads", 1, 1024, &v)) return false;
            FLAGS_threads = static_cast<int>(v);
            break;
        case 'n':
            if (!parse_long("nvars", 0, std::numeric_limits<lit_t>::max(),
                            &v)) {
                return false;
            }
            FLAGS_nvars = v;
            break;
        case 'a':
            FLAGS_alpha = strtod(optarg, &end);
            if (*optarg == '\0' || *end != '\0') {
                std::cerr << "c Invalid value for --alpha: '" << optarg
                          << "'" << std::endl;
                return false;
            }
            break;
        case 'k':
            if (!parse_long("samples", 0, std::numeric_limits<long>::max(),
                            &v)) {
                return false;
            }
            FLAGS_samples = v;
            break;
        case 'w':
            FLAGS_sweep = true;
            break;
        case 'o':
            FLAGS_output = optarg;
            break;
        default:
            return false;
        }
    }
    *option_index = optind;
    return true;
}
