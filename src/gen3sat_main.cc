// Random 3-SAT instances and backbone-labeled datasets.
//
//   gen3sat -n 50 -a 4.26 -s 7          one instance in DIMACS format
//   gen3sat -n 40 -k 10 -o data.json    ten labeled satisfiable samples
//   gen3sat -n 15 -w                    phase-transition sweep

#include <cstdlib>
#include <fstream>
#include <string>
#include <vector>

#include "counters.h"
#include "dataset.h"
#include "flags.h"
#include "generate.h"
#include "logging.h"
#include "params.h"
#include "parse.h"
#include "timer.h"

DEFINE_PARAM(sweep_min_alpha, 3.0,
             "Smallest clause/variable ratio visited by --sweep.");

DEFINE_PARAM(sweep_max_alpha, 6.0,
             "Largest clause/variable ratio visited by --sweep.");

DEFINE_PARAM(sweep_step, 0.2,
             "Increment between the ratios visited by --sweep.");

DEFINE_PARAM(sweep_trials, 20,
             "Random instances solved at each ratio during --sweep.");

DEFINE_PARAM(max_attempts, 0,
             "When generating a dataset, give up after this many instances "
             "have been tried. 0 means keep trying until enough satisfiable "
             "instances are found.");

static const char kUsage[] =
    "\n\n"
    "Without -k or -w, writes one random 3-SAT formula with --nvars variables\n"
    "and round(nvars * alpha) clauses in DIMACS format. With -k K, writes a\n"
    "JSON array of K satisfiable formulas labeled with their frozen backbones.\n"
    "With -w, prints solver behavior across a range of ratios. Diagnostics\n"
    "also go to stdout, so write datasets with -o to keep the JSON clean.";

// Writes text to --output, or to stdout if no output file was given.
static bool write_output(const std::string& text, std::string* error) {
    if (FLAGS_output.empty()) {
        PRINT << text;
        return true;
    }
    std::ofstream out(FLAGS_output);
    out << text;
    out.close();
    if (!out) {
        *error = "Failed to write " + FLAGS_output;
        return false;
    }
    LOG(1) << "Wrote " << text.size() << " bytes to " << FLAGS_output;
    return true;
}

int main(int argc, char** argv) {
    int oidx;
    if (!parse_flags(argc, argv, kUsage, &oidx) || oidx != argc) {
        PRINT << "c Usage: " << argv[0] << " [OPTIONS]..." << std::endl;
        return EXIT_FAILURE;
    }
    init_counters();
    init_timers();

    unsigned long seed = init_random(FLAGS_seed);
    lit_t nvars = static_cast<lit_t>(FLAGS_nvars);
    BackboneOptions opts;
    opts.max_steps = FLAGS_max_steps;
    opts.threads = FLAGS_threads;
    std::string error;

    if (FLAGS_sweep) {
        PRINT << "c seed: " << seed << std::endl;
        std::vector<SweepPoint> points;
        if (!phase_sweep(nvars, PARAM_sweep_min_alpha, PARAM_sweep_max_alpha,
                         PARAM_sweep_step,
                         static_cast<long>(PARAM_sweep_trials), opts,
                         &points, &error)) {
            PRINT << "c " << error << std::endl;
            return EXIT_FAILURE;
        }
        if (!write_output(sweep_table(points), &error)) {
            PRINT << "c " << error << std::endl;
            return EXIT_FAILURE;
        }
        return EXIT_SUCCESS;
    }

    if (FLAGS_samples > 0) {
        std::vector<Sample> samples;
        bool ok = generate_dataset(FLAGS_samples, nvars, FLAGS_alpha, opts,
                                   static_cast<long>(PARAM_max_attempts),
                                   &samples, &error);
        if (!ok) {
            PRINT << "c " << error << std::endl;
            return EXIT_FAILURE;
        }
        LOG(1) << "Generated " << samples.size() << " samples with seed "
               << seed;
        if (!write_output(to_json(samples), &error)) {
            PRINT << "c " << error << std::endl;
            return EXIT_FAILURE;
        }
        return EXIT_SUCCESS;
    }

    Formula f;
    if (!generate_3sat(nvars, FLAGS_alpha, &f, &error)) {
        PRINT << "c " << error << std::endl;
        return EXIT_FAILURE;
    }
    std::string text = "c random 3-SAT, alpha " + std::to_string(FLAGS_alpha) +
        ", seed " + std::to_string(seed) + "\n" + to_dimacs(f);
    if (!write_output(text, &error)) {
        PRINT << "c " << error << std::endl;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
