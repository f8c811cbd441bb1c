#include "dataset.h"

#include <iomanip>
#include <sstream>

#include <nlohmann/json.hpp>

#include "counters.h"
#include "generate.h"
#include "logging.h"
#include "timer.h"

bool generate_dataset(long nsamples, lit_t nvars, double alpha,
                      const BackboneOptions& opts, long max_attempts,
                      std::vector<Sample>* out, std::string* error) {
    Timer t("generate_dataset");
    long attempts = 0;
    while (static_cast<long>(out->size()) < nsamples) {
        if (max_attempts > 0 && attempts >= max_attempts) {
            std::ostringstream oss;
            oss << "found only " << out->size() << " of " << nsamples
                << " satisfiable samples in " << attempts << " attempts";
            *error = oss.str();
            return false;
        }
        ++attempts;
        INC(dataset_attempts);

        Formula f;
        if (!generate_3sat(nvars, alpha, &f, error)) return false;
        BackboneResult b = find_backbone(f, opts);
        if (b.result == UNSATISFIABLE) {
            LOG(1) << "Attempt " << attempts << ": UNSAT (skipping)";
            INC(dataset_unsat);
            continue;
        }
        if (b.result != SATISFIABLE) {
            LOG(1) << "Attempt " << attempts << ": undecided within "
                   << opts.max_steps << " steps (skipping)";
            INC(dataset_unknown);
            continue;
        }

        Sample s;
        s.id = static_cast<long>(out->size());
        s.nvars = nvars;
        s.alpha = alpha;
        s.clauses = std::move(f.clauses);
        s.backbone = std::move(b.frozen);
        s.backbone_size = s.backbone.size();
        s.rigidity = rigidity(s.backbone, nvars);
        LOG(1) << "Generated sample " << s.id + 1 << "/" << nsamples
               << " (rigidity: " << s.rigidity << ")";
        out->push_back(std::move(s));
    }
    return true;
}

std::string to_json(const Sample& s) {
    nlohmann::ordered_json backbone = nlohmann::ordered_json::object();
    for (const auto& kv : s.backbone) {
        backbone[std::to_string(kv.first)] = kv.second;
    }
    nlohmann::ordered_json j;
    j["id"] = s.id;
    j["n_vars"] = s.nvars;
    j["alpha"] = s.alpha;
    j["clauses"] = s.clauses;
    j["backbone"] = backbone;
    j["backbone_size"] = s.backbone_size;
    j["rigidity"] = s.rigidity;
    return j.dump();
}

std::string to_json(const std::vector<Sample>& samples) {
    std::ostringstream oss;
    oss << "[";
    for (std::size_t i = 0; i < samples.size(); ++i) {
        oss << (i > 0 ? ",\n  " : "\n  ") << to_json(samples[i]);
    }
    oss << (samples.empty() ? "]" : "\n]") << "\n";
    return oss.str();
}

bool phase_sweep(lit_t nvars, double min_alpha, double max_alpha, double step,
                 long trials, const BackboneOptions& opts,
                 std::vector<SweepPoint>* out, std::string* error) {
    if (!(min_alpha > 0) || !(max_alpha >= min_alpha) || !(step > 0) ||
        trials <= 0) {
        std::ostringstream oss;
        oss << "invalid sweep: alpha " << min_alpha << ".." << max_alpha
            << " step " << step << ", " << trials << " trials";
        *error = oss.str();
        return false;
    }
    Timer t("phase_sweep");
    // Step by index rather than accumulating step, so that the end of the
    // range is not lost to rounding.
    const double kTolerance = 1e-9;
    for (long i = 0; min_alpha + i * step <= max_alpha + kTolerance; ++i) {
        SweepPoint p;
        p.alpha = min_alpha + i * step;
        p.trials = trials;
        uint64_t total_steps = 0;
        long sat = 0;
        long decided = 0;
        double total_rigidity = 0;
        for (long k = 0; k < trials; ++k) {
            Formula f;
            if (!generate_3sat(nvars, p.alpha, &f, error)) return false;
            BackboneResult b = find_backbone(f, opts);
            total_steps += b.reference.steps;
            if (b.reference.steps > p.max_steps) {
                p.max_steps = b.reference.steps;
            }
            if (b.reference.result == SATISFIABLE) ++sat;
            if (b.reference.result == UNKNOWN) ++p.unknown;
            if (b.result == SATISFIABLE) {
                ++decided;
                total_rigidity += rigidity(b.frozen, nvars);
            }
        }
        p.avg_steps = static_cast<double>(total_steps) / trials;
        p.sat_ratio = static_cast<double>(sat) / trials;
        p.avg_rigidity = decided > 0 ? total_rigidity / decided : 0;
        LOG(1) << "alpha " << p.alpha << ": " << sat << "/" << trials
               << " satisfiable, avg steps " << p.avg_steps;
        out->push_back(p);
    }
    return true;
}

std::string sweep_table(const std::vector<SweepPoint>& points) {
    std::ostringstream oss;
    oss << "c " << std::setw(6) << "alpha" << std::setw(8) << "trials"
        << std::setw(12) << "avg_steps" << std::setw(12) << "max_steps"
        << std::setw(10) << "sat" << std::setw(9) << "unknown"
        << std::setw(10) << "rigidity" << "\n";
    for (const SweepPoint& p : points) {
        oss << "c " << std::fixed << std::setprecision(2)
            << std::setw(6) << p.alpha << std::setw(8) << p.trials
            << std::setprecision(1) << std::setw(12) << p.avg_steps
            << std::setw(12) << p.max_steps
            << std::setprecision(3) << std::setw(10) << p.sat_ratio
            << std::setw(9) << p.unknown
            << std::setw(10) << p.avg_rigidity << "\n";
    }
    return oss.str();
}
