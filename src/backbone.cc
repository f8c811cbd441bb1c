#include "backbone.h"

#include <algorithm>
#include <atomic>
#include <thread>

#include "counters.h"
#include "logging.h"
#include "timer.h"

// Per-worker totals, summed by the calling thread after all workers join.
struct WorkerStats {
    WorkerStats() : steps(0), backtracks(0) {}
    uint64_t steps;
    uint64_t backtracks;
};

static void record(ReturnValue verdict, BackboneResult* r) {
    ++r->calls.total;
    switch (verdict) {
    case SATISFIABLE: ++r->calls.sat; break;
    case UNSATISFIABLE: ++r->calls.unsat; break;
    default: ++r->calls.unknown; break;
    }
}

BackboneResult find_backbone(const Formula& f, const BackboneOptions& opts) {
    Timer t("find_backbone");
    BackboneResult r;

    r.reference = solve(f, opts.max_steps);
    r.steps = r.reference.steps;
    r.backtracks = r.reference.backtracks;
    record(r.reference.result, &r);
    if (r.reference.result != SATISFIABLE) {
        LOG(1) << "Reference solve returned " << r.reference.result
               << ", no backbone to compute.";
        r.result = r.reference.result;
        return r;
    }

    const Assignment& model = r.reference.model;
    std::vector<lit_t> candidates;
    candidates.reserve(model.size());
    for (const auto& kv : model) candidates.push_back(kv.first);

    // Refutation i asserts the opposite of candidate i's model value. Each
    // worker claims indexes from next and writes only verdicts[i] and its own
    // stats entry; f and model are only read.
    std::vector<ReturnValue> verdicts(candidates.size(), UNKNOWN);
    int nworkers = static_cast<int>(std::min<std::size_t>(
        std::max(1, opts.threads), candidates.size()));
    if (nworkers < 1) nworkers = 1;
    std::vector<WorkerStats> stats(nworkers);
    std::atomic<std::size_t> next(0);
    auto worker = [&](int w) {
        for (std::size_t i = next++; i < candidates.size(); i = next++) {
            lit_t v = candidates[i];
            lit_t flip = model.at(v) ? -v : v;
            Outcome o = solve(f.with_clause(Clause(1, flip)), opts.max_steps);
            verdicts[i] = o.result;
            stats[w].steps += o.steps;
            stats[w].backtracks += o.backtracks;
        }
    };

    LOG(1) << "Testing " << candidates.size() << " variables on " << nworkers
           << " thread(s)";
    if (nworkers == 1) {
        worker(0);
    } else {
        std::vector<std::thread> threads(nworkers);
        for (int i = 0; i < nworkers; ++i) {
            threads[i] = std::thread([&, i]() { worker(i); });
        }
        for (auto& th : threads) {
            th.join();
        }
    }

    for (const WorkerStats& s : stats) {
        r.steps += s.steps;
        r.backtracks += s.backtracks;
    }
    for (std::size_t i = 0; i < candidates.size(); ++i) {
        lit_t v = candidates[i];
        record(verdicts[i], &r);
        if (verdicts[i] == UNSATISFIABLE) {
            LOG(2) << v << " is frozen to " << model.at(v);
            r.frozen[v] = model.at(v);
        } else if (verdicts[i] == UNKNOWN) {
            LOG(2) << v << " ran out of budget";
            r.undecided.push_back(v);
        }
    }
    r.result = r.undecided.empty() ? SATISFIABLE : UNKNOWN;

    INC(backbone_calls);
    INC(backbone_refutations, candidates.size());
    INC(backbone_frozen, r.frozen.size());
    INC(backbone_solver_steps, r.steps);
    LOG(1) << "Backbone has " << r.frozen.size() << " of " << f.nvars
           << " variables, " << r.calls.total << " solver calls";
    return r;
}

double rigidity(const Backbone& backbone, lit_t nvars) {
    if (nvars <= 0) return 0;
    return static_cast<double>(backbone.size()) / nvars;
}
