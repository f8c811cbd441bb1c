#ifndef __TIMER_H__
#define __TIMER_H__

#include <signal.h>

#include <cmath>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <map>
#include <sstream>
#include <string>

#include "logging.h"
#include "types.h"

#ifndef TIMERS
#define TIMERS 0
#endif

extern bool FLAGS_time;

// Accumulates CPU time per named section. Like the counters, timers are only
// started and stopped on the main thread.
class Timers {
public:
    void start(const char* name) {
        start_[name] = clock();
    }

    void stop(const char* name) {
        clock_t start = start_[name];
        clock_t end = clock();
        sums_[name] += static_cast<double>(end - start) / CLOCKS_PER_SEC;
        counts_[name]++;
    }

    void reset(const char* name) {
        start_.erase(name);
    }

    void stop_all() {
        for (const auto& kv : start_) { stop(kv.first); }
    }

    void print() {
        for (const auto& kv : sums_) {
            PRINT << "c timer: [" << kv.first << "] = "
                  << fancy_time(kv.second);
            if (counts_[kv.first] > 1) {
                PRINT << " (avg: " << fancy_time(kv.second / counts_[kv.first])
                      << ", n: " << counts_[kv.first] << ")";
            }
            PRINT << std::endl;
        }
    }

    void dump() {
        stop_all();
        print();
        start_.clear();
        sums_.clear();
        counts_.clear();
    }

    static std::string fancy_time(double t) {
        std::ostringstream oss;
        if (t < (1.0 / 1000)) {
            oss << std::fixed << std::setprecision(0) << t * 1000000 << "us";
        } else if (t < 1) {
            oss << std::fixed << std::setprecision(0) << t * 1000 << "ms";
        } else if (t < 60) {
            oss << std::fixed << std::setprecision(1) << t << "s";
        } else {
            oss << std::fixed << std::setprecision(0) << floor(t / 60) << "m "
                << fmod(t, 60) << "s";
        }
        return oss.str();
    }

    static Timers& singleton() {
        static Timers s;
        return s;
    }
private:
    std::map<const char*, clock_t, cstrcmp> start_;
    std::map<const char*, double, cstrcmp> sums_;
    std::map<const char*, uint64_t, cstrcmp> counts_;
};

class Timer {
public:
    explicit Timer(const char* name) : name_(name) {
        if (!TIMERS) return;
        if (!FLAGS_time) return;
        Timers::singleton().start(name_);
    }
    ~Timer() {
        if (!TIMERS) return;
        if (!FLAGS_time) return;
        Timers::singleton().stop(name_);
        Timers::singleton().reset(name_);
    }
private:
    const char* name_;
};

inline void init_timers() {
    if (!TIMERS) return;
    if (!FLAGS_time) return;
    Timers::singleton();
    std::atexit([]{ Timers::singleton().dump(); });
    struct sigaction sigbreak;
    sigbreak.sa_handler = [](int) {
        Timers::singleton().dump(); exit(UNKNOWN);
    };
    sigemptyset(&sigbreak.sa_mask);
    sigbreak.sa_flags = 0;
    CHECK(sigaction(SIGINT, &sigbreak, NULL) == 0);
}

#endif  // __TIMER_H__
