#ifndef __FLAGS_H__
#define __FLAGS_H__

#include <cstdint>
#include <string>

// To add and use a new flag:
// (1) Define it and its default in flags.cc as FLAGS_xxx = default.
// (2) Declare an extern reference to it below.
// (3) Add an entry to long_options[] and optstring[] in flags.cc.
// (4) Add a case in the switch statement in parse_flags to set the flag.
// (5) Add a sentence to the help text displayed with -h.

extern int FLAGS_verbosity;
extern unsigned long FLAGS_seed;
extern bool FLAGS_time;
extern bool FLAGS_counters;
extern uint64_t FLAGS_max_steps;
extern int FLAGS_threads;
extern long FLAGS_nvars;
extern double FLAGS_alpha;
extern long FLAGS_samples;
extern bool FLAGS_sweep;
extern std::string FLAGS_output;

// Parses command-line flags into the FLAGS_ globals. usage is the
// tool-specific paragraph printed by -h. Returns false on an unknown flag or
// a malformed value; on success *option_index is the index of the first
// positional argument.
bool parse_flags(int argc, char* argv[], const char* usage,
                 int* option_index);

#endif  // __FLAGS_H__
