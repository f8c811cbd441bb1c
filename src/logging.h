#ifndef __LOGGING_H__
#define __LOGGING_H__

#include <iostream>
#include <string>

#include "types.h"

extern int FLAGS_verbosity;

#ifndef LOGGING
#define LOGGING 0
#endif

#define LOG_ENABLED(i) (LOGGING && FLAGS_verbosity >= i)
#define LOG(i) if (LOG_ENABLED(i)) Logger(__FILE__,__LINE__)
#define CHECK(expr) if (!(expr)) AbortLogger(__FILE__,__LINE__)
#define PRINT std::cout

struct Logger {
    Logger(const std::string& filename, int line) {
        PRINT << "c [" << filename << ":" << line << "] ";
    }

    ~Logger() { PRINT << std::endl; }

    template<class T>
    Logger& operator<<(const T& msg) {
        PRINT << msg;
        return *this;
    }
};

struct AbortLogger {
    AbortLogger(const std::string& filename, int line) {
        PRINT << "s UNKNOWN" << std::endl;
        PRINT << "c [FATAL " << filename << ":" << line << "] ";
    }

    ~AbortLogger() {
        PRINT << std::endl;
        exit(EXIT_FAILURE);
    }

    template<class T>
    AbortLogger& operator<<(const T& msg) {
        PRINT << msg;
        return *this;
    }
};

// Prints the status line for r in the format of the SAT competition.
inline void print_status(ReturnValue r) {
    switch (r) {
    case SATISFIABLE: PRINT << "s SATISFIABLE" << std::endl; break;
    case UNSATISFIABLE: PRINT << "s UNSATISFIABLE" << std::endl; break;
    default: PRINT << "s UNKNOWN" << std::endl; break;
    }
}

#endif  // __LOGGING_H__
