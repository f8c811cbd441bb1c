// Minimal test harness. Each *_test.cc file is its own executable:
//
//   TEST(empty_formula,
//        Outcome o = solve(Formula());
//        EXPECT_EQ(o.result, SATISFIABLE);
//       )
//
//   int main(int argc, char** argv) {
//       INIT_TEST(argc, argv);
//       RUN(empty_formula);
//       return test_failures > 0;
//   }
//
// Failed expectations are logged and counted, and the test keeps running.
// Commas are fine inside a TEST body; an EXPECT argument that contains a
// top-level comma, such as a braced initializer, needs extra parentheses.

#ifndef __TEST_H__
#define __TEST_H__

#include <cstdlib>

#include "flags.h"
#include "logging.h"

static int test_failures = 0;

#define EXPECT_TRUE(x) if (!(x)) { \
    ++test_failures; \
    PRINT << "c [FAILED " << __FILE__ << ":" << __LINE__ << "] " \
          << #x << std::endl; }
#define EXPECT_FALSE(x) EXPECT_TRUE(!(x))
#define EXPECT_EQ(x,y) if ((x) != (y)) { \
    ++test_failures; \
    PRINT << "c [FAILED " << __FILE__ << ":" << __LINE__ << "] " \
          << #x << " != " << #y << std::endl; }
#define TEST(x, ...) static void test_##x() \
    { LOG(1) << "--------- Running " << __func__ << " ---------" ; \
      __VA_ARGS__ \
      LOG(3) << "--------- Finished " << __func__ << " ---------"; }
#define RUN(x) test_##x()
#define INIT_TEST(argc, argv) \
    int oidx; \
    CHECK(parse_flags(argc, argv, "", &oidx)) << \
        "Usage: " << argv[0] << " [OPTIONS]..."; \
    PRINT << "c Running all tests. No output below means everything " \
          << "passes." << std::endl

#endif  // __TEST_H__
