#pragma once

// Test support helpers.
//
// Release builds usually define NDEBUG, which would compile assert() away and
// turn every test into a no-op. Tests include this header and keep writing
// assert(expr); the macro is replaced with an always-on check that reports the
// failing expression on stderr and exits non-zero.

#include <cassert>  // bring in the standard macro (and its header guard)

#include <cstdlib>
#include <exception>
#include <iostream>

namespace neurosync_test {

inline void fail(const char* expr, const char* file, int line) {
  std::cerr << "Test assertion failed: " << expr << " (" << file << ":" << line << ")\n";
  std::exit(1);
}

// Runs fn and reports whether it threw an exception of type E.
template <typename E, typename Fn>
bool throws_as(Fn&& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  } catch (const std::exception& e) {
    std::cerr << "unexpected exception: " << e.what() << "\n";
    return false;
  }
  return false;
}

} // namespace neurosync_test

#ifndef NEUROSYNC_TEST_ASSERT
#define NEUROSYNC_TEST_ASSERT(expr) \
  (static_cast<bool>(expr) ? (void)0 : ::neurosync_test::fail(#expr, __FILE__, __LINE__))
#endif

#ifdef assert
#undef assert
#endif
#define assert(expr) NEUROSYNC_TEST_ASSERT(expr)

#ifndef TEST_CHECK
#define TEST_CHECK(expr) NEUROSYNC_TEST_ASSERT(expr)
#endif
