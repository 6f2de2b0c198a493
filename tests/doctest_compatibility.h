#ifndef DOCTEST_COMPATIBILITY_H
#define DOCTEST_COMPATIBILITY_H

#define DOCTEST_THREAD_LOCAL  // enable single-threaded builds with XCode
#include <doctest/doctest.h>

// Catch-style sections on top of doctest subcases
#define SECTION(name) DOCTEST_SUBCASE(name)

// doctest's CAPTURE does not accept expressions with commas
#undef CAPTURE
#define CAPTURE(x) DOCTEST_CAPTURE(x)

#endif  // DOCTEST_COMPATIBILITY_H
