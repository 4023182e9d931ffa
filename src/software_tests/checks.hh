/* Copyright (C) 2026 ncfix Authors
 *
 * This file is part of ncfix.
 *
 * ncfix is free software; you can redistribute it and/or modify it under the
 * terms of the GNU General Public License as published by the Free Software
 * Foundation; either version 3 of the License, or (at your option) any later
 * version.
 *
 * ncfix is distributed in the hope that it will be useful, but WITHOUT ANY
 * WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS
 * FOR A PARTICULAR PURPOSE.  See the GNU General Public License for more
 * details.
 *
 * You should have received a copy of the GNU General Public License
 * along with ncfix; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin St, Fifth Floor, Boston, MA  02110-1301  USA
 */

#ifndef NCFIX_SOFTWARE_TESTS_CHECKS_H
#define NCFIX_SOFTWARE_TESTS_CHECKS_H

#include <cmath>
#include <string>
#include <vector>

#include "ncfix/util/error_handling.hh"

namespace ncfix {
namespace testing {

inline void check(bool condition, const ErrorLocation &location, const char *expression) {
  if (not condition) {
    throw RuntimeError::formatted(location, "check failed: %s", expression);
  }
}

inline void check_close(double a, double b, double tolerance,
                        const ErrorLocation &location, const char *expression) {
  if (not (std::fabs(a - b) <= tolerance)) {
    throw RuntimeError::formatted(location, "check failed: %s (%.17g != %.17g, tolerance %g)",
                                  expression, a, b, tolerance);
  }
}

//! Runs `code`, which is expected to throw RuntimeError, and returns the error.
template <typename F>
RuntimeError expect_failure(const ErrorLocation &location, const char *description, F code) {
  try {
    code();
  } catch (RuntimeError &e) {
    return e;
  }
  throw RuntimeError::formatted(location, "%s did not fail", description);
}

//! Returns true if one of the context messages of `e` contains `text`.
inline bool context_contains(const RuntimeError &e, const std::string &text) {
  for (const auto &c : e.context()) {
    if (c.find(text) != std::string::npos) {
      return true;
    }
  }
  return false;
}

} // end of namespace testing
} // end of namespace ncfix

#define NCFIX_CHECK(condition)                                          \
  ncfix::testing::check((condition), NCFIX_ERROR_LOCATION, #condition)

#define NCFIX_CHECK_CLOSE(a, b, tolerance)                              \
  ncfix::testing::check_close((a), (b), (tolerance), NCFIX_ERROR_LOCATION, #a " == " #b)

#define NCFIX_EXPECT_FAILURE(description, code)                         \
  ncfix::testing::expect_failure(NCFIX_ERROR_LOCATION, description, code)

#endif /* NCFIX_SOFTWARE_TESTS_CHECKS_H */
