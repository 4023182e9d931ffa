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
#include <cstdlib> // strtod
#include <vector>

#include <petscsys.h>

#include "ncfix/util/ncfix_options.hh"
#include "ncfix/util/error_handling.hh"
#include "ncfix/util/Logger.hh"
#include "ncfix/util/Units.hh"
#include "ncfix/util/ncfix_utilities.hh"
#include "ncfix/ncfix_config.hh"

namespace ncfix {

void show_usage(const Logger &log, const std::string &execname, const std::string &usage) {
  log.message(1, "%s writes analytic NetCDF fixtures for tests.\n\n", execname.c_str());
  log.message(1, usage);
  log.message(1,
              "\nTo run on N processes use 'mpiexec -n N %s ...'.\n"
              "Use '%s -help' to list every recognized option.\n",
              execname.c_str(), execname.c_str());
}

bool show_usage_check_req_opts(const Logger &log,
                               const std::string &execname,
                               const std::vector<std::string> &required_options,
                               const std::string &usage) {
  log.message(3, "%s %s\n", execname.c_str(), ncfix::revision);

  if (options::Bool("-version", "print the version and exit")) {
    log.message(2, ncfix::version());
    return true;
  }

  if (options::Bool("-usage", "print usage and exit")) {
    show_usage(log, execname, usage);
    return true;
  }

  std::vector<std::string> missing;
  for (const auto &name : required_options) {
    if (not options::Bool(name, "required option")) {
      missing.push_back(name);
    }
  }

  if (not missing.empty()) {
    log.error("NCFIX ERROR: missing required option(s) %s\n\n",
              join(missing, ", ").c_str());
    show_usage(log, execname, usage);
    return true;
  }

  if (options::Bool("-help", "print help")) {
    show_usage(log, execname, usage);
  }

  return false;
}

namespace options {

String::String(const std::string& option,
               const std::string& description) {
  process(option, description, "", DONT_ALLOW_EMPTY);
}

String::String(const std::string& option,
               const std::string& description,
               const std::string& default_value,
               ArgumentFlag argument_flag) {
  process(option, description, default_value, argument_flag);
}

void String::process(const std::string& option,
                     const std::string& description,
                     const std::string& default_value,
                     ArgumentFlag argument_flag) {
  // large enough for any path or list given on a command line
  std::vector<char> buffer(16384, '\0');
  PetscBool found = PETSC_FALSE;

  PetscErrorCode ierr = PetscOptionsGetString(NULL, NULL, option.c_str(),
                                              buffer.data(), buffer.size(),
                                              &found);
  NCFIX_CHK(ierr, "PetscOptionsGetString");

  if (found == PETSC_FALSE) {
    set(default_value, false);
    return;
  }

  std::string argument(buffer.data());

  if (argument.empty() and argument_flag == DONT_ALLOW_EMPTY) {
    throw RuntimeError::formatted(NCFIX_ERROR_LOCATION,
                                  "option %s (%s) needs an argument",
                                  option.c_str(), description.c_str());
  }

  set(argument, true);
}

Keyword::Keyword(const std::string& option,
                 const std::string& description,
                 const std::string& choices,
                 const std::string& default_value) {
  if (choices.empty()) {
    throw RuntimeError::formatted(NCFIX_ERROR_LOCATION,
                                  "option %s has no valid choices", option.c_str());
  }

  String input(option, description + " (one of " + choices + ")", default_value);

  if (input.is_set() and not member(input.value(), set_split(choices, ','))) {
    throw RuntimeError::formatted(NCFIX_ERROR_LOCATION,
                                  "option %s: '%s' is not one of [%s]",
                                  option.c_str(), input->c_str(), choices.c_str());
  }

  set(input.value(), input.is_set());
}

Integer::Integer(const std::string& option,
                 const std::string& description,
                 int default_value) {
  String input(option, description);

  if (not input.is_set()) {
    set(default_value, false);
    return;
  }

  try {
    set(parse_integer(input.value()), true);
  } catch (RuntimeError &e) {
    e.add_context("reading option %s", option.c_str());
    throw;
  }
}

Real::Real(std::shared_ptr<units::System> system,
           const std::string& option,
           const std::string& description,
           const std::string& units,
           double default_value) {
  String input(option, description);

  if (not input.is_set()) {
    set(default_value, false);
    return;
  }

  char *end = NULL;
  double number = strtod(input->c_str(), &end);

  if (*end != '\0') {
    // the argument may be a number with units, e.g. "1 day"
    if (units.empty()) {
      throw RuntimeError::formatted(NCFIX_ERROR_LOCATION,
                                    "option %s: '%s' is not a number",
                                    option.c_str(), input->c_str());
    }
    try {
      number = units::convert(system, 1.0, input.value(), units);
    } catch (RuntimeError &e) {
      e.add_context("reading option %s (expected units: %s)",
                    option.c_str(), units.c_str());
      throw;
    }
  }

  set(number, true);
}

bool Bool(const std::string& option,
          const std::string& description) {
  return String(option, description, "", ALLOW_EMPTY).is_set();
}

} // end of namespace options
} // end of namespace ncfix
