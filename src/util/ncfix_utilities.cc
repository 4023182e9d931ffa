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

#include "ncfix/util/ncfix_utilities.hh"

#include <algorithm>            // std::min_element, std::max_element
#include <cstdarg>              // va_list, va_start(), va_end()
#include <sstream>              // istringstream
#include <cstdio>               // vsnprintf
#include <cerrno>               // errno, ERANGE
#include <climits>              // INT_MIN, INT_MAX
#include <cstdlib>              // strtol()
#include <ctime>                // time(), localtime_r(), strftime()

#include <mpi.h>                // MPI_Get_library_version
#include <petscsys.h>           // PetscGetVersion(), PetscGetArgs()

#ifndef MPI_INCLUDED
#define MPI_INCLUDED 1
#endif
#include <netcdf.h>             // nc_inq_libvers

#include "ncfix/ncfix_config.hh" // version info
#include "ncfix/util/error_handling.hh"

namespace ncfix {

bool ends_with(const std::string &str, const std::string &suffix) {
  return str.size() >= suffix.size() and
    std::equal(suffix.rbegin(), suffix.rend(), str.rbegin());
}

//! Concatenate `strings`, inserting `separator` between elements.
std::string join(const std::vector<std::string> &strings, const std::string &separator) {
  std::string result;
  for (size_t k = 0; k < strings.size(); ++k) {
    if (k > 0) {
      result += separator;
    }
    result += strings[k];
  }
  return result;
}

//! Split a `separator`-separated list, dropping empty tokens.
std::vector<std::string> split(const std::string &input, char separator) {
  std::istringstream stream(input);
  std::vector<std::string> result;

  std::string token;
  while (std::getline(stream, token, separator)) {
    if (not token.empty()) {
      result.push_back(token);
    }
  }
  return result;
}

std::set<std::string> set_split(const std::string &input, char separator) {
  auto tokens = split(input, separator);
  return std::set<std::string>(tokens.begin(), tokens.end());
}

bool member(const std::string &string, const std::set<std::string> &set) {
  return set.count(string) > 0;
}

double vector_min(const std::vector<double> &input) {
  return *std::min_element(input.begin(), input.end());
}

double vector_max(const std::vector<double> &input) {
  return *std::max_element(input.begin(), input.end());
}

//! Versions of ncfix and the libraries it uses, one per line.
std::string version() {
  const int buffer_size = 1024;
  char buffer[buffer_size];

  std::string result = printf("ncfix (%s)\n", revision);
  result += printf("CMake %s.\n", cmake_version);

  PetscGetVersion(buffer, buffer_size);
  result += printf("%s\nPETSc configure: %s\n", buffer, petsc_configure_flags);

  int length = buffer_size;
  MPI_Get_library_version(buffer, &length);
  result += printf("%s\n", buffer);

  result += printf("NetCDF %s.\n", nc_inq_libvers());

  return result;
}

//! Current local time ("2000-01-01 00:00:00 UTC") as seen by rank 0.
std::string timestamp(MPI_Comm com) {
  char result[64] = {0};

  time_t now = time(NULL);
  tm tm_now;
  localtime_r(&now, &tm_now);
  strftime(result, sizeof(result), "%F %T %Z", &tm_now);

  MPI_Bcast(result, sizeof(result), MPI_CHAR, 0, com);

  return result;
}

//! "user@host timestamp: ", the prefix of history strings.
std::string username_prefix(MPI_Comm com) {
  char username[64] = {0};
  PetscErrorCode ierr = PetscGetUserName(username, sizeof(username));
  NCFIX_CHK(ierr, "PetscGetUserName");

  char hostname[128] = {0};
  ierr = PetscGetHostName(hostname, sizeof(hostname));
  NCFIX_CHK(ierr, "PetscGetHostName");

  // all ranks have to agree, so use rank 0's user and host names
  MPI_Bcast(username, sizeof(username), MPI_CHAR, 0, com);
  MPI_Bcast(hostname, sizeof(hostname), MPI_CHAR, 0, com);

  return printf("%s@%s %s: ", username, hostname, timestamp(com).c_str());
}

//! The command line, with arguments containing spaces in double quotes.
std::string args_string() {
  int argc = 0;
  char **argv = NULL;
  PetscErrorCode ierr = PetscGetArgs(&argc, &argv);
  NCFIX_CHK(ierr, "PetscGetArgs");

  std::string result;
  for (int j = 0; j < argc; j++) {
    std::string argument = argv[j];

    if (argument.find(' ') != std::string::npos) {
      argument = "\"" + argument + "\"";
    }

    result += " " + argument;
  }

  return result + "\n";
}

std::string printf(const char *format, ...) {
  va_list arglist;

  va_start(arglist, format);
  int length = vsnprintf(NULL, 0, format, arglist);
  va_end(arglist);

  if (length < 0) {
    return "";
  }

  std::vector<char> buffer(length + 1, 0);

  va_start(arglist, format);
  vsnprintf(buffer.data(), buffer.size(), format, arglist);
  va_end(arglist);

  return std::string(buffer.data(), length);
}

int parse_integer(const std::string &input) {
  char *end = NULL;
  errno = 0;
  long int result = strtol(input.c_str(), &end, 10);

  if (input.empty() or *end != '\0') {
    throw RuntimeError::formatted(NCFIX_ERROR_LOCATION,
                                  "Can't parse %s (expected an integer)",
                                  input.c_str());
  }

  if (errno == ERANGE or result < INT_MIN or result > INT_MAX) {
    throw RuntimeError::formatted(NCFIX_ERROR_LOCATION,
                                  "integer %s is out of range [%d, %d]",
                                  input.c_str(), INT_MIN, INT_MAX);
  }

  return static_cast<int>(result);
}

} // end of namespace ncfix
