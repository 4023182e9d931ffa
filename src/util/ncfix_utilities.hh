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

#ifndef NCFIX_UTILITIES_H
#define NCFIX_UTILITIES_H

#include <set>
#include <string>
#include <vector>

#include <mpi.h>

namespace ncfix {

#ifndef __GNUC__
#  define  __attribute__(x)  /* nothing */
#endif

std::string timestamp(MPI_Comm com);
std::string username_prefix(MPI_Comm com);
std::string args_string();

// strings
bool ends_with(const std::string &str, const std::string &suffix);

std::string join(const std::vector<std::string> &strings, const std::string &separator);

std::vector<std::string> split(const std::string &input, char separator);

std::set<std::string> set_split(const std::string &input, char separator);

bool member(const std::string &string, const std::set<std::string> &set);

// `input` has to be non-empty
double vector_min(const std::vector<double> &input);
double vector_max(const std::vector<double> &input);

std::string version();

std::string printf(const char *format, ...) __attribute__((format(printf, 1, 2)));

//! Parses a base-10 `int`. Trailing characters and out-of-range values are errors.
int parse_integer(const std::string &input);

} // end of namespace ncfix


#endif /* NCFIX_UTILITIES_H */
