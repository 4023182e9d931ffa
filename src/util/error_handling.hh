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

#ifndef _NCFIX_ERROR_HANDLING_H_
#define _NCFIX_ERROR_HANDLING_H_

#include <mpi.h>                // MPI_Comm
#include <stdexcept>
#include <string>
#include <vector>

namespace ncfix {

//! Source location of a `throw`, recorded in debug builds only.
class ErrorLocation {
public:
  ErrorLocation();
  ErrorLocation(const char *name, int line);
  const char *filename;
  int line_number;
};

#if NCFIX_DEBUG==1
#define NCFIX_ERROR_LOCATION ncfix::ErrorLocation(__FILE__, __LINE__)
#else
#define NCFIX_ERROR_LOCATION ncfix::ErrorLocation()
#endif

class RuntimeError : public std::runtime_error {
public:
  RuntimeError(const ErrorLocation &location, const std::string &message);
  ~RuntimeError() throw();

  static RuntimeError formatted(const ErrorLocation &location, const char format[], ...) __attribute__((format(printf, 2, 3)));

  //! Appends a "while ..." line to the report. Callers add context as the
  //! exception propagates, so the list reads from innermost to outermost.
  void add_context(const std::string &message);
  void add_context(const char format[], ...) __attribute__((format(printf, 2, 3)));

  const std::vector<std::string>& context() const;

  void print(MPI_Comm com);
protected:
  std::vector<std::string> m_context;
  ErrorLocation m_location;
};

void handle_fatal_errors(MPI_Comm com);

void check_petsc_call(int errcode, const char* function_name,
                      const char *file, int line);

#define NCFIX_CHK(errcode,name) do { ncfix::check_petsc_call(errcode, name, __FILE__, __LINE__); } while (0)

} // end of namespace ncfix

#endif /* _NCFIX_ERROR_HANDLING_H_ */
