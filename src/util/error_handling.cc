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
#include "ncfix/util/error_handling.hh"

#include <cstdarg>
#include <cstdio>

#include <petsc.h>

namespace ncfix {

ErrorLocation::ErrorLocation()
  : filename(NULL), line_number(0) {
}

ErrorLocation::ErrorLocation(const char *name, int line)
  : filename(name), line_number(line) {
}

static std::string vformat(const char format[], va_list args) {
  char buffer[8192];
  vsnprintf(buffer, sizeof(buffer), format, args);
  return buffer;
}

RuntimeError::RuntimeError(const ErrorLocation &location, const std::string &message)
  : std::runtime_error(message), m_location(location) {
}

RuntimeError::~RuntimeError() throw() {
}

RuntimeError RuntimeError::formatted(const ErrorLocation &location, const char format[], ...) {
  va_list args;
  va_start(args, format);
  std::string message = vformat(format, args);
  va_end(args);

  return RuntimeError(location, message);
}

void RuntimeError::add_context(const std::string &message) {
  m_context.push_back(message);
}

void RuntimeError::add_context(const char format[], ...) {
  va_list args;
  va_start(args, format);
  std::string message = vformat(format, args);
  va_end(args);

  m_context.push_back(message);
}

const std::vector<std::string>& RuntimeError::context() const {
  return m_context;
}

//! Replaces each newline in `text` with a newline followed by `indent`.
static std::string indent_lines(const std::string &text, const std::string &indent) {
  std::string result;
  for (char c : text) {
    result += c;
    if (c == '\n') {
      result += indent;
    }
  }
  return result;
}

void RuntimeError::print(MPI_Comm com) {
  const std::string prefix = "NCFIX ERROR: ";
  const std::string margin(prefix.size(), ' ');

  PetscErrorCode ierr = PetscPrintf(com, "%s%s\n", prefix.c_str(),
                                    indent_lines(what(), margin).c_str());
  CHKERRCONTINUE(ierr);

  // context messages are printed from the innermost to the outermost
  const std::string while_prefix = margin + "while ";
  for (const auto &message : m_context) {
    ierr = PetscPrintf(com, "%s%s\n", while_prefix.c_str(),
                       indent_lines(message, margin + "       ").c_str());
    CHKERRCONTINUE(ierr);
  }

  if (m_location.filename != NULL) {
    ierr = PetscPrintf(com, "%s(thrown at %s:%d)\n", margin.c_str(),
                       m_location.filename, m_location.line_number);
    CHKERRCONTINUE(ierr);
  }
}

/** Prints a description of the exception currently being handled.
 *
 * Call from a `catch (...)` block in `main()` only.
 */
void handle_fatal_errors(MPI_Comm com) {
  try {
    throw;
  } catch (RuntimeError &e) {
    e.print(com);
  } catch (std::exception &e) {
    PetscErrorCode ierr = PetscPrintf(PETSC_COMM_SELF,
                                      "NCFIX ERROR: unexpected exception: \"%s\"\n",
                                      e.what());
    CHKERRCONTINUE(ierr);
  } catch (...) {
    PetscErrorCode ierr = PetscPrintf(PETSC_COMM_SELF,
                                      "NCFIX ERROR: unexpected exception of unknown type\n");
    CHKERRCONTINUE(ierr);
  }
}

void check_petsc_call(int errcode,
                      const char* function_name, const char *file, int line) {
  if (errcode == 0) {
    return;
  }
  // let PETSc print its own error stack first
  CHKERRCONTINUE(errcode);
  throw RuntimeError::formatted(ErrorLocation(file, line),
                                "PETSc call %s failed (error code %d)",
                                function_name, errcode);
}

} // end of namespace ncfix
