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
#include <cstdarg>
#include <cstdio>
#include <sstream>

#include <petscsys.h>

#include "ncfix/util/Logger.hh"
#include "ncfix/util/ncfix_options.hh"
#include "ncfix/util/error_handling.hh"

namespace ncfix {

struct Logger::Impl {
  MPI_Comm com;
  int threshold;
  bool enabled;
};

Logger::Logger(MPI_Comm com, int threshold)
  : m_impl(new Impl) {
  m_impl->com       = com;
  m_impl->threshold = threshold;
  m_impl->enabled   = true;
}

Logger::~Logger() {
  // empty
}

bool Logger::accepts(int threshold) const {
  return m_impl->enabled and threshold <= m_impl->threshold;
}

void Logger::message(int threshold, const char format[], ...) const {
  if (not accepts(threshold)) {
    return;
  }

  char buffer[8192];
  va_list args;
  va_start(args, format);
  vsnprintf(buffer, sizeof(buffer), format, args);
  va_end(args);

  message_impl(buffer);
}

void Logger::message(int threshold, const std::string &text) const {
  if (accepts(threshold)) {
    message_impl(text.c_str());
  }
}

void Logger::error(const char format[], ...) const {
  char buffer[8192];
  va_list args;
  va_start(args, format);
  vsnprintf(buffer, sizeof(buffer), format, args);
  va_end(args);

  error_impl(buffer);
}

void Logger::message_impl(const char buffer[]) const {
  PetscErrorCode ierr = PetscFPrintf(m_impl->com, PETSC_STDOUT, "%s", buffer);
  NCFIX_CHK(ierr, "PetscFPrintf");
}

void Logger::error_impl(const char buffer[]) const {
  PetscErrorCode ierr = PetscFPrintf(m_impl->com, stderr, "%s", buffer);
  NCFIX_CHK(ierr, "PetscFPrintf");
}

void Logger::set_threshold(int level) {
  m_impl->threshold = level;
}

int Logger::get_threshold() const {
  return m_impl->threshold;
}

void Logger::disable() const {
  m_impl->enabled = false;
}

void Logger::enable() const {
  m_impl->enabled = true;
}

//! Returns a logger with the threshold given by `-verbose N` (2 if not set).
Logger::Ptr logger_from_options(MPI_Comm com) {
  const int default_threshold = 2;
  options::Integer verbose("-verbose", "verbosity threshold (0 to 5)", default_threshold);

  return Logger::Ptr(new Logger(com, verbose));
}

struct StringLogger::Impl {
  std::ostringstream messages;
  std::ostringstream errors;
};

StringLogger::StringLogger(MPI_Comm com, int threshold)
  : Logger(com, threshold), m_impl(new Impl) {
}

StringLogger::~StringLogger() {
  // empty
}

void StringLogger::message_impl(const char buffer[]) const {
  m_impl->messages << buffer;
}

void StringLogger::error_impl(const char buffer[]) const {
  m_impl->errors << buffer;
}

std::string StringLogger::get() const {
  return m_impl->messages.str();
}

std::string StringLogger::errors() const {
  return m_impl->errors.str();
}

void StringLogger::reset() {
  m_impl->messages.str("");
  m_impl->errors.str("");
}

} // end of namespace ncfix
