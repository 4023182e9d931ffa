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

#ifndef _NCFIX_LOGGER_H_
#define _NCFIX_LOGGER_H_

#include <string>
#include <memory>

#include <mpi.h>                // MPI_Comm

namespace ncfix {

//! Verbosity-filtered output printed on rank 0.
/**
 * A message is printed if its threshold does not exceed the logger's
 * threshold. Errors are printed regardless of the threshold.
 */
class Logger {
public:
  Logger(MPI_Comm com, int threshold);
  virtual ~Logger();

  typedef std::shared_ptr<Logger> Ptr;
  typedef std::shared_ptr<const Logger> ConstPtr;

  void message(int threshold, const char format[], ...) const __attribute__((format(printf, 3, 4)));
  void message(int threshold, const std::string &text) const;

  //! Prints to stderr in the base class.
  void error(const char format[], ...) const __attribute__((format(printf, 2, 3)));

  void set_threshold(int level);
  int get_threshold() const;

  void disable() const;
  void enable() const;
protected:
  virtual void message_impl(const char buffer[]) const;
  virtual void error_impl(const char buffer[]) const;
private:
  bool accepts(int threshold) const;

  struct Impl;
  std::unique_ptr<Impl> m_impl;
  Logger(const Logger&);
  Logger & operator=(const Logger &);
};

//! Keeps messages and errors in memory. Used by tests.
class StringLogger : public Logger {
public:
  StringLogger(MPI_Comm com, int threshold);
  virtual ~StringLogger();

  void reset();

  //! Messages printed using message().
  std::string get() const;
  //! Messages printed using error().
  std::string errors() const;
protected:
  virtual void message_impl(const char buffer[]) const;
  virtual void error_impl(const char buffer[]) const;
private:
  struct Impl;
  std::unique_ptr<Impl> m_impl;
};

Logger::Ptr logger_from_options(MPI_Comm com);

} // end of namespace ncfix

#endif /* _NCFIX_LOGGER_H_ */
