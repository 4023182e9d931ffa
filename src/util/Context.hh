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

#ifndef NCFIX_CONTEXT_H
#define NCFIX_CONTEXT_H

#include <memory>
#include <string>

#include <mpi.h>

namespace ncfix {

namespace units {
class System;
}

class Config;
class Logger;

//! Objects shared by everything that runs in a communicator: the unit system, the
//! configuration database and the logger.
class Context {
public:
  Context(MPI_Comm c, std::shared_ptr<units::System> sys, std::shared_ptr<Config> conf,
          std::shared_ptr<Logger> log);
  ~Context();

  MPI_Comm com() const;
  int rank() const;
  std::shared_ptr<units::System> unit_system() const;

  std::shared_ptr<const Config> config() const;
  std::shared_ptr<Config> config();

  std::shared_ptr<const Logger> log() const;
  std::shared_ptr<Logger> log();

private:
  struct Impl;
  std::unique_ptr<Impl> m_impl;

  Context(const Context& other);
  Context & operator=(const Context &);
};

std::shared_ptr<Context> context_from_options(MPI_Comm com, bool print = false);

} // end of namespace ncfix

#endif /* NCFIX_CONTEXT_H */
