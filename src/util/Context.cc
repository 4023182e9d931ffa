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
#include "ncfix/util/Context.hh"
#include "ncfix/util/Units.hh"
#include "ncfix/util/Logger.hh"
#include "ncfix/util/ConfigInterface.hh"

namespace ncfix {

struct Context::Impl {
  MPI_Comm com;
  int rank;
  std::shared_ptr<units::System> unit_system;
  std::shared_ptr<Config> config;
  std::shared_ptr<Logger> logger;
};

Context::Context(MPI_Comm c, std::shared_ptr<units::System> sys,
                 std::shared_ptr<Config> config, std::shared_ptr<Logger> L)
  : m_impl(new Impl) {
  m_impl->com         = c;
  m_impl->rank        = 0;
  m_impl->unit_system = sys;
  m_impl->config      = config;
  m_impl->logger      = L;

  MPI_Comm_rank(c, &m_impl->rank);
}

Context::~Context() {
  // empty
}

MPI_Comm Context::com() const {
  return m_impl->com;
}

int Context::rank() const {
  return m_impl->rank;
}

std::shared_ptr<units::System> Context::unit_system() const {
  return m_impl->unit_system;
}

std::shared_ptr<Config> Context::config() {
  return m_impl->config;
}

std::shared_ptr<const Config> Context::config() const {
  return m_impl->config;
}

std::shared_ptr<Logger> Context::log() {
  return m_impl->logger;
}

std::shared_ptr<const Logger> Context::log() const {
  return m_impl->logger;
}

/*!
 * Reads `-verbose`, `-config`, `-config_override` and parameter options. With
 * `print` set the resulting configuration is logged at verbosity 3.
 */
std::shared_ptr<Context> context_from_options(MPI_Comm com, bool print) {
  auto unit_system = std::make_shared<units::System>();
  auto log         = logger_from_options(com);
  auto config      = config_from_options(com, *log, unit_system);

  if (print) {
    print_config(*log, 3, *config);
  }

  return std::make_shared<Context>(com, unit_system, config, log);
}

} // end of namespace ncfix
