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

#include <memory>

#include "ncfix/util/io/File.hh"
#include "ncfix/util/io/NC_Serial.hh"
#include "ncfix/util/io/NC4_Serial.hh"
#include "ncfix/util/io/IO_Flags.hh"
#include "ncfix/util/io/io_helpers.hh"
#include "ncfix/util/error_handling.hh"

namespace ncfix {

struct File::Impl {
  MPI_Comm com;
  io::Backend backend;
  std::unique_ptr<io::NC_Serial> nc;
};

namespace io {

Backend string_to_backend(const std::string &backend) {
  if (backend == "netcdf3") {
    return NCFIX_NETCDF3;
  }

  if (backend == "netcdf4_serial") {
    return NCFIX_NETCDF4_SERIAL;
  }

  throw RuntimeError::formatted(NCFIX_ERROR_LOCATION,
                                "unknown or unsupported I/O backend: %s",
                                backend.c_str());
}

} // end of namespace io

// Inspect an existing file to pick the backend that can append to it.
static io::Backend existing_file_backend(MPI_Comm com, const std::string &filename) {
  io::NC_Serial file(com);

  file.open(filename, io::NCFIX_READONLY);
  std::string format = file.format();
  file.close();

  return format == "netcdf4" ? io::NCFIX_NETCDF4_SERIAL : io::NCFIX_NETCDF3;
}

File::File(MPI_Comm com, const std::string &filename, io::Backend backend, io::Mode mode)
  : m_impl(new Impl) {

  m_impl->com = com;

  try {
    if (filename.empty()) {
      throw RuntimeError(NCFIX_ERROR_LOCATION,
                         "cannot open file: provided file name is empty");
    }

    if (backend == io::NCFIX_GUESS) {
      bool existing = (mode == io::NCFIX_READONLY or mode == io::NCFIX_READWRITE);
      backend = existing ? existing_file_backend(com, filename) : io::NCFIX_NETCDF4_SERIAL;
    }

    switch (backend) {
    case io::NCFIX_NETCDF3:
      m_impl->nc.reset(new io::NC_Serial(com));
      break;
    case io::NCFIX_NETCDF4_SERIAL:
      m_impl->nc.reset(new io::NC4_Serial(com));
      break;
    default:
      throw RuntimeError::formatted(NCFIX_ERROR_LOCATION,
                                    "unknown or unsupported I/O backend: %d", backend);
    }
    m_impl->backend = backend;

    this->open(filename, mode);
  } catch (...) {
    // the destructor is not called if the constructor throws
    delete m_impl;
    throw;
  }
}

File::~File() {
  if (m_impl->nc and not name().empty()) {
    try {
      this->close();
    } catch (...) {
      // never throw from a destructor
      handle_fatal_errors(MPI_COMM_SELF);
    }
  }
  delete m_impl;
}

io::Backend File::backend() const {
  return m_impl->backend;
}

MPI_Comm File::com() const {
  return m_impl->com;
}

void File::set_compression_level(int level) const {
  m_impl->nc->set_compression_level(level);
}

void File::open(const std::string &filename, io::Mode mode) {
  try {
    switch (mode) {
    case io::NCFIX_READONLY:
      m_impl->nc->open(filename, mode);
      return;
    case io::NCFIX_READWRITE:
      m_impl->nc->open(filename, mode);
      break;
    case io::NCFIX_READWRITE_MOVE:
      io::move_if_exists(m_impl->com, filename);
      m_impl->nc->create(filename);
      break;
    case io::NCFIX_READWRITE_CLOBBER:
      io::remove_if_exists(m_impl->com, filename);
      m_impl->nc->create(filename);
      break;
    default:
      throw RuntimeError::formatted(NCFIX_ERROR_LOCATION, "invalid mode: %d", mode);
    }

    // every value is written explicitly
    m_impl->nc->set_fill(io::NCFIX_NOFILL);
  } catch (RuntimeError &e) {
    e.add_context("opening or creating \"" + filename + "\"");
    throw;
  }
}

void File::close() {
  std::string filename = name();
  try {
    m_impl->nc->close();
  } catch (RuntimeError &e) {
    e.add_context("closing \"" + filename + "\"");
    throw;
  }
}

void File::redef() const {
  try {
    m_impl->nc->redef();
  } catch (RuntimeError &e) {
    e.add_context("switching to define mode; file \"" + name() + "\"");
    throw;
  }
}

void File::enddef() const {
  try {
    m_impl->nc->enddef();
  } catch (RuntimeError &e) {
    e.add_context("switching to data mode; file \"" + name() + "\"");
    throw;
  }
}

std::string File::name() const {
  return m_impl->nc->filename();
}

std::string File::format() const {
  try {
    return m_impl->nc->format();
  } catch (RuntimeError &e) {
    e.add_context("getting the format of \"" + name() + "\"");
    throw;
  }
}

unsigned int File::nvariables() const {
  try {
    return m_impl->nc->n_variables();
  } catch (RuntimeError &e) {
    e.add_context("getting the number of variables in '%s'", name().c_str());
    throw;
  }
}

unsigned int File::nattributes(const std::string &var_name) const {
  try {
    return m_impl->nc->n_attributes(var_name);
  } catch (RuntimeError &e) {
    e.add_context("getting the number of attributes of '%s' in '%s'",
                  var_name.c_str(), name().c_str());
    throw;
  }
}

void File::define_dimension(const std::string &dimension_name, size_t length) const {
  try {
    m_impl->nc->def_dim(dimension_name, length);
  } catch (RuntimeError &e) {
    e.add_context("defining dimension '%s' in '%s'", dimension_name.c_str(),
                  name().c_str());
    throw;
  }
}

//! Returns 0 if the dimension does not exist.
unsigned int File::dimension_length(const std::string &dimension_name) const {
  try {
    if (not dimension_exists(dimension_name)) {
      return 0;
    }
    return m_impl->nc->dim_length(dimension_name);
  } catch (RuntimeError &e) {
    e.add_context("getting the length of dimension '%s' in '%s'", dimension_name.c_str(),
                  name().c_str());
    throw;
  }
}

std::vector<std::string> File::dimensions(const std::string &variable_name) const {
  try {
    return m_impl->nc->var_dimensions(variable_name);
  } catch (RuntimeError &e) {
    e.add_context("getting dimensions of variable '%s' in '%s'", variable_name.c_str(),
                  name().c_str());
    throw;
  }
}

bool File::dimension_exists(const std::string &dimension_name) const {
  return m_impl->nc->dim_exists(dimension_name);
}

std::string File::variable_name(unsigned int id) const {
  try {
    return m_impl->nc->var_name(id);
  } catch (RuntimeError &e) {
    e.add_context("getting the name of variable number %d in '%s'", id, name().c_str());
    throw;
  }
}

void File::define_variable(const std::string &variable_name, io::Type nctype,
                           const std::vector<std::string> &dims) const {
  try {
    m_impl->nc->def_var(variable_name, nctype, dims);
  } catch (RuntimeError &e) {
    e.add_context("defining variable '%s' in '%s'", variable_name.c_str(),
                  name().c_str());
    throw;
  }
}

bool File::variable_exists(const std::string &variable_name) const {
  return m_impl->nc->var_exists(variable_name);
}

io::Type File::variable_type(const std::string &variable_name) const {
  try {
    return m_impl->nc->var_type(variable_name);
  } catch (RuntimeError &e) {
    e.add_context("getting the type of variable '%s' in '%s'", variable_name.c_str(),
                  name().c_str());
    throw;
  }
}

void File::read_variable(const std::string &variable_name,
                         const std::vector<unsigned int> &start,
                         const std::vector<unsigned int> &count,
                         double *ip) const {
  try {
    m_impl->nc->get_vara_double(variable_name, start, count, ip);
  } catch (RuntimeError &e) {
    e.add_context("reading variable '%s' from '%s'", variable_name.c_str(), name().c_str());
    throw;
  }
}

//! Read all values of a variable.
std::vector<double> File::read_variable(const std::string &variable_name) const {
  try {
    auto dims = dimensions(variable_name);

    std::vector<unsigned int> start(dims.size(), 0), count;
    size_t size = 1;
    for (const auto &d : dims) {
      count.push_back(dimension_length(d));
      size *= count.back();
    }

    std::vector<double> result(size);
    read_variable(variable_name, start, count, result.data());
    return result;
  } catch (RuntimeError &e) {
    e.add_context("reading all values of '%s' from '%s'", variable_name.c_str(), name().c_str());
    throw;
  }
}

void File::write_variable(const std::string &variable_name,
                          const std::vector<unsigned int> &start,
                          const std::vector<unsigned int> &count,
                          const double *op) const {
  try {
    m_impl->nc->put_vara_double(variable_name, start, count, op);
  } catch (RuntimeError &e) {
    e.add_context("writing variable '%s' to '%s'", variable_name.c_str(), name().c_str());
    throw;
  }
}

std::string File::attribute_name(const std::string &var_name, unsigned int n) const {
  try {
    return m_impl->nc->att_name(var_name, n);
  } catch (RuntimeError &e) {
    e.add_context("getting the name of attribute %d of '%s' in '%s'",
                  n, var_name.c_str(), name().c_str());
    throw;
  }
}

//! Returns io::NCFIX_NAT if the attribute does not exist.
io::Type File::attribute_type(const std::string &var_name, const std::string &att_name) const {
  try {
    return m_impl->nc->att_type(var_name, att_name);
  } catch (RuntimeError &e) {
    e.add_context("getting the type of '%s:%s' in '%s'",
                  var_name.c_str(), att_name.c_str(), name().c_str());
    throw;
  }
}

void File::write_attribute(const std::string &var_name, const std::string &att_name, io::Type nctype,
                           const std::vector<double> &values) const {
  try {
    m_impl->nc->put_att_double(var_name, att_name, nctype, values);
  } catch (RuntimeError &e) {
    e.add_context("writing double attribute '%s:%s' in '%s'",
                  var_name.c_str(), att_name.c_str(), name().c_str());
    throw;
  }
}

void File::write_attribute(const std::string &var_name, const std::string &att_name,
                           const std::string &value) const {
  try {
    m_impl->nc->put_att_text(var_name, att_name, value);
  } catch (RuntimeError &e) {
    e.add_context("writing text attribute '%s:%s' in '%s'",
                  var_name.c_str(), att_name.c_str(), name().c_str());
    throw;
  }
}

//! Returns an empty vector if the attribute does not exist.
std::vector<double> File::read_double_attribute(const std::string &var_name,
                                                const std::string &att_name) const {
  try {
    if (attribute_type(var_name, att_name) == io::NCFIX_CHAR) {
      throw RuntimeError::formatted(NCFIX_ERROR_LOCATION,
                                    "attribute %s is a string '%s'; expected a number or a list of numbers",
                                    att_name.c_str(),
                                    read_text_attribute(var_name, att_name).c_str());
    }

    return m_impl->nc->get_att_double(var_name, att_name);
  } catch (RuntimeError &e) {
    e.add_context("reading double attribute '%s:%s' from '%s'",
                  var_name.c_str(), att_name.c_str(), name().c_str());
    throw;
  }
}

//! Returns an empty string if the attribute does not exist.
std::string File::read_text_attribute(const std::string &var_name, const std::string &att_name) const {
  try {
    auto type = attribute_type(var_name, att_name);
    if (type != io::NCFIX_NAT and type != io::NCFIX_CHAR) {
      throw RuntimeError::formatted(NCFIX_ERROR_LOCATION,
                                    "attribute %s is not a string", att_name.c_str());
    }

    return m_impl->nc->get_att_text(var_name, att_name);
  } catch (RuntimeError &e) {
    e.add_context("reading text attribute '%s:%s' from %s",
                  var_name.c_str(), att_name.c_str(), name().c_str());
    throw;
  }
}

//! Prepend `history` to the "history" global attribute.
void File::append_history(const std::string &history) const {
  try {
    std::string old_history = read_text_attribute("NCFIX_GLOBAL", "history");
    write_attribute("NCFIX_GLOBAL", "history", history + old_history);
  } catch (RuntimeError &e) {
    e.add_context("appending to the history attribute in \"" + name() + "\"");
    throw;
  }
}

} // end of namespace ncfix
