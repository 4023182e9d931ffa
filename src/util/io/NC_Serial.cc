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

#include "ncfix/util/io/NC_Serial.hh"

// netcdf.h declares MPI-dependent parallel I/O functions unless MPI_INCLUDED
// is set; mpi.h is already included by NC_Serial.hh.
#ifndef MPI_INCLUDED
#define MPI_INCLUDED 1
#endif
#include <netcdf.h>

#include <cstdio>               // stderr, fprintf

#include "ncfix/util/ncfix_utilities.hh" // join
#include "ncfix/util/error_handling.hh"

#include "ncfix/util/io/ncfix_type_conversion.hh" // needs NC_* from netcdf.h

namespace ncfix {
namespace io {

NC_Serial::NC_Serial(MPI_Comm com)
  : m_com(com), m_rank(0), m_file_id(-1), m_define_mode(false) {
  MPI_Comm_rank(m_com, &m_rank);
}

NC_Serial::~NC_Serial() {
  if (m_file_id >= 0 and m_rank == 0) {
    nc_close(m_file_id);
    fprintf(stderr, "NC_Serial::~NC_Serial: NetCDF file %s is still open\n",
            m_filename.c_str());
  }
}

void NC_Serial::call(const ErrorLocation &where, const std::function<int()> &nc_call) const {
  int stat = NC_NOERR;

  if (m_rank == 0) {
    stat = nc_call();
  }

  MPI_Bcast(&stat, 1, MPI_INT, 0, m_com);

  if (stat != NC_NOERR) {
    throw RuntimeError(where, nc_strerror(stat));
  }
}

void NC_Serial::broadcast(int &value) const {
  MPI_Bcast(&value, 1, MPI_INT, 0, m_com);
}

void NC_Serial::broadcast(std::string &value) const {
  int length = static_cast<int>(value.size());
  broadcast(length);

  std::vector<char> buffer(value.begin(), value.end());
  buffer.resize(length + 1, 0);
  MPI_Bcast(buffer.data(), length + 1, MPI_CHAR, 0, m_com);

  value.assign(buffer.data(), length);
}

int NC_Serial::find_varid(const std::string &name, int &varid) const {
  if (name == "NCFIX_GLOBAL") {
    varid = NC_GLOBAL;
    return NC_NOERR;
  }
  return nc_inq_varid(m_file_id, name.c_str(), &varid);
}

int NC_Serial::creation_mode() const {
  return NC_CLOBBER | NC_64BIT_OFFSET;
}

void NC_Serial::open(const std::string &filename, io::Mode mode) {
  int nc_mode = mode == NCFIX_READONLY ? NC_NOWRITE : NC_WRITE;
  int file_id = -1;

  call(NCFIX_ERROR_LOCATION, [&]() -> int {
      return nc_open(filename.c_str(), nc_mode, &file_id);
    });
  broadcast(file_id);

  m_file_id     = file_id;
  m_filename    = filename;
  m_define_mode = false;
}

void NC_Serial::create(const std::string &filename) {
  int file_id = -1;

  call(NCFIX_ERROR_LOCATION, [&]() -> int {
      return nc_create(filename.c_str(), creation_mode(), &file_id);
    });
  broadcast(file_id);

  m_file_id     = file_id;
  m_filename    = filename;
  m_define_mode = true;
}

void NC_Serial::close() {
  int file_id = m_file_id;

  m_file_id     = -1;
  m_define_mode = false;
  m_filename.clear();

  call(NCFIX_ERROR_LOCATION, [&]() -> int { return nc_close(file_id); });
}

std::string NC_Serial::filename() const {
  return m_filename;
}

std::string NC_Serial::format() const {
  int format = 0;
  call(NCFIX_ERROR_LOCATION, [&]() -> int { return nc_inq_format(m_file_id, &format); });
  broadcast(format);

  if (format == NC_FORMAT_CLASSIC or format == NC_FORMAT_64BIT_OFFSET) {
    return "netcdf3";
  }
  return "netcdf4";
}

void NC_Serial::redef() const {
  if (not m_define_mode) {
    call(NCFIX_ERROR_LOCATION, [&]() -> int { return nc_redef(m_file_id); });
    m_define_mode = true;
  }
}

void NC_Serial::enddef() const {
  if (m_define_mode) {
    // leave room in the header so that attributes can be added later
    const size_t header_padding = 200 * 1024;

    call(NCFIX_ERROR_LOCATION, [&]() -> int {
        return nc__enddef(m_file_id, header_padding, 4, 0, 4);
      });
    m_define_mode = false;
  }
}

void NC_Serial::set_fill(int fill_mode) const {
  redef();

  int old_mode = 0;
  call(NCFIX_ERROR_LOCATION, [&]() -> int { return nc_set_fill(m_file_id, fill_mode, &old_mode); });
}

void NC_Serial::set_compression_level(int level) const {
  (void) level;
  // NetCDF-3 files do not support compression
}

void NC_Serial::def_dim(const std::string &name, size_t length) const {
  redef();

  call(NCFIX_ERROR_LOCATION, [&]() -> int {
      int dimid = 0;
      return nc_def_dim(m_file_id, name.c_str(), length, &dimid);
    });
}

bool NC_Serial::dim_exists(const std::string &name) const {
  int exists = 0;
  if (m_rank == 0) {
    int dimid = 0;
    exists = nc_inq_dimid(m_file_id, name.c_str(), &dimid) == NC_NOERR;
  }
  broadcast(exists);

  return exists == 1;
}

unsigned int NC_Serial::dim_length(const std::string &name) const {
  int length = 0;

  call(NCFIX_ERROR_LOCATION, [&]() -> int {
      int dimid = 0;
      size_t len = 0;
      int stat = nc_inq_dimid(m_file_id, name.c_str(), &dimid);
      if (stat == NC_NOERR) {
        stat = nc_inq_dimlen(m_file_id, dimid, &len);
        length = static_cast<int>(len);
      }
      return stat;
    });
  broadcast(length);

  return length;
}

void NC_Serial::def_var(const std::string &name, io::Type type,
                        const std::vector<std::string> &dims) const {
  redef();

  call(NCFIX_ERROR_LOCATION, [&]() -> int {
      std::vector<int> dimids;
      for (const auto &d : dims) {
        int dimid = 0;
        int stat = nc_inq_dimid(m_file_id, d.c_str(), &dimid);
        if (stat != NC_NOERR) {
          return stat;
        }
        dimids.push_back(dimid);
      }

      int varid = 0;
      return nc_def_var(m_file_id, name.c_str(), ncfix_type_to_nc_type(type),
                        static_cast<int>(dimids.size()), dimids.data(), &varid);
    });
}

int NC_Serial::n_variables() const {
  int result = 0;
  call(NCFIX_ERROR_LOCATION, [&]() -> int { return nc_inq_nvars(m_file_id, &result); });
  broadcast(result);
  return result;
}

std::string NC_Serial::var_name(unsigned int j) const {
  std::string result;

  call(NCFIX_ERROR_LOCATION, [&]() -> int {
      std::vector<char> buffer(NC_MAX_NAME + 1, 0);
      int stat = nc_inq_varname(m_file_id, static_cast<int>(j), buffer.data());
      result = buffer.data();
      return stat;
    });
  broadcast(result);

  return result;
}

bool NC_Serial::var_exists(const std::string &name) const {
  int exists = 0;
  if (m_rank == 0) {
    int varid = 0;
    exists = nc_inq_varid(m_file_id, name.c_str(), &varid) == NC_NOERR;
  }
  broadcast(exists);

  return exists == 1;
}

io::Type NC_Serial::var_type(const std::string &name) const {
  int type = NC_NAT;

  call(NCFIX_ERROR_LOCATION, [&]() -> int {
      int varid = 0;
      nc_type nctype = NC_NAT;
      int stat = find_varid(name, varid);
      if (stat == NC_NOERR) {
        stat = nc_inq_vartype(m_file_id, varid, &nctype);
        type = nctype;
      }
      return stat;
    });
  broadcast(type);

  return nc_type_to_ncfix_type(type);
}

std::vector<std::string> NC_Serial::var_dimensions(const std::string &name) const {
  std::vector<std::string> result;

  call(NCFIX_ERROR_LOCATION, [&]() -> int {
      int varid = 0, ndims = 0;
      int stat = find_varid(name, varid);
      if (stat == NC_NOERR) {
        stat = nc_inq_varndims(m_file_id, varid, &ndims);
      }
      if (stat != NC_NOERR or ndims == 0) {
        return stat;
      }

      std::vector<int> dimids(ndims);
      stat = nc_inq_vardimid(m_file_id, varid, dimids.data());

      for (int k = 0; stat == NC_NOERR and k < ndims; ++k) {
        std::vector<char> buffer(NC_MAX_NAME + 1, 0);
        stat = nc_inq_dimname(m_file_id, dimids[k], buffer.data());
        result.push_back(buffer.data());
      }
      return stat;
    });

  int ndims = static_cast<int>(result.size());
  broadcast(ndims);
  result.resize(ndims);
  for (auto &d : result) {
    broadcast(d);
  }

  return result;
}

static void check_start_count(const std::vector<unsigned int> &start,
                              const std::vector<unsigned int> &count) {
  if (start.size() != count.size()) {
    throw RuntimeError::formatted(NCFIX_ERROR_LOCATION,
                                  "start and count arrays have to have the same size");
  }
}

//! Read a hyperslab on rank 0 and broadcast it.
void NC_Serial::get_vara_double(const std::string &name,
                                const std::vector<unsigned int> &start,
                                const std::vector<unsigned int> &count,
                                double *ip) const {
  check_start_count(start, count);
  enddef();

  size_t length = 1;
  for (auto c : count) {
    length *= c;
  }

  call(NCFIX_ERROR_LOCATION, [&]() -> int {
      int varid = 0;
      int stat = find_varid(name, varid);
      if (stat == NC_NOERR) {
        std::vector<size_t> nc_start(start.begin(), start.end());
        std::vector<size_t> nc_count(count.begin(), count.end());
        stat = nc_get_vara_double(m_file_id, varid, nc_start.data(), nc_count.data(), ip);
      }
      return stat;
    });

  MPI_Bcast(ip, static_cast<int>(length), MPI_DOUBLE, 0, m_com);
}

//! Write a hyperslab using the buffer on rank 0.
/*!
 * NetCDF converts values to the external type of the variable.
 */
void NC_Serial::put_vara_double(const std::string &name,
                                const std::vector<unsigned int> &start,
                                const std::vector<unsigned int> &count,
                                const double *op) const {
  check_start_count(start, count);
  enddef();

  call(NCFIX_ERROR_LOCATION, [&]() -> int {
      int varid = 0;
      int stat = find_varid(name, varid);
      if (stat == NC_NOERR) {
        std::vector<size_t> nc_start(start.begin(), start.end());
        std::vector<size_t> nc_count(count.begin(), count.end());
        stat = nc_put_vara_double(m_file_id, varid, nc_start.data(), nc_count.data(), op);
      }
      return stat;
    });
}

int NC_Serial::n_attributes(const std::string &var_name) const {
  int result = 0;

  call(NCFIX_ERROR_LOCATION, [&]() -> int {
      int varid = 0;
      int stat = find_varid(var_name, varid);
      if (stat == NC_NOERR) {
        stat = nc_inq_varnatts(m_file_id, varid, &result);
      }
      return stat;
    });
  broadcast(result);

  return result;
}

std::string NC_Serial::att_name(const std::string &var_name, unsigned int n) const {
  std::string result;

  call(NCFIX_ERROR_LOCATION, [&]() -> int {
      int varid = 0;
      std::vector<char> buffer(NC_MAX_NAME + 1, 0);
      int stat = find_varid(var_name, varid);
      if (stat == NC_NOERR) {
        stat = nc_inq_attname(m_file_id, varid, static_cast<int>(n), buffer.data());
        result = buffer.data();
      }
      return stat;
    });
  broadcast(result);

  return result;
}

//! Returns NCFIX_NAT if the attribute does not exist.
io::Type NC_Serial::att_type(const std::string &var_name, const std::string &att_name) const {
  int type = NC_NAT;

  call(NCFIX_ERROR_LOCATION, [&]() -> int {
      int varid = 0;
      int stat = find_varid(var_name, varid);
      if (stat == NC_NOERR) {
        nc_type nctype = NC_NAT;
        stat = nc_inq_atttype(m_file_id, varid, att_name.c_str(), &nctype);
        type = nctype;
      }
      if (stat == NC_ENOTATT) {
        type = NC_NAT;
        stat = NC_NOERR;
      }
      return stat;
    });
  broadcast(type);

  return nc_type_to_ncfix_type(type);
}

//! Returns an empty vector if the attribute does not exist.
std::vector<double> NC_Serial::get_att_double(const std::string &var_name,
                                              const std::string &att_name) const {
  std::vector<double> result;

  call(NCFIX_ERROR_LOCATION, [&]() -> int {
      int varid = 0;
      size_t length = 0;
      int stat = find_varid(var_name, varid);
      if (stat == NC_NOERR) {
        stat = nc_inq_attlen(m_file_id, varid, att_name.c_str(), &length);
      }
      if (stat == NC_ENOTATT) {
        return NC_NOERR;
      }
      if (stat == NC_NOERR) {
        result.resize(length);
        stat = nc_get_att_double(m_file_id, varid, att_name.c_str(), result.data());
      }
      return stat;
    });

  int length = static_cast<int>(result.size());
  broadcast(length);
  result.resize(length);
  MPI_Bcast(result.data(), length, MPI_DOUBLE, 0, m_com);

  return result;
}

// Reads a NC_CHAR attribute on rank 0.
static int get_att_chars(int ncid, int varid, const std::string &att_name, std::string &result) {
  size_t length = 0;
  int stat = nc_inq_attlen(ncid, varid, att_name.c_str(), &length);
  if (stat != NC_NOERR) {
    return stat;
  }

  std::vector<char> buffer(length + 1, 0);
  stat = nc_get_att_text(ncid, varid, att_name.c_str(), buffer.data());
  result = buffer.data();

  return stat;
}

// Reads a NC_STRING attribute on rank 0, joining elements with commas.
static int get_att_strings(int ncid, int varid, const std::string &att_name,
                           std::string &result) {
  size_t length = 0;
  int stat = nc_inq_attlen(ncid, varid, att_name.c_str(), &length);
  if (stat != NC_NOERR) {
    return stat;
  }

  std::vector<char*> buffer(length + 1, NULL);
  stat = nc_get_att_string(ncid, varid, att_name.c_str(), buffer.data());
  if (stat != NC_NOERR) {
    return stat;
  }

  result = join(std::vector<std::string>(buffer.begin(), buffer.begin() + length), ",");

  return nc_free_string(length, buffer.data());
}

//! Returns an empty string if the attribute is missing or is not text.
std::string NC_Serial::get_att_text(const std::string &var_name,
                                    const std::string &att_name) const {
  std::string result;

  call(NCFIX_ERROR_LOCATION, [&]() -> int {
      int varid = 0;
      nc_type nctype = NC_NAT;
      int stat = find_varid(var_name, varid);
      if (stat == NC_NOERR) {
        stat = nc_inq_atttype(m_file_id, varid, att_name.c_str(), &nctype);
      }

      if (stat == NC_ENOTATT) {
        return NC_NOERR;
      }
      if (stat != NC_NOERR) {
        return stat;
      }

      switch (nctype) {
      case NC_CHAR:
        return get_att_chars(m_file_id, varid, att_name, result);
      case NC_STRING:
        return get_att_strings(m_file_id, varid, att_name, result);
      default:
        return NC_NOERR;
      }
    });
  broadcast(result);

  return result;
}

void NC_Serial::put_att_double(const std::string &var_name, const std::string &att_name,
                               io::Type type, const std::vector<double> &data) const {
  redef();

  call(NCFIX_ERROR_LOCATION, [&]() -> int {
      int varid = 0;
      int stat = find_varid(var_name, varid);
      if (stat == NC_NOERR) {
        stat = nc_put_att_double(m_file_id, varid, att_name.c_str(),
                                 ncfix_type_to_nc_type(type), data.size(), data.data());
      }
      return stat;
    });
}

void NC_Serial::put_att_text(const std::string &var_name, const std::string &att_name,
                             const std::string &value) const {
  redef();

  call(NCFIX_ERROR_LOCATION, [&]() -> int {
      int varid = 0;
      int stat = find_varid(var_name, varid);
      if (stat == NC_NOERR) {
        stat = nc_put_att_text(m_file_id, varid, att_name.c_str(), value.size(), value.c_str());
      }
      return stat;
    });
}

} // end of namespace io
} // end of namespace ncfix
