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

#ifndef NCFIX_NC_SERIAL_H
#define NCFIX_NC_SERIAL_H

#include <functional>
#include <string>
#include <vector>

#include <mpi.h>

#include "ncfix/util/io/IO_Flags.hh"

namespace ncfix {

class ErrorLocation;

namespace io {

//! NetCDF-3 (64-bit offset) file. Only rank 0 calls NetCDF.
/*!
 * Dimensions, variables and attributes are referenced by name; NetCDF ids
 * never leave this class. Every rank gets the same results: rank 0 makes the
 * call and broadcasts the status code and anything it read.
 *
 * Switching between define and data modes is done automatically.
 *
 * Use "NCFIX_GLOBAL" as the variable name to access global attributes.
 */
class NC_Serial
{
public:
  NC_Serial(MPI_Comm com);
  virtual ~NC_Serial();

  void open(const std::string &filename, io::Mode mode);
  void create(const std::string &filename);
  void close();

  std::string filename() const;

  //! "netcdf3" or "netcdf4"
  std::string format() const;

  void redef() const;
  void enddef() const;

  void set_fill(int fill_mode) const;

  virtual void set_compression_level(int level) const;

  // dimensions
  void def_dim(const std::string &name, size_t length) const;
  bool dim_exists(const std::string &name) const;
  unsigned int dim_length(const std::string &name) const;

  // variables
  virtual void def_var(const std::string &name, io::Type type,
                       const std::vector<std::string> &dims) const;

  int n_variables() const;
  std::string var_name(unsigned int j) const;
  bool var_exists(const std::string &name) const;
  io::Type var_type(const std::string &name) const;
  std::vector<std::string> var_dimensions(const std::string &name) const;

  void get_vara_double(const std::string &name,
                       const std::vector<unsigned int> &start,
                       const std::vector<unsigned int> &count,
                       double *ip) const;

  void put_vara_double(const std::string &name,
                       const std::vector<unsigned int> &start,
                       const std::vector<unsigned int> &count,
                       const double *op) const;

  // attributes
  int n_attributes(const std::string &var_name) const;
  std::string att_name(const std::string &var_name, unsigned int n) const;
  io::Type att_type(const std::string &var_name, const std::string &att_name) const;

  std::vector<double> get_att_double(const std::string &var_name,
                                     const std::string &att_name) const;
  std::string get_att_text(const std::string &var_name, const std::string &att_name) const;

  void put_att_double(const std::string &var_name, const std::string &att_name,
                      io::Type type, const std::vector<double> &data) const;
  void put_att_text(const std::string &var_name, const std::string &att_name,
                    const std::string &value) const;

protected:
  //! NetCDF creation mode flags.
  virtual int creation_mode() const;

  //! Make a NetCDF call on rank 0 and throw on all ranks if it failed.
  void call(const ErrorLocation &where, const std::function<int()> &nc_call) const;

  //! Look up a varid (NC_GLOBAL for "NCFIX_GLOBAL"). Rank 0 only; returns a NetCDF status.
  int find_varid(const std::string &name, int &varid) const;

  void broadcast(int &value) const;
  void broadcast(std::string &value) const;

  MPI_Comm m_com;
  int m_rank;
  int m_file_id;
  std::string m_filename;
  mutable bool m_define_mode;
};

} // end of namespace io
} // end of namespace ncfix

#endif /* NCFIX_NC_SERIAL_H */
