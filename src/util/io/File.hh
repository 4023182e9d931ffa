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

#ifndef NCFIX_FILE_H
#define NCFIX_FILE_H

#include <vector>
#include <string>

#include <mpi.h>

namespace ncfix {

namespace io {
enum Type : int;
enum Backend : int;
enum Mode : int;
} // namespace io

//! \brief High-level I/O class.
/*!
 * Hides the low-level NetCDF wrapper.
 *
 * The constructor opens (or creates) a file; the destructor closes it if
 * it is still open, so a File can be used as a scoped handle.
 */
class File
{
public:
  File(MPI_Comm com, const std::string &filename, io::Backend backend, io::Mode mode);
  ~File();

  io::Backend backend() const;

  MPI_Comm com() const;

  void close();

  void redef() const;

  void enddef() const;


  std::string name() const;

  //! Format of the file on disk: "netcdf3" or "netcdf4".
  std::string format() const;

  unsigned int nvariables() const;

  unsigned int nattributes(const std::string &var_name) const;

  // dimensions

  void define_dimension(const std::string &name, size_t length) const;

  unsigned int dimension_length(const std::string &name) const;

  std::vector<std::string> dimensions(const std::string &variable_name) const;

  bool dimension_exists(const std::string &name) const;

  // variables

  std::string variable_name(unsigned int id) const;

  void define_variable(const std::string &name, io::Type nctype,
                       const std::vector<std::string> &dims) const;

  bool variable_exists(const std::string &name) const;

  io::Type variable_type(const std::string &variable_name) const;

  void read_variable(const std::string &variable_name,
                     const std::vector<unsigned int> &start,
                     const std::vector<unsigned int> &count,
                     double *ip) const;

  std::vector<double> read_variable(const std::string &variable_name) const;

  void write_variable(const std::string &variable_name,
                      const std::vector<unsigned int> &start,
                      const std::vector<unsigned int> &count,
                      const double *op) const;

  void set_compression_level(int level) const;

  // attributes

  std::string attribute_name(const std::string &var_name, unsigned int n) const;

  io::Type attribute_type(const std::string &var_name, const std::string &att_name) const;

  void write_attribute(const std::string &var_name, const std::string &att_name,
                       io::Type nctype, const std::vector<double> &values) const;

  void write_attribute(const std::string &var_name, const std::string &att_name,
                       const std::string &value) const;

  std::vector<double> read_double_attribute(const std::string &var_name,
                                            const std::string &att_name) const;

  std::string read_text_attribute(const std::string &var_name, const std::string &att_name) const;

  void append_history(const std::string &history) const;

private:
  struct Impl;
  Impl *m_impl;

  void open(const std::string &filename, io::Mode mode);

  // disable copying and assignments
  File(const File &other);
  File & operator=(const File &);
};

} // end of namespace ncfix

#endif /* NCFIX_FILE_H */
