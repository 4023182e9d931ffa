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

#ifndef _NCFIX_NETCDF_CONFIG_H_
#define _NCFIX_NETCDF_CONFIG_H_

#include <string>

#include "ncfix/util/ConfigInterface.hh"
#include "ncfix/util/VariableMetadata.hh"
#include "ncfix/util/error_handling.hh"

namespace ncfix {

//! A configuration database stored as attributes of a NetCDF variable.
/*!
 * Each parameter `foo` is an attribute `foo` of the variable. Its "metadata" is kept in
 * companion attributes `foo_doc`, `foo_type`, `foo_units`, `foo_option`, `foo_choices`,
 * `foo_valid_min` and `foo_valid_max`.
 *
 * Flags are stored as text attributes ("true", "false", etc).
 */
class NetCDFConfig : public Config {
public:
  NetCDFConfig(MPI_Comm com, const std::string &name, units::System::Ptr unit_system);
  ~NetCDFConfig();

protected:
  void read_impl(const File &file);
  void write_impl(const File &file) const;

  bool is_set_impl(const std::string &name) const;

  // numbers
  Doubles all_doubles_impl() const;
  double get_number_impl(const std::string &name) const;
  void set_number_impl(const std::string &name, double value);

  // strings
  Strings all_strings_impl() const;
  std::string get_string_impl(const std::string &name) const;
  void set_string_impl(const std::string &name, const std::string &value);

  // flags
  Flags all_flags_impl() const;
  bool get_flag_impl(const std::string& name) const;
  void set_flag_impl(const std::string& name, bool value);
protected:
  MPI_Comm m_com;
  VariableMetadata m_data;
private:
  RuntimeError not_set(const std::string &name) const;

  //! file the parameters were read from
  std::string m_config_filename;
};

} // end of namespace ncfix

#endif /* _NCFIX_NETCDF_CONFIG_H_ */
