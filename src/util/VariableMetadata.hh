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

#ifndef _NCFIX_VARIABLEMETADATA_H_
#define _NCFIX_VARIABLEMETADATA_H_

#include <map>
#include <vector>
#include <string>
#include <initializer_list>

#include "ncfix/util/Units.hh"

namespace ncfix {
namespace io {
enum Type : int;
}

class Logger;

//! Name, dimensions, output type and attributes of a NetCDF variable.
/*!
 * Units are checked by UDUNITS-2 when set. Empty string attributes are not
 * written and do not count as present.
 *
 * The name "NCFIX_GLOBAL" refers to global attributes.
 */

class VariableMetadata;

class ConstAttribute {
public:
  friend class VariableMetadata;
  ConstAttribute(const ConstAttribute&) = delete;
  ConstAttribute& operator=(const ConstAttribute&) = delete;

  operator std::string() const;
  operator double() const;
  operator std::vector<double> () const;
protected:
  ConstAttribute(const VariableMetadata *var, const std::string &name);
  ConstAttribute(ConstAttribute&& a) noexcept;

  std::string m_name;
  VariableMetadata* m_var;
};

class Attribute : public ConstAttribute {
public:
  friend class VariableMetadata;
  void operator=(const std::string &value);
  void operator=(const char *value);
  void operator=(const std::initializer_list<double> &value);
  void operator=(const std::vector<double> &value);
private:
  using ConstAttribute::ConstAttribute;
};

class VariableMetadata {
public:
  VariableMetadata(const std::string &name, units::System::Ptr system,
                   const std::vector<std::string> &dimensions = {});
  virtual ~VariableMetadata() = default;

  Attribute operator[](const std::string &name) {
    return Attribute(this, name);
  }

  const ConstAttribute operator[](const std::string &name) const {
    return ConstAttribute(this, name);
  }

  // getters and setters
  double get_number(const std::string &name) const;
  void set_number(const std::string &name, double value);

  std::vector<double> get_numbers(const std::string &name) const;
  void set_numbers(const std::string &name, const std::vector<double> &values);

  std::string get_name() const;

  std::string get_string(const std::string &name) const;
  void set_string(const std::string &name, const std::string &value);

  //! Names of NetCDF dimensions of this variable, slowest-varying first.
  const std::vector<std::string>& dimensions() const;
  void set_dimensions(const std::vector<std::string> &dimensions);

  io::Type get_output_type() const;
  void set_output_type(io::Type type);


  units::System::Ptr unit_system() const;

  bool has_attribute(const std::string &name) const;

  typedef std::map<std::string,std::string> StringAttrs;
  const StringAttrs& all_strings() const;

  typedef std::map<std::string,std::vector<double> > DoubleAttrs;
  const DoubleAttrs& all_doubles() const;

  void report_to_stdout(const Logger &log, int verbosity_threshold) const;
  void report_range(const Logger &log, int verbosity_threshold, double min, double max) const;

private:
  units::System::Ptr m_unit_system;

  StringAttrs m_strings;
  DoubleAttrs m_doubles;

  std::string m_name;
  std::vector<std::string> m_dimensions;

  io::Type m_output_type;
};

} // end of namespace ncfix

#endif  // _NCFIX_VARIABLEMETADATA_H_
