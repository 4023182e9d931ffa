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
#include "ncfix/util/NetCDFConfig.hh"
#include "ncfix/util/io/File.hh"
#include "ncfix/util/io/io_helpers.hh"
#include "ncfix/util/io/IO_Flags.hh"
#include "ncfix/util/error_handling.hh"

namespace ncfix {

NetCDFConfig::NetCDFConfig(MPI_Comm com, const std::string &name, units::System::Ptr system)
  : Config(system),
    m_com(com),
    m_data(name, system) {
}

NetCDFConfig::~NetCDFConfig() {
}

RuntimeError NetCDFConfig::not_set(const std::string &name) const {
  std::string source = m_config_filename.empty() ? "no file read yet" : m_config_filename;
  return RuntimeError::formatted(NCFIX_ERROR_LOCATION,
                                 "parameter '%s' is not set (configuration source: %s)",
                                 name.c_str(), source.c_str());
}

bool NetCDFConfig::is_set_impl(const std::string &name) const {
  return m_data.has_attribute(name);
}

double NetCDFConfig::get_number_impl(const std::string &name) const {
  if (m_data.all_doubles().count(name) == 0) {
    throw not_set(name);
  }
  return m_data.get_number(name);
}

Config::Doubles NetCDFConfig::all_doubles_impl() const {
  return Doubles(m_data.all_doubles().begin(), m_data.all_doubles().end());
}

void NetCDFConfig::set_number_impl(const std::string &name, double value) {
  m_data.set_number(name, value);
}

std::string NetCDFConfig::get_string_impl(const std::string &name) const {
  if (m_data.all_strings().count(name) == 0) {
    throw not_set(name);
  }
  return m_data.get_string(name);
}

Config::Strings NetCDFConfig::all_strings_impl() const {
  const VariableMetadata::StringAttrs &strings = m_data.all_strings();

  Strings result;
  for (const auto &s : strings) {
    // flags are text attributes too; they are reported by all_flags()
    auto type = strings.find(s.first + "_type");
    if (type == strings.end() or type->second != "flag") {
      result[s.first] = s.second;
    }
  }
  return result;
}

void NetCDFConfig::set_string_impl(const std::string &name, const std::string &value) {
  m_data.set_string(name, value);
}

//! Returns 1 for true, 0 for false and -1 if `text` is not a flag value.
static int flag_value(const std::string &text) {
  if (text == "true" or text == "yes" or text == "on") {
    return 1;
  }
  if (text == "false" or text == "no" or text == "off") {
    return 0;
  }
  return -1;
}

bool NetCDFConfig::get_flag_impl(const std::string &name) const {
  if (m_data.all_strings().count(name) == 0) {
    throw not_set(name);
  }

  std::string text = m_data.get_string(name);
  int value = flag_value(text);
  if (value < 0) {
    throw RuntimeError::formatted(NCFIX_ERROR_LOCATION,
                                  "parameter '%s' = '%s' is not a flag\n"
                                  "(use true/false, yes/no or on/off)",
                                  name.c_str(), text.c_str());
  }
  return value == 1;
}

NetCDFConfig::Flags NetCDFConfig::all_flags_impl() const {
  Flags result;
  for (const auto &s : m_data.all_strings()) {
    int value = flag_value(s.second);
    if (value >= 0) {
      result[s.first] = (value == 1);
    }
  }
  return result;
}

void NetCDFConfig::set_flag_impl(const std::string &name, bool value) {
  m_data.set_string(name, value ? "true" : "false");
}

//! Replaces all parameters with the attributes of the config variable in `file`.
void NetCDFConfig::read_impl(const File &file) {
  m_data = io::read_attributes(file, m_data.get_name(), m_data.unit_system());
  m_config_filename = file.name();
}

void NetCDFConfig::write_impl(const File &file) const {
  if (not file.variable_exists(m_data.get_name())) {
    file.define_variable(m_data.get_name(), io::NCFIX_BYTE, {});
  }
  io::write_attributes(file, m_data, io::NCFIX_DOUBLE);
}

} // end of namespace ncfix
