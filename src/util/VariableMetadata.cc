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

#include <algorithm>
#include <cmath>

#include "ncfix/util/VariableMetadata.hh"
#include "ncfix/util/io/IO_Flags.hh"
#include "ncfix/util/error_handling.hh"
#include "ncfix/util/Logger.hh"

namespace ncfix {

VariableMetadata::VariableMetadata(const std::string &name, units::System::Ptr system,
                                   const std::vector<std::string> &dimensions)
  : m_unit_system(std::move(system)),
    m_name(name),
    m_dimensions(dimensions),
    m_output_type(io::NCFIX_NAT) {
  // empty
}

std::string VariableMetadata::get_name() const {
  return m_name;
}

const std::vector<std::string>& VariableMetadata::dimensions() const {
  return m_dimensions;
}

void VariableMetadata::set_dimensions(const std::vector<std::string> &dimensions) {
  m_dimensions = dimensions;
}

io::Type VariableMetadata::get_output_type() const {
  return m_output_type;
}

void VariableMetadata::set_output_type(io::Type type) {
  m_output_type = type;
}

units::System::Ptr VariableMetadata::unit_system() const {
  return m_unit_system;
}

void VariableMetadata::report_range(const Logger &log, int verbosity_threshold,
                                    double min, double max) const {
  std::string spacer(m_name.size(), ' ');

  log.message(verbosity_threshold,
              " %s / %-10s\n"
              " %s \\ min,max = %9.3f,%9.3f (%s)\n",
              m_name.c_str(), get_string("long_name").c_str(),
              spacer.c_str(), min, max, get_string("units").c_str());
}

//! Print all non-empty attributes, one per line.
void VariableMetadata::report_to_stdout(const Logger &log, int verbosity_threshold) const {
  size_t width = 0;
  for (const auto &s : m_strings) {
    width = std::max(width, s.first.size());
  }
  for (const auto &d : m_doubles) {
    width = std::max(width, d.first.size());
  }

  for (const auto &s : m_strings) {
    if (not s.second.empty()) {
      log.message(verbosity_threshold, "  %-*s = \"%s\"\n",
                  (int)width, s.first.c_str(), s.second.c_str());
    }
  }

  for (const auto &d : m_doubles) {
    if (d.second.empty()) {
      continue;
    }

    double value = d.second[0];
    // scientific notation for very large and very small numbers
    bool scientific = std::fabs(value) >= 1.0e7 or std::fabs(value) <= 1.0e-4;

    log.message(verbosity_threshold, scientific ? "  %-*s = %12.3e\n" : "  %-*s = %12.5f\n",
                (int)width, d.first.c_str(), value);
  }
}

//! Empty string attributes do not count, except "units".
bool VariableMetadata::has_attribute(const std::string &name) const {
  auto s = m_strings.find(name);
  if (s != m_strings.end()) {
    return name == "units" or not s->second.empty();
  }

  return m_doubles.count(name) > 0;
}

double VariableMetadata::get_number(const std::string &name) const {
  auto values = get_numbers(name);
  if (values.empty()) {
    throw RuntimeError::formatted(NCFIX_ERROR_LOCATION,
                                  "variable \"%s\" does not have a double attribute \"%s\"",
                                  m_name.c_str(), name.c_str());
  }
  return values[0];
}

void VariableMetadata::set_number(const std::string &name, double value) {
  m_doubles[name] = {value};
}

//! Returns an empty vector if the attribute is not set.
std::vector<double> VariableMetadata::get_numbers(const std::string &name) const {
  auto d = m_doubles.find(name);
  return d != m_doubles.end() ? d->second : std::vector<double>();
}

void VariableMetadata::set_numbers(const std::string &name, const std::vector<double> &values) {
  m_doubles[name] = values;
}

//! Returns an empty string if the attribute is not set.
std::string VariableMetadata::get_string(const std::string &name) const {
  auto s = m_strings.find(name);
  return s != m_strings.end() ? s->second : std::string();
}

//! Set a string attribute. Non-empty "units" have to be understood by UDUNITS-2.
void VariableMetadata::set_string(const std::string &name, const std::string &value) {
  if (name == "units" and not value.empty()) {
    try {
      units::Unit parsed(m_unit_system, value);
    } catch (RuntimeError &e) {
      e.add_context("setting units of '%s'", m_name.c_str());
      throw;
    }
  }

  m_strings[name] = value;
}

const VariableMetadata::StringAttrs& VariableMetadata::all_strings() const {
  return m_strings;
}

const VariableMetadata::DoubleAttrs& VariableMetadata::all_doubles() const {
  return m_doubles;
}

ConstAttribute::ConstAttribute(const VariableMetadata *var, const std::string &name)
  : m_name(name), m_var(const_cast<VariableMetadata*>(var)) {
}

ConstAttribute::ConstAttribute(ConstAttribute&& a) noexcept
  : m_name(std::move(a.m_name)), m_var(a.m_var) {
  a.m_var = nullptr;
}

ConstAttribute::operator std::string() const {
  return m_var->get_string(m_name);
}

ConstAttribute::operator double() const {
  auto values = m_var->get_numbers(m_name);
  if (values.size() != 1) {
    throw RuntimeError::formatted(NCFIX_ERROR_LOCATION,
                                  "%s:%s does not have exactly one value",
                                  m_var->get_name().c_str(), m_name.c_str());
  }
  return values[0];
}

ConstAttribute::operator std::vector<double> () const {
  return m_var->get_numbers(m_name);
}

void Attribute::operator=(const std::string &value) {
  m_var->set_string(m_name, value);
}

void Attribute::operator=(const char *value) {
  m_var->set_string(m_name, value);
}

void Attribute::operator=(const std::initializer_list<double> &value) {
  m_var->set_numbers(m_name, value);
}

void Attribute::operator=(const std::vector<double> &value) {
  m_var->set_numbers(m_name, value);
}

} // end of namespace ncfix
