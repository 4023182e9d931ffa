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

#include <mpi.h>
#include <cmath>
#include <algorithm>

#include "ncfix/ncfix_config.hh"
#include "ncfix/util/io/File.hh"
#include "ncfix/util/ConfigInterface.hh"
#include "ncfix/util/Units.hh"
#include "ncfix/util/ncfix_utilities.hh"
#include "ncfix/util/ncfix_options.hh"
#include "ncfix/util/error_handling.hh"
#include "ncfix/util/io/IO_Flags.hh"
#include "ncfix/util/NetCDFConfig.hh"
#include "ncfix/util/Logger.hh"

namespace ncfix {

struct Config::Impl {
  Impl(units::System::Ptr sys)
    : unit_system(sys) {
    // empty
  }

  //! Returns true if a `set_...()` call with `flag` should leave the current value alone.
  bool keep_current_value(const std::string &name, ConfigSettingFlag flag) {
    if (flag == CONFIG_USER) {
      set_by_user.insert(name);
      return false;
    }
    return flag == CONFIG_DEFAULT and set_by_user.count(name) > 0;
  }

  units::System::Ptr unit_system;
  std::string filename;

  std::set<std::string> set_by_user;
  std::set<std::string> used;
};

Config::Config(units::System::Ptr system)
  : m_impl(new Impl(system)) {
  // empty
}

Config::~Config() {
  delete m_impl;
}

void Config::read(MPI_Comm com, const std::string &filename) {
  File file(com, filename, io::NCFIX_GUESS, io::NCFIX_READONLY);
  this->read(file);
}

void Config::read(const File &file) {
  this->read_impl(file);
  m_impl->filename = file.name();
}

void Config::write(const File &file) const {
  this->write_impl(file);
}

//! Write to `filename`, appending or moving an existing file aside.
void Config::write(MPI_Comm com, const std::string &filename, bool append) const {
  File file(com, filename, io::NCFIX_NETCDF3,
            append ? io::NCFIX_READWRITE : io::NCFIX_READWRITE_MOVE);
  this->write(file);
}

//! Name of the file this database was read from.
std::string Config::filename() const {
  return m_impl->filename;
}

//! Copy all parameters from `other`, marking them as set by the user.
/*!
 * Every parameter in `other` has to be known to this database.
 */
void Config::import_from(const Config &other) {
  auto known = this->keys();

  for (const auto &name : other.keys()) {
    if (known.count(name) == 0) {
      throw RuntimeError::formatted(NCFIX_ERROR_LOCATION,
                                    "unrecognized parameter %s in %s",
                                    name.c_str(), other.filename().c_str());
    }
  }

  for (const auto &p : other.all_doubles()) {
    this->set_number(p.first, p.second.at(0), CONFIG_USER);
  }

  for (const auto &p : other.all_strings()) {
    this->set_string(p.first, p.second, CONFIG_USER);
  }

  for (const auto &p : other.all_flags()) {
    this->set_flag(p.first, p.second, CONFIG_USER);
  }
}

const std::set<std::string>& Config::parameters_set_by_user() const {
  return m_impl->set_by_user;
}

const std::set<std::string>& Config::parameters_used() const {
  return m_impl->used;
}

bool Config::is_set(const std::string &name) const {
  return this->is_set_impl(name);
}

Config::Doubles Config::all_doubles() const {
  return this->all_doubles_impl();
}

// Throws if `value` is not an acceptable value of the parameter `name`.
static void check_number(const Config &config, const std::string &name, double value) {
  bool integer = config.type(name) == "integer";

  if (integer and std::round(value) != value) {
    throw RuntimeError::formatted(NCFIX_ERROR_LOCATION,
                                  "integer parameter '%s' was set to %f (not an integer)",
                                  name.c_str(), value);
  }

  auto min = config.valid_min(name);
  auto max = config.valid_max(name);

  if ((min.first and value < min.second) or (max.first and value > max.second)) {
    std::string range = printf("[%s, %s]",
                               min.first ? printf("%g", min.second).c_str() : "-inf",
                               max.first ? printf("%g", max.second).c_str() : "inf");
    throw RuntimeError::formatted(NCFIX_ERROR_LOCATION,
                                  "parameter '%s' = %g is outside its valid range %s",
                                  name.c_str(), value, range.c_str());
  }
}

double Config::get_number(const std::string &name, UseFlag flag) const {
  double value = this->get_number_impl(name);

  // The valid range is not checked when a parameter is not "used": this is how
  // default values of command-line options are obtained.
  if (flag == REMEMBER_THIS_USE) {
    m_impl->used.insert(name);
    check_number(*this, name, value);
  }

  return value;
}

double Config::get_number(const std::string &name,
                          const std::string &units,
                          UseFlag flag) const {
  double value = this->get_number(name, flag);
  std::string input_units = this->units(name);

  try {
    return units::convert(m_impl->unit_system, value, input_units, units);
  } catch (RuntimeError &e) {
    e.add_context("converting \"%s\" from \"%s\" to \"%s\"",
                  name.c_str(), input_units.c_str(), units.c_str());
    throw;
  }
}

void Config::set_number(const std::string &name, double value,
                        ConfigSettingFlag flag) {
  if (not m_impl->keep_current_value(name, flag)) {
    this->set_number_impl(name, value);
  }
}

Config::Strings Config::all_strings() const {
  return this->all_strings_impl();
}

std::string Config::get_string(const std::string &name, UseFlag flag) const {
  if (flag == REMEMBER_THIS_USE) {
    m_impl->used.insert(name);
  }
  return this->get_string_impl(name);
}

void Config::set_string(const std::string &name,
                        const std::string &value,
                        ConfigSettingFlag flag) {
  if (not m_impl->keep_current_value(name, flag)) {
    this->set_string_impl(name, value);
  }
}

Config::Flags Config::all_flags() const {
  return this->all_flags_impl();
}

bool Config::get_flag(const std::string& name, UseFlag flag) const {
  if (flag == REMEMBER_THIS_USE) {
    m_impl->used.insert(name);
  }
  return this->get_flag_impl(name);
}

void Config::set_flag(const std::string& name, bool value,
                      ConfigSettingFlag flag) {
  if (not m_impl->keep_current_value(name, flag)) {
    this->set_flag_impl(name, value);
  }
}

//! Names of all parameters (and their companion attributes).
std::set<std::string> Config::keys() const {
  std::set<std::string> result;

  for (const auto &p : all_doubles()) {
    result.insert(p.first);
  }
  for (const auto &p : all_strings()) {
    result.insert(p.first);
  }
  for (const auto &p : all_flags()) {
    result.insert(p.first);
  }

  return result;
}

// Returns the companion attribute `name` + `suffix` or an empty string.
static std::string companion(const Config &config, const std::string &name,
                             const std::string &suffix) {
  if (config.is_set(name + suffix)) {
    return config.get_string(name + suffix, Config::FORGET_THIS_USE);
  }
  return "";
}

std::string Config::doc(const std::string &parameter) const {
  return companion(*this, parameter, "_doc");
}

std::string Config::units(const std::string &parameter) const {
  return companion(*this, parameter, "_units");
}

std::string Config::type(const std::string &parameter) const {
  return companion(*this, parameter, "_type");
}

std::string Config::option(const std::string &parameter) const {
  return companion(*this, parameter, "_option");
}

std::string Config::choices(const std::string &parameter) const {
  return companion(*this, parameter, "_choices");
}

std::pair<bool, double> Config::valid_min(const std::string &parameter) const {
  std::string name = parameter + "_valid_min";
  if (is_set(name)) {
    return {true, get_number(name, FORGET_THIS_USE)};
  }
  return {false, 0.0};
}

std::pair<bool, double> Config::valid_max(const std::string &parameter) const {
  std::string name = parameter + "_valid_max";
  if (is_set(name)) {
    return {true, get_number(name, FORGET_THIS_USE)};
  }
  return {false, 0.0};
}

// Companion attributes and "long_name" (required by CF for the variable
// holding the database) are not parameters.
static bool special_parameter(const std::string &name) {
  for (const auto &suffix : {"_doc", "_units", "_type", "_option", "_choices",
        "_valid_min", "_valid_max"}) {
    if (ends_with(name, suffix)) {
      return true;
    }
  }
  return name == "long_name";
}

// Width of the longest parameter name in `names`.
template<typename T>
static size_t name_width(const T &names) {
  size_t result = 0;
  for (const auto &n : names) {
    if (not special_parameter(n.first)) {
      result = std::max(result, n.first.size());
    }
  }
  return result;
}

void print_config(const Logger &log, int verbosity_threshold, const Config &config) {
  const int v = verbosity_threshold;

  auto strings = config.all_strings();
  auto doubles = config.all_doubles();
  auto flags   = config.all_flags();

  size_t width = std::max(name_width(strings),
                          std::max(name_width(doubles), name_width(flags)));

  log.message(v, "### Strings:\n###\n");
  for (const auto &s : strings) {
    if (s.second.empty() or special_parameter(s.first)) {
      continue;
    }

    std::string choices;
    if (config.type(s.first) == "keyword") {
      choices = " (allowed choices: " + config.choices(s.first) + ")";
    }

    log.message(v, "  %-*s = \"%s\"%s\n", (int)width, s.first.c_str(),
                s.second.c_str(), choices.c_str());
  }

  log.message(v, "### Numbers:\n###\n");
  for (const auto &d : doubles) {
    if (d.second.empty() or special_parameter(d.first)) {
      continue;
    }

    std::string units = config.units(d.first);
    if (not units.empty()) {
      units = " (" + units + ")";
    }

    if (config.type(d.first) == "integer") {
      log.message(v, "  %-*s = %13.0f\n", (int)width, d.first.c_str(), d.second[0]);
    } else {
      log.message(v, "  %-*s = %13.5f%s\n", (int)width, d.first.c_str(), d.second[0],
                  units.c_str());
    }
  }

  log.message(v, "### Flags:\n###\n");
  for (const auto &f : flags) {
    log.message(v, "  %-*s = %s\n", (int)width, f.first.c_str(), f.second ? "true" : "false");
  }

  log.message(v, "### List of configuration parameters ends here.\n###\n");
}

//! Warn about parameters set by the user but never read.
/*!
 * Warnings are printed at `verbosity_threshold`, or always if `-options_left` is set.
 */
void print_unused_parameters(const Logger &log, int verbosity_threshold,
                             const Config &config) {
  if (options::Bool("-options_left", "report unused options")) {
    verbosity_threshold = log.get_threshold();
  }

  const auto &used = config.parameters_used();

  for (const auto &p : config.parameters_set_by_user()) {
    if (special_parameter(p) or used.count(p) > 0) {
      continue;
    }

    log.message(verbosity_threshold,
                "NCFIX WARNING: flag or parameter \"%s\" was set but was not used!\n",
                p.c_str());
  }
}

//! Set a flag parameter from `-option` or `-no_option`.
/*!
 * `-option` without an argument and `-option true|yes|on` set the flag,
 * `-option false|no|off` and `-no_option` clear it. Nothing changes if neither
 * option is given.
 */
void set_flag_from_option(Config &config, const std::string &option,
                          const std::string &parameter_name) {
  std::string doc = config.doc(parameter_name);
  bool current    = config.get_flag(parameter_name, Config::FORGET_THIS_USE);

  options::String opt("-" + option, doc, current ? "true" : "false", options::ALLOW_EMPTY);
  bool no_opt = options::Bool("-no_" + option, doc);

  if (opt.is_set() and no_opt) {
    throw RuntimeError::formatted(NCFIX_ERROR_LOCATION,
                                  "both -%s and -no_%s are set",
                                  option.c_str(), option.c_str());
  }

  if (no_opt) {
    config.set_flag(parameter_name, false, CONFIG_USER);
  } else if (opt.is_set()) {
    const std::string &value = opt.value();

    if (member(value, {"", "on", "yes", "true", "True"})) {
      config.set_flag(parameter_name, true, CONFIG_USER);
    } else if (member(value, {"off", "no", "false", "False"})) {
      config.set_flag(parameter_name, false, CONFIG_USER);
    } else {
      throw RuntimeError::formatted(NCFIX_ERROR_LOCATION, "invalid -%s argument: %s",
                                    option.c_str(), value.c_str());
    }
  }
}

//! Set a number from `-option`, converting it if the argument has units ("-scale_factor 200%").
void set_number_from_option(units::System::Ptr unit_system, Config &config,
                            const std::string &option, const std::string &parameter) {
  options::Real opt(unit_system, "-" + option, config.doc(parameter), config.units(parameter),
                    config.get_number(parameter, Config::FORGET_THIS_USE));
  if (opt.is_set()) {
    config.set_number(parameter, opt, CONFIG_USER);
  }
}

void set_integer_from_option(Config &config, const std::string &option,
                             const std::string &parameter) {
  // The default is never used: the parameter changes only if the option is given. The
  // current value may be out of int range (it is checked when used), so it is not cast.
  options::Integer opt("-" + option, config.doc(parameter), 0);
  if (opt.is_set()) {
    config.set_number(parameter, opt, CONFIG_USER);
  }
}

void set_string_from_option(Config &config, const std::string &option,
                            const std::string &parameter) {
  options::String opt("-" + option, config.doc(parameter),
                      config.get_string(parameter, Config::FORGET_THIS_USE));
  if (opt.is_set()) {
    config.set_string(parameter, opt, CONFIG_USER);
  }
}

//! Set a keyword from `-option`; the argument has to be one of comma-separated `choices`.
void set_keyword_from_option(Config &config, const std::string &option,
                             const std::string &parameter, const std::string &choices) {
  options::Keyword opt("-" + option, config.doc(parameter), choices,
                       config.get_string(parameter, Config::FORGET_THIS_USE));
  if (opt.is_set()) {
    config.set_string(parameter, opt, CONFIG_USER);
  }
}

//! Set `name` from the command line.
/*!
 * The option is `-name` or, if the parameter has an "_option" attribute, the
 * shorter `-option`. Setting both is an error.
 */
void set_parameter_from_options(units::System::Ptr unit_system, Config &config,
                                const std::string &name) {
  if (special_parameter(name)) {
    return;
  }

  std::string option = name;
  std::string short_option = config.option(name);

  if (not short_option.empty()) {
    std::string doc = config.doc(name);

    bool short_is_set = (options::Bool("-" + short_option, doc) or
                         options::Bool("-no_" + short_option, doc));

    if (short_is_set) {
      if (options::Bool("-" + name, doc)) {
        throw RuntimeError::formatted(NCFIX_ERROR_LOCATION,
                                      "both -%s and -%s are set (please use one or the other)",
                                      name.c_str(), short_option.c_str());
      }
      option = short_option;
    }
  }

  std::string type = config.type(name);

  if (type == "string") {
    set_string_from_option(config, option, name);
  } else if (type == "flag") {
    set_flag_from_option(config, option, name);
  } else if (type == "number") {
    set_number_from_option(unit_system, config, option, name);
  } else if (type == "integer") {
    set_integer_from_option(config, option, name);
  } else if (type == "keyword") {
    set_keyword_from_option(config, option, name, config.choices(name));
  } else {
    throw RuntimeError::formatted(NCFIX_ERROR_LOCATION,
                                  "parameter type \"%s\" of \"%s\" is invalid",
                                  type.c_str(), name.c_str());
  }
}

void set_config_from_options(units::System::Ptr unit_system, Config &config) {
  for (const auto &name : config.keys()) {
    set_parameter_from_options(unit_system, config, name);
  }
}

Config::Ptr config_from_options(MPI_Comm com, const Logger &log, units::System::Ptr unit_system) {
  options::String config_filename("-config", "Config file name", ncfix::config_file);
  options::String override_filename("-config_override", "Config override file name");

  auto config = std::make_shared<NetCDFConfig>(com, "ncfix_config", unit_system);
  config->read(com, config_filename);
  log.message(3, "Read configuration parameters from '%s'.\n", config_filename->c_str());

  if (override_filename.is_set()) {
    NetCDFConfig overrides(com, "ncfix_overrides", unit_system);
    overrides.read(com, override_filename);
    config->import_from(overrides);
    log.message(3, "Read configuration overrides from '%s'.\n", override_filename->c_str());
  }

  set_config_from_options(unit_system, *config);

  return config;
}

ConfigWithPrefix::ConfigWithPrefix(Config::ConstPtr c, const std::string &prefix)
  : m_prefix(prefix), m_config(c) {
  // empty
}

double ConfigWithPrefix::get_number(const std::string &name) const {
  return m_config->get_number(m_prefix + name);
}

double ConfigWithPrefix::get_number(const std::string &name, const std::string &units) const {
  return m_config->get_number(m_prefix + name, units);
}

std::string ConfigWithPrefix::get_string(const std::string &name) const {
  return m_config->get_string(m_prefix + name);
}

bool ConfigWithPrefix::get_flag(const std::string &name) const {
  return m_config->get_flag(m_prefix + name);
}

} // end of namespace ncfix
