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

#include <cerrno>
#include <cstdio>               // rename, remove
#include <cstring>              // strerror
#include <functional>

#include <sys/stat.h>           // mkdir, stat
#include <sys/types.h>

#include "ncfix/util/io/io_helpers.hh"
#include "ncfix/util/io/File.hh"
#include "ncfix/util/io/IO_Flags.hh"
#include "ncfix/util/VariableMetadata.hh"
#include "ncfix/util/error_handling.hh"
#include "ncfix/util/ncfix_utilities.hh"

namespace ncfix {
namespace io {

//! Output type of `metadata`, using NCFIX_DOUBLE if it is not set.
static io::Type output_type(const VariableMetadata &metadata) {
  io::Type result = metadata.get_output_type();
  return result == NCFIX_NAT ? NCFIX_DOUBLE : result;
}

//! Define a dimension and its coordinate variable (named after the dimension).
void define_dimension(const File &file, unsigned long int length,
                      const VariableMetadata &metadata) {
  std::string name = metadata.get_name();
  try {
    file.define_dimension(name, length);

    auto type = output_type(metadata);
    file.define_variable(name, type, {name});
    write_attributes(file, metadata, type);
  } catch (RuntimeError &e) {
    e.add_context("defining dimension '%s' in '%s'", name.c_str(), file.name().c_str());
    throw;
  }
}

//! Define a variable. All its dimensions have to be defined already.
void define_variable(const File &file, const VariableMetadata &metadata) {
  std::string name = metadata.get_name();
  try {
    for (const auto &d : metadata.dimensions()) {
      if (not file.dimension_exists(d)) {
        throw RuntimeError::formatted(NCFIX_ERROR_LOCATION, "dimension '%s' is not defined",
                                      d.c_str());
      }
    }

    auto type = output_type(metadata);
    file.define_variable(name, type, metadata.dimensions());
    write_attributes(file, metadata, type);
  } catch (RuntimeError &e) {
    e.add_context("defining variable '%s' in '%s'", name.c_str(), file.name().c_str());
    throw;
  }
}

//! Write all values of a variable (last dimension varying fastest).
void write_variable(const File &file, const VariableMetadata &metadata,
                    const std::vector<double> &data) {
  std::string name = metadata.get_name();
  try {
    auto dims = file.dimensions(name);

    std::vector<unsigned int> start(dims.size(), 0), count;
    size_t size = 1;
    for (const auto &d : dims) {
      count.push_back(file.dimension_length(d));
      size *= count.back();
    }

    if (data.size() != size) {
      throw RuntimeError::formatted(NCFIX_ERROR_LOCATION,
                                    "expected %d values, got %d",
                                    (int)size, (int)data.size());
    }

    file.write_variable(name, start, count, data.data());
  } catch (RuntimeError &e) {
    e.add_context("writing variable '%s' to '%s'", name.c_str(), file.name().c_str());
    throw;
  }
}

//! Read dimensions, type and all attributes of a variable (or global attributes).
VariableMetadata read_attributes(const File &file,
                                 const std::string &variable_name,
                                 std::shared_ptr<units::System> unit_system) {
  VariableMetadata result(variable_name, unit_system);

  try {
    if (variable_name != "NCFIX_GLOBAL") {
      if (not file.variable_exists(variable_name)) {
        throw RuntimeError::formatted(NCFIX_ERROR_LOCATION, "variable '%s' is missing",
                                      variable_name.c_str());
      }

      result.set_dimensions(file.dimensions(variable_name));
      result.set_output_type(file.variable_type(variable_name));
    }

    unsigned int n_attributes = file.nattributes(variable_name);
    for (unsigned int j = 0; j < n_attributes; ++j) {
      std::string name = file.attribute_name(variable_name, j);

      if (file.attribute_type(variable_name, name) == NCFIX_CHAR) {
        result[name] = file.read_text_attribute(variable_name, name);
      } else {
        result[name] = file.read_double_attribute(variable_name, name);
      }
    }
  } catch (RuntimeError &e) {
    e.add_context("reading attributes of variable '%s' from '%s'",
                  variable_name.c_str(), file.name().c_str());
    throw;
  }
  return result;
}

//! Write attributes of `variable`, using `nctype` for numbers.
/*!
 * "units" goes first. A valid_min/valid_max pair is written as valid_range.
 * Empty text attributes are skipped.
 */
void write_attributes(const File &file, const VariableMetadata &variable, io::Type nctype) {
  std::string name = variable.get_name();

  try {
    if (variable.has_attribute("units")) {
      file.write_attribute(name, "units", variable.get_string("units"));
    }

    for (const auto &s : variable.all_strings()) {
      if (s.first != "units" and not s.second.empty()) {
        file.write_attribute(name, s.first, s.second);
      }
    }

    auto doubles = variable.all_doubles();
    if (doubles.count("valid_min") > 0 and doubles.count("valid_max") > 0) {
      doubles["valid_range"] = {doubles["valid_min"][0], doubles["valid_max"][0]};
      doubles.erase("valid_min");
      doubles.erase("valid_max");
    }

    for (const auto &d : doubles) {
      if (not d.second.empty()) {
        file.write_attribute(name, d.first, nctype, d.second);
      }
    }
  } catch (RuntimeError &e) {
    e.add_context("writing attributes of variable '%s' to '%s'",
                  name.c_str(), file.name().c_str());
    throw;
  }
}

// Runs `operation` on rank `rank_to_use` and broadcasts its result (0 or an errno value).
static int run_on_one_rank(MPI_Comm com, int rank_to_use,
                           const std::function<int()> &operation) {
  int rank = 0, result = 0;
  MPI_Comm_rank(com, &rank);

  if (rank == rank_to_use) {
    result = operation();
  }
  MPI_Bcast(&result, 1, MPI_INT, rank_to_use, com);

  return result;
}

static bool exists(const std::string &path) {
  struct stat info;
  return stat(path.c_str(), &info) == 0;
}

bool file_exists(MPI_Comm com, const std::string &filename) {
  return run_on_one_rank(com, 0, [&]() { return exists(filename) ? 1 : 0; }) == 1;
}

//! Rename `file_to_move` to `file_to_move~` if it exists.
void move_if_exists(MPI_Comm com, const std::string &file_to_move, int rank_to_use) {
  std::string backup = file_to_move + "~";

  int error = run_on_one_rank(com, rank_to_use, [&]() -> int {
      if (not exists(file_to_move)) {
        return 0;
      }
      return rename(file_to_move.c_str(), backup.c_str()) == 0 ? 0 : errno;
    });

  if (error != 0) {
    throw RuntimeError::formatted(NCFIX_ERROR_LOCATION, "can't move '%s' to '%s': %s",
                                  file_to_move.c_str(), backup.c_str(), strerror(error));
  }
}

void remove_if_exists(MPI_Comm com, const std::string &file_to_remove, int rank_to_use) {
  int error = run_on_one_rank(com, rank_to_use, [&]() -> int {
      if (not exists(file_to_remove)) {
        return 0;
      }
      return remove(file_to_remove.c_str()) == 0 ? 0 : errno;
    });

  if (error != 0) {
    throw RuntimeError::formatted(NCFIX_ERROR_LOCATION, "can't remove '%s': %s",
                                  file_to_remove.c_str(), strerror(error));
  }
}

// Creates one directory; returns 0 if it exists already and errno otherwise.
static int make_one_directory(const std::string &path) {
  if (mkdir(path.c_str(), 0777) == 0) {
    return 0;
  }

  if (errno != EEXIST) {
    return errno;
  }

  struct stat info;
  if (stat(path.c_str(), &info) == 0 and S_ISDIR(info.st_mode)) {
    return 0;
  }
  return ENOTDIR;
}

//! Create a directory and missing parents. Succeeds if it exists already.
void make_directory(MPI_Comm com, const std::string &path, int rank_to_use) {
  if (path.empty()) {
    throw RuntimeError(NCFIX_ERROR_LOCATION, "cannot create a directory: empty path");
  }

  int error = run_on_one_rank(com, rank_to_use, [&]() -> int {
      std::string prefix = path[0] == '/' ? "/" : "";

      for (const auto &component : split(path, '/')) {
        prefix += component;

        int code = make_one_directory(prefix);
        if (code != 0) {
          return code;
        }

        prefix += "/";
      }
      return 0;
    });

  if (error != 0) {
    throw RuntimeError::formatted(NCFIX_ERROR_LOCATION,
                                  "can't create directory '%s': %s",
                                  path.c_str(), strerror(error));
  }
}

} // end of namespace io
} // end of namespace ncfix
