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

#include <cmath>

#include "ncfix/fixtures/FixtureGenerator.hh"
#include "ncfix/fixtures/LatLonGrid.hh"
#include "ncfix/fixtures/AnalyticFields.hh"
#include "ncfix/ncfix_config.hh"
#include "ncfix/util/Context.hh"
#include "ncfix/util/ConfigInterface.hh"
#include "ncfix/util/Logger.hh"
#include "ncfix/util/VariableMetadata.hh"
#include "ncfix/util/error_handling.hh"
#include "ncfix/util/ncfix_utilities.hh"
#include "ncfix/util/io/File.hh"
#include "ncfix/util/io/IO_Flags.hh"
#include "ncfix/util/io/io_helpers.hh"

namespace ncfix {
namespace fixtures {

//! Format a scale factor the way it appears in log messages ("2.0", "0.5", "1e+20").
static std::string format_scale_factor(double scale_factor) {
  std::string result = ncfix::printf("%g", scale_factor);

  if (std::isfinite(scale_factor) and
      result.find_first_of(".e") == std::string::npos) {
    result += ".0";
  }

  return result;
}

static std::string join_path(const std::string &directory, const std::string &filename) {
  if (directory.empty()) {
    return filename;
  }

  if (ends_with(directory, "/")) {
    return directory + filename;
  }

  return directory + "/" + filename;
}

static void write_global_attributes(const File &file, units::System::Ptr sys,
                                    double scale_factor) {
  VariableMetadata global("NCFIX_GLOBAL", sys);

  global["Conventions"]  = "CF-1.6";
  global["source"]       = std::string("ncfix ") + ncfix::revision;
  // "scale_factor" is reserved for packed data by CF
  global.set_number("fixture_scale_factor", scale_factor);

  io::write_attributes(file, global, io::NCFIX_DOUBLE);

  file.append_history(username_prefix(file.com()) + args_string());
}

static void write_fixture(const Context &ctx, const std::string &filename,
                          int nx, int ny, int time_steps, double scale_factor,
                          bool expected_output) {
  try {
    if (not (scale_factor >= 0.0)) {
      throw RuntimeError::formatted(NCFIX_ERROR_LOCATION,
                                    "scale_factor = %f is invalid (has to be non-negative)",
                                    scale_factor);
    }

    auto sys = ctx.unit_system();
    const Logger &log = *ctx.log();
    ConfigWithPrefix output(ctx.config(), "output.");

    // validates sizes: this has to happen before the file is created
    LatLonGrid grid(sys, nx, ny, time_steps);

    auto fields = analytic_fields(grid, scale_factor, sys);

    io::Backend backend = io::string_to_backend(output.get_string("format"));
    io::Mode mode = output.get_flag("backup_existing") ?
      io::NCFIX_READWRITE_MOVE : io::NCFIX_READWRITE_CLOBBER;

    File file(ctx.com(), filename, backend, mode);

    file.set_compression_level(static_cast<int>(output.get_number("compression_level")));

    write_global_attributes(file, sys, scale_factor);

    grid.define(file);
    for (const auto &f : fields) {
      io::define_variable(file, f.metadata);
    }

    grid.write(file);
    for (const auto &f : fields) {
      io::write_variable(file, f.metadata, f.values);
    }

    file.close();

    if (not expected_output) {
      log.message(2, "Created test input data file: %s\n", filename.c_str());
    } else {
      log.message(2, "Created test output data file (scaled by %s): %s\n",
                  format_scale_factor(scale_factor).c_str(), filename.c_str());
    }

    for (const auto &f : fields) {
      f.metadata.report_range(log, 3, f.min(), f.max());
      f.metadata.report_to_stdout(log, 4);
    }
  } catch (RuntimeError &e) {
    e.add_context("generating fixture file '%s'", filename.c_str());
    throw;
  }
}

void generate(const Context &ctx, const std::string &filename,
              int nx, int ny, int time_steps) {
  write_fixture(ctx, filename, nx, ny, time_steps, 1.0, false);
}

void generate(const Context &ctx, const std::string &filename,
              int nx, int ny, int time_steps, double scale_factor) {
  write_fixture(ctx, filename, nx, ny, time_steps, scale_factor, true);
}

void generate_from_config(const Context &ctx) {
  auto config = ctx.config();
  ConfigWithPrefix output(config, "output.");

  const int
    nx         = static_cast<int>(config->get_number("grid.nx")),
    ny         = static_cast<int>(config->get_number("grid.ny")),
    time_steps = static_cast<int>(config->get_number("time.steps"));

  const double scale_factor = output.get_number("scale_factor");

  std::string directory = output.get_string("directory");

  if (not directory.empty()) {
    io::make_directory(ctx.com(), directory);
  }

  generate(ctx, join_path(directory, output.get_string("input_file")),
           nx, ny, time_steps);

  generate(ctx, join_path(directory, output.get_string("expected_file")),
           nx, ny, time_steps, scale_factor);
}

} // end of namespace fixtures
} // end of namespace ncfix
