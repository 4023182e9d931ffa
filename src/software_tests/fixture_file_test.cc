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

static char help[] =
  "Tests fixture files: layout, types, attributes and values.\n";

#include <cmath>
#include <memory>
#include <set>

#include <petscsys.h>

#include "ncfix/fixtures/FixtureGenerator.hh"
#include "ncfix/fixtures/LatLonGrid.hh"
#include "ncfix/fixtures/AnalyticFields.hh"
#include "ncfix/util/ConfigInterface.hh"
#include "ncfix/util/Context.hh"
#include "ncfix/util/Logger.hh"
#include "ncfix/util/io/File.hh"
#include "ncfix/util/io/IO_Flags.hh"
#include "ncfix/util/io/io_helpers.hh"
#include "ncfix/util/petscwrappers/PetscInitializer.hh"
#include "ncfix/software_tests/checks.hh"

using namespace ncfix;
using namespace ncfix::fixtures;

static const char *field_names[] = {"air_temperature", "eastward_wind", "northward_wind"};

static void test_layout(const Context &ctx) {
  const std::string filename = "fixture_file_test_layout.nc";

  generate(ctx, filename, 5, 4, 3);

  File file(ctx.com(), filename, io::NCFIX_GUESS, io::NCFIX_READONLY);

  NCFIX_CHECK(file.format() == "netcdf4");
  NCFIX_CHECK(file.backend() == io::NCFIX_NETCDF4_SERIAL);
  NCFIX_CHECK(file.nvariables() == 6);

  std::set<std::string> variables;
  for (unsigned int k = 0; k < file.nvariables(); ++k) {
    variables.insert(file.variable_name(k));
  }
  NCFIX_CHECK(variables == std::set<std::string>({"time", "lon", "lat", "air_temperature",
                                                  "eastward_wind", "northward_wind"}));

  NCFIX_CHECK(file.dimension_length("time") == 3);
  NCFIX_CHECK(file.dimension_length("lon") == 5);
  NCFIX_CHECK(file.dimension_length("lat") == 4);

  NCFIX_CHECK(file.variable_type("lon") == io::NCFIX_FLOAT);
  NCFIX_CHECK(file.variable_type("lat") == io::NCFIX_FLOAT);
  NCFIX_CHECK(file.variable_type("time") == io::NCFIX_DOUBLE);

  for (auto name : field_names) {
    NCFIX_CHECK(file.variable_exists(name));
    NCFIX_CHECK(file.variable_type(name) == io::NCFIX_FLOAT);
    NCFIX_CHECK(file.dimensions(name) == LatLonGrid::field_dimensions());
  }

  NCFIX_CHECK(file.read_text_attribute("time", "units") == "hours since 2000-01-01 00:00:00");
  NCFIX_CHECK(file.read_text_attribute("time", "calendar") == "standard");
  NCFIX_CHECK(file.read_text_attribute("lon", "units") == "degrees_east");
  NCFIX_CHECK(file.read_text_attribute("lat", "units") == "degrees_north");
  NCFIX_CHECK(file.read_text_attribute("lon", "axis") == "X");
  NCFIX_CHECK(file.read_text_attribute("lat", "axis") == "Y");

  NCFIX_CHECK(file.read_text_attribute("air_temperature", "units") == "K");
  NCFIX_CHECK(file.read_text_attribute("air_temperature", "long_name") == "Air Temperature");
  NCFIX_CHECK(file.read_text_attribute("eastward_wind", "units") == "m s-1");
  NCFIX_CHECK(file.read_text_attribute("eastward_wind", "long_name") == "Eastward Wind");
  NCFIX_CHECK(file.read_text_attribute("northward_wind", "units") == "m s-1");
  NCFIX_CHECK(file.read_text_attribute("northward_wind", "long_name") == "Northward Wind");

  NCFIX_CHECK(file.read_text_attribute("NCFIX_GLOBAL", "Conventions") == "CF-1.6");
  NCFIX_CHECK(not file.read_text_attribute("NCFIX_GLOBAL", "history").empty());
  auto scale = file.read_double_attribute("NCFIX_GLOBAL", "fixture_scale_factor");
  NCFIX_CHECK(scale.size() == 1 and scale[0] == 1.0);
  // the CF packing attribute must not appear
  NCFIX_CHECK(file.read_double_attribute("NCFIX_GLOBAL", "scale_factor").empty());
}

static void test_values(const Context &ctx) {
  const std::string filename = "fixture_file_test_values.nc";

  generate(ctx, filename, 6, 5, 2);

  LatLonGrid grid(ctx.unit_system(), 6, 5, 2);

  File file(ctx.com(), filename, io::NCFIX_GUESS, io::NCFIX_READONLY);

  NCFIX_CHECK(file.read_variable("lon") == grid.lon());
  NCFIX_CHECK(file.read_variable("lat") == grid.lat());

  auto time = file.read_variable("time");
  NCFIX_CHECK(time.size() == 2 and time[0] == 0.0 and time[1] == 1.0);

  auto T = file.read_variable("air_temperature");
  auto U = file.read_variable("eastward_wind");
  auto V = file.read_variable("northward_wind");

  NCFIX_CHECK(T.size() == 2 * 6 * 5);

  for (unsigned int t = 0; t < 2; ++t) {
    for (unsigned int i = 0; i < 6; ++i) {
      for (unsigned int j = 0; j < 5; ++j) {
        unsigned int k = (t * 6 + i) * 5 + j;
        float lon = static_cast<float>(grid.lon()[i]), lat = static_cast<float>(grid.lat()[j]);

        NCFIX_CHECK(T[k] == air_temperature(lon, lat));
        NCFIX_CHECK(U[k] == eastward_wind(lon, lat));
        NCFIX_CHECK(V[k] == northward_wind(lon, lat));
      }
    }
  }
}

static void test_scenarios(const Context &ctx) {
  generate(ctx, "fixture_file_test_a.nc", 20, 20, 1);
  generate(ctx, "fixture_file_test_b.nc", 20, 20, 1, 2.0);
  generate(ctx, "fixture_file_test_c.nc", 20, 20, 1, 3.0);

  File a(ctx.com(), "fixture_file_test_a.nc", io::NCFIX_GUESS, io::NCFIX_READONLY);
  File b(ctx.com(), "fixture_file_test_b.nc", io::NCFIX_GUESS, io::NCFIX_READONLY);
  File c(ctx.com(), "fixture_file_test_c.nc", io::NCFIX_GUESS, io::NCFIX_READONLY);

  auto T_a = a.read_variable("air_temperature");
  auto T_b = b.read_variable("air_temperature");

  float expected = 280.0f + 20.0f * std::sin(-90.0f) * std::cos(-180.0f);
  NCFIX_CHECK(T_a[0] == expected);

  // scaling by a power of two is exact, even in single precision
  NCFIX_CHECK(T_b[0] == 2.0 * T_a[0]);

  for (auto name : field_names) {
    auto unscaled = a.read_variable(name);
    auto doubled  = b.read_variable(name);
    auto tripled  = c.read_variable(name);

    NCFIX_CHECK(unscaled.size() == 400);

    for (unsigned int k = 0; k < unscaled.size(); ++k) {
      NCFIX_CHECK(doubled[k] == 2.0 * unscaled[k]);
      NCFIX_CHECK(tripled[k] == 3.0f * static_cast<float>(unscaled[k]));
    }
  }

  NCFIX_CHECK(b.read_double_attribute("NCFIX_GLOBAL", "fixture_scale_factor")[0] == 2.0);
}

static void test_idempotence(const Context &ctx) {
  const std::string filename = "fixture_file_test_repeat.nc";

  std::vector<std::vector<double> > first, second;

  generate(ctx, filename, 8, 6, 2, 1.25);
  {
    File file(ctx.com(), filename, io::NCFIX_GUESS, io::NCFIX_READONLY);
    for (auto name : field_names) {
      first.push_back(file.read_variable(name));
    }
  }

  generate(ctx, filename, 8, 6, 2, 1.25);
  {
    File file(ctx.com(), filename, io::NCFIX_GUESS, io::NCFIX_READONLY);
    for (auto name : field_names) {
      second.push_back(file.read_variable(name));
    }
  }

  NCFIX_CHECK(first == second);
}

static void test_netcdf3(Context &ctx) {
  auto config = ctx.config();
  const std::string filename = "fixture_file_test_netcdf3.nc";

  config->set_string("output.format", "netcdf3");
  generate(ctx, filename, 3, 3, 1);
  config->set_string("output.format", "netcdf4_serial");

  File file(ctx.com(), filename, io::NCFIX_GUESS, io::NCFIX_READONLY);
  NCFIX_CHECK(file.format() == "netcdf3");
  NCFIX_CHECK(file.backend() == io::NCFIX_NETCDF3);
  NCFIX_CHECK(file.variable_type("air_temperature") == io::NCFIX_FLOAT);
  NCFIX_CHECK(file.read_variable("air_temperature").size() == 9);
}

static void test_compression(Context &ctx) {
  auto config = ctx.config();

  config->set_number("output.compression_level", 5);
  generate(ctx, "fixture_file_test_deflated.nc", 10, 10, 4);
  config->set_number("output.compression_level", 0);
  generate(ctx, "fixture_file_test_plain.nc", 10, 10, 4);

  File deflated(ctx.com(), "fixture_file_test_deflated.nc", io::NCFIX_GUESS, io::NCFIX_READONLY);
  File plain(ctx.com(), "fixture_file_test_plain.nc", io::NCFIX_GUESS, io::NCFIX_READONLY);

  for (auto name : field_names) {
    NCFIX_CHECK(deflated.read_variable(name) == plain.read_variable(name));
  }
}

static void test_backup(Context &ctx) {
  auto config = ctx.config();
  const std::string filename = "fixture_file_test_backup.nc";

  io::remove_if_exists(ctx.com(), filename + "~");

  config->set_flag("output.backup_existing", true);
  generate(ctx, filename, 2, 2, 1);
  generate(ctx, filename, 2, 2, 1, 2.0);
  config->set_flag("output.backup_existing", false);

  NCFIX_CHECK(io::file_exists(ctx.com(), filename + "~"));

  File old_file(ctx.com(), filename + "~", io::NCFIX_GUESS, io::NCFIX_READONLY);
  NCFIX_CHECK(old_file.read_double_attribute("NCFIX_GLOBAL", "fixture_scale_factor")[0] == 1.0);
}

static void test_messages(Context &ctx) {
  auto log = std::make_shared<StringLogger>(ctx.com(), 2);
  Context capturing(ctx.com(), ctx.unit_system(), ctx.config(), log);

  generate(capturing, "fixture_file_test_messages_in.nc", 2, 2, 1);
  NCFIX_CHECK(log->get() == "Created test input data file: fixture_file_test_messages_in.nc\n");
  log->reset();

  // an explicit scale factor means "expected output", even if it is 1
  generate(capturing, "fixture_file_test_messages_out.nc", 2, 2, 1, 1.0);
  NCFIX_CHECK(log->get() ==
              "Created test output data file (scaled by 1.0): fixture_file_test_messages_out.nc\n");
  log->reset();

  generate(capturing, "fixture_file_test_messages_out.nc", 2, 2, 1, 0.5);
  NCFIX_CHECK(log->get() ==
              "Created test output data file (scaled by 0.5): fixture_file_test_messages_out.nc\n");
}

static void test_generate_from_config(Context &ctx) {
  auto config = ctx.config();
  const std::string directory = "fixture_file_test_output/nested/data";

  config->set_string("output.directory", directory);
  config->set_number("grid.nx", 6);
  config->set_number("grid.ny", 4);
  config->set_number("time.steps", 2);

  generate_from_config(ctx);

  NCFIX_CHECK(io::file_exists(ctx.com(), directory + "/input_test.nc"));
  NCFIX_CHECK(io::file_exists(ctx.com(), directory + "/expected_output.nc"));

  File input(ctx.com(), directory + "/input_test.nc", io::NCFIX_GUESS, io::NCFIX_READONLY);
  File expected(ctx.com(), directory + "/expected_output.nc", io::NCFIX_GUESS, io::NCFIX_READONLY);

  NCFIX_CHECK(input.dimension_length("lon") == 6);
  NCFIX_CHECK(input.dimension_length("lat") == 4);
  NCFIX_CHECK(input.dimension_length("time") == 2);

  auto T_in  = input.read_variable("air_temperature");
  auto T_out = expected.read_variable("air_temperature");
  for (unsigned int k = 0; k < T_in.size(); ++k) {
    NCFIX_CHECK(T_out[k] == 2.0 * T_in[k]);
  }

  // the directory exists now: running again is fine
  generate_from_config(ctx);
}

int main(int argc, char *argv[]) {

  MPI_Comm com = MPI_COMM_WORLD;
  petsc::Initializer petsc(argc, argv, help);

  com = PETSC_COMM_WORLD;

  try {
    auto ctx = context_from_options(com);

    test_layout(*ctx);
    test_values(*ctx);
    test_scenarios(*ctx);
    test_idempotence(*ctx);
    test_netcdf3(*ctx);
    test_compression(*ctx);
    test_backup(*ctx);
    test_messages(*ctx);
    test_generate_from_config(*ctx);

    ctx->log()->message(1, "fixture_file_test: all checks passed\n");
  }
  catch (...) {
    handle_fatal_errors(com);
    return 1;
  }

  return 0;
}
