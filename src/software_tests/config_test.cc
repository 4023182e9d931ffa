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
  "Tests the configuration database.\n";

#include <petscsys.h>

#include "ncfix/ncfix_config.hh"
#include "ncfix/util/ConfigInterface.hh"
#include "ncfix/util/NetCDFConfig.hh"
#include "ncfix/util/Context.hh"
#include "ncfix/util/Logger.hh"
#include "ncfix/util/petscwrappers/PetscInitializer.hh"
#include "ncfix/software_tests/checks.hh"

using namespace ncfix;

static void test_defaults(const Config &config) {
  NCFIX_CHECK(config.get_number("grid.nx") == 20);
  NCFIX_CHECK(config.get_number("grid.ny") == 20);
  NCFIX_CHECK(config.get_number("time.steps") == 1);
  NCFIX_CHECK(config.get_number("output.scale_factor") == 2.0);
  NCFIX_CHECK(config.get_number("output.compression_level") == 0);
  NCFIX_CHECK(config.get_string("output.directory") == "tests/data");
  NCFIX_CHECK(config.get_string("output.input_file") == "input_test.nc");
  NCFIX_CHECK(config.get_string("output.expected_file") == "expected_output.nc");
  NCFIX_CHECK(config.get_string("output.format") == "netcdf4_serial");
  NCFIX_CHECK(not config.get_flag("output.backup_existing"));

  NCFIX_CHECK(config.type("grid.nx") == "integer");
  NCFIX_CHECK(config.type("output.scale_factor") == "number");
  NCFIX_CHECK(config.type("output.format") == "keyword");
  NCFIX_CHECK(config.type("output.backup_existing") == "flag");
  NCFIX_CHECK(config.option("grid.nx") == "nx");
  NCFIX_CHECK(config.option("output.backup_existing").empty());
  NCFIX_CHECK(config.choices("output.format") == "netcdf3,netcdf4_serial");
  NCFIX_CHECK(config.units("output.scale_factor") == "1");
  NCFIX_CHECK(not config.doc("grid.ny").empty());

  auto min = config.valid_min("grid.nx");
  NCFIX_CHECK(min.first and min.second == 1);
  auto max = config.valid_max("grid.nx");
  NCFIX_CHECK(max.first and max.second == 100000);
  NCFIX_CHECK(config.valid_max("time.steps").first);
  NCFIX_CHECK(not config.valid_max("output.scale_factor").first);

  // flags are not reported as strings
  NCFIX_CHECK(config.all_strings().count("output.backup_existing") == 0);
  NCFIX_CHECK(config.all_flags().count("output.backup_existing") == 1);

  NCFIX_CHECK_CLOSE(config.get_number("output.scale_factor", "percent"), 200.0, 1e-9);
}

static void test_validation(MPI_Comm com, units::System::Ptr sys) {
  NetCDFConfig config(com, "ncfix_config", sys);
  config.read(com, ncfix::config_file);

  NCFIX_CHECK(config.filename() == ncfix::config_file);

  config.set_number("grid.nx", 0);
  NCFIX_EXPECT_FAILURE("grid.nx below valid_min", [&]() { config.get_number("grid.nx"); });
  // the valid range is not checked when getting a default value
  NCFIX_CHECK(config.get_number("grid.nx", Config::FORGET_THIS_USE) == 0);

  config.set_number("time.steps", 3e9);
  NCFIX_EXPECT_FAILURE("time.steps above valid_max", [&]() { config.get_number("time.steps"); });

  config.set_number("grid.ny", 2.5);
  NCFIX_EXPECT_FAILURE("fractional grid.ny", [&]() { config.get_number("grid.ny"); });

  config.set_number("output.compression_level", 10);
  NCFIX_EXPECT_FAILURE("compression level above valid_max",
                       [&]() { config.get_number("output.compression_level"); });

  config.set_number("output.scale_factor", -0.5);
  NCFIX_EXPECT_FAILURE("negative scale factor",
                       [&]() { config.get_number("output.scale_factor"); });

  config.set_string("output.backup_existing", "maybe");
  NCFIX_EXPECT_FAILURE("invalid flag", [&]() { config.get_flag("output.backup_existing"); });

  NCFIX_EXPECT_FAILURE("unset parameter", [&]() { config.get_number("grid.nz"); });
  NCFIX_EXPECT_FAILURE("unset parameter", [&]() { config.get_string("output.title"); });
}

static void test_setting_flags(MPI_Comm com, units::System::Ptr sys) {
  NetCDFConfig config(com, "ncfix_config", sys);
  config.read(com, ncfix::config_file);

  config.set_number("grid.nx", 30, CONFIG_USER);
  config.set_number("grid.nx", 40, CONFIG_DEFAULT);
  NCFIX_CHECK(config.get_number("grid.nx") == 30);

  config.set_number("grid.nx", 50, CONFIG_FORCE);
  NCFIX_CHECK(config.get_number("grid.nx") == 50);

  config.set_number("grid.ny", 40, CONFIG_DEFAULT);
  NCFIX_CHECK(config.get_number("grid.ny") == 40);

  NCFIX_CHECK(config.parameters_set_by_user().count("grid.nx") == 1);
  NCFIX_CHECK(config.parameters_set_by_user().count("grid.ny") == 0);
  NCFIX_CHECK(config.parameters_used().count("grid.nx") == 1);
}

static void test_write_and_read(MPI_Comm com, units::System::Ptr sys) {
  const std::string filename = "config_test_copy.nc";

  NetCDFConfig config(com, "ncfix_config", sys);
  config.read(com, ncfix::config_file);

  config.set_number("grid.nx", 7);
  config.set_string("output.directory", "fixtures");
  config.set_flag("output.backup_existing", true);
  config.write(com, filename, false);

  NetCDFConfig copy(com, "ncfix_config", sys);
  copy.read(com, filename);

  NCFIX_CHECK(copy.get_number("grid.nx") == 7);
  NCFIX_CHECK(copy.get_number("output.scale_factor") == 2.0);
  NCFIX_CHECK(copy.get_string("output.directory") == "fixtures");
  NCFIX_CHECK(copy.get_flag("output.backup_existing"));
  NCFIX_CHECK(copy.type("grid.nx") == "integer");
}

static void test_overrides(MPI_Comm com, units::System::Ptr sys) {
  const std::string filename = "config_test_overrides.nc";

  {
    NetCDFConfig overrides(com, "ncfix_overrides", sys);
    overrides.set_number("grid.ny", 12);
    overrides.set_string("output.format", "netcdf3");
    overrides.write(com, filename, false);
  }

  NetCDFConfig config(com, "ncfix_config", sys);
  config.read(com, ncfix::config_file);

  NetCDFConfig overrides(com, "ncfix_overrides", sys);
  overrides.read(com, filename);

  config.import_from(overrides);

  NCFIX_CHECK(config.get_number("grid.ny") == 12);
  NCFIX_CHECK(config.get_string("output.format") == "netcdf3");
  NCFIX_CHECK(config.parameters_set_by_user().count("grid.ny") == 1);

  // type information of overridden parameters is kept
  NCFIX_CHECK(config.type("grid.ny") == "integer");

  NetCDFConfig unknown(com, "ncfix_overrides", sys);
  unknown.set_number("grid.nz", 3);

  NCFIX_EXPECT_FAILURE("unknown override", [&]() { config.import_from(unknown); });
}

static void test_reporting(MPI_Comm com, units::System::Ptr sys) {
  NetCDFConfig config(com, "ncfix_config", sys);
  config.read(com, ncfix::config_file);

  StringLogger log(com, 3);

  print_config(log, 3, config);

  std::string output = log.get();
  NCFIX_CHECK(output.find("grid.nx") != std::string::npos);
  NCFIX_CHECK(output.find("(allowed choices: netcdf3,netcdf4_serial)") != std::string::npos);
  NCFIX_CHECK(output.find("output.backup_existing") != std::string::npos);
  NCFIX_CHECK(output.find("_doc") == std::string::npos);

  log.reset();

  config.set_number("output.compression_level", 3, CONFIG_USER);
  config.set_number("grid.nx", 10, CONFIG_USER);
  config.get_number("grid.nx");

  print_unused_parameters(log, 3, config);

  output = log.get();
  NCFIX_CHECK(output.find("\"output.compression_level\" was set but was not used") !=
              std::string::npos);
  NCFIX_CHECK(output.find("grid.nx") == std::string::npos);
}

int main(int argc, char *argv[]) {

  MPI_Comm com = MPI_COMM_WORLD;
  petsc::Initializer petsc(argc, argv, help);

  com = PETSC_COMM_WORLD;

  try {
    auto ctx = context_from_options(com);
    auto sys = ctx->unit_system();

    test_defaults(*ctx->config());
    test_validation(com, sys);
    test_setting_flags(com, sys);
    test_write_and_read(com, sys);
    test_overrides(com, sys);
    test_reporting(com, sys);

    ctx->log()->message(1, "config_test: all checks passed\n");
  }
  catch (...) {
    handle_fatal_errors(com);
    return 1;
  }

  return 0;
}
