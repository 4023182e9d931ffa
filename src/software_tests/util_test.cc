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
  "Tests utilities: units, variable metadata, logging, errors and string helpers.\n";

#include <string>

#include <petscsys.h>

#include "ncfix/util/Context.hh"
#include "ncfix/util/Logger.hh"
#include "ncfix/util/Units.hh"
#include "ncfix/util/VariableMetadata.hh"
#include "ncfix/util/ncfix_utilities.hh"
#include "ncfix/util/io/IO_Flags.hh"
#include "ncfix/util/petscwrappers/PetscInitializer.hh"
#include "ncfix/software_tests/checks.hh"

using namespace ncfix;

static void test_units(units::System::Ptr sys) {
  NCFIX_CHECK_CLOSE(units::convert(sys, 1.0, "km", "m"), 1000.0, 1e-9);
  NCFIX_CHECK_CLOSE(units::convert(sys, 36.0, "km hour-1", "m s-1"), 10.0, 1e-9);

  units::Converter celsius(sys, "degC", "K");
  NCFIX_CHECK_CLOSE(celsius(0.0), 273.15, 1e-9);

  units::Unit wind(sys, "m s-1"), speed(sys, "km hour-1"), kelvin(sys, "K");
  NCFIX_CHECK(wind.is_convertible(speed));
  NCFIX_CHECK(not wind.is_convertible(kelvin));

  units::Unit copy = kelvin;
  NCFIX_CHECK(copy.is_convertible(kelvin));

  NCFIX_EXPECT_FAILURE("invalid unit", [&]() { units::Unit(sys, "not_a_unit_string"); });
  NCFIX_EXPECT_FAILURE("incompatible units", [&]() { units::convert(sys, 1.0, "K", "m"); });
}

static void test_metadata(units::System::Ptr sys) {
  VariableMetadata var("air_temperature", sys, {"time", "lon", "lat"});

  var["units"]     = "K";
  var["long_name"] = "Air Temperature";
  var["comment"]   = "";
  var.set_number("valid_min", 150.0);
  var.set_number("valid_max", 350.0);
  var["flag_values"] = {1.0, 2.0, 3.0};

  NCFIX_CHECK(var.get_name() == "air_temperature");
  NCFIX_CHECK(var.dimensions().size() == 3);
  NCFIX_CHECK(var.get_string("units") == "K");
  NCFIX_CHECK(var.has_attribute("long_name"));
  NCFIX_CHECK(not var.has_attribute("comment"));
  NCFIX_CHECK(not var.has_attribute("standard_name"));
  NCFIX_CHECK(var.get_numbers("flag_values").size() == 3);
  NCFIX_CHECK(var.get_output_type() == io::NCFIX_NAT);

  var.set_output_type(io::NCFIX_FLOAT);
  NCFIX_CHECK(var.get_output_type() == io::NCFIX_FLOAT);

  auto e = NCFIX_EXPECT_FAILURE("invalid units", [&]() { var["units"] = "degrees Kelvinish"; });
  NCFIX_CHECK(testing::context_contains(e, "air_temperature"));

  StringLogger log(MPI_COMM_SELF, 3);
  var.report_range(log, 3, 260.0, 300.0);
  NCFIX_CHECK(log.get().find("Air Temperature") != std::string::npos);
  NCFIX_CHECK(log.get().find("min,max") != std::string::npos);

  log.reset();
  var.report_to_stdout(log, 3);
  NCFIX_CHECK(log.get().find("long_name") != std::string::npos);
  NCFIX_CHECK(log.get().find("valid_max") != std::string::npos);
  NCFIX_CHECK(log.get().find("comment") == std::string::npos);
}

static void test_logger(MPI_Comm com) {
  StringLogger log(com, 2);

  log.message(3, "hidden\n");
  NCFIX_CHECK(log.get().empty());

  log.message(2, "shown %d\n", 1);
  log.message(1, std::string("shown 2\n"));
  NCFIX_CHECK(log.get() == "shown 1\nshown 2\n");

  log.error("something went wrong\n");
  NCFIX_CHECK(log.errors() == "something went wrong\n");
  NCFIX_CHECK(log.get() == "shown 1\nshown 2\n");

  log.disable();
  log.message(1, "disabled\n");
  log.enable();
  NCFIX_CHECK(log.get().find("disabled") == std::string::npos);

  log.set_threshold(5);
  NCFIX_CHECK(log.get_threshold() == 5);

  log.reset();
  NCFIX_CHECK(log.get().empty() and log.errors().empty());
}

static void test_errors() {
  RuntimeError e = RuntimeError::formatted(NCFIX_ERROR_LOCATION, "value %d is invalid", 42);
  NCFIX_CHECK(std::string(e.what()) == "value 42 is invalid");

  e.add_context("reading '%s'", "file.nc");
  e.add_context("processing option -%s", "nx");
  NCFIX_CHECK(e.context().size() == 2);
  NCFIX_CHECK(e.context()[0] == "reading 'file.nc'");
  NCFIX_CHECK(e.context()[1] == "processing option -nx");
}

static void test_strings() {
  NCFIX_CHECK(join({"a", "b", "c"}, ",") == "a,b,c");
  NCFIX_CHECK(join({}, ",").empty());

  auto tokens = split("netcdf3,netcdf4_serial", ',');
  NCFIX_CHECK(tokens.size() == 2 and tokens[1] == "netcdf4_serial");
  NCFIX_CHECK(set_split("b,a,b", ',').size() == 2);
  NCFIX_CHECK(member("a", {"a", "b"}));

  NCFIX_CHECK(ends_with("input_test.nc", ".nc"));
  NCFIX_CHECK(not ends_with("nc", "input_test.nc"));

  NCFIX_CHECK(parse_integer("20") == 20);
  NCFIX_EXPECT_FAILURE("parse_integer(\"1.5\")", [&]() { parse_integer("1.5"); });
  NCFIX_CHECK(parse_integer("-2147483648") == -2147483647 - 1);
  // values that do not fit in an int must not wrap around
  NCFIX_EXPECT_FAILURE("parse_integer(\"4294967297\")", [&]() { parse_integer("4294967297"); });
  NCFIX_EXPECT_FAILURE("parse_integer(\"-4294967276\")", [&]() { parse_integer("-4294967276"); });
  NCFIX_EXPECT_FAILURE("parse_integer(\"99999999999999999999\")",
                       [&]() { parse_integer("99999999999999999999"); });

  NCFIX_CHECK(vector_min({3.0, -1.0, 2.0}) == -1.0);
  NCFIX_CHECK(vector_max({3.0, -1.0, 2.0}) == 3.0);

  NCFIX_CHECK(ncfix::printf("%s-%03d", "lon", 7) == "lon-007");

  NCFIX_CHECK(io::string_to_backend("netcdf3") == io::NCFIX_NETCDF3);
  NCFIX_EXPECT_FAILURE("unknown backend", [&]() { io::string_to_backend("pnetcdf"); });
}

int main(int argc, char *argv[]) {

  MPI_Comm com = MPI_COMM_WORLD;
  petsc::Initializer petsc(argc, argv, help);

  com = PETSC_COMM_WORLD;

  try {
    auto ctx = context_from_options(com);

    test_units(ctx->unit_system());
    test_metadata(ctx->unit_system());
    test_logger(com);
    test_errors();
    test_strings();

    ctx->log()->message(1, "util_test: all checks passed\n");
  }
  catch (...) {
    handle_fatal_errors(com);
    return 1;
  }

  return 0;
}
