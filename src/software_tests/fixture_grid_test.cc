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
  "Tests fixture grids and analytic fields (no file I/O).\n";

#include <cmath>

#include <petscsys.h>

#include "ncfix/fixtures/LatLonGrid.hh"
#include "ncfix/fixtures/AnalyticFields.hh"
#include "ncfix/util/Context.hh"
#include "ncfix/util/Logger.hh"
#include "ncfix/util/io/IO_Flags.hh"
#include "ncfix/util/petscwrappers/PetscInitializer.hh"
#include "ncfix/software_tests/checks.hh"

using namespace ncfix;
using namespace ncfix::fixtures;

static void test_linspace() {
  auto v = linspace(-180.0, 180.0, 20);

  NCFIX_CHECK(v.size() == 20);
  NCFIX_CHECK(v.front() == -180.0);
  NCFIX_CHECK(v.back() == 180.0);

  for (unsigned int k = 0; k + 1 < v.size(); ++k) {
    NCFIX_CHECK_CLOSE(v[k + 1] - v[k], 360.0 / 19.0, 1e-12);
  }

  auto one = linspace(-90.0, 90.0, 1);
  NCFIX_CHECK(one.size() == 1);
  NCFIX_CHECK(one[0] == -90.0);

  auto two = linspace(-90.0, 90.0, 2);
  NCFIX_CHECK(two.size() == 2);
  NCFIX_CHECK(two[0] == -90.0 and two[1] == 90.0);
}

static void test_grid(units::System::Ptr sys) {
  LatLonGrid grid(sys, 20, 10, 4);

  NCFIX_CHECK(grid.nx() == 20);
  NCFIX_CHECK(grid.ny() == 10);
  NCFIX_CHECK(grid.time_steps() == 4);

  NCFIX_CHECK(grid.lon().front() == -180.0);
  NCFIX_CHECK(grid.lon().back() == 180.0);
  NCFIX_CHECK(grid.lat().front() == -90.0);
  NCFIX_CHECK(grid.lat().back() == 90.0);

  // coordinates are rounded to 32-bit floats
  auto lon = linspace(-180.0, 180.0, 20);
  for (unsigned int i = 0; i < lon.size(); ++i) {
    NCFIX_CHECK(grid.lon()[i] == static_cast<float>(lon[i]));
  }

  for (unsigned int t = 0; t < grid.time_steps(); ++t) {
    NCFIX_CHECK(grid.time()[t] == t);
  }

  auto dims = LatLonGrid::field_dimensions();
  NCFIX_CHECK(dims.size() == 3);
  NCFIX_CHECK(dims[0] == "time" and dims[1] == "lon" and dims[2] == "lat");
}

static void test_degenerate_grid(units::System::Ptr sys) {
  LatLonGrid grid(sys, 1, 1, 1);

  NCFIX_CHECK(grid.lon().size() == 1 and grid.lon()[0] == -180.0);
  NCFIX_CHECK(grid.lat().size() == 1 and grid.lat()[0] == -90.0);
  NCFIX_CHECK(grid.time().size() == 1 and grid.time()[0] == 0.0);
}

static void test_invalid_grid(units::System::Ptr sys) {
  NCFIX_EXPECT_FAILURE("nx = 0", [&]() { LatLonGrid(sys, 0, 20, 1); });
  NCFIX_EXPECT_FAILURE("ny = -3", [&]() { LatLonGrid(sys, 20, -3, 1); });
  NCFIX_EXPECT_FAILURE("time_steps = 0", [&]() { LatLonGrid(sys, 20, 20, 0); });
}

static void test_formulas() {
  // degrees are passed to sin() and cos() as if they were radians
  NCFIX_CHECK_CLOSE(air_temperature(-180.0f, -90.0f), 290.70042610071766, 1e-4);
  NCFIX_CHECK_CLOSE(eastward_wind(-180.0f, -90.0f), 6.605063915107653, 1e-5);
  NCFIX_CHECK_CLOSE(northward_wind(-180.0f, -90.0f), 1.2820492828706536, 1e-6);

  NCFIX_CHECK(air_temperature(0.0f, 0.0f) == 280.0f);
  NCFIX_CHECK(eastward_wind(0.0f, 0.0f) == 5.0f);
  NCFIX_CHECK(northward_wind(0.0f, 0.0f) == 2.0f);

  // single precision, rounded after every operation
  auto lon = linspace(-180.0, 180.0, 20);
  auto lat = linspace(-90.0, 90.0, 20);
  for (unsigned int i = 0; i < lon.size(); ++i) {
    for (unsigned int j = 0; j < lat.size(); ++j) {
      float x = static_cast<float>(lon[i]), y = static_cast<float>(lat[j]);
      float sin_y = std::sin(y), cos_y = std::cos(y), sin_x = std::sin(x), cos_x = std::cos(x);

      float T = 20.0f * sin_y;
      T = T * cos_x;
      T = 280.0f + T;

      float U = 3.0f * sin_y;
      U = U * cos_x;
      U = 5.0f + U;

      float V = 2.0f * cos_y;
      V = V * sin_x;
      V = 2.0f + V;

      NCFIX_CHECK(air_temperature(x, y) == T);
      NCFIX_CHECK(eastward_wind(x, y) == U);
      NCFIX_CHECK(northward_wind(x, y) == V);
    }
  }
}

static void test_fields(units::System::Ptr sys) {
  LatLonGrid grid(sys, 4, 3, 2);

  auto fields = analytic_fields(grid, 1.0, sys);

  NCFIX_CHECK(fields.size() == 3);
  NCFIX_CHECK(fields[0].metadata.get_name() == "air_temperature");
  NCFIX_CHECK(fields[1].metadata.get_name() == "eastward_wind");
  NCFIX_CHECK(fields[2].metadata.get_name() == "northward_wind");

  NCFIX_CHECK(fields[0].metadata.get_string("units") == "K");
  NCFIX_CHECK(fields[0].metadata.get_string("long_name") == "Air Temperature");
  NCFIX_CHECK(fields[1].metadata.get_string("units") == "m s-1");
  NCFIX_CHECK(fields[1].metadata.get_string("long_name") == "Eastward Wind");
  NCFIX_CHECK(fields[2].metadata.get_string("units") == "m s-1");
  NCFIX_CHECK(fields[2].metadata.get_string("long_name") == "Northward Wind");

  for (const auto &f : fields) {
    NCFIX_CHECK(f.values.size() == 2 * 4 * 3);
    NCFIX_CHECK(f.metadata.get_output_type() == io::NCFIX_FLOAT);
    NCFIX_CHECK(f.metadata.dimensions() == LatLonGrid::field_dimensions());
  }

  const auto &lon = grid.lon();
  const auto &lat = grid.lat();
  for (unsigned int t = 0; t < 2; ++t) {
    for (unsigned int i = 0; i < 4; ++i) {
      for (unsigned int j = 0; j < 3; ++j) {
        unsigned int k = (t * 4 + i) * 3 + j;
        NCFIX_CHECK(fields[0].values[k] == air_temperature(lon[i], lat[j]));
        NCFIX_CHECK(fields[1].values[k] == eastward_wind(lon[i], lat[j]));
        NCFIX_CHECK(fields[2].values[k] == northward_wind(lon[i], lat[j]));
      }
    }
  }

  NCFIX_CHECK(fields[0].min() <= 280.0 and fields[0].max() >= 280.0);
}

static void test_scaling(units::System::Ptr sys) {
  LatLonGrid grid(sys, 20, 20, 3);

  auto unscaled = analytic_fields(grid, 1.0, sys);
  auto scaled   = analytic_fields(grid, 2.0, sys);
  auto tripled  = analytic_fields(grid, 3.0, sys);
  auto zero     = analytic_fields(grid, 0.0, sys);

  for (unsigned int f = 0; f < unscaled.size(); ++f) {
    for (unsigned int k = 0; k < unscaled[f].values.size(); ++k) {
      float value = static_cast<float>(unscaled[f].values[k]);

      NCFIX_CHECK(unscaled[f].values[k] == value);
      NCFIX_CHECK(scaled[f].values[k] == 2.0 * unscaled[f].values[k]);
      // the product is rounded to single precision
      NCFIX_CHECK(tripled[f].values[k] == 3.0f * value);
      NCFIX_CHECK(zero[f].values[k] == 0.0);
    }
  }
}

static void test_determinism(units::System::Ptr sys) {
  LatLonGrid grid(sys, 7, 5, 2);

  auto a = analytic_fields(grid, 1.5, sys);
  auto b = analytic_fields(grid, 1.5, sys);

  for (unsigned int f = 0; f < a.size(); ++f) {
    NCFIX_CHECK(a[f].values == b[f].values);
  }
}

int main(int argc, char *argv[]) {

  MPI_Comm com = MPI_COMM_WORLD;
  petsc::Initializer petsc(argc, argv, help);

  com = PETSC_COMM_WORLD;

  try {
    auto ctx = context_from_options(com);
    auto sys = ctx->unit_system();

    test_linspace();
    test_grid(sys);
    test_degenerate_grid(sys);
    test_invalid_grid(sys);
    test_formulas();
    test_fields(sys);
    test_scaling(sys);
    test_determinism(sys);

    ctx->log()->message(1, "fixture_grid_test: all checks passed\n");
  }
  catch (...) {
    handle_fatal_errors(com);
    return 1;
  }

  return 0;
}
