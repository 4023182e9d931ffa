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
#include <algorithm>

#include "ncfix/fixtures/AnalyticFields.hh"
#include "ncfix/fixtures/LatLonGrid.hh"
#include "ncfix/util/io/IO_Flags.hh"
#include "ncfix/util/ncfix_utilities.hh"

namespace ncfix {
namespace fixtures {

// All arithmetic below is in single precision, rounding after each operation.

float air_temperature(float lon, float lat) {
  return 280.0f + 20.0f * std::sin(lat) * std::cos(lon);
}

float eastward_wind(float lon, float lat) {
  return 5.0f + 3.0f * std::sin(lat) * std::cos(lon);
}

float northward_wind(float lon, float lat) {
  return 2.0f + 2.0f * std::cos(lat) * std::sin(lon);
}

Field::Field(const VariableMetadata &md, size_t size)
  : metadata(md), values(size, 0.0) {
  // empty
}

double Field::min() const {
  return vector_min(values);
}

double Field::max() const {
  return vector_max(values);
}

typedef float (*FieldFormula)(float lon, float lat);

static Field evaluate(const LatLonGrid &grid, double scale_factor,
                      const VariableMetadata &metadata, FieldFormula formula) {
  const std::vector<double>
    &lon = grid.lon(),
    &lat = grid.lat();

  const unsigned int
    Nt = grid.time_steps(),
    Nx = grid.nx(),
    Ny = grid.ny();

  Field result(metadata, (size_t)Nt * Nx * Ny);

  const float scale = static_cast<float>(scale_factor);

  // fields do not depend on time: compute one record, then copy it
  for (unsigned int i = 0; i < Nx; ++i) {
    for (unsigned int j = 0; j < Ny; ++j) {
      // coordinates are already rounded to float, so these conversions are exact
      float value = formula(static_cast<float>(lon[i]), static_cast<float>(lat[j]));
      result.values[i * Ny + j] = scale * value;
    }
  }

  const size_t record_size = (size_t)Nx * Ny;
  for (unsigned int t = 1; t < Nt; ++t) {
    std::copy(result.values.begin(), result.values.begin() + record_size,
              result.values.begin() + t * record_size);
  }

  return result;
}

static VariableMetadata field_metadata(units::System::Ptr sys,
                                       const std::string &name,
                                       const std::string &long_name,
                                       const std::string &units) {
  VariableMetadata result(name, sys, LatLonGrid::field_dimensions());
  result["long_name"] = long_name;
  result["units"]     = units;
  result.set_output_type(io::NCFIX_FLOAT);
  return result;
}

std::vector<Field> analytic_fields(const LatLonGrid &grid, double scale_factor,
                                   units::System::Ptr unit_system) {
  std::vector<Field> result;

  result.push_back(evaluate(grid, scale_factor,
                            field_metadata(unit_system, "air_temperature",
                                           "Air Temperature", "K"),
                            air_temperature));

  result.push_back(evaluate(grid, scale_factor,
                            field_metadata(unit_system, "eastward_wind",
                                           "Eastward Wind", "m s-1"),
                            eastward_wind));

  result.push_back(evaluate(grid, scale_factor,
                            field_metadata(unit_system, "northward_wind",
                                           "Northward Wind", "m s-1"),
                            northward_wind));

  return result;
}

} // end of namespace fixtures
} // end of namespace ncfix
