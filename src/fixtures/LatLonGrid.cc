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

#include "ncfix/fixtures/LatLonGrid.hh"
#include "ncfix/util/io/File.hh"
#include "ncfix/util/io/IO_Flags.hh"
#include "ncfix/util/io/io_helpers.hh"
#include "ncfix/util/error_handling.hh"

namespace ncfix {
namespace fixtures {

std::vector<double> linspace(double v_min, double v_max, unsigned int N) {
  std::vector<double> result(N);

  if (N == 0) {
    return result;
  }

  if (N == 1) {
    result[0] = v_min;
    return result;
  }

  double delta = (v_max - v_min) / (N - 1);
  for (unsigned int i = 0; i < N; ++i) {
    result[i] = v_min + i * delta;
  }
  result[N - 1] = v_max;

  return result;
}

//! Round to the nearest 32-bit float, i.e. the value a NC_FLOAT variable would store.
static std::vector<double> round_to_float(const std::vector<double> &input) {
  std::vector<double> result(input.size());
  for (unsigned int k = 0; k < input.size(); ++k) {
    result[k] = static_cast<float>(input[k]);
  }
  return result;
}

void LatLonGrid::validate(int nx, int ny, int time_steps) {
  if (nx < 1) {
    throw RuntimeError::formatted(NCFIX_ERROR_LOCATION,
                                  "nx = %d is invalid (has to be 1 or greater)", nx);
  }

  if (ny < 1) {
    throw RuntimeError::formatted(NCFIX_ERROR_LOCATION,
                                  "ny = %d is invalid (has to be 1 or greater)", ny);
  }

  if (time_steps < 1) {
    throw RuntimeError::formatted(NCFIX_ERROR_LOCATION,
                                  "time_steps = %d is invalid (has to be 1 or greater)",
                                  time_steps);
  }
}

LatLonGrid::LatLonGrid(units::System::Ptr unit_system, int nx, int ny, int time_steps)
  : m_lon_metadata("lon", unit_system, {"lon"}),
    m_lat_metadata("lat", unit_system, {"lat"}),
    m_time_metadata("time", unit_system, {"time"}) {

  validate(nx, ny, time_steps);

  m_lon  = round_to_float(linspace(-180.0, 180.0, nx));
  m_lat  = round_to_float(linspace(-90.0, 90.0, ny));
  m_time = linspace(0.0, time_steps - 1, time_steps);

  m_lon_metadata["axis"]          = "X";
  m_lon_metadata["standard_name"] = "longitude";
  m_lon_metadata["long_name"]     = "longitude";
  m_lon_metadata["units"]         = "degrees_east";
  m_lon_metadata.set_output_type(io::NCFIX_FLOAT);

  m_lat_metadata["axis"]          = "Y";
  m_lat_metadata["standard_name"] = "latitude";
  m_lat_metadata["long_name"]     = "latitude";
  m_lat_metadata["units"]         = "degrees_north";
  m_lat_metadata.set_output_type(io::NCFIX_FLOAT);

  m_time_metadata["axis"]          = "T";
  m_time_metadata["standard_name"] = "time";
  m_time_metadata["long_name"]     = "time";
  m_time_metadata["units"]         = "hours since 2000-01-01 00:00:00";
  m_time_metadata["calendar"]      = "standard";
  m_time_metadata.set_output_type(io::NCFIX_DOUBLE);
}

unsigned int LatLonGrid::nx() const {
  return m_lon.size();
}

unsigned int LatLonGrid::ny() const {
  return m_lat.size();
}

unsigned int LatLonGrid::time_steps() const {
  return m_time.size();
}

const std::vector<double>& LatLonGrid::lon() const {
  return m_lon;
}

const std::vector<double>& LatLonGrid::lat() const {
  return m_lat;
}

const std::vector<double>& LatLonGrid::time() const {
  return m_time;
}

std::vector<std::string> LatLonGrid::field_dimensions() {
  return {"time", "lon", "lat"};
}

void LatLonGrid::define(const File &file) const {
  io::define_dimension(file, time_steps(), m_time_metadata);
  io::define_dimension(file, nx(), m_lon_metadata);
  io::define_dimension(file, ny(), m_lat_metadata);
}

void LatLonGrid::write(const File &file) const {
  io::write_variable(file, m_time_metadata, m_time);
  io::write_variable(file, m_lon_metadata, m_lon);
  io::write_variable(file, m_lat_metadata, m_lat);
}

} // end of namespace fixtures
} // end of namespace ncfix
