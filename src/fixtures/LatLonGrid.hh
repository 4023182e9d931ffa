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

#ifndef NCFIX_LATLONGRID_H
#define NCFIX_LATLONGRID_H

#include <vector>

#include "ncfix/util/VariableMetadata.hh"

namespace ncfix {

class File;

namespace fixtures {

//! Returns `N` evenly spaced numbers over `[v_min, v_max]` (both ends included).
/*!
 * If `N == 1` the result contains `v_min` only.
 */
std::vector<double> linspace(double v_min, double v_max, unsigned int N);

//! @brief A rectilinear longitude/latitude/time grid of a fixture file.
/*!
 * Longitudes span [-180, 180] degrees east, latitudes [-90, 90] degrees north. Times are
 * `0, 1, ..., time_steps - 1` hours since 2000-01-01.
 *
 * Longitudes and latitudes are stored in files as 32-bit floats; lon() and lat() return
 * the values rounded the same way.
 */
class LatLonGrid {
public:
  LatLonGrid(units::System::Ptr unit_system, int nx, int ny, int time_steps);

  unsigned int nx() const;
  unsigned int ny() const;
  unsigned int time_steps() const;

  const std::vector<double>& lon() const;
  const std::vector<double>& lat() const;
  const std::vector<double>& time() const;

  //! Define dimensions and coordinate variables in `file`.
  void define(const File &file) const;
  //! Write coordinate values. The file has to contain dimensions defined by define().
  void write(const File &file) const;

  //! Names of dimensions of a field on this grid, slowest-varying first.
  static std::vector<std::string> field_dimensions();
private:
  static void validate(int nx, int ny, int time_steps);

  std::vector<double> m_lon, m_lat, m_time;

  VariableMetadata m_lon_metadata, m_lat_metadata, m_time_metadata;
};

} // end of namespace fixtures
} // end of namespace ncfix

#endif /* NCFIX_LATLONGRID_H */
