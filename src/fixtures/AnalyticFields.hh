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

#ifndef NCFIX_ANALYTICFIELDS_H
#define NCFIX_ANALYTICFIELDS_H

#include <vector>

#include "ncfix/util/VariableMetadata.hh"

namespace ncfix {
namespace fixtures {

class LatLonGrid;

/*!
 * Analytic fields written to fixture files.
 *
 * Trigonometric functions are applied to longitudes and latitudes in degrees as if they
 * were in radians. Files generated this way are compared against output of existing
 * tools, so the formulas must not change.
 *
 * Formulas are evaluated in single precision, left to right, and the scale factor is
 * applied in single precision too. Results match single-precision tools up to the
 * accuracy of their sinf() and cosf().
 */

//! Air temperature, K.
float air_temperature(float lon, float lat);

//! Eastward wind, m s-1.
float eastward_wind(float lon, float lat);

//! Northward wind, m s-1.
float northward_wind(float lon, float lat);

//! A field sampled on a LatLonGrid.
struct Field {
  Field(const VariableMetadata &metadata, size_t size);

  VariableMetadata metadata;
  //! Values in the (time, lon, lat) order, `lat` varying fastest. Every value is
  //! representable as a float.
  std::vector<double> values;

  double min() const;
  double max() const;
};

//! Evaluate all analytic fields on `grid`, multiplying by `scale_factor`.
std::vector<Field> analytic_fields(const LatLonGrid &grid, double scale_factor,
                                   units::System::Ptr unit_system);

} // end of namespace fixtures
} // end of namespace ncfix

#endif /* NCFIX_ANALYTICFIELDS_H */
