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

#ifndef NCFIX_FIXTUREGENERATOR_H
#define NCFIX_FIXTUREGENERATOR_H

#include <string>

namespace ncfix {

class Context;

namespace fixtures {

//! @brief Write an unscaled "input" fixture file containing a lon/lat/time grid and
//! analytic fields.
/*!
 * Creates (or overwrites) `filename`.
 *
 * The file format, the compression level and whether to keep a backup of an existing
 * file are taken from the configuration database of `ctx`
 * (`output.format`, `output.compression_level`, `output.backup_existing`).
 *
 * Throws RuntimeError if sizes are not positive or `scale_factor` is negative (no file is
 * created in this case) and if the file cannot be written.
 */
void generate(const Context &ctx, const std::string &filename,
              int nx, int ny, int time_steps);

//! @brief Write an "expected output" fixture: same as above, with field values
//! multiplied by `scale_factor`.
/*!
 * The file is announced as scaled output even if `scale_factor` is 1.
 */
void generate(const Context &ctx, const std::string &filename,
              int nx, int ny, int time_steps, double scale_factor);

//! @brief Write an unscaled "input" fixture and a scaled "expected output" fixture.
/*!
 * Creates `output.directory` if it does not exist, then writes `output.input_file` and
 * `output.expected_file` in it using sizes `grid.nx`, `grid.ny`, `time.steps` and the
 * scale factor `output.scale_factor`.
 */
void generate_from_config(const Context &ctx);

} // end of namespace fixtures
} // end of namespace ncfix

#endif /* NCFIX_FIXTUREGENERATOR_H */
