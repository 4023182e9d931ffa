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

#ifndef NCFIX_IO_FLAGS_H
#define NCFIX_IO_FLAGS_H

#include <string>

namespace ncfix {
namespace io {

// Flags shared by File and the NetCDF backends.

// A subset of NetCDF data types.
enum Type : int {
  NCFIX_NAT    = 0,             /* NAT = 'Not A Type' (c.f. NaN) */
  NCFIX_BYTE   = 1,             /* signed 1 byte integer */
  NCFIX_CHAR   = 2,             /* ISO/ASCII character */
  NCFIX_SHORT  = 3,             /* signed 2 byte integer */
  NCFIX_INT    = 4,             /* signed 4 byte integer */
  NCFIX_FLOAT  = 5,             /* single precision floating point number */
  NCFIX_DOUBLE = 6              /* double precision floating point number */
};

enum Backend : int {
  NCFIX_GUESS,
  NCFIX_NETCDF3,
  NCFIX_NETCDF4_SERIAL
};

// File modes. Values do not overlap NetCDF mode flags, so passing one straight
// to NetCDF fails.
enum Mode : int {
  //! open an existing file for reading only
  NCFIX_READONLY = 7,
  //! open an existing file for reading and writing
  NCFIX_READWRITE = 8,
  //! create a file for writing, overwrite if present
  NCFIX_READWRITE_CLOBBER = 9,
  //! create a file for writing, move foo.nc to foo.nc~ if present
  NCFIX_READWRITE_MOVE = 10
};

// Passed to nc_set_fill() as is, so values match NC_FILL and NC_NOFILL.
enum Fill_Mode : int { NCFIX_FILL = 0, NCFIX_NOFILL = 0x100 };

//! Convert a name ("netcdf3", "netcdf4_serial") to a Backend.
Backend string_to_backend(const std::string &backend);

} // namespace io
} // end of namespace ncfix

#endif /* NCFIX_IO_FLAGS_H */
