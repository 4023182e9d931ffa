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

//! Convert ncfix's IO types into NetCDF types and back. Note that NC_* may be
//! macros, so you need to include the appropriate NetCDF header first.
namespace ncfix {

static nc_type ncfix_type_to_nc_type(ncfix::io::Type input) {
  switch (input) {
  case io::NCFIX_BYTE:
    return NC_BYTE;
  case io::NCFIX_CHAR:
    return NC_CHAR;
  case io::NCFIX_SHORT:
    return NC_SHORT;
  case io::NCFIX_INT:
    return NC_INT;
  case io::NCFIX_FLOAT:
    return NC_FLOAT;
  case io::NCFIX_DOUBLE:
    return NC_DOUBLE;
  default:
    return NC_NAT;
  }
}

static ncfix::io::Type nc_type_to_ncfix_type(int input) {
  switch (input) {
  case NC_BYTE:
    return io::NCFIX_BYTE;
  case NC_CHAR:
  case NC_STRING:               // treat NC_CHAR and NC_STRING as equivalent
    return io::NCFIX_CHAR;
  case NC_SHORT:
    return io::NCFIX_SHORT;
  case NC_INT:
    return io::NCFIX_INT;
  case NC_FLOAT:
    return io::NCFIX_FLOAT;
  case NC_DOUBLE:
    return io::NCFIX_DOUBLE;
  default:
    return io::NCFIX_NAT;
  }
}

} // end of namespace ncfix
