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

#include "ncfix/util/io/NC4_Serial.hh"

#include <algorithm>            // std::min, std::max

#ifndef MPI_INCLUDED
#define MPI_INCLUDED 1
#endif
#include <netcdf.h>

#include "ncfix/util/error_handling.hh"

namespace ncfix {
namespace io {

NC4_Serial::NC4_Serial(MPI_Comm com)
  : NC_Serial(com), m_compression_level(0) {
  // empty
}

int NC4_Serial::creation_mode() const {
  return NC_CLOBBER | NC_NETCDF4;
}

//! Set the deflate level (0 to 9) used for variables defined after this call.
void NC4_Serial::set_compression_level(int level) const {
  m_compression_level = std::min(std::max(level, 0), 9);
}

//! Define a variable, compressing it unless it is a scalar or a coordinate variable.
void NC4_Serial::def_var(const std::string &name, io::Type type,
                         const std::vector<std::string> &dims) const {
  NC_Serial::def_var(name, type, dims);

  if (m_compression_level == 0 or dims.size() < 2) {
    return;
  }

  call(NCFIX_ERROR_LOCATION, [&]() -> int {
      int varid = 0;
      int stat = find_varid(name, varid);
      if (stat == NC_NOERR) {
        stat = nc_def_var_deflate(m_file_id, varid, 0, 1, m_compression_level);
      }
      // NetCDF may be built without compression support
      return stat == NC_EINVAL ? NC_NOERR : stat;
    });
}

} // end of namespace io
} // end of namespace ncfix
