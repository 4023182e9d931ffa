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

#ifndef NCFIX_NC4_SERIAL_H
#define NCFIX_NC4_SERIAL_H

#include "ncfix/util/io/NC_Serial.hh"

namespace ncfix {
namespace io {

//! NetCDF-4 (HDF5-based) file with optional deflate compression.
class NC4_Serial : public NC_Serial
{
public:
  NC4_Serial(MPI_Comm com);
  virtual ~NC4_Serial() = default;

  void set_compression_level(int level) const;

  void def_var(const std::string &name, io::Type type,
               const std::vector<std::string> &dims) const;
protected:
  int creation_mode() const;

  mutable int m_compression_level;
};

} // end of namespace io
} // end of namespace ncfix

#endif /* NCFIX_NC4_SERIAL_H */
