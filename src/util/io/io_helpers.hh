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

#ifndef NCFIX_IO_HELPERS_H
#define NCFIX_IO_HELPERS_H

#include <string>
#include <vector>

#include <mpi.h>

#include "ncfix/util/Units.hh"

namespace ncfix {

class VariableMetadata;
class File;

namespace io {

enum Type : int;

void define_dimension(const File &file, unsigned long int length,
                      const VariableMetadata &metadata);

void define_variable(const File &file, const VariableMetadata &metadata);

void write_variable(const File &file, const VariableMetadata &metadata,
                    const std::vector<double> &data);

VariableMetadata read_attributes(const File &file, const std::string &variable_name,
                                 std::shared_ptr<units::System> unit_system);

void write_attributes(const File &file, const VariableMetadata &variable, io::Type nctype);

bool file_exists(MPI_Comm com, const std::string &filename);

void move_if_exists(MPI_Comm com, const std::string &file_to_move, int rank_to_use = 0);

void remove_if_exists(MPI_Comm com, const std::string &file_to_remove, int rank_to_use = 0);

void make_directory(MPI_Comm com, const std::string &path, int rank_to_use = 0);

} // end of namespace io
} // end of namespace ncfix

#endif /* NCFIX_IO_HELPERS_H */
