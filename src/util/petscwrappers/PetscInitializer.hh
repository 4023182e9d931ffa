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

#ifndef NCFIX_PETSC_INITIALIZER_H
#define NCFIX_PETSC_INITIALIZER_H

namespace ncfix {
namespace petsc {

//! Initializes PETSc (and MPI) in the constructor and finalizes in the destructor.
/*! Does nothing if PETSc is already initialized. */
class Initializer {
public:
  Initializer(int argc, char **argv, const char *help);
  ~Initializer();
};

} // end of namespace petsc
} // end of namespace ncfix

#endif /* NCFIX_PETSC_INITIALIZER_H */
