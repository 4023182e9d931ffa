/* Copyright (C) 2026 ncfix Authors
 *
 * This file is part of ncfix.
 *
 * ncfix is free software; you can redistribute it and/or modify it under the
 * terms of the GNU General Public License as published by the Free Software
 * Foundation; either version 2 of the License, or (at your option) any later
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

#ifndef _NCFIX_UNITS_H_
#define _NCFIX_UNITS_H_

#include <string>
#include <memory>

namespace ncfix {

/** @brief Unit management.
 *
 * This layer wraps UDUNITS-2 to check unit strings written to fixture
 * files and to convert values given on the command line.
 */
namespace units {

/** The unit system.
 *
 * Units from different systems cannot be compared, so there should be
 * one System per program, stored in the Context.
 */
class System {
public:
  System(const std::string &path = "");
  typedef std::shared_ptr<System> Ptr;
private:
  friend class Unit;

  struct Impl;
  std::shared_ptr<Impl> m_impl;

  System(const System &);
  System& operator=(System const &);
};

double convert(System::Ptr system, double input,
               const std::string &spec1, const std::string &spec2);

class Unit {
public:
  Unit(System::Ptr system, const std::string &spec);
  Unit(const Unit &other);

  bool is_convertible(const Unit &other) const;

  Unit& operator=(const Unit& other);
  std::string format() const;
private:
  friend class Converter;

  struct Impl;
  std::shared_ptr<Impl> m_impl;
};

class Converter {
public:
  Converter(const Unit &u1, const Unit &u2);
  Converter(System::Ptr sys, const std::string &u1, const std::string &u2);
  double operator()(double input) const;
private:

  struct Impl;
  std::shared_ptr<Impl> m_impl;

  // hide copy constructor and the assignment operator
  Converter(const Converter &);
  Converter& operator=(Converter const &);
};

} // end of namespace units

} // end of namespace ncfix

#endif /* _NCFIX_UNITS_H_ */
