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
#include "ncfix/util/Units.hh"

#include <udunits2.h>

#include "ncfix/util/error_handling.hh"

namespace ncfix {
namespace units {

struct System::Impl {
  Impl(const std::string &path)
    : system(NULL) {
    // errors are reported by throwing, so silence the library's own messages
    ut_set_error_message_handler(ut_ignore);

    system = ut_read_xml(path.empty() ? NULL : path.c_str());
    if (system == NULL) {
      throw RuntimeError::formatted(NCFIX_ERROR_LOCATION,
                                    "failed to read unit definitions from '%s'",
                                    path.empty() ? "the UDUNITS-2 default database" : path.c_str());
    }
  }
  ~Impl() {
    ut_free_system(system);
  }
  ut_system *system;
};

/**
 * Reads unit definitions from the XML file `path`.
 *
 * If `path` is empty UDUNITS-2 uses `UDUNITS2_XML_PATH` or its
 * compiled-in database.
 */
System::System(const std::string &path)
  : m_impl(new Impl(path)) {
}

struct Unit::Impl {
  Impl(System::Ptr sys, const std::string &spec)
    : system(sys), text(spec), unit(ut_parse(sys->m_impl->system, spec.c_str(), UT_ASCII)) {
    if (unit == NULL) {
      throw RuntimeError::formatted(NCFIX_ERROR_LOCATION,
                                    "'%s' is not a valid unit", spec.c_str());
    }
  }
  Impl(const Impl &other)
    : system(other.system), text(other.text), unit(ut_clone(other.unit)) {
    if (unit == NULL) {
      throw RuntimeError::formatted(NCFIX_ERROR_LOCATION,
                                    "failed to copy unit '%s'", text.c_str());
    }
  }
  ~Impl() {
    ut_free(unit);
  }

  System::Ptr system;
  std::string text;
  ut_unit *unit;
};

Unit::Unit(System::Ptr system, const std::string &spec)
  : m_impl(new Impl(system, spec)) {
}

Unit::Unit(const Unit &other)
  : m_impl(new Impl(*other.m_impl)) {
}

Unit& Unit::operator=(const Unit& other) {
  if (this != &other) {
    m_impl.reset(new Impl(*other.m_impl));
  }
  return *this;
}

bool Unit::is_convertible(const Unit &other) const {
  return ut_are_convertible(m_impl->unit, other.m_impl->unit) != 0;
}

std::string Unit::format() const {
  return m_impl->text;
}

struct Converter::Impl {
  Impl(const Unit &from, const Unit &to)
    : converter(NULL) {
    if (not from.is_convertible(to)) {
      throw RuntimeError::formatted(NCFIX_ERROR_LOCATION,
                                    "units '%s' and '%s' are not compatible",
                                    from.format().c_str(), to.format().c_str());
    }

    converter = ut_get_converter(from.m_impl->unit, to.m_impl->unit);
    if (converter == NULL) {
      throw RuntimeError::formatted(NCFIX_ERROR_LOCATION,
                                    "ut_get_converter('%s', '%s') failed",
                                    from.format().c_str(), to.format().c_str());
    }
  }
  ~Impl() {
    cv_free(converter);
  }
  cv_converter *converter;
};

Converter::Converter(const Unit &u1, const Unit &u2)
  : m_impl(new Impl(u1, u2)) {
}

Converter::Converter(System::Ptr sys, const std::string &u1, const std::string &u2)
  : m_impl(new Impl(Unit(sys, u1), Unit(sys, u2))) {
}

double Converter::operator()(double input) const {
  return cv_convert_double(m_impl->converter, input);
}

//! Converts `input` from `spec1` to `spec2`, e.g. `convert(sys, 1.0, "km", "m")`.
double convert(System::Ptr system, double input,
               const std::string &spec1, const std::string &spec2) {
  return Converter(system, spec1, spec2)(input);
}

} // end of namespace units
} // end of namespace ncfix
