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

#ifndef _NCFIX_OPTIONS_TEMPLATE_H_
#define _NCFIX_OPTIONS_TEMPLATE_H_

namespace ncfix {
namespace options {

//! A command-line option value together with the flag telling whether it was set.
template <typename T>
class Option {
public:
  Option()
    : m_value(), m_is_set(false) {
  }
  operator T() const {
    return m_value;
  }
  const T* operator->() const {
    return &m_value;
  }
  bool is_set() const {
    return m_is_set;
  }
  T value() const {
    return m_value;
  }
protected:
  T m_value;
  bool m_is_set;
  void set(T value, bool is_set) {
    m_value = value;
    m_is_set = is_set;
  }
};

} // end of namespace options
} // end of namespace ncfix


#endif /* _NCFIX_OPTIONS_TEMPLATE_H_ */
