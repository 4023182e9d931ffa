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

#ifndef _NCFIX_OPTIONS_H_
#define _NCFIX_OPTIONS_H_

#include <memory>
#include <string>
#include <vector>

#include "ncfix/util/options.hh"

namespace ncfix {

class Logger;

namespace units {
class System;
}

void show_usage(const Logger &log, const std::string &execname, const std::string &usage);

//! Handles -version, -usage and -help and checks `required_options`.
//!
//! Returns true if the caller should exit without doing any work.
bool show_usage_check_req_opts(const Logger &log,
                               const std::string &execname,
                               const std::vector<std::string> &required_options,
                               const std::string &usage);


//! Typed wrappers around the PETSc options database.
namespace options {

typedef enum {ALLOW_EMPTY, DONT_ALLOW_EMPTY} ArgumentFlag;

class String : public Option<std::string> {
public:
  // no default: if given, the option needs an argument
  String(const std::string& option,
         const std::string& description);
  String(const std::string& option,
         const std::string& description,
         const std::string& default_value,
         ArgumentFlag flag = DONT_ALLOW_EMPTY);
private:
  void process(const std::string& option,
               const std::string& description,
               const std::string& default_value,
               ArgumentFlag flag);
};

class Keyword : public Option<std::string> {
public:
  Keyword(const std::string& option,
          const std::string& description,
          const std::string& choices,
          const std::string& default_value);
};

class Integer : public Option<int> {
public:
  Integer(const std::string& option,
          const std::string& description,
          int default_value);
};

class Real : public Option<double> {
public:
  Real(std::shared_ptr<units::System> system,
       const std::string& option,
       const std::string& description,
       const std::string& units,
       double default_value);
};

bool Bool(const std::string& option,
          const std::string& description);

} // end of namespace options

} // end of namespace ncfix

#endif /* _NCFIX_OPTIONS_H_ */
