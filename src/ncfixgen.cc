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

static char help[] =
  "Generates NetCDF fixture files (an input file and a scaled expected-output file)\n"
  "containing analytic temperature and wind fields on a lon/lat/time grid.\n";

#include <petscsys.h>

#include "ncfix/fixtures/FixtureGenerator.hh"
#include "ncfix/util/ConfigInterface.hh"
#include "ncfix/util/Context.hh"
#include "ncfix/util/Logger.hh"
#include "ncfix/util/error_handling.hh"
#include "ncfix/util/ncfix_options.hh"
#include "ncfix/util/petscwrappers/PetscInitializer.hh"

using namespace ncfix;

int main(int argc, char *argv[]) {

  MPI_Comm com = MPI_COMM_WORLD;
  petsc::Initializer petsc(argc, argv, help);

  com = PETSC_COMM_WORLD;

  try {
    std::shared_ptr<Context> ctx = context_from_options(com);
    Logger::Ptr log = ctx->log();

    std::string usage =
      "  ncfixgen [-o_dir DIR] [-nx N] [-ny N] [-time_steps N] [-scale_factor S]\n"
      "           [-input_file NAME] [-expected_file NAME] [-o_format FORMAT]\n"
      "           [OTHER ncfix & PETSc OPTIONS]\n"
      "Writes the unscaled input file and the expected-output file (fields multiplied\n"
      "by S) to DIR. Defaults: DIR = tests/data, 20 x 20 grid, 1 time step, S = 2.\n";

    bool done = show_usage_check_req_opts(*log, "ncfixgen (fixture generator)",
                                          std::vector<std::string>(), // no required options
                                          usage);
    if (done) {
      return 0;
    }

    Config::Ptr config = ctx->config();

    print_config(*log, 3, *config);

    fixtures::generate_from_config(*ctx);

    print_unused_parameters(*log, 3, *config);
  }
  catch (...) {
    handle_fatal_errors(com);
    return 1;
  }

  return 0;
}
