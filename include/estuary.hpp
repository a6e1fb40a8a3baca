/*!
 * \file estuary.hpp
 * \brief Driver class for running a full simulation
 *
 * \author - Jacob Crabill
 *           Aerospace Computing Laboratory (ACL)
 *           Aero/Astro Department. Stanford University
 *
 * \version 1.0.0
 *
 * Estuary: Discontinuous Galerkin Flow Solver in C++
 * Copyright (C) 2015 Jacob Crabill
 *
 * Estuary is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation; either version 2 of the License, or
 * (at your option) any later version.
 *
 * Estuary is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License along
 * with Estuary; if not, write to the Free Software Foundation, Inc.,
 * 51 Franklin Street, Fifth Floor, Boston, MA 02110-1301 USA.
 */
#pragma once

#include <memory>

#ifndef _NO_MPI
#include "mpi.h"
#endif

#include "global.hpp"

#include "geo.hpp"
#include "input.hpp"
#include "output.hpp"
#include "solver.hpp"

class Estuary
{
public:
  /*! Assign the MPI communicator; MPI must already be initialized */
#ifndef _NO_MPI
  Estuary(MPI_Comm comm_in = MPI_COMM_WORLD);
#else
  Estuary(void);
#endif

  //! Read input file and set basic run parameters
  void read_input(const char *inputfile);

  //! Build the mesh, gas model, boundaries & solver; apply the initial condition
  void setup_solver(void);

  //! Run one full time step
  void do_step(void);

  //! Time-step until iterMax or maxTime is reached
  void run(void);

  void write_residual(void);

  void write_solution(void);

  input params;
  shared_ptr<geo> Geo;
  shared_ptr<solver> Solver;

private:
  int rank = 0;
  int nRanks = 1;

#ifndef _NO_MPI
  MPI_Comm myComm;
#endif
};
