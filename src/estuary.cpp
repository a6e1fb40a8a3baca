/*!
 * \file estuary.cpp
 * \brief Main driver for the Estuary solver
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
#include "../include/estuary.hpp"

#ifndef _NO_MPI
#include <mpi.h>
#endif

#ifndef _NO_MPI
Estuary::Estuary(MPI_Comm comm_in)
{
  myComm = comm_in;
  MPI_Comm_rank(myComm, &rank);
  MPI_Comm_size(myComm, &nRanks);
#else
Estuary::Estuary(void)
{
#endif

  /* Print out cool ascii art header */
  if (rank == 0) {
    cout << endl;
    cout << R"(  ========================================================  )" << endl;
    cout << R"(   _____          _                                         )" << endl;
    cout << R"(  | ____|___  ___| |_ _   _  __ _ _ __ _   _    ~~   ~~     )" << endl;
    cout << R"(  |  _| / __|/ __| __| | | |/ _` | '__| | | |  ~~~~~~~~~    )" << endl;
    cout << R"(  | |___\__ \ (__| |_| |_| | (_| | |  | |_| |   ~~~~~~~     )" << endl;
    cout << R"(  |_____|___/\___|\__|\__,_|\__,_|_|   \__, |  ~~~~~~~~~~   )" << endl;
    cout << R"(                                       |___/                )" << endl;
    cout << R"(  -----   Discontinuous Galerkin Flow Solver in C++  -----  )" << endl;
    cout << R"(  ========================================================  )" << endl;
    cout << endl;
  }
}

void Estuary::read_input(const char *inputfile)
{
  if (rank == 0) std::cout << "Reading input file: " << inputfile << std::endl;

  params.rank = rank;
  params.nproc = nRanks;
#ifndef _NO_MPI
  params.myComm = myComm;
#endif

  params.readInputFile(inputfile);
}

void Estuary::setup_solver(void)
{
  Geo = make_shared<geo>();
  Geo->setup(&params);

  Solver = make_shared<solver>();
  Solver->setup(&params, Geo.get());
}

void Estuary::do_step(void)
{
  params.iter++;

  params.runTime.startTimer();

  Solver->update();

  if (params.filterFreq > 0 && params.iter%params.filterFreq == 0)
    Solver->applyFilter();

  params.runTime.stopTimer();
}

void Estuary::run(void)
{
  /* Start timer for simulation (ignoring pre-processing) */
  params.timer.startTimer();

  params.runTime.setPrefix("Computation Time: ");

  double maxTime = params.maxTime;
  int initIter = params.initIter;
  int iterMax = params.iterMax;
  int &iter = params.iter;

  /* --- Calculation Loop --- */
  while (iter < iterMax && params.time < maxTime) {
    do_step();

    if (iter%params.monitorResFreq == 0 || iter == initIter+1 || params.time >= maxTime)
      write_residual();

    if (iter%params.healthCheckFreq == 0 || iter == iterMax || params.time >= maxTime) {
      if (!Solver->checkHealth()) {
        write_solution();
        FatalError("Solution failed the health check.");
      }
    }

    if (iter%params.plotFreq == 0)
      write_solution();
  }

  params.runTime.showTime(2);

  // Get simulation wall time
  params.timer.stopTimer();
  if (rank == 0) params.timer.showTime();
}

void Estuary::write_residual(void)
{
  writeResidual(Solver.get(), &params);
}

void Estuary::write_solution(void)
{
  writeCSV(Solver.get(), &params);
}

int main(int argc, char *argv[])
{
#ifndef _NO_MPI
  MPI_Init(&argc, &argv);
#endif

  {
    Estuary run;

    if (argc<2) FatalError("No input file specified.");

    /* Read input file & set simulation parameters */
    run.read_input(argv[1]);

    /* Setup the grid, gas model, boundaries, faces & operators; apply the initial condition */
    run.setup_solver();

#ifndef _NO_MPI
    MPI_Barrier(MPI_COMM_WORLD);
#endif

    run.run();
  }

#ifndef _NO_MPI
  MPI_Finalize();
#endif

  return 0;
}
