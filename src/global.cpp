/*!
 * \file global.cpp
 * \brief Definitions for global constants, objects, and helper routines
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
#include "global.hpp"

#include <cstdlib>
#include <string>

#ifndef _NO_MPI
#include "mpi.h"
#endif

//! Maps a boundary-condition string to its integer enum
// NOTE: 'symmetry' is the viscous-wall variant of 'slip_wall'; both reflect
// the normal momentum in the advective exterior state
map<string,int> bcStr2Num = {
  {"none", NONE},
  {"periodic", PERIODIC},
  {"dummy", DUMMY},
  {"slip_wall", SLIP_WALL},
  {"adiabatic_slip", SLIP_WALL},
  {"adiabatic_noslip_moving", ADIABATIC_NOSLIP_MOVING},
  {"isothermal_noslip", ISOTHERMAL_NOSLIP},
  {"farfield", FARFIELD},
  {"outflow", SUB_OUT},
  {"sub_out", SUB_OUT},
  {"inflow", SUB_IN},
  {"sub_in", SUB_IN},
  {"isothermal_wall", ISOTHERMAL_WALL},
  {"adiabatic_noslip_wall", ADIABATIC_NOSLIP_WALL},
  {"symmetry", SYMMETRY}
};

bool checkNaN(const vector<double> &vec)
{
  for (auto& i:vec)
    if (std::isnan(i)) return true;

  return false;
}

bool checkNaNInf(const double* vec, int size)
{
  for (int i=0; i<size; i++)
    if (!std::isfinite(vec[i])) return true;

  return false;
}

string toLower(string str)
{
  std::transform(str.begin(), str.end(), str.begin(), ::tolower);
  return str;
}

void simTimer::startTimer(void)
{
  initTime = std::chrono::high_resolution_clock::now();
}

void simTimer::stopTimer(void)
{
  finalTime = std::chrono::high_resolution_clock::now();
}

double simTimer::getElapsedTime(void)
{
  finalTime = std::chrono::high_resolution_clock::now();
  auto duration = std::chrono::duration_cast<std::chrono::milliseconds>( finalTime - initTime ).count();
  return (double) duration / 1000.;
}

void simTimer::showTime(int precision)
{
  int rank = 0;
#ifndef _NO_MPI
  MPI_Comm_rank(MPI_COMM_WORLD,&rank);
#endif

  if (rank == 0) {
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>( finalTime - initTime ).count();
    double execTime = (double)duration/1000.;
    cout.setf(ios::fixed, ios::floatfield);
    if (execTime > 60) {
      int minutes = floor(execTime/60);
      double seconds = execTime-(minutes*60);
      cout << "Execution time = " << minutes << "min " << setprecision(precision) << seconds << "s" << endl;
    }
    else {
      cout << setprecision(precision) << "Execution time = " << execTime << "s" << endl;
    }
  }
}

void blocked_dgemm(int M, int N, int K, double alpha, const double* A, int lda,
    const double* B, int ldb, double beta, double* C, int ldc)
{
  if (M == 0 || N == 0) return;

#ifdef _OMP
#pragma omp parallel
  {
    int nThreads = omp_get_num_threads();
    int thread_idx = omp_get_thread_num();

    int block_size = N / nThreads;
    int start_idx = block_size * thread_idx;

    if (thread_idx == nThreads-1)
      block_size = N - start_idx;

    if (block_size > 0)
      cblas_dgemm(CblasRowMajor, CblasNoTrans, CblasNoTrans, M, block_size, K,
                  alpha, A, lda, B + start_idx, ldb, beta, C + start_idx, ldc);
  }
#else
  cblas_dgemm(CblasRowMajor, CblasNoTrans, CblasNoTrans, M, N, K, alpha, A,
              lda, B, ldb, beta, C, ldc);
#endif
}
