/*!
 * \file global.hpp
 * \brief Header file for global constants, enums, and helper routines
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

#include <limits.h>
#include <cmath>
#include <chrono>
#include <iostream>
#include <iomanip>
#include <fstream>
#include <map>
#include <string>
#include <cstddef>    // std::size_t
#include <cstdlib>
#include <vector>
#include <array>
#include <stdio.h>
#include <algorithm>

#ifdef _OMP
#include <omp.h>
#endif

#ifdef _MKL_BLAS
#include "mkl_types.h"
#include "mkl_cblas.h"
#else
#include "cblas.h"
#endif

#include "error.hpp"

template<typename T> class matrix;

#include "matrix.hpp"

// Forward declarations of basic Estuary classes
class geo;
class solver;

using namespace std;

typedef unsigned int uint;

/* --- Misc. Common Constants / Globally-Useful Variables --- */

static double pi = 4.0*atan(1);

//! Universal gas constant [J/(kmol*K)]
static const double RUniversal = 8314.46261815324;

extern map<string,int> bcStr2Num;

/*! Enumeration for original, mesh-defined face type */
enum FACE_TYPE {
  INTERNAL  = 0,
  BOUNDARY  = 1,
  MPI_FACE  = 2
};

/*! Form of the volume divergence operator */
enum OPERATOR_TYPE {
  WEAK_FORM      = 0,
  ENTROPY_STABLE = 1
};

/*! Numerical flux to use on interior interfaces */
enum RIEMANN_TYPE {
  RUSANOV = 0,
  CENTRAL = 1
};

/*! Enumeration for all available boundary conditions */
enum BC_TYPE {
  NONE = -1,
  PERIODIC = 0,
  DUMMY = 1,
  SLIP_WALL = 2,
  ADIABATIC_NOSLIP_MOVING = 3,
  ISOTHERMAL_NOSLIP = 4,
  FARFIELD = 5,
  SUB_OUT = 6,
  SUB_IN = 7,
  ISOTHERMAL_WALL = 8,
  ADIABATIC_NOSLIP_WALL = 9,
  SYMMETRY = 10
};

/*! Equation of state */
enum EOS_TYPE {
  IDEAL_SINGLE_GAS = 0,
  IDEAL_MIXTURE    = 1
};

/*! Initial condition */
enum IC_TYPE {
  IC_UNIFORM = 0,
  IC_VORTEX  = 1,
  IC_PULSE   = 2
};

/*! For convinience with geometry, a simple struct to hold an x,y,z coordinate */
struct point
{
  double x, y, z;

  point() {
    x = 0;
    y = 0;
    z = 0;
  }

  point (double _x, double _y, double _z) {
    x = _x;
    y = _y;
    z = _z;
  }

  double& operator[](int ind) {
    switch(ind) {
      case 0:
        return x;
      case 1:
        return y;
      case 2:
        return z;
      default:
        cout << "ind = " << ind << ": " << flush;
        FatalError("Invalid index for point struct.");
    }
  }

  double operator[](int ind) const {
    switch(ind) {
      case 0:
        return x;
      case 1:
        return y;
      case 2:
        return z;
      default:
        cout << "ind = " << ind << ": " << flush;
        FatalError("Invalid index for point struct.");
    }
  }
};

//! Check for any NaN values in a vector
bool checkNaN(const vector<double> &vec);

//! Check for any NaN or Inf values in an array
bool checkNaNInf(const double* vec, int size);

/*! Find index of first occurance of val in vec */
template<typename T>
int findFirst(const vector<T> &vec, T val)
{
  for (int i=0; i<(int)vec.size(); i++)
    if (vec[i]==val) return i;

  return -1;
}

//! Convert a string to lowercase
string toLower(string str);

class simTimer {
private:
  std::chrono::high_resolution_clock::time_point initTime;
  std::chrono::high_resolution_clock::time_point finalTime;

public:
  void startTimer();
  void stopTimer();
  void showTime(int precision=3);
  double getElapsedTime(void);
};

/*! Row-major dgemm split across OpenMP threads by blocks of columns of B & C;
 *  falls back to a single cblas_dgemm call without OpenMP */
void blocked_dgemm(int M, int N, int K, double alpha, const double* A, int lda,
    const double* B, int ldb, double beta, double* C, int ldc);
