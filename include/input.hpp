/*!
 * \file input.hpp
 * \brief Class to read & store simulation parameters from the input file
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

#include <chrono>
#include <fstream>
#include <iomanip>
#include <map>
#include <string>
#include <vector>

#ifndef _NO_MPI
#include "mpi.h"
#endif

#include "global.hpp"

class Timer
{
private:
  std::chrono::high_resolution_clock::time_point tStart;
  std::chrono::high_resolution_clock::time_point tStop;
  std::string prefix = "Execution time = ";
  double duration = 0; // Time in milliseconds
public:

  Timer(void) {}

  Timer(const std::string &prefix) { this->prefix = prefix; }

  void setPrefix(const std::string &prefix) { this->prefix = prefix; }

  void startTimer(void)
  {
    tStart = std::chrono::high_resolution_clock::now();
  }

  void stopTimer(void)
  {
    tStop = std::chrono::high_resolution_clock::now();
    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>( tStop - tStart ).count();
    duration += (double)elapsed/1000.;
  }

  void resetTimer(void)
  {
    duration = 0;
    tStart = std::chrono::high_resolution_clock::now();
  }

  double getTime(void)
  {
    return duration;
  }

  void showTime(int precision = 2)
  {
    int rank = 0;
#ifndef _NO_MPI
    MPI_Comm_rank(MPI_COMM_WORLD,&rank);
#endif
    cout.setf(ios::fixed, ios::floatfield);
    double seconds = duration/1000.;
    if (seconds > 60) {
      int minutes = floor(seconds/60);
      seconds -= (minutes*60);
#ifndef _NO_MPI
      cout << "Rank " << rank << ": ";
#endif
      cout << prefix << minutes << "min " << setprecision(precision) << seconds << "s" << endl;
    }
    else
    {
#ifndef _NO_MPI
      cout << "Rank " << rank << ": ";
#endif
      cout << setprecision(precision) << prefix << seconds << "s" << endl;
    }
  }
};

class fileReader
{

public:
  /*! Default constructor */
  fileReader();

  fileReader(string fileName);

  /*! Default destructor */
  ~fileReader();

  /*! Set the file to be read from */
  void setFile(string fileName);

  /*! Open the file to prepare for reading simulation parameters */
  void openFile(void);

  /*! Close the file & clean up */
  void closeFile(void);

  /* === Functions to read paramters from input file === */

  /*! Read a single value from the input file; if not found, apply a default value */
  template <typename T>
  void getScalarValue(string optName, T &opt, T defaultVal);

  /*! Read a single value from the input file; if not found, throw an error and exit */
  template <typename T>
  void getScalarValue(string optName, T &opt);

  /*! Read a vector of values from the input file; if not found, use the given default vector */
  template <typename T>
  void getVectorValue(string optName, vector<T> &opt, const vector<T> &defaultVal);

  /*! Read a vector of values from the input file; if not found, throw an error and exit */
  template <typename T>
  void getVectorValue(string optName, vector<T> &opt);

  /*! Read in a map of type <T,U> from input file; each entry prefaced by optName */
  template <typename T, typename U>
  void getMap(string optName, map<T, U> &opt);

  /*! Check whether the option appears in the input file */
  bool isOption(string optName);

private:
  ifstream optFile;
  string fileName;

  void rewind(void);
};

/*! Parameters for one tagged boundary of the mesh */
struct bcParams
{
  string tag;        //! Mesh boundary tag
  string bcName;     //! Name of the boundary condition applied to the tag
  int bcType;        //! BC_TYPE enum value for bcName

  double TWall;      //! Wall temperature (isothermal walls)
  double PBound;     //! Boundary / free-stream pressure
  double TBound;     //! Free-stream temperature
  double rhoBound;   //! Free-stream density
  vector<double> VBound;  //! Free-stream velocity
  vector<double> YBound;  //! Free-stream species mass fractions
  vector<double> VWall;   //! Wall velocity (moving no-slip walls)

  bool hasP = false;
  bool hasT = false;
  bool hasRho = false;
  bool hasV = false;
  bool hasY = false;
};

class input
{
public:
  /*! Default constructor */
  input();

  void readInputFile(const char *filename);

  simTimer timer;

  Timer runTime;

  /* --- Basic Problem Variables --- */
  int viscous;       //! {0 | Euler} {1 | Navier-Stokes}
  int order;
  int quadOrder;     //! Order of volume & face quadrature (overintegration if > order)
  int operatorType;  //! {0 | Weak form} {1 | Entropy-stable flux differencing}
  int riemannType;   //! {0 | Rusanov} {1 | Central}
  int icType;

  /* --- Simulation Run Parameters --- */
  int nFields;
  int nDims;
  int nSpecies;
  double dt;
  double CFL;
  int dtType;
  int timeType;
  double rkTime;
  double time;
  double maxTime;
  int iterMax;
  int initIter;
  int iter;
  int nRKSteps;
  vector<double> RKa, RKb;

  /* --- Output Parameters --- */
  string dataFileName;
  int plotFreq;       //! Frequency of CSV solution output
  int monitorResFreq;
  int resType;        //! Norm to use for residual: {1 | L1} {2 | L2}

  /* --- Gas Model Parameters --- */
  int eosType;
  double gamma;
  double RGas;
  vector<double> mwSpecies;   //! Species molecular weights [kg/kmol]
  vector<double> cpASpecies;  //! Species heat capacity: cp = a + b*T
  vector<double> cpBSpecies;

  // For Sutherland's Law
  int fixVis;  //! Use Sutherland's Law or fixed (constant) viscosity?
  double muGas;
  double TGas;
  double SGas;
  double prandtl;
  double schmidt;
  double diffD;    //! Species diffusivity for constant transport

  /* --- Initial Condition Parameters --- */
  double rhoIC;
  double pIC;
  vector<double> VIC;
  vector<double> YIC;

  double vortexX0, vortexY0, vortexBeta;
  double pulseAmp, pulseWidth, pulseX0, pulseY0, pulseZ0;

  /* --- Mesh Parameters --- */
  int nx, ny, nz;   //! For creating a structured mesh: Number of cells in each direction
  double xmin, xmax, ymin, ymax, zmin, zmax;
  string create_bcTop, create_bcBottom, create_bcLeft;
  string create_bcRight, create_bcFront, create_bcBack; //! Boundary tags for the box sides
  map<string,string> meshBounds;  //! Mesh tag -> boundary condition name
  map<string,bcParams> bcs;       //! Mesh tag -> boundary condition parameters

  /* --- Stabilization & Health Parameters --- */
  int limiter;
  double rhoMin;
  double YMin;
  int artVisc;
  double avAlpha;
  double avS0;
  double avKappa;

  int filterFreq;     //! Steps between applications of the modal filter [0: off]
  int filterCutoff;
  int filterOrder;
  double filterAlpha;

  int healthCheckFreq;
  double healthPresMin, healthPresMax;
  double healthTempMin, healthTempMax;

  /* --- Other --- */
  int rank;
  int nproc;

#ifndef _NO_MPI
  MPI_Comm myComm;
#endif

private:
  fileReader opts;

  //! Read the parameters for each boundary tag named in the mesh_bound map
  void readBoundaryParams(void);
};
