/*!
 * \file solver.hpp
 * \brief Class to store all solution data & apply the DG operators
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
#include <map>
#include <string>
#include <vector>

#include "global.hpp"

#include "boundary.hpp"
#include "fluid.hpp"
#include "flux.hpp"
#include "gasModel.hpp"
#include "geo.hpp"
#include "input.hpp"
#include "face.hpp"
#include "intFace.hpp"
#include "boundFace.hpp"
#include "mpiFace.hpp"
#include "operators.hpp"

/*!
 * \brief Solution data & residual evaluation on one rank's partition
 *
 * Field arrays are stored as [nPts][nEles][nFields] so each reference
 * operator is applied to all elements & fields with one dgemm.  Gradient
 * arrays carry Q = [CV, T] (nFields+1 quantities) and a leading direction
 * index: [nDims][nPts][nEles][nFields+1].
 */
class solver
{
public:
  /* === Member Variables === */
  //! Pointer to geometry object for mesh-related operations
  geo *Geo;

  //! Input parameters for simulation
  input *params;

  //! Map from order to order-specific operators
  map<int, oper> opers;

  //! Equation of state & transport model shared by all evaluations
  gasModel gas;

  //! Boundary for each mesh tag
  map<string,fluidBoundary> bounds;

  //! Numerical flux used on interior & partition faces (and passed to the boundaries)
  inviscidNumFlux numFlux;

  //! Interior & boundary faces handled by this solver
  vector<shared_ptr<face>> faces;

  //! MPI faces handled by this solver
  vector<shared_ptr<mpiFace>> mpiFaces;

  int nDims, nFields, nSpecies, nQ;
  int nEles, nSpts, nFpts, nQpts, nFptsPerFace;
  int order;
  int nRKSteps;

  double rkTime;   //! Time at which the current residual is evaluated

  /* --- Solution & flux storage --- */
  Array<double,3> U_spts;   //! Solution at solution points [nSpts, nEles, nFields]
  Array<double,3> U0;       //! Solution at start of time step
  Array<double,3> U_fpts;   //! Solution at flux points [nFpts, nEles, nFields]
  Array<double,3> U_qpts;   //! Solution at volume quadrature points [nQpts, nEles, nFields]

  matrix<double> T_spts;    //! Temperature at solution points [nSpts, nEles]
  matrix<double> T_fpts;    //! Temperature seed at flux points [nFpts, nEles]
  matrix<double> T_qpts;    //! Temperature seed at quadrature points [nQpts, nEles]

  vector<double> smoothness;  //! Artificial-viscosity switch of each element

  Array<double,3> Q_spts, Q_qpts;  //! Q = [CV, T] [nPts, nEles, nQ]
  Array<double,4> dQ_spts, dQ_fpts, dQ_qpts;  //! Gradient of Q [nDims, nPts, nEles, nQ]
  Array<double,4> gradFn_fpts;  //! Common Q* n dA at the flux points [nDims, nFpts, nEles, nQ]

  Array<double,4> F_qpts;      //! Volume flux F_I - F_V + r [nDims, nQpts, nEles, nFields]
  Array<double,3> Fn_fpts;     //! Common normal flux times dA [nFpts, nEles, nFields]
  Array<double,3> disFn_fpts;  //! Element's own inviscid normal flux times dA [nFpts, nEles, nFields]

  vector<Array<double,3>> divF_spts;  //! Divergence of the flux for each RK stage [nSpts, nEles, nFields]

  /* === Setup Functions === */

  solver();

  ~solver();

  //! Setup the operators, gas model, boundaries, faces & solution arrays
  void setup(input *params, geo *Geo);

  //! Build the face objects from the mesh connectivity
  void setupFaces(void);

  //! Apply the initial condition to all elements
  void initializeSolution(void);

  /* === Functions Related to Basic FR Process === */

  //! Advance the solution by one time step
  void update(void);

  //! Calculate the residual divF_spts[step] of the current solution
  void calcResidual(int step);

  /*! Right-hand side dU/dt = -divF of the given solution at the given time;
   *  the stored solution is left untouched */
  void rhs(double time, const Array<double,3> &U, Array<double,3> &dUdt);

  //! Compute the time step from the CFL condition (fixed dt otherwise)
  double calcDt(void);

  //! U = U0 - RKval * dt * divF[step]
  void timeStepA(int step, double RKval);

  //! U = U - RKb[step] * dt * divF[step]
  void timeStepB(int step);

  //! Strong-stability-preserving RK3 (Shu-Osher form)
  void updateSSPRK3(void);

  void copyUspts_U0(void);
  void copyU0_Uspts(void);

  //! Extrapolate the solution to the flux & quadrature points
  void extrapolateU(void);

  //! Temperature at all points [seeded with the previous values]
  void calcTemperature(void);

  //! Gradient of Q = [CV, T] at the solution, flux & quadrature points
  void calcGradQ(void);

  //! Inviscid common fluxes on all faces
  void calcInviscidFlux_faces(void);

  //! Viscous & artificial-viscosity common fluxes on all faces
  void calcViscousFlux_faces(void);

  //! Volume flux at the quadrature points
  void calcFlux_qpts(void);

  //! Weak-form divergence of the flux
  void calcDivF_weak(int step);

  //! Entropy-stable flux-differencing divergence of the flux
  void calcDivF_entropyStable(int step);

  /* === Stabilization & health [solver_av.cpp] === */

  //! Persson-Peraire modal-decay indicator of each element
  void calcSmoothness(void);

  //! Zhang-Shu bound-preserving limiter on density & partial densities
  void applyLimiter(void);

  //! Exponential modal filter on all conserved variables
  void applyFilter(void);

  /*! Check for NaN/Inf & non-physical values on all ranks
   *  \return true if the solution is healthy */
  bool checkHealth(void);

  /* === Post-processing === */

  //! Norm of the residual of each field over all ranks
  vector<double> computeResidualNorm(int type);

  //! Integral of each conserved variable over the partition
  vector<double> computeIntegrals(void);

private:
  double esGamma;  //! Ratio of specific heats used by the entropy-stable operator

  //! Pack the solution & temperature into Q = [CV, T]
  void setupQ(void);
};

/*! Scale the nodal deviations of field k within each element towards the element
 *  mean so that all values are >= mmin (and <= mmax when mmax is finite)
 *
 * \param wts  Cell-average weight of each solution point (sum to one)
 * \param modifyAvg  Clip the element mean up to mmin first; the mean is
 *                   always clipped down to a finite mmax
 */
void boundPreservingLimiter(Array<double,3> &U, int k, const vector<double> &wts, double mmin,
                            double mmax = INFINITY, bool modifyAvg = true);

/*! Persson-Peraire switch from the log10 of the high-mode energy fraction */
double smoothnessSwitch(double se, double s0, double kappa);
