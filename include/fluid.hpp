/*!
 * \file fluid.hpp
 * \brief Conserved & dependent variables of the fluid at a set of points
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

#include <vector>

#include "global.hpp"

#include "gasModel.hpp"
#include "matrix.hpp"

/*!
 * \brief Conserved variables at a set of points
 *
 * Row pt of U holds [rho, rho*u_0 .. rho*u_{nDims-1}, rho*E, rho*Y_0 ..].
 * Operations which modify a state build and return a new conservedVars.
 */
class conservedVars
{
public:
  conservedVars(void);

  conservedVars(int nPts, int nDims, int nSpecies);

  int getNPts(void) const { return nPts; }
  int getNDims(void) const { return nDims; }
  int getNSpecies(void) const { return nSpecies; }
  int getNFields(void) const { return nDims+2+nSpecies; }

  double mass(int pt) const { return U(pt,0); }
  double momentum(int pt, int dim) const { return U(pt,dim+1); }
  double energy(int pt) const { return U(pt,nDims+1); }
  double speciesMass(int pt, int k) const { return U(pt,nDims+2+k); }

  double velocity(int pt, int dim) const { return U(pt,dim+1)/U(pt,0); }
  double massFraction(int pt, int k) const { return U(pt,nDims+2+k)/U(pt,0); }

  //! Pointer to the conserved variables of point pt
  const double* operator[](int pt) const { return &U.data[pt*U.dims[1]]; }
  double* operator[](int pt) { return &U.data[pt*U.dims[1]]; }

  matrix<double> U;

private:
  int nPts, nDims, nSpecies;
};

/*! Quantities derived from the conserved variables through the gas model */
struct dependentVars
{
  vector<double> T;      //! Temperature
  vector<double> P;      //! Pressure
  vector<double> c;      //! Speed of sound
  vector<double> gamma;  //! Ratio of specific heats
  vector<double> mu;     //! Dynamic viscosity
  vector<double> kappa;  //! Thermal conductivity
  matrix<double> D;      //! Species diffusivities [nPts x nSpecies]

  bool hasSmoothness = false;
  vector<double> smoothness;  //! Artificial-viscosity smoothness indicator
};

class fluidState
{
public:
  conservedVars cv;
  dependentVars dv;

  int getNPts(void) const { return cv.getNPts(); }

  double temperature(int pt) const { return dv.T[pt]; }
  double pressure(int pt) const { return dv.P[pt]; }
  double soundSpeed(int pt) const { return dv.c[pt]; }

  //! Wave-speed bound |u.n| + c at a point for the given unit normal
  double waveSpeed(int pt, const double* norm) const;

  //! Smoothness indicator; fatal if the state was built without one
  double smoothness(int pt) const;
};

/*!
 * Evaluate the dependent variables of cv through the gas model.
 * \param tSeed  Optional temperature guess per point for iterative (mixture) solves
 * \param smoothness  Optional smoothness indicator per point; attached when given
 */
fluidState makeFluidState(const conservedVars &cv, const gasModel &gas,
                          const vector<double>* tSeed = NULL,
                          const vector<double>* smoothness = NULL);
