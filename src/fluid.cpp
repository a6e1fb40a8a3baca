/*!
 * \file fluid.cpp
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
#include "../include/fluid.hpp"

#include <cmath>

conservedVars::conservedVars(void)
{
  nPts = 0;
  nDims = 0;
  nSpecies = 0;
}

conservedVars::conservedVars(int nPts, int nDims, int nSpecies)
{
  if (nDims < 1 || nSpecies < 0)
    FatalError("Invalid dimensions for conserved variables.");

  this->nPts = nPts;
  this->nDims = nDims;
  this->nSpecies = nSpecies;

  U.setup(nPts, nDims+2+nSpecies);
}

double fluidState::waveSpeed(int pt, const double* norm) const
{
  double vn = 0;
  for (int d=0; d<cv.getNDims(); d++)
    vn += cv.velocity(pt,d)*norm[d];

  return fabs(vn) + dv.c[pt];
}

double fluidState::smoothness(int pt) const
{
  if (!dv.hasSmoothness)
    FatalError("Smoothness indicator requested from a state built without one.");

  return dv.smoothness[pt];
}

fluidState makeFluidState(const conservedVars &cv, const gasModel &gas,
                          const vector<double>* tSeed, const vector<double>* smoothness)
{
  int nPts = cv.getNPts();
  int nSpecies = cv.getNSpecies();

  if (cv.getNDims() != gas.eos->nDims || nSpecies != gas.eos->nSpecies)
    FatalError("Conserved variables do not match the gas model.");

  if (tSeed != NULL && (int)tSeed->size() != nPts)
    FatalError("Temperature seed must have one value per point.");

  if (smoothness != NULL && (int)smoothness->size() != nPts)
    FatalError("Smoothness indicator must have one value per point.");

  fluidState state;
  state.cv = cv;

  dependentVars &dv = state.dv;
  dv.T.resize(nPts);
  dv.P.resize(nPts);
  dv.c.resize(nPts);
  dv.gamma.resize(nPts);
  dv.mu.resize(nPts);
  dv.kappa.resize(nPts);
  dv.D.setup(nPts, std::max(nSpecies,1));

  const equationOfState &eos = *gas.eos;
  const transportModel &trans = *gas.transport;

  for (int pt=0; pt<nPts; pt++) {
    const double* U = cv[pt];
    double seed = (tSeed != NULL) ? (*tSeed)[pt] : 300.;

    double T = eos.temperature(U,seed);
    dv.T[pt] = T;
    dv.P[pt] = eos.pressure(U,T);
    dv.gamma[pt] = eos.gamma(U,T);
    dv.c[pt] = sqrt(dv.gamma[pt]*dv.P[pt]/U[0]);
    dv.mu[pt] = trans.viscosity(U,T);
    dv.kappa[pt] = trans.thermalConductivity(U,T,eos);
    if (nSpecies > 0)
      trans.speciesDiffusivity(U,T,nSpecies,dv.D[pt]);
  }

  if (smoothness != NULL) {
    dv.hasSmoothness = true;
    dv.smoothness = *smoothness;
  }

  return state;
}
