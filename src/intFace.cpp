/*!
 * \file intFace.cpp
 * \brief Face between two elements on the same rank
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
#include "../include/intFace.hpp"

#include "../include/solver.hpp"

void intFace::setupRightState(void)
{
  eR = myInfo.eR;

  // Both elements order the points of a shared face identically
  fptR.resize(nFpts);
  for (int fpt=0; fpt<nFpts; fpt++)
    fptR[fpt] = myInfo.fR*nFpts + fpt;
}

void intFace::getRightState(void)
{
  conservedVars cv(nFpts,nDims,nSpecies);
  vector<double> tSeed(nFpts);

  for (int fpt=0; fpt<nFpts; fpt++) {
    for (int k=0; k<nFields; k++)
      cv.U(fpt,k) = Solver->U_fpts(fptR[fpt],eR,k);
    tSeed[fpt] = Solver->T_fpts(fptR[fpt],eR);
  }

  smoothR = Solver->smoothness[eR];

  stateR = buildState(cv, tSeed, smoothR);
}

void intFace::getRightGradient(void)
{
  for (int fpt=0; fpt<nFpts; fpt++) {
    for (int d=0; d<nDims; d++) {
      for (int k=0; k<nFields; k++)
        gradCvR(fpt,d,k) = Solver->dQ_fpts(d,fptR[fpt],eR,k);
      gradTR(fpt,d) = Solver->dQ_fpts(d,fptR[fpt],eR,nFields);
    }
  }
}

void intFace::addRightFlux(const matrix<double> &Fn)
{
  for (int fpt=0; fpt<nFpts; fpt++)
    for (int k=0; k<nFields; k++)
      Solver->Fn_fpts(fptR[fpt],eR,k) -= Fn(fpt,k)*dA;
}

void intFace::setRightGradFlux(const Array<double,3> &cvFlux, const matrix<double> &TFlux)
{
  for (int fpt=0; fpt<nFpts; fpt++) {
    for (int d=0; d<nDims; d++) {
      for (int k=0; k<nFields; k++)
        Solver->gradFn_fpts(d,fptR[fpt],eR,k) = -cvFlux(fpt,d,k)*dA;
      Solver->gradFn_fpts(d,fptR[fpt],eR,nFields) = -TFlux(fpt,d)*dA;
    }
  }
}
