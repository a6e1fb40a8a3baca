/*!
 * \file face.cpp
 * \brief Base class for the faces between elements & on the box boundary
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
#include "../include/face.hpp"

#include "../include/flux.hpp"
#include "../include/geo.hpp"
#include "../include/solver.hpp"

void face::initialize(solver *Solver, const faceInfo &info)
{
  this->Solver = Solver;
  myInfo = info;

  nDims = Solver->nDims;
  nFields = Solver->nFields;
  nSpecies = Solver->nSpecies;
  nFpts = Solver->nFptsPerFace;

  eL = info.eL;
  dim = info.fL / 2;
  dA = Solver->Geo->dA[dim];

  fptL.resize(nFpts);
  for (int fpt=0; fpt<nFpts; fpt++)
    fptL[fpt] = info.fL*nFpts + fpt;

  // Cartesian elements: the normal is a coordinate direction
  double sign = (info.fL % 2 == 0) ? -1. : 1.;
  normL.setup(nFpts,nDims);
  for (int fpt=0; fpt<nFpts; fpt++)
    normL(fpt,dim) = sign;

  gradCvL.setup(nFpts,nDims,nFields);
  gradCvR.setup(nFpts,nDims,nFields);
  gradTL.setup(nFpts,nDims);
  gradTR.setup(nFpts,nDims);

  smoothL = 0;
  smoothR = 0;

  setupRightState();
}

fluidState face::buildState(const conservedVars &cv, const vector<double> &tSeed, double smooth) const
{
  if (Solver->params->artVisc) {
    vector<double> sm(cv.getNPts(), smooth);
    return makeFluidState(cv, Solver->gas, &tSeed, &sm);
  }

  return makeFluidState(cv, Solver->gas, &tSeed);
}

void face::getLeftState(void)
{
  conservedVars cv(nFpts,nDims,nSpecies);
  vector<double> tSeed(nFpts);

  for (int fpt=0; fpt<nFpts; fpt++) {
    for (int k=0; k<nFields; k++)
      cv.U(fpt,k) = Solver->U_fpts(fptL[fpt],eL,k);
    tSeed[fpt] = Solver->T_fpts(fptL[fpt],eL);
  }

  smoothL = Solver->smoothness[eL];

  stateL = buildState(cv, tSeed, smoothL);
}

void face::getLeftGradient(void)
{
  for (int fpt=0; fpt<nFpts; fpt++) {
    for (int d=0; d<nDims; d++) {
      for (int k=0; k<nFields; k++)
        gradCvL(fpt,d,k) = Solver->dQ_fpts(d,fptL[fpt],eL,k);
      gradTL(fpt,d) = Solver->dQ_fpts(d,fptL[fpt],eL,nFields);
    }
  }
}

Array<double,3> face::avDiffusion(const Array<double,3> &gradCv, double smooth) const
{
  Array<double,3> r(nFpts,nDims,nFields);
  double fac = -Solver->params->avAlpha*smooth;
  for (int fpt=0; fpt<nFpts; fpt++)
    for (int d=0; d<nDims; d++)
      for (int k=0; k<nFields; k++)
        r(fpt,d,k) = fac*gradCv(fpt,d,k);

  return r;
}

void face::addLeftFlux(const matrix<double> &Fn)
{
  for (int fpt=0; fpt<nFpts; fpt++)
    for (int k=0; k<nFields; k++)
      Solver->Fn_fpts(fptL[fpt],eL,k) += Fn(fpt,k)*dA;
}

void face::setLeftGradFlux(const Array<double,3> &cvFlux, const matrix<double> &TFlux)
{
  for (int fpt=0; fpt<nFpts; fpt++) {
    for (int d=0; d<nDims; d++) {
      for (int k=0; k<nFields; k++)
        Solver->gradFn_fpts(d,fptL[fpt],eL,k) = cvFlux(fpt,d,k)*dA;
      Solver->gradFn_fpts(d,fptL[fpt],eL,nFields) = TFlux(fpt,d)*dA;
    }
  }
}

void face::calcGradFlux(void)
{
  Array<double,3> cvFlux(nFpts,nDims,nFields);
  matrix<double> TFlux(nFpts,nDims);

  for (int fpt=0; fpt<nFpts; fpt++) {
    double TC = gradFluxCentral(stateL.temperature(fpt), stateR.temperature(fpt));
    for (int d=0; d<nDims; d++) {
      for (int k=0; k<nFields; k++)
        cvFlux(fpt,d,k) = gradFluxCentral(stateL.cv.U(fpt,k), stateR.cv.U(fpt,k)) * normL(fpt,d);
      TFlux(fpt,d) = TC*normL(fpt,d);
    }
  }

  setLeftGradFlux(cvFlux, TFlux);
  setRightGradFlux(cvFlux, TFlux);
}

void face::calcInviscidFlux(void)
{
  matrix<double> Fn = Solver->numFlux(stateL, stateR, Solver->gas, normL);

  addLeftFlux(Fn);
  addRightFlux(Fn);
}

void face::calcViscousFlux(void)
{
  matrix<double> Fn(nFpts,nFields);

  if (Solver->params->viscous) {
    matrix<double> Fv = viscousFacialFluxCentral(stateL, stateR, gradCvL, gradCvR, gradTL,
                                                 gradTR, Solver->gas, normL);
    Fn -= Fv;
  }

  if (Solver->params->artVisc) {
    Array<double,3> rL = avDiffusion(gradCvL, smoothL);
    Array<double,3> rR = avDiffusion(gradCvR, smoothR);
    for (int fpt=0; fpt<nFpts; fpt++)
      for (int d=0; d<nDims; d++)
        for (int k=0; k<nFields; k++)
          Fn(fpt,k) += gradFluxCentral(rL(fpt,d,k), rR(fpt,d,k)) * normL(fpt,d);
  }

  addLeftFlux(Fn);
  addRightFlux(Fn);
}
