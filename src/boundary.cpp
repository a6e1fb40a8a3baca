/*!
 * \file boundary.cpp
 * \brief Prescribed-state fluid boundary: strategy record & default resolution
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
#include "../include/boundary.hpp"

#include <iostream>

fluidState makeStateLike(const conservedVars &cv, const fluidState &ref, const gasModel &gas)
{
  const vector<double>* smooth = (ref.dv.hasSmoothness) ? &ref.dv.smoothness : NULL;

  return makeFluidState(cv, gas, &ref.dv.T, smooth);
}

Array<double,3> outerNormal(const matrix<double> &u, const matrix<double> &norm)
{
  int nPts = u.getDim0();
  int nFields = u.getDim1();
  int nDims = norm.getDim1();

  Array<double,3> F(nPts,nDims,nFields);
  for (int pt=0; pt<nPts; pt++)
    for (int dim=0; dim<nDims; dim++)
      for (int k=0; k<nFields; k++)
        F(pt,dim,k) = u(pt,k)*norm(pt,dim);

  return F;
}

fluidBoundary::fluidBoundary(const boundaryFuncs &inFuncs, const string &inName)
{
  funcs = inFuncs;
  name = inName;

  /* --- Exterior state --- */

  if (!funcs.bndState && !funcs.inviscidFlux) {
    cout << "WARNING: Boundary '" << name << "' is a dummy boundary: copies interior solution." << endl;
    dummy = true;
    funcs.bndState = [](const fluidState &sM, const bndContext&) {
      return sM;
    };
  }

  if (!funcs.bndState) {
    string bndName = name;
    funcs.bndState = [bndName](const fluidState&, const bndContext&) -> fluidState {
      string errMsg = "Boundary '" + bndName + "' has no exterior state to use.";
      FatalError(errMsg.c_str());
    };
  } else {
    hasState = true;
  }

  // Copies of the resolved strategies are captured by value in the defaults below
  bndStateFunc stateFunc = funcs.bndState;

  if (!funcs.gradFlux)
    funcs.gradFlux = gradFluxCentral;

  gradNumFlux gradFunc = funcs.gradFlux;

  if (!funcs.bndTemperature) {
    funcs.bndTemperature = [stateFunc](const fluidState &sM, const bndContext &ctx) {
      return stateFunc(sM,ctx).dv.T;
    };
  }

  bndTempFunc tempFunc = funcs.bndTemperature;

  /* --- Exterior gradients --- */

  if (!funcs.bndGradCv) {
    funcs.bndGradCv = [](const fluidState&, const Array<double,3> &gradCvM, const bndContext&) {
      return gradCvM;
    };
  }

  if (!funcs.bndGradT) {
    funcs.bndGradT = [](const fluidState&, const matrix<double> &gradTM, const bndContext&) {
      return gradTM;
    };
  }

  if (!funcs.bndGradAv) {
    funcs.bndGradAv = [](const Array<double,3> &gradAvM, const bndContext&) {
      return gradAvM;
    };
  }

  bndGradCvFunc gradCvFunc = funcs.bndGradCv;
  bndGradTFunc gradTFunc = funcs.bndGradT;

  /* --- Boundary fluxes --- */

  if (!funcs.inviscidFlux) {
    funcs.inviscidFlux = [stateFunc](const fluidState &sM, const bndContext &ctx,
                                     const inviscidNumFlux &numFlux) -> matrix<double> {
      fluidState sP = stateFunc(sM,ctx);
      return numFlux(sM, sP, *ctx.gas, *ctx.norm);
    };
  }

  if (!funcs.viscousFlux) {
    funcs.viscousFlux = [stateFunc,gradCvFunc,gradTFunc](const fluidState &sM,
        const Array<double,3> &gradCvM, const matrix<double> &gradTM, const bndContext &ctx,
        const viscousNumFlux &numFlux) -> matrix<double> {
      fluidState sP = stateFunc(sM,ctx);
      Array<double,3> gradCvP = gradCvFunc(sM,gradCvM,ctx);
      matrix<double> gradTP = gradTFunc(sM,gradTM,ctx);
      return numFlux(sM, sP, gradCvM, gradCvP, gradTM, gradTP, *ctx.gas, *ctx.norm);
    };
  }

  if (!funcs.cvGradientFlux) {
    funcs.cvGradientFlux = [stateFunc,gradFunc](const fluidState &sM, const bndContext &ctx) -> Array<double,3> {
      fluidState sP = stateFunc(sM,ctx);
      int nPts = sM.getNPts();
      int nFields = sM.cv.getNFields();

      matrix<double> cvStar(nPts,nFields);
      for (int pt=0; pt<nPts; pt++)
        for (int k=0; k<nFields; k++)
          cvStar(pt,k) = gradFunc(sM.cv.U(pt,k), sP.cv.U(pt,k));

      return outerNormal(cvStar, *ctx.norm);
    };
  }

  if (!funcs.temperatureGradientFlux) {
    funcs.temperatureGradientFlux = [tempFunc,gradFunc](const fluidState &sM, const bndContext &ctx) -> matrix<double> {
      vector<double> TP = tempFunc(sM,ctx);
      const matrix<double> &norm = *ctx.norm;
      int nPts = sM.getNPts();
      int nDims = norm.getDim1();

      matrix<double> F(nPts,nDims);
      for (int pt=0; pt<nPts; pt++) {
        double TStar = gradFunc(sM.dv.T[pt], TP[pt]);
        for (int dim=0; dim<nDims; dim++)
          F(pt,dim) = TStar*norm(pt,dim);
      }

      return F;
    };
  }
}

matrix<double> fluidBoundary::inviscidDivergenceFlux(const fluidState &stateM, const bndContext &ctx,
    const inviscidNumFlux &numFlux) const
{
  return funcs.inviscidFlux(stateM, ctx, numFlux);
}

matrix<double> fluidBoundary::viscousDivergenceFlux(const fluidState &stateM, const Array<double,3> &gradCvM,
    const matrix<double> &gradTM, const bndContext &ctx, const viscousNumFlux &numFlux) const
{
  return funcs.viscousFlux(stateM, gradCvM, gradTM, ctx, numFlux);
}

Array<double,3> fluidBoundary::cvGradientFlux(const fluidState &stateM, const bndContext &ctx) const
{
  return funcs.cvGradientFlux(stateM, ctx);
}

matrix<double> fluidBoundary::temperatureGradientFlux(const fluidState &stateM, const bndContext &ctx) const
{
  return funcs.temperatureGradientFlux(stateM, ctx);
}

matrix<double> fluidBoundary::avFlux(const Array<double,3> &diffusionM, const bndContext &ctx) const
{
  Array<double,3> diffusionP = funcs.bndGradAv(diffusionM, ctx);

  const matrix<double> &norm = *ctx.norm;
  int nPts = diffusionM.getDim(0);
  int nDims = diffusionM.getDim(1);
  int nFields = diffusionM.getDim(2);

  matrix<double> Fn(nPts,nFields);
  for (int pt=0; pt<nPts; pt++)
    for (int dim=0; dim<nDims; dim++)
      for (int k=0; k<nFields; k++)
        Fn(pt,k) += gradFluxCentral(diffusionM(pt,dim,k), diffusionP(pt,dim,k)) * norm(pt,dim);

  return Fn;
}

fluidState fluidBoundary::exteriorState(const fluidState &stateM, const bndContext &ctx) const
{
  return funcs.bndState(stateM, ctx);
}

vector<double> fluidBoundary::exteriorTemperature(const fluidState &stateM, const bndContext &ctx) const
{
  return funcs.bndTemperature(stateM, ctx);
}
