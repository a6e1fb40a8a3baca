/*!
 * \file boundFace.cpp
 * \brief Face on a tagged side of the box
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
#include "../include/boundFace.hpp"

#include "../include/solver.hpp"

void boundFace::setupRightState(void)
{
  auto it = Solver->bounds.find(myInfo.bndTag);
  if (it == Solver->bounds.end()) {
    string errMsg = "No boundary condition given for mesh boundary: " + myInfo.bndTag;
    FatalError(errMsg.c_str());
  }

  bnd = &(it->second);
}

bndContext boundFace::getContext(void) const
{
  bndContext ctx;
  ctx.gas = &Solver->gas;
  ctx.norm = &normL;
  ctx.time = Solver->rkTime;

  return ctx;
}

void boundFace::calcGradFlux(void)
{
  bndContext ctx = getContext();

  Array<double,3> cvFlux = bnd->cvGradientFlux(stateL, ctx);
  matrix<double> TFlux = bnd->temperatureGradientFlux(stateL, ctx);

  setLeftGradFlux(cvFlux, TFlux);
}

void boundFace::calcInviscidFlux(void)
{
  bndContext ctx = getContext();

  matrix<double> Fn = bnd->inviscidDivergenceFlux(stateL, ctx, Solver->numFlux);

  addLeftFlux(Fn);
}

void boundFace::calcViscousFlux(void)
{
  bndContext ctx = getContext();

  matrix<double> Fn(nFpts,nFields);

  if (Solver->params->viscous)
    Fn -= bnd->viscousDivergenceFlux(stateL, gradCvL, gradTL, ctx);

  if (Solver->params->artVisc)
    Fn += bnd->avFlux(avDiffusion(gradCvL, smoothL), ctx);

  addLeftFlux(Fn);
}
