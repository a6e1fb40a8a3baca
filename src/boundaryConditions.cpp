/*!
 * \file boundaryConditions.cpp
 * \brief Catalogue of fluid boundary conditions built on the prescribed-state boundary
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
#include "../include/boundaryConditions.hpp"

#include <cmath>
#include <sstream>

namespace {

//! Momentum with twice its normal component removed
conservedVars reflectMomentum(const conservedVars &cvM, const matrix<double> &norm)
{
  conservedVars cvP = cvM;
  int nDims = cvM.getNDims();

  for (int pt=0; pt<cvM.getNPts(); pt++) {
    double mn = 0;
    for (int d=0; d<nDims; d++)
      mn += cvM.momentum(pt,d)*norm(pt,d);

    for (int d=0; d<nDims; d++)
      cvP.U(pt,d+1) = cvM.momentum(pt,d) - 2*mn*norm(pt,d);
  }

  return cvP;
}

//! Momentum with its normal component removed; the internal energy is kept
conservedVars projectMomentum(const conservedVars &cvM, const matrix<double> &norm)
{
  conservedVars cvP = cvM;
  int nDims = cvM.getNDims();

  for (int pt=0; pt<cvM.getNPts(); pt++) {
    double mn = 0;
    for (int d=0; d<nDims; d++)
      mn += cvM.momentum(pt,d)*norm(pt,d);

    for (int d=0; d<nDims; d++)
      cvP.U(pt,d+1) = cvM.momentum(pt,d) - mn*norm(pt,d);
    cvP.U(pt,nDims+1) = cvM.energy(pt) - 0.5*mn*mn/cvM.mass(pt);
  }

  return cvP;
}

//! Interior state with the momentum replaced by a*m + 2*rho*vWall
conservedVars scaleMomentum(const conservedVars &cvM, double a, const vector<double> &vWall)
{
  conservedVars cvP = cvM;
  int nDims = cvM.getNDims();

  for (int pt=0; pt<cvM.getNPts(); pt++) {
    for (int d=0; d<nDims; d++) {
      cvP.U(pt,d+1) = a*cvM.momentum(pt,d);
      if (!vWall.empty())
        cvP.U(pt,d+1) += 2*cvM.mass(pt)*vWall[d];
    }
  }

  return cvP;
}

/*! grad(CV) at a wall: the normal part of each species mass-fraction gradient
 *  is removed, grad(rho*Y_k) = rho*grad(Y_k) + Y_k*grad(rho) */
Array<double,3> wallGradCv(const fluidState &sM, const Array<double,3> &gradCvM,
                           const matrix<double> &norm)
{
  Array<double,3> gradCvP = gradCvM;

  int nDims = sM.cv.getNDims();
  int nSpecies = sM.cv.getNSpecies();

  for (int pt=0; pt<sM.getNPts(); pt++) {
    double rho = sM.cv.mass(pt);
    for (int k=0; k<nSpecies; k++) {
      int ind = nDims+2+k;
      double Y = sM.cv.massFraction(pt,k);

      double dY[3] = {0,0,0};
      double dYn = 0;
      for (int d=0; d<nDims; d++) {
        dY[d] = (gradCvM(pt,d,ind) - Y*gradCvM(pt,d,0)) / rho;
        dYn += dY[d]*norm(pt,d);
      }

      for (int d=0; d<nDims; d++)
        gradCvP(pt,d,ind) = rho*(dY[d] - dYn*norm(pt,d)) + Y*gradCvM(pt,d,0);
    }
  }

  return gradCvP;
}

/*!
 * grad(CV) at a symmetry plane, paired with the plane state sP
 *
 * The velocity gradient G(i,j) = dv_i/dx_j loses its normal-tangential
 * coupling, G+ = P G P + (n.G.n) n n^T with P = I - n n^T, so the stress
 * tau.n is parallel to n.  grad(rho*v) is rebuilt from G+ and the velocity
 * of sP; species gradients are treated as at a wall.
 */
Array<double,3> symmetryGradCv(const fluidState &sM, const fluidState &sP,
                               const Array<double,3> &gradCvM, const matrix<double> &norm)
{
  Array<double,3> gradCvP = wallGradCv(sM,gradCvM,norm);

  int nDims = sM.cv.getNDims();

  for (int pt=0; pt<sM.getNPts(); pt++) {
    double rho = sM.cv.mass(pt);

    double n[3] = {0,0,0};
    for (int d=0; d<nDims; d++)
      n[d] = norm(pt,d);

    double G[3][3] = {{0,0,0},{0,0,0},{0,0,0}};
    for (int i=0; i<nDims; i++)
      for (int j=0; j<nDims; j++)
        G[i][j] = (gradCvM(pt,j,i+1) - sM.cv.velocity(pt,i)*gradCvM(pt,j,0)) / rho;

    double Gn[3] = {0,0,0};
    double nG[3] = {0,0,0};
    for (int i=0; i<nDims; i++) {
      for (int j=0; j<nDims; j++) {
        Gn[i] += G[i][j]*n[j];
        nG[i] += n[j]*G[j][i];
      }
    }

    double nGn = 0;
    for (int i=0; i<nDims; i++)
      nGn += n[i]*Gn[i];

    for (int i=0; i<nDims; i++) {
      for (int j=0; j<nDims; j++) {
        double Gp = G[i][j] - n[i]*nG[j] - Gn[i]*n[j] + 2*nGn*n[i]*n[j];
        gradCvP(pt,j,i+1) = rho*Gp + sP.cv.velocity(pt,i)*gradCvM(pt,j,0);
      }
    }
  }

  return gradCvP;
}

//! Gradient with its normal component removed
matrix<double> dropNormal(const matrix<double> &gradTM, const matrix<double> &norm)
{
  matrix<double> gradTP = gradTM;
  int nDims = norm.getDim1();

  for (uint pt=0; pt<gradTM.getDim0(); pt++) {
    double gn = 0;
    for (int d=0; d<nDims; d++)
      gn += gradTM(pt,d)*norm(pt,d);

    for (int d=0; d<nDims; d++)
      gradTP(pt,d) = gradTM(pt,d) - gn*norm(pt,d);
  }

  return gradTP;
}

/*! AV diffusion mirrored at a slip wall: scalar parts negated, momentum
 *  M+ = -(M - 2 n (M n)^T) with M(i,d) the d-component for momentum i */
Array<double,3> slipGradAv(const Array<double,3> &gradAvM, const matrix<double> &norm)
{
  int nPts = gradAvM.getDim(0);
  int nDims = gradAvM.getDim(1);
  int nFields = gradAvM.getDim(2);

  Array<double,3> gradAvP(nPts,nDims,nFields);
  for (int pt=0; pt<nPts; pt++) {
    for (int d=0; d<nDims; d++) {
      gradAvP(pt,d,0) = -gradAvM(pt,d,0);
      for (int k=nDims+1; k<nFields; k++)
        gradAvP(pt,d,k) = -gradAvM(pt,d,k);
    }

    double Mn[3] = {0,0,0};
    for (int i=0; i<nDims; i++)
      for (int d=0; d<nDims; d++)
        Mn[i] += gradAvM(pt,d,i+1)*norm(pt,d);

    for (int i=0; i<nDims; i++)
      for (int d=0; d<nDims; d++)
        gradAvP(pt,d,i+1) = -(gradAvM(pt,d,i+1) - 2*norm(pt,i)*Mn[d]);
  }

  return gradAvP;
}

//! Wall viscous flux evaluated directly at the wall state, Fv(state+, grad+).n
matrix<double> wallViscousFlux(const fluidState &sP, const Array<double,3> &gradCvP,
                               const matrix<double> &gradTP, const bndContext &ctx)
{
  return normalFlux(viscousFlux(sP, gradCvP, gradTP, *ctx.gas), *ctx.norm);
}

vector<double> massFractions(const conservedVars &cv, int pt)
{
  vector<double> Y(cv.getNSpecies());
  for (int k=0; k<cv.getNSpecies(); k++)
    Y[k] = cv.massFraction(pt,k);

  return Y;
}

string toString(int val)
{
  stringstream ss;
  ss << val;
  return ss.str();
}

}

/* ------------------------- Configuration checks -------------------------- */

string checkMovingWallParams(const bcParams &bc, int nDims)
{
  if ((int)bc.VWall.size() != nDims)
    return "Boundary " + bc.tag + ": wall velocity must have " + toString(nDims) + " components.";

  return "";
}

string checkFarfieldParams(const bcParams &bc, int nDims, int nSpecies)
{
  if (bc.hasV && (int)bc.VBound.size() != nDims)
    return "Boundary " + bc.tag + ": free-stream velocity must have " + toString(nDims) + " components.";

  if (nSpecies > 0) {
    if (!bc.hasY)
      return "Boundary " + bc.tag + ": free-stream species mass fractions must be given.";

    if ((int)bc.YBound.size() != nSpecies)
      return "Boundary " + bc.tag + ": free-stream species mass fractions of improper size.";
  }

  return "";
}

string checkInflowParams(const bcParams &bc, int nDims, int nSpecies)
{
  if (!bc.hasV)
    return "Boundary " + bc.tag + ": inflow boundary requires a free-stream velocity.";

  if ((int)bc.VBound.size() != nDims)
    return "Boundary " + bc.tag + ": free-stream velocity must have " + toString(nDims) + " components.";

  int nGiven = (int)bc.hasRho + (int)bc.hasP + (int)bc.hasT;
  if (nGiven < 2)
    return "Boundary " + bc.tag + ": inflow boundary requires two of density, pressure & temperature.";

  if (nSpecies > 0) {
    if (!bc.hasY)
      return "Boundary " + bc.tag + ": free-stream species mass fractions must be given.";

    if ((int)bc.YBound.size() != nSpecies)
      return "Boundary " + bc.tag + ": free-stream species mass fractions of improper size.";
  }

  return "";
}

/* ------------------------------- Factories ------------------------------- */

fluidBoundary dummyBoundary(void)
{
  return fluidBoundary(boundaryFuncs(), "dummy");
}

fluidBoundary adiabaticSlipBoundary(void)
{
  boundaryFuncs funcs;

  funcs.bndState = [](const fluidState &sM, const bndContext &ctx) {
    return makeStateLike(reflectMomentum(sM.cv,*ctx.norm), sM, *ctx.gas);
  };

  funcs.bndTemperature = [](const fluidState &sM, const bndContext&) {
    return sM.dv.T;
  };

  funcs.bndGradAv = [](const Array<double,3> &gradAvM, const bndContext &ctx) {
    return slipGradAv(gradAvM,*ctx.norm);
  };

  return fluidBoundary(funcs, "slip_wall");
}

fluidBoundary adiabaticNoslipMovingBoundary(const vector<double> &vWall, int nDims)
{
  if ((int)vWall.size() != nDims)
    FatalError("Specified wall velocity must have nDims components.");

  boundaryFuncs funcs;

  funcs.bndState = [vWall](const fluidState &sM, const bndContext &ctx) {
    return makeStateLike(scaleMomentum(sM.cv,-1.,vWall), sM, *ctx.gas);
  };

  funcs.bndTemperature = [](const fluidState &sM, const bndContext&) {
    return sM.dv.T;
  };

  funcs.bndGradAv = [](const Array<double,3> &gradAvM, const bndContext&) -> Array<double,3> {
    Array<double,3> gradAvP = gradAvM;
    for (auto &val:gradAvP.data)
      val = -val;
    return gradAvP;
  };

  return fluidBoundary(funcs, "adiabatic_noslip_moving");
}

fluidBoundary isothermalNoslipBoundary(double TWall)
{
  boundaryFuncs funcs;

  funcs.bndState = [TWall](const fluidState &sM, const bndContext &ctx) -> fluidState {
    const equationOfState &eos = *ctx.gas->eos;
    conservedVars cvP = scaleMomentum(sM.cv,-1.,vector<double>());

    for (int pt=0; pt<sM.getNPts(); pt++) {
      vector<double> Y = massFractions(sM.cv,pt);
      double rho = sM.cv.mass(pt);
      double eWall = eos.internalEnergy(TWall,Y.data());
      cvP.U(pt,eos.nDims+1) = rho*eWall + eos.kineticEnergy(sM.cv[pt]);
    }

    return makeStateLike(cvP, sM, *ctx.gas);
  };

  funcs.bndTemperature = [TWall](const fluidState &sM, const bndContext&) -> vector<double> {
    vector<double> TP(sM.getNPts());
    for (int pt=0; pt<sM.getNPts(); pt++)
      TP[pt] = 2*TWall - sM.dv.T[pt];
    return TP;
  };

  return fluidBoundary(funcs, "isothermal_noslip");
}

fluidBoundary farfieldBoundary(double PInf, double TInf, const vector<double> &VInf,
                               const vector<double> &YInf)
{
  boundaryFuncs funcs;

  funcs.bndState = [PInf,TInf,VInf,YInf](const fluidState &sM, const bndContext &ctx) -> fluidState {
    const equationOfState &eos = *ctx.gas->eos;
    int nPts = sM.getNPts();
    int nDims = eos.nDims;
    int nSpecies = eos.nSpecies;

    double rho = eos.density(PInf,TInf,YInf.data());
    double e = eos.internalEnergy(TInf,YInf.data());

    double vsq = 0;
    for (int d=0; d<nDims; d++)
      vsq += VInf[d]*VInf[d];

    conservedVars cvP(nPts,nDims,nSpecies);
    for (int pt=0; pt<nPts; pt++) {
      cvP.U(pt,0) = rho;
      for (int d=0; d<nDims; d++)
        cvP.U(pt,d+1) = rho*VInf[d];
      cvP.U(pt,nDims+1) = rho*(e + 0.5*vsq);
      for (int k=0; k<nSpecies; k++)
        cvP.U(pt,nDims+2+k) = rho*YInf[k];
    }

    vector<double> seed(nPts,TInf);
    const vector<double>* smooth = (sM.dv.hasSmoothness) ? &sM.dv.smoothness : NULL;

    return makeFluidState(cvP, *ctx.gas, &seed, smooth);
  };

  funcs.bndTemperature = [TInf](const fluidState &sM, const bndContext&) {
    return vector<double>(sM.getNPts(),TInf);
  };

  return fluidBoundary(funcs, "farfield");
}

fluidBoundary outflowBoundary(double PBound)
{
  boundaryFuncs funcs;

  funcs.bndState = [PBound](const fluidState &sM, const bndContext &ctx) -> fluidState {
    const matrix<double> &norm = *ctx.norm;
    const equationOfState &eos = *ctx.gas->eos;
    int nDims = eos.nDims;

    conservedVars cvP = sM.cv;
    for (int pt=0; pt<sM.getNPts(); pt++) {
      double vn = 0;
      for (int d=0; d<nDims; d++)
        vn += sM.cv.velocity(pt,d)*norm(pt,d);

      // Both branches are evaluated; the supersonic one keeps the interior energy
      double ESub = (2*PBound - sM.dv.P[pt])/(sM.dv.gamma[pt]-1.) + eos.kineticEnergy(sM.cv[pt]);
      double ESup = sM.cv.energy(pt);

      cvP.U(pt,nDims+1) = (fabs(vn) >= sM.dv.c[pt]) ? ESup : ESub;
    }

    return makeStateLike(cvP, sM, *ctx.gas);
  };

  return fluidBoundary(funcs, "outflow");
}

fluidState inflowFreeStreamState(const bcParams &bc, const gasModel &gas, int nDims, int nSpecies)
{
  string errMsg = checkInflowParams(bc, nDims, nSpecies);
  if (!errMsg.empty())
    FatalError(errMsg.c_str());

  const equationOfState &eos = *gas.eos;
  vector<double> Y = bc.YBound;
  Y.resize(nSpecies);

  double rho, T;
  if (bc.hasRho && bc.hasP) {
    rho = bc.rhoBound;
    T = bc.PBound / (rho*eos.gasConstant(Y.data()));
  } else if (bc.hasP && bc.hasT) {
    T = bc.TBound;
    rho = eos.density(bc.PBound, T, Y.data());
  } else {
    rho = bc.rhoBound;
    T = bc.TBound;
  }

  double vsq = 0;
  for (int d=0; d<nDims; d++)
    vsq += bc.VBound[d]*bc.VBound[d];

  conservedVars cv(1,nDims,nSpecies);
  cv.U(0,0) = rho;
  for (int d=0; d<nDims; d++)
    cv.U(0,d+1) = rho*bc.VBound[d];
  cv.U(0,nDims+1) = rho*(eos.internalEnergy(T,Y.data()) + 0.5*vsq);
  for (int k=0; k<nSpecies; k++)
    cv.U(0,nDims+2+k) = rho*Y[k];

  vector<double> seed(1,T);
  return makeFluidState(cv, gas, &seed);
}

fluidBoundary inflowBoundary(const fluidState &freeStream)
{
  if (freeStream.getNPts() != 1)
    FatalError("Inflow free-stream state must be given at a single point.");

  boundaryFuncs funcs;

  funcs.bndState = [freeStream](const fluidState &sM, const bndContext &ctx) -> fluidState {
    const matrix<double> &norm = *ctx.norm;
    int nDims = sM.cv.getNDims();
    int nSpecies = sM.cv.getNSpecies();

    double rhoP = freeStream.cv.mass(0);
    double cP = freeStream.dv.c[0];
    double gamP = freeStream.dv.gamma[0];

    // Entropy of the free stream, p = K rho^gamma
    double entropy = cP*cP / (gamP*pow(rhoP,gamP-1.));

    conservedVars cvB(sM.getNPts(),nDims,nSpecies);
    for (int pt=0; pt<sM.getNPts(); pt++) {
      double vP = 0, vM = 0;
      for (int d=0; d<nDims; d++) {
        vP += freeStream.cv.velocity(0,d)*norm(pt,d);
        vM += sM.cv.velocity(pt,d)*norm(pt,d);
      }

      double cM = sM.dv.c[pt];
      double gamM = sM.dv.gamma[pt];

      double rPlusSub = vM + 2*cM/(gamM-1.);
      double rPlusSup = vP + 2*cP/(gamP-1.);
      double rPlus = (vM > cM) ? rPlusSup : rPlusSub;
      double rMinus = vP - 2*cP/(gamP-1.);

      double vnB = 0.5*(rMinus + rPlus);
      double cB = 0.25*(gamP-1.)*(rPlus - rMinus);

      double rhoB = pow(cB*cB/(gamP*entropy), 1./(gamP-1.));
      double pB = rhoB*cB*cB/gamP;

      double vsq = 0;
      cvB.U(pt,0) = rhoB;
      for (int d=0; d<nDims; d++) {
        double vB = freeStream.cv.velocity(0,d) + (vnB - vP)*norm(pt,d);
        cvB.U(pt,d+1) = rhoB*vB;
        vsq += vB*vB;
      }
      cvB.U(pt,nDims+1) = pB/(gamP-1.) + 0.5*rhoB*vsq;

      for (int k=0; k<nSpecies; k++)
        cvB.U(pt,nDims+2+k) = rhoB*freeStream.cv.massFraction(0,k);
    }

    return makeStateLike(cvB, sM, *ctx.gas);
  };

  return fluidBoundary(funcs, "inflow");
}

fluidBoundary isothermalWallBoundary(double TWall)
{
  boundaryFuncs funcs;

  // Diffusive wall state: zero velocity, internal energy at TWall
  bndStateFunc wallState = [TWall](const fluidState &sM, const bndContext &ctx) -> fluidState {
    const equationOfState &eos = *ctx.gas->eos;
    conservedVars cvP = scaleMomentum(sM.cv,0.,vector<double>());

    for (int pt=0; pt<sM.getNPts(); pt++) {
      vector<double> Y = massFractions(sM.cv,pt);
      cvP.U(pt,eos.nDims+1) = sM.cv.mass(pt)*eos.internalEnergy(TWall,Y.data());
    }

    return makeStateLike(cvP, sM, *ctx.gas);
  };

  funcs.bndState = wallState;

  funcs.inviscidFlux = [](const fluidState &sM, const bndContext &ctx, const inviscidNumFlux &numFlux) -> matrix<double> {
    fluidState sP = makeStateLike(scaleMomentum(sM.cv,-1.,vector<double>()), sM, *ctx.gas);
    return numFlux(sM, sP, *ctx.gas, *ctx.norm);
  };

  funcs.bndTemperature = [TWall](const fluidState &sM, const bndContext&) {
    return vector<double>(sM.getNPts(),TWall);
  };

  funcs.bndGradCv = [](const fluidState &sM, const Array<double,3> &gradCvM, const bndContext &ctx) {
    return wallGradCv(sM,gradCvM,*ctx.norm);
  };

  funcs.viscousFlux = [wallState](const fluidState &sM, const Array<double,3> &gradCvM,
      const matrix<double> &gradTM, const bndContext &ctx, const viscousNumFlux&) -> matrix<double> {
    fluidState sP = wallState(sM,ctx);
    return wallViscousFlux(sP, wallGradCv(sM,gradCvM,*ctx.norm), gradTM, ctx);
  };

  return fluidBoundary(funcs, "isothermal_wall");
}

fluidBoundary adiabaticNoslipWallBoundary(void)
{
  boundaryFuncs funcs;

  funcs.bndState = [](const fluidState &sM, const bndContext &ctx) {
    return makeStateLike(scaleMomentum(sM.cv,-1.,vector<double>()), sM, *ctx.gas);
  };

  funcs.bndTemperature = [](const fluidState &sM, const bndContext&) {
    return sM.dv.T;
  };

  funcs.bndGradCv = [](const fluidState &sM, const Array<double,3> &gradCvM, const bndContext &ctx) {
    return wallGradCv(sM,gradCvM,*ctx.norm);
  };

  funcs.bndGradT = [](const fluidState&, const matrix<double> &gradTM, const bndContext &ctx) {
    return dropNormal(gradTM,*ctx.norm);
  };

  funcs.viscousFlux = [](const fluidState &sM, const Array<double,3> &gradCvM,
      const matrix<double> &gradTM, const bndContext &ctx, const viscousNumFlux&) -> matrix<double> {
    // Diffusive wall state: zero velocity, interior energy
    fluidState sP = makeStateLike(scaleMomentum(sM.cv,0.,vector<double>()), sM, *ctx.gas);
    return wallViscousFlux(sP, wallGradCv(sM,gradCvM,*ctx.norm), dropNormal(gradTM,*ctx.norm), ctx);
  };

  return fluidBoundary(funcs, "adiabatic_noslip_wall");
}

fluidBoundary symmetryBoundary(void)
{
  boundaryFuncs funcs;

  funcs.bndState = [](const fluidState &sM, const bndContext &ctx) {
    return makeStateLike(reflectMomentum(sM.cv,*ctx.norm), sM, *ctx.gas);
  };

  funcs.bndTemperature = [](const fluidState &sM, const bndContext&) {
    return sM.dv.T;
  };

  // Diffusive plane state: tangential velocity only, interior temperature
  bndStateFunc planeState = [](const fluidState &sM, const bndContext &ctx) {
    return makeStateLike(projectMomentum(sM.cv,*ctx.norm), sM, *ctx.gas);
  };

  funcs.bndGradCv = [planeState](const fluidState &sM, const Array<double,3> &gradCvM, const bndContext &ctx) {
    return symmetryGradCv(sM, planeState(sM,ctx), gradCvM, *ctx.norm);
  };

  funcs.bndGradT = [](const fluidState&, const matrix<double> &gradTM, const bndContext &ctx) {
    return dropNormal(gradTM,*ctx.norm);
  };

  funcs.bndGradAv = [](const Array<double,3> &gradAvM, const bndContext &ctx) {
    return slipGradAv(gradAvM,*ctx.norm);
  };

  // No shear stress, work or heat flux crosses the plane
  funcs.viscousFlux = [planeState](const fluidState &sM, const Array<double,3> &gradCvM,
      const matrix<double> &gradTM, const bndContext &ctx, const viscousNumFlux&) -> matrix<double> {
    fluidState sP = planeState(sM,ctx);
    return wallViscousFlux(sP, symmetryGradCv(sM,sP,gradCvM,*ctx.norm), dropNormal(gradTM,*ctx.norm), ctx);
  };

  return fluidBoundary(funcs, "symmetry");
}

/* ------------------------------- Setup ----------------------------------- */

fluidBoundary createBoundary(const bcParams &bc, const gasModel &gas, int nDims, int nSpecies)
{
  string errMsg;

  switch (bc.bcType) {
    case DUMMY:
      return dummyBoundary();

    case SLIP_WALL:
      return adiabaticSlipBoundary();

    case ADIABATIC_NOSLIP_MOVING:
      errMsg = checkMovingWallParams(bc, nDims);
      if (!errMsg.empty()) FatalError(errMsg.c_str());
      return adiabaticNoslipMovingBoundary(bc.VWall, nDims);

    case ISOTHERMAL_NOSLIP:
      return isothermalNoslipBoundary(bc.TWall);

    case FARFIELD: {
      errMsg = checkFarfieldParams(bc, nDims, nSpecies);
      if (!errMsg.empty()) FatalError(errMsg.c_str());
      vector<double> V = (bc.hasV) ? bc.VBound : vector<double>(nDims,0.);
      vector<double> Y = bc.YBound;
      Y.resize(nSpecies);
      return farfieldBoundary(bc.PBound, bc.TBound, V, Y);
    }

    case SUB_OUT:
      return outflowBoundary(bc.PBound);

    case SUB_IN:
      return inflowBoundary(inflowFreeStreamState(bc, gas, nDims, nSpecies));

    case ISOTHERMAL_WALL:
      return isothermalWallBoundary(bc.TWall);

    case ADIABATIC_NOSLIP_WALL:
      return adiabaticNoslipWallBoundary();

    case SYMMETRY:
      return symmetryBoundary();

    default:
      errMsg = "Boundary condition not usable on mesh boundary " + bc.tag + ": " + bc.bcName;
      FatalError(errMsg.c_str());
  }
}

map<string,fluidBoundary> setupBoundaries(const input *params, const gasModel &gas,
                                          const vector<string> &meshTags)
{
  map<string,fluidBoundary> bnds;

  for (auto &tag:meshTags) {
    if (bnds.count(tag)) continue;

    auto it = params->bcs.find(tag);
    if (it == params->bcs.end()) {
      string errMsg = "No boundary condition given for mesh boundary: " + tag;
      FatalError(errMsg.c_str());
    }

    if (params->rank == 0)
      cout << "Solver: Boundary '" << tag << "' using " << it->second.bcName << endl;

    bnds[tag] = createBoundary(it->second, gas, params->nDims, params->nSpecies);
  }

  return bnds;
}
