/*!
 * \file flux.cpp
 * \brief Physical & numerical flux functions for the compressible Navier-Stokes equations
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
#include "../include/flux.hpp"

#include <cmath>
#include <vector>

void inviscidFluxPt(const double* U, double P, int nDims, int nFields, double* F)
{
  double rho = U[0];
  double H = (U[nDims+1] + P) / rho;

  for (int dim=0; dim<nDims; dim++) {
    double* Fd = F + dim*nFields;
    double vd = U[dim+1]/rho;

    Fd[0] = U[dim+1];
    for (int i=0; i<nDims; i++)
      Fd[i+1] = U[i+1]*vd;
    Fd[dim+1] += P;
    Fd[nDims+1] = rho*H*vd;

    for (int k=nDims+2; k<nFields; k++)
      Fd[k] = U[k]*vd;
  }
}

void viscousFluxPt(const double* U, const double* gradU, const double* gradT, double mu,
                   double kappa, const double* D, const double* h, int nDims, int nSpecies,
                   double* Fv)
{
  int nFields = nDims+2+nSpecies;
  double rho = U[0];

  double v[3] = {0,0,0};
  for (int i=0; i<nDims; i++)
    v[i] = U[i+1]/rho;

  /* --- Velocity gradient: dv_i/dx_j = (d(rho*u_i)/dx_j - v_i*drho/dx_j) / rho --- */
  double dv[3][3] = {{0,0,0},{0,0,0},{0,0,0}};
  for (int i=0; i<nDims; i++)
    for (int j=0; j<nDims; j++)
      dv[i][j] = (gradU[j*nFields+i+1] - v[i]*gradU[j*nFields]) / rho;

  double divV = 0;
  for (int i=0; i<nDims; i++)
    divV += dv[i][i];

  /* --- Newtonian stress tensor --- */
  double tau[3][3];
  for (int i=0; i<nDims; i++) {
    for (int j=0; j<nDims; j++)
      tau[i][j] = mu*(dv[i][j] + dv[j][i]);
    tau[i][i] -= 2./3.*mu*divV;
  }

  for (int dim=0; dim<nDims; dim++) {
    double* Fd = Fv + dim*nFields;

    Fd[0] = 0;
    for (int i=0; i<nDims; i++)
      Fd[i+1] = tau[dim][i];

    double Fe = kappa*gradT[dim];
    for (int i=0; i<nDims; i++)
      Fe += tau[dim][i]*v[i];

    for (int k=0; k<nSpecies; k++) {
      int ind = nDims+2+k;
      double Y = U[ind]/rho;
      double dY = (gradU[dim*nFields+ind] - Y*gradU[dim*nFields]) / rho;

      // Diffusive species flux j_k = -rho*D_k*grad(Y_k) also carries enthalpy
      double jk = -rho*D[k]*dY;
      Fd[ind] = -jk;
      Fe -= h[k]*jk;
    }

    Fd[nDims+1] = Fe;
  }
}

double logMean(double aL, double aR)
{
  double zeta = aL/aR;
  double f = (zeta-1.)/(zeta+1.);
  double u = f*f;

  double F;
  if (u < 1e-2)
    F = 1. + u/3. + u*u/5. + u*u*u/7.;
  else
    F = log(zeta)/(2.*f);

  return (aL+aR)/(2.*F);
}

void chandrashekarFlux(const double* UL, const double* UR, double gamma, int nDims,
                       int nSpecies, const double* norm, double* Fn)
{
  double rhoL = UL[0];
  double rhoR = UR[0];

  double vL[3] = {0,0,0}, vR[3] = {0,0,0};
  double vsqL = 0, vsqR = 0;
  for (int i=0; i<nDims; i++) {
    vL[i] = UL[i+1]/rhoL;
    vR[i] = UR[i+1]/rhoR;
    vsqL += vL[i]*vL[i];
    vsqR += vR[i]*vR[i];
  }

  double pL = (gamma-1.)*(UL[nDims+1] - 0.5*rhoL*vsqL);
  double pR = (gamma-1.)*(UR[nDims+1] - 0.5*rhoR*vsqR);

  double betaL = 0.5*rhoL/pL;
  double betaR = 0.5*rhoR/pR;

  double rhoLn = logMean(rhoL,rhoR);
  double betaLn = logMean(betaL,betaR);
  double rhoAvg = 0.5*(rhoL+rhoR);
  double betaAvg = 0.5*(betaL+betaR);
  double pHat = 0.5*rhoAvg/betaAvg;
  double vsqAvg = 0.5*(vsqL+vsqR);

  double vAvg[3];
  double vnAvg = 0;
  for (int i=0; i<nDims; i++) {
    vAvg[i] = 0.5*(vL[i]+vR[i]);
    vnAvg += vAvg[i]*norm[i];
  }

  double fRho = rhoLn*vnAvg;
  Fn[0] = fRho;

  double fmv = 0;
  for (int i=0; i<nDims; i++) {
    Fn[i+1] = fRho*vAvg[i] + pHat*norm[i];
    fmv += Fn[i+1]*vAvg[i];
  }

  Fn[nDims+1] = fRho*(1./(2.*(gamma-1.)*betaLn) - 0.5*vsqAvg) + fmv;

  for (int k=0; k<nSpecies; k++) {
    int ind = nDims+2+k;
    Fn[ind] = fRho*0.5*(UL[ind]/rhoL + UR[ind]/rhoR);
  }
}

void consToEntropyVars(const double* U, double gamma, int nDims, int nSpecies, double* V)
{
  double rho = U[0];
  double msq = 0;
  for (int i=0; i<nDims; i++)
    msq += U[i+1]*U[i+1];

  double p = (gamma-1.)*(U[nDims+1] - 0.5*msq/rho);
  double s = log(p) - gamma*log(rho);

  V[0] = (gamma-s)/(gamma-1.) - 0.5*msq/(rho*p);
  for (int i=0; i<nDims; i++)
    V[i+1] = U[i+1]/p;
  V[nDims+1] = -rho/p;

  for (int k=0; k<nSpecies; k++)
    V[nDims+2+k] = U[nDims+2+k]/rho;
}

void entropyToConsVars(const double* V, double gamma, int nDims, int nSpecies, double* U)
{
  double vE = V[nDims+1];

  double usq = 0;
  for (int i=0; i<nDims; i++) {
    double u = -V[i+1]/vE;
    usq += u*u;
  }

  double s = gamma - (gamma-1.)*(V[0] - 0.5*vE*usq);
  double rho = pow(-vE*exp(s), -1./(gamma-1.));
  double p = -rho/vE;

  U[0] = rho;
  for (int i=0; i<nDims; i++)
    U[i+1] = rho*(-V[i+1]/vE);
  U[nDims+1] = p/(gamma-1.) + 0.5*rho*usq;

  for (int k=0; k<nSpecies; k++)
    U[nDims+2+k] = rho*V[nDims+2+k];
}

Array<double,3> inviscidFlux(const fluidState &state)
{
  int nPts = state.getNPts();
  int nDims = state.cv.getNDims();
  int nFields = state.cv.getNFields();

  Array<double,3> F(nPts,nDims,nFields);
  for (int pt=0; pt<nPts; pt++)
    inviscidFluxPt(state.cv[pt], state.dv.P[pt], nDims, nFields, &F(pt,0,0));

  return F;
}

Array<double,3> viscousFlux(const fluidState &state, const Array<double,3> &gradCv,
                            const matrix<double> &gradT, const gasModel &gas)
{
  int nPts = state.getNPts();
  int nDims = state.cv.getNDims();
  int nSpecies = state.cv.getNSpecies();
  int nFields = state.cv.getNFields();

  if ((int)gradCv.getDim0() != nPts || (int)gradT.getDim0() != nPts)
    FatalError("Gradient arrays do not match the fluid state.");

  Array<double,3> Fv(nPts,nDims,nFields);
  vector<double> h(std::max(nSpecies,1));

  for (int pt=0; pt<nPts; pt++) {
    if (nSpecies > 0)
      gas.eos->speciesEnthalpies(state.dv.T[pt], h.data());

    viscousFluxPt(state.cv[pt], &gradCv.data[pt*nDims*nFields], &gradT.data[pt*nDims],
        state.dv.mu[pt], state.dv.kappa[pt], &state.dv.D.data[pt*state.dv.D.dims[1]],
        h.data(), nDims, nSpecies, &Fv(pt,0,0));
  }

  return Fv;
}

matrix<double> normalFlux(const Array<double,3> &F, const matrix<double> &norm)
{
  int nPts = F.getDim(0);
  int nDims = F.getDim(1);
  int nFields = F.getDim(2);

  matrix<double> Fn(nPts,nFields);
  for (int pt=0; pt<nPts; pt++)
    for (int dim=0; dim<nDims; dim++)
      for (int k=0; k<nFields; k++)
        Fn(pt,k) += F(pt,dim,k)*norm(pt,dim);

  return Fn;
}

matrix<double> rusanovFlux(const fluidState &sL, const fluidState &sR, const gasModel &,
                           const matrix<double> &norm)
{
  matrix<double> Fn = normalFlux(inviscidFlux(sL),norm);
  Fn += normalFlux(inviscidFlux(sR),norm);
  Fn *= 0.5;

  int nFields = sL.cv.getNFields();
  for (int pt=0; pt<sL.getNPts(); pt++) {
    const double* n = &norm.data[pt*norm.dims[1]];
    double lambda = std::max(sL.waveSpeed(pt,n), sR.waveSpeed(pt,n));
    for (int k=0; k<nFields; k++)
      Fn(pt,k) -= 0.5*lambda*(sR.cv.U(pt,k) - sL.cv.U(pt,k));
  }

  return Fn;
}

matrix<double> centralFlux(const fluidState &sL, const fluidState &sR, const gasModel &,
                           const matrix<double> &norm)
{
  matrix<double> Fn = normalFlux(inviscidFlux(sL),norm);
  Fn += normalFlux(inviscidFlux(sR),norm);
  Fn *= 0.5;

  return Fn;
}

matrix<double> entropyStableRusanovFlux(const fluidState &sL, const fluidState &sR,
                                        const gasModel &, const matrix<double> &norm)
{
  int nPts = sL.getNPts();
  int nDims = sL.cv.getNDims();
  int nSpecies = sL.cv.getNSpecies();
  int nFields = sL.cv.getNFields();

  matrix<double> Fn(nPts,nFields);
  for (int pt=0; pt<nPts; pt++) {
    const double* n = &norm.data[pt*norm.dims[1]];
    chandrashekarFlux(sL.cv[pt], sR.cv[pt], sL.dv.gamma[pt], nDims, nSpecies, n, Fn[pt]);

    double lambda = std::max(sL.waveSpeed(pt,n), sR.waveSpeed(pt,n));
    for (int k=0; k<nFields; k++)
      Fn(pt,k) -= 0.5*lambda*(sR.cv.U(pt,k) - sL.cv.U(pt,k));
  }

  return Fn;
}

matrix<double> viscousFacialFluxCentral(const fluidState &sL, const fluidState &sR,
                                        const Array<double,3> &gradCvL, const Array<double,3> &gradCvR,
                                        const matrix<double> &gradTL, const matrix<double> &gradTR,
                                        const gasModel &gas, const matrix<double> &norm)
{
  matrix<double> Fn = normalFlux(viscousFlux(sL,gradCvL,gradTL,gas),norm);
  Fn += normalFlux(viscousFlux(sR,gradCvR,gradTR,gas),norm);
  Fn *= 0.5;

  return Fn;
}

double gradFluxCentral(double uL, double uR)
{
  return 0.5*(uL+uR);
}

inviscidNumFlux getInviscidNumFlux(int riemannType, int operatorType)
{
  if (operatorType == ENTROPY_STABLE)
    return entropyStableRusanovFlux;

  switch (riemannType) {
    case RUSANOV:
      return rusanovFlux;
    case CENTRAL:
      return centralFlux;
    default:
      FatalError("Riemann solver type not recognized.");
  }
}
