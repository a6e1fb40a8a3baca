/*!
 * \file solver_av.cpp
 * \brief Shock-capturing, positivity-limiting & health-checking routines of the solver
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
#include "../include/solver.hpp"

#include <sstream>

double smoothnessSwitch(double se, double s0, double kappa)
{
  if (se < s0 - kappa)
    return 0.;
  else if (se > s0 + kappa)
    return 1.;
  else
    return 0.5*(1. + sin(pi*(se-s0)/(2.*kappa)));
}

void solver::calcSmoothness(void)
{
  const oper &op = opers[order];

  matrix<double> rho(nSpts,nEles);
  matrix<double> modes(nSpts,nEles);

  for (int spt=0; spt<nSpts; spt++)
    for (int e=0; e<nEles; e++)
      rho(spt,e) = U_spts(spt,e,0);

  op.applyInvVandermonde(rho.getData(), modes.getData(), nEles);

#pragma omp parallel for
  for (int e=0; e<nEles; e++) {
    double total = 0;
    double high = 0;
    for (int mode=0; mode<nSpts; mode++) {
      double sq = modes(mode,e)*modes(mode,e);
      total += sq;
      if (op.isHighMode(mode)) high += sq;
    }

    if (total <= 0 || high <= 0) {
      smoothness[e] = 0.;
      continue;
    }

    double se = log10(high/total);
    smoothness[e] = smoothnessSwitch(se, params->avS0, params->avKappa);
  }
}

void boundPreservingLimiter(Array<double,3> &U, int k, const vector<double> &wts, double mmin,
                            double mmax, bool modifyAvg)
{
  int nSpts = U.getDim(0);
  int nEles = U.getDim(1);

  for (int e=0; e<nEles; e++) {
    double avg = 0;
    double uMin = U(0,e,k);
    double uMax = U(0,e,k);
    for (int spt=0; spt<nSpts; spt++) {
      avg += wts[spt]*U(spt,e,k);
      uMin = min(uMin,U(spt,e,k));
      uMax = max(uMax,U(spt,e,k));
    }

    if (modifyAvg)
      avg = max(avg,mmin);

    double theta = 1.;
    if (uMin < mmin)
      theta = min(theta, std::abs((mmin-avg)/(uMin-avg+1e-13)));

    if (std::isfinite(mmax)) {
      avg = min(avg,mmax);
      if (uMax > mmax)
        theta = min(theta, std::abs((mmax-avg)/(uMax-avg+1e-13)));
    }

    for (int spt=0; spt<nSpts; spt++)
      U(spt,e,k) = theta*(U(spt,e,k)-avg) + avg;
  }
}

void solver::applyLimiter(void)
{
  const vector<double> &wts = opers[order].getAvgWeights();

  boundPreservingLimiter(U_spts, 0, wts, params->rhoMin);

  if (nSpecies == 0) return;

  // Limit the mass fractions, then rebuild the partial densities
  Array<double,3> Y(nSpts,nEles,1);
  for (int s=0; s<nSpecies; s++) {
    int k = nDims+2+s;
    for (int spt=0; spt<nSpts; spt++)
      for (int e=0; e<nEles; e++)
        Y(spt,e,0) = U_spts(spt,e,k)/U_spts(spt,e,0);

    boundPreservingLimiter(Y, 0, wts, params->YMin, 1.);

    for (int spt=0; spt<nSpts; spt++)
      for (int e=0; e<nEles; e++)
        U_spts(spt,e,k) = U_spts(spt,e,0)*Y(spt,e,0);
  }
}

void solver::applyFilter(void)
{
  Array<double,3> UFilt(nSpts,nEles,nFields);

  opers[order].applyFilter(U_spts.getData(), UFilt.getData(), nEles*nFields);

  U_spts = UFilt;
}

bool solver::checkHealth(void)
{
  const equationOfState &eos = *gas.eos;

  int unhealthy = 0;
  stringstream reason;

  if (checkNaNInf(U_spts.getData(), U_spts.getSize())) {
    unhealthy = 1;
    reason << "NaN or Inf in the solution";
  }
  else {
    for (int e=0; e<nEles && !unhealthy; e++) {
      for (int spt=0; spt<nSpts; spt++) {
        const double* U = &U_spts(spt,e,0);
        if (U[0] <= 0) {
          unhealthy = 1;
          reason << "non-positive density " << U[0] << " in element " << e;
          break;
        }

        double T = eos.temperature(U, T_spts(spt,e));
        double P = eos.pressure(U, T);
        if (!(P > 0) || P < params->healthPresMin || P > params->healthPresMax) {
          unhealthy = 1;
          reason << "pressure " << P << " out of range in element " << e;
          break;
        }
        if (!(T > 0) || T < params->healthTempMin || T > params->healthTempMax) {
          unhealthy = 1;
          reason << "temperature " << T << " out of range in element " << e;
          break;
        }
      }
    }
  }

  if (unhealthy)
    cout << "WARNING: Rank " << params->rank << ": Health check failed: " << reason.str() << endl;

#ifndef _NO_MPI
  int localFlag = unhealthy;
  MPI_Allreduce(&localFlag, &unhealthy, 1, MPI_INT, MPI_MAX, params->myComm);
#endif

  return (unhealthy == 0);
}
