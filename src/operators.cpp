/*!
 * \file operators.cpp
 * \brief Reference-element operators for the tensor-product DG discretization
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
#include "../include/operators.hpp"

#include <cmath>

#include "../include/polynomials.hpp"

void oper::setupOperators(int nDims, int order, int quadOrder)
{
  if (nDims != 2 && nDims != 3)
    FatalError("Only quads and hexes implemented.");

  if (order < 1)
    FatalError("Solution order must be at least 1.");

  this->nDims = nDims;
  this->order = order;
  this->quadOrder = std::max(order,quadOrder);

  overInt = (this->quadOrder > order);

  setupPoints();

  // Set up each operator
  setupExtrapolateSptsFpts();

  setupInterpolateSptsQpts();

  setupWeakDiv();

  setupLift();

  setupVandermonde();
}

void oper::setupPoints(void)
{
  nSpts1D = order+1;
  loc_spts1D = getPts1D("Lobatto",order);
  wts_spts1D = getQptWeights1D("Lobatto",order);

  if (overInt) {
    nQ1D = quadOrder+1;
    loc_qpts1D = getPts1D("Legendre",quadOrder);
    wts_qpts1D = getQptWeights1D("Legendre",quadOrder);
  } else {
    nQ1D = nSpts1D;
    loc_qpts1D = loc_spts1D;
    wts_qpts1D = wts_spts1D;
  }

  loc_spts = getLocPts(loc_spts1D,nDims);
  loc_qpts = getLocPts(loc_qpts1D,nDims);
  nSpts = loc_spts.size();
  nQpts = loc_qpts.size();

  wts_spts.resize(nSpts);
  for (int spt=0; spt<nSpts; spt++) {
    wts_spts[spt] = 1;
    for (int d=0; d<nDims; d++)
      wts_spts[spt] *= wts_spts1D[sptIndex1D(spt,d)];
  }

  wts_qpts.resize(nQpts);
  for (int qpt=0; qpt<nQpts; qpt++) {
    wts_qpts[qpt] = 1;
    int ind = qpt;
    for (int d=0; d<nDims; d++) {
      wts_qpts[qpt] *= wts_qpts1D[ind % nQ1D];
      ind /= nQ1D;
    }
  }

  double volume = pow(2.,nDims);
  wts_avg.resize(nSpts);
  for (int spt=0; spt<nSpts; spt++)
    wts_avg[spt] = wts_spts[spt] / volume;

  /* --- Flux points: tensor grid of the qpts 1D set on each face --- */

  nFaces = 2*nDims;
  nFptsPerFace = (nDims == 2) ? nQ1D : nQ1D*nQ1D;
  nFpts = nFaces*nFptsPerFace;

  loc_fpts.resize(nFpts);
  wts_fpts.resize(nFpts);
  for (int f=0; f<nFaces; f++) {
    int dim = f/2;
    double xi = (f%2 == 0) ? -1. : 1.;
    for (int a=0; a<nFptsPerFace; a++) {
      int fpt = f*nFptsPerFace + a;
      point &pt = loc_fpts[fpt];
      pt[dim] = xi;
      wts_fpts[fpt] = 1;

      int ind = a;
      for (int d=0; d<nDims; d++) {
        if (d == dim) continue;
        pt[d] = loc_qpts1D[ind % nQ1D];
        wts_fpts[fpt] *= wts_qpts1D[ind % nQ1D];
        ind /= nQ1D;
      }
    }
  }

  /* --- 1D differentiation matrix --- */

  opp_D1D.setup(nSpts1D,nSpts1D);
  for (int i=0; i<nSpts1D; i++)
    for (int j=0; j<nSpts1D; j++)
      opp_D1D(i,j) = dLagrange(loc_spts1D,loc_spts1D[i],j);
}

int oper::sptStride(int dim) const
{
  int stride = 1;
  for (int d=0; d<dim; d++)
    stride *= nSpts1D;

  return stride;
}

double oper::basis(int spt, const point &loc) const
{
  double val = 1.;
  for (int d=0; d<nDims; d++)
    val *= Lagrange(loc_spts1D,loc[d],sptIndex1D(spt,d));

  return val;
}

double oper::dBasis(int spt, const point &loc, int dim) const
{
  double val = 1.;
  for (int d=0; d<nDims; d++) {
    if (d == dim)
      val *= dLagrange(loc_spts1D,loc[d],sptIndex1D(spt,d));
    else
      val *= Lagrange(loc_spts1D,loc[d],sptIndex1D(spt,d));
  }

  return val;
}

void oper::setupExtrapolateSptsFpts(void)
{
  opp_spts_to_fpts.setup(nFpts,nSpts);

  for (int fpt=0; fpt<nFpts; fpt++)
    for (int spt=0; spt<nSpts; spt++)
      opp_spts_to_fpts(fpt,spt) = basis(spt,loc_fpts[fpt]);
}

void oper::setupInterpolateSptsQpts(void)
{
  opp_spts_to_qpts.setup(nQpts,nSpts);

  for (int qpt=0; qpt<nQpts; qpt++)
    for (int spt=0; spt<nSpts; spt++)
      opp_spts_to_qpts(qpt,spt) = basis(spt,loc_qpts[qpt]);
}

void oper::setupWeakDiv(void)
{
  opp_weak_div.resize(nDims);

  // A_d(spt,qpt) = (W_qpt / W_spt) * d(phi_spt)/d(xi_d) at qpt
  for (int dim=0; dim<nDims; dim++) {
    opp_weak_div[dim].setup(nSpts,nQpts);
    for (int spt=0; spt<nSpts; spt++)
      for (int qpt=0; qpt<nQpts; qpt++)
        opp_weak_div[dim](spt,qpt) = wts_qpts[qpt] / wts_spts[spt] * dBasis(spt,loc_qpts[qpt],dim);
  }
}

void oper::setupLift(void)
{
  opp_lift.setup(nSpts,nFpts);

  for (int spt=0; spt<nSpts; spt++)
    for (int fpt=0; fpt<nFpts; fpt++)
      opp_lift(spt,fpt) = wts_fpts[fpt] / wts_spts[spt] * basis(spt,loc_fpts[fpt]);
}

void oper::setupVandermonde(void)
{
  vandermonde.setup(nSpts,nSpts);
  highModes.assign(nSpts,false);

  int ind[3];
  for (int mode=0; mode<nSpts; mode++) {
    for (int d=0; d<nDims; d++) {
      ind[d] = sptIndex1D(mode,d);
      if (ind[d] == order)
        highModes[mode] = true;
    }

    for (int spt=0; spt<nSpts; spt++)
      vandermonde(spt,mode) = orthLegendreND(loc_spts[spt],ind,nDims);
  }

  // Store its inverse
  inv_vandermonde = vandermonde.invertMatrix();
}

void oper::applySptsFpts(const double* in, double* out, int nCols) const
{
  const double* A = opp_spts_to_fpts.getData();
  blocked_dgemm(nFpts, nCols, nSpts, 1.0, A, nSpts, in, nCols, 0.0, out, nCols);
}

void oper::applySptsQpts(const double* in, double* out, int nCols) const
{
  const double* A = opp_spts_to_qpts.getData();
  blocked_dgemm(nQpts, nCols, nSpts, 1.0, A, nSpts, in, nCols, 0.0, out, nCols);
}

void oper::applyWeakDiv(int dim, const double* in, double* out, int nCols, double alpha, double beta) const
{
  const double* A = opp_weak_div[dim].getData();
  blocked_dgemm(nSpts, nCols, nQpts, alpha, A, nQpts, in, nCols, beta, out, nCols);
}

void oper::applyLift(const double* in, double* out, int nCols, double alpha, double beta) const
{
  const double* A = opp_lift.getData();
  blocked_dgemm(nSpts, nCols, nFpts, alpha, A, nFpts, in, nCols, beta, out, nCols);
}

void oper::applyInvVandermonde(const double* in, double* out, int nCols) const
{
  const double* A = inv_vandermonde.getData();
  blocked_dgemm(nSpts, nCols, nSpts, 1.0, A, nSpts, in, nCols, 0.0, out, nCols);
}

int oper::modeOrder(int mode) const
{
  int m = 0;
  for (int d=0; d<nDims; d++)
    m = std::max(m, sptIndex1D(mode,d));

  return m;
}

void oper::setupFilter(int cutoff, int filterOrder, double alpha)
{
  if (cutoff < 0 || cutoff >= order)
    FatalError("Filter cutoff must lie in [0, order).");

  if (filterOrder < 1)
    FatalError("Filter order must be at least 1.");

  int nFilt = order - cutoff;

  filterCoeffs.resize(nSpts);
  for (int mode=0; mode<nSpts; mode++)
    filterCoeffs[mode] = exponentialModeResponse(modeOrder(mode), cutoff, nFilt, filterOrder, alpha);

  opp_filter.setup(nSpts,nSpts);
  for (int i=0; i<nSpts; i++)
    for (int j=0; j<nSpts; j++)
      for (int mode=0; mode<nSpts; mode++)
        opp_filter(i,j) += vandermonde(i,mode)*filterCoeffs[mode]*inv_vandermonde(mode,j);
}

void oper::applyFilter(const double* in, double* out, int nCols) const
{
  if (filterCoeffs.empty())
    FatalError("Modal filter has not been set up.");

  const double* A = opp_filter.getData();
  blocked_dgemm(nSpts, nCols, nSpts, 1.0, A, nSpts, in, nCols, 0.0, out, nCols);
}
