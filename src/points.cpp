/*!
 * \file points.cpp
 * \brief Reference-element point sets & quadrature weights
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
#include "../include/points.hpp"

#include <cmath>

#include "../include/polynomials.hpp"

namespace {

const int maxNewtonIter = 100;
const double newtonTol = 1e-15;

//! Roots of the Legendre polynomial of degree n+1
vector<double> gaussPts(int order)
{
  int nPts = order+1;
  vector<double> pts(nPts);

  for (int i=0; i<nPts; i++) {
    // Chebyshev-Gauss initial guess, ascending
    double x = -cos(pi*(i+.75)/(nPts+.5));
    for (int iter=0; iter<maxNewtonIter; iter++) {
      double dx = Legendre(x,nPts) / dLegendre(x,nPts);
      x -= dx;
      if (fabs(dx) < newtonTol) break;
    }
    pts[i] = x;
  }

  return pts;
}

//! Endpoints plus the roots of the derivative of the Legendre polynomial of degree n
vector<double> lobattoPts(int order)
{
  if (order < 1)
    FatalError("Lobatto points require order >= 1.");

  int nPts = order+1;
  vector<double> pts(nPts);
  pts[0] = -1.;
  pts[nPts-1] = 1.;

  for (int i=1; i<nPts-1; i++) {
    // Chebyshev-Gauss-Lobatto initial guess
    double x = -cos(pi*i/order);
    for (int iter=0; iter<maxNewtonIter; iter++) {
      // Newton on (1-x^2) P'_N(x), using Legendre's ODE for the second derivative
      double dP = dLegendre(x,order);
      double ddP = (2.*x*dP - order*(order+1.)*Legendre(x,order)) / (1.-x*x);
      double dx = dP/ddP;
      x -= dx;
      if (fabs(dx) < newtonTol) break;
    }
    pts[i] = x;
  }

  return pts;
}

}

vector<double> getPts1D(string ptsType, int order)
{
  if (order < 0)
    FatalError("Negative polynomial order requested.");

  if (!ptsType.compare("Legendre")) {
    return gaussPts(order);
  }
  else if (!ptsType.compare("Lobatto")) {
    return lobattoPts(order);
  }
  else {
    string errMsg = "Point type not recognized: " + ptsType;
    FatalError(errMsg.c_str());
  }
}

vector<double> getQptWeights1D(string ptsType, int order)
{
  vector<double> pts = getPts1D(ptsType,order);
  int nPts = order+1;
  vector<double> wts(nPts);

  if (!ptsType.compare("Legendre")) {
    for (int i=0; i<nPts; i++) {
      double dP = dLegendre(pts[i],nPts);
      wts[i] = 2. / ((1.-pts[i]*pts[i])*dP*dP);
    }
  }
  else {
    for (int i=0; i<nPts; i++) {
      double P = Legendre(pts[i],order);
      wts[i] = 2. / (order*(order+1.)*P*P);
    }
  }

  return wts;
}

vector<point> getLocPts(const vector<double> &pts1D, int nDims)
{
  int n = pts1D.size();
  int nPts = (nDims == 2) ? n*n : n*n*n;
  vector<point> pts(nPts);

  int nk = (nDims == 2) ? 1 : n;
  for (int k=0; k<nk; k++) {
    for (int j=0; j<n; j++) {
      for (int i=0; i<n; i++) {
        int ind = i + n*(j + n*k);
        pts[ind].x = pts1D[i];
        pts[ind].y = pts1D[j];
        pts[ind].z = (nDims == 3) ? pts1D[k] : 0;
      }
    }
  }

  return pts;
}
