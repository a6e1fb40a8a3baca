/*!
 * \file polynomials.cpp
 * \brief Polynomial definitions for the tensor-product DG operators
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
#include "../include/polynomials.hpp"

#include <cmath>

double Lagrange(const vector<double> &x_lag, double y, uint mode)
{
  double lag = 1.0;

  for (uint i=0; i<x_lag.size(); i++) {
    if (i!=mode) {
      lag = lag*((y-x_lag[i])/(x_lag[mode]-x_lag[i]));
    }
  }

  return lag;
}

double dLagrange(const vector<double> &x_lag, double y, uint mode)
{
  uint i, j;
  double dLag, dLag_num, dLag_den;

  dLag = 0.0;

  for (i=0; i<x_lag.size(); i++) {
    if (i!=mode) {
      dLag_num = 1.0;
      dLag_den = 1.0;

      for (j=0; j<x_lag.size(); j++) {
        if (j!=mode && j!=i) {
          dLag_num = dLag_num*(y-x_lag[j]);
        }

        if (j!=mode) {
          dLag_den = dLag_den*(x_lag[mode]-x_lag[j]);
        }
      }

      dLag = dLag+(dLag_num/dLag_den);
    }
  }

  return dLag;
}

double Legendre(double in_r, int in_mode)
{
  // Three-term recurrence
  double p0 = 1.;
  if (in_mode == 0) return p0;

  double p1 = in_r;
  for (int n=2; n<=in_mode; n++) {
    double p2 = ((2*n-1)*in_r*p1 - (n-1)*p0) / n;
    p0 = p1;
    p1 = p2;
  }

  return p1;
}

double dLegendre(double in_r, int in_mode)
{
  double dLeg = 0.;

  if (in_mode == 0) {
    dLeg = 0;
  } else {
    if (in_r > -1.0 && in_r < 1.0) {
      dLeg = in_mode*((in_r*Legendre(in_r,in_mode)) - Legendre(in_r,in_mode-1)) / (in_r*in_r-1.0);
    } else if (in_r <= -1.0) {
      dLeg = pow(-1.0,in_mode-1.0)*0.5*in_mode*(in_mode+1.0);
    } else {
      dLeg = 0.5*in_mode*(in_mode + 1.0);
    }
  }

  return dLeg;
}

double orthLegendre(double in_r, int in_mode)
{
  return sqrt((2.*in_mode+1.)/2.) * Legendre(in_r,in_mode);
}

double orthLegendreND(const point &loc, const int *ind, int nDims)
{
  double val = 1.;
  for (int d=0; d<nDims; d++)
    val *= orthLegendre(loc[d],ind[d]);

  return val;
}

double exponentialModeResponse(int in_mode, int cutoff, int nFilt, int filterOrder, double alpha)
{
  if (in_mode <= cutoff)
    return 1.;

  double eta = (double)(in_mode - cutoff) / nFilt;
  return exp(-alpha*pow(eta, 2*filterOrder));
}
