/*!
 * \file polynomials.hpp
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
#pragma once

#include "global.hpp"

/*! Evaluate the 1D Lagrange polynomial mode based on points x_lag at point y */
double Lagrange(const vector<double> &x_lag, double y, uint mode);

/*! Evaluate the first derivative of the 1D Lagrange polynomial mode based on points x_lag at point y */
double dLagrange(const vector<double> &x_lag, double y, uint mode);

/*! Evaluate the 1D Legendre polynomial mode number in_mode based at point location in_r*/
double Legendre(double in_r, int in_mode);

/*! Evaluate the derivative of the 1D Legendre polynomial mode number in_mode based at point location in_r*/
double dLegendre(double in_r, int in_mode);

/*! Legendre mode normalized to unit L2 norm on [-1,1] */
double orthLegendre(double in_r, int in_mode);

/*! Tensor-product orthonormal Legendre basis; ind = (i,j,k) mode indices */
double orthLegendreND(const point &loc, const int *ind, int nDims);

/*! Exponential filter response of a mode of order in_mode: 1 up to the cutoff,
 *  exp(-alpha) at cutoff+nFilt */
double exponentialModeResponse(int in_mode, int cutoff, int nFilt, int filterOrder, double alpha);
