/*!
 * \file operators.hpp
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
#pragma once

#include <map>
#include <vector>

#include "global.hpp"

#include "matrix.hpp"
#include "points.hpp"

/*!
 * \brief Operators on the reference hexahedron/quadrilateral [-1,1]^nDims
 *
 * Solution points (spts) are the Gauss-Lobatto-Legendre points of the given
 * order.  Volume quadrature points (qpts) are the spts themselves unless
 * quadOrder > order, in which case Gauss-Legendre points of quadOrder are used.
 * Face flux points (fpts) use the same 1D point set as the qpts.
 *
 * Face f = 2*d + side lies at xi_d = -1 (side 0) or xi_d = +1 (side 1).  The
 * points on each face form a tensor grid over the remaining dimensions, in
 * increasing dimension order, so both elements sharing a face see the same
 * point ordering.
 *
 * All operators act on arrays laid out as [nPts][nEles*nFields] (row-major),
 * with the matrix product performed by blocked_dgemm.
 */
class oper
{
public:
  //! Overall setup function for the given dimension & polynomial order
  void setupOperators(int nDims, int order, int quadOrder);

  /* --- Operator application: out = alpha * Op * in + beta * out --- */

  //! Extrapolate solution-point values to the face flux points
  void applySptsFpts(const double* in, double* out, int nCols) const;

  //! Interpolate solution-point values to the volume quadrature points
  void applySptsQpts(const double* in, double* out, int nCols) const;

  //! Apply the weak-form volume divergence operator for reference direction dim
  void applyWeakDiv(int dim, const double* in, double* out, int nCols, double alpha, double beta) const;

  //! Lift flux-point values [already multiplied by face area] back to the solution points
  void applyLift(const double* in, double* out, int nCols, double alpha, double beta) const;

  //! Modal coefficients of a solution-point field in the orthonormal Legendre basis
  void applyInvVandermonde(const double* in, double* out, int nCols) const;

  /*!
   * \brief Build the exponential modal filter
   *
   * Modes of order m > cutoff are scaled by
   * exp(-alpha * ((m - cutoff) / (order - cutoff))^(2*filterOrder)),
   * lower modes are kept; the nodal operator is V * diag(sigma) * V^-1.
   */
  void setupFilter(int cutoff, int filterOrder, double alpha);

  //! Apply the modal filter to solution-point values
  void applyFilter(const double* in, double* out, int nCols) const;

  //! Response of each orthonormal mode to the modal filter
  const vector<double>& getFilterCoeffs(void) const { return filterCoeffs; }

  /* --- Index helpers --- */

  //! Face index of a flux point
  int fptFace(int fpt) const { return fpt / nFptsPerFace; }

  //! Reference direction normal to the face containing the flux point
  int fptDim(int fpt) const { return fptFace(fpt) / 2; }

  //! Outward reference normal direction (-1 or +1) of the face containing the flux point
  double fptSign(int fpt) const { return (fptFace(fpt) % 2 == 0) ? -1. : 1.; }

  //! Stride between neighboring solution points along reference direction dim
  int sptStride(int dim) const;

  //! 1D index of solution point spt along reference direction dim
  int sptIndex1D(int spt, int dim) const { return (spt / sptStride(dim)) % nSpts1D; }

  //! Cell-average weight of each solution point (sums to one)
  const vector<double>& getAvgWeights(void) const { return wts_avg; }

  //! Whether the orthonormal mode is one of the highest-order modes (any index == order)
  bool isHighMode(int mode) const { return highModes[mode]; }

  //! Polynomial order of a tensor-product mode: its largest 1D index
  int modeOrder(int mode) const;

  int nDims, order, quadOrder;
  int nSpts1D, nQ1D;
  int nSpts, nQpts, nFpts, nFaces, nFptsPerFace;
  bool overInt;   //! Volume quadrature differs from the solution points

  vector<double> loc_spts1D, loc_qpts1D;
  vector<double> wts_spts1D, wts_qpts1D;
  vector<point> loc_spts, loc_qpts, loc_fpts;
  vector<double> wts_spts, wts_qpts;
  vector<double> wts_fpts;  //! Tensor quadrature weight of each point on its face

  //! 1D differentiation matrix on the spts: D(i,j) = dl_j/dxi(xi_i)
  matrix<double> opp_D1D;

private:
  matrix<double> opp_spts_to_fpts;
  matrix<double> opp_spts_to_qpts;
  vector<matrix<double>> opp_weak_div;
  matrix<double> opp_lift;
  matrix<double> vandermonde;
  matrix<double> inv_vandermonde;
  matrix<double> opp_filter;
  vector<double> wts_avg;
  vector<double> filterCoeffs;
  vector<bool> highModes;

  void setupPoints(void);
  void setupExtrapolateSptsFpts(void);
  void setupInterpolateSptsQpts(void);
  void setupWeakDiv(void);
  void setupLift(void);
  void setupVandermonde(void);

  //! Value of the tensor-product Lagrange basis function spt at the given reference location
  double basis(int spt, const point &loc) const;

  //! Derivative along dim of the tensor-product Lagrange basis function spt at the given location
  double dBasis(int spt, const point &loc, int dim) const;
};
