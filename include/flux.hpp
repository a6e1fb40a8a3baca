/*!
 * \file flux.hpp
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
#pragma once

#include <functional>

#include "global.hpp"

#include "fluid.hpp"
#include "gasModel.hpp"
#include "matrix.hpp"

/* ------------------------- Pointwise flux kernels ------------------------ */

/*! Calculate the inviscid flux vector F[nDims][nFields] at a point */
void inviscidFluxPt(const double* U, double P, int nDims, int nFields, double* F);

/*! Calculate the viscous flux vector F[nDims][nFields] at a point
 *
 * \param gradU  Gradient of the conserved variables [nDims][nFields]
 * \param gradT  Gradient of the temperature [nDims]
 * \param D      Species diffusivities [nSpecies]
 * \param h      Species specific enthalpies [nSpecies]
 */
void viscousFluxPt(const double* U, const double* gradU, const double* gradT, double mu,
                   double kappa, const double* D, const double* h, int nDims, int nSpecies,
                   double* Fv);

/*! Chandrashekar's kinetic-energy-preserving, entropy-conserving two-point flux,
 *  dotted with the (not necessarily unit) direction norm */
void chandrashekarFlux(const double* UL, const double* UR, double gamma, int nDims,
                       int nSpecies, const double* norm, double* Fn);

/*! Logarithmic mean (aR - aL)/(ln aR - ln aL), stable as aL -> aR */
double logMean(double aL, double aR);

/*! Entropy variables for a calorically-perfect gas; species slots carry Y */
void consToEntropyVars(const double* U, double gamma, int nDims, int nSpecies, double* V);

/*! Inverse of consToEntropyVars */
void entropyToConsVars(const double* V, double gamma, int nDims, int nSpecies, double* U);

/* ------------------------ Flux over a set of points ---------------------- */

/*! Inviscid flux at every point of the state [nPts][nDims][nFields] */
Array<double,3> inviscidFlux(const fluidState &state);

/*! Viscous flux at every point of the state [nPts][nDims][nFields]
 *
 * \param gradCv  Gradient of the conserved variables [nPts][nDims][nFields]
 * \param gradT   Gradient of the temperature [nPts][nDims]
 */
Array<double,3> viscousFlux(const fluidState &state, const Array<double,3> &gradCv,
                            const matrix<double> &gradT, const gasModel &gas);

/*! Dot a flux [nPts][nDims][nFields] with the unit normals [nPts][nDims] */
matrix<double> normalFlux(const Array<double,3> &F, const matrix<double> &norm);

/* ----------------------------- Numerical fluxes -------------------------- */

//! Common inviscid flux F*.n from the interior (L) & exterior (R) states
typedef std::function<matrix<double>(const fluidState&, const fluidState&, const gasModel&,
                                     const matrix<double>&)> inviscidNumFlux;

//! Common viscous flux Fv*.n from the interior & exterior states & gradients
typedef std::function<matrix<double>(const fluidState&, const fluidState&,
                                     const Array<double,3>&, const Array<double,3>&,
                                     const matrix<double>&, const matrix<double>&,
                                     const gasModel&, const matrix<double>&)> viscousNumFlux;

//! Common value of a scalar from its interior & exterior values
typedef std::function<double(double,double)> gradNumFlux;

/*! Rusanov (local Lax-Friedrichs) flux:
 *  0.5*(FL.n + FR.n) - 0.5*lambda*(UR - UL), lambda = max(|u.n|+c) over both sides */
matrix<double> rusanovFlux(const fluidState &sL, const fluidState &sR, const gasModel &gas,
                           const matrix<double> &norm);

/*! Central flux 0.5*(FL.n + FR.n) */
matrix<double> centralFlux(const fluidState &sL, const fluidState &sR, const gasModel &gas,
                           const matrix<double> &norm);

/*! Chandrashekar flux with Rusanov dissipation */
matrix<double> entropyStableRusanovFlux(const fluidState &sL, const fluidState &sR,
                                        const gasModel &gas, const matrix<double> &norm);

/*! Central viscous flux 0.5*(FvL + FvR).n */
matrix<double> viscousFacialFluxCentral(const fluidState &sL, const fluidState &sR,
                                        const Array<double,3> &gradCvL, const Array<double,3> &gradCvR,
                                        const matrix<double> &gradTL, const matrix<double> &gradTR,
                                        const gasModel &gas, const matrix<double> &norm);

/*! Central average used for the gradient operators */
double gradFluxCentral(double uL, double uR);

//! Select the interior-face inviscid flux
inviscidNumFlux getInviscidNumFlux(int riemannType, int operatorType);
