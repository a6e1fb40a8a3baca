/*!
 * \file boundaryConditions.hpp
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
#pragma once

#include <map>
#include <string>
#include <vector>

#include "global.hpp"

#include "boundary.hpp"
#include "input.hpp"

/* --- Configuration checks: return an error message, empty when valid --- */

string checkMovingWallParams(const bcParams &bc, int nDims);

string checkFarfieldParams(const bcParams &bc, int nDims, int nSpecies);

string checkInflowParams(const bcParams &bc, int nDims, int nSpecies);

/* --- Boundary factories --- */

//! Copies the interior solution
fluidBoundary dummyBoundary(void);

//! Inviscid reflecting wall: normal momentum flipped, tangential kept
fluidBoundary adiabaticSlipBoundary(void);

//! No-slip wall moving with velocity vWall; adiabatic
fluidBoundary adiabaticNoslipMovingBoundary(const vector<double> &vWall, int nDims);

//! No-slip wall held at TWall, imposed weakly through T+ = 2*TWall - T-
fluidBoundary isothermalNoslipBoundary(double TWall);

//! Free-stream state from (P, T, V, Y)
fluidBoundary farfieldBoundary(double PInf, double TInf, const vector<double> &VInf,
                               const vector<double> &YInf);

//! Subsonic pressure outflow; supersonic points copy the interior energy
fluidBoundary outflowBoundary(double PBound);

//! Free-stream state at a single point from the velocity and two of (rho, P, T)
fluidState inflowFreeStreamState(const bcParams &bc, const gasModel &gas, int nDims, int nSpecies);

//! Riemann-invariant inflow towards the given free-stream state
fluidBoundary inflowBoundary(const fluidState &freeStream);

//! Viscous no-slip wall at TWall with separate advective & diffusive exterior states
fluidBoundary isothermalWallBoundary(double TWall);

//! Viscous adiabatic no-slip wall
fluidBoundary adiabaticNoslipWallBoundary(void);

//! Viscous symmetry plane
fluidBoundary symmetryBoundary(void);

//! Validate the parameters & build the boundary named in bc.bcType
fluidBoundary createBoundary(const bcParams &bc, const gasModel &gas, int nDims, int nSpecies);

/*! Build the boundary for every mesh tag; a tag without a boundary condition is fatal */
map<string,fluidBoundary> setupBoundaries(const input *params, const gasModel &gas,
                                          const vector<string> &meshTags);
