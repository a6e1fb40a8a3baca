/*!
 * \file points.hpp
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
#pragma once

#include <vector>

#include "global.hpp"

//! Get the point locations of the requested type (i.e. Legendre [Gauss], Lobatto) for the given order
vector<double> getPts1D(string ptsType, int order);

//! Get the quadrature weights for the points of the requested type for the given order [1D]
vector<double> getQptWeights1D(string ptsType, int order);

//! Get the tensor-product locations of a 1D point set in the reference element [-1,1]^nDims
vector<point> getLocPts(const vector<double> &pts1D, int nDims);
