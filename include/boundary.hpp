/*!
 * \file boundary.hpp
 * \brief Prescribed-state fluid boundary: strategy record & default resolution
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
#include <map>
#include <memory>
#include <string>

#include "global.hpp"

#include "fluid.hpp"
#include "flux.hpp"
#include "gasModel.hpp"
#include "matrix.hpp"

class input;
struct bcParams;

/*! Everything a boundary strategy may need besides the interior data */
struct bndContext
{
  const gasModel* gas;         //! Gas model shared by the run
  const matrix<double>* norm;  //! Outward unit normals [nPts][nDims]
  double time;                 //! Current (stage) time
};

/* --- Signatures of the boundary sub-strategies --- */

//! Exterior fluid state from the interior state
typedef std::function<fluidState(const fluidState&, const bndContext&)> bndStateFunc;

//! Exterior temperature used by the temperature-gradient operator [nPts]
typedef std::function<vector<double>(const fluidState&, const bndContext&)> bndTempFunc;

//! Exterior grad(CV) [nPts][nDims][nFields] from the interior state & grad(CV)
typedef std::function<Array<double,3>(const fluidState&, const Array<double,3>&, const bndContext&)> bndGradCvFunc;

//! Exterior grad(T) [nPts][nDims] from the interior state & grad(T)
typedef std::function<matrix<double>(const fluidState&, const matrix<double>&, const bndContext&)> bndGradTFunc;

//! Exterior artificial-viscosity diffusion [nPts][nDims][nFields] from the interior one
typedef std::function<Array<double,3>(const Array<double,3>&, const bndContext&)> bndGradAvFunc;

//! Boundary flux for the inviscid divergence [nPts][nFields]
typedef std::function<matrix<double>(const fluidState&, const bndContext&, const inviscidNumFlux&)> bndInviscidFluxFunc;

//! Boundary flux for the viscous divergence [nPts][nFields]
typedef std::function<matrix<double>(const fluidState&, const Array<double,3>&, const matrix<double>&,
                                     const bndContext&, const viscousNumFlux&)> bndViscousFluxFunc;

//! Boundary flux for the grad(CV) operator [nPts][nDims][nFields]
typedef std::function<Array<double,3>(const fluidState&, const bndContext&)> bndCvGradFluxFunc;

//! Boundary flux for the grad(T) operator [nPts][nDims]
typedef std::function<matrix<double>(const fluidState&, const bndContext&)> bndTGradFluxFunc;

/*! Optional sub-strategies describing one kind of boundary; unset members get defaults */
struct boundaryFuncs
{
  bndStateFunc bndState;
  bndTempFunc bndTemperature;
  bndGradCvFunc bndGradCv;
  bndGradTFunc bndGradT;
  bndGradAvFunc bndGradAv;
  bndInviscidFluxFunc inviscidFlux;
  bndViscousFluxFunc viscousFlux;
  bndCvGradFluxFunc cvGradientFlux;
  bndTGradFluxFunc temperatureGradientFlux;
  gradNumFlux gradFlux;
};

/*!
 * \brief A fully-resolved boundary treatment
 *
 * Built from a boundaryFuncs record; every sub-strategy left unset is
 * replaced by its default at construction, and the result never changes.
 *
 * Defaults:
 *  - exterior state: the interior state (a "dummy" boundary, with a warning)
 *  - exterior temperature: temperature of the exterior state
 *  - gradient numerical flux: central average
 *  - exterior grad(CV), grad(T), AV diffusion: the interior values
 *  - inviscid flux: numerical flux on the (interior, exterior) state pair
 *  - viscous flux: numerical flux on the state & gradient pairs
 *  - CV / temperature gradient fluxes: gradient numerical flux on the
 *    (interior, exterior) pair, times the normal
 *
 * If an inviscid-flux override is given without an exterior state, every
 * default which needs the exterior state fails at its first use.
 */
class fluidBoundary
{
public:
  fluidBoundary(void) {}

  fluidBoundary(const boundaryFuncs &funcs, const string &name);

  //! F*.n for the inviscid divergence (not multiplied by the face area)
  matrix<double> inviscidDivergenceFlux(const fluidState &stateM, const bndContext &ctx,
      const inviscidNumFlux &numFlux = rusanovFlux) const;

  //! Fv*.n for the viscous divergence
  matrix<double> viscousDivergenceFlux(const fluidState &stateM, const Array<double,3> &gradCvM,
      const matrix<double> &gradTM, const bndContext &ctx,
      const viscousNumFlux &numFlux = viscousFacialFluxCentral) const;

  //! CV* (x) n for the grad(CV) operator [nPts][nDims][nFields]
  Array<double,3> cvGradientFlux(const fluidState &stateM, const bndContext &ctx) const;

  //! T* n for the grad(T) operator [nPts][nDims]
  matrix<double> temperatureGradientFlux(const fluidState &stateM, const bndContext &ctx) const;

  //! Central flux of the artificial-viscosity diffusion, dotted with n
  matrix<double> avFlux(const Array<double,3> &diffusionM, const bndContext &ctx) const;

  fluidState exteriorState(const fluidState &stateM, const bndContext &ctx) const;

  vector<double> exteriorTemperature(const fluidState &stateM, const bndContext &ctx) const;

  //! Whether an exterior-state strategy was supplied or defaulted
  bool hasExteriorState(void) const { return hasState; }

  //! Whether this boundary just copies the interior solution
  bool isDummy(void) const { return dummy; }

  const string& getName(void) const { return name; }

private:
  boundaryFuncs funcs;
  string name;
  bool hasState = false;
  bool dummy = false;
};

/* --- Helpers shared by the boundary factories --- */

//! Build a fluid state from cv, seeding the temperature & copying the smoothness of ref
fluidState makeStateLike(const conservedVars &cv, const fluidState &ref, const gasModel &gas);

//! F(pt,dim,k) = u(pt,k) * n(pt,dim)
Array<double,3> outerNormal(const matrix<double> &u, const matrix<double> &norm);
