/*!
 * \file face.hpp
 * \brief Base class for the faces between elements & on the box boundary
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

#include <memory>
#include <string>
#include <vector>

#ifndef _NO_MPI
#include "mpi.h"
#endif

#include "global.hpp"

#include "boundary.hpp"
#include "fluid.hpp"
#include "matrix.hpp"

//! Struct to pass into each face; values assigned as needed based on face type
struct faceInfo {
  int type = INTERNAL;  //! FACE_TYPE of the face
  int eL = -1;          //! Local ID of the element on this rank
  int fL = -1;          //! Element-local face ID in the left element
  int eR = -1;          //! intFace: local ID of the right element
  int fR = -1;          //! Element-local face ID in the right element
  int procR = -1;       //! mpiFace: rank owning the right element
  int gID = -1;         //! Global face ID: (global ID of the min-side element)*nDims + dim
  int tagBase = 0;      //! mpiFace: first of the MPI message tags used by the face
  string bndTag;        //! boundFace: mesh boundary tag
};

/*!
 * \brief A face seen from its left element
 *
 * Faces gather the element traces from the solver's flux-point arrays, form
 * the common fluxes, and write the normal fluxes (times the face-area
 * Jacobian) back into the flux-point arrays of the elements on either side.
 * The left element receives +Fn and the right element -Fn, so interface
 * contributions cancel exactly.
 */
class face
{
public:
  virtual ~face() {}

  /*! Assign basic parameters & allocate the face storage */
  void initialize(solver *Solver, const faceInfo &info);

  /*! Setup access to the data on the right of the face */
  virtual void setupRightState(void) = 0;

  /*! Build the fluid state of the left element at the face */
  void getLeftState(void);

  /*! Get the gradients of the left element at the face */
  void getLeftGradient(void);

  /*! Build the fluid state on the right of the face */
  virtual void getRightState(void) = 0;

  /*! Get the gradients on the right of the face */
  virtual void getRightGradient(void) = 0;

  /*! Common values Q* n dA for the gradient of Q = [CV, T] */
  virtual void calcGradFlux(void);

  /*! Common inviscid flux F*.n dA */
  virtual void calcInviscidFlux(void);

  /*! Common viscous & artificial-viscosity flux (-Fv* + r*).n dA */
  virtual void calcViscousFlux(void);

  int ID;    //! Index of the face in the solver's face list
  faceInfo myInfo;

  int nDims, nFields, nSpecies, nFpts;
  int eL;
  int dim;   //! Direction normal to the face

protected:
  solver *Solver;

  vector<int> fptL;      //! Left element's flux points on the face
  double dA;             //! Face-area Jacobian
  matrix<double> normL;  //! Outward unit normal of the left element [nFpts, nDims]

  fluidState stateL, stateR;
  Array<double,3> gradCvL, gradCvR;  //! Gradient of CV [nFpts, nDims, nFields]
  matrix<double> gradTL, gradTR;     //! Gradient of T [nFpts, nDims]

  //! Build a state from flux-point conserved variables, seed temperatures & smoothness
  fluidState buildState(const conservedVars &cv, const vector<double> &tSeed, double smooth) const;

  //! Artificial-viscosity diffusion r = -alpha * s * grad(CV) [nFpts, nDims, nFields]
  Array<double,3> avDiffusion(const Array<double,3> &gradCv, double smooth) const;

  //! Add Fn*dA to the left element's flux points
  void addLeftFlux(const matrix<double> &Fn);

  //! Add -Fn*dA to the right element's flux points (if it lives on this rank)
  virtual void addRightFlux(const matrix<double> &Fn) = 0;

  //! Set the gradient fluxes of the left element from the common CV & T fluxes
  void setLeftGradFlux(const Array<double,3> &cvFlux, const matrix<double> &TFlux);

  //! Set the gradient fluxes of the right element (if it lives on this rank)
  virtual void setRightGradFlux(const Array<double,3> &cvFlux, const matrix<double> &TFlux) = 0;

  double smoothL, smoothR;
};
