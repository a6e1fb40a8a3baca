/*!
 * \file mpiFace.hpp
 * \brief Face shared with an element on another rank
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

#ifndef _NO_MPI
#include "mpi.h"
#endif

#include "matrix.hpp"
#include "face.hpp"

/*!
 * \brief Face whose right element lives on rank procR
 *
 * Each rank computes the common flux for its own element only; both sides
 * see the same face points in the same order and the numerical fluxes are
 * antisymmetric, so the two halves stay conservative.  Messages for a face
 * are tagged tagBase + {0: CV, 1: [T seed, smoothness], 2: grad(Q)}.
 */
class mpiFace : public face
{
public:
  //! Allocate the message buffers
  void setupRightState(void);

  //! Post the nonblocking exchange of the left state
  void sendState(void);

  //! Post the nonblocking exchange of the left gradients
  void sendGradient(void);

  //! Wait for the right state & build it
  void getRightState(void);

  //! Wait for the right gradients
  void getRightGradient(void);

  int procR;   //! Rank owning the right element

protected:
  //! Do nothing [handled on the opposite rank]
  void addRightFlux(const matrix<double>&) {}

  //! Do nothing [handled on the opposite rank]
  void setRightGradFlux(const Array<double,3>&, const matrix<double>&) {}

private:
  matrix<double> bufUL, bufUR;    //! Outgoing / incoming CV [nFpts, nFields]
  matrix<double> bufTL, bufTR;    //! Outgoing / incoming [T seed, smoothness] [nFpts, 2]
  Array<double,3> bufGradL, bufGradR;  //! Outgoing / incoming grad(Q) [nFpts, nDims, nFields+1]

#ifndef _NO_MPI
  MPI_Comm myComm;

  MPI_Request UL_out, UR_in;
  MPI_Request TL_out, TR_in;
  MPI_Request gradL_out, gradR_in;
#endif
};
