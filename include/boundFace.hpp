/*!
 * \file boundFace.hpp
 * \brief Face on a tagged side of the box
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

#include "face.hpp"

class boundFace : public face
{
public:
  //! Look up the boundary for the face's tag
  void setupRightState(void);

  /*! No right element at a boundary; the boundary supplies the exterior data */
  void getRightState(void) {}

  void getRightGradient(void) {}

  void calcGradFlux(void);

  void calcInviscidFlux(void);

  void calcViscousFlux(void);

protected:
  void addRightFlux(const matrix<double>&) {}

  void setRightGradFlux(const Array<double,3>&, const matrix<double>&) {}

private:
  const fluidBoundary *bnd = NULL;

  bndContext getContext(void) const;
};
