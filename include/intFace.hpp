/*!
 * \file intFace.hpp
 * \brief Face between two elements on the same rank
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

class intFace : public face
{
public:
  //! Match the right element's flux points to the left ones
  void setupRightState(void);

  //! Get the state from the right element
  void getRightState(void);

  //! Get the gradients from the right element
  void getRightGradient(void);

protected:
  //! Put the negated flux into the right element's memory
  void addRightFlux(const matrix<double> &Fn);

  void setRightGradFlux(const Array<double,3> &cvFlux, const matrix<double> &TFlux);

private:
  int eR;
  vector<int> fptR;   //! Right element's flux points, matched to fptL
};
