/*!
 * \file geo.hpp
 * \brief Class for generating, partitioning & connecting the structured box mesh
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

#ifndef _NO_MPI
#include "mpi.h"
#endif

#include "input.hpp"
#include "face.hpp"

/*!
 * \brief Structured Cartesian box mesh of quadrilaterals / hexahedra
 *
 * Element (i,j,k) has global ID i + nx*(j + ny*k) and is the box
 * [xmin+i*dx, xmin+(i+1)*dx] x ...  Its face f = 2*d + side lies on the
 * min (side 0) or max (side 1) end of direction d.  The sides of the box are
 * tagged by create_bcLeft/Right (x), create_bcBottom/Top (y) and
 * create_bcBack/Front (z); a tag of "periodic" connects the two sides.
 *
 * Every face between two elements is owned by the element on its min side:
 * that element is the 'left' element, and the face's outward normal points
 * in +d.
 */
class geo
{
public:
  geo();

  void setup(input* params);

  //! Build the (global) element connectivity of the box
  void createMesh(void);

  //! Use METIS to assign each element to a rank
  void partitionMesh(void);

  //! Classify the faces of the local elements into interior, boundary & MPI faces
  void processConnectivity(void);

  //! Physical position of the reference location loc within local element ele
  point getPosition(int ele, const point &loc) const;

  //! Global element ID of the element at (i,j,k)
  int getGlobalID(int i, int j, int k) const { return i + nx*(j + ny*k); }

  //! Tags of all non-periodic sides of the box, without repeats
  vector<string> getBoundaryTags(void) const;

  int nDims;
  int nEles;       //! Number of elements on this rank
  int nEles_g;     //! Number of elements in the whole mesh
  int nVerts_g;    //! Number of vertices in the whole mesh
  int nx, ny, nz;
  int nIntFaces, nBndFaces, nMpiFaces;

  double h[3];     //! Element size in each direction
  double detJ;     //! Jacobian determinant of the reference-to-physical mapping
  double dA[3];    //! Face-area Jacobian of the faces normal to each direction
  double hMin;     //! Smallest element size

  point minPt;     //! Lower corner of the box

  vector<string> sideTags;   //! Tag of each side of the box, ordered as the element faces
  vector<bool> periodic;     //! Periodicity in each direction

  matrix<int> c2v;           //! Global element-to-vertex connectivity
  vector<int> epart;         //! Rank owning each global element
  vector<int> ic2icg;        //! Global ID of each local element
  vector<int> icg2ic;        //! Local ID of each global element (-1 if off-rank)

  vector<faceInfo> intFaces;  //! Faces between two local elements
  vector<faceInfo> bndFaces;  //! Faces on a tagged side of the box
  vector<faceInfo> mpiFaces;  //! Faces shared with an element on another rank

  int rank;
  int nproc;

#ifndef _NO_MPI
  MPI_Comm myComm;
#endif

private:
  input *params;

  //! Global (i,j,k) indices of a global element
  void getIJK(int icg, int &i, int &j, int &k) const;

  /*! Global element on the other side of face f of element icg
   *  \return -1 if the face lies on a non-periodic side of the box */
  int getNeighbor(int icg, int f) const;
};
