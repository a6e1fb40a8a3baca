/*!
 * \file geo.cpp
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
#include "../include/geo.hpp"

#include <algorithm>
#include <set>
#include <sstream>

#ifndef _NO_MPI
#include "metis.h"
#endif

geo::geo()
{
  nDims = 2;
  nEles = 0;
  nEles_g = 0;
  rank = 0;
  nproc = 1;
}

void geo::setup(input* params)
{
  this->params = params;

  nDims = params->nDims;
  rank = params->rank;
  nproc = params->nproc;

#ifndef _NO_MPI
  myComm = params->myComm;
#endif

  createMesh();

  partitionMesh();

  processConnectivity();
}

void geo::createMesh(void)
{
  nx = params->nx;
  ny = params->ny;
  nz = params->nz;

  if (nDims == 2)
    nz = 1;

  if (nx < 1 || ny < 1 || nz < 1)
    FatalError("Number of cells in each direction must be positive.");

  if (rank==0)
    cout << "Geo: Creating " << nx << "x" << ny << "x" << nz << " cartesian mesh" << endl;

  minPt = point(params->xmin, params->ymin, params->zmin);

  h[0] = (params->xmax-params->xmin)/nx;
  h[1] = (params->ymax-params->ymin)/ny;
  h[2] = (nDims == 3) ? (params->zmax-params->zmin)/nz : 1.;

  for (int dim=0; dim<nDims; dim++)
    if (h[dim] <= 0)
      FatalError("Mesh extents must satisfy min < max in each direction.");

  // Affine map from [-1,1]^nDims
  detJ = 1;
  hMin = h[0];
  for (int dim=0; dim<nDims; dim++) {
    detJ *= h[dim]/2.;
    hMin = min(hMin,h[dim]);
  }

  for (int dim=0; dim<nDims; dim++) {
    dA[dim] = 1;
    for (int d2=0; d2<nDims; d2++)
      if (d2 != dim) dA[dim] *= h[d2]/2.;
  }

  /* --- Boundary tags of the box sides --- */

  sideTags = {params->create_bcLeft, params->create_bcRight,
              params->create_bcBottom, params->create_bcTop};
  if (nDims == 3) {
    sideTags.push_back(params->create_bcBack);
    sideTags.push_back(params->create_bcFront);
  }

  periodic.assign(nDims,false);
  for (int dim=0; dim<nDims; dim++) {
    bool perMin = (sideTags[2*dim] == "periodic");
    bool perMax = (sideTags[2*dim+1] == "periodic");
    if (perMin != perMax) {
      stringstream ss;
      ss << "Both sides of the box in direction " << dim << " must be periodic if either one is.";
      FatalError(ss.str().c_str());
    }
    periodic[dim] = perMin;
  }

  /* --- Setup Vertices & Elements --- */

  nEles_g = nx*ny*nz;

  int nvx = nx+1;
  int nvy = ny+1;
  if (nDims == 2) {
    nVerts_g = nvx*nvy;
    c2v.setup(nEles_g,4);
  }
  else {
    nVerts_g = nvx*nvy*(nz+1);
    c2v.setup(nEles_g,8);
  }

  for (int k=0; k<nz; k++) {
    for (int j=0; j<ny; j++) {
      for (int i=0; i<nx; i++) {
        int ic = getGlobalID(i,j,k);
        int v0 = i + nvx*(j + nvy*k);
        c2v(ic,0) = v0;
        c2v(ic,1) = v0 + 1;
        c2v(ic,2) = v0 + nvx + 1;
        c2v(ic,3) = v0 + nvx;
        if (nDims == 3) {
          for (int n=0; n<4; n++)
            c2v(ic,n+4) = c2v(ic,n) + nvx*nvy;
        }
      }
    }
  }
}

void geo::partitionMesh(void)
{
  epart.assign(nEles_g,0);

#ifndef _NO_MPI
  if (nproc > 1) {
    if (rank == 0) cout << "Geo: Partitioning mesh across " << nproc << " processes" << endl;
    if (rank == 0) cout << "Geo:   Number of elements globally: " << nEles_g << endl;

    idx_t nElesM = nEles_g;
    idx_t nVertsM = nVerts_g;
    idx_t nParts = nproc;
    int nNodesPerCell = c2v.getDim1();

    vector<idx_t> eptr(nEles_g+1);
    vector<idx_t> eind(nEles_g*nNodesPerCell);
    for (int ic=0; ic<nEles_g; ic++) {
      eptr[ic] = ic*nNodesPerCell;
      for (int n=0; n<nNodesPerCell; n++)
        eind[ic*nNodesPerCell+n] = c2v(ic,n);
    }
    eptr[nEles_g] = nEles_g*nNodesPerCell;

    idx_t objval;
    vector<idx_t> epartM(nEles_g);
    vector<idx_t> npart(nVerts_g);

    // Number of shared nodes defining a face: 2 for quads, 4 for hexes
    idx_t ncommon = (nDims == 2) ? 2 : 4;

    idx_t options[METIS_NOPTIONS];
    METIS_SetDefaultOptions(options);
    options[METIS_OPTION_NUMBERING] = 0;
    options[METIS_OPTION_IPTYPE] = METIS_IPTYPE_NODE;
    options[METIS_OPTION_OBJTYPE] = METIS_OBJTYPE_CUT;
    options[METIS_OPTION_PTYPE] = METIS_PTYPE_KWAY;
    options[METIS_OPTION_NCUTS] = 5;

    int err = METIS_PartMeshDual(&nElesM,&nVertsM,eptr.data(),eind.data(),NULL,NULL,
                                 &ncommon,&nParts,NULL,options,&objval,epartM.data(),npart.data());

    if (err != METIS_OK)
      FatalError("METIS failed to partition the mesh.");

    for (int ic=0; ic<nEles_g; ic++)
      epart[ic] = epartM[ic];
  }
#endif

  ic2icg.resize(0);
  icg2ic.assign(nEles_g,-1);
  for (int icg=0; icg<nEles_g; icg++) {
    if (epart[icg] == rank) {
      icg2ic[icg] = ic2icg.size();
      ic2icg.push_back(icg);
    }
  }

  nEles = ic2icg.size();

  if (nEles == 0)
    FatalError("Partition on this rank is empty; use fewer ranks or a finer mesh.");

#ifndef _NO_MPI
  if (nproc > 1) {
    cout << "Geo:   On rank " << rank << ": nEles = " << nEles << endl;

    MPI_Barrier(myComm);

    if (rank == 0) cout << "Geo: Done partitioning mesh" << endl;
  }
#endif
}

void geo::getIJK(int icg, int &i, int &j, int &k) const
{
  i = icg % nx;
  j = (icg / nx) % ny;
  k = icg / (nx*ny);
}

int geo::getNeighbor(int icg, int f) const
{
  int ijk[3];
  getIJK(icg,ijk[0],ijk[1],ijk[2]);

  int dim = f / 2;
  int n[3] = {nx,ny,nz};

  ijk[dim] += (f % 2 == 0) ? -1 : 1;

  if (ijk[dim] < 0 || ijk[dim] >= n[dim]) {
    if (!periodic[dim]) return -1;
    ijk[dim] = (ijk[dim] + n[dim]) % n[dim];
  }

  return getGlobalID(ijk[0],ijk[1],ijk[2]);
}

void geo::processConnectivity(void)
{
  if (rank==0) cout << "Geo: Processing element connectivity" << endl;

  intFaces.resize(0);
  bndFaces.resize(0);
  mpiFaces.resize(0);

  int nFaces = 2*nDims;

  for (int ic=0; ic<nEles; ic++) {
    int icg = ic2icg[ic];
    for (int f=0; f<nFaces; f++) {
      int dim = f / 2;
      int side = f % 2;
      int nb = getNeighbor(icg,f);

      faceInfo info;
      info.eL = ic;
      info.fL = f;

      if (nb < 0) {
        info.type = BOUNDARY;
        info.bndTag = sideTags[f];
        info.gID = icg*nDims + dim;
        bndFaces.push_back(info);
      }
      else if (epart[nb] == rank) {
        // Owned by the element on the min side of the face
        if (side == 0) continue;
        info.type = INTERNAL;
        info.eR = icg2ic[nb];
        info.fR = 2*dim;
        info.gID = icg*nDims + dim;
        intFaces.push_back(info);
      }
      else {
        info.type = MPI_FACE;
        info.fR = 2*dim + 1 - side;
        info.procR = epart[nb];
        info.gID = ((side == 1) ? icg : nb)*nDims + dim;
        mpiFaces.push_back(info);
      }
    }
  }

  /* --- Match MPI faces: both ranks order their shared faces by global ID --- */

  std::sort(mpiFaces.begin(), mpiFaces.end(), [](const faceInfo &a, const faceInfo &b) {
    if (a.procR != b.procR) return a.procR < b.procR;
    return a.gID < b.gID;
  });

  int nOnProc = 0;
  for (uint i=0; i<mpiFaces.size(); i++) {
    if (i > 0 && mpiFaces[i].procR != mpiFaces[i-1].procR)
      nOnProc = 0;
    mpiFaces[i].tagBase = 3*nOnProc;
    nOnProc++;
  }

  nIntFaces = intFaces.size();
  nBndFaces = bndFaces.size();
  nMpiFaces = mpiFaces.size();
}

point geo::getPosition(int ele, const point &loc) const
{
  int ijk[3];
  getIJK(ic2icg[ele],ijk[0],ijk[1],ijk[2]);

  point pos;
  for (int dim=0; dim<nDims; dim++)
    pos[dim] = minPt[dim] + (ijk[dim] + 0.5*(loc[dim]+1.))*h[dim];

  return pos;
}

vector<string> geo::getBoundaryTags(void) const
{
  vector<string> tags;
  for (auto &tag:sideTags) {
    if (tag == "periodic") continue;
    if (findFirst(tags,tag) == -1)
      tags.push_back(tag);
  }

  return tags;
}
