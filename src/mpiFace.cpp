/*!
 * \file mpiFace.cpp
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
#include "../include/mpiFace.hpp"

#ifndef _NO_MPI
#include "mpi.h"
#endif

#include "../include/solver.hpp"

void mpiFace::setupRightState(void)
{
#ifdef _NO_MPI
  FatalError("Trying to setup an MPI face but code is not compiled for MPI.");
#else
  procR = myInfo.procR;
  myComm = Solver->params->myComm;

  bufUL.setup(nFpts,nFields);
  bufUR.setup(nFpts,nFields);
  bufTL.setup(nFpts,2);
  bufTR.setup(nFpts,2);
  bufGradL.setup(nFpts,nDims,nFields+1);
  bufGradR.setup(nFpts,nDims,nFields+1);
#endif
}

void mpiFace::sendState(void)
{
  for (int fpt=0; fpt<nFpts; fpt++) {
    for (int k=0; k<nFields; k++)
      bufUL(fpt,k) = Solver->U_fpts(fptL[fpt],eL,k);
    bufTL(fpt,0) = Solver->T_fpts(fptL[fpt],eL);
    bufTL(fpt,1) = Solver->smoothness[eL];
  }

#ifndef _NO_MPI
  int tag = myInfo.tagBase;
  MPI_Irecv(bufUR.getData(),bufUR.getSize(),MPI_DOUBLE,procR,tag,myComm,&UR_in);
  MPI_Irecv(bufTR.getData(),bufTR.getSize(),MPI_DOUBLE,procR,tag+1,myComm,&TR_in);
  MPI_Isend(bufUL.getData(),bufUL.getSize(),MPI_DOUBLE,procR,tag,myComm,&UL_out);
  MPI_Isend(bufTL.getData(),bufTL.getSize(),MPI_DOUBLE,procR,tag+1,myComm,&TL_out);
#endif
}

void mpiFace::sendGradient(void)
{
  for (int fpt=0; fpt<nFpts; fpt++)
    for (int d=0; d<nDims; d++)
      for (int k=0; k<nFields+1; k++)
        bufGradL(fpt,d,k) = Solver->dQ_fpts(d,fptL[fpt],eL,k);

#ifndef _NO_MPI
  int tag = myInfo.tagBase + 2;
  MPI_Irecv(bufGradR.getData(),bufGradR.getSize(),MPI_DOUBLE,procR,tag,myComm,&gradR_in);
  MPI_Isend(bufGradL.getData(),bufGradL.getSize(),MPI_DOUBLE,procR,tag,myComm,&gradL_out);
#endif
}

void mpiFace::getRightState(void)
{
#ifndef _NO_MPI
  MPI_Wait(&UR_in,MPI_STATUS_IGNORE);
  MPI_Wait(&TR_in,MPI_STATUS_IGNORE);
  MPI_Wait(&UL_out,MPI_STATUS_IGNORE);
  MPI_Wait(&TL_out,MPI_STATUS_IGNORE);
#endif

  conservedVars cv(nFpts,nDims,nSpecies);
  vector<double> tSeed(nFpts);
  for (int fpt=0; fpt<nFpts; fpt++) {
    for (int k=0; k<nFields; k++)
      cv.U(fpt,k) = bufUR(fpt,k);
    tSeed[fpt] = bufTR(fpt,0);
  }

  smoothR = bufTR(0,1);

  stateR = buildState(cv, tSeed, smoothR);
}

void mpiFace::getRightGradient(void)
{
#ifndef _NO_MPI
  MPI_Wait(&gradR_in,MPI_STATUS_IGNORE);
  MPI_Wait(&gradL_out,MPI_STATUS_IGNORE);
#endif

  for (int fpt=0; fpt<nFpts; fpt++) {
    for (int d=0; d<nDims; d++) {
      for (int k=0; k<nFields; k++)
        gradCvR(fpt,d,k) = bufGradR(fpt,d,k);
      gradTR(fpt,d) = bufGradR(fpt,d,nFields);
    }
  }
}
