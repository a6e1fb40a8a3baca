/*!
 * \file output.cpp
 * \brief Functions for writing data to file & the terminal
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
#include "../include/output.hpp"

#include <cstdio>

void writeCSV(solver *Solver, input *params)
{
  ofstream dataFile;
  int iter = params->iter;
  int nDims = params->nDims;
  int nSpecies = params->nSpecies;

  char fileNameC[256];
  string fileName = params->dataFileName;
  snprintf(fileNameC,256,"%s.csv.%d.%.09d",&fileName[0],params->rank,iter);

  dataFile.precision(15);
  dataFile.setf(ios_base::fixed);

  dataFile.open(fileNameC);

  // Write header:
  // x  y  z(=0)  rho  u  v  [w]  p  T  [Y_0 ..]
  dataFile << "x,y,z,rho,u,v,";
  if (nDims == 3) dataFile << "w,";
  dataFile << "p,T";
  for (int s=0; s<nSpecies; s++)
    dataFile << ",Y" << s;
  dataFile << endl;

  const oper &op = Solver->opers[params->order];
  const equationOfState &eos = *Solver->gas.eos;

  for (int e=0; e<Solver->nEles; e++) {
    for (int spt=0; spt<Solver->nSpts; spt++) {
      point pt = Solver->Geo->getPosition(e, op.loc_spts[spt]);
      const double* U = &Solver->U_spts(spt,e,0);
      double T = eos.temperature(U, Solver->T_spts(spt,e));
      double P = eos.pressure(U, T);

      for (int dim=0; dim<nDims; dim++)
        dataFile << pt[dim] << ",";
      if (nDims == 2) dataFile << "0.0,"; // output a 0 for z [2D]

      dataFile << U[0] << ",";
      for (int dim=0; dim<nDims; dim++)
        dataFile << U[dim+1]/U[0] << ",";
      dataFile << P << "," << T;
      for (int s=0; s<nSpecies; s++)
        dataFile << "," << U[nDims+2+s]/U[0];
      dataFile << endl;
    }
  }

  dataFile.close();
}

void writeResidual(solver *Solver, input *params)
{
  int iter = params->iter;

  // Residual of the last-evaluated stage; all ranks take part in the reduction
  vector<double> res = Solver->computeResidualNorm(params->resType);

  if (checkNaN(res))
    FatalError("NaN Encountered in Solution Residual!");

  if (params->rank != 0) return;

  /* --- Print the residual in the terminal --- */

  int colW = 16;
  cout.precision(6);
  cout.setf(ios::scientific, ios::floatfield);
  bool header = (iter==params->initIter+1 || (iter/params->monitorResFreq)%25==0);
  if (header) {
    cout << endl;
    cout << setw(8) << left << "Iter" << "Var  ";
    cout << setw(colW) << left << "rho";
    cout << setw(colW) << left << "rhoU";
    cout << setw(colW) << left << "rhoV";
    if (params->nDims == 3)
      cout << setw(colW) << left << "rhoW";
    cout << setw(colW) << left << "rhoE";
    for (int s=0; s<params->nSpecies; s++)
      cout << setw(colW) << left << "rhoY" + to_string(s);
    if (params->dtType == 1)
      cout << setw(colW) << left << "deltaT";
    cout << endl;
  }

  cout << setw(8) << left << iter << "Res  ";
  for (int i=0; i<params->nFields; i++)
    cout << setw(colW) << left << res[i];

  // Print time step (for CFL time-stepping)
  if (params->dtType == 1)
    cout << setw(colW) << left << params->dt;

  cout << endl;

  /* --- Write the residual to the history file --- */

  ofstream histFile;
  string fileName = params->dataFileName + ".hist";
  histFile.open(fileName.c_str(),ofstream::app);

  histFile.precision(5);
  histFile.setf(ios::scientific, ios::floatfield);
  if (header) {
    histFile << endl;
    histFile << setw(8) << left << "Iter";
    histFile << setw(colW) << left << "Time";
    for (int i=0; i<params->nFields; i++)
      histFile << setw(colW) << left << "Res" + to_string(i);
    histFile << endl;
  }

  histFile << setw(8) << left << iter;
  histFile << setw(colW) << left << params->time;
  for (int i=0; i<params->nFields; i++)
    histFile << setw(colW) << left << res[i];
  histFile << endl;

  histFile.close();
}
