/*!
 * \file input.cpp
 * \brief Functions for reading the input file & storing simulation parameters
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
#include "../include/input.hpp"

#include <algorithm>
#include <climits>
#include <fstream>
#include <limits>
#include <sstream>
#include <string>
#include <stdio.h>

fileReader::fileReader()
{

}

fileReader::fileReader(string fileName)
{
  this->fileName = fileName;
}

fileReader::~fileReader()
{
  if (optFile.is_open()) optFile.close();
}

void fileReader::setFile(string fileName)
{
  this->fileName = fileName;
}

void fileReader::openFile(void)
{
  optFile.open(fileName.c_str(), ifstream::in);
}

void fileReader::closeFile()
{
  optFile.close();
}

void fileReader::rewind(void)
{
  if (!optFile.is_open()) {
    openFile();
    if (!optFile.is_open()) {
      string errMsg = "Cannot open input file for reading: " + fileName;
      FatalError(errMsg.c_str());
    }
  }

  // Rewind to the start of the file
  optFile.clear();
  optFile.seekg(0,optFile.beg);
}

bool fileReader::isOption(string optName)
{
  string str, optKey;

  rewind();

  while (getline(optFile,str)) {
    stringstream ss;
    ss.str(str);
    optKey = "";
    ss >> optKey;
    if (optKey.compare(optName)==0) {
      closeFile();
      return true;
    }
  }

  closeFile();
  return false;
}

template<typename T>
void fileReader::getScalarValue(string optName, T &opt, T defaultVal)
{
  string str, optKey;

  rewind();

  // Search for the given option string
  while (getline(optFile,str)) {
    // Remove any leading whitespace & see if first word is the input option
    stringstream ss;
    ss.str(str);
    optKey = "";
    ss >> optKey;
    if (optKey.compare(optName)==0) {
      if (!(ss >> opt)) {
        // This could happen if, for example, trying to assign a string to a double
        cout << "WARNING: Unable to assign value to option " << optName << endl;
        cout << "Using default value of " << defaultVal << " instead." << endl;
        opt = defaultVal;
      }

      closeFile();
      return;
    }
  }

  opt = defaultVal;
  closeFile();
}

template<typename T>
void fileReader::getScalarValue(string optName, T &opt)
{
  string str, optKey;

  rewind();

  // Search for the given option string
  while (getline(optFile,str)) {
    // Remove any leading whitespace & see if first word is the input option
    stringstream ss;
    ss.str(str);
    optKey = "";
    ss >> optKey;
    if (optKey.compare(optName)==0) {
      if (!(ss >> opt)) {
        // This could happen if, for example, trying to assign a string to a double
        cerr << "WARNING: Unable to assign value to option " << optName << endl;
        string errMsg = "Required option not set: " + optName;
        FatalError(errMsg.c_str())
      }

      closeFile();
      return;
    }
  }

  // Option was not found; throw error & exit
  string errMsg = "Required option not found: " + optName;
  FatalError(errMsg.c_str());
}

template<typename T, typename U>
void fileReader::getMap(string optName, map<T,U> &opt) {
  string str, optKey;
  T tmpT;
  U tmpU;
  bool found = false;

  rewind();

  // Search for the given option string
  while (getline(optFile,str)) {
    // Remove any leading whitespace & see if first word is the input option
    stringstream ss;
    ss.str(str);
    optKey = "";
    ss >> optKey;
    if (optKey.compare(optName)==0) {
      found = true;
      if (!(ss >> tmpT >> tmpU)) {
        // This could happen if, for example, trying to assign a string to a double
        cerr << "WARNING: Unable to assign value to option " << optName << endl;
        string errMsg = "Required option not set: " + optName;
        FatalError(errMsg.c_str())
      }

      opt[tmpT] = tmpU;
    }
  }

  if (!found) {
    // Option was not found; throw error & exit
    string errMsg = "Required option not found: " + optName;
    FatalError(errMsg.c_str());
  }

  closeFile();
}

template<typename T>
void fileReader::getVectorValue(string optName, vector<T> &opt)
{
  if (!isOption(optName)) {
    // Option was not found; throw error & exit
    string errMsg = "Required option not found: " + optName;
    FatalError(errMsg.c_str());
  }

  getVectorValue(optName, opt, vector<T>());
}

template<typename T>
void fileReader::getVectorValue(string optName, vector<T> &opt, const vector<T> &defaultVal)
{
  string str, optKey;

  rewind();

  // Search for the given option string
  while (getline(optFile,str)) {
    // Remove any leading whitespace & see if first word is the input option
    stringstream ss;
    ss.str(str);
    optKey = "";
    ss >> optKey;
    if (optKey.compare(optName)==0) {
      int nVals;
      if (!(ss >> nVals) || nVals < 0) {
        cerr << "WARNING: Unable to read number of entries for vector option " << optName << endl;
        string errMsg = "Required option not set: " + optName;
        FatalError(errMsg.c_str());
      }

      opt.resize(nVals);
      for (int i=0; i<nVals; i++) {
        if (!(ss >> opt[i])) {
          cerr << "WARNING: Unable to assign all values to vector option " << optName << endl;
          string errMsg = "Required option not set: " + optName;
          FatalError(errMsg.c_str())
        }
      }

      closeFile();
      return;
    }
  }

  opt = defaultVal;
  closeFile();
}

input::input()
{
  rank = 0;
  nproc = 1;
  time = 0;
  rkTime = 0;
  iter = 0;
  initIter = 0;
#ifndef _NO_MPI
  myComm = MPI_COMM_WORLD;
#endif
}

void input::readInputFile(const char *filename)
{
  /* --- Open Input File --- */
  string fName;
  fName.assign(filename);

  opts.setFile(fName);

  /* --- Read input file & store all simulation parameters --- */

  opts.getScalarValue("nDims",nDims);
  if (nDims != 2 && nDims != 3)
    FatalError("nDims must be 2 or 3.");

  opts.getScalarValue("order",order,3);
  opts.getScalarValue("quadOrder",quadOrder,order);
  if (quadOrder < order) quadOrder = order;
  opts.getScalarValue("operatorType",operatorType,(int)WEAK_FORM);
  opts.getScalarValue("viscous",viscous,0);
  opts.getScalarValue("riemannType",riemannType,(int)RUSANOV);
  opts.getScalarValue("icType",icType,(int)IC_UNIFORM);

  /* --- Gas model --- */
  opts.getScalarValue("nSpecies",nSpecies,0);
  opts.getScalarValue("eos",eosType,(int)IDEAL_SINGLE_GAS);
  opts.getScalarValue("gamma",gamma,1.4);
  opts.getScalarValue("RGas",RGas,287.058);
  if (eosType == IDEAL_MIXTURE) {
    if (nSpecies < 1)
      FatalError("Ideal-gas mixture requires nSpecies > 0.");
    opts.getVectorValue("speciesMW",mwSpecies);
    opts.getVectorValue("speciesCpA",cpASpecies);
    opts.getVectorValue("speciesCpB",cpBSpecies,vector<double>(nSpecies,0.));
  }

  nFields = nDims + 2 + nSpecies;

  opts.getScalarValue("fixVis",fixVis,1);
  opts.getScalarValue("muGas",muGas,1.827e-5);
  opts.getScalarValue("TGas",TGas,291.15);
  opts.getScalarValue("SGas",SGas,120.);
  opts.getScalarValue("prandtl",prandtl,.72);
  opts.getScalarValue("schmidt",schmidt,1.);
  opts.getScalarValue("diffD",diffD,0.);

  /* --- Time stepping --- */
  opts.getScalarValue("timeType",timeType,4);
  opts.getScalarValue("dtType",dtType,0);
  opts.getScalarValue("iterMax",iterMax);
  if (dtType == 1) {
    opts.getScalarValue("CFL",CFL);
    opts.getScalarValue("maxTime",maxTime);
    dt = 0;
  } else {
    opts.getScalarValue("dt",dt);
    opts.getScalarValue("maxTime",maxTime,iterMax*dt);
  }

  /* --- Initial condition --- */
  opts.getScalarValue("rhoIC",rhoIC,1.);
  opts.getScalarValue("pIC",pIC,1./gamma);
  opts.getVectorValue("VIC",VIC,vector<double>(nDims,0.));
  if ((int)VIC.size() != nDims)
    FatalError("VIC must have nDims entries.");
  opts.getVectorValue("YIC",YIC,vector<double>(nSpecies,(nSpecies>0) ? 1./nSpecies : 0.));
  if ((int)YIC.size() != nSpecies)
    FatalError("YIC must have nSpecies entries.");
  opts.getScalarValue("vortexX0",vortexX0,0.);
  opts.getScalarValue("vortexY0",vortexY0,0.);
  opts.getScalarValue("vortexBeta",vortexBeta,5.);
  opts.getScalarValue("pulseAmp",pulseAmp,.1);
  opts.getScalarValue("pulseWidth",pulseWidth,.1);
  opts.getScalarValue("pulseX0",pulseX0,0.);
  opts.getScalarValue("pulseY0",pulseY0,0.);
  opts.getScalarValue("pulseZ0",pulseZ0,0.);

  /* --- Mesh --- */
  opts.getScalarValue("nx",nx,10);
  opts.getScalarValue("ny",ny,10);
  opts.getScalarValue("nz",nz,10);
  opts.getScalarValue("xmin",xmin,-10.);
  opts.getScalarValue("xmax",xmax,10.);
  opts.getScalarValue("ymin",ymin,-10.);
  opts.getScalarValue("ymax",ymax,10.);
  opts.getScalarValue("zmin",zmin,-10.);
  opts.getScalarValue("zmax",zmax,10.);
  if (nDims == 2) nz = 1;

  opts.getScalarValue("create_bcTop",create_bcTop,string("periodic"));
  opts.getScalarValue("create_bcBottom",create_bcBottom,string("periodic"));
  opts.getScalarValue("create_bcLeft",create_bcLeft,string("periodic"));
  opts.getScalarValue("create_bcRight",create_bcRight,string("periodic"));
  opts.getScalarValue("create_bcFront",create_bcFront,string("periodic"));
  opts.getScalarValue("create_bcBack",create_bcBack,string("periodic"));
  create_bcTop = toLower(create_bcTop);
  create_bcBottom = toLower(create_bcBottom);
  create_bcLeft = toLower(create_bcLeft);
  create_bcRight = toLower(create_bcRight);
  create_bcFront = toLower(create_bcFront);
  create_bcBack = toLower(create_bcBack);

  // Get mesh boundaries, boundary conditions & convert to lowercase
  if (opts.isOption("mesh_bound")) {
    map<string,string> meshBndTmp;
    opts.getMap("mesh_bound",meshBndTmp);
    for (auto& B:meshBndTmp)
      meshBounds[toLower(B.first)] = toLower(B.second);
  }

  readBoundaryParams();

  /* --- Output --- */
  opts.getScalarValue("dataFileName",dataFileName,string("simData"));
  opts.getScalarValue("plotFreq",plotFreq,-1);
  if (plotFreq <= 0) plotFreq = INT_MAX;
  opts.getScalarValue("monitorResFreq",monitorResFreq,10);
  if (monitorResFreq < 0) monitorResFreq = INT_MAX;
  opts.getScalarValue("resType",resType,2);

  /* --- Stabilization --- */
  opts.getScalarValue("limiter",limiter,0);
  opts.getScalarValue("rhoMin",rhoMin,0.);
  opts.getScalarValue("YMin",YMin,0.);
  opts.getScalarValue("artVisc",artVisc,0);
  opts.getScalarValue("avAlpha",avAlpha,1e-2);
  opts.getScalarValue("avS0",avS0,-6.);
  opts.getScalarValue("avKappa",avKappa,1.);

  opts.getScalarValue("filterFreq",filterFreq,0);
  opts.getScalarValue("filterCutoff",filterCutoff,order/2);
  opts.getScalarValue("filterOrder",filterOrder,2);
  opts.getScalarValue("filterAlpha",filterAlpha,-log(std::numeric_limits<double>::epsilon()));

  opts.getScalarValue("healthCheckFreq",healthCheckFreq,10);
  if (healthCheckFreq <= 0) healthCheckFreq = INT_MAX;
  opts.getScalarValue("healthPresMin",healthPresMin,0.);
  opts.getScalarValue("healthPresMax",healthPresMax,(double)INFINITY);
  opts.getScalarValue("healthTempMin",healthTempMin,0.);
  opts.getScalarValue("healthTempMax",healthTempMax,(double)INFINITY);

  /* --- Cleanup ---- */
  opts.closeFile();

  /* --- Additional Processing --- */
  switch (timeType) {
    case 0:
      nRKSteps = 1;
      RKa = {0};
      RKb = {1};
      break;
    case 3:
      // SSP-RK3 in Shu-Osher form; RKa holds the stage times
      nRKSteps = 3;
      RKa = {0., 1., .5};
      RKb = {1./6., 1./6., 2./3.};
      break;
    case 4:
      nRKSteps = 4;
      RKa = {0., .5, .5, 1.};
      RKb = {1./6., 1./3., 1./3., 1./6.};
      break;
    default:
      FatalError("Time-Stepping type not supported.");
  }

  iter = initIter;
}

void input::readBoundaryParams(void)
{
  for (auto &B:meshBounds) {
    bcParams bc;
    bc.tag = B.first;
    bc.bcName = B.second;

    if (!bcStr2Num.count(bc.bcName)) {
      string errMsg = "Unknown boundary condition '" + bc.bcName + "' for boundary " + bc.tag;
      FatalError(errMsg.c_str());
    }
    bc.bcType = bcStr2Num[bc.bcName];

    string pre = bc.tag + "_";

    opts.getScalarValue(pre+"TWall",bc.TWall,300.);

    bc.hasP = opts.isOption(pre+"PBound");
    opts.getScalarValue(pre+"PBound",bc.PBound,101325.);

    bc.hasT = opts.isOption(pre+"TBound");
    opts.getScalarValue(pre+"TBound",bc.TBound,300.);

    bc.hasRho = opts.isOption(pre+"rhoBound");
    opts.getScalarValue(pre+"rhoBound",bc.rhoBound,1.);

    bc.hasV = opts.isOption(pre+"VBound");
    opts.getVectorValue(pre+"VBound",bc.VBound,vector<double>());

    bc.hasY = opts.isOption(pre+"YBound");
    opts.getVectorValue(pre+"YBound",bc.YBound,vector<double>());

    opts.getVectorValue(pre+"VWall",bc.VWall,vector<double>(nDims,0.));

    bcs[bc.tag] = bc;
  }
}
