/*!
 * \file solver.cpp
 * \brief Class to store all solution data & apply the DG operators
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
#include "../include/solver.hpp"

#include <cstring>
#include <sstream>

#include "../include/boundaryConditions.hpp"
#include "../include/flux.hpp"

solver::solver()
{
  Geo = NULL;
  params = NULL;
  rkTime = 0;
  esGamma = 1.4;
}

solver::~solver()
{

}

void solver::setup(input *params, geo *Geo)
{
  this->params = params;
  this->Geo = Geo;

  nDims = params->nDims;
  nFields = params->nFields;
  nSpecies = params->nSpecies;
  nQ = nFields + 1;
  order = params->order;
  nRKSteps = params->nRKSteps;
  nEles = Geo->nEles;

  /* Setup the FR operators for computation */
  if (params->rank == 0) cout << "Solver: Setting up operators" << endl;

  opers[order].setupOperators(nDims, order, params->quadOrder);

  if (params->filterFreq > 0)
    opers[order].setupFilter(params->filterCutoff, params->filterOrder, params->filterAlpha);
  const oper &op = opers[order];

  nSpts = op.nSpts;
  nFpts = op.nFpts;
  nQpts = op.nQpts;
  nFptsPerFace = op.nFptsPerFace;

  /* Gas model, numerical flux & boundaries */
  gas = setupGasModel(params);

  if (params->operatorType == ENTROPY_STABLE) {
    if (op.overInt)
      FatalError("Entropy-stable operator requires quadOrder == order (LGL quadrature).");

    auto ideal = dynamic_pointer_cast<idealSingleGas>(gas.eos);
    if (!ideal)
      FatalError("Entropy-stable operator only supported for a calorically-perfect single gas.");

    esGamma = ideal->getGamma();
  }
  else if (params->operatorType != WEAK_FORM) {
    FatalError("Operator type not recognized.");
  }

  numFlux = getInviscidNumFlux(params->riemannType, params->operatorType);

  if (params->rank == 0) cout << "Solver: Setting up boundary conditions" << endl;

  bounds = setupBoundaries(params, gas, Geo->getBoundaryTags());

  /* Solution & flux storage */
  U_spts.setup(nSpts,nEles,nFields);
  U0.setup(nSpts,nEles,nFields);
  U_fpts.setup(nFpts,nEles,nFields);
  U_qpts.setup(nQpts,nEles,nFields);

  T_spts.setup(nSpts,nEles);
  T_fpts.setup(nFpts,nEles);
  T_qpts.setup(nQpts,nEles);
  T_spts.initializeToValue(300.);

  smoothness.assign(nEles,0.);

  if (params->viscous || params->artVisc) {
    Q_spts.setup(nSpts,nEles,nQ);
    Q_qpts.setup(nQpts,nEles,nQ);
    dQ_spts.setup(nDims,nSpts,nEles,nQ);
    dQ_fpts.setup(nDims,nFpts,nEles,nQ);
    dQ_qpts.setup(nDims,nQpts,nEles,nQ);
    gradFn_fpts.setup(nDims,nFpts,nEles,nQ);
  }

  F_qpts.setup(nDims,nQpts,nEles,nFields);
  Fn_fpts.setup(nFpts,nEles,nFields);
  if (params->operatorType == ENTROPY_STABLE)
    disFn_fpts.setup(nFpts,nEles,nFields);

  divF_spts.resize(nRKSteps);
  for (auto &divF:divF_spts)
    divF.setup(nSpts,nEles,nFields);

  if (params->rank == 0) cout << "Solver: Setting up faces" << endl;

  setupFaces();

  if (params->rank == 0) cout << "Solver: Initializing solution" << endl;

  initializeSolution();
}

void solver::setupFaces(void)
{
  faces.resize(0);
  mpiFaces.resize(0);

  for (auto &info:Geo->intFaces) {
    shared_ptr<face> iface = make_shared<intFace>();
    iface->initialize(this,info);
    iface->ID = faces.size();
    faces.push_back(iface);
  }

  for (auto &info:Geo->bndFaces) {
    shared_ptr<face> bface = make_shared<boundFace>();
    bface->initialize(this,info);
    bface->ID = faces.size();
    faces.push_back(bface);
  }

  for (auto &info:Geo->mpiFaces) {
    shared_ptr<mpiFace> mface = make_shared<mpiFace>();
    mface->initialize(this,info);
    mface->ID = mpiFaces.size();
    mpiFaces.push_back(mface);
  }
}

void solver::initializeSolution(void)
{
  const oper &op = opers[order];
  const equationOfState &eos = *gas.eos;

  double gam = params->gamma;
  vector<double> Y(max(nSpecies,1));
  for (int s=0; s<nSpecies; s++)
    Y[s] = params->YIC[s];

  for (int e=0; e<nEles; e++) {
    for (int spt=0; spt<nSpts; spt++) {
      point pos = Geo->getPosition(e, op.loc_spts[spt]);

      double rho = params->rhoIC;
      double P = params->pIC;
      vector<double> V = params->VIC;

      if (params->icType == IC_VORTEX) {
        // Isentropic vortex in the x-y plane
        double dx = pos.x - params->vortexX0;
        double dy = pos.y - params->vortexY0;
        double f = 1. - dx*dx - dy*dy;
        double beta = params->vortexBeta;

        double theta = 1. - (gam-1.)*beta*beta*params->rhoIC/(8.*gam*pi*pi*params->pIC)*exp(f);
        rho = params->rhoIC*pow(theta,1./(gam-1.));
        P = params->pIC*pow(theta,gam/(gam-1.));
        V[0] -= beta/(2.*pi)*dy*exp(f/2.);
        V[1] += beta/(2.*pi)*dx*exp(f/2.);
      }
      else if (params->icType == IC_PULSE) {
        // Gaussian pressure pulse on a uniform state
        double x0[3] = {params->pulseX0, params->pulseY0, params->pulseZ0};
        double r2 = 0;
        for (int dim=0; dim<nDims; dim++)
          r2 += (pos[dim]-x0[dim])*(pos[dim]-x0[dim]);
        double w = params->pulseWidth;
        P += params->pulseAmp*exp(-r2/(2.*w*w));
      }
      else if (params->icType != IC_UNIFORM) {
        FatalError("Initial condition type not recognized.");
      }

      double T = P / (rho*eos.gasConstant(Y.data()));

      double vMagSq = 0;
      for (int dim=0; dim<nDims; dim++)
        vMagSq += V[dim]*V[dim];

      U_spts(spt,e,0) = rho;
      for (int dim=0; dim<nDims; dim++)
        U_spts(spt,e,dim+1) = rho*V[dim];
      U_spts(spt,e,nDims+1) = rho*eos.internalEnergy(T,Y.data()) + 0.5*rho*vMagSq;
      for (int s=0; s<nSpecies; s++)
        U_spts(spt,e,nDims+2+s) = rho*Y[s];

      T_spts(spt,e) = T;
    }
  }
}

void solver::update(void)
{
  if (params->timeType == 3) {
    updateSSPRK3();
    params->time += params->dt;
    return;
  }

  /* Intermediate residuals for Runge-Kutta time integration */

  for (int step=0; step<nRKSteps-1; step++) {
    rkTime = params->time + params->RKa[step]*params->dt;

    if (step == 0 && params->dtType != 0) calcDt();

    if (step == 0) copyUspts_U0(); // Store starting values for RK method

    calcResidual(step);

    timeStepA(step, params->RKa[step+1]);

    if (params->limiter) applyLimiter();
  }

  /* Final Runge-Kutta time advancement step */

  rkTime = params->time + params->RKa[nRKSteps-1]*params->dt;

  if (nRKSteps == 1 && params->dtType != 0) calcDt();

  calcResidual(nRKSteps-1);

  // Reset solution to initial-stage values
  if (nRKSteps>1)
    copyU0_Uspts();

  for (int step=0; step<nRKSteps; step++)
    timeStepB(step);

  if (params->limiter) applyLimiter();

  params->time += params->dt;
}

void solver::updateSSPRK3(void)
{
  // Stage weights on the starting solution & the previous stage
  double c0[3] = {0., .75, 1./3.};
  double c1[3] = {1., .25, 2./3.};

  if (params->dtType != 0) calcDt();

  copyUspts_U0();

  for (int step=0; step<3; step++) {
    rkTime = params->time + params->RKa[step]*params->dt;

    calcResidual(0);

    double dt = params->dt;
#pragma omp parallel for collapse(3)
    for (int spt = 0; spt < nSpts; spt++)
      for (int e = 0; e < nEles; e++)
        for (int k = 0; k < nFields; k++)
          U_spts(spt,e,k) = c0[step]*U0(spt,e,k)
              + c1[step]*(U_spts(spt,e,k) - dt*divF_spts[0](spt,e,k));

    if (params->limiter) applyLimiter();
  }
}

void solver::calcResidual(int step)
{
  if (nEles == 0) return;

  extrapolateU();

  calcTemperature();

  if (params->artVisc)
    calcSmoothness();

  /* --- Post the partition-face exchange of the face states --- */

  for (auto &mFace:mpiFaces)
    mFace->sendState();

#pragma omp parallel for
  for (uint i=0; i<faces.size(); i++) {
    faces[i]->getLeftState();
    faces[i]->getRightState();
  }

  for (auto &mFace:mpiFaces) {
    mFace->getLeftState();
    mFace->getRightState();
  }

  if (params->viscous || params->artVisc)
    calcGradQ();

  Fn_fpts.initializeToValue(0.);

  calcInviscidFlux_faces();

  if (params->viscous || params->artVisc)
    calcViscousFlux_faces();

  calcFlux_qpts();

  if (params->operatorType == ENTROPY_STABLE)
    calcDivF_entropyStable(step);
  else
    calcDivF_weak(step);
}

void solver::rhs(double time, const Array<double,3> &U, Array<double,3> &dUdt)
{
  if (U.getDim(0) != (uint)nSpts || U.getDim(1) != (uint)nEles || U.getDim(2) != (uint)nFields)
    FatalError("rhs: solution array does not match the discretization.");

  Array<double,3> USave = U_spts;
  double tSave = rkTime;

  U_spts = U;
  rkTime = time;

  calcResidual(0);

  dUdt = divF_spts[0];
  for (auto &val:dUdt.data)
    val = -val;

  U_spts = USave;
  rkTime = tSave;
}

void solver::timeStepA(int step, double RKval)
{
  double dt = params->dt;
#pragma omp parallel for collapse(3)
  for (int spt = 0; spt < nSpts; spt++)
    for (int e = 0; e < nEles; e++)
      for (int k = 0; k < nFields; k++)
        U_spts(spt,e,k) = U0(spt,e,k) - RKval * divF_spts[step](spt,e,k) * dt;
}

void solver::timeStepB(int step)
{
  double dt = params->dt;
#pragma omp parallel for collapse(3)
  for (int spt = 0; spt < nSpts; spt++)
    for (int e = 0; e < nEles; e++)
      for (int k = 0; k < nFields; k++)
        U_spts(spt,e,k) -= params->RKb[step] * divF_spts[step](spt,e,k) * dt;
}

double solver::calcDt(void)
{
  const equationOfState &eos = *gas.eos;
  double h = Geo->hMin;
  double p2 = 2*order + 1;

  double dtMin = INFINITY;

  for (int e=0; e<nEles; e++) {
    for (int spt=0; spt<nSpts; spt++) {
      const double* U = &U_spts(spt,e,0);
      double T = eos.temperature(U, T_spts(spt,e));
      double c = eos.speedOfSound(U, T);

      double vMag = 0;
      for (int dim=0; dim<nDims; dim++)
        vMag += U[dim+1]*U[dim+1];
      vMag = sqrt(vMag)/U[0];

      // Largest diffusivity: kinematic viscosity plus artificial viscosity
      double nu = 0;
      if (params->viscous)
        nu = gas.transport->viscosity(U,T)/U[0];
      if (params->artVisc)
        nu += params->avAlpha*smoothness[e];

      double dt = params->CFL / (p2*(vMag+c)/h + p2*p2*nu/(h*h));
      dtMin = min(dtMin,dt);
    }
  }

#ifndef _NO_MPI
  double dtTmp = dtMin;
  MPI_Allreduce(&dtTmp, &dtMin, 1, MPI_DOUBLE, MPI_MIN, params->myComm);
#endif

  params->dt = dtMin;

  return dtMin;
}

void solver::copyUspts_U0(void)
{
  U0 = U_spts;
}

void solver::copyU0_Uspts(void)
{
  U_spts = U0;
}

void solver::extrapolateU(void)
{
  const oper &op = opers[order];

  op.applySptsQpts(U_spts.getData(), U_qpts.getData(), nEles*nFields);

  if (params->operatorType != ENTROPY_STABLE) {
    op.applySptsFpts(U_spts.getData(), U_fpts.getData(), nEles*nFields);
    return;
  }

  /* --- Entropy-stable: face states from the projected entropy variables --- */

  Array<double,3> V_spts(nSpts,nEles,nFields);
  Array<double,3> V_fpts(nFpts,nEles,nFields);

#pragma omp parallel for collapse(2)
  for (int spt=0; spt<nSpts; spt++)
    for (int e=0; e<nEles; e++)
      consToEntropyVars(&U_spts(spt,e,0), esGamma, nDims, nSpecies, &V_spts(spt,e,0));

  op.applySptsFpts(V_spts.getData(), V_fpts.getData(), nEles*nFields);

#pragma omp parallel for collapse(2)
  for (int fpt=0; fpt<nFpts; fpt++)
    for (int e=0; e<nEles; e++)
      entropyToConsVars(&V_fpts(fpt,e,0), esGamma, nDims, nSpecies, &U_fpts(fpt,e,0));
}

void solver::calcTemperature(void)
{
  const oper &op = opers[order];
  const equationOfState &eos = *gas.eos;

#pragma omp parallel for collapse(2)
  for (int spt=0; spt<nSpts; spt++)
    for (int e=0; e<nEles; e++)
      T_spts(spt,e) = eos.temperature(&U_spts(spt,e,0), T_spts(spt,e));

  // Seeds for the temperature solves at the flux & quadrature points
  op.applySptsFpts(T_spts.getData(), T_fpts.getData(), nEles);
  op.applySptsQpts(T_spts.getData(), T_qpts.getData(), nEles);
}

void solver::setupQ(void)
{
#pragma omp parallel for collapse(2)
  for (int spt=0; spt<nSpts; spt++) {
    for (int e=0; e<nEles; e++) {
      for (int k=0; k<nFields; k++)
        Q_spts(spt,e,k) = U_spts(spt,e,k);
      Q_spts(spt,e,nFields) = T_spts(spt,e);
    }
  }
}

void solver::calcGradQ(void)
{
  const oper &op = opers[order];

  setupQ();

  op.applySptsQpts(Q_spts.getData(), Q_qpts.getData(), nEles*nQ);

  /* --- Common values of Q on all faces --- */

#pragma omp parallel for
  for (uint i=0; i<faces.size(); i++)
    faces[i]->calcGradFlux();

  for (auto &mFace:mpiFaces)
    mFace->calcGradFlux();

  /* --- Weak-form gradient: -(2/h) A Q + (1/detJ) L (Q* n dA) --- */

  for (int dim=0; dim<nDims; dim++) {
    double* dQ = &dQ_spts(dim,0,0,0);

    op.applyWeakDiv(dim, Q_qpts.getData(), dQ, nEles*nQ, -2./Geo->h[dim], 0.);
    op.applyLift(&gradFn_fpts(dim,0,0,0), dQ, nEles*nQ, 1./Geo->detJ, 1.);

    op.applySptsFpts(dQ, &dQ_fpts(dim,0,0,0), nEles*nQ);
    op.applySptsQpts(dQ, &dQ_qpts(dim,0,0,0), nEles*nQ);
  }

  /* --- Exchange the face gradients --- */

  for (auto &mFace:mpiFaces)
    mFace->sendGradient();

#pragma omp parallel for
  for (uint i=0; i<faces.size(); i++) {
    faces[i]->getLeftGradient();
    faces[i]->getRightGradient();
  }

  for (auto &mFace:mpiFaces) {
    mFace->getLeftGradient();
    mFace->getRightGradient();
  }
}

void solver::calcInviscidFlux_faces(void)
{
#pragma omp parallel for
  for (uint i=0; i<faces.size(); i++)
    faces[i]->calcInviscidFlux();

  for (auto &mFace:mpiFaces)
    mFace->calcInviscidFlux();
}

void solver::calcViscousFlux_faces(void)
{
#pragma omp parallel for
  for (uint i=0; i<faces.size(); i++)
    faces[i]->calcViscousFlux();

  for (auto &mFace:mpiFaces)
    mFace->calcViscousFlux();
}

void solver::calcFlux_qpts(void)
{
  int nPts = nQpts*nEles;

  // Rows of U_qpts & T_qpts are ordered [qpt][ele]
  conservedVars cv(nPts,nDims,nSpecies);
  std::memcpy(cv.U.getData(), U_qpts.getData(), nPts*nFields*sizeof(double));

  vector<double> tSeed(T_qpts.data);

  fluidState state;
  if (params->artVisc) {
    vector<double> sm(nPts);
    for (int qpt=0; qpt<nQpts; qpt++)
      for (int e=0; e<nEles; e++)
        sm[qpt*nEles+e] = smoothness[e];
    state = makeFluidState(cv, gas, &tSeed, &sm);
  }
  else {
    state = makeFluidState(cv, gas, &tSeed);
  }

  F_qpts.initializeToValue(0.);

  if (params->operatorType != ENTROPY_STABLE) {
    Array<double,3> F = inviscidFlux(state);
    for (int qpt=0; qpt<nQpts; qpt++)
      for (int e=0; e<nEles; e++)
        for (int dim=0; dim<nDims; dim++)
          for (int k=0; k<nFields; k++)
            F_qpts(dim,qpt,e,k) = F(qpt*nEles+e,dim,k);
  }

  if (!params->viscous && !params->artVisc) return;

  Array<double,3> gradCv(nPts,nDims,nFields);
  matrix<double> gradT(nPts,nDims);
  for (int dim=0; dim<nDims; dim++) {
    for (int qpt=0; qpt<nQpts; qpt++) {
      for (int e=0; e<nEles; e++) {
        int pt = qpt*nEles+e;
        for (int k=0; k<nFields; k++)
          gradCv(pt,dim,k) = dQ_qpts(dim,qpt,e,k);
        gradT(pt,dim) = dQ_qpts(dim,qpt,e,nFields);
      }
    }
  }

  if (params->viscous) {
    Array<double,3> Fv = viscousFlux(state, gradCv, gradT, gas);
    for (int qpt=0; qpt<nQpts; qpt++)
      for (int e=0; e<nEles; e++)
        for (int dim=0; dim<nDims; dim++)
          for (int k=0; k<nFields; k++)
            F_qpts(dim,qpt,e,k) -= Fv(qpt*nEles+e,dim,k);
  }

  if (params->artVisc) {
    // r = -alpha * s * grad(CV)
    for (int qpt=0; qpt<nQpts; qpt++)
      for (int e=0; e<nEles; e++)
        for (int dim=0; dim<nDims; dim++)
          for (int k=0; k<nFields; k++)
            F_qpts(dim,qpt,e,k) -= params->avAlpha*smoothness[e]*gradCv(qpt*nEles+e,dim,k);
  }
}

void solver::calcDivF_weak(int step)
{
  const oper &op = opers[order];
  double* divF = divF_spts[step].getData();

  for (int dim=0; dim<nDims; dim++) {
    double beta = (dim == 0) ? 0. : 1.;
    op.applyWeakDiv(dim, &F_qpts(dim,0,0,0), divF, nEles*nFields, -2./Geo->h[dim], beta);
  }

  op.applyLift(Fn_fpts.getData(), divF, nEles*nFields, 1./Geo->detJ, 1.);
}

void solver::calcDivF_entropyStable(int step)
{
  const oper &op = opers[order];
  const equationOfState &eos = *gas.eos;
  Array<double,3> &divF = divF_spts[step];

  /* --- Weak-form volume term of the diffusive fluxes (zero when inviscid) --- */

  for (int dim=0; dim<nDims; dim++) {
    double beta = (dim == 0) ? 0. : 1.;
    op.applyWeakDiv(dim, &F_qpts(dim,0,0,0), divF.getData(), nEles*nFields, -2./Geo->h[dim], beta);
  }

  /* --- Flux differencing: (2/h) * sum_j 2 D_ij F#(u_i,u_j) along each direction --- */

#pragma omp parallel for collapse(2)
  for (int e=0; e<nEles; e++) {
    for (int spt=0; spt<nSpts; spt++) {
      vector<double> Fs(nFields);
      double norm[3] = {0,0,0};
      for (int dim=0; dim<nDims; dim++) {
        int stride = op.sptStride(dim);
        int i1 = op.sptIndex1D(spt,dim);
        int start = spt - i1*stride;
        double fac = 2.*2./Geo->h[dim];

        norm[0] = norm[1] = norm[2] = 0;
        norm[dim] = 1.;

        for (int j1=0; j1<op.nSpts1D; j1++) {
          double Dij = op.opp_D1D(i1,j1);
          if (Dij == 0) continue;
          int sptj = start + j1*stride;
          chandrashekarFlux(&U_spts(spt,e,0), &U_spts(sptj,e,0), esGamma, nDims, nSpecies, norm, Fs.data());
          for (int k=0; k<nFields; k++)
            divF(spt,e,k) += fac*Dij*Fs[k];
        }
      }
    }
  }

  /* --- Element's own inviscid normal flux at the face points --- */

  int nPerFace = nFptsPerFace;
#pragma omp parallel for collapse(2)
  for (int fpt=0; fpt<nFpts; fpt++) {
    for (int e=0; e<nEles; e++) {
      int dim = fpt / nPerFace / 2;
      double sign = op.fptSign(fpt);
      double dA = Geo->dA[dim];
      const double* U = &U_fpts(fpt,e,0);
      double T = eos.temperature(U, T_fpts(fpt,e));
      double P = eos.pressure(U, T);

      vector<double> F(nDims*nFields);
      inviscidFluxPt(U, P, nDims, nFields, F.data());
      for (int k=0; k<nFields; k++)
        disFn_fpts(fpt,e,k) = sign*F[dim*nFields+k]*dA;
    }
  }

  /* --- Lift of the flux jump (common flux - element's own flux) --- */

  Array<double,3> jump(nFpts,nEles,nFields);
  for (uint i=0; i<jump.data.size(); i++)
    jump.data[i] = Fn_fpts.data[i] - disFn_fpts.data[i];

  op.applyLift(jump.getData(), divF.getData(), nEles*nFields, 1./Geo->detJ, 1.);
}

vector<double> solver::computeResidualNorm(int type)
{
  vector<double> res(nFields, 0.);
  const Array<double,3> &divF = divF_spts[0];

  for (int spt=0; spt<nSpts; spt++) {
    for (int e=0; e<nEles; e++) {
      for (int k=0; k<nFields; k++) {
        double val = std::abs(divF(spt,e,k));
        if (type == 3)
          res[k] = max(res[k], val);
        else if (type == 1)
          res[k] += val;
        else
          res[k] += val*val;
      }
    }
  }

#ifndef _NO_MPI
  vector<double> resTmp = res;
  MPI_Op op = (type == 3) ? MPI_MAX : MPI_SUM;
  MPI_Allreduce(resTmp.data(), res.data(), nFields, MPI_DOUBLE, op, params->myComm);
#endif

  if (type == 2)
    for (auto &R:res) R = sqrt(R);

  return res;
}

vector<double> solver::computeIntegrals(void)
{
  const oper &op = opers[order];
  vector<double> integrals(nFields, 0.);

  for (int spt=0; spt<nSpts; spt++)
    for (int e=0; e<nEles; e++)
      for (int k=0; k<nFields; k++)
        integrals[k] += op.wts_spts[spt]*Geo->detJ*U_spts(spt,e,k);

  return integrals;
}
