/*!
 * \file gasModel.cpp
 * \brief Equations of state & transport models for the compressible gas
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
#include "../include/gasModel.hpp"

#include <cmath>

#include "../include/input.hpp"

/* ---------------------------- equationOfState ---------------------------- */

equationOfState::equationOfState(int nDims, int nSpecies)
{
  this->nDims = nDims;
  this->nSpecies = nSpecies;
}

double equationOfState::speedOfSound(const double* U, double T) const
{
  return sqrt(gamma(U,T) * pressure(U,T) / U[0]);
}

double equationOfState::kineticEnergy(const double* U) const
{
  double msq = 0;
  for (int d=0; d<nDims; d++)
    msq += U[d+1]*U[d+1];

  return 0.5*msq/U[0];
}

void equationOfState::massFractions(const double* U, double* Y) const
{
  for (int k=0; k<nSpecies; k++)
    Y[k] = U[nDims+2+k] / U[0];
}

/* ----------------------------- idealSingleGas ---------------------------- */

idealSingleGas::idealSingleGas(int nDims, int nSpecies, double gamma, double R)
  : equationOfState(nDims, nSpecies)
{
  if (gamma <= 1.)
    FatalError("Ratio of specific heats must be > 1.");

  if (R <= 0.)
    FatalError("Gas constant must be positive.");

  gam = gamma;
  RGas = R;
}

double idealSingleGas::temperature(const double* U, double) const
{
  double e = (U[nDims+1] - kineticEnergy(U)) / U[0];
  return (gam-1.)*e / RGas;
}

double idealSingleGas::pressure(const double* U, double T) const
{
  return U[0]*RGas*T;
}

double idealSingleGas::gamma(const double*, double) const
{
  return gam;
}

double idealSingleGas::internalEnergy(double T, const double*) const
{
  return RGas*T/(gam-1.);
}

double idealSingleGas::density(double P, double T, const double*) const
{
  return P/(RGas*T);
}

double idealSingleGas::gasConstant(const double*) const
{
  return RGas;
}

double idealSingleGas::heatCapacityCp(double, const double*) const
{
  return gam*RGas/(gam-1.);
}

void idealSingleGas::speciesEnthalpies(double T, double* h) const
{
  double cp = gam*RGas/(gam-1.);
  for (int k=0; k<nSpecies; k++)
    h[k] = cp*T;
}

/* ------------------------------ idealMixture ----------------------------- */

idealMixture::idealMixture(int nDims, const vector<double> &mw, const vector<double> &cpA,
                           const vector<double> &cpB)
  : equationOfState(nDims, mw.size())
{
  if (nSpecies < 1)
    FatalError("Ideal-gas mixture requires at least one species.");

  if ((int)cpA.size() != nSpecies || (int)cpB.size() != nSpecies)
    FatalError("Heat-capacity fits must be given for every species.");

  Rk.resize(nSpecies);
  for (int k=0; k<nSpecies; k++) {
    if (mw[k] <= 0)
      FatalError("Species molecular weights must be positive.");
    Rk[k] = RUniversal / mw[k];
  }

  this->cpA = cpA;
  this->cpB = cpB;
}

double idealMixture::gasConstant(const double* Y) const
{
  double R = 0;
  for (int k=0; k<nSpecies; k++)
    R += Y[k]*Rk[k];

  return R;
}

double idealMixture::heatCapacityCp(double T, const double* Y) const
{
  double cp = 0;
  for (int k=0; k<nSpecies; k++)
    cp += Y[k]*(cpA[k] + cpB[k]*T);

  return cp;
}

double idealMixture::internalEnergy(double T, const double* Y) const
{
  double e = 0;
  for (int k=0; k<nSpecies; k++)
    e += Y[k]*((cpA[k] - Rk[k])*T + 0.5*cpB[k]*T*T);

  return e;
}

void idealMixture::speciesEnthalpies(double T, double* h) const
{
  for (int k=0; k<nSpecies; k++)
    h[k] = cpA[k]*T + 0.5*cpB[k]*T*T;
}

double idealMixture::temperature(const double* U, double tSeed) const
{
  vector<double> Y(nSpecies);
  massFractions(U,Y.data());

  double e = (U[nDims+1] - kineticEnergy(U)) / U[0];
  double R = gasConstant(Y.data());

  double T = tSeed;
  for (int iter=0; iter<maxNewtonIter; iter++) {
    double cv = heatCapacityCp(T,Y.data()) - R;
    double dT = (internalEnergy(T,Y.data()) - e) / cv;
    T -= dT;
    if (fabs(dT) < 1e-10*fabs(T)) break;
  }

  return T;
}

double idealMixture::pressure(const double* U, double T) const
{
  vector<double> Y(nSpecies);
  massFractions(U,Y.data());

  return U[0]*gasConstant(Y.data())*T;
}

double idealMixture::gamma(const double* U, double T) const
{
  vector<double> Y(nSpecies);
  massFractions(U,Y.data());

  double cp = heatCapacityCp(T,Y.data());
  return cp / (cp - gasConstant(Y.data()));
}

double idealMixture::density(double P, double T, const double* Y) const
{
  return P / (gasConstant(Y)*T);
}

/* ---------------------------- Transport models --------------------------- */

double transportModel::thermalConductivity(const double* U, double T, const equationOfState &eos) const
{
  vector<double> Y(eos.nSpecies);
  eos.massFractions(U,Y.data());

  return viscosity(U,T) * eos.heatCapacityCp(T,Y.data()) / prandtl;
}

constantTransport::constantTransport(double mu, double prandtl, double diffD)
  : transportModel(prandtl)
{
  this->mu = mu;
  this->diffD = diffD;
}

double constantTransport::viscosity(const double*, double) const
{
  return mu;
}

void constantTransport::speciesDiffusivity(const double*, double, int nSpecies, double* D) const
{
  for (int k=0; k<nSpecies; k++)
    D[k] = diffD;
}

sutherlandTransport::sutherlandTransport(double muRef, double TRef, double S, double prandtl, double schmidt)
  : transportModel(prandtl)
{
  this->muRef = muRef;
  this->TRef = TRef;
  this->S = S;
  this->schmidt = schmidt;
}

double sutherlandTransport::viscosity(const double*, double T) const
{
  return muRef * pow(T/TRef,1.5) * (TRef+S) / (T+S);
}

void sutherlandTransport::speciesDiffusivity(const double* U, double T, int nSpecies, double* D) const
{
  double Dk = viscosity(U,T) / (U[0]*schmidt);
  for (int k=0; k<nSpecies; k++)
    D[k] = Dk;
}

/* -------------------------------- Setup ---------------------------------- */

gasModel setupGasModel(const input *params)
{
  gasModel gas;

  switch (params->eosType) {
    case IDEAL_SINGLE_GAS:
      gas.eos = make_shared<idealSingleGas>(params->nDims, params->nSpecies, params->gamma, params->RGas);
      break;

    case IDEAL_MIXTURE:
      if ((int)params->mwSpecies.size() != params->nSpecies)
        FatalError("speciesMW must have nSpecies entries.");
      gas.eos = make_shared<idealMixture>(params->nDims, params->mwSpecies, params->cpASpecies, params->cpBSpecies);
      break;

    default:
      FatalError("Equation of state not recognized.");
  }

  if (params->fixVis)
    gas.transport = make_shared<constantTransport>(params->muGas, params->prandtl, params->diffD);
  else
    gas.transport = make_shared<sutherlandTransport>(params->muGas, params->TGas, params->SGas, params->prandtl, params->schmidt);

  return gas;
}
