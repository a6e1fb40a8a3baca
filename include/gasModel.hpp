/*!
 * \file gasModel.hpp
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
#pragma once

#include <memory>
#include <vector>

#include "global.hpp"

class input;

/*!
 * \brief Pointwise thermodynamic relations for a gas
 *
 * All functions act on a single point of conserved variables laid out as
 * [rho, rho*u_0 .. rho*u_{nDims-1}, rho*E, rho*Y_0 .. rho*Y_{nSpecies-1}].
 * Mass-fraction arguments Y may be NULL when nSpecies == 0.
 */
class equationOfState
{
public:
  equationOfState(int nDims, int nSpecies);

  virtual ~equationOfState() {}

  //! Temperature from the conserved variables; tSeed starts any iterative solve
  virtual double temperature(const double* U, double tSeed = 300.) const = 0;

  virtual double pressure(const double* U, double T) const = 0;

  virtual double gamma(const double* U, double T) const = 0;

  double speedOfSound(const double* U, double T) const;

  //! Internal energy per unit mass
  virtual double internalEnergy(double T, const double* Y) const = 0;

  virtual double density(double P, double T, const double* Y) const = 0;

  virtual double gasConstant(const double* Y) const = 0;

  virtual double heatCapacityCp(double T, const double* Y) const = 0;

  //! Specific enthalpy of each species at temperature T
  virtual void speciesEnthalpies(double T, double* h) const = 0;

  //! Kinetic energy per unit volume, 0.5*|rho*u|^2/rho
  double kineticEnergy(const double* U) const;

  //! Extract the species mass fractions at a point
  void massFractions(const double* U, double* Y) const;

  virtual bool isMixture(void) const { return false; }

  int nDims;
  int nSpecies;
};

/*! Calorically-perfect single gas; species (if any) are passive scalars */
class idealSingleGas : public equationOfState
{
public:
  idealSingleGas(int nDims, int nSpecies, double gamma, double R);

  double temperature(const double* U, double tSeed = 300.) const;
  double pressure(const double* U, double T) const;
  double gamma(const double* U, double T) const;
  double internalEnergy(double T, const double* Y) const;
  double density(double P, double T, const double* Y) const;
  double gasConstant(const double* Y) const;
  double heatCapacityCp(double T, const double* Y) const;
  void speciesEnthalpies(double T, double* h) const;

  double getGamma(void) const { return gam; }

private:
  double gam;
  double RGas;
};

/*!
 * \brief Mixture of thermally-perfect ideal gases
 *
 * Each species k has molecular weight mw_k and heat capacity
 * cp_k(T) = a_k + b_k*T.  The temperature is recovered from the internal
 * energy by Newton iteration starting from the seed.
 */
class idealMixture : public equationOfState
{
public:
  idealMixture(int nDims, const vector<double> &mw, const vector<double> &cpA,
               const vector<double> &cpB);

  double temperature(const double* U, double tSeed = 300.) const;
  double pressure(const double* U, double T) const;
  double gamma(const double* U, double T) const;
  double internalEnergy(double T, const double* Y) const;
  double density(double P, double T, const double* Y) const;
  double gasConstant(const double* Y) const;
  double heatCapacityCp(double T, const double* Y) const;
  void speciesEnthalpies(double T, double* h) const;

  bool isMixture(void) const { return true; }

  static const int maxNewtonIter = 20;

private:
  vector<double> Rk, cpA, cpB;
};

/*! Viscosity, heat conductivity & species diffusivities */
class transportModel
{
public:
  transportModel(double prandtl) : prandtl(prandtl) {}

  virtual ~transportModel() {}

  virtual double viscosity(const double* U, double T) const = 0;

  //! kappa = mu * cp / Pr
  double thermalConductivity(const double* U, double T, const equationOfState &eos) const;

  //! Diffusivity of each species
  virtual void speciesDiffusivity(const double* U, double T, int nSpecies, double* D) const = 0;

protected:
  double prandtl;
};

class constantTransport : public transportModel
{
public:
  constantTransport(double mu, double prandtl, double diffD);

  double viscosity(const double* U, double T) const;
  void speciesDiffusivity(const double* U, double T, int nSpecies, double* D) const;

private:
  double mu, diffD;
};

/*! Sutherland's law for viscosity; D = mu / (rho * Sc) */
class sutherlandTransport : public transportModel
{
public:
  sutherlandTransport(double muRef, double TRef, double S, double prandtl, double schmidt);

  double viscosity(const double* U, double T) const;
  void speciesDiffusivity(const double* U, double T, int nSpecies, double* D) const;

private:
  double muRef, TRef, S, schmidt;
};

/*! Shared, read-only pairing of an equation of state and a transport model */
struct gasModel
{
  shared_ptr<equationOfState> eos;
  shared_ptr<transportModel> transport;
};

//! Build the gas model requested in the input parameters
gasModel setupGasModel(const input *params);
