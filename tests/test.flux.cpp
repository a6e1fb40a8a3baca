/*!
 * \file test.flux.cpp
 * \brief Tests for the inviscid, viscous & entropy-conservative flux functions
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
#include "../include/flux.hpp"

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

namespace {

gasModel perfectGas(int nDims, int nSpecies)
{
  gasModel gas;
  gas.eos = make_shared<idealSingleGas>(nDims, nSpecies, 1.4, 1.);
  gas.transport = make_shared<constantTransport>(.01, .72, .001);
  return gas;
}

//! Single-point state from primitive variables
fluidState pointState(const gasModel &gas, double rho, const vector<double> &V, double P,
                      const vector<double> &Y = vector<double>())
{
  int nDims = V.size();
  int nSpecies = Y.size();
  conservedVars cv(1, nDims, nSpecies);

  double vsq = 0;
  cv.U(0,0) = rho;
  for (int d=0; d<nDims; d++) {
    cv.U(0,d+1) = rho*V[d];
    vsq += V[d]*V[d];
  }
  cv.U(0,nDims+1) = P/.4 + .5*rho*vsq;
  for (int k=0; k<nSpecies; k++)
    cv.U(0,nDims+2+k) = rho*Y[k];

  return makeFluidState(cv, gas);
}

matrix<double> unitNormal(double nx, double ny)
{
  matrix<double> norm(1,2);
  double mag = sqrt(nx*nx+ny*ny);
  norm(0,0) = nx/mag;
  norm(0,1) = ny/mag;
  return norm;
}

}

TEST_CASE("Analytic inviscid flux")
{
  gasModel gas = perfectGas(2,0);
  fluidState s = pointState(gas, 1.2, {2., -1.}, 3.);

  Array<double,3> F = inviscidFlux(s);
  CHECK(F(0,0,0) == Approx(1.2*2.));
  CHECK(F(0,0,1) == Approx(1.2*4. + 3.));
  CHECK(F(0,0,2) == Approx(1.2*2.*-1.));
  CHECK(F(0,1,2) == Approx(1.2*1. + 3.));

  double E = s.cv.energy(0);
  CHECK(F(0,0,3) == Approx((E+3.)*2.));
  CHECK(F(0,1,3) == Approx(-(E+3.)));
}

TEST_CASE("Numerical fluxes are consistent")
{
  gasModel gas = perfectGas(2,1);
  fluidState s = pointState(gas, .8, {.3, .4}, 1.1, {.6});
  matrix<double> norm = unitNormal(1., 2.);

  matrix<double> Fexact = normalFlux(inviscidFlux(s), norm);
  matrix<double> Frus = rusanovFlux(s, s, gas, norm);
  matrix<double> Fcen = centralFlux(s, s, gas, norm);
  matrix<double> Fes = entropyStableRusanovFlux(s, s, gas, norm);

  for (int k=0; k<s.cv.getNFields(); k++) {
    CHECK(Frus(0,k) == Approx(Fexact(0,k)));
    CHECK(Fcen(0,k) == Approx(Fexact(0,k)));
    CHECK(Fes(0,k) == Approx(Fexact(0,k)));
  }
}

TEST_CASE("Rusanov flux is conservative across a face")
{
  gasModel gas = perfectGas(2,0);
  fluidState sL = pointState(gas, 1., {.5, 0.}, 1.);
  fluidState sR = pointState(gas, .5, {-.2, .1}, .4);

  matrix<double> norm = unitNormal(1., 0.);
  matrix<double> normR = unitNormal(-1., 0.);

  matrix<double> FL = rusanovFlux(sL, sR, gas, norm);
  matrix<double> FR = rusanovFlux(sR, sL, gas, normR);

  for (int k=0; k<4; k++)
    CHECK(FL(0,k) == Approx(-FR(0,k)));

  // Upwinding dissipates: differs from the central flux by 0.5*lambda*jump
  matrix<double> FC = centralFlux(sL, sR, gas, norm);
  double n[2] = {1., 0.};
  double lambda = std::max(sL.waveSpeed(0,n), sR.waveSpeed(0,n));
  CHECK(FL(0,0) == Approx(FC(0,0) - .5*lambda*(.5 - 1.)));
}

TEST_CASE("Logarithmic mean")
{
  CHECK(logMean(2., 2.) == Approx(2.));
  CHECK(logMean(1., std::exp(1.)) == Approx(std::exp(1.) - 1.));
  CHECK(logMean(3., 3.0001) == Approx(.0001/std::log(3.0001/3.)).epsilon(1e-10));
  CHECK(logMean(1.5, 4.) == Approx(logMean(4., 1.5)));
}

TEST_CASE("Chandrashekar two-point flux")
{
  int nDims = 2;
  int nSpecies = 1;
  double gam = 1.4;
  gasModel gas = perfectGas(nDims,nSpecies);

  fluidState sA = pointState(gas, 1.1, {.2, -.3}, .9, {.25});
  fluidState sB = pointState(gas, .7, {-.1, .5}, 1.3, {.8});
  double n[2] = {.6, .8};

  vector<double> FAB(5), FBA(5), FAA(5);
  chandrashekarFlux(sA.cv[0], sB.cv[0], gam, nDims, nSpecies, n, FAB.data());
  chandrashekarFlux(sB.cv[0], sA.cv[0], gam, nDims, nSpecies, n, FBA.data());
  chandrashekarFlux(sA.cv[0], sA.cv[0], gam, nDims, nSpecies, n, FAA.data());

  SECTION("Symmetric in its arguments") {
    for (int k=0; k<5; k++)
      CHECK(FAB[k] == Approx(FBA[k]));
  }

  SECTION("Consistent with the analytic flux") {
    matrix<double> norm(1,2);
    norm(0,0) = n[0];
    norm(0,1) = n[1];
    matrix<double> F = normalFlux(inviscidFlux(sA), norm);
    for (int k=0; k<5; k++)
      CHECK(FAA[k] == Approx(F(0,k)));
  }

  SECTION("Entropy conservative: [v].F# = [psi.n]") {
    vector<double> vA(5), vB(5);
    consToEntropyVars(sA.cv[0], gam, nDims, nSpecies, vA.data());
    consToEntropyVars(sB.cv[0], gam, nDims, nSpecies, vB.data());

    // Entropy potential psi = rho*u for the Euler part
    double psiA = 0, psiB = 0;
    for (int d=0; d<nDims; d++) {
      psiA += sA.cv.momentum(0,d)*n[d];
      psiB += sB.cv.momentum(0,d)*n[d];
    }

    double jump = 0;
    for (int k=0; k<nDims+2; k++)
      jump += (vB[k]-vA[k])*FAB[k];

    CHECK(jump == Approx(psiB - psiA).margin(1e-12));
  }
}

TEST_CASE("Entropy variables invert to the conserved variables")
{
  int nDims = 3;
  int nSpecies = 2;
  double gam = 1.4;
  gasModel gas = perfectGas(nDims,nSpecies);

  fluidState s = pointState(gas, 1.3, {.1, -.4, .25}, 2.2, {.3, .5});

  vector<double> V(7), U(7);
  consToEntropyVars(s.cv[0], gam, nDims, nSpecies, V.data());
  entropyToConsVars(V.data(), gam, nDims, nSpecies, U.data());

  for (int k=0; k<7; k++)
    CHECK(U[k] == Approx(s.cv.U(0,k)));

  // Last Euler entropy variable is -rho/p
  CHECK(V[nDims+1] == Approx(-1.3/2.2));
}

TEST_CASE("Viscous flux of a linear shear")
{
  gasModel gas = perfectGas(2,0);
  fluidState s = pointState(gas, 1., {0., 0.}, 1.);

  // d(rho*u)/dy = 1 with uniform density & temperature
  Array<double,3> gradCv(1,2,4);
  gradCv(0,1,1) = 1.;
  matrix<double> gradT(1,2);

  Array<double,3> Fv = viscousFlux(s, gradCv, gradT, gas);

  double mu = .01;
  CHECK(Fv(0,0,0) == 0.);
  CHECK(Fv(0,1,1) == Approx(mu));
  CHECK(Fv(0,0,2) == Approx(mu));
  CHECK(Fv(0,0,1) == Approx(0.).margin(1e-14));
  CHECK(Fv(0,1,3) == Approx(0.).margin(1e-14));
}

TEST_CASE("Interior-face flux selection")
{
  gasModel gas = perfectGas(2,0);
  fluidState sL = pointState(gas, 1., {.5, 0.}, 1.);
  fluidState sR = pointState(gas, .5, {-.2, .1}, .4);
  matrix<double> norm = unitNormal(0., 1.);

  inviscidNumFlux fES = getInviscidNumFlux(RUSANOV, ENTROPY_STABLE);
  inviscidNumFlux fCen = getInviscidNumFlux(CENTRAL, WEAK_FORM);

  matrix<double> A = fES(sL, sR, gas, norm);
  matrix<double> B = entropyStableRusanovFlux(sL, sR, gas, norm);
  matrix<double> C = fCen(sL, sR, gas, norm);
  matrix<double> D = centralFlux(sL, sR, gas, norm);

  for (int k=0; k<4; k++) {
    CHECK(A(0,k) == B(0,k));
    CHECK(C(0,k) == D(0,k));
  }
}
