/*!
 * \file test.boundary.cpp
 * \brief Tests for the boundary-flux engine & the boundary-condition catalogue
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
#include "../include/boundary.hpp"
#include "../include/boundaryConditions.hpp"

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

namespace {

gasModel perfectGas(int nDims, int nSpecies, double R = 287.)
{
  gasModel gas;
  gas.eos = make_shared<idealSingleGas>(nDims, nSpecies, 1.4, R);
  gas.transport = make_shared<constantTransport>(1.8e-5, .72, 1e-5);
  return gas;
}

//! Three-point 2D state with varied velocity & temperature
fluidState sampleState(const gasModel &gas)
{
  double rho[3] = {1.2, .9, 1.5};
  double u[3] = {30., -80., 5.};
  double v[3] = {10., 40., -60.};
  double P[3] = {101325., 9e4, 1.2e5};

  conservedVars cv(3, 2, 0);
  for (int pt=0; pt<3; pt++) {
    cv.U(pt,0) = rho[pt];
    cv.U(pt,1) = rho[pt]*u[pt];
    cv.U(pt,2) = rho[pt]*v[pt];
    cv.U(pt,3) = P[pt]/.4 + .5*rho[pt]*(u[pt]*u[pt] + v[pt]*v[pt]);
  }

  return makeFluidState(cv, gas);
}

//! Unit normals at three points, one oblique
matrix<double> sampleNormals(void)
{
  matrix<double> norm(3,2);
  norm(0,0) = 1.;
  norm(1,1) = -1.;
  norm(2,0) = .6;
  norm(2,1) = .8;
  return norm;
}

bndContext makeContext(const gasModel &gas, const matrix<double> &norm)
{
  bndContext ctx;
  ctx.gas = &gas;
  ctx.norm = &norm;
  ctx.time = 0.;
  return ctx;
}

}

TEST_CASE("Default boundary copies the interior")
{
  gasModel gas = perfectGas(2,0);
  fluidState sM = sampleState(gas);
  matrix<double> norm = sampleNormals();
  bndContext ctx = makeContext(gas, norm);

  fluidBoundary bnd = dummyBoundary();
  CHECK(bnd.isDummy());
  CHECK(bnd.hasExteriorState());

  fluidState sP = bnd.exteriorState(sM, ctx);
  for (int pt=0; pt<3; pt++)
    for (int k=0; k<4; k++)
      CHECK(sP.cv.U(pt,k) == sM.cv.U(pt,k));

  SECTION("Inviscid flux equals the analytic flux") {
    matrix<double> Fn = bnd.inviscidDivergenceFlux(sM, ctx);
    matrix<double> Fexact = normalFlux(inviscidFlux(sM), norm);
    for (int pt=0; pt<3; pt++)
      for (int k=0; k<4; k++)
        CHECK(Fn(pt,k) == Approx(Fexact(pt,k)));
  }

  SECTION("Gradient fluxes use the interior values") {
    Array<double,3> Fcv = bnd.cvGradientFlux(sM, ctx);
    matrix<double> FT = bnd.temperatureGradientFlux(sM, ctx);
    for (int pt=0; pt<3; pt++) {
      for (int d=0; d<2; d++) {
        CHECK(Fcv(pt,d,0) == Approx(sM.cv.mass(pt)*norm(pt,d)));
        CHECK(FT(pt,d) == Approx(sM.temperature(pt)*norm(pt,d)));
      }
    }
  }

  SECTION("Zero-Neumann viscous flux equals the interior viscous flux") {
    Array<double,3> gradCv(3,2,4);
    matrix<double> gradT(3,2);
    for (int pt=0; pt<3; pt++) {
      gradCv(pt,0,1) = .1*(pt+1);
      gradCv(pt,1,2) = -.3;
      gradT(pt,0) = 2.;
    }

    matrix<double> Fv = bnd.viscousDivergenceFlux(sM, gradCv, gradT, ctx);
    matrix<double> Fexact = normalFlux(viscousFlux(sM, gradCv, gradT, gas), norm);
    for (int pt=0; pt<3; pt++)
      for (int k=0; k<4; k++)
        CHECK(Fv(pt,k) == Approx(Fexact(pt,k)));
  }
}

TEST_CASE("Boundary inviscid flux is consistent for every numerical flux")
{
  gasModel gas = perfectGas(2,0);
  fluidState sM = sampleState(gas);
  matrix<double> norm = sampleNormals();
  bndContext ctx = makeContext(gas, norm);

  matrix<double> Fexact = normalFlux(inviscidFlux(sM), norm);

  // Exterior state forced to the interior one, every other strategy taken from the boundary
  auto identity = [](const fluidState &s, const bndContext&) { return s; };

  vector<inviscidNumFlux> fluxes = {rusanovFlux, centralFlux, entropyStableRusanovFlux};
  for (auto &numFlux:fluxes) {
    boundaryFuncs funcs;
    funcs.bndState = identity;
    funcs.bndTemperature = [](const fluidState &s, const bndContext&) { return s.dv.T; };
    fluidBoundary bnd(funcs, "identity");

    matrix<double> Fn = bnd.inviscidDivergenceFlux(sM, ctx, numFlux);
    for (int pt=0; pt<3; pt++)
      for (int k=0; k<4; k++)
        CHECK(Fn(pt,k) == Approx(Fexact(pt,k)));
  }
}

TEST_CASE("Slip wall reflects the normal momentum")
{
  gasModel gas = perfectGas(2,0);
  fluidState sM = sampleState(gas);
  matrix<double> norm = sampleNormals();
  bndContext ctx = makeContext(gas, norm);

  vector<fluidBoundary> walls = {adiabaticSlipBoundary(), symmetryBoundary()};
  for (auto &bnd:walls) {
    fluidState sP = bnd.exteriorState(sM, ctx);

    for (int pt=0; pt<3; pt++) {
      double mnM = 0, mnP = 0;
      for (int d=0; d<2; d++) {
        mnM += sM.cv.momentum(pt,d)*norm(pt,d);
        mnP += sP.cv.momentum(pt,d)*norm(pt,d);
      }

      // Exact for the axis-aligned normals, round-off for the oblique one
      bool aligned = (norm(pt,0) == 0. || norm(pt,1) == 0.);
      for (int d=0; d<2; d++) {
        double tM = sM.cv.momentum(pt,d) - mnM*norm(pt,d);
        double tP = sP.cv.momentum(pt,d) - mnP*norm(pt,d);
        if (aligned)
          CHECK(tP == tM);
        else
          CHECK(tP == Approx(tM).margin(1e-12));
      }

      if (aligned)
        CHECK(mnP == -mnM);
      else
        CHECK(mnP == Approx(-mnM));

      CHECK(sP.cv.mass(pt) == sM.cv.mass(pt));
      CHECK(sP.cv.energy(pt) == sM.cv.energy(pt));
    }

    // No mass crosses the wall
    matrix<double> Fn = bnd.inviscidDivergenceFlux(sM, ctx, centralFlux);
    for (int pt=0; pt<3; pt++)
      CHECK(Fn(pt,0) == Approx(0.).margin(1e-10));
  }
}

TEST_CASE("Isothermal no-slip wall")
{
  gasModel gas = perfectGas(2,0);
  fluidState sM = sampleState(gas);
  matrix<double> norm = sampleNormals();
  bndContext ctx = makeContext(gas, norm);

  double TWall = 400.;
  fluidBoundary bnd = isothermalNoslipBoundary(TWall);

  vector<double> TP = bnd.exteriorTemperature(sM, ctx);
  matrix<double> FT = bnd.temperatureGradientFlux(sM, ctx);

  for (int pt=0; pt<3; pt++) {
    CHECK(TP[pt] == Approx(2*TWall - sM.temperature(pt)));

    // Centered flux gives exactly the wall temperature at the face
    CHECK(gradFluxCentral(sM.temperature(pt), TP[pt]) == Approx(TWall));
    for (int d=0; d<2; d++)
      CHECK(FT(pt,d) == Approx(TWall*norm(pt,d)));
  }

  fluidState sP = bnd.exteriorState(sM, ctx);
  for (int pt=0; pt<3; pt++) {
    CHECK(sP.cv.momentum(pt,0) == -sM.cv.momentum(pt,0));
    CHECK(sP.cv.momentum(pt,1) == -sM.cv.momentum(pt,1));
    CHECK(sP.temperature(pt) == Approx(TWall));
  }
}

TEST_CASE("Moving no-slip wall")
{
  gasModel gas = perfectGas(2,0);
  fluidState sM = sampleState(gas);
  matrix<double> norm = sampleNormals();
  bndContext ctx = makeContext(gas, norm);

  vector<double> vWall = {3., -1.};
  fluidBoundary bnd = adiabaticNoslipMovingBoundary(vWall, 2);
  fluidState sP = bnd.exteriorState(sM, ctx);

  for (int pt=0; pt<3; pt++) {
    // Average velocity at the face matches the wall
    for (int d=0; d<2; d++)
      CHECK(.5*(sM.cv.velocity(pt,d) + sP.cv.velocity(pt,d)) == Approx(vWall[d]));
    CHECK(bnd.exteriorTemperature(sM, ctx)[pt] == sM.temperature(pt));
  }
}

TEST_CASE("Outflow switches between the subsonic & supersonic energies")
{
  gasModel gas = perfectGas(1,0);
  double gam = 1.4;

  double PM = 101325.;
  double PB = 1.;
  double rho = 1.;
  double c = sqrt(gam*PM/rho);

  matrix<double> norm(1,1);
  norm(0,0) = 1.;
  bndContext ctx = makeContext(gas, norm);

  fluidBoundary bnd = outflowBoundary(PB);

  SECTION("Subsonic") {
    double u = 100.;
    conservedVars cv(1,1,0);
    cv.U(0,0) = rho;
    cv.U(0,1) = rho*u;
    cv.U(0,2) = PM/(gam-1.) + .5*rho*u*u;
    fluidState sM = makeFluidState(cv, gas);
    REQUIRE(u < c);

    fluidState sP = bnd.exteriorState(sM, ctx);
    double expected = (2*PB - PM)/(gam-1.) + .5*rho*u*u;
    CHECK(sP.cv.energy(0) == Approx(expected));
    CHECK(sP.cv.energy(0) == Approx(-253307.5 + 5000.));
    CHECK(sP.cv.mass(0) == rho);
    CHECK(sP.cv.momentum(0,0) == rho*u);
  }

  SECTION("Supersonic") {
    double u = 2*c;
    conservedVars cv(1,1,0);
    cv.U(0,0) = rho;
    cv.U(0,1) = rho*u;
    cv.U(0,2) = PM/(gam-1.) + .5*rho*u*u;
    fluidState sM = makeFluidState(cv, gas);

    fluidState sP = bnd.exteriorState(sM, ctx);
    CHECK(sP.cv.energy(0) == sM.cv.energy(0));
  }
}

TEST_CASE("Farfield ignores the interior state")
{
  gasModel gas = perfectGas(2,0);
  fluidState sM = sampleState(gas);
  matrix<double> norm = sampleNormals();
  bndContext ctx = makeContext(gas, norm);

  fluidBoundary bnd = farfieldBoundary(1e5, 300., {50., 0.}, vector<double>());
  fluidState sP = bnd.exteriorState(sM, ctx);

  double rhoInf = 1e5/(287.*300.);
  for (int pt=0; pt<3; pt++) {
    CHECK(sP.cv.mass(pt) == Approx(rhoInf));
    CHECK(sP.cv.velocity(pt,0) == Approx(50.));
    CHECK(sP.temperature(pt) == Approx(300.));
    CHECK(sP.pressure(pt) == Approx(1e5));
  }
}

TEST_CASE("Inflow reproduces a matching free stream")
{
  gasModel gas = perfectGas(2,0);

  bcParams bc;
  bc.tag = "inlet";
  bc.hasV = true;
  bc.VBound = {40., 0.};
  bc.hasP = true;
  bc.PBound = 1e5;
  bc.hasT = true;
  bc.TBound = 300.;
  REQUIRE(checkInflowParams(bc, 2, 0).empty());

  fluidState freeStream = inflowFreeStreamState(bc, gas, 2, 0);
  CHECK(freeStream.pressure(0) == Approx(1e5));
  CHECK(freeStream.temperature(0) == Approx(300.));

  fluidBoundary bnd = inflowBoundary(freeStream);

  // Interior at the free-stream state; the face normal points against the flow
  conservedVars cv(1,2,0);
  for (int k=0; k<4; k++)
    cv.U(0,k) = freeStream.cv.U(0,k);
  fluidState sM = makeFluidState(cv, gas);

  matrix<double> norm(1,2);
  norm(0,0) = -1.;
  bndContext ctx = makeContext(gas, norm);

  fluidState sP = bnd.exteriorState(sM, ctx);
  for (int k=0; k<4; k++)
    CHECK(sP.cv.U(0,k) == Approx(sM.cv.U(0,k)));
}

TEST_CASE("Inflow blends the Riemann invariants per node")
{
  gasModel gas = perfectGas(2,0);
  double gam = 1.4;
  double R = 287.;

  bcParams bc;
  bc.tag = "inlet";
  bc.hasV = true;
  bc.VBound = {40., 0.};
  bc.hasP = true;
  bc.PBound = 1e5;
  bc.hasT = true;
  bc.TBound = 300.;

  fluidBoundary bnd = inflowBoundary(inflowFreeStreamState(bc, gas, 2, 0));

  // Node 0: subsonic interior leaving through n = (-1,0)
  // Node 1: supersonic interior leaving through n = (1,0)
  double rho[2] = {1., 1.};
  double u[2] = {30., 500.};
  double v[2] = {5., 0.};
  double P[2] = {9e4, 9e4};

  conservedVars cv(2,2,0);
  for (int pt=0; pt<2; pt++) {
    cv.U(pt,0) = rho[pt];
    cv.U(pt,1) = rho[pt]*u[pt];
    cv.U(pt,2) = rho[pt]*v[pt];
    cv.U(pt,3) = P[pt]/(gam-1.) + .5*rho[pt]*(u[pt]*u[pt] + v[pt]*v[pt]);
  }
  fluidState sM = makeFluidState(cv, gas);

  matrix<double> norm(2,2);
  norm(0,0) = -1.;
  norm(1,0) = 1.;
  bndContext ctx = makeContext(gas, norm);

  REQUIRE(-u[0] < sM.soundSpeed(0));
  REQUIRE(u[1] > sM.soundSpeed(1));

  fluidState sP = bnd.exteriorState(sM, ctx);
  vector<double> TP = bnd.exteriorTemperature(sM, ctx);

  double rhoInf = 1e5/(R*300.);
  double cInf = sqrt(gam*R*300.);

  SECTION("Subsonic node takes R+ from the interior") {
    double cM = sqrt(gam*P[0]/rho[0]);
    double rPlus = -u[0] + 2*cM/(gam-1.);
    double rMinus = -40. - 2*cInf/(gam-1.);
    double vnB = .5*(rPlus + rMinus);
    double cB = .25*(gam-1.)*(rPlus - rMinus);
    double rhoB = rhoInf*pow(cB/cInf, 2./(gam-1.));
    double pB = rhoB*cB*cB/gam;

    CHECK(vnB == Approx(-15.559806269664705));
    CHECK(cB == Approx(352.0767482399099));
    CHECK(rhoB == Approx(1.245534045291024));
    CHECK(pB == Approx(110281.39631177735));

    CHECK(sP.cv.mass(0) == Approx(rhoB));
    CHECK(sP.cv.velocity(0,0) == Approx(-vnB));
    CHECK(sP.cv.velocity(0,1) == Approx(0.).margin(1e-12));
    CHECK(sP.pressure(0) == Approx(pB));
    CHECK(sP.soundSpeed(0) == Approx(cB));
    CHECK(TP[0] == Approx(pB/(rhoB*R)));
    CHECK(TP[0] == Approx(308.50681097856864));
  }

  SECTION("Supersonic node returns the free stream") {
    CHECK(sP.cv.mass(1) == Approx(rhoInf));
    CHECK(sP.cv.velocity(1,0) == Approx(40.));
    CHECK(sP.cv.velocity(1,1) == Approx(0.).margin(1e-12));
    CHECK(sP.pressure(1) == Approx(1e5));
    CHECK(TP[1] == Approx(300.));
  }
}

TEST_CASE("Viscous walls use separate advective & diffusive states")
{
  gasModel gas = perfectGas(2,0);
  fluidState sM = sampleState(gas);
  matrix<double> norm = sampleNormals();
  bndContext ctx = makeContext(gas, norm);

  Array<double,3> gradCv(3,2,4);
  matrix<double> gradT(3,2);
  for (int pt=0; pt<3; pt++) {
    gradT(pt,0) = 5.;
    gradT(pt,1) = -2.;
  }

  SECTION("Isothermal wall") {
    double TWall = 350.;
    fluidBoundary bnd = isothermalWallBoundary(TWall);

    // Advective state: mirrored momentum
    matrix<double> Fn = bnd.inviscidDivergenceFlux(sM, ctx);
    for (int pt=0; pt<3; pt++)
      CHECK(Fn(pt,0) == Approx(0.).margin(1e-10));

    // Diffusive state: zero velocity at the wall temperature
    fluidState sP = bnd.exteriorState(sM, ctx);
    for (int pt=0; pt<3; pt++) {
      CHECK(sP.cv.momentum(pt,0) == 0.);
      CHECK(sP.cv.momentum(pt,1) == 0.);
      CHECK(sP.temperature(pt) == Approx(TWall));
    }

    // No mass diffusion & no work at the wall: energy flux is heat conduction only
    matrix<double> Fv = bnd.viscousDivergenceFlux(sM, gradCv, gradT, ctx);
    for (int pt=0; pt<3; pt++) {
      CHECK(Fv(pt,0) == 0.);
      double kappa = sP.dv.kappa[pt];
      double qn = kappa*(gradT(pt,0)*norm(pt,0) + gradT(pt,1)*norm(pt,1));
      CHECK(Fv(pt,3) == Approx(qn));
    }
  }

  SECTION("Adiabatic wall drops the normal heat flux") {
    fluidBoundary bnd = adiabaticNoslipWallBoundary();
    matrix<double> Fv = bnd.viscousDivergenceFlux(sM, gradCv, gradT, ctx);
    for (int pt=0; pt<3; pt++)
      CHECK(Fv(pt,3) == Approx(0.).margin(1e-12));
  }
}

TEST_CASE("No shear stress, work or heat crosses a symmetry plane")
{
  gasModel gas = perfectGas(2,0);
  double mu = 1.8e-5;

  // u = 10 sheared normal to the plane, with density & temperature gradients
  conservedVars cv(2,2,0);
  for (int pt=0; pt<2; pt++) {
    cv.U(pt,0) = 1.2;
    cv.U(pt,1) = 1.2*10.;
    cv.U(pt,2) = 0.;
    cv.U(pt,3) = 1e5/.4 + .5*1.2*100.;
  }
  fluidState sM = makeFluidState(cv, gas);

  matrix<double> norm(2,2);
  norm(0,1) = 1.;
  norm(1,0) = .6;
  norm(1,1) = .8;
  bndContext ctx = makeContext(gas, norm);

  // du/dy = 5, dv/dx = 3, dv/dy = 2, drho/dy = .2
  Array<double,3> gradCv(2,2,4);
  matrix<double> gradT(2,2);
  for (int pt=0; pt<2; pt++) {
    gradCv(pt,1,0) = .2;
    gradCv(pt,1,1) = 1.2*5. + 10.*.2;
    gradCv(pt,0,2) = 1.2*3.;
    gradCv(pt,1,2) = 1.2*2.;
    gradT(pt,0) = 4.;
    gradT(pt,1) = -7.;
  }

  // The interior stress does carry shear through the plane
  matrix<double> FvM = normalFlux(viscousFlux(sM, gradCv, gradT, gas), norm);
  REQUIRE(std::abs(FvM(0,1)) > 1e-5);

  fluidBoundary bnd = symmetryBoundary();
  matrix<double> Fv = bnd.viscousDivergenceFlux(sM, gradCv, gradT, ctx);

  SECTION("Axis-aligned plane") {
    CHECK(Fv(0,0) == 0.);
    CHECK(Fv(0,1) == Approx(0.).margin(1e-14));
    CHECK(Fv(0,3) == Approx(0.).margin(1e-14));

    // Normal stress from dv/dy survives
    CHECK(Fv(0,2) == Approx(mu*(2*2. - 2./3.*2.)));
  }

  SECTION("Oblique plane") {
    double tx = -norm(1,1);
    double ty = norm(1,0);
    CHECK(Fv(1,1)*tx + Fv(1,2)*ty == Approx(0.).margin(1e-12));
    CHECK(Fv(1,3) == Approx(0.).margin(1e-12));
  }
}

TEST_CASE("Boundary without an exterior state fails only when one is needed")
{
  boundaryFuncs funcs;
  funcs.inviscidFlux = [](const fluidState &sM, const bndContext &ctx, const inviscidNumFlux&) {
    return normalFlux(inviscidFlux(sM), *ctx.norm);
  };

  fluidBoundary bnd(funcs, "flux_only");
  CHECK_FALSE(bnd.hasExteriorState());
  CHECK_FALSE(bnd.isDummy());

  gasModel gas = perfectGas(2,0);
  fluidState sM = sampleState(gas);
  matrix<double> norm = sampleNormals();
  bndContext ctx = makeContext(gas, norm);

  matrix<double> Fn = bnd.inviscidDivergenceFlux(sM, ctx);
  CHECK(Fn(0,1) == Approx(sM.cv.momentum(0,0)*sM.cv.velocity(0,0) + sM.pressure(0)));
}

TEST_CASE("Configuration checks")
{
  bcParams bc;
  bc.tag = "far";

  SECTION("Farfield velocity dimension") {
    bc.hasV = true;
    bc.VBound = {1., 2., 3.};
    CHECK_FALSE(checkFarfieldParams(bc, 2, 0).empty());
    bc.VBound = {1., 2.};
    CHECK(checkFarfieldParams(bc, 2, 0).empty());
  }

  SECTION("Species mass fractions required for mixtures") {
    CHECK_FALSE(checkFarfieldParams(bc, 2, 2).empty());
    bc.hasY = true;
    bc.YBound = {.5};
    CHECK_FALSE(checkFarfieldParams(bc, 2, 2).empty());
    bc.YBound = {.5, .5};
    CHECK(checkFarfieldParams(bc, 2, 2).empty());
  }

  SECTION("Inflow needs a velocity & two thermodynamic values") {
    bc.hasV = true;
    bc.VBound = {1., 0.};
    bc.hasP = true;
    CHECK_FALSE(checkInflowParams(bc, 2, 0).empty());
    bc.hasRho = true;
    CHECK(checkInflowParams(bc, 2, 0).empty());
  }

  SECTION("Moving wall velocity dimension") {
    bc.VWall = {1.};
    CHECK_FALSE(checkMovingWallParams(bc, 2).empty());
    bc.VWall = {1., 0.};
    CHECK(checkMovingWallParams(bc, 2).empty());
  }
}

TEST_CASE("Boundaries are created from the input parameters")
{
  gasModel gas = perfectGas(2,0);

  bcParams bc;
  bc.tag = "wall";
  bc.bcName = "symmetry";
  bc.bcType = SYMMETRY;
  CHECK(createBoundary(bc, gas, 2, 0).getName() == "symmetry");

  bc.bcType = SUB_OUT;
  bc.PBound = 1e5;
  CHECK(createBoundary(bc, gas, 2, 0).getName() == "outflow");

  bc.bcType = FARFIELD;
  bc.TBound = 300.;
  bc.hasV = false;
  CHECK(createBoundary(bc, gas, 2, 0).getName() == "farfield");
}
