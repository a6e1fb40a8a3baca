/*!
 * \file test.solver.cpp
 * \brief Tests for the mesh connectivity & the residual assembly of the solver
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
#include "../include/input.hpp"
#include "../include/solver.hpp"

#include <cstdio>
#include <fstream>
#include <sstream>

#ifndef _NO_MPI
#include "mpi.h"
#endif

#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

namespace {

//! Input, mesh & solver of a small box case built from the given options
class simSetup
{
public:
  simSetup(const string &options)
  {
    static int count = 0;
    stringstream ss;
    ss << "estuary_solver_test_" << count++ << ".inp";
    fileName = ss.str();

    ofstream out(fileName.c_str());
    out << "nDims 2\niterMax 1\ndt 1e-3\n" << options;
    out.close();

    params.readInputFile(fileName.c_str());
    Geo.setup(&params);
    Solver.setup(&params, &Geo);
  }

  ~simSetup() { std::remove(fileName.c_str()); }

  //! Integral over the partition of each field of divF
  vector<double> integrateDivF(void)
  {
    const oper &op = Solver.opers[Solver.order];
    vector<double> sum(Solver.nFields, 0.);
    for (int spt=0; spt<Solver.nSpts; spt++)
      for (int e=0; e<Solver.nEles; e++)
        for (int k=0; k<Solver.nFields; k++)
          sum[k] += op.wts_spts[spt]*Geo.detJ*Solver.divF_spts[0](spt,e,k);
    return sum;
  }

  input params;
  geo Geo;
  solver Solver;

private:
  string fileName;
};

const string periodicBox =
    "xmin -1\nxmax 1\nymin -1\nymax 1\n";

const string uniformFlow =
    "icType 0\nrhoIC 1.\npIC .7142857142857143\nVIC 2 .3 .2\nRGas 1.\n";

const string pressurePulse =
    "icType 2\nrhoIC 1.\npIC .7142857142857143\nVIC 2 .3 .2\nRGas 1.\n"
    "pulseAmp .1\npulseWidth .3\n";

double maxAbs(const Array<double,3> &A)
{
  double val = 0;
  for (auto &a:A.data)
    val = std::max(val, std::abs(a));
  return val;
}

}

TEST_CASE("Box mesh connectivity")
{
  SECTION("Fully periodic") {
    simSetup sim(periodicBox + uniformFlow + "nx 4\nny 3\norder 1\n");
    geo &Geo = sim.Geo;

    CHECK(Geo.nEles == 12);
    CHECK(Geo.nIntFaces == 24);
    CHECK(Geo.nBndFaces == 0);
    CHECK(Geo.nMpiFaces == 0);
    CHECK(Geo.getBoundaryTags().empty());
    CHECK(Geo.h[0] == Approx(.5));
    CHECK(Geo.h[1] == Approx(2./3.));
    CHECK(Geo.detJ == Approx(.25*1./3.));
    CHECK(Geo.dA[0] == Approx(1./3.));
    CHECK(Geo.dA[1] == Approx(.25));
  }

  SECTION("Walls on the bottom & top") {
    simSetup sim(periodicBox + uniformFlow +
        "nx 4\nny 3\norder 1\ncreate_bcBottom wall\ncreate_bcTop wall\nmesh_bound wall slip_wall\n");
    geo &Geo = sim.Geo;

    CHECK(Geo.nIntFaces == 12 + 8);
    CHECK(Geo.nBndFaces == 8);
    REQUIRE(Geo.getBoundaryTags().size() == 1);
    CHECK(Geo.getBoundaryTags()[0] == "wall");

    for (auto &info:Geo.bndFaces) {
      CHECK(info.bndTag == "wall");
      CHECK(info.fL / 2 == 1);
    }
  }

  SECTION("Element positions") {
    simSetup sim(periodicBox + uniformFlow + "nx 4\nny 3\norder 1\n");
    point pos = sim.Geo.getPosition(5, point(-1.,1.,0.));
    CHECK(pos.x == Approx(-.5));
    CHECK(pos.y == Approx(1./3.));
  }
}

TEST_CASE("Uniform flow has zero residual")
{
  string base = periodicBox + uniformFlow + "nx 3\nny 4\norder 3\n";

  SECTION("Weak form, inviscid") {
    simSetup sim(base);
    sim.Solver.calcResidual(0);
    CHECK(maxAbs(sim.Solver.divF_spts[0]) < 1e-11);
  }

  SECTION("Weak form, overintegrated Navier-Stokes") {
    simSetup sim(base + "viscous 1\nquadOrder 5\nmuGas .01\n");
    sim.Solver.calcResidual(0);
    CHECK(maxAbs(sim.Solver.divF_spts[0]) < 1e-11);
  }

  SECTION("Entropy stable, Navier-Stokes with artificial viscosity") {
    simSetup sim(base + "operatorType 1\nviscous 1\nmuGas .01\nartVisc 1\n");
    sim.Solver.calcResidual(0);
    CHECK(maxAbs(sim.Solver.divF_spts[0]) < 1e-11);
  }

  SECTION("Fluid at rest between slip walls") {
    simSetup sim(periodicBox +
        "icType 0\nrhoIC 1.\npIC 1.\nVIC 2 0 0\nRGas 1.\nnx 3\nny 3\norder 2\n"
        "create_bcLeft wall\ncreate_bcRight wall\ncreate_bcBottom wall\ncreate_bcTop wall\n"
        "mesh_bound wall slip_wall\n");
    sim.Solver.calcResidual(0);
    CHECK(maxAbs(sim.Solver.divF_spts[0]) < 1e-11);
  }
}

TEST_CASE("Residual is conservative on a periodic domain")
{
  string base = periodicBox + pressurePulse + "nx 4\nny 4\norder 3\n";

  vector<string> variants = {
    "operatorType 0\n",
    "operatorType 0\nquadOrder 5\nriemannType 1\n",
    "operatorType 0\nviscous 1\nmuGas .01\nartVisc 1\navS0 -8\n",
    "operatorType 1\n",
    "operatorType 1\nviscous 1\nmuGas .01\n"
  };

  for (auto &opts:variants) {
    simSetup sim(base + opts);
    sim.Solver.calcResidual(0);

    // The pulse must actually produce a residual
    REQUIRE(maxAbs(sim.Solver.divF_spts[0]) > 1e-3);

    vector<double> sum = sim.integrateDivF();
    for (auto &val:sum)
      CHECK(val == Approx(0.).margin(1e-11));
  }
}

TEST_CASE("Entropy-stable & weak-form residuals converge together")
{
  auto difference = [](int nx) {
    stringstream ss;
    ss << "xmin -5\nxmax 5\nymin -5\nymax 5\nnx " << nx << "\nny " << nx << "\n"
       << "order 3\nicType 1\nvortexBeta 1.\nrhoIC 1.\npIC 1.\nVIC 2 1 0\nRGas 1.\n";

    simSetup weak(ss.str() + "operatorType 0\n");
    simSetup es(ss.str() + "operatorType 1\n");
    weak.Solver.calcResidual(0);
    es.Solver.calcResidual(0);

    const oper &op = weak.Solver.opers[weak.Solver.order];
    double err = 0;
    for (int spt=0; spt<weak.Solver.nSpts; spt++)
      for (int e=0; e<weak.Solver.nEles; e++)
        for (int k=0; k<weak.Solver.nFields; k++) {
          double d = weak.Solver.divF_spts[0](spt,e,k) - es.Solver.divF_spts[0](spt,e,k);
          err += op.wts_spts[spt]*weak.Geo.detJ*d*d;
        }

    return sqrt(err);
  };

  double err8 = difference(8);
  double err16 = difference(16);

  CHECK(err8 > 0.);
  CHECK(err16 < .5*err8);
}

TEST_CASE("Right-hand side evaluation")
{
  simSetup sim(periodicBox + pressurePulse + "nx 3\nny 3\norder 2\n");
  solver &Solver = sim.Solver;

  Array<double,3> USave = Solver.U_spts;

  // Evaluate at a perturbed state
  Array<double,3> U = Solver.U_spts;
  for (auto &val:U.data) val *= 1.01;

  Array<double,3> dUdt;
  Solver.rhs(.5, U, dUdt);

  SECTION("Stored solution is left untouched") {
    for (uint i=0; i<USave.data.size(); i++)
      CHECK(Solver.U_spts.data[i] == USave.data[i]);
  }

  SECTION("Equals the negative divergence of the given state") {
    Solver.U_spts = U;
    Solver.calcResidual(0);
    for (uint i=0; i<dUdt.data.size(); i++)
      CHECK(dUdt.data[i] == Approx(-Solver.divF_spts[0].data[i]).margin(1e-13));
  }
}

TEST_CASE("Time stepping conserves the integrals")
{
  vector<string> steppers = {"timeType 4\n", "timeType 3\nlimiter 1\nrhoMin 1e-10\n", "timeType 0\n"};

  for (auto &opts:steppers) {
    simSetup sim(periodicBox + pressurePulse + "nx 4\nny 4\norder 2\ndtType 1\nCFL .5\nmaxTime 1\n" + opts);
    solver &Solver = sim.Solver;

    vector<double> before = Solver.computeIntegrals();
    for (int i=0; i<3; i++)
      Solver.update();
    vector<double> after = Solver.computeIntegrals();

    CHECK(sim.params.dt > 0.);
    CHECK(sim.params.time > 2*sim.params.dt);
    CHECK(Solver.checkHealth());
    for (int k=0; k<Solver.nFields; k++)
      CHECK(after[k] == Approx(before[k]).epsilon(1e-12).margin(1e-12));
  }
}

TEST_CASE("Modal filter keeps the integrals & leaves uniform flow alone")
{
  SECTION("Pressure pulse") {
    simSetup sim(periodicBox + pressurePulse + "nx 3\nny 3\norder 4\nfilterFreq 1\nfilterCutoff 2\n");
    solver &Solver = sim.Solver;

    Array<double,3> USave = Solver.U_spts;
    vector<double> before = Solver.computeIntegrals();

    Solver.applyFilter();

    vector<double> after = Solver.computeIntegrals();
    for (int k=0; k<Solver.nFields; k++)
      CHECK(after[k] == Approx(before[k]).epsilon(1e-12).margin(1e-12));

    double change = 0;
    for (uint i=0; i<USave.data.size(); i++)
      change = std::max(change, std::abs(Solver.U_spts.data[i] - USave.data[i]));
    CHECK(change > 1e-8);
    CHECK(Solver.checkHealth());
  }

  SECTION("Uniform flow") {
    simSetup sim(periodicBox + uniformFlow + "nx 2\nny 2\norder 3\nfilterFreq 5\n");
    solver &Solver = sim.Solver;

    CHECK(sim.params.filterCutoff == 1);

    Array<double,3> USave = Solver.U_spts;
    Solver.applyFilter();
    for (uint i=0; i<USave.data.size(); i++)
      CHECK(Solver.U_spts.data[i] == Approx(USave.data[i]).margin(1e-13));
  }
}

TEST_CASE("Health check flags non-physical states")
{
  simSetup sim(periodicBox + uniformFlow + "nx 2\nny 2\norder 1\n");
  solver &Solver = sim.Solver;

  CHECK(Solver.checkHealth());

  Solver.U_spts(1,2,0) = -1.;
  CHECK_FALSE(Solver.checkHealth());

  Solver.U_spts(1,2,0) = 1.;
  Solver.U_spts(0,0,3) = NAN;
  CHECK_FALSE(Solver.checkHealth());
}

int main(int argc, char* argv[])
{
#ifndef _NO_MPI
  MPI_Init(&argc, &argv);
#endif

  int result = Catch::Session().run(argc, argv);

#ifndef _NO_MPI
  MPI_Finalize();
#endif

  return result;
}
