/*!
 * \file test.input.cpp
 * \brief Tests for reading simulation parameters from an input file
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

#include <cstdio>
#include <fstream>

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

namespace {

//! Write the given text to a scratch input file & return its name
string writeInput(const string &name, const string &text)
{
  string fileName = "estuary_test_" + name + ".inp";
  ofstream out(fileName.c_str());
  out << text;
  out.close();
  return fileName;
}

}

TEST_CASE("Scalar & vector options with defaults")
{
  string fName = writeInput("basic",
      "# Comment lines are skipped\n"
      "nDims     2\n"
      "order     4\n"
      "iterMax   20\n"
      "dt        1e-3\n"
      "VIC       2  .5 .25\n"
      "riemannType 1\n");

  input params;
  params.readInputFile(fName.c_str());

  CHECK(params.nDims == 2);
  CHECK(params.order == 4);
  CHECK(params.quadOrder == 4);
  CHECK(params.nSpecies == 0);
  CHECK(params.nFields == 4);
  CHECK(params.riemannType == CENTRAL);
  CHECK(params.operatorType == WEAK_FORM);
  CHECK(params.dt == Approx(1e-3));
  CHECK(params.maxTime == Approx(20*1e-3));
  REQUIRE(params.VIC.size() == 2);
  CHECK(params.VIC[0] == Approx(.5));
  CHECK(params.VIC[1] == Approx(.25));
  CHECK(params.gamma == Approx(1.4));
  CHECK(params.pIC == Approx(1./1.4));
  CHECK(params.dataFileName == "simData");

  // 2D runs are a single layer of cells
  CHECK(params.nz == 1);

  std::remove(fName.c_str());
}

TEST_CASE("Runge-Kutta tables")
{
  SECTION("Classical RK4") {
    string fName = writeInput("rk4", "nDims 2\niterMax 1\ndt .1\ntimeType 4\n");
    input params;
    params.readInputFile(fName.c_str());

    REQUIRE(params.nRKSteps == 4);
    double sumB = 0;
    for (auto b:params.RKb) sumB += b;
    CHECK(sumB == Approx(1.));
    CHECK(params.RKa[1] == Approx(.5));
    CHECK(params.RKa[3] == Approx(1.));
    std::remove(fName.c_str());
  }

  SECTION("SSP-RK3 stage times") {
    string fName = writeInput("ssprk3", "nDims 2\niterMax 1\ndt .1\ntimeType 3\n");
    input params;
    params.readInputFile(fName.c_str());

    REQUIRE(params.nRKSteps == 3);
    CHECK(params.RKa[0] == Approx(0.));
    CHECK(params.RKa[1] == Approx(1.));
    CHECK(params.RKa[2] == Approx(.5));
    std::remove(fName.c_str());
  }

  SECTION("Forward Euler") {
    string fName = writeInput("euler", "nDims 2\niterMax 1\ndt .1\ntimeType 0\n");
    input params;
    params.readInputFile(fName.c_str());

    REQUIRE(params.nRKSteps == 1);
    CHECK(params.RKb[0] == Approx(1.));
    std::remove(fName.c_str());
  }
}

TEST_CASE("Boundary parameters are read per mesh tag")
{
  string fName = writeInput("bcs",
      "nDims 2\n"
      "iterMax 1\n"
      "dt .1\n"
      "create_bcLeft   Inlet\n"
      "create_bcRight  Outlet\n"
      "create_bcBottom Wall\n"
      "create_bcTop    Wall\n"
      "mesh_bound  inlet   Inflow\n"
      "mesh_bound  outlet  outflow\n"
      "mesh_bound  wall    isothermal_noslip\n"
      "inlet_VBound   2  100 0\n"
      "inlet_PBound   2e5\n"
      "inlet_TBound   350\n"
      "outlet_PBound  1e5\n"
      "wall_TWall     500\n");

  input params;
  params.readInputFile(fName.c_str());

  CHECK(params.create_bcLeft == "inlet");
  CHECK(params.create_bcTop == "wall");

  REQUIRE(params.meshBounds.size() == 3);
  CHECK(params.meshBounds["inlet"] == "inflow");

  REQUIRE(params.bcs.count("inlet"));
  const bcParams &inlet = params.bcs["inlet"];
  CHECK(inlet.bcType == SUB_IN);
  CHECK(inlet.hasV);
  CHECK(inlet.hasP);
  CHECK(inlet.hasT);
  CHECK_FALSE(inlet.hasRho);
  CHECK_FALSE(inlet.hasY);
  REQUIRE(inlet.VBound.size() == 2);
  CHECK(inlet.VBound[0] == Approx(100.));
  CHECK(inlet.PBound == Approx(2e5));
  CHECK(inlet.TBound == Approx(350.));

  const bcParams &outlet = params.bcs["outlet"];
  CHECK(outlet.bcType == SUB_OUT);
  CHECK(outlet.PBound == Approx(1e5));
  CHECK_FALSE(outlet.hasV);

  const bcParams &wall = params.bcs["wall"];
  CHECK(wall.bcType == ISOTHERMAL_NOSLIP);
  CHECK(wall.TWall == Approx(500.));
  REQUIRE(wall.VWall.size() == 2);
  CHECK(wall.VWall[0] == 0.);

  std::remove(fName.c_str());
}

TEST_CASE("Option lookup")
{
  string fName = writeInput("lookup", "nDims 3\n  mesh_bound a b\n");

  fileReader opts(fName);
  CHECK(opts.isOption("nDims"));
  CHECK(opts.isOption("mesh_bound"));
  CHECK_FALSE(opts.isOption("nDim"));
  CHECK_FALSE(opts.isOption("a"));

  std::remove(fName.c_str());
}
