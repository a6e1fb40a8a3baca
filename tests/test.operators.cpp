/*!
 * \file test.operators.cpp
 * \brief Tests for the tensor-product DG operators on the reference element
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
#include "../include/operators.hpp"
#include "../include/polynomials.hpp"

#include <limits>

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

TEST_CASE("Point & weight layout")
{
  oper op;

  SECTION("Quads without overintegration") {
    op.setupOperators(2, 3, 3);
    CHECK_FALSE(op.overInt);
    CHECK(op.nSpts == 16);
    CHECK(op.nQpts == 16);
    CHECK(op.nFptsPerFace == 4);
    CHECK(op.nFpts == 16);
  }

  SECTION("Hexes with overintegration") {
    op.setupOperators(3, 2, 4);
    CHECK(op.overInt);
    CHECK(op.nSpts == 27);
    CHECK(op.nQpts == 125);
    CHECK(op.nFptsPerFace == 25);
    CHECK(op.nFpts == 150);
  }

  double sumAvg = 0;
  for (auto w:op.getAvgWeights()) sumAvg += w;
  CHECK(sumAvg == Approx(1.));

  double sumQ = 0;
  for (auto w:op.wts_qpts) sumQ += w;
  CHECK(sumQ == Approx(pow(2.,op.nDims)));

  // Each face carries the full face area
  for (int f=0; f<op.nFaces; f++) {
    double area = 0;
    for (int i=0; i<op.nFptsPerFace; i++)
      area += op.wts_fpts[f*op.nFptsPerFace+i];
    CHECK(area == Approx(pow(2.,op.nDims-1)));
  }
}

TEST_CASE("Flux-point helpers")
{
  oper op;
  op.setupOperators(2, 2, 2);

  for (int fpt=0; fpt<op.nFpts; fpt++) {
    int f = op.fptFace(fpt);
    CHECK(op.fptDim(fpt) == f/2);
    CHECK(op.loc_fpts[fpt][op.fptDim(fpt)] == op.fptSign(fpt));
  }

  CHECK(op.sptStride(0) == 1);
  CHECK(op.sptStride(1) == 3);
  CHECK(op.sptIndex1D(5,0) == 2);
  CHECK(op.sptIndex1D(5,1) == 1);

  // Lobatto points include the element ends
  CHECK(op.loc_spts1D.front() == Approx(-1.));
  CHECK(op.loc_spts1D.back() == Approx(1.));
}

TEST_CASE("Extrapolation & interpolation reproduce polynomials")
{
  oper op;
  op.setupOperators(2, 3, 5);

  // f = x^3 - 2xy + y^2, degree <= 3 in each direction
  auto f = [](const point &pt) { return pt.x*pt.x*pt.x - 2*pt.x*pt.y + pt.y*pt.y; };

  vector<double> u(op.nSpts);
  for (int spt=0; spt<op.nSpts; spt++)
    u[spt] = f(op.loc_spts[spt]);

  vector<double> uf(op.nFpts), uq(op.nQpts);
  op.applySptsFpts(u.data(), uf.data(), 1);
  op.applySptsQpts(u.data(), uq.data(), 1);

  for (int fpt=0; fpt<op.nFpts; fpt++)
    CHECK(uf[fpt] == Approx(f(op.loc_fpts[fpt])).margin(1e-12));

  for (int qpt=0; qpt<op.nQpts; qpt++)
    CHECK(uq[qpt] == Approx(f(op.loc_qpts[qpt])).margin(1e-12));
}

TEST_CASE("Weak divergence plus lift gives the exact derivative")
{
  oper op;
  int order = 4;
  op.setupOperators(2, order, order);

  // F_x = x^2 y, F_y = y^3:  div F = 2xy + 3y^2
  vector<double> Fx(op.nQpts), Fy(op.nQpts);
  for (int qpt=0; qpt<op.nQpts; qpt++) {
    const point &pt = op.loc_qpts[qpt];
    Fx[qpt] = pt.x*pt.x*pt.y;
    Fy[qpt] = pt.y*pt.y*pt.y;
  }

  vector<double> Fn(op.nFpts);
  for (int fpt=0; fpt<op.nFpts; fpt++) {
    const point &pt = op.loc_fpts[fpt];
    double F = (op.fptDim(fpt) == 0) ? pt.x*pt.x*pt.y : pt.y*pt.y*pt.y;
    Fn[fpt] = F*op.fptSign(fpt);
  }

  vector<double> div(op.nSpts);
  op.applyWeakDiv(0, Fx.data(), div.data(), 1, -1., 0.);
  op.applyWeakDiv(1, Fy.data(), div.data(), 1, -1., 1.);
  op.applyLift(Fn.data(), div.data(), 1, 1., 1.);

  for (int spt=0; spt<op.nSpts; spt++) {
    const point &pt = op.loc_spts[spt];
    CHECK(div[spt] == Approx(2*pt.x*pt.y + 3*pt.y*pt.y).margin(1e-10));
  }
}

TEST_CASE("Overintegrated divergence of a constant flux vanishes")
{
  oper op;
  op.setupOperators(3, 2, 4);

  vector<double> F(op.nQpts, 1.7);
  vector<double> Fn(op.nFpts);
  for (int fpt=0; fpt<op.nFpts; fpt++)
    Fn[fpt] = (op.fptDim(fpt) == 1) ? 1.7*op.fptSign(fpt) : 0.;

  vector<double> div(op.nSpts);
  op.applyWeakDiv(1, F.data(), div.data(), 1, -1., 0.);
  op.applyLift(Fn.data(), div.data(), 1, 1., 1.);

  for (int spt=0; spt<op.nSpts; spt++)
    CHECK(div[spt] == Approx(0.).margin(1e-11));
}

TEST_CASE("Differentiation matrix on the solution points")
{
  oper op;
  op.setupOperators(2, 3, 3);

  // Rows of D annihilate constants & differentiate x^3 exactly
  for (int i=0; i<op.nSpts1D; i++) {
    double sum = 0, d3 = 0;
    for (int j=0; j<op.nSpts1D; j++) {
      double xj = op.loc_spts1D[j];
      sum += op.opp_D1D(i,j);
      d3 += op.opp_D1D(i,j)*xj*xj*xj;
    }
    double xi = op.loc_spts1D[i];
    CHECK(sum == Approx(0.).margin(1e-12));
    CHECK(d3 == Approx(3*xi*xi));
  }
}

TEST_CASE("Modal decomposition")
{
  oper op;
  op.setupOperators(2, 3, 3);

  vector<double> u(op.nSpts, 2.), modes(op.nSpts);
  op.applyInvVandermonde(u.data(), modes.data(), 1);

  CHECK(modes[0] != Approx(0.));
  for (int mode=1; mode<op.nSpts; mode++)
    CHECK(modes[mode] == Approx(0.).margin(1e-12));

  CHECK_FALSE(op.isHighMode(0));
  CHECK(op.isHighMode(3));
  CHECK(op.isHighMode(12));
  CHECK(op.isHighMode(15));
  CHECK_FALSE(op.isHighMode(5));
}

TEST_CASE("Exponential filter coefficients at the band limits")
{
  double alpha = -log(std::numeric_limits<double>::epsilon());

  for (int order=2; order<=4; order++) {
    for (int filterOrder=1; filterOrder<=3; filterOrder++) {
      oper op;
      op.setupOperators(2, order, order);

      int cutoff = order/2;
      op.setupFilter(cutoff, filterOrder, alpha);

      const vector<double> &coeffs = op.getFilterCoeffs();
      REQUIRE((int)coeffs.size() == op.nSpts);

      for (int mode=0; mode<op.nSpts; mode++) {
        int m = op.modeOrder(mode);
        if (m <= cutoff)
          CHECK(coeffs[mode] == 1.);
        if (m == order)
          CHECK(coeffs[mode] == exp(-alpha));
        if (m > cutoff && m < order) {
          CHECK(coeffs[mode] < 1.);
          CHECK(coeffs[mode] > exp(-alpha));
        }
      }
    }
  }
}

TEST_CASE("Modal filter attenuates only the modes above the cutoff")
{
  int order = 6;
  int cutoff = 3;
  int filterOrder = 2;
  double alpha = -log(std::numeric_limits<double>::epsilon());

  oper op;
  op.setupOperators(2, order, order);
  op.setupFilter(cutoff, filterOrder, alpha);

  CHECK(op.modeOrder(0) == 0);
  CHECK(op.modeOrder(3) == 3);
  CHECK(op.modeOrder(2 + 7*5) == 5);

  // Field with power 1/(m+1) in every mode
  vector<double> c(op.nSpts);
  for (int mode=0; mode<op.nSpts; mode++)
    c[mode] = 1./(op.modeOrder(mode)+1);

  vector<double> u(op.nSpts, 0.);
  for (int spt=0; spt<op.nSpts; spt++) {
    for (int mode=0; mode<op.nSpts; mode++) {
      int ind[3] = {op.sptIndex1D(mode,0), op.sptIndex1D(mode,1), 0};
      u[spt] += c[mode]*orthLegendreND(op.loc_spts[spt],ind,2);
    }
  }

  vector<double> uf(op.nSpts), modes(op.nSpts);
  op.applyFilter(u.data(), uf.data(), 1);
  op.applyInvVandermonde(uf.data(), modes.data(), 1);

  for (int mode=0; mode<op.nSpts; mode++) {
    int m = op.modeOrder(mode);
    double expected = c[mode]*exponentialModeResponse(m, cutoff, order-cutoff, filterOrder, alpha);
    CHECK(modes[mode] == Approx(expected).margin(1e-10));
    if (m <= cutoff)
      CHECK(modes[mode] == Approx(c[mode]));
  }

  // The element mean is untouched
  double avg = 0, avgF = 0;
  const vector<double> &wts = op.getAvgWeights();
  for (int spt=0; spt<op.nSpts; spt++) {
    avg += wts[spt]*u[spt];
    avgF += wts[spt]*uf[spt];
  }
  CHECK(avgF == Approx(avg));
}
