/*!
 * \file matrix.hpp
 * \brief Header file for the multidimensional Array and matrix classes
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

#include <iostream>
#include <vector>

#include "error.hpp"

using namespace std;

typedef unsigned int uint;

/*!
 * \brief Dense array of up to 4 dimensions with row-major storage
 *
 * Element (i,j,k,l) is stored at data[l+dims[3]*(k+dims[2]*(j+dims[1]*i))],
 * so any trailing set of dimensions can be handed to BLAS as one contiguous
 * block.  Bounds checking is enabled with _DEBUG.
 */
template <typename T, uint N>
class Array
{
public:
  Array();

  //! Allocate & zero-fill an Array of the given dimensions
  Array(uint inDim0, uint inDim1=1, uint inDim2=1, uint inDim3=1);

  Array(const Array<T,N>& inArray);

  Array<T,N>& operator=(const Array<T,N>& inArray);

  //! Re-allocate to the given dimensions, zero-filling all entries
  void setup(uint inDim0, uint inDim1=1, uint inDim2=1, uint inDim3=1);

  void initializeToValue(const T &_val);

  uint getDim0(void) const {return dims[0];}
  uint getDim1(void) const {return dims[1];}
  uint getDim(int i) const {return dims[i];}

  //! Total number of entries
  uint getSize(void) const {return data.size();}

  T &operator()(int i, int j=0, int k=0, int l=0);

  T operator()(int i, int j=0, int k=0, int l=0) const;

  //! Pointer to the first entry of row i (all trailing dimensions)
  T* operator[](int i);

  const T* operator[](int i) const;

  //! Pointer to the first entry, for BLAS calls & MPI buffers
  T* getData(void) {return data.data();}

  const T* getData(void) const {return data.data();}

  uint dims[4];  //! Dimensions of the Array

  vector<T> data;

protected:
  //! Abort with the offending index when _DEBUG bounds checking fails
  void checkBounds(int i, int j, int k, int l) const;
};

/*! Row-major 2D Array, used for point-by-point state data and the small
 *  dense reference-element operators */
template <typename T>
class matrix : public Array<T,2>
{
public:
  matrix() : Array<T,2>(0,0) {}

  matrix(uint inDim0, uint inDim1) : Array<T,2>(inDim0,inDim1) {}

  T &operator()(int i, int j=0);

  T operator()(int i, int j=0) const;

  //! Entry-wise M += A; A must match in size
  matrix<T>& operator+=(const matrix<T> &A);

  //! Entry-wise M -= A; A must match in size
  matrix<T>& operator-=(const matrix<T> &A);

  matrix<T>& operator*=(T a);

  /*! Inverse of a square matrix by Gauss-Jordan elimination with partial
   *  pivoting; only meant for the reference-element operators */
  matrix<T> invertMatrix(void) const;
};
