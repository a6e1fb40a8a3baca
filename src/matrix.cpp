/*!
 * \file matrix.cpp
 * \brief Class definitions for the multidimensional Array and matrix classes
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
#include "../include/matrix.hpp"

#include <algorithm>
#include <cmath>

template<typename T, uint N>
Array<T,N>::Array()
{
  dims[0] = dims[1] = dims[2] = dims[3] = 0;
}

template<typename T, uint N>
Array<T,N>::Array(uint inDim0, uint inDim1, uint inDim2, uint inDim3)
{
  setup(inDim0, inDim1, inDim2, inDim3);
}

template<typename T, uint N>
Array<T,N>::Array(const Array<T,N> &inArray)
  : data(inArray.data)
{
  for (int i=0; i<4; i++)
    dims[i] = inArray.dims[i];
}

template<typename T, uint N>
Array<T,N>& Array<T,N>::operator=(const Array<T,N> &inArray)
{
  if (this == &inArray) return *this;

  data = inArray.data;
  for (int i=0; i<4; i++)
    dims[i] = inArray.dims[i];

  return *this;
}

template<typename T, uint N>
void Array<T,N>::setup(uint inDim0, uint inDim1, uint inDim2, uint inDim3)
{
  dims[0] = inDim0;
  dims[1] = inDim1;
  dims[2] = inDim2;
  dims[3] = inDim3;

  data.assign(inDim0*inDim1*inDim2*inDim3, T());
}

template<typename T, uint N>
void Array<T,N>::initializeToValue(const T &_val)
{
  std::fill(data.begin(), data.end(), _val);
}

template<typename T, uint N>
void Array<T,N>::checkBounds(int i, int j, int k, int l) const
{
  int ind[4] = {i,j,k,l};
  for (int n=0; n<4; n++) {
    if (ind[n] < 0 || ind[n] >= (int)dims[n]) {
      cout << "Index " << n << " = " << ind[n] << ", dims = [" << dims[0] << "," << dims[1]
           << "," << dims[2] << "," << dims[3] << "]" << endl;
      FatalErrorST("Attempted out-of-bounds access in Array.");
    }
  }
}

template<typename T, uint N>
T& Array<T,N>::operator()(int i, int j, int k, int l)
{
#ifdef _DEBUG
  checkBounds(i,j,k,l);
#endif
  return data[l+dims[3]*(k+dims[2]*(j+dims[1]*i))];
}

template<typename T, uint N>
T Array<T,N>::operator()(int i, int j, int k, int l) const
{
#ifdef _DEBUG
  checkBounds(i,j,k,l);
#endif
  return data[l+dims[3]*(k+dims[2]*(j+dims[1]*i))];
}

template<typename T, uint N>
T* Array<T,N>::operator[](int i)
{
#ifdef _DEBUG
  checkBounds(i,0,0,0);
#endif
  return &data[i*dims[1]*dims[2]*dims[3]];
}

template<typename T, uint N>
const T* Array<T,N>::operator[](int i) const
{
#ifdef _DEBUG
  checkBounds(i,0,0,0);
#endif
  return &data[i*dims[1]*dims[2]*dims[3]];
}

template<typename T>
T& matrix<T>::operator()(int i, int j)
{
#ifdef _DEBUG
  this->checkBounds(i,j,0,0);
#endif
  return this->data[j+this->dims[1]*i];
}

template<typename T>
T matrix<T>::operator()(int i, int j) const
{
#ifdef _DEBUG
  this->checkBounds(i,j,0,0);
#endif
  return this->data[j+this->dims[1]*i];
}

template<typename T>
matrix<T>& matrix<T>::operator+=(const matrix<T> &A)
{
  if (A.dims[0] != this->dims[0] || A.dims[1] != this->dims[1])
    FatalErrorST("Incompatible matrix sizes in +=.");

  for (uint i=0; i<this->data.size(); i++)
    this->data[i] += A.data[i];

  return *this;
}

template<typename T>
matrix<T>& matrix<T>::operator-=(const matrix<T> &A)
{
  if (A.dims[0] != this->dims[0] || A.dims[1] != this->dims[1])
    FatalErrorST("Incompatible matrix sizes in -=.");

  for (uint i=0; i<this->data.size(); i++)
    this->data[i] -= A.data[i];

  return *this;
}

template<typename T>
matrix<T>& matrix<T>::operator*=(T a)
{
  for (auto &val:this->data)
    val *= a;

  return *this;
}

template<typename T>
matrix<T> matrix<T>::invertMatrix(void) const
{
  if (this->dims[0] != this->dims[1])
    FatalErrorST("Can only obtain inverse of a square matrix.");

  int n = this->dims[0];

  // Augmented system [A | I] reduced in place to [I | inv(A)]
  matrix<double> A(n,2*n);
  for (int i=0; i<n; i++) {
    for (int j=0; j<n; j++)
      A(i,j) = (*this)(i,j);
    A(i,n+i) = 1.;
  }

  for (int col=0; col<n; col++) {
    int pivot = col;
    for (int i=col+1; i<n; i++)
      if (std::abs(A(i,col)) > std::abs(A(pivot,col)))
        pivot = i;

    if (A(pivot,col) == 0.)
      FatalErrorST("invertMatrix: matrix is singular.");

    if (pivot != col)
      for (int j=0; j<2*n; j++)
        std::swap(A(pivot,j), A(col,j));

    double scale = 1./A(col,col);
    for (int j=0; j<2*n; j++)
      A(col,j) *= scale;

    for (int i=0; i<n; i++) {
      if (i == col || A(i,col) == 0.) continue;
      double fac = A(i,col);
      for (int j=0; j<2*n; j++)
        A(i,j) -= fac*A(col,j);
    }
  }

  matrix<T> inv(n,n);
  for (int i=0; i<n; i++)
    for (int j=0; j<n; j++)
      inv(i,j) = A(i,n+j);

  return inv;
}

template class Array<double,1>;
template class Array<double,2>;
template class Array<double,3>;
template class Array<double,4>;

template class Array<int,2>;

template class matrix<double>;
template class matrix<int>;
