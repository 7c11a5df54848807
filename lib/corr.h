#ifndef CORR_H
#define CORR_H 1

#include <cmath>
#include <vector>
#include "structure_factor.h"

struct AutoCorrelator {
  AutoCorrelator(const int n, const int dim, const double rmax= M_PI);

  int dim;
  std::vector<double> r;  // n + 1 points, r[i] = rmax*i/n
  std::vector<double> cr; // C(r[i]), C(0) = 1
};

// Angle average of exp(ik.r) in dim dimensions
double corr_kernel(const double kr, const int dim);

//
// Isotropic correlation function C(r) = <u(0) u(r)>/<u(0)^2> from S(k),
// sampled at n + 1 points in [0, boxsize/2].
// n should stay below the number of grid points per dimension.
//
AutoCorrelator correlation(const StructureFactor& S, const int n= 128);

#endif
