//
// Isotropic structure factor S(k): |fk|^2 summed in bins of |k|
//
#ifndef STRUCTURE_FACTOR_H
#define STRUCTURE_FACTOR_H 1

#include <cmath>
#include <vector>
#include "config.h"
#include "spectrum.h"
#include "kgrid.h"

struct StructureFactor {
  StructureFactor(const size_t kmax, const int dim, const double boxsize= 2.0*M_PI);

  int dim;                // dimension of the field
  double boxsize;         // length of the periodic box
  double dk;              // fundamental frequency 2pi/boxsize
  std::vector<double> k;  // k[i] = i*dk, i = 0..kmax
  std::vector<double> sk; // S(k[i])
};

double structure_factor_normalization(const std::vector<size_t>& shape,
				      const Convention convention);

//
// Accumulate |fk|^2 into S->sk without normalisation.
// For real_transform the axis-0 edges of fk are scaled by sqrt(1/2) during
// the sum; with preserve = false they are left scaled on return.
//
void structure_factor_accumulate(StructureFactor* const S,
				 const KGrid& kgrid,
				 Spectrum* const fk,
				 const bool preserve= true);

//
// Accumulate norm*Re(conj(fk) gk) into S->sk.
// For real_transform the axis-0 edges of fk (not gk) are halved during the
// sum; with preserve = false they are left halved on return.
//
void budget_accumulate(StructureFactor* const S,
		       const KGrid& kgrid,
		       Spectrum* const fk,
		       const Spectrum& gk,
		       const double norm,
		       const bool preserve= true);

// S(k) of a scalar field, fk = rfft(x) or fft(x) as given by convention
StructureFactor isotropic_structure_factor(Spectrum& fk,
					   const Convention convention= real_transform,
					   const double boxsize= 2.0*M_PI,
					   const bool preserve= true);

// S(k) of a vector field; sum of |fk_i|^2 over the components
StructureFactor isotropic_structure_factor(std::vector<Spectrum>& fk,
					   const Convention convention= real_transform,
					   const double boxsize= 2.0*M_PI,
					   const bool preserve= true);

// Co-spectrum Re(conj(fk) gk) binned in |k|
StructureFactor budget(Spectrum& fk, const Spectrum& gk,
		       const Convention convention= real_transform,
		       const double boxsize= 2.0*M_PI,
		       const bool preserve= true);

#endif
