//
// Compute isotropic structure factor from Fourier coefficients fk
//
#include <cmath>
#include <cassert>
#include "msg.h"
#include "error.h"
#include "structure_factor.h"

using namespace std;

namespace {
  void check_shape(const vector<size_t>& shape1, const vector<size_t>& shape2)
  {
    if(shape1 != shape2) {
      msg_printf(msg_error, "Error: shape %s should be identical to shape %s\n",
		 spectrum_shape_string(shape1).c_str(),
		 spectrum_shape_string(shape2).c_str());
      throw ShapeMismatch("spectra differ in shape");
    }
  }

  void check_boxsize(const double boxsize)
  {
    if(!(boxsize > 0.0)) {
      msg_printf(msg_error, "Error: boxsize must be positive: %e\n", boxsize);
      throw InvalidArgument("boxsize must be positive");
    }
  }

  // |fk|^2 of grid cell index
  struct AutoPower {
    explicit AutoPower(Spectrum const * const fk_) : fk(fk_) {}
    double operator()(const size_t index) const {
      return norm((*fk)[index]);
    }
    Spectrum const * const fk;
  };

  // Re(conj(fk) gk) of grid cell index
  struct CrossPower {
    CrossPower(Spectrum const * const fk_, Spectrum const * const gk_) :
      fk(fk_), gk(gk_) {}
    double operator()(const size_t index) const {
      return real(conj((*fk)[index])*(*gk)[index]);
    }
    Spectrum const * const fk;
    Spectrum const * const gk;
  };

  //
  // Add power(index) to the |k| bin of every grid cell, walking the cells
  // in Spectrum index order
  //
  template<typename Power>
  void bin_power(StructureFactor* const S, const KGrid& kgrid,
		 const Power& power)
  {
    const vector<double>& kx= kgrid.axis(0);
    const vector<double>& ky= kgrid.axis(1);
    const vector<double>& kz= kgrid.axis(2);
    const int rank= kgrid.rank();
    const size_t nbin= S->sk.size();

    double k[3];
    size_t index= 0;
    for(size_t iz=0; iz<kz.size(); ++iz) {
     k[2]= kz[iz];
     for(size_t iy=0; iy<ky.size(); ++iy) {
      k[1]= ky[iy];
      for(size_t ix=0; ix<kx.size(); ++ix) {
	k[0]= kx[ix];
	const size_t i= kgrid_bin(k, rank);
	assert(i < nbin);

	S->sk[i] += power(index);
	++index;
      }
     }
    }
  }
}

StructureFactor::StructureFactor(const size_t kmax, const int dim_,
				 const double boxsize_) :
  dim(dim_), boxsize(boxsize_), dk(2.0*M_PI/boxsize_),
  k(kmax + 1), sk(kmax + 1, 0.0)
{
  for(size_t i=0; i<=kmax; ++i)
    k[i]= dk*i;
}

double structure_factor_normalization(const vector<size_t>& shape,
				      const Convention convention)
{
  // 1/(number of real-space points)^2, with the extra 1/2 of the
  // complex transform matching the doubled mode count
  spectrum_check_shape(shape);
  if(convention == real_transform && shape[0] < 2) {
    msg_printf(msg_error,
	       "Error: no normalisation for a half spectrum of shape %s\n",
	       spectrum_shape_string(shape).c_str());
    throw InvalidArgument("half spectrum axis 0 must have at least 2 modes");
  }

  double n_rest= 1.0;
  for(size_t i=1; i<shape.size(); ++i)
    n_rest *= shape[i];

  if(convention == real_transform) {
    const double n= 2.0*(shape[0] - 1)*n_rest;
    return 1.0/(n*n);
  }

  const double n= shape[0]*n_rest;
  return 1.0/(2.0*n*n);
}

void structure_factor_accumulate(StructureFactor* const S,
				 const KGrid& kgrid,
				 Spectrum* const fk,
				 const bool preserve)
{
  check_shape(kgrid.shape(), fk->shape());

  const bool is_real= kgrid.convention() == real_transform;
  EdgeScale edge(fk, is_real ? sqrt(0.5) : 1.0, is_real && preserve);

  bin_power(S, kgrid, AutoPower(fk));
}

void budget_accumulate(StructureFactor* const S,
		       const KGrid& kgrid,
		       Spectrum* const fk,
		       const Spectrum& gk,
		       const double nrm,
		       const bool preserve)
{
  check_shape(fk->shape(), gk.shape());
  check_shape(kgrid.shape(), fk->shape());

  const bool is_real= kgrid.convention() == real_transform;
  EdgeScale edge(fk, is_real ? 0.5 : 1.0, is_real && preserve);

  bin_power(S, kgrid, CrossPower(fk, &gk));

  for(size_t i=0; i<S->sk.size(); ++i)
    S->sk[i] *= nrm;
}

//
// KGrid, normalisation and an empty S(k) for spectra of this shape
//
namespace {
  struct Setup {
    Setup(const vector<size_t>& shape, const Convention convention,
	  const double boxsize) :
      kgrid(shape, convention),
      norm(structure_factor_normalization(shape, convention)),
      S(kgrid_kmax(kgrid), (int) shape.size(), boxsize)
    {
      msg_printf(msg_verbose, "S(k) of shape %s: %lu bins, normalisation %e\n",
		 spectrum_shape_string(shape).c_str(), S.sk.size(), norm);
    }

    KGrid kgrid;
    double norm;
    StructureFactor S;
  };

  StructureFactor compute_structure_factor(const vector<Spectrum*>& fk,
					   const Convention convention,
					   const double boxsize,
					   const bool preserve)
  {
    check_boxsize(boxsize);
    if(fk.empty()) {
      msg_printf(msg_error, "Error: no field component given\n");
      throw InvalidArgument("vector field without components");
    }

    for(size_t i=1; i<fk.size(); ++i)
      check_shape(fk[0]->shape(), fk[i]->shape());

    Setup setup(fk[0]->shape(), convention, boxsize);

    for(size_t i=0; i<fk.size(); ++i)
      structure_factor_accumulate(&setup.S, setup.kgrid, fk[i], preserve);

    vector<double>& sk= setup.S.sk;
    for(size_t i=0; i<sk.size(); ++i)
      sk[i] *= setup.norm;

    return setup.S;
  }
}

StructureFactor isotropic_structure_factor(Spectrum& fk,
					   const Convention convention,
					   const double boxsize,
					   const bool preserve)
{
  vector<Spectrum*> v(1, &fk);
  return compute_structure_factor(v, convention, boxsize, preserve);
}

StructureFactor isotropic_structure_factor(vector<Spectrum>& fk,
					   const Convention convention,
					   const double boxsize,
					   const bool preserve)
{
  vector<Spectrum*> v;
  for(size_t i=0; i<fk.size(); ++i)
    v.push_back(&fk[i]);

  return compute_structure_factor(v, convention, boxsize, preserve);
}

StructureFactor budget(Spectrum& fk, const Spectrum& gk,
		       const Convention convention,
		       const double boxsize,
		       const bool preserve)
{
  check_boxsize(boxsize);
  check_shape(fk.shape(), gk.shape());

  Setup setup(fk.shape(), convention, boxsize);

  if(&fk == &gk) {
    // scaling fk would also scale gk
    const Spectrum gk_copy(gk);
    budget_accumulate(&setup.S, setup.kgrid, &fk, gk_copy, setup.norm, preserve);
  }
  else {
    budget_accumulate(&setup.S, setup.kgrid, &fk, gk, setup.norm, preserve);
  }

  return setup.S;
}
