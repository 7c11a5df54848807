//
// Compute isotropic correlation function C(r) from structure factor S(k)
//
//   C(r) = sum_k S(k) K_D(kr) / sum_k S(k)
//
// with the angle-averaged Fourier kernels
//   K_1(x) = cos(x), K_2(x) = J0(x), K_3(x) = j0(x) = sin(x)/x
//
#include <cmath>
#include <gsl/gsl_sf_bessel.h>
#include "msg.h"
#include "error.h"
#include "corr.h"

using namespace std;

namespace {
  void check_dim(const int dim)
  {
    if(dim < 1 || dim > 3) {
      msg_printf(msg_error, "Error: correlation function in %d dimensions\n", dim);
      throw UnsupportedDimension("dimension must be 1, 2, or 3");
    }
  }
}

AutoCorrelator::AutoCorrelator(const int n, const int dim_, const double rmax) :
  dim(dim_), r(n > 0 ? n + 1 : 1), cr(r.size(), 0.0)
{
  if(n < 1) {
    msg_printf(msg_error, "Error: number of r points must be positive: %d\n", n);
    throw InvalidArgument("number of r points must be positive");
  }

  for(int i=0; i<=n; ++i)
    r[i]= rmax*i/n;
}

double corr_kernel(const double kr, const int dim)
{
  switch(dim) {
  case 1:
    return cos(kr);
  case 2:
    return gsl_sf_bessel_J0(kr);
  case 3:
    return gsl_sf_bessel_j0(kr);
  }

  check_dim(dim);
  return 0.0;
}

AutoCorrelator correlation(const StructureFactor& S, const int n)
{
  check_dim(S.dim);

  AutoCorrelator C(n, S.dim, 0.5*S.boxsize);

  const size_t nk= S.sk.size();
  for(int i=0; i<=n; ++i) {
    double xi= 0.0;
    for(size_t j=0; j<nk; ++j)
      xi += S.sk[j]*corr_kernel(S.k[j]*C.r[i], S.dim);

    C.cr[i]= xi;
  }

  const double xi0= C.cr[0];
  if(xi0 == 0.0) {
    msg_printf(msg_error, "Error: C(0) = 0; S(k) has no power to normalise\n");
    throw DegenerateSpectrum("correlation function vanishes at r = 0");
  }

  for(int i=0; i<=n; ++i)
    C.cr[i] /= xi0;

  msg_printf(msg_debug, "C(r) computed at %d points up to r= %e\n",
	     n + 1, C.r[n]);

  return C;
}
