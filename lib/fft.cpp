#include <vector>
#include <algorithm>
#include <new>
#include <fftw3.h>
#include "msg.h"
#include "error.h"
#include "fft.h"

using namespace std;

namespace {
  // FFTW takes the slowest axis first
  void fftw_dims(const vector<size_t>& shape, int dims[])
  {
    const int rank= (int) shape.size();
    for(int i=0; i<rank; ++i)
      dims[i]= (int) shape[rank - 1 - i];
  }

  void check_size(const vector<size_t>& shape, const size_t n)
  {
    spectrum_check_shape(shape);

    size_t ntot= 1;
    for(size_t i=0; i<shape.size(); ++i)
      ntot *= shape[i];

    if(n != ntot) {
      msg_printf(msg_error, "Error: %lu values given for a grid of shape %s\n",
		 n, spectrum_shape_string(shape).c_str());
      throw InvalidArgument("number of values does not match the grid shape");
    }
  }
}

vector<size_t> fft_spectrum_shape(const vector<size_t>& shape,
				  const Convention convention)
{
  vector<size_t> nk(shape);
  if(convention == real_transform)
    nk[0]= shape[0]/2 + 1;

  return nk;
}

Spectrum fft_forward(const vector<size_t>& shape,
		     const vector<Complex>& fx)
{
  check_size(shape, fx.size());

  int dims[3];
  fftw_dims(shape, dims);

  Spectrum fk(shape, fx);
  fftw_complex* const data= reinterpret_cast<fftw_complex*>(fk.data());

  fftw_plan plan= fftw_plan_dft((int) shape.size(), dims, data, data,
				FFTW_FORWARD, FFTW_ESTIMATE);
  fftw_execute(plan);
  fftw_destroy_plan(plan);

  msg_printf(msg_debug, "fft %s complex -> complex\n",
	     spectrum_shape_string(shape).c_str());

  return fk;
}

Spectrum fft_forward(const vector<size_t>& shape,
		     const vector<double>& fx,
		     const Convention convention)
{
  check_size(shape, fx.size());

  if(convention == complex_transform) {
    vector<Complex> fz(fx.begin(), fx.end());
    return fft_forward(shape, fz);
  }

  // the half spectrum of an odd number of points has no Nyquist mode;
  // its normalisation and edge weights assume 2(n0 - 1) points
  if(shape[0] % 2 != 0) {
    msg_printf(msg_error,
	       "Error: real transform of shape %s; axis 0 needs an even number of points\n",
	       spectrum_shape_string(shape).c_str());
    throw InvalidArgument("real transform needs an even extent along axis 0");
  }

  int dims[3];
  fftw_dims(shape, dims);

  // the input of the planner is overwritten
  double* const x= (double*) fftw_malloc(sizeof(double)*fx.size());
  if(x == 0) {
    msg_printf(msg_fatal, "Error: unable to allocate fft buffer of %lu doubles\n",
	       fx.size());
    throw bad_alloc();
  }

  Spectrum fk(fft_spectrum_shape(shape, real_transform));
  fftw_complex* const data= reinterpret_cast<fftw_complex*>(fk.data());

  fftw_plan plan= fftw_plan_dft_r2c((int) shape.size(), dims, x, data,
				    FFTW_ESTIMATE);
  copy(fx.begin(), fx.end(), x);
  fftw_execute(plan);

  fftw_destroy_plan(plan);
  fftw_free(x);

  msg_printf(msg_debug, "fft %s real -> complex\n",
	     spectrum_shape_string(shape).c_str());

  return fk;
}
