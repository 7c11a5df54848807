//
// Forward discrete Fourier transform of a real-space grid (FFTW3)
//
// shape is the real-space shape with axis 0 contiguous.
// real_transform halves axis 0 to shape[0]/2 + 1 modes; shape[0] must be even.
// The transforms are unnormalised, fk = sum_x f(x) exp(-ik.x).
//
#ifndef FFT_H
#define FFT_H 1

#include <vector>
#include "config.h"
#include "spectrum.h"

Spectrum fft_forward(const std::vector<size_t>& shape,
		     const std::vector<double>& fx,
		     const Convention convention= real_transform);

Spectrum fft_forward(const std::vector<size_t>& shape,
		     const std::vector<Complex>& fx);

// Shape of the spectrum of a real-space grid
std::vector<size_t> fft_spectrum_shape(const std::vector<size_t>& shape,
				       const Convention convention);

#endif
