#ifndef CONFIG_H
#define CONFIG_H 1

#include <complex>

typedef std::complex<double> Complex;

// real_transform:    fk = rfft(x), axis 0 holds non-negative modes only
// complex_transform: fk = fft(x), all modes along every axis
enum Convention {real_transform, complex_transform};

#endif
