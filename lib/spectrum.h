//
// Complex Fourier coefficients fk on a 1D, 2D or 3D grid
//
// Axis 0 is the contiguous axis; a real-to-complex transform halves it.
//   index = (iz*n[1] + iy)*n[0] + ix
//
#ifndef SPECTRUM_H
#define SPECTRUM_H 1

#include <string>
#include <cstddef>
#include <vector>
#include "config.h"

class Spectrum {
 public:
  explicit Spectrum(const std::vector<size_t>& shape);
  Spectrum(const std::vector<size_t>& shape, const std::vector<Complex>& values);

  int rank() const { return (int) shape_.size(); }
  const std::vector<size_t>& shape() const { return shape_; }

  // extent of axis i; 1 for the axes beyond rank()
  size_t n(const int i) const { return i < rank() ? shape_[i] : 1; }
  size_t size() const { return fk_.size(); }

  size_t index(const size_t ix, const size_t iy= 0, const size_t iz= 0) const {
    return (iz*n(1) + iy)*n(0) + ix;
  }

  Complex& operator[](const size_t i) { return fk_[i]; }
  const Complex& operator[](const size_t i) const { return fk_[i]; }

  Complex* data() { return fk_.data(); }
  Complex const * data() const { return fk_.data(); }

 private:
  std::vector<size_t> shape_;
  std::vector<Complex> fk_;
};

void spectrum_check_shape(const std::vector<size_t>& shape);
std::string spectrum_shape_string(const std::vector<size_t>& shape);

// Multiply the first and the last slice along axis 0 by factor, in place
void spectrum_scale_edges(Spectrum* const fk, const double factor);

//
// Scales the axis-0 edge slices for the lifetime of the object.
// If restore is set, the destructor writes back the saved edge values,
// so the input is restored exactly on every exit path.
//
class EdgeScale {
 public:
  EdgeScale(Spectrum* const fk, const double factor, const bool restore);
  ~EdgeScale();

 private:
  EdgeScale(const EdgeScale&);
  EdgeScale& operator=(const EdgeScale&);

  Spectrum* const fk_;
  const bool restore_;
  std::vector<Complex> edges_;
};

#endif
