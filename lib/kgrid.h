//
// Wavenumber grid matching the cells of a Spectrum
//
// Wavenumbers are integer mode numbers, in units of the fundamental
// frequency 2pi/boxsize, enumerated in the Spectrum index order
//   index = (iz*n[1] + iy)*n[0] + ix
//
#ifndef KGRID_H
#define KGRID_H 1

#include <cstddef>
#include <vector>
#include "config.h"

class KGrid {
 public:
  KGrid(const std::vector<size_t>& shape, const Convention convention);

  int rank() const { return rank_; }
  Convention convention() const { return convention_; }
  const std::vector<size_t>& shape() const { return shape_; }
  size_t size() const { return k_[0].size()*k_[1].size()*k_[2].size(); }

  // frequency sequence of axis i; {0} for the axes beyond rank()
  const std::vector<double>& axis(const int i) const { return k_[i]; }

  // wavenumber vector of grid cell index; k[rank()..2] are set to 0
  void kvec(const size_t index, double k[]) const;

 private:
  int rank_;
  Convention convention_;
  std::vector<size_t> shape_;
  std::vector<double> k_[3];
};

// fftfreq(n, n): 0, 1, ..., n/2, -(n - 1)/2, ..., -1
std::vector<double> kgrid_fftfreq(const size_t n);

// frequencies along axis 0 for a spectrum axis of length n0
std::vector<double> kgrid_xfftfreq(const size_t n0, const Convention convention);

// 0-based radial bin of wavenumber vector k, round(|k|)
size_t kgrid_bin(double const * const k, const int rank);

// Upper bound of kgrid_bin over the grid; a structure factor on this grid
// needs kmax + 1 bins
size_t kgrid_kmax(const KGrid& kgrid);

#endif
