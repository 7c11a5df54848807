#include <cmath>
#include <algorithm>
#include "msg.h"
#include "error.h"
#include "spectrum.h"
#include "kgrid.h"

using namespace std;

KGrid::KGrid(const vector<size_t>& shape, const Convention convention) :
  rank_((int) shape.size()), convention_(convention), shape_(shape)
{
  spectrum_check_shape(shape_);

  if(convention_ == real_transform && shape_[0] < 2) {
    msg_printf(msg_error,
	       "Error: half spectrum of shape %s; axis 0 needs at least 2 modes\n",
	       spectrum_shape_string(shape_).c_str());
    throw InvalidArgument("half spectrum axis 0 must have at least 2 modes");
  }

  k_[0]= kgrid_xfftfreq(shape_[0], convention_);
  for(int i=1; i<3; ++i) {
    if(i < rank_)
      k_[i]= kgrid_fftfreq(shape_[i]);
    else
      k_[i].assign(1, 0.0);
  }

  msg_printf(msg_debug, "KGrid %s, %s transform, %lu modes\n",
	     spectrum_shape_string(shape_).c_str(),
	     convention_ == real_transform ? "real" : "complex",
	     size());
}

void KGrid::kvec(const size_t index, double k[]) const
{
  const size_t n0= k_[0].size();
  const size_t n1= k_[1].size();

  k[0]= k_[0][index % n0];
  k[1]= k_[1][(index/n0) % n1];
  k[2]= k_[2][index/(n0*n1)];
}

vector<double> kgrid_fftfreq(const size_t n)
{
  vector<double> v(n);
  for(size_t i=0; i<n; ++i)
    v[i]= i <= n/2 ? (double) i : -(double) (n - i);

  return v;
}

vector<double> kgrid_xfftfreq(const size_t n0, const Convention convention)
{
  if(convention == complex_transform)
    return kgrid_fftfreq(n0);

  // rfftfreq of the 2(n0 - 1) real points: 0, 1, ..., n0 - 1
  vector<double> v(n0);
  for(size_t i=0; i<n0; ++i)
    v[i]= (double) i;

  return v;
}

size_t kgrid_bin(double const * const k, const int rank)
{
  double k2= 0.0;
  for(int i=0; i<rank; ++i)
    k2 += k[i]*k[i];

  // nearbyint rounds half to even; |k|^2 is an integer for mode numbers,
  // so |k| is never exactly at a half integer
  return (size_t) nearbyint(sqrt(k2));
}

size_t kgrid_kmax(const KGrid& kgrid)
{
  // The frequency sequences may omit the largest magnitude along an axis;
  // one extra mode per axis keeps every bin in range
  double kmax[3];
  for(int i=0; i<kgrid.rank(); ++i) {
    const vector<double>& ki= kgrid.axis(i);
    kmax[i]= *max_element(ki.begin(), ki.end()) + 1.0;
  }

  return kgrid_bin(kmax, kgrid.rank()) + 1;
}
