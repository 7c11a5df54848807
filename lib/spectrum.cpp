#include <sstream>
#include "msg.h"
#include "error.h"
#include "spectrum.h"

using namespace std;

namespace {
  size_t shape_size(const vector<size_t>& shape)
  {
    size_t n= 1;
    for(size_t i=0; i<shape.size(); ++i)
      n *= shape[i];
    return n;
  }
}

Spectrum::Spectrum(const vector<size_t>& shape) :
  shape_(shape)
{
  spectrum_check_shape(shape_);
  fk_.assign(shape_size(shape_), Complex(0.0, 0.0));
}

Spectrum::Spectrum(const vector<size_t>& shape, const vector<Complex>& values) :
  shape_(shape)
{
  spectrum_check_shape(shape_);

  if(values.size() != shape_size(shape_)) {
    msg_printf(msg_error, "Error: %lu values given for a spectrum of shape %s\n",
	       values.size(), spectrum_shape_string(shape_).c_str());
    throw InvalidArgument("number of values does not match the spectrum shape");
  }

  fk_= values;
}

void spectrum_check_shape(const vector<size_t>& shape)
{
  if(shape.size() < 1 || shape.size() > 3) {
    msg_printf(msg_error, "Error: spectrum of rank %lu; only 1, 2, 3 supported\n",
	       shape.size());
    throw UnsupportedDimension("array rank must be 1, 2, or 3");
  }

  for(size_t i=0; i<shape.size(); ++i) {
    if(shape[i] == 0) {
      msg_printf(msg_error, "Error: zero extent in shape %s\n",
		 spectrum_shape_string(shape).c_str());
      throw InvalidArgument("zero extent in spectrum shape");
    }
  }
}

string spectrum_shape_string(const vector<size_t>& shape)
{
  ostringstream ss;
  ss << "(";
  for(size_t i=0; i<shape.size(); ++i) {
    if(i > 0) ss << ", ";
    ss << shape[i];
  }
  ss << ")";
  return ss.str();
}

void spectrum_scale_edges(Spectrum* const fk, const double factor)
{
  const size_t n0= fk->n(0);
  const size_t nyz= fk->n(1)*fk->n(2);

  for(size_t iyz=0; iyz<nyz; ++iyz) {
    (*fk)[iyz*n0] *= factor;
    (*fk)[iyz*n0 + n0 - 1] *= factor;
  }
}

namespace {
  // copy the axis-0 edge slices into v, or back from v
  void copy_edges(Spectrum* const fk, vector<Complex>* const v, const bool save)
  {
    const size_t n0= fk->n(0);
    const size_t nyz= fk->n(1)*fk->n(2);

    if(save)
      v->resize(2*nyz);

    for(size_t iyz=0; iyz<nyz; ++iyz) {
      Complex& first= (*fk)[iyz*n0];
      Complex& last= (*fk)[iyz*n0 + n0 - 1];
      if(save) {
	(*v)[2*iyz]= first;
	(*v)[2*iyz + 1]= last;
      }
      else {
	last= (*v)[2*iyz + 1];
	first= (*v)[2*iyz];
      }
    }
  }
}

EdgeScale::EdgeScale(Spectrum* const fk, const double factor, const bool restore) :
  fk_(fk), restore_(restore)
{
  if(restore_)
    copy_edges(fk_, &edges_, true);

  spectrum_scale_edges(fk_, factor);
}

EdgeScale::~EdgeScale()
{
  if(restore_)
    copy_edges(fk_, &edges_, false);
}
