//
// S(k) of a real field must not depend on whether fk comes from the
// real-to-complex (half spectrum) or the complex transform
//
#include <cmath>
#include <vector>
#include <gtest/gtest.h>
#include "error.h"
#include "fft.h"
#include "structure_factor.h"

using namespace std;

namespace {
  vector<double> make_field(const vector<size_t>& shape)
  {
    size_t n= 1;
    for(size_t i=0; i<shape.size(); ++i)
      n *= shape[i];

    vector<double> fx(n);
    for(size_t i=0; i<n; ++i)
      fx[i]= 0.3 + sin(0.9*i) + 0.5*cos(0.37*i*i) + (i % 3 == 0 ? 0.2 : -0.1);

    return fx;
  }

  double mean_square(const vector<double>& fx)
  {
    double sum= 0.0;
    for(size_t i=0; i<fx.size(); ++i)
      sum += fx[i]*fx[i];
    return sum/fx.size();
  }

  void check_conventions(const vector<size_t>& shape)
  {
    const vector<double> fx= make_field(shape);

    Spectrum fk_half= fft_forward(shape, fx, real_transform);
    Spectrum fk_full= fft_forward(shape, fx, complex_transform);

    ASSERT_EQ(fft_spectrum_shape(shape, real_transform), fk_half.shape());
    ASSERT_EQ(shape, fk_full.shape());

    StructureFactor S_half= isotropic_structure_factor(fk_half, real_transform);
    StructureFactor S_full= isotropic_structure_factor(fk_full, complex_transform);

    ASSERT_EQ(S_full.sk.size(), S_half.sk.size());

    double sum= 0.0;
    for(size_t i=0; i<S_half.sk.size(); ++i) {
      EXPECT_NEAR(S_full.sk[i], S_half.sk[i], 1.0e-12) << "bin " << i;
      sum += S_half.sk[i];
    }

    // Parseval: sum_k S(k) = <f^2>/2
    EXPECT_NEAR(0.5*mean_square(fx), sum, 1.0e-12);
  }
}

TEST(Convention, Field1D)
{
  check_conventions(vector<size_t>(1, 16));
}

TEST(Convention, Field2D)
{
  vector<size_t> shape;
  shape.push_back(8);
  shape.push_back(6);
  check_conventions(shape);
}

TEST(Convention, Field3D)
{
  vector<size_t> shape;
  shape.push_back(8);
  shape.push_back(6);
  shape.push_back(4);
  check_conventions(shape);
}

TEST(Convention, CosineMode)
{
  // f(x) = cos(3x) on 16 points: all power in bin 3
  const size_t n= 16;
  vector<double> fx(n);
  for(size_t i=0; i<n; ++i)
    fx[i]= cos(2.0*M_PI*3.0*i/n);

  Spectrum fk= fft_forward(vector<size_t>(1, n), fx);
  StructureFactor S= isotropic_structure_factor(fk);

  for(size_t i=0; i<S.sk.size(); ++i)
    EXPECT_NEAR(i == 3 ? 0.25 : 0.0, S.sk[i], 1.0e-14) << "bin " << i;
}

TEST(Convention, OddRealExtent)
{
  // 9 points have no Nyquist mode; the half spectrum is refused
  const vector<double> fx(9, 1.0);
  EXPECT_THROW(fft_forward(vector<size_t>(1, 9), fx, real_transform),
	       InvalidArgument);

  vector<size_t> shape;
  shape.push_back(9);
  shape.push_back(4);
  EXPECT_THROW(fft_forward(shape, vector<double>(36, 1.0)), InvalidArgument);

  // the complex transform handles any extent
  Spectrum fk= fft_forward(vector<size_t>(1, 9), fx, complex_transform);
  StructureFactor S= isotropic_structure_factor(fk, complex_transform);
  EXPECT_NEAR(0.5, S.sk[0], 1.0e-14);
  for(size_t i=1; i<S.sk.size(); ++i)
    EXPECT_NEAR(0.0, S.sk[i], 1.0e-14);

  // odd extents along the other axes are fine
  vector<size_t> shape2;
  shape2.push_back(8);
  shape2.push_back(5);
  check_conventions(shape2);
}
