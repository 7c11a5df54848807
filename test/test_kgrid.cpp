#include <vector>
#include <gtest/gtest.h>
#include "error.h"
#include "kgrid.h"

using namespace std;

TEST(KGrid, FftfreqEven)
{
  const double expected[]= {0, 1, 2, 3, 4, -3, -2, -1};
  vector<double> k= kgrid_fftfreq(8);

  ASSERT_EQ(8u, k.size());
  for(size_t i=0; i<8; ++i)
    EXPECT_EQ(expected[i], k[i]) << "i= " << i;
}

TEST(KGrid, FftfreqOdd)
{
  const double expected[]= {0, 1, 2, -2, -1};
  vector<double> k= kgrid_fftfreq(5);

  ASSERT_EQ(5u, k.size());
  for(size_t i=0; i<5; ++i)
    EXPECT_EQ(expected[i], k[i]) << "i= " << i;
}

TEST(KGrid, HalfSpectrumAxisIncludesNyquist)
{
  // rfft of 8 real points has 5 modes, 0..4
  vector<double> k= kgrid_xfftfreq(5, real_transform);

  ASSERT_EQ(5u, k.size());
  for(size_t i=0; i<5; ++i)
    EXPECT_EQ((double) i, k[i]);

  EXPECT_EQ(kgrid_fftfreq(5), kgrid_xfftfreq(5, complex_transform));
}

TEST(KGrid, AxesAndSize)
{
  vector<size_t> shape;
  shape.push_back(5);
  shape.push_back(6);
  KGrid kgrid(shape, real_transform);

  EXPECT_EQ(2, kgrid.rank());
  EXPECT_EQ(real_transform, kgrid.convention());
  EXPECT_EQ(30u, kgrid.size());
  EXPECT_EQ(5u, kgrid.axis(0).size());
  EXPECT_EQ(kgrid_fftfreq(6), kgrid.axis(1));
  ASSERT_EQ(1u, kgrid.axis(2).size());
  EXPECT_EQ(0.0, kgrid.axis(2)[0]);
}

TEST(KGrid, KvecFollowsSpectrumIndex)
{
  vector<size_t> shape;
  shape.push_back(5);
  shape.push_back(6);
  shape.push_back(4);
  KGrid kgrid(shape, real_transform);

  // index = (iz*6 + iy)*5 + ix with ix=3, iy=4, iz=3
  double k[3];
  kgrid.kvec((3*6 + 4)*5 + 3, k);
  EXPECT_EQ(3.0, k[0]);
  EXPECT_EQ(-2.0, k[1]);
  EXPECT_EQ(-1.0, k[2]);

  kgrid.kvec(0, k);
  EXPECT_EQ(0.0, k[0]);
  EXPECT_EQ(0.0, k[1]);
  EXPECT_EQ(0.0, k[2]);
}

TEST(KGrid, RadialBin)
{
  const double k1[]= {3.0, 4.0};
  EXPECT_EQ(5u, kgrid_bin(k1, 2));

  const double k2[]= {0.0};
  EXPECT_EQ(0u, kgrid_bin(k2, 1));

  const double k3[]= {-1.0, 1.0, 1.0};
  EXPECT_EQ(2u, kgrid_bin(k3, 3));

  // components beyond rank are ignored
  const double k4[]= {1.0, 7.0, 7.0};
  EXPECT_EQ(1u, kgrid_bin(k4, 1));
}

TEST(KGrid, RadialBinRoundsHalfToEven)
{
  const double a[]= {0.5};
  const double b[]= {1.5};
  const double c[]= {2.5};

  EXPECT_EQ(0u, kgrid_bin(a, 1));
  EXPECT_EQ(2u, kgrid_bin(b, 1));
  EXPECT_EQ(2u, kgrid_bin(c, 1));
}

TEST(KGrid, Kmax)
{
  vector<size_t> s1(1, 5);
  EXPECT_EQ(6u, kgrid_kmax(KGrid(s1, real_transform)));

  vector<size_t> s2(1, 8);
  EXPECT_EQ(6u, kgrid_kmax(KGrid(s2, complex_transform)));

  vector<size_t> s3;
  s3.push_back(5);
  s3.push_back(6);
  EXPECT_EQ(7u, kgrid_kmax(KGrid(s3, real_transform)));

  vector<size_t> s4(3, 8);
  EXPECT_EQ(10u, kgrid_kmax(KGrid(s4, complex_transform)));
}

TEST(KGrid, KmaxBoundsEveryBin)
{
  const size_t shapes[][3]= {{2, 1, 1}, {5, 7, 1}, {9, 4, 3}, {3, 3, 3}, {6, 5, 2}};
  const int ranks[]= {1, 2, 3, 3, 3};

  for(int s=0; s<5; ++s) {
    vector<size_t> shape(shapes[s], shapes[s] + ranks[s]);

    for(int c=0; c<2; ++c) {
      KGrid kgrid(shape, c == 0 ? real_transform : complex_transform);
      const size_t kmax= kgrid_kmax(kgrid);

      double k[3];
      for(size_t i=0; i<kgrid.size(); ++i) {
	kgrid.kvec(i, k);
	EXPECT_LE(kgrid_bin(k, kgrid.rank()), kmax);
      }
    }
  }
}

TEST(KGrid, RejectsUnsupportedShapes)
{
  vector<size_t> s4(4, 4);
  EXPECT_THROW(KGrid(s4, complex_transform), UnsupportedDimension);

  vector<size_t> s0;
  EXPECT_THROW(KGrid(s0, complex_transform), UnsupportedDimension);

  vector<size_t> s1(1, 1);
  EXPECT_THROW(KGrid(s1, real_transform), InvalidArgument);
  EXPECT_NO_THROW(KGrid(s1, complex_transform));
}
