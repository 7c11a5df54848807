//
// Real-space field on a 1D, 2D or 3D grid read from a text file
//
// # comment lines
// nx [ny [nz]]
// f(0,0,0) f(1,0,0) ... (axis 0 fastest, any whitespace)
//
#ifndef FIELD_H
#define FIELD_H 1

#include <cstddef>
#include <vector>

struct Field {
  std::vector<size_t> shape;
  std::vector<double> fx;
};

Field field_read(const char filename[]);

#endif
