#include <fstream>
#include <sstream>
#include <string>
#include "msg.h"
#include "error.h"
#include "spectrum.h"
#include "field.h"

using namespace std;

Field field_read(const char filename[])
{
  ifstream in(filename);
  if(!in) {
    msg_printf(msg_error, "Error: Unable to open input field file: %s\n",
	       filename);
    throw InvalidArgument("unable to open field file");
  }

  Field f;
  size_t ntot= 0;
  size_t nline= 0;
  string line;

  while(getline(in, line)) {
    nline++;
    if(line.empty() || line[0] == '#')
      continue;

    istringstream ss(line);

    if(f.shape.empty()) {
      // first data line: grid extents
      size_t n;
      while(ss >> n)
	f.shape.push_back(n);

      if(!ss.eof() || f.shape.empty()) {
	msg_printf(msg_error, "Error: Unable to read grid extents in %s line %lu: %s\n",
		   filename, nline, line.c_str());
	throw InvalidArgument("malformed grid extents in field file");
      }

      spectrum_check_shape(f.shape);

      ntot= 1;
      for(size_t i=0; i<f.shape.size(); ++i)
	ntot *= f.shape[i];
      f.fx.reserve(ntot);
      continue;
    }

    double x;
    while(ss >> x)
      f.fx.push_back(x);

    if(!ss.eof()) {
      msg_printf(msg_error, "Error: Unable to understand line %lu in %s: %s\n",
		 nline, filename, line.c_str());
      throw InvalidArgument("malformed value in field file");
    }
  }

  if(f.shape.empty() || f.fx.size() != ntot) {
    msg_printf(msg_error, "Error: %s has %lu values; %lu expected for shape %s\n",
	       filename, f.fx.size(), ntot,
	       spectrum_shape_string(f.shape).c_str());
    throw InvalidArgument("number of values does not match the grid extents");
  }

  msg_printf(msg_verbose, "Read field of shape %s from %s\n",
	     spectrum_shape_string(f.shape).c_str(), filename);

  return f;
}
