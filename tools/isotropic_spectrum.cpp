//
// Isotropic structure factor S(k) and correlation function C(r)
// of a field on a periodic 1D, 2D or 3D grid
//
// Output:
//     Column 1: k
//     Column 2: S(k)
// and with --corr
//     Column 1: r
//     Column 2: C(r)
//
#include <iostream>
#include <exception>
#include <string>
#include <vector>
#include <cstdio>
#include <cmath>
#include <boost/program_options.hpp>

#include "msg.h"
#include "error.h"
#include "field.h"
#include "fft.h"
#include "structure_factor.h"
#include "corr.h"

using namespace std;
using namespace boost::program_options;

static Spectrum read_spectrum(const string& filename, const Convention convention);
static FILE* open_output(const variables_map& vm, const char name[]);
static void close_output(FILE* const fp);

int main(int argc, char* argv[])
{
  //
  // command-line options (Boost program_options)
  //
  options_description opt("isotropic_spectrum [options] field [field2 field3]");
  opt.add_options()
    ("help,h", "display this help")
    ("filename,f", value<vector<string> >(), "field file; several files are the components of a vector field")
    ("boxsize", value<double>()->default_value(2.0*M_PI, "2pi"), "length of box on a side")
    ("complex", "full complex transform of all modes instead of the real half spectrum")
    ("cross", value<string>(), "compute the co-spectrum Re(conj(f) g) with this field g")
    ("corr", "also compute the correlation function C(r)")
    ("nr", value<int>()->default_value(128), "number of r intervals in [0, boxsize/2]")
    ("output,o", value<string>(), "S(k) output filename (default stdout)")
    ("corr-output", value<string>(), "C(r) output filename (default stdout)")
    ("loglevel", value<int>()->default_value(2), "0 debug, 1 verbose, 2 info, 3 warn, 4 error")
    ;

  positional_options_description p;
  p.add("filename", -1);

  variables_map vm;
  try {
    store(command_line_parser(argc, argv).options(opt).positional(p).run(), vm);
    notify(vm);
  }
  catch(const boost::program_options::error& e) {
    cerr << "Error: " << e.what() << endl;
    cerr << opt;
    return 1;
  }

  if(vm.count("help") || ! vm.count("filename")) {
    cout << opt;
    return 0;
  }

  const int loglevel= vm["loglevel"].as<int>();
  if(loglevel < msg_debug || loglevel > msg_error) {
    cerr << "Error: loglevel must be between 0 and 4: " << loglevel << endl;
    return 1;
  }
  msg_set_loglevel((LogLevel) loglevel);

  const vector<string> filenames= vm["filename"].as<vector<string> >();
  const double boxsize= vm["boxsize"].as<double>();
  const int nr= vm["nr"].as<int>();
  const Convention convention=
    vm.count("complex") ? complex_transform : real_transform;

  if(filenames.size() > 3) {
    cerr << "Error: at most 3 vector field components\n";
    return 1;
  }

  if(vm.count("cross") && filenames.size() != 1) {
    cerr << "Error: --cross takes a single scalar field\n";
    return 1;
  }

  try {
    vector<Spectrum> fk;
    for(size_t i=0; i<filenames.size(); ++i)
      fk.push_back(read_spectrum(filenames[i], convention));

    // fk is not used after S(k); no need to restore the edge modes
    StructureFactor S= vm.count("cross") ?
      budget(fk[0], read_spectrum(vm["cross"].as<string>(), convention),
	     convention, boxsize, false) :
      isotropic_structure_factor(fk, convention, boxsize, false);

    msg_printf(msg_info, "S(k) computed in %d bins, dk= %e\n",
	       (int) S.sk.size(), S.dk);

    FILE* fp= open_output(vm, "output");
    fprintf(fp, "# k S(k)\n");
    for(size_t i=0; i<S.sk.size(); ++i)
      fprintf(fp, "%e %e\n", S.k[i], S.sk[i]);
    close_output(fp);

    if(vm.count("corr")) {
      AutoCorrelator C= correlation(S, nr);

      fp= open_output(vm, "corr-output");
      fprintf(fp, "# r C(r)\n");
      for(size_t i=0; i<C.cr.size(); ++i)
	fprintf(fp, "%e %e\n", C.r[i], C.cr[i]);
      close_output(fp);
    }
  }
  catch(const SpectrumError& e) {
    cerr << "Error: " << e.what() << endl;
    return 1;
  }
  catch(const exception& e) {
    cerr << "Error: " << e.what() << endl;
    return 1;
  }

  return 0;
}

Spectrum read_spectrum(const string& filename, const Convention convention)
{
  Field f= field_read(filename.c_str());
  return fft_forward(f.shape, f.fx, convention);
}

FILE* open_output(const variables_map& vm, const char name[])
{
  if(!vm.count(name))
    return stdout;

  const string filename= vm[name].as<string>();
  FILE* const fp= fopen(filename.c_str(), "w");
  if(fp == 0) {
    msg_printf(msg_error, "Error: Unable to write to file: %s\n",
	       filename.c_str());
    throw InvalidArgument("unable to open output file");
  }

  return fp;
}

void close_output(FILE* const fp)
{
  if(fp == stdout) {
    fflush(fp);
    return;
  }

  int ret= fclose(fp);
  if(ret != 0) {
    msg_printf(msg_error, "Error: Unable to close output file\n");
    throw InvalidArgument("unable to close output file");
  }
  msg_printf(msg_info, "output written.\n");
}
