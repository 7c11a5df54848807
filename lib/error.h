#ifndef ERROR_H
#define ERROR_H 1

#include <stdexcept>
#include <string>

class SpectrumError : public std::runtime_error {
 public:
  explicit SpectrumError(const std::string& what) : std::runtime_error(what) {}
};

// two spectra (or a spectrum and its k grid) differ in shape
class ShapeMismatch : public SpectrumError {
 public:
  explicit ShapeMismatch(const std::string& what) : SpectrumError(what) {}
};

// array rank outside 1, 2, 3
class UnsupportedDimension : public SpectrumError {
 public:
  explicit UnsupportedDimension(const std::string& what) : SpectrumError(what) {}
};

class InvalidArgument : public SpectrumError {
 public:
  explicit InvalidArgument(const std::string& what) : SpectrumError(what) {}
};

// C(r=0) is zero; the correlation function cannot be normalised
class DegenerateSpectrum : public SpectrumError {
 public:
  explicit DegenerateSpectrum(const std::string& what) : SpectrumError(what) {}
};

#endif
