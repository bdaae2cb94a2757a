#pragma once

#include "bif6/reader.hpp"
#include "sims/interval.hpp"

#include "hdf5.h"

#include <cstdint>
#include <limits>
#include <string>

namespace utils {

struct ExportSettings {
  double min_mz = 0.0;
  double max_mz = std::numeric_limits<double>::infinity();

  bool remove_hotspots = false;
  double hotspot_percentile = 99.0;

  bool use_progressbar = false;
};

// Writes interval images to an HDF5 file as /intervals/<id> datasets
// (height x width, uint32) carrying their m/z bounds as attributes.
class Hdf5IntervalWriter {
  std::string filename_;
  hid_t file_;
  hid_t group_;
  size_t n_written_;

 public:
  Hdf5IntervalWriter(const std::string& filename, uint32_t width, uint32_t height);

  Hdf5IntervalWriter(const Hdf5IntervalWriter&) = delete;
  Hdf5IntervalWriter& operator=(const Hdf5IntervalWriter&) = delete;

  void write(const sims::IntervalImage& interval);

  size_t intervalsWritten() const { return n_written_; }

  void close();

  ~Hdf5IntervalWriter();
};

// Returns the number of intervals written.
size_t exportToHdf5(const std::string& input_filename, const std::string& output_filename,
    const ExportSettings& settings,
    const bif6::ReaderSettings& reader_settings = bif6::ReaderSettings());

}
