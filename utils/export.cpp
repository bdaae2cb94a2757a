#include "utils/export.hpp"

#include "hdf5_hl.h"

extern "C" {
#include "progressbar.h"
}

#include <cstdio>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace utils {

namespace {
struct ProgressBarFinisher {
  void operator()(progressbar* bar) const {
    progressbar_finish(bar);
    std::fflush(stdout);
  }
};
}

Hdf5IntervalWriter::Hdf5IntervalWriter(const std::string& filename,
                                       uint32_t width, uint32_t height) :
    filename_(filename), file_(-1), group_(-1), n_written_(0)
{
  file_ = H5Fcreate(filename.c_str(), H5F_ACC_TRUNC, H5P_DEFAULT, H5P_DEFAULT);
  if (file_ < 0)
    throw std::runtime_error("can't open " + filename + " for writing");

  group_ = H5Gcreate2(file_, "/intervals", H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
  if (group_ < 0) {
    close();
    throw std::runtime_error("couldn't create the intervals group in " + filename);
  }

  unsigned int shape[2] = {width, height};
  if (H5LTset_attribute_uint(file_, "/", "width", &shape[0], 1) < 0 ||
      H5LTset_attribute_uint(file_, "/", "height", &shape[1], 1) < 0) {
    close();
    throw std::runtime_error("couldn't write the image shape to " + filename);
  }
}

void Hdf5IntervalWriter::write(const sims::IntervalImage& interval)
{
  if (file_ < 0)
    throw std::logic_error("writing to a closed HDF5 file");

  auto dataset = "/intervals/" + std::to_string(interval.id);
  hsize_t dims[2] = {interval.height(), interval.width()};
  if (H5LTmake_dataset(file_, dataset.c_str(), 2, dims, H5T_NATIVE_UINT32,
                       interval.image.rawPtr()) < 0)
    throw std::runtime_error("couldn't write dataset " + dataset +
                             " (duplicate interval id?)");

  const char* names[3] = {"mz_lower", "mz_middle", "mz_upper"};
  double values[3] = {interval.mz_lower, interval.mz_middle, interval.mz_upper};
  for (int i = 0; i < 3; ++i)
    if (H5LTset_attribute_double(file_, dataset.c_str(), names[i], &values[i], 1) < 0)
      throw std::runtime_error("couldn't write attribute " + std::string(names[i]) +
                               " of " + dataset);
  ++n_written_;
}

void Hdf5IntervalWriter::close()
{
  if (group_ >= 0) {
    H5Gclose(group_);
    group_ = -1;
  }
  if (file_ >= 0) {
    H5Fclose(file_);
    file_ = -1;
  }
}

Hdf5IntervalWriter::~Hdf5IntervalWriter()
{
  close();
}

size_t exportToHdf5(const std::string& input_filename, const std::string& output_filename,
    const ExportSettings& settings, const bif6::ReaderSettings& reader_settings)
{
  if (settings.min_mz > settings.max_mz)
    throw std::runtime_error("min m/z must not exceed max m/z");
  if (settings.remove_hotspots &&
      !(0 < settings.hotspot_percentile && settings.hotspot_percentile < 100))
    throw std::runtime_error("hotspot percentile must be between 0 and 100");

  bif6::Bif6Reader reader(input_filename, reader_settings);
  Hdf5IntervalWriter writer(output_filename, reader.width(), reader.height());

  std::unique_ptr<progressbar, ProgressBarFinisher> bar;
  if (settings.use_progressbar)
    bar.reset(progressbar_new("Exporting intervals", reader.intervalCount()));

  std::vector<uint32_t> hotspot_removal_buf;
  sims::IntervalImage interval;
  while (reader.readNext(interval)) {
    if (bar)
      progressbar_inc(bar.get());

    if (interval.mz_middle < settings.min_mz || interval.mz_middle > settings.max_mz)
      continue;

    if (settings.remove_hotspots) {
      hotspot_removal_buf.resize(interval.image.size());
      interval.image.removeHotspots(settings.hotspot_percentile, hotspot_removal_buf.data());
    }
    writer.write(interval);
  }

  bar.reset();
  writer.close();
  return writer.intervalsWritten();
}

}
