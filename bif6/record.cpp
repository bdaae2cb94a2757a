#include "bif6/record.hpp"
#include "bif6/fileutils.hpp"

#include <sstream>

namespace bif6 {

RecordCodec::RecordCodec(uint32_t width, uint32_t height,
                         const ReaderSettings& settings) :
    width_(width), height_(height), max_dimension_(settings.max_dimension)
{
}

void RecordCodec::decodeMetadata(const char* buf, const Location& where,
                                 sims::IntervalImage& interval) const
{
  interval.id = read_le32(buf);
  interval.mz_lower = read_le_float(buf + 4);
  interval.mz_middle = read_le_float(buf + 8);
  interval.mz_upper = read_le_float(buf + 12);

  // also rejects NaN bounds
  if (!(interval.mz_lower <= interval.mz_middle &&
        interval.mz_middle <= interval.mz_upper)) {
    std::ostringstream ss;
    ss << "m/z bounds of interval " << interval.id << " are out of order: "
       << interval.mz_lower << ", " << interval.mz_middle << ", " << interval.mz_upper;
    throw FormatError(FormatError::InvalidRange, ss.str(),
                      Location{where.offset + 4, where.record});
  }

  checkDimensions(where);
}

void RecordCodec::checkDimensions(const Location& where) const {
  if (width_ == 0 || height_ == 0 ||
      width_ > max_dimension_ || height_ > max_dimension_) {
    std::ostringstream ss;
    ss << "invalid image dimensions " << width_ << "x" << height_
       << " (maximum is " << max_dimension_ << ")";
    throw FormatError(FormatError::InvalidDimensions, ss.str(), where);
  }
}

void RecordCodec::decodePixels(const char* buf, sims::ImageU32& image) const {
  image.resize(height_, width_);
  uint32_t* out = image.rawPtr();
  size_t n = size_t(width_) * height_;
  for (size_t i = 0; i < n; ++i, buf += SAMPLE_SIZE)
    out[i] = read_le32(buf);
}

}
