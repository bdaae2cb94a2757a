#pragma once

#include "bif6/errors.hpp"
#include "sims/interval.hpp"

#include <cstdint>
#include <cstddef>

namespace bif6 {

struct ReaderSettings {
  // upper bound for the raster width and height, guards against corrupt headers
  uint32_t max_dimension = 8192;
};

const size_t RECORD_METADATA_SIZE = sizeof(uint32_t) + 3 * sizeof(float);

// BIF6 pixel samples are unsigned 32-bit counts in every record of a file
const size_t SAMPLE_SIZE = sizeof(uint32_t);

// Decodes a single interval record; knows nothing about the records around it.
class RecordCodec {
  uint32_t width_, height_;
  uint32_t max_dimension_;

 public:
  RecordCodec(uint32_t width, uint32_t height,
              const ReaderSettings& settings = ReaderSettings());

  uint32_t width() const { return width_; }
  uint32_t height() const { return height_; }

  size_t metadataSize() const { return RECORD_METADATA_SIZE; }
  size_t payloadSize() const { return size_t(width_) * height_ * SAMPLE_SIZE; }
  size_t recordSize() const { return metadataSize() + payloadSize(); }

  // Fills id and m/z bounds from RECORD_METADATA_SIZE bytes, then validates
  // the bounds ordering and the raster dimensions.
  void decodeMetadata(const char* buf, const Location& where,
                      sims::IntervalImage& interval) const;

  void checkDimensions(const Location& where) const;

  // Reads payloadSize() bytes of row-major samples into the image.
  void decodePixels(const char* buf, sims::ImageU32& image) const;
};

}
