#pragma once

#include "sims/image.hpp"

#include <cstdint>

namespace sims {

// One m/z band of a TOF-SIMS acquisition and its intensity map.
struct IntervalImage {
  uint32_t id;

  double mz_lower;
  double mz_middle;
  double mz_upper;

  ImageU32 image;

  IntervalImage() : id(0), mz_lower(0), mz_middle(0), mz_upper(0) {}

  size_t height() const { return image.height(); }
  size_t width() const { return image.width(); }

  // the total-ion-count image is stored with id 0, normally as the first interval
  bool isTicImage() const { return id == 0; }

  uint64_t totalCounts() const {
    uint64_t sum = 0;
    for (auto x: image.intensities())
      sum += x;
    return sum;
  }

  uint32_t maxIntensity() const {
    return image.size() > 0 ? image.intensities().max() : 0;
  }

  bool containsMz(double mz) const {
    return mz_lower <= mz && mz <= mz_upper;
  }
};

}
