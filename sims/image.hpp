#pragma once

#include <valarray>
#include <algorithm>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace sims {

// row-major: rows run along the y axis of the raster, columns along x
inline size_t pixelIndex(size_t row, size_t col, size_t width) {
  return row * width + col;
}

template <typename T>
class Image {
  std::valarray<T> intensities_;
  size_t height_, width_;
  public:
  Image() : height_(0), width_(0) {}

  Image(size_t height, size_t width) :
    intensities_(height * width), height_(height), width_(width)
  {
  }

  size_t height() const { return height_; }
  size_t width() const { return width_; }
  size_t size() const { return intensities_.size(); }

  void resize(size_t height, size_t width) {
    if (height * width != intensities_.size())
      intensities_.resize(height * width);
    height_ = height;
    width_ = width;
  }

  const T& intensity(size_t row, size_t col) const {
    return intensities_[pixelIndex(row, col, width_)];
  }

  T& intensity(size_t row, size_t col) {
    return intensities_[pixelIndex(row, col, width_)];
  }

  T* rawPtr() { return size() > 0 ? &intensities_[0] : nullptr; }
  const T* rawPtr() const { return size() > 0 ? &intensities_[0] : nullptr; }

  const std::valarray<T>& intensities() const { return intensities_; }

  std::pair<size_t, size_t> shape() const {
    return std::make_pair(height(), width());
  }

  // clips every intensity above the given percentile of the non-zero ones
  void removeHotspots(double percentile, T* tmpbuf=nullptr) {
    assert(0 < percentile && percentile < 100);
    std::vector<T> tmp;
    if (tmpbuf == nullptr) {
      tmp.resize(height() * width());
      tmpbuf = tmp.data();
    }
    T* pend = tmpbuf;
    for (T i: intensities_)
      if (i > 0)
        *pend++ = i;
    if (tmpbuf == pend)
      return; // empty image
    size_t k = size_t((pend - tmpbuf) * percentile) / 100;
    std::nth_element(tmpbuf, tmpbuf + k, pend);
    T threshold = tmpbuf[k];
    for (T& i: intensities_)
      if (i > threshold)
        i = threshold;
  }

  bool operator==(const Image& other) const {
    if (height_ != other.height_ || width_ != other.width_)
      return false;
    return std::equal(std::begin(intensities_), std::end(intensities_),
                      std::begin(other.intensities_));
  }

  bool operator!=(const Image& other) const { return !(*this == other); }
};

typedef Image<uint32_t> ImageU32;
typedef Image<float> ImageF;

}
