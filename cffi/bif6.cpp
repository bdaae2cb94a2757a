#include "cffi/bif6.hpp"

#include <algorithm>
#include <cstdint>

using namespace cffi;

extern "C" {

SIMS_EXTERN bif6::Bif6Reader* bif6_reader_new(const char* filename) {
  return wrap_catch<bif6::Bif6Reader*>(
      nullptr, [&]() { return new bif6::Bif6Reader(filename); });
}

SIMS_EXTERN void bif6_reader_free(bif6::Bif6Reader* reader) {
  delete reader;
}

SIMS_EXTERN int bif6_reader_interval_count(bif6::Bif6Reader* reader) {
  return reader->intervalCount();
}

SIMS_EXTERN int bif6_reader_height(bif6::Bif6Reader* reader) {
  return reader->height();
}

SIMS_EXTERN int bif6_reader_width(bif6::Bif6Reader* reader) {
  return reader->width();
}

// pixels must hold width * height samples; returns 1, 0 at the end, -1 on error
SIMS_EXTERN int bif6_reader_next(bif6::Bif6Reader* reader,
                                 IntervalInfo* info, uint32_t* pixels) {
  return wrap_catch<int>(-1, [&]() -> int {
    sims::IntervalImage interval;
    if (!reader->readNext(interval))
      return 0;
    info->id = interval.id;
    info->mz_lower = interval.mz_lower;
    info->mz_middle = interval.mz_middle;
    info->mz_upper = interval.mz_upper;
    const uint32_t* src = interval.image.rawPtr();
    std::copy(src, src + interval.image.size(), pixels);
    return 1;
  });
}

SIMS_EXTERN void bif6_reader_close(bif6::Bif6Reader* reader) {
  reader->close();
}

}
