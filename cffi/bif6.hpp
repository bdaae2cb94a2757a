#pragma once

#include "cffi/common.hpp"
#include "bif6/reader.hpp"

#include <cstdint>

// C++ view of the entry points listed in sims.h; the handle is the reader itself.

extern "C" {

typedef struct {
  uint32_t id;
  double mz_lower;
  double mz_middle;
  double mz_upper;
} IntervalInfo;

SIMS_EXTERN bif6::Bif6Reader* bif6_reader_new(const char* filename);
SIMS_EXTERN void bif6_reader_free(bif6::Bif6Reader* reader);
SIMS_EXTERN int bif6_reader_interval_count(bif6::Bif6Reader* reader);
SIMS_EXTERN int bif6_reader_height(bif6::Bif6Reader* reader);
SIMS_EXTERN int bif6_reader_width(bif6::Bif6Reader* reader);
SIMS_EXTERN int bif6_reader_next(bif6::Bif6Reader* reader,
                                 IntervalInfo* info, uint32_t* pixels);
SIMS_EXTERN void bif6_reader_close(bif6::Bif6Reader* reader);

}
