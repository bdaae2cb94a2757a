// cffi cdef of libsims, declared for C++ in cffi/bif6.hpp and cffi/common.hpp
const char* sims_strerror();

typedef struct {
  uint32_t id;
  double mz_lower;
  double mz_middle;
  double mz_upper;
} IntervalInfo;

typedef void* Bif6Reader;
Bif6Reader bif6_reader_new(const char*);
void bif6_reader_free(Bif6Reader);
int bif6_reader_interval_count(Bif6Reader);
int bif6_reader_height(Bif6Reader);
int bif6_reader_width(Bif6Reader);
int bif6_reader_next(Bif6Reader, IntervalInfo* info, uint32_t* pixels);
void bif6_reader_close(Bif6Reader);
