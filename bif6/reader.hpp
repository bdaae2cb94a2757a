#pragma once

#include "bif6/fileheader.hpp"
#include "bif6/record.hpp"
#include "sims/interval.hpp"

#include <string>
#include <istream>
#include <memory>
#include <vector>
#include <cstdint>

namespace bif6 {

class Bif6Reader {
  std::string fn_;
  std::unique_ptr<std::istream> in_;

  FileHeader header_;
  RecordCodec codec_;

  std::vector<char> buffer_;
  sims::IntervalImage scratch_;
  uint64_t offset_;
  size_t n_records_;
  bool finished_;

  void readHeader();
  void readRecord(sims::IntervalImage& interval);
  void finish();

 public:
  Bif6Reader(const std::string& filename,
             const ReaderSettings& settings = ReaderSettings());

  Bif6Reader(std::unique_ptr<std::istream> stream,
             const ReaderSettings& settings = ReaderSettings());

  // Returns false once the stream is exhausted. A format error releases the
  // stream, after which every call returns false.
  bool readNext(sims::IntervalImage& interval);

  const FileHeader& header() const { return header_; }
  uint32_t intervalCount() const { return header_.interval_count; }
  uint32_t height() const { return header_.height; }
  uint32_t width() const { return header_.width; }

  uint64_t offset() const { return offset_; }
  size_t recordsRead() const { return n_records_; }

  bool isOpen() const { return in_ != nullptr; }
  void close();
  const std::string& filename() const { return fn_; }
};

}
