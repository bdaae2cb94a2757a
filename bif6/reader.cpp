#include "bif6/reader.hpp"
#include "bif6/fileutils.hpp"
#include "utils/timer.hpp"

#include <fstream>
#include <ios>
#include <sstream>
#include <utility>

namespace {

std::unique_ptr<std::istream> openFile(const std::string& filename) {
  std::unique_ptr<std::ifstream> in(new std::ifstream(filename, std::ios::binary));
  if (!in->is_open())
    throw bif6::IOError("couldn't open " + filename);
  return std::move(in);
}

}

bif6::Bif6Reader::Bif6Reader(const std::string& filename,
                             const ReaderSettings& settings) :
    fn_(filename), in_(openFile(filename)),
    codec_(0, 0, settings),
    offset_(0), n_records_(0), finished_(false)
{
  readHeader();
  codec_ = RecordCodec(header_.width, header_.height, settings);
}

bif6::Bif6Reader::Bif6Reader(std::unique_ptr<std::istream> stream,
                             const ReaderSettings& settings) :
    fn_("<stream>"), in_(std::move(stream)),
    codec_(0, 0, settings),
    offset_(0), n_records_(0), finished_(false)
{
  if (!in_)
    throw IOError("no input stream given");
  readHeader();
  codec_ = RecordCodec(header_.width, header_.height, settings);
}

void bif6::Bif6Reader::readHeader()
{
  header_.read(*in_);
  offset_ = HEADER_SIZE;
}

bool bif6::Bif6Reader::readNext(sims::IntervalImage& interval)
{
  if (finished_)
    return false;

  // a clean end of input can only be detected by attempting a read
  if (in_->peek() == std::char_traits<char>::eof()) {
    if (in_->bad()) {
      finish();
      throw IOError("read error in " + fn_);
    }
    finish();
    return false;
  }

  auto& timer = utils::ProfilingTimer::instance();
  timer.reset();
  timer << "record " << n_records_;
  timer.start();

  // the caller's interval is only touched once the whole record is valid
  try {
    readRecord(scratch_);
  } catch (...) {
    finish();
    throw;
  }

  std::swap(interval, scratch_);
  timer.stop();
  ++n_records_;
  return true;
}

void bif6::Bif6Reader::readRecord(sims::IntervalImage& interval)
{
  Location where{offset_, int64_t(n_records_)};

  buffer_.resize(codec_.metadataSize());
  size_t n = read_some(*in_, &buffer_[0], buffer_.size());
  if (in_->bad())
    throw IOError("read error in " + fn_);
  if (n < codec_.metadataSize()) {
    std::ostringstream ss;
    ss << "truncated interval metadata: expected " << codec_.metadataSize()
       << " bytes, got " << n;
    throw FormatError(FormatError::Truncated, ss.str(), where);
  }

  codec_.decodeMetadata(&buffer_[0], where, interval);
  offset_ += n;

  where.offset = offset_;
  buffer_.resize(codec_.payloadSize());
  n = read_some(*in_, &buffer_[0], buffer_.size());
  if (in_->bad())
    throw IOError("read error in " + fn_);
  if (n < codec_.payloadSize()) {
    std::ostringstream ss;
    ss << "truncated pixel data: expected " << codec_.payloadSize()
       << " bytes, got " << n;
    throw FormatError(FormatError::Truncated, ss.str(), where);
  }

  codec_.decodePixels(&buffer_[0], interval.image);
  offset_ += n;
}

void bif6::Bif6Reader::finish()
{
  finished_ = true;
  close();
}

void bif6::Bif6Reader::close()
{
  finished_ = true;
  in_.reset();
  std::vector<char>().swap(buffer_);
  scratch_ = sims::IntervalImage();
}
