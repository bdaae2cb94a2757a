#include "bif6/iterator.hpp"

#include <stdexcept>
#include <utility>

bif6::IntervalIterator::IntervalIterator(const std::string& filename,
                                         const ReaderSettings& settings) :
    reader_(new Bif6Reader(filename, settings)),
    have_current_(false), exhausted_(false)
{
}

bif6::IntervalIterator::IntervalIterator(std::unique_ptr<Bif6Reader> reader) :
    reader_(std::move(reader)),
    have_current_(false), exhausted_(false)
{
  if (!reader_)
    throw std::invalid_argument("IntervalIterator requires a reader");
}

void bif6::IntervalIterator::pull()
{
  try {
    have_current_ = reader_->readNext(current_);
  } catch (...) {
    exhausted_ = true;
    throw;
  }
  if (!have_current_)
    exhausted_ = true;
}

bool bif6::IntervalIterator::hasNext()
{
  if (have_current_)
    return true;
  if (exhausted_)
    return false;
  pull();
  return have_current_;
}

sims::IntervalImage bif6::IntervalIterator::next()
{
  if (!hasNext())
    throw std::out_of_range("no more intervals in " + reader_->filename());
  have_current_ = false;
  return std::move(current_);
}

void bif6::IntervalIterator::close()
{
  have_current_ = false;
  exhausted_ = true;
  reader_->close();
}

bif6::IntervalIterator bif6::parseBif6(const std::string& filename,
                                       const ReaderSettings& settings)
{
  return IntervalIterator(filename, settings);
}
