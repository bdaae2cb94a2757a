#pragma once

#include "bif6/reader.hpp"
#include "sims/interval.hpp"

#include <cstddef>
#include <iterator>
#include <memory>
#include <string>

namespace bif6 {

// Lazy forward-only sequence of the intervals of one BIF6 stream. Nothing is
// read until an element is requested; starting over requires a new iterator.
class IntervalIterator {
  std::unique_ptr<Bif6Reader> reader_;
  sims::IntervalImage current_;
  bool have_current_;
  bool exhausted_;

  void pull();

 public:
  explicit IntervalIterator(const std::string& filename,
                            const ReaderSettings& settings = ReaderSettings());

  explicit IntervalIterator(std::unique_ptr<Bif6Reader> reader);

  IntervalIterator(IntervalIterator&&) = default;
  IntervalIterator& operator=(IntervalIterator&&) = default;

  // May throw the reader's errors; after an error it returns false.
  bool hasNext();

  // Throws std::out_of_range when the sequence is exhausted.
  sims::IntervalImage next();

  void close();

  const FileHeader& header() const { return reader_->header(); }
  const Bif6Reader& reader() const { return *reader_; }

  class InputIterator : public std::iterator<std::input_iterator_tag,
                                             sims::IntervalImage> {
    IntervalIterator* seq_;
    sims::IntervalImage value_;

    void advance() {
      if (seq_ == nullptr)
        return;
      if (seq_->hasNext())
        value_ = seq_->next();
      else
        seq_ = nullptr;
    }

   public:
    InputIterator() : seq_(nullptr) {}
    explicit InputIterator(IntervalIterator* seq) : seq_(seq) { advance(); }

    const sims::IntervalImage& operator*() const { return value_; }
    const sims::IntervalImage* operator->() const { return &value_; }

    InputIterator& operator++() {
      advance();
      return *this;
    }

    bool operator==(const InputIterator& other) const { return seq_ == other.seq_; }
    bool operator!=(const InputIterator& other) const { return seq_ != other.seq_; }
  };

  InputIterator begin() { return InputIterator(this); }
  InputIterator end() { return InputIterator(); }
};

IntervalIterator parseBif6(const std::string& filename,
                           const ReaderSettings& settings = ReaderSettings());

}
