#pragma once

#include <cstddef>
#include <istream>
#include <string>
#include <utility>
#include <vector>

namespace cz {

/*
 * Source of text lines for InputParser.
 */
class AbstractLineReader {
 public:
  virtual ~AbstractLineReader() = default;

  // Reads the next line, without its '\n', into line. Returns false once the input is exhausted.
  virtual bool read_line(std::string& line) = 0;
};

// Reads from a std::istream, e.g. a std::ifstream or a std::istringstream.
class StreamLineReader : public AbstractLineReader {
 public:
  explicit StreamLineReader(std::istream& in) : in_(in) {}

  bool read_line(std::string& line) override { return bool(std::getline(in_, line)); }

 private:
  std::istream& in_;
};

// Reads from lines already held in memory.
class VectorLineReader : public AbstractLineReader {
 public:
  explicit VectorLineReader(std::vector<std::string> lines) : lines_(std::move(lines)) {}

  bool read_line(std::string& line) override {
    if (index_ >= lines_.size()) return false;
    line = lines_[index_++];
    return true;
  }

 private:
  std::vector<std::string> lines_;
  size_t index_ = 0;
};

}  // namespace cz
