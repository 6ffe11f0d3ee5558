#pragma once
#include <stdexcept>
#include <string>

namespace normhash {

// Source file missing, unreadable, or failing mid-read.
class input_error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Destination cannot be created, written or flushed.
class output_error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

} // namespace normhash
