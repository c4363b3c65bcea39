#pragma once

#include <stdexcept>
#include <string>

namespace rctx {

// Work handed to an executor that no longer accepts it.
class RejectedExecutionError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// A handle was cancelled before its task started.
class CancelledError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// A bulk wait ran past its deadline with nothing to return.
class TimeoutError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

} // namespace rctx
