#ifndef PLUGEVAL_TESTS_COMMON_CLI_DISPATCH_HPP_
#define PLUGEVAL_TESTS_COMMON_CLI_DISPATCH_HPP_

#include "plugeval/cli/router.hpp"

#include <iostream>
#include <sstream>
#include <streambuf>
#include <string>
#include <vector>

namespace plugeval::tests::common {

inline int DispatchArgs(const std::vector<std::string>& argv_storage) {
  std::vector<char*> argv;
  argv.reserve(argv_storage.size());
  for (const auto& arg : argv_storage) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  return plugeval::cli::Dispatch(static_cast<int>(argv.size()), argv.data());
}

// Redirects std::cout into a buffer for the lifetime of the object.
class ScopedCoutCapture {
public:
  ScopedCoutCapture() : previous_(std::cout.rdbuf(buffer_.rdbuf())) {}
  ~ScopedCoutCapture() {
    std::cout.rdbuf(previous_);
  }
  ScopedCoutCapture(const ScopedCoutCapture&) = delete;
  ScopedCoutCapture& operator=(const ScopedCoutCapture&) = delete;

  std::string Text() const {
    return buffer_.str();
  }

private:
  std::ostringstream buffer_;
  std::streambuf* previous_ = nullptr;
};

// Dispatches and returns the exit code, capturing stdout into `output`.
inline int DispatchArgsCapture(const std::vector<std::string>& argv_storage, std::string& output) {
  ScopedCoutCapture capture;
  const int exit_code = DispatchArgs(argv_storage);
  output = capture.Text();
  return exit_code;
}

} // namespace plugeval::tests::common

#endif // PLUGEVAL_TESTS_COMMON_CLI_DISPATCH_HPP_
