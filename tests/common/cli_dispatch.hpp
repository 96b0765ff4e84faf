#ifndef PACKDOC_TESTS_COMMON_CLI_DISPATCH_HPP_
#define PACKDOC_TESTS_COMMON_CLI_DISPATCH_HPP_

#include "packdoc/cli/router.hpp"

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace packdoc::tests::common {

inline int DispatchArgs(const std::vector<std::string>& argv_storage) {
  std::vector<char*> argv;
  argv.reserve(argv_storage.size());
  for (const auto& arg : argv_storage) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  return packdoc::cli::Dispatch(static_cast<int>(argv.size()), argv.data());
}

// Runs the CLI with stdout and stderr redirected into strings.
inline int DispatchCaptured(const std::vector<std::string>& argv_storage, std::string& stdout_text,
                            std::string& stderr_text) {
  std::ostringstream captured_out;
  std::ostringstream captured_err;
  std::streambuf* original_out = std::cout.rdbuf(captured_out.rdbuf());
  std::streambuf* original_err = std::cerr.rdbuf(captured_err.rdbuf());
  const int exit_code = DispatchArgs(argv_storage);
  std::cout.rdbuf(original_out);
  std::cerr.rdbuf(original_err);

  stdout_text = captured_out.str();
  stderr_text = captured_err.str();
  return exit_code;
}

} // namespace packdoc::tests::common

#endif // PACKDOC_TESTS_COMMON_CLI_DISPATCH_HPP_
