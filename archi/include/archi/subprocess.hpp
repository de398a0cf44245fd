#ifndef SUBPROCESS_HPP
#define SUBPROCESS_HPP

#include "archi/io_utils.hpp"

#include <chrono>  // for seconds
#include <string>  // for string
#include <vector>  // for vector

namespace archi::utils {

/// @brief Execute command args via subprocess with combined stdout+stderr,
/// killing the child once the timeout expires.
/// @param vec The arguments to launch.
/// @param timeout Wall-clock limit of the child.
/// @return Exit status and captured output. timed_out is set when the child was killed.
auto exec_timed(const std::vector<std::string>& vec, std::chrono::seconds timeout) noexcept -> CommandResult;

}  // namespace archi::utils

#endif  // SUBPROCESS_HPP
