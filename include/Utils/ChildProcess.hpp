/*****************************************************************
 * File:      ChildProcess.hpp
 * Category:  include/Utils
 * Author:    Bugg Project
 *
 * Purpose:
 *    RAII wrapper around posix_spawn for the external tools the
 *    daemon drives (arecord, ffmpeg). Optional pipes on stdin and
 *    stdout; the child is terminated and reaped on destruction.
 *****************************************************************/

#ifndef BUGG_INCLUDE_UTILS_CHILD_PROCESS_HPP_
#define BUGG_INCLUDE_UTILS_CHILD_PROCESS_HPP_

#include "HAL/HalTypes.hpp"
#include <sys/types.h>
#include <string>
#include <vector>

namespace bugg::utils{

class ChildProcess{
public:
  ChildProcess() = default;
  ~ChildProcess();

  ChildProcess(const ChildProcess&) = delete;
  ChildProcess& operator=(const ChildProcess&) = delete;

  /** Spawn argv[0] (searched on PATH)
   * @param argv Program and arguments
   * @param pipe_stdin Connect a pipe to the child's stdin
   * @param pipe_stdout Connect a pipe to the child's stdout
   * @return HalResult::DEVICE_NOT_FOUND if the program cannot be started
   */
  hal::HalResult start(const std::vector<std::string>& argv,
                       bool pipe_stdin = false, bool pipe_stdout = false);

  int stdinFd() const{ return stdin_fd_; }
  int stdoutFd() const{ return stdout_fd_; }

  /** Close our end of the stdin pipe (child sees EOF) */
  void closeStdin();

  /** Read exactly length bytes from stdout unless EOF comes first */
  hal::HalResult readStdout(uint8_t* buffer, size_t length, size_t* bytes_read);

  /** Write all bytes to stdin */
  hal::HalResult writeStdin(const uint8_t* data, size_t length);

  /** Wait for exit
   * @param exit_code Exit status, -1 if killed by a signal
   */
  hal::HalResult wait(int* exit_code);

  /** Send SIGTERM and reap */
  void terminate();

  bool running() const{ return pid_ > 0; }

private:
  pid_t pid_ = -1;
  int stdin_fd_ = -1;
  int stdout_fd_ = -1;
};

/** Run a command to completion
 * @return HalResult::OK only when it exits with status 0
 */
hal::HalResult runCommand(const std::vector<std::string>& argv, int* exit_code = nullptr);

} // namespace bugg::utils

#endif // BUGG_INCLUDE_UTILS_CHILD_PROCESS_HPP_
