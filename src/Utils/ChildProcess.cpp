/*****************************************************************
 * File:      ChildProcess.cpp
 * Category:  src/Utils
 * Author:    Bugg Project
 *
 * Purpose:
 *    posix_spawn based child process management.
 *****************************************************************/

#include "Utils/ChildProcess.hpp"

#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace bugg::utils{

using hal::HalResult;

ChildProcess::~ChildProcess(){
  terminate();
}

HalResult ChildProcess::start(const std::vector<std::string>& argv, bool pipe_stdin, bool pipe_stdout){
  if(pid_ > 0) return HalResult::ALREADY_INITIALIZED;
  if(argv.empty()) return HalResult::INVALID_PARAM;

  int in_pipe[2] = {-1, -1};
  int out_pipe[2] = {-1, -1};
  if(pipe_stdin && pipe2(in_pipe, O_CLOEXEC) != 0) return HalResult::NO_MEMORY;
  if(pipe_stdout && pipe2(out_pipe, O_CLOEXEC) != 0){
    if(pipe_stdin){ ::close(in_pipe[0]); ::close(in_pipe[1]); }
    return HalResult::NO_MEMORY;
  }

  posix_spawn_file_actions_t actions;
  posix_spawn_file_actions_init(&actions);
  if(pipe_stdin) posix_spawn_file_actions_adddup2(&actions, in_pipe[0], STDIN_FILENO);
  if(pipe_stdout) posix_spawn_file_actions_adddup2(&actions, out_pipe[1], STDOUT_FILENO);

  std::vector<char*> args;
  args.reserve(argv.size() + 1);
  for(const std::string& a : argv) args.push_back(const_cast<char*>(a.c_str()));
  args.push_back(nullptr);

  pid_t pid = -1;
  int rc = posix_spawnp(&pid, args[0], &actions, nullptr, args.data(), environ);
  posix_spawn_file_actions_destroy(&actions);

  if(pipe_stdin) ::close(in_pipe[0]);
  if(pipe_stdout) ::close(out_pipe[1]);

  if(rc != 0){
    if(pipe_stdin) ::close(in_pipe[1]);
    if(pipe_stdout) ::close(out_pipe[0]);
    return HalResult::DEVICE_NOT_FOUND;
  }

  pid_ = pid;
  stdin_fd_ = pipe_stdin ? in_pipe[1] : -1;
  stdout_fd_ = pipe_stdout ? out_pipe[0] : -1;
  return HalResult::OK;
}

void ChildProcess::closeStdin(){
  if(stdin_fd_ >= 0){
    ::close(stdin_fd_);
    stdin_fd_ = -1;
  }
}

HalResult ChildProcess::readStdout(uint8_t* buffer, size_t length, size_t* bytes_read){
  *bytes_read = 0;
  if(stdout_fd_ < 0) return HalResult::NOT_INITIALIZED;
  while(*bytes_read < length){
    ssize_t n = ::read(stdout_fd_, buffer + *bytes_read, length - *bytes_read);
    if(n < 0){
      if(errno == EINTR) continue;
      return HalResult::READ_FAILED;
    }
    if(n == 0) break;
    *bytes_read += static_cast<size_t>(n);
  }
  return HalResult::OK;
}

HalResult ChildProcess::writeStdin(const uint8_t* data, size_t length){
  if(stdin_fd_ < 0) return HalResult::NOT_INITIALIZED;
  size_t done = 0;
  while(done < length){
    ssize_t n = ::write(stdin_fd_, data + done, length - done);
    if(n < 0){
      if(errno == EINTR) continue;
      return HalResult::WRITE_FAILED;
    }
    done += static_cast<size_t>(n);
  }
  return HalResult::OK;
}

HalResult ChildProcess::wait(int* exit_code){
  if(pid_ <= 0) return HalResult::NOT_INITIALIZED;
  closeStdin();
  int status = 0;
  pid_t r;
  do{
    r = waitpid(pid_, &status, 0);
  }while(r < 0 && errno == EINTR);

  if(stdout_fd_ >= 0){
    ::close(stdout_fd_);
    stdout_fd_ = -1;
  }
  pid_ = -1;
  if(r < 0) return HalResult::ERROR;

  if(exit_code) *exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
  return HalResult::OK;
}

void ChildProcess::terminate(){
  if(pid_ <= 0) return;
  kill(pid_, SIGTERM);
  int code = 0;
  wait(&code);
}

HalResult runCommand(const std::vector<std::string>& argv, int* exit_code){
  ChildProcess child;
  HalResult result = child.start(argv);
  if(result != HalResult::OK) return result;
  int code = -1;
  result = child.wait(&code);
  if(exit_code) *exit_code = code;
  if(result != HalResult::OK) return result;
  return code == 0 ? HalResult::OK : HalResult::ERROR;
}

} // namespace bugg::utils
