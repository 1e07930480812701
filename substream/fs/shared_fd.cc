//
// Copyright (C) 2026 The Android Open Source Project
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "substream/fs/shared_fd.h"

#include <errno.h>
#include <fcntl.h>
#include <sys/mman.h>
#include <unistd.h>

#include <memory>
#include <string>

#include <android-base/logging.h>

namespace substream {

FileInstance::FileInstance(int fd, int in_errno) : fd_(fd), errno_(in_errno) {
  // Ensure every file descriptor managed by a FileInstance has the CLOEXEC
  // flag
  if (fd_ != -1) {
    TEMP_FAILURE_RETRY(fcntl(fd_, F_SETFD, FD_CLOEXEC));
  }
}

void FileInstance::Close() {
  if (fd_ == -1) {
    errno_ = EBADF;
  } else if (close(fd_) == -1) {
    errno_ = errno;
    LOG(ERROR) << "close(" << fd_ << ") failed: " << StrError();
  }
  fd_ = -1;
}

std::string FileInstance::ProcFdPath() const {
  return "/proc/self/fd/" + std::to_string(fd_);
}

SharedFD SharedFD::Dup(int unmanaged_fd) {
  int fd = fcntl(unmanaged_fd, F_DUPFD_CLOEXEC, 3);
  int error_num = errno;
  return SharedFD(
      std::shared_ptr<FileInstance>(new FileInstance(fd, error_num)));
}

SharedFD SharedFD::Open(const char* path, int flags, mode_t mode) {
  int fd = TEMP_FAILURE_RETRY(open(path, flags | O_CLOEXEC, mode));
  if (fd == -1) {
    return ErrorFD(errno);
  }
  return SharedFD(std::shared_ptr<FileInstance>(new FileInstance(fd, 0)));
}

bool SharedFD::Pipe(SharedFD* fd0, SharedFD* fd1) {
  int fds[2];
  if (pipe2(fds, O_CLOEXEC) == -1) {
    return false;
  }
  *fd0 = std::shared_ptr<FileInstance>(new FileInstance(fds[0], 0));
  *fd1 = std::shared_ptr<FileInstance>(new FileInstance(fds[1], 0));
  return true;
}

SharedFD SharedFD::MemfdCreate(const std::string& name, unsigned int flags) {
  int fd = memfd_create(name.c_str(), flags | MFD_CLOEXEC);
  if (fd == -1) {
    return ErrorFD(errno);
  }
  return std::shared_ptr<FileInstance>(new FileInstance(fd, 0));
}

SharedFD SharedFD::ErrorFD(int error) {
  return SharedFD(std::shared_ptr<FileInstance>(new FileInstance(-1, error)));
}

}  // namespace substream
