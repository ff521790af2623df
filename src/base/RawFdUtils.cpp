#include "RawFdUtils.hpp"

namespace ptymux {
void RawFdUtils::writeAll(int fd, const char* buf, size_t count) {
  if (fd < 0) {
    throw std::runtime_error("Invalid file descriptor for writeAll");
  }
  if (count == 0) {
    return;
  }

  size_t bytesWritten = 0;
  do {
    ssize_t rc = ::write(fd, buf + bytesWritten, count - bytesWritten);
    if (rc < 0) {
      auto localErrno = GetErrno();
      if (localErrno == EINTR) {
        continue;
      }
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK) {
        // The pty input queue is full, give the child time to drain it
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        continue;
      }
      throw std::runtime_error(strerror(localErrno));
    }
    if (rc == 0) {
      throw std::runtime_error("descriptor closed");
    }
    bytesWritten += rc;
  } while (bytesWritten != count);
}

size_t RawFdUtils::readSome(int fd, char* buf, size_t count) {
  if (fd < 0) {
    throw std::runtime_error("Invalid file descriptor for readSome");
  }
  while (true) {
    ssize_t rc = ::read(fd, buf, count);
    if (rc < 0) {
      auto localErrno = GetErrno();
      if (localErrno == EINTR) {
        continue;
      }
      throw std::runtime_error(strerror(localErrno));
    }
    return size_t(rc);
  }
}

int RawFdUtils::dupCloexec(int fd) {
  int newFd = ::fcntl(fd, F_DUPFD_CLOEXEC, 0);
  if (newFd < 0) {
    throw std::runtime_error(strerror(GetErrno()));
  }
  return newFd;
}

void RawFdUtils::closeFd(int* fd) {
  if (*fd >= 0) {
    ::close(*fd);
    *fd = -1;
  }
}
}  // namespace ptymux
