#include "FdUtils.hpp"

namespace tabmux {
#define BUF_SIZE (16 * 1024)

void FdUtils::writeAll(int fd, const char* buf, size_t count) {
  if (fd < 0) {
    throw std::runtime_error("Invalid file descriptor for writeAll");
  }
  if (count == 0) {
    return;
  }

  size_t bytesWritten = 0;
  do {
    int rc = ::write(fd, buf + bytesWritten, count - bytesWritten);
    if (rc < 0) {
      auto localErrno = GetErrno();
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK ||
          localErrno == EINTR) {
        // This is fine, just keep retrying
        std::this_thread::sleep_for(std::chrono::microseconds(1000));
        continue;
      }
      STERROR << "Cannot write to fd " << fd << ": " << strerror(localErrno);
      throw std::runtime_error("Cannot write to fd");
    }
    if (rc == 0) {
      throw std::runtime_error("Cannot write to fd: closed");
    }
    bytesWritten += rc;
  } while (bytesWritten != count);
}

string FdUtils::readAvailable(int fd, bool* eof) {
  *eof = false;
  if (fd < 0) {
    throw std::runtime_error("Invalid file descriptor for readAvailable");
  }
  char b[BUF_SIZE];
  int rc = ::read(fd, b, BUF_SIZE);
  if (rc < 0) {
    auto localErrno = GetErrno();
    if (localErrno == EAGAIN || localErrno == EWOULDBLOCK ||
        localErrno == EINTR) {
      return string();
    }
    // A pipe whose writer vanished behaves like EOF
    LOG(INFO) << "Read error on fd " << fd << ": " << strerror(localErrno);
    *eof = true;
    return string();
  }
  if (rc == 0) {
    *eof = true;
    return string();
  }
  return string(b, rc);
}

void FdUtils::setNonBlocking(int fd) {
  int opts = fcntl(fd, F_GETFL);
  FATAL_FAIL(opts);
  FATAL_FAIL(fcntl(fd, F_SETFL, opts | O_NONBLOCK));
}

void FdUtils::setCloseOnExec(int fd) {
  int opts = fcntl(fd, F_GETFD);
  FATAL_FAIL(opts);
  FATAL_FAIL(fcntl(fd, F_SETFD, opts | FD_CLOEXEC));
}
}  // namespace tabmux
