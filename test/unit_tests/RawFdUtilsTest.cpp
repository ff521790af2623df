#include "RawFdUtils.hpp"

#include "TestHeaders.hpp"

using namespace ptymux;

TEST_CASE("Bytes survive a pipe", "[RawFdUtils]") {
  int fds[2];
  REQUIRE(::pipe(fds) == 0);

  string message = "line one\nline two\n";
  RawFdUtils::writeAll(fds[1], message.data(), message.size());
  RawFdUtils::closeFd(&fds[1]);
  REQUIRE(fds[1] == -1);

  string received;
  char buf[4];
  while (true) {
    size_t bytesRead = RawFdUtils::readSome(fds[0], buf, sizeof(buf));
    if (bytesRead == 0) {
      break;
    }
    received.append(buf, bytesRead);
  }
  REQUIRE(received == message);
  RawFdUtils::closeFd(&fds[0]);
  RawFdUtils::closeFd(&fds[0]);
}

TEST_CASE("Descriptor errors are reported", "[RawFdUtils]") {
  char buf[1];
  REQUIRE_THROWS_AS(RawFdUtils::readSome(-1, buf, 1), std::runtime_error);
  REQUIRE_THROWS_AS(RawFdUtils::writeAll(-1, "x", 1), std::runtime_error);

  int fds[2];
  REQUIRE(::pipe(fds) == 0);
  ::close(fds[0]);
  REQUIRE_THROWS_WITH(RawFdUtils::writeAll(fds[1], "x", 1), strerror(EPIPE));
  ::close(fds[1]);
}

TEST_CASE("Duplicates are close-on-exec", "[RawFdUtils]") {
  int fds[2];
  REQUIRE(::pipe(fds) == 0);
  int copy = RawFdUtils::dupCloexec(fds[0]);
  REQUIRE(copy != fds[0]);
  REQUIRE((::fcntl(copy, F_GETFD) & FD_CLOEXEC) != 0);
  RawFdUtils::closeFd(&copy);
  ::close(fds[0]);
  ::close(fds[1]);
}
