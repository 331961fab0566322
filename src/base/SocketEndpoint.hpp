#ifndef __LT_SOCKET_ENDPOINT__
#define __LT_SOCKET_ENDPOINT__

#include "Headers.hpp"

namespace lt {
/**
 * @brief Address of a local tunnel endpoint: the filesystem path of a Unix
 * stream socket.
 */
class SocketEndpoint {
 public:
  SocketEndpoint() : name("") {}

  explicit SocketEndpoint(const string &_name) : name(_name) {}

  const string &getName() const { return name; }

  bool empty() const { return name.empty(); }

  bool operator==(const SocketEndpoint &other) const {
    return name == other.name;
  }

 protected:
  string name;
};

inline ostream &operator<<(ostream &os, const SocketEndpoint &self) {
  return os << self.getName(), os;
}

/**
 * @brief Creates a fresh endpoint path inside a private temp directory.
 *
 * The directory is created with mode 0700 so only the owning user can reach
 * the socket.
 */
inline SocketEndpoint createPrivateEndpoint(const string &prefix) {
  string dirPattern = GetTempDirectory() + prefix + "_XXXXXXXX";
  if (mkdtemp(&dirPattern[0]) == NULL) {
    throw std::runtime_error(string("Could not create socket directory: ") +
                             strerror(GetErrno()));
  }
  // sun_path is 108 bytes including the terminator
  return SocketEndpoint(dirPattern + "/" + genRandomAlphaNum(8) + ".sock");
}
}  // namespace lt

#endif  // __LT_SOCKET_ENDPOINT__
