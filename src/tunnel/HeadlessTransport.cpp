#include "HeadlessTransport.hpp"

namespace lt {
optional<WebSocketUrl> parseWebSocketUrl(const string& url) {
  WebSocketUrl result;
  string rest;
  if (startsWith(url, "ws://")) {
    rest = url.substr(5);
  } else if (startsWith(url, "wss://")) {
    result.secure = true;
    rest = url.substr(6);
  } else {
    return nullopt;
  }

  auto slash = rest.find_first_of("/?#");
  string authority = rest.substr(0, slash);
  if (slash == string::npos) {
    result.target = "/";
  } else if (rest[slash] == '/') {
    result.target = rest.substr(slash);
  } else {
    result.target = "/" + rest.substr(slash);
  }
  auto fragment = result.target.find('#');
  if (fragment != string::npos) {
    result.target = result.target.substr(0, fragment);
  }

  // Credentials are not supported and are dropped from the authority
  auto at = authority.rfind('@');
  if (at != string::npos) {
    authority = authority.substr(at + 1);
  }

  if (!authority.empty() && authority[0] == '[') {
    auto close = authority.find(']');
    if (close == string::npos) {
      return nullopt;
    }
    result.host = authority.substr(1, close - 1);
    if (close + 1 < authority.size()) {
      if (authority[close + 1] != ':') {
        return nullopt;
      }
      result.port = authority.substr(close + 2);
    }
  } else {
    auto colon = authority.rfind(':');
    if (colon != string::npos) {
      result.host = authority.substr(0, colon);
      result.port = authority.substr(colon + 1);
    } else {
      result.host = authority;
    }
  }

  if (result.host.empty()) {
    return nullopt;
  }
  if (result.port.empty()) {
    result.port = result.secure ? "443" : "80";
  }
  if (result.port.size() > 5) {
    return nullopt;
  }
  for (char c : result.port) {
    if (c < '0' || c > '9') {
      return nullopt;
    }
  }
  int port = stoi(result.port);
  if (port <= 0 || port > 65535) {
    return nullopt;
  }
  return result;
}
}  // namespace lt
