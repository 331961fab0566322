#include "LoggingContext.hpp"

namespace lt {
shared_ptr<LoggingContext> LoggingContext::fromEnvironment(
    shared_ptr<SocketHandler> socketHandler, bool showDebug) {
  auto socketPath = GetEnv(LT_OUTPUT_SOCKET_ENV);
  if (socketPath) {
    try {
      auto client =
          TunnelClient::connect(socketHandler, SocketEndpoint(*socketPath));
      VLOG(1) << "Forwarding output through tunnel " << *socketPath;
      return make_shared<LoggingContext>(client, client);
    } catch (const std::runtime_error& e) {
      LOG(WARNING) << "Could not connect to tunnel " << *socketPath << ": "
                   << e.what() << ", using the console";
      ::unsetenv(LT_OUTPUT_SOCKET_ENV.c_str());
    }
  }
  return make_shared<LoggingContext>(make_shared<ConsoleLogSink>(showDebug),
                                     shared_ptr<TunnelClient>());
}

void LoggingContext::shutdown(int64_t timeoutMs) {
  if (tunnelClient) {
    tunnelClient->destroy(timeoutMs);
  }
}
}  // namespace lt
