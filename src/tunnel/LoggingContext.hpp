#ifndef __LT_LOGGING_CONTEXT__
#define __LT_LOGGING_CONTEXT__

#include "Headers.hpp"
#include "LogSink.hpp"
#include "SocketHandler.hpp"
#include "TunnelClient.hpp"

namespace lt {
/**
 * @brief The sink a process should send its output to.
 *
 * When $LT_OUTPUT_SOCKET names a reachable tunnel the sink is a TunnelClient
 * to the parent; otherwise it is the local console.
 */
class LoggingContext {
 public:
  /**
   * @brief Connects to the parent tunnel if one is advertised.
   *
   * A tunnel that cannot be reached is reported once in the diagnostic log,
   * LT_OUTPUT_SOCKET is removed from the environment so this process's own
   * children do not try it either, and the console is used instead.
   */
  static shared_ptr<LoggingContext> fromEnvironment(
      shared_ptr<SocketHandler> socketHandler, bool showDebug = false);

  LoggingContext(shared_ptr<LogSink> _sink,
                 shared_ptr<TunnelClient> _tunnelClient)
      : sink(_sink), tunnelClient(_tunnelClient) {}

  shared_ptr<LogSink> getSink() { return sink; }

  // Null when the process is not tunneled
  shared_ptr<TunnelClient> getTunnelClient() { return tunnelClient; }

  bool isTunneled() { return tunnelClient.get() != NULL; }

  /**
   * @brief Flushes and disconnects the tunnel, if any.
   */
  void shutdown(int64_t timeoutMs = TunnelClient::DEFAULT_DESTROY_TIMEOUT_MS);

 protected:
  shared_ptr<LogSink> sink;
  shared_ptr<TunnelClient> tunnelClient;
};
}  // namespace lt

#endif  // __LT_LOGGING_CONTEXT__
