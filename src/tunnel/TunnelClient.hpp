#ifndef __LT_TUNNEL_CLIENT__
#define __LT_TUNNEL_CLIENT__

#include "FrameCodec.hpp"
#include "Headers.hpp"
#include "LogSink.hpp"
#include "PromptRegistry.hpp"
#include "SocketHandler.hpp"
#include "TunnelMessages.hpp"
#include "WriteBuffer.hpp"

namespace lt {
/**
 * @brief LogSink that forwards every call up a tunnel to the parent
 * process's TunnelServer.
 *
 * Frames are written in call order. When the connection is gone every call
 * becomes a silent no-op; the tunnel never fails the caller's work.
 */
class TunnelClient : public LogSink {
 public:
  static constexpr int64_t DEFAULT_DESTROY_TIMEOUT_MS = 2000;

  /**
   * @brief Connects to the server at @p endpoint.
   * @throws std::runtime_error when nothing accepts the connection.
   */
  static shared_ptr<TunnelClient> connect(
      shared_ptr<SocketHandler> socketHandler, const SocketEndpoint& endpoint);

  virtual ~TunnelClient();

  virtual void log(const vector<string>& args);
  virtual void error(const vector<string>& args);
  virtual void warn(const vector<string>& args);
  virtual void debug(const vector<string>& args);
  virtual void writeStdout(const string& data);
  virtual void writeStderr(const string& data);
  virtual void sendStructured(const json& message);

  /**
   * @brief Queues one frame for the server.
   * @return false when the frame was dropped because the tunnel is not
   * writable.
   */
  bool send(const TunnelMessage& message);

  /**
   * @brief Sends a prompt_request event and blocks until the server answers.
   *
   * @param promptRequest A prompt_request structured event; its `requestId`
   * correlates the answer.
   * @param timeoutMs Zero waits without a deadline.
   * @return The answer value (null when the answer carried no value).
   * @throws PromptTimeoutError, TunnelConnectionLostError,
   * TunnelDestroyedError, PromptResponseError or TunnelSendError.
   */
  json sendPromptRequest(const json& promptRequest, int64_t timeoutMs = 0);

  /**
   * @brief Installs the callback for user_input frames, replacing any
   * previous one. An empty function removes it.
   */
  void setUserInputHandler(UserInputHandler handler);

  bool isConnected();

  /**
   * @brief Stops accepting writes, rejects pending prompts and flushes what
   * was already queued for up to @p timeoutMs before disconnecting.
   */
  void destroy(int64_t timeoutMs = DEFAULT_DESTROY_TIMEOUT_MS);

  /**
   * @brief Like destroy() without waiting for queued bytes.
   */
  void destroySync();

  int pendingPromptCount() { return int(prompts.size()); }

 protected:
  TunnelClient(shared_ptr<SocketHandler> _socketHandler, int _socketFd,
               const SocketEndpoint& _endpoint);

  void run();
  /** @brief Writes as much of the write buffer as the socket takes. */
  bool flushSome();
  void handleServerMessage(const ServerTunnelMessage& message);
  void handleConnectionLost(const string& reason);
  void stopThread();

  shared_ptr<SocketHandler> socketHandler;
  int socketFd;
  SocketEndpoint endpoint;

  recursive_mutex clientMutex;
  bool connected;
  bool destroyed;
  WriteBuffer writeBuffer;
  FrameCodec codec;

  PromptRegistry prompts;

  std::mutex handlerMutex;
  UserInputHandler userInputHandler;

  std::atomic<bool> halt;
  std::thread ioThread;
};
}  // namespace lt

#endif  // __LT_TUNNEL_CLIENT__
