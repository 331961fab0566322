#ifndef __LT_HEADLESS_ADAPTER__
#define __LT_HEADLESS_ADAPTER__

#include "Headers.hpp"
#include "HeadlessTransport.hpp"
#include "LogSink.hpp"
#include "PromptRegistry.hpp"
#include "TunnelMessages.hpp"

namespace lt {
enum class HeadlessConnectionState {
  Disconnected,
  Connecting,
  Connected,
  Draining
};

string headlessConnectionStateName(HeadlessConnectionState state);

struct HeadlessAdapterOptions {
  int64_t maxBufferBytes = 10 * 1024 * 1024;
  int64_t reconnectIntervalMs = 5000;
  // debug() calls are mirrored to the viewer as well as the wrapped sink
  bool forwardDebug = true;
};

/**
 * @brief LogSink that mirrors every call to a remote viewer over a
 * reconnecting websocket while still passing it to a wrapped local sink.
 *
 * Output is numbered with a strictly increasing sequence and kept in a
 * bounded history.  Each time a connection opens, the viewer receives
 * session_info, replay_start, the whole history and replay_end before any
 * new output.  The viewer being absent never blocks or fails a caller.
 *
 * Connection events arrive on the transport's thread, frames are written by
 * the adapter's own drain thread, and log calls come from anywhere; all
 * state is guarded by adapterMutex.
 */
class HeadlessAdapter : public LogSink,
                        public enable_shared_from_this<HeadlessAdapter> {
 public:
  static constexpr int64_t DEFAULT_DESTROY_TIMEOUT_MS = 2000;

  static shared_ptr<HeadlessAdapter> create(
      const string& url, const HeadlessSessionInfo& sessionInfo,
      shared_ptr<LogSink> wrappedSink, shared_ptr<HeadlessTransport> transport,
      const HeadlessAdapterOptions& options = HeadlessAdapterOptions());

  virtual ~HeadlessAdapter();

  virtual void log(const vector<string>& args);
  virtual void error(const vector<string>& args);
  virtual void warn(const vector<string>& args);
  virtual void debug(const vector<string>& args);
  virtual void writeStdout(const string& data);
  virtual void writeStderr(const string& data);
  virtual void sendStructured(const json& message);

  /**
   * @brief Registers interest in the viewer's answer to @p requestId.
   *
   * An error answer from the viewer is logged through the wrapped sink and
   * leaves the wait unresolved.  Cancelling the returned handle rejects it
   * with PromptCancelledError.
   */
  PromptRegistry::PendingPrompt waitForPromptResponse(const string& requestId);

  void setUserInputHandler(UserInputHandler handler);

  /**
   * @brief Stops accepting output and flushes what is already queued.
   *
   * A connection attempt in flight gets up to half of @p timeoutMs to open;
   * an open connection gets the remaining budget to drain.  Pending prompt
   * waits are rejected with TunnelDestroyedError.
   */
  void destroy(int64_t timeoutMs = DEFAULT_DESTROY_TIMEOUT_MS);

  /**
   * @brief Stops immediately, discarding queued output.
   */
  void destroySync();

  HeadlessConnectionState getState();
  int64_t getBufferedOutputBytes();
  int64_t getHistoryOutputBytes();
  size_t getQueueLength();
  size_t getHistoryLength();
  vector<string> getQueuedPayloads();
  vector<string> getHistoryPayloads();
  const string& getUrl() const { return url; }

 protected:
  HeadlessAdapter(const string& url, const HeadlessSessionInfo& sessionInfo,
                  shared_ptr<LogSink> wrappedSink,
                  shared_ptr<HeadlessTransport> transport,
                  const HeadlessAdapterOptions& options);

  // History entries and queue entries are shared, so eviction can find an
  // entry in the queue by identity.
  struct QueuedEntry {
    string payload;
    int64_t outputBytes;
  };
  typedef shared_ptr<QueuedEntry> QueuedEntryPtr;

  void enqueue(const TunnelMessage& message);
  void enforceBufferLimit();
  void maybeConnect();
  void handleOpen(shared_ptr<HeadlessConnection> connection);
  void handleMessage(const string& text);
  void handleDisconnect(shared_ptr<HeadlessConnection> connection);
  void prependHandshakeMessages();
  void runDrainThread();
  void drainQueue(unique_lock<recursive_mutex>& lock,
                  shared_ptr<HeadlessConnection> connection,
                  int64_t generation);
  bool waitForDrain(shared_ptr<HeadlessConnection> connection,
                    int64_t timeoutMs);
  void stopDrainThread();

  shared_ptr<HeadlessTransport> transport;
  string url;
  HeadlessSessionInfo sessionInfo;
  shared_ptr<LogSink> wrappedSink;
  HeadlessAdapterOptions options;

  recursive_mutex adapterMutex;
  condition_variable_any drainCondition;
  HeadlessConnectionState state;
  shared_ptr<HeadlessConnection> socket;
  // Set once the handshake for the current socket has been queued
  bool socketOpened;
  deque<QueuedEntryPtr> queue;
  deque<QueuedEntryPtr> history;
  int64_t bufferedOutputBytes;
  int64_t historyOutputBytes;
  int64_t nextOutputSequence;
  // Bumped whenever the queue is rebuilt or abandoned; a drain pass stops
  // when it no longer matches.
  int64_t drainGeneration;
  optional<int64_t> lastConnectAttemptAt;
  bool destroyed;
  bool drainInProgress;
  bool haltDrain;
  thread drainThread;

  PromptRegistry prompts;
  mutex userInputMutex;
  UserInputHandler userInputHandler;
};
}  // namespace lt

#endif  // __LT_HEADLESS_ADAPTER__
