#ifndef __LT_PROMPT_HANDLER__
#define __LT_PROMPT_HANDLER__

#include "HeadlessAdapter.hpp"
#include "Headers.hpp"
#include "LogSink.hpp"
#include "PromptConsole.hpp"
#include "TunnelClient.hpp"
#include "TunnelServer.hpp"

namespace lt {
/**
 * @brief Answers the prompt requests a host's children send up its tunnel.
 *
 * A host that is itself tunneled passes the request to its parent.  At the
 * root the question is asked on the console, raced against the headless
 * viewer when one is attached; the first answer wins and a prompt_answered
 * event records where it came from.
 */
class PromptHandler : public enable_shared_from_this<PromptHandler> {
 public:
  /**
   * @param upstream Parent tunnel, or null at the root.
   * @param headless Viewer mirror, or null when there is none.
   * @param answerSink Receives the prompt_answered events.
   */
  PromptHandler(shared_ptr<PromptConsole> _console,
                shared_ptr<TunnelClient> _upstream,
                shared_ptr<HeadlessAdapter> _headless,
                shared_ptr<LogSink> _answerSink);

  virtual ~PromptHandler();

  /**
   * @brief Answers one prompt_request, blocking until it is settled.
   * @return The prompt_response to send back.  Failures are reported in its
   * error field, never thrown.
   */
  ServerTunnelMessage answer(const json& promptRequest);

  /**
   * @brief Answers on a worker thread and hands the result to @p respond.
   * Suitable as a TunnelServer prompt handler.
   */
  void handleAsync(const json& promptRequest, PromptResponder respond);

  /**
   * @brief Cancels console prompts in progress and waits for every worker.
   * Requests forwarded upstream end when the upstream tunnel is destroyed.
   */
  void shutdown();

  /** @brief Workers still running, after joining the ones that are done. */
  size_t workerCount();

 protected:
  struct PromptWorker {
    thread worker;
    shared_ptr<atomic<bool>> finished;
  };

  // Joins workers whose prompt is settled.  handlerMutex must be held.
  void reapFinishedWorkers();

  json askConsoleAndViewer(const string& requestId, const string& promptType,
                           const json& promptRequest,
                           shared_ptr<PromptCancellation> cancellation);

  shared_ptr<PromptConsole> console;
  shared_ptr<TunnelClient> upstream;
  shared_ptr<HeadlessAdapter> headless;
  shared_ptr<LogSink> answerSink;

  std::mutex handlerMutex;
  set<shared_ptr<PromptCancellation>> activePrompts;
  vector<PromptWorker> workers;
  bool shuttingDown;
};
}  // namespace lt

#endif  // __LT_PROMPT_HANDLER__
