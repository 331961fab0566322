#ifndef __LT_PROMPT_CONSOLE__
#define __LT_PROMPT_CONSOLE__

#include "Headers.hpp"
#include "TunnelErrors.hpp"

namespace lt {
/**
 * @brief Lets the owner of a prompt stop it, and carries its deadline.
 */
struct PromptCancellation {
  explicit PromptCancellation(int64_t _timeoutMs = 0)
      : cancelled(false),
        timeoutMs(_timeoutMs),
        deadlineMs(_timeoutMs > 0 ? nowMs() + _timeoutMs : 0) {}

  bool expired() const { return deadlineMs > 0 && nowMs() >= deadlineMs; }

  atomic<bool> cancelled;
  int64_t timeoutMs;
  // Zero means no deadline
  int64_t deadlineMs;
};

/**
 * @brief Asks the question carried by a prompt_request on some interactive
 * surface.
 */
class PromptConsole {
 public:
  virtual ~PromptConsole() {}

  /**
   * @brief Blocks until the question is answered.
   * @return The answer: a bool for confirm, a string for input, the chosen
   * value for select and an array of values for checkbox.
   * @throws PromptCancelledError, PromptTimeoutError, or std::runtime_error
   * when the prompt cannot be shown or answered.
   */
  virtual json ask(const json& promptRequest,
                   shared_ptr<PromptCancellation> cancellation) = 0;
};

/**
 * @brief Line-based prompts on a terminal.
 *
 * Questions are written to outFd and answers read from inFd.  Only one
 * prompt is shown at a time; concurrent prompts wait their turn.
 */
class TerminalPromptConsole : public PromptConsole {
 public:
  TerminalPromptConsole(int _inFd, int _outFd, bool _ownsFds = false)
      : inFd(_inFd), outFd(_outFd), ownsFds(_ownsFds) {}

  virtual ~TerminalPromptConsole();

  /**
   * @brief Uses the controlling terminal (/dev/tty), or stdin and stderr
   * when the process has none.
   */
  static shared_ptr<TerminalPromptConsole> openControllingTerminal();

  virtual json ask(const json& promptRequest,
                   shared_ptr<PromptCancellation> cancellation);

 protected:
  json askConfirm(const json& config, shared_ptr<PromptCancellation> cancel);
  json askInput(const json& config, shared_ptr<PromptCancellation> cancel);
  json askSelect(const json& config, shared_ptr<PromptCancellation> cancel);
  json askCheckbox(const json& config, shared_ptr<PromptCancellation> cancel);

  string readLine(shared_ptr<PromptCancellation> cancel);
  void write(const string& text);
  static string choiceLabel(const json& choice);

  int inFd;
  int outFd;
  bool ownsFds;
  std::timed_mutex consoleMutex;
  // Bytes read past the end of the last answered line
  string pendingInput;
};
}  // namespace lt

#endif  // __LT_PROMPT_CONSOLE__
