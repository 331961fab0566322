#ifndef __LT_PROMPT_REGISTRY__
#define __LT_PROMPT_REGISTRY__

#include "Headers.hpp"
#include "TunnelErrors.hpp"

namespace lt {
/**
 * @brief Correlates prompt request ids with the callers waiting for their
 * answers.
 *
 * Each outstanding request id maps to one waiter. Responses, timeouts,
 * cancellation and shutdown settle or drop entries by id; a response for an
 * id that is not registered is ignored.
 */
class PromptRegistry {
 protected:
  typedef std::promise<json> Resolution;

  struct State {
    mutex registryMutex;
    unordered_map<string, shared_ptr<Resolution>> pending;
  };

 public:
  /**
   * @brief Handle held by the caller that registered a request id.
   */
  class PendingPrompt {
   public:
    PendingPrompt(const string& _requestId, shared_ptr<Resolution> _resolution,
                  weak_ptr<State> _state)
        : requestId(_requestId),
          resolution(_resolution),
          result(_resolution->get_future().share()),
          state(_state) {}

    const string& getRequestId() const { return requestId; }

    /**
     * @brief Blocks until the request is settled.
     * @return The answer value.
     * @throws TunnelError (or a subclass) when the request was rejected.
     */
    json get() const { return result.get(); }

    /**
     * @brief Waits up to @p timeout for the request to settle.
     * @return true when it settled within the timeout.
     */
    bool waitFor(std::chrono::milliseconds timeout) const {
      return result.wait_for(timeout) == std::future_status::ready;
    }

    bool isSettled() const {
      return result.wait_for(std::chrono::seconds(0)) ==
             std::future_status::ready;
    }

    /**
     * @brief Deregisters the request and rejects it with a
     * PromptCancelledError. Only the first call has any effect.
     */
    void cancel() const {
      cancelWith(std::make_exception_ptr(
          PromptCancelledError("Prompt cancelled: " + requestId)));
    }

    /**
     * @brief Like cancel(), with a caller-chosen error.
     */
    void cancelWith(std::exception_ptr error) const;

   protected:
    string requestId;
    // Keeps the answer channel alive after the registry has dropped the
    // entry, so a removed request stays unresolved rather than broken.
    shared_ptr<Resolution> resolution;
    std::shared_future<json> result;
    weak_ptr<State> state;
  };

  PromptRegistry() : state(new State()) {}

  /**
   * @brief Registers a waiter for @p requestId.
   * @throws std::runtime_error when the id is already registered.
   */
  PendingPrompt waitFor(const string& requestId);

  /**
   * @brief Settles the request with a value and deregisters it.
   * @return false when the id was not registered.
   */
  bool resolve(const string& requestId, const json& value);

  /**
   * @brief Settles the request with an error and deregisters it.
   * @return false when the id was not registered.
   */
  bool reject(const string& requestId, std::exception_ptr error);

  /**
   * @brief Deregisters the request without settling it.
   * @return false when the id was not registered.
   */
  bool remove(const string& requestId);

  /**
   * @brief Rejects every registered request with @p error and empties the
   * registry.
   * @return The number of requests rejected.
   */
  int rejectAll(std::exception_ptr error);

  bool has(const string& requestId) const;
  size_t size() const;

 protected:
  shared_ptr<Resolution> take(const string& requestId);

  shared_ptr<State> state;
};
}  // namespace lt

#endif  // __LT_PROMPT_REGISTRY__
