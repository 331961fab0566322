#ifndef __LT_TUNNEL_ERRORS__
#define __LT_TUNNEL_ERRORS__

#include "Headers.hpp"

namespace lt {
/**
 * @brief Base class of every error a pending prompt can be settled with.
 */
class TunnelError : public std::runtime_error {
 public:
  explicit TunnelError(const string &what) : std::runtime_error(what) {}
};

/** @brief No answer arrived within the request's timeout. */
class PromptTimeoutError : public TunnelError {
 public:
  explicit PromptTimeoutError(const string &what) : TunnelError(what) {}
};

/** @brief The connection carrying the request went away. */
class TunnelConnectionLostError : public TunnelError {
 public:
  explicit TunnelConnectionLostError(const string &what) : TunnelError(what) {}
};

/** @brief The owning client or adapter was shut down. */
class TunnelDestroyedError : public TunnelError {
 public:
  explicit TunnelDestroyedError(const string &what) : TunnelError(what) {}
};

/** @brief The waiter gave up on the request itself. */
class PromptCancelledError : public TunnelError {
 public:
  explicit PromptCancelledError(const string &what) : TunnelError(what) {}
};

/** @brief The answering side reported an error instead of a value. */
class PromptResponseError : public TunnelError {
 public:
  explicit PromptResponseError(const string &what) : TunnelError(what) {}
};

/** @brief The request could not be written to the tunnel. */
class TunnelSendError : public TunnelError {
 public:
  explicit TunnelSendError(const string &what) : TunnelError(what) {}
};
}  // namespace lt

#endif  // __LT_TUNNEL_ERRORS__
