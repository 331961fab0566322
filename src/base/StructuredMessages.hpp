#ifndef __LT_STRUCTURED_MESSAGES__
#define __LT_STRUCTURED_MESSAGES__

#include "Headers.hpp"

namespace lt {
/**
 * @brief The closed set of structured event types that may travel through a
 * tunnel inside a `structured` frame.
 */
extern const vector<string> STRUCTURED_MESSAGE_TYPES;

/** @brief Prompt kinds a prompt_request may carry. */
extern const vector<string> PROMPT_TYPES;

bool isKnownStructuredMessageType(const string &type);

/**
 * @brief Checks the shape of a structured event.
 *
 * The event must be an object with a known `type` and a string `timestamp`.
 * Fields the event type requires must be present with the right JSON kind,
 * and optional fields must have the right kind when present. Unknown extra
 * fields are allowed.
 */
bool isValidStructuredMessage(const json &message);

/**
 * @brief Creates an event skeleton with `type` and the current `timestamp`.
 */
json makeStructuredMessage(const string &type);

/**
 * @brief Builds a prompt_request event.
 * @param promptConfig Object with at least a string `message`.
 * @param timeoutMs Zero means no timeout field.
 */
json makePromptRequestMessage(const string &requestId, const string &promptType,
                              const json &promptConfig, int64_t timeoutMs = 0);

/**
 * @brief Builds a prompt_answered event recording which side answered.
 * @param source "terminal" or "websocket".
 */
json makePromptAnsweredMessage(const string &requestId,
                               const string &promptType,
                               const optional<json> &value,
                               const string &source);
}  // namespace lt

#endif  // __LT_STRUCTURED_MESSAGES__
