#include "StructuredMessages.hpp"

namespace lt {
const vector<string> STRUCTURED_MESSAGE_TYPES = {
    "agent_session_start", "agent_session_end",   "agent_iteration_start",
    "agent_step_start",    "agent_step_end",      "llm_thinking",
    "llm_response",        "llm_tool_use",        "llm_tool_result",
    "llm_status",          "todo_update",         "file_write",
    "file_edit",           "file_change_summary", "command_exec",
    "command_result",      "review_start",        "review_result",
    "review_verdict",      "workflow_progress",   "failure_report",
    "task_completion",     "execution_summary",   "token_usage",
    "input_required",      "user_terminal_input", "prompt_request",
    "prompt_answered",     "plan_discovery",      "workspace_info",
};

const vector<string> PROMPT_TYPES = {"input", "confirm", "select", "checkbox"};

namespace {
enum class FieldKind {
  STRING,
  NUMBER,
  BOOLEAN,
  OBJECT,
  ARRAY,
  STRING_ARRAY,
  // string, number or boolean
  SCALAR,
  ANY
};

struct FieldRule {
  const char *name;
  FieldKind kind;
  bool required;
};

typedef vector<FieldRule> FieldRules;

bool matchesKind(const json &value, FieldKind kind) {
  switch (kind) {
    case FieldKind::STRING:
      return value.is_string();
    case FieldKind::NUMBER:
      return value.is_number();
    case FieldKind::BOOLEAN:
      return value.is_boolean();
    case FieldKind::OBJECT:
      return value.is_object();
    case FieldKind::ARRAY:
      return value.is_array();
    case FieldKind::STRING_ARRAY:
      if (!value.is_array()) return false;
      for (const auto &element : value) {
        if (!element.is_string()) return false;
      }
      return true;
    case FieldKind::SCALAR:
      return value.is_string() || value.is_number() || value.is_boolean();
    case FieldKind::ANY:
      return true;
  }
  return false;
}

bool checkFields(const json &object, const FieldRules &rules) {
  if (!object.is_object()) {
    return false;
  }
  for (const auto &rule : rules) {
    auto it = object.find(rule.name);
    if (it == object.end()) {
      if (rule.required) {
        return false;
      }
      continue;
    }
    if (!matchesKind(*it, rule.kind)) {
      return false;
    }
  }
  return true;
}

bool checkEach(const json &array, const FieldRules &rules) {
  if (!array.is_array()) {
    return false;
  }
  for (const auto &element : array) {
    if (!checkFields(element, rules)) {
      return false;
    }
  }
  return true;
}

const FieldKind S = FieldKind::STRING;
const FieldKind N = FieldKind::NUMBER;
const FieldKind B = FieldKind::BOOLEAN;
const FieldKind O = FieldKind::OBJECT;
const FieldKind A = FieldKind::ARRAY;
const FieldKind SA = FieldKind::STRING_ARRAY;
const FieldKind SC = FieldKind::SCALAR;
const FieldKind ANY = FieldKind::ANY;
const bool REQ = true;
const bool OPT = false;

const map<string, FieldRules> &topLevelRules() {
  static const map<string, FieldRules> rules = {
      {"agent_session_start",
       {{"executor", S, OPT},
        {"mode", S, OPT},
        {"planId", N, OPT},
        {"sessionId", S, OPT},
        {"threadId", S, OPT},
        {"tools", SA, OPT},
        {"mcpServers", SA, OPT}}},
      {"agent_session_end",
       {{"success", B, REQ},
        {"sessionId", S, OPT},
        {"threadId", S, OPT},
        {"durationMs", N, OPT},
        {"costUsd", N, OPT},
        {"turns", N, OPT},
        {"summary", S, OPT}}},
      {"agent_iteration_start",
       {{"iterationNumber", N, REQ},
        {"taskTitle", S, OPT},
        {"taskDescription", S, OPT}}},
      {"agent_step_start",
       {{"phase", S, REQ},
        {"executor", S, OPT},
        {"stepNumber", N, OPT},
        {"attempt", N, OPT},
        {"message", S, OPT}}},
      {"agent_step_end",
       {{"phase", S, REQ}, {"success", B, REQ}, {"summary", S, OPT}}},
      {"llm_thinking", {{"text", S, REQ}}},
      {"llm_response", {{"text", S, REQ}, {"isUserRequest", B, OPT}}},
      {"llm_tool_use",
       {{"toolName", S, REQ}, {"inputSummary", S, OPT}, {"input", ANY, OPT}}},
      {"llm_tool_result",
       {{"toolName", S, REQ},
        {"resultSummary", S, OPT},
        {"result", ANY, OPT}}},
      {"llm_status",
       {{"status", S, REQ}, {"detail", S, OPT}, {"source", S, OPT}}},
      {"todo_update", {{"items", A, REQ}, {"source", S, OPT}}},
      {"file_write", {{"path", S, REQ}, {"lineCount", N, REQ}}},
      {"file_edit", {{"path", S, REQ}, {"diff", S, REQ}}},
      {"file_change_summary", {{"changes", A, REQ}}},
      {"command_exec", {{"command", S, REQ}, {"cwd", S, OPT}}},
      {"command_result",
       {{"command", S, OPT},
        {"cwd", S, OPT},
        {"exitCode", N, REQ},
        {"stdout", S, OPT},
        {"stderr", S, OPT}}},
      {"review_start", {{"executor", S, OPT}, {"planId", N, OPT}}},
      {"review_result",
       {{"issues", A, REQ},
        {"recommendations", SA, REQ},
        {"actionItems", SA, REQ}}},
      {"review_verdict", {{"verdict", S, REQ}, {"fixInstructions", S, OPT}}},
      {"workflow_progress", {{"message", S, REQ}, {"phase", S, OPT}}},
      {"failure_report",
       {{"summary", S, REQ},
        {"requirements", S, OPT},
        {"problems", S, OPT},
        {"solutions", S, OPT},
        {"sourceAgent", S, OPT}}},
      {"task_completion", {{"taskTitle", S, OPT}, {"planComplete", B, REQ}}},
      {"execution_summary", {{"summary", O, REQ}}},
      {"token_usage",
       {{"inputTokens", N, OPT},
        {"cachedInputTokens", N, OPT},
        {"outputTokens", N, OPT},
        {"reasoningTokens", N, OPT},
        {"totalTokens", N, OPT},
        {"rateLimits", O, OPT}}},
      {"input_required", {{"prompt", S, OPT}}},
      {"user_terminal_input", {{"content", S, REQ}}},
      {"prompt_request",
       {{"requestId", S, REQ},
        {"promptType", S, REQ},
        {"promptConfig", O, REQ},
        {"timeoutMs", N, OPT}}},
      {"prompt_answered",
       {{"requestId", S, REQ},
        {"promptType", S, REQ},
        {"value", ANY, OPT},
        {"source", S, REQ}}},
      {"plan_discovery", {{"planId", N, REQ}, {"title", S, REQ}}},
      {"workspace_info",
       {{"workspaceId", S, OPT}, {"path", S, REQ}, {"planFile", S, OPT}}},
  };
  return rules;
}

bool isPromptType(const json &value) {
  return value.is_string() &&
         std::find(PROMPT_TYPES.begin(), PROMPT_TYPES.end(),
                   value.get<string>()) != PROMPT_TYPES.end();
}

bool checkPromptConfig(const json &config) {
  static const FieldRules configRules = {{"message", S, REQ},
                                         {"default", SC, OPT},
                                         {"choices", A, OPT},
                                         {"pageSize", N, OPT},
                                         {"validationHint", S, OPT}};
  static const FieldRules choiceRules = {{"name", S, REQ},
                                         {"value", SC, REQ},
                                         {"description", S, OPT},
                                         {"checked", B, OPT}};
  if (!checkFields(config, configRules)) {
    return false;
  }
  if (config.contains("choices") && !checkEach(config["choices"], choiceRules)) {
    return false;
  }
  return true;
}

bool checkExecutionStep(const json &step) {
  static const FieldRules stepRules = {{"title", S, REQ},
                                       {"executor", S, REQ},
                                       {"success", B, REQ},
                                       {"output", O, OPT}};
  static const FieldRules outputRules = {{"content", S, REQ},
                                         {"steps", A, OPT},
                                         {"metadata", O, OPT},
                                         {"failureDetails", O, OPT}};
  static const FieldRules outputStepRules = {{"title", S, REQ},
                                             {"body", S, REQ}};
  // Unknown failureDetails keys are tolerated, known ones must be strings
  static const FieldRules failureDetailRules = {{"sourceAgent", S, OPT},
                                                {"requirements", S, OPT},
                                                {"problems", S, OPT},
                                                {"solutions", S, OPT}};
  if (!checkFields(step, stepRules)) {
    return false;
  }
  if (!step.contains("output")) {
    return true;
  }
  const json &output = step["output"];
  if (!checkFields(output, outputRules)) {
    return false;
  }
  if (output.contains("steps") && !checkEach(output["steps"], outputStepRules)) {
    return false;
  }
  if (output.contains("failureDetails") &&
      !checkFields(output["failureDetails"], failureDetailRules)) {
    return false;
  }
  return true;
}

bool checkExecutionSummary(const json &summary) {
  static const FieldRules summaryRules = {
      {"planId", S, REQ},        {"planTitle", S, REQ},
      {"planFilePath", S, REQ},  {"mode", S, REQ},
      {"startedAt", S, REQ},     {"endedAt", S, OPT},
      {"durationMs", N, OPT},    {"steps", A, REQ},
      {"changedFiles", SA, REQ}, {"createdFiles", SA, OPT},
      {"deletedFiles", SA, OPT}, {"errors", SA, REQ},
      {"metadata", O, REQ},      {"planInfo", O, OPT}};
  static const FieldRules metadataRules = {{"totalSteps", N, REQ},
                                           {"failedSteps", N, REQ}};
  if (!checkFields(summary, summaryRules)) {
    return false;
  }
  if (!checkFields(summary["metadata"], metadataRules)) {
    return false;
  }
  for (const auto &step : summary["steps"]) {
    if (!checkExecutionStep(step)) {
      return false;
    }
  }
  return true;
}

bool checkNested(const string &type, const json &message) {
  if (type == "todo_update") {
    return checkEach(message["items"], {{"label", S, REQ}, {"status", S, REQ}});
  }
  if (type == "file_change_summary") {
    return checkEach(message["changes"], {{"path", S, REQ}, {"kind", S, REQ}});
  }
  if (type == "review_result") {
    for (const auto &issue : message["issues"]) {
      if (!issue.is_object()) return false;
    }
    return true;
  }
  if (type == "execution_summary") {
    return checkExecutionSummary(message["summary"]);
  }
  if (type == "prompt_request") {
    return isPromptType(message["promptType"]) &&
           checkPromptConfig(message["promptConfig"]);
  }
  if (type == "prompt_answered") {
    const string source = message["source"].get<string>();
    return isPromptType(message["promptType"]) &&
           (source == "terminal" || source == "websocket");
  }
  return true;
}
}  // namespace

bool isKnownStructuredMessageType(const string &type) {
  return topLevelRules().count(type) > 0;
}

bool isValidStructuredMessage(const json &message) {
  if (!message.is_object()) {
    return false;
  }
  auto typeIt = message.find("type");
  if (typeIt == message.end() || !typeIt->is_string()) {
    return false;
  }
  auto timestampIt = message.find("timestamp");
  if (timestampIt == message.end() || !timestampIt->is_string()) {
    return false;
  }
  const string type = typeIt->get<string>();
  auto rulesIt = topLevelRules().find(type);
  if (rulesIt == topLevelRules().end()) {
    return false;
  }
  if (!checkFields(message, rulesIt->second)) {
    return false;
  }
  return checkNested(type, message);
}

json makeStructuredMessage(const string &type) {
  json message;
  message["type"] = type;
  message["timestamp"] = isoTimestamp();
  return message;
}

json makePromptRequestMessage(const string &requestId, const string &promptType,
                              const json &promptConfig, int64_t timeoutMs) {
  json message = makeStructuredMessage("prompt_request");
  message["requestId"] = requestId;
  message["promptType"] = promptType;
  message["promptConfig"] = promptConfig;
  if (timeoutMs > 0) {
    message["timeoutMs"] = timeoutMs;
  }
  return message;
}

json makePromptAnsweredMessage(const string &requestId,
                               const string &promptType,
                               const optional<json> &value,
                               const string &source) {
  json message = makeStructuredMessage("prompt_answered");
  message["requestId"] = requestId;
  message["promptType"] = promptType;
  if (value) {
    message["value"] = *value;
  }
  message["source"] = source;
  return message;
}
}  // namespace lt
