#include "PromptConsole.hpp"

#include "TunnelMessages.hpp"

namespace lt {
namespace {
string lowercase(string s) {
  transform(s.begin(), s.end(), s.begin(),
            [](unsigned char c) { return char(::tolower(c)); });
  return s;
}

optional<int> parseChoiceNumber(const string& text, int count) {
  if (text.empty() || text.size() > 6) {
    return nullopt;
  }
  for (char c : text) {
    if (c < '0' || c > '9') {
      return nullopt;
    }
  }
  int number = stoi(text);
  if (number < 1 || number > count) {
    return nullopt;
  }
  return number - 1;
}
}  // namespace

TerminalPromptConsole::~TerminalPromptConsole() {
  if (ownsFds) {
    ::close(inFd);
    if (outFd != inFd) {
      ::close(outFd);
    }
  }
}

shared_ptr<TerminalPromptConsole> TerminalPromptConsole::openControllingTerminal() {
  int ttyFd = ::open("/dev/tty", O_RDWR | O_CLOEXEC);
  if (ttyFd >= 0) {
    return make_shared<TerminalPromptConsole>(ttyFd, ttyFd, true);
  }
  VLOG(1) << "No controlling terminal, prompting on stdin/stderr";
  return make_shared<TerminalPromptConsole>(STDIN_FILENO, STDERR_FILENO, false);
}

json TerminalPromptConsole::ask(const json& promptRequest,
                                shared_ptr<PromptCancellation> cancellation) {
  string promptType = promptRequest.value("promptType", string());
  if (!promptRequest.contains("promptConfig") ||
      !promptRequest["promptConfig"].is_object()) {
    throw std::runtime_error("Prompt request has no promptConfig");
  }
  const json& config = promptRequest["promptConfig"];

  // One prompt at a time on the terminal
  unique_lock<std::timed_mutex> lock(consoleMutex, std::defer_lock);
  while (!lock.try_lock_for(std::chrono::milliseconds(50))) {
    if (cancellation->cancelled) {
      throw PromptCancelledError("Prompt cancelled");
    }
    if (cancellation->expired()) {
      throw PromptTimeoutError("Prompt aborted: no answer within " +
                               to_string(cancellation->timeoutMs) + "ms");
    }
  }

  if (promptType == "confirm") {
    return askConfirm(config, cancellation);
  }
  if (promptType == "input") {
    return askInput(config, cancellation);
  }
  if (promptType == "select") {
    return askSelect(config, cancellation);
  }
  if (promptType == "checkbox") {
    return askCheckbox(config, cancellation);
  }
  throw std::runtime_error("Unsupported prompt type: " + promptType);
}

json TerminalPromptConsole::askConfirm(const json& config,
                                       shared_ptr<PromptCancellation> cancel) {
  bool defaultValue = true;
  if (config.contains("default") && config["default"].is_boolean()) {
    defaultValue = config["default"].get<bool>();
  }
  string message = config.value("message", string());
  while (true) {
    write(message + (defaultValue ? " (Y/n) " : " (y/N) "));
    string answer = lowercase(trim(readLine(cancel)));
    if (answer.empty()) {
      return defaultValue;
    }
    if (answer == "y" || answer == "yes") {
      return true;
    }
    if (answer == "n" || answer == "no") {
      return false;
    }
    write("Please answer y or n.\n");
  }
}

json TerminalPromptConsole::askInput(const json& config,
                                     shared_ptr<PromptCancellation> cancel) {
  optional<string> defaultValue;
  if (config.contains("default") && !config["default"].is_null()) {
    defaultValue = formatLogArg(config["default"]);
  }
  string question = config.value("message", string());
  if (defaultValue) {
    question += " (" + *defaultValue + ")";
  }
  if (config.contains("validationHint") && config["validationHint"].is_string()) {
    question += " [" + config["validationHint"].get<string>() + "]";
  }
  write(question + " ");
  string answer = readLine(cancel);
  if (answer.empty() && defaultValue) {
    return *defaultValue;
  }
  return answer;
}

json TerminalPromptConsole::askSelect(const json& config,
                                      shared_ptr<PromptCancellation> cancel) {
  if (!config.contains("choices") || !config["choices"].is_array() ||
      config["choices"].empty()) {
    throw std::runtime_error("Select prompt has no choices");
  }
  const json& choices = config["choices"];
  int count = int(choices.size());
  int defaultIndex = 0;
  if (config.contains("default")) {
    for (int a = 0; a < count; a++) {
      if (choices[a].is_object() && choices[a].contains("value") &&
          choices[a]["value"] == config["default"]) {
        defaultIndex = a;
        break;
      }
    }
  }

  string menu = config.value("message", string()) + "\n";
  for (int a = 0; a < count; a++) {
    menu += "  " + to_string(a + 1) + ") " + choiceLabel(choices[a]) + "\n";
  }
  write(menu);
  while (true) {
    write("Choose 1-" + to_string(count) + " (" + to_string(defaultIndex + 1) +
          ") ");
    string answer = trim(readLine(cancel));
    if (answer.empty()) {
      return choices[defaultIndex].value("value", json());
    }
    auto index = parseChoiceNumber(answer, count);
    if (index) {
      return choices[*index].value("value", json());
    }
    write("Please enter a number between 1 and " + to_string(count) + ".\n");
  }
}

json TerminalPromptConsole::askCheckbox(const json& config,
                                        shared_ptr<PromptCancellation> cancel) {
  json choices = json::array();
  if (config.contains("choices") && config["choices"].is_array()) {
    choices = config["choices"];
  }
  int count = int(choices.size());

  string menu = config.value("message", string()) + "\n";
  for (int a = 0; a < count; a++) {
    bool checked = choices[a].is_object() && choices[a].value("checked", false);
    menu += "  " + to_string(a + 1) + ") [" + (checked ? "x" : " ") + "] " +
            choiceLabel(choices[a]) + "\n";
  }
  write(menu);
  while (true) {
    write("Numbers separated by commas, empty keeps the checked ones: ");
    string answer = trim(readLine(cancel));
    json selected = json::array();
    if (answer.empty()) {
      for (const auto& choice : choices) {
        if (choice.is_object() && choice.value("checked", false)) {
          selected.push_back(choice.value("value", json()));
        }
      }
      return selected;
    }
    bool valid = true;
    vector<bool> picked(count, false);
    for (const auto& token : split(answer, ',')) {
      string item = trim(token);
      if (item.empty()) {
        continue;
      }
      auto index = parseChoiceNumber(item, count);
      if (!index) {
        valid = false;
        break;
      }
      picked[*index] = true;
    }
    if (valid) {
      for (int a = 0; a < count; a++) {
        if (picked[a]) {
          selected.push_back(choices[a].value("value", json()));
        }
      }
      return selected;
    }
    write("Please enter numbers between 1 and " + to_string(count) + ".\n");
  }
}

string TerminalPromptConsole::choiceLabel(const json& choice) {
  if (!choice.is_object()) {
    return formatLogArg(choice);
  }
  string label;
  if (choice.contains("name") && choice["name"].is_string()) {
    label = choice["name"].get<string>();
  } else {
    label = formatLogArg(choice.value("value", json()));
  }
  if (choice.contains("description") && choice["description"].is_string()) {
    label += " - " + choice["description"].get<string>();
  }
  return label;
}

string TerminalPromptConsole::readLine(shared_ptr<PromptCancellation> cancel) {
  while (true) {
    auto newline = pendingInput.find('\n');
    if (newline != string::npos) {
      string line = pendingInput.substr(0, newline);
      pendingInput.erase(0, newline + 1);
      if (!line.empty() && line.back() == '\r') {
        line.pop_back();
      }
      return line;
    }
    if (cancel->cancelled) {
      throw PromptCancelledError("Prompt cancelled");
    }
    if (cancel->expired()) {
      write("\n");
      throw PromptTimeoutError("Prompt aborted: no answer within " +
                               to_string(cancel->timeoutMs) + "ms");
    }

    fd_set rfd;
    FD_ZERO(&rfd);
    FD_SET(inFd, &rfd);
    timeval tv;
    tv.tv_sec = 0;
    tv.tv_usec = 50 * 1000;
    int rc = select(inFd + 1, &rfd, NULL, NULL, &tv);
    if (rc < 0) {
      if (GetErrno() == EINTR) {
        continue;
      }
      throw std::runtime_error(string("Could not wait for prompt input: ") +
                               strerror(GetErrno()));
    }
    if (rc == 0 || !FD_ISSET(inFd, &rfd)) {
      continue;
    }
    char buf[256];
    ssize_t bytesRead = ::read(inFd, buf, sizeof(buf));
    if (bytesRead < 0) {
      if (GetErrno() == EINTR || GetErrno() == EAGAIN) {
        continue;
      }
      throw std::runtime_error(string("Could not read prompt input: ") +
                               strerror(GetErrno()));
    }
    if (bytesRead == 0) {
      if (!pendingInput.empty()) {
        string line = pendingInput;
        pendingInput.clear();
        return line;
      }
      throw std::runtime_error("Prompt input closed");
    }
    pendingInput.append(buf, bytesRead);
  }
}

void TerminalPromptConsole::write(const string& text) {
  size_t written = 0;
  while (written < text.size()) {
    ssize_t rc = ::write(outFd, text.data() + written, text.size() - written);
    if (rc < 0) {
      if (GetErrno() == EINTR || GetErrno() == EAGAIN) {
        continue;
      }
      throw std::runtime_error(string("Could not show prompt: ") +
                               strerror(GetErrno()));
    }
    written += size_t(rc);
  }
}
}  // namespace lt
