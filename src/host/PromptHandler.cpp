#include "PromptHandler.hpp"

#include "StructuredMessages.hpp"

namespace lt {
namespace {
enum class ConsoleOutcome { Pending, Answered, Ended, Failed };

struct ConsoleAttempt {
  std::mutex attemptMutex;
  ConsoleOutcome outcome = ConsoleOutcome::Pending;
  json value;
  string error;
};
}  // namespace

PromptHandler::PromptHandler(shared_ptr<PromptConsole> _console,
                             shared_ptr<TunnelClient> _upstream,
                             shared_ptr<HeadlessAdapter> _headless,
                             shared_ptr<LogSink> _answerSink)
    : console(_console),
      upstream(_upstream),
      headless(_headless),
      answerSink(_answerSink),
      shuttingDown(false) {}

PromptHandler::~PromptHandler() { shutdown(); }

ServerTunnelMessage PromptHandler::answer(const json& promptRequest) {
  string requestId = promptRequest.value("requestId", string());
  string promptType = promptRequest.value("promptType", string());
  int64_t timeoutMs = 0;
  if (promptRequest.contains("timeoutMs") &&
      promptRequest["timeoutMs"].is_number()) {
    timeoutMs = std::max<int64_t>(0, promptRequest["timeoutMs"].get<int64_t>());
  }

  auto cancellation = make_shared<PromptCancellation>(timeoutMs);
  {
    lock_guard<std::mutex> guard(handlerMutex);
    if (shuttingDown) {
      return ServerTunnelMessage::promptResponse(requestId, nullopt,
                                                 string("Prompt handler stopped"));
    }
    activePrompts.insert(cancellation);
  }

  optional<json> value;
  optional<string> error;
  try {
    if (upstream && upstream->isConnected()) {
      VLOG(1) << "Forwarding prompt " << requestId << " to parent tunnel";
      value = upstream->sendPromptRequest(promptRequest, timeoutMs);
    } else if (headless) {
      value = askConsoleAndViewer(requestId, promptType, promptRequest,
                                  cancellation);
    } else {
      value = console->ask(promptRequest, cancellation);
    }
  } catch (const std::exception& e) {
    LOG(INFO) << "Prompt " << requestId << " failed: " << e.what();
    error = string(e.what());
  }

  {
    lock_guard<std::mutex> guard(handlerMutex);
    activePrompts.erase(cancellation);
  }
  if (error) {
    return ServerTunnelMessage::promptResponse(requestId, nullopt, error);
  }
  return ServerTunnelMessage::promptResponse(requestId, value, nullopt);
}

json PromptHandler::askConsoleAndViewer(
    const string& requestId, const string& promptType,
    const json& promptRequest, shared_ptr<PromptCancellation> cancellation) {
  PromptRegistry::PendingPrompt viewer =
      headless->waitForPromptResponse(requestId);

  auto attempt = make_shared<ConsoleAttempt>();
  shared_ptr<PromptConsole> consoleRef = console;
  thread consoleThread([consoleRef, promptRequest, cancellation, attempt]() {
    json value;
    ConsoleOutcome outcome = ConsoleOutcome::Answered;
    string error;
    try {
      value = consoleRef->ask(promptRequest, cancellation);
    } catch (const PromptTimeoutError& e) {
      outcome = ConsoleOutcome::Ended;
      error = e.what();
    } catch (const PromptCancelledError& e) {
      outcome = ConsoleOutcome::Ended;
      error = e.what();
    } catch (const std::exception& e) {
      outcome = ConsoleOutcome::Failed;
      error = e.what();
    }
    lock_guard<std::mutex> guard(attempt->attemptMutex);
    attempt->outcome = outcome;
    attempt->value = value;
    attempt->error = error;
  });

  optional<json> value;
  string source;
  string failure;
  bool viewerWaiting = true;
  bool consoleFailureLogged = false;
  while (true) {
    if (viewerWaiting) {
      if (viewer.waitFor(std::chrono::milliseconds(20))) {
        try {
          value = viewer.get();
          source = "websocket";
          break;
        } catch (const TunnelError& e) {
          VLOG(1) << "Viewer stopped waiting for prompt " << requestId << ": "
                  << e.what();
          viewerWaiting = false;
        }
      }
    } else {
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    {
      lock_guard<std::mutex> guard(attempt->attemptMutex);
      if (attempt->outcome == ConsoleOutcome::Answered) {
        value = attempt->value;
        source = "terminal";
        break;
      }
      if (attempt->outcome == ConsoleOutcome::Ended) {
        failure = attempt->error;
        break;
      }
      if (attempt->outcome == ConsoleOutcome::Failed) {
        // The viewer can still answer
        if (!viewerWaiting) {
          failure = attempt->error;
          break;
        }
        if (!consoleFailureLogged) {
          LOG(INFO) << "Terminal prompt unavailable (" << attempt->error
                    << "), waiting for the headless viewer";
          consoleFailureLogged = true;
        }
      }
    }

    if (cancellation->cancelled) {
      failure = "Prompt cancelled";
      break;
    }
    if (cancellation->expired()) {
      failure = "Prompt aborted: no answer within " +
                to_string(cancellation->timeoutMs) + "ms";
      break;
    }
  }

  cancellation->cancelled = true;
  viewer.cancel();
  consoleThread.join();

  if (!value) {
    throw std::runtime_error(failure);
  }
  answerSink->sendStructured(
      makePromptAnsweredMessage(requestId, promptType, value, source));
  return *value;
}

void PromptHandler::handleAsync(const json& promptRequest,
                                PromptResponder respond) {
  lock_guard<std::mutex> guard(handlerMutex);
  if (shuttingDown) {
    respond(ServerTunnelMessage::promptResponse(
        promptRequest.value("requestId", string()), nullopt,
        string("Prompt handler stopped")));
    return;
  }
  reapFinishedWorkers();
  auto self = shared_from_this();
  auto finished = make_shared<atomic<bool>>(false);
  PromptWorker worker;
  worker.finished = finished;
  worker.worker = thread([self, promptRequest, respond, finished]() {
    ServerTunnelMessage response = self->answer(promptRequest);
    if (!respond(response)) {
      VLOG(1) << "Prompt " << response.requestId
              << " answered after its client went away";
    }
    *finished = true;
  });
  workers.push_back(std::move(worker));
}

size_t PromptHandler::workerCount() {
  lock_guard<std::mutex> guard(handlerMutex);
  reapFinishedWorkers();
  return workers.size();
}

void PromptHandler::reapFinishedWorkers() {
  auto it = workers.begin();
  while (it != workers.end()) {
    if (!*(it->finished)) {
      ++it;
      continue;
    }
    if (it->worker.get_id() == std::this_thread::get_id()) {
      it->worker.detach();
    } else {
      it->worker.join();
    }
    it = workers.erase(it);
  }
}

void PromptHandler::shutdown() {
  vector<PromptWorker> finished;
  {
    lock_guard<std::mutex> guard(handlerMutex);
    shuttingDown = true;
    for (auto& cancellation : activePrompts) {
      cancellation->cancelled = true;
    }
    finished.swap(workers);
  }
  for (auto& worker : finished) {
    if (worker.worker.get_id() == std::this_thread::get_id()) {
      worker.worker.detach();
    } else {
      worker.worker.join();
    }
  }
}
}  // namespace lt
