#include "HeadlessAdapter.hpp"

namespace lt {
string headlessConnectionStateName(HeadlessConnectionState state) {
  switch (state) {
    case HeadlessConnectionState::Disconnected:
      return "disconnected";
    case HeadlessConnectionState::Connecting:
      return "connecting";
    case HeadlessConnectionState::Connected:
      return "connected";
    case HeadlessConnectionState::Draining:
      return "draining";
  }
  return "unknown";
}

shared_ptr<HeadlessAdapter> HeadlessAdapter::create(
    const string& url, const HeadlessSessionInfo& sessionInfo,
    shared_ptr<LogSink> wrappedSink, shared_ptr<HeadlessTransport> transport,
    const HeadlessAdapterOptions& options) {
  shared_ptr<HeadlessAdapter> adapter(
      new HeadlessAdapter(url, sessionInfo, wrappedSink, transport, options));
  adapter->drainThread = thread(&HeadlessAdapter::runDrainThread, adapter.get());
  return adapter;
}

HeadlessAdapter::HeadlessAdapter(const string& _url,
                                 const HeadlessSessionInfo& _sessionInfo,
                                 shared_ptr<LogSink> _wrappedSink,
                                 shared_ptr<HeadlessTransport> _transport,
                                 const HeadlessAdapterOptions& _options)
    : transport(_transport),
      url(_url),
      sessionInfo(_sessionInfo),
      wrappedSink(_wrappedSink),
      options(_options),
      state(HeadlessConnectionState::Disconnected),
      socketOpened(false),
      bufferedOutputBytes(0),
      historyOutputBytes(0),
      nextOutputSequence(1),
      drainGeneration(0),
      destroyed(false),
      drainInProgress(false),
      haltDrain(false) {}

HeadlessAdapter::~HeadlessAdapter() { destroySync(); }

void HeadlessAdapter::log(const vector<string>& args) {
  wrappedSink->log(args);
  enqueue(TunnelMessage::logArgs(TunnelMessageType::Log, args));
}

void HeadlessAdapter::error(const vector<string>& args) {
  wrappedSink->error(args);
  enqueue(TunnelMessage::logArgs(TunnelMessageType::Error, args));
}

void HeadlessAdapter::warn(const vector<string>& args) {
  wrappedSink->warn(args);
  enqueue(TunnelMessage::logArgs(TunnelMessageType::Warn, args));
}

void HeadlessAdapter::debug(const vector<string>& args) {
  wrappedSink->debug(args);
  if (options.forwardDebug) {
    enqueue(TunnelMessage::logArgs(TunnelMessageType::Debug, args));
  }
}

void HeadlessAdapter::writeStdout(const string& data) {
  wrappedSink->writeStdout(data);
  enqueue(TunnelMessage::output(TunnelMessageType::Stdout, data));
}

void HeadlessAdapter::writeStderr(const string& data) {
  wrappedSink->writeStderr(data);
  enqueue(TunnelMessage::output(TunnelMessageType::Stderr, data));
}

void HeadlessAdapter::sendStructured(const json& message) {
  wrappedSink->sendStructured(message);
  enqueue(TunnelMessage::structured(message));
}

PromptRegistry::PendingPrompt HeadlessAdapter::waitForPromptResponse(
    const string& requestId) {
  return prompts.waitFor(requestId);
}

void HeadlessAdapter::setUserInputHandler(UserInputHandler handler) {
  lock_guard<mutex> guard(userInputMutex);
  userInputHandler = handler;
}

void HeadlessAdapter::enqueue(const TunnelMessage& message) {
  lock_guard<recursive_mutex> guard(adapterMutex);
  if (destroyed && state != HeadlessConnectionState::Draining) {
    return;
  }
  int64_t seq = nextOutputSequence++;
  auto entry = make_shared<QueuedEntry>();
  entry->payload = dumpJson(makeOutputMessage(seq, message));
  entry->outputBytes = int64_t(entry->payload.size());
  queue.push_back(entry);
  history.push_back(entry);
  bufferedOutputBytes += entry->outputBytes;
  historyOutputBytes += entry->outputBytes;
  enforceBufferLimit();
  maybeConnect();
  drainCondition.notify_all();
}

void HeadlessAdapter::enforceBufferLimit() {
  while (historyOutputBytes > options.maxBufferBytes && !history.empty()) {
    QueuedEntryPtr evicted = history.front();
    history.pop_front();
    historyOutputBytes -= evicted->outputBytes;
    auto it = std::find(queue.begin(), queue.end(), evicted);
    if (it != queue.end()) {
      queue.erase(it);
      bufferedOutputBytes -= evicted->outputBytes;
    }
  }
}

void HeadlessAdapter::maybeConnect() {
  if (destroyed || state == HeadlessConnectionState::Connected ||
      state == HeadlessConnectionState::Connecting) {
    return;
  }
  int64_t now = nowMs();
  if (lastConnectAttemptAt &&
      now - *lastConnectAttemptAt < options.reconnectIntervalMs) {
    return;
  }
  lastConnectAttemptAt = now;
  state = HeadlessConnectionState::Connecting;

  shared_ptr<HeadlessConnection> connection;
  try {
    connection = transport->createConnection(url);
  } catch (const std::runtime_error& e) {
    VLOG(1) << "Could not open headless connection: " << e.what();
    state = HeadlessConnectionState::Disconnected;
    return;
  }
  socket = connection;
  socketOpened = false;

  weak_ptr<HeadlessAdapter> weakSelf = shared_from_this();
  weak_ptr<HeadlessConnection> weakConnection = connection;
  HeadlessConnectionEvents events;
  events.onOpen = [weakSelf, weakConnection]() {
    auto self = weakSelf.lock();
    auto connection = weakConnection.lock();
    if (self && connection) {
      self->handleOpen(connection);
    }
  };
  events.onMessage = [weakSelf](const string& text) {
    auto self = weakSelf.lock();
    if (self) {
      self->handleMessage(text);
    }
  };
  events.onClose = [weakSelf, weakConnection]() {
    auto self = weakSelf.lock();
    auto connection = weakConnection.lock();
    if (self && connection) {
      self->handleDisconnect(connection);
    }
  };
  VLOG(1) << "Connecting to headless viewer at " << url;
  connection->start(events);
}

void HeadlessAdapter::handleOpen(shared_ptr<HeadlessConnection> connection) {
  lock_guard<recursive_mutex> guard(adapterMutex);
  if (socket != connection) {
    return;
  }
  if (destroyed && state != HeadlessConnectionState::Draining) {
    return;
  }
  if (state != HeadlessConnectionState::Draining) {
    state = HeadlessConnectionState::Connected;
  }
  LOG(INFO) << "Connected to headless viewer at " << url << ", replaying "
            << history.size() << " messages";
  prependHandshakeMessages();
  socketOpened = true;
  drainCondition.notify_all();
}

void HeadlessAdapter::prependHandshakeMessages() {
  drainGeneration++;
  queue.clear();
  bufferedOutputBytes = 0;

  auto pushControl = [this](const json& message) {
    auto entry = make_shared<QueuedEntry>();
    entry->payload = dumpJson(message);
    entry->outputBytes = 0;
    queue.push_back(entry);
  };
  pushControl(makeSessionInfoMessage(sessionInfo));
  pushControl(makeReplayStartMessage());
  for (const auto& entry : history) {
    queue.push_back(entry);
    bufferedOutputBytes += entry->outputBytes;
  }
  pushControl(makeReplayEndMessage());
}

void HeadlessAdapter::handleMessage(const string& text) {
  json value = json::parse(text, nullptr, false);
  if (value.is_discarded()) {
    VLOG(1) << "Ignoring malformed headless message";
    return;
  }
  auto message = serverTunnelMessageFromJson(value);
  if (!message) {
    VLOG(1) << "Ignoring unknown headless message: " << text;
    return;
  }

  if (message->type == ServerTunnelMessageType::UserInput) {
    UserInputHandler handler;
    {
      lock_guard<mutex> guard(userInputMutex);
      handler = userInputHandler;
    }
    if (handler) {
      try {
        handler(message->content);
      } catch (const std::exception& e) {
        LOG(ERROR) << "Error in user input handler: " << e.what();
      } catch (...) {
        LOG(ERROR) << "Error in user input handler: non-standard exception";
      }
    }
    return;
  }

  const string& requestId = message->requestId;
  if (!prompts.has(requestId)) {
    return;
  }
  if (message->error) {
    wrappedSink->warn(
        {"Headless prompt error for " + requestId + ": " + *message->error});
    prompts.remove(requestId);
    return;
  }
  prompts.resolve(requestId, message->value ? *message->value : json());
}

void HeadlessAdapter::handleDisconnect(
    shared_ptr<HeadlessConnection> connection) {
  lock_guard<recursive_mutex> guard(adapterMutex);
  if (socket != connection) {
    return;
  }
  LOG(INFO) << "Disconnected from headless viewer at " << url;
  socket.reset();
  socketOpened = false;
  if (state != HeadlessConnectionState::Draining) {
    state = HeadlessConnectionState::Disconnected;
  }
  connection->close();
  drainCondition.notify_all();
}

void HeadlessAdapter::runDrainThread() {
  el::Helpers::setThreadName("headless-drain");
  unique_lock<recursive_mutex> lock(adapterMutex);
  while (!haltDrain) {
    if (socket && socketOpened && socket->isOpen() && !queue.empty()) {
      drainInProgress = true;
      drainQueue(lock, socket, drainGeneration);
      drainInProgress = false;
      drainCondition.notify_all();
      continue;
    }
    drainCondition.wait_for(lock, std::chrono::milliseconds(100));
  }
}

void HeadlessAdapter::drainQueue(unique_lock<recursive_mutex>& lock,
                                 shared_ptr<HeadlessConnection> connection,
                                 int64_t generation) {
  while (!haltDrain && socket == connection && connection->isOpen() &&
         !queue.empty() && drainGeneration == generation) {
    QueuedEntryPtr entry = queue.front();
    lock.unlock();
    bool sent = connection->send(entry->payload);
    lock.lock();
    if (!sent) {
      handleDisconnect(connection);
      return;
    }
    // The head may have been evicted or the queue rebuilt while sending
    if (drainGeneration == generation && !queue.empty() &&
        queue.front() == entry) {
      queue.pop_front();
      bufferedOutputBytes -= entry->outputBytes;
    }
    lock.unlock();
    std::this_thread::yield();
    lock.lock();
  }
}

bool HeadlessAdapter::waitForDrain(shared_ptr<HeadlessConnection> connection,
                                   int64_t timeoutMs) {
  int64_t deadline = nowMs() + timeoutMs;
  unique_lock<recursive_mutex> lock(adapterMutex);
  while (true) {
    if (queue.empty() && !drainInProgress) {
      return true;
    }
    if (socket != connection) {
      return false;
    }
    int64_t remaining = deadline - nowMs();
    if (remaining <= 0) {
      return false;
    }
    drainCondition.wait_for(
        lock, std::chrono::milliseconds(std::min<int64_t>(remaining, 10)));
  }
}

void HeadlessAdapter::stopDrainThread() {
  {
    lock_guard<recursive_mutex> guard(adapterMutex);
    haltDrain = true;
    drainCondition.notify_all();
  }
  if (drainThread.joinable()) {
    if (drainThread.get_id() == std::this_thread::get_id()) {
      drainThread.detach();
    } else {
      drainThread.join();
    }
  }
}

void HeadlessAdapter::destroySync() {
  shared_ptr<HeadlessConnection> connection;
  {
    lock_guard<recursive_mutex> guard(adapterMutex);
    destroyed = true;
    drainGeneration++;
    connection = socket;
    socket.reset();
    socketOpened = false;
    state = HeadlessConnectionState::Disconnected;
  }
  prompts.rejectAll(std::make_exception_ptr(
      TunnelDestroyedError("HeadlessAdapter destroyed")));
  if (connection) {
    connection->close();
  }
  stopDrainThread();
}

void HeadlessAdapter::destroy(int64_t timeoutMs) {
  {
    lock_guard<recursive_mutex> guard(adapterMutex);
    if (destroyed) {
      return;
    }
    destroyed = true;
    state = HeadlessConnectionState::Draining;
  }
  prompts.rejectAll(std::make_exception_ptr(
      TunnelDestroyedError("HeadlessAdapter destroyed")));

  timeoutMs = std::max<int64_t>(0, timeoutMs);
  int64_t deadline = nowMs() + timeoutMs;
  int64_t connectDeadline = nowMs() + timeoutMs / 2;
  while (nowMs() < connectDeadline) {
    {
      lock_guard<recursive_mutex> guard(adapterMutex);
      if (!socket || !socket->isConnecting()) {
        break;
      }
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }

  shared_ptr<HeadlessConnection> connection;
  {
    lock_guard<recursive_mutex> guard(adapterMutex);
    connection = socket;
  }
  if (connection) {
    if (connection->isOpen()) {
      drainCondition.notify_all();
      if (!waitForDrain(connection,
                        std::max<int64_t>(0, deadline - nowMs()))) {
        LOG(WARNING) << "Headless output was not fully delivered before "
                        "shutdown";
      }
    }
    connection->close();
  }

  {
    lock_guard<recursive_mutex> guard(adapterMutex);
    socket.reset();
    socketOpened = false;
    state = HeadlessConnectionState::Disconnected;
  }
  stopDrainThread();
}

HeadlessConnectionState HeadlessAdapter::getState() {
  lock_guard<recursive_mutex> guard(adapterMutex);
  return state;
}

int64_t HeadlessAdapter::getBufferedOutputBytes() {
  lock_guard<recursive_mutex> guard(adapterMutex);
  return bufferedOutputBytes;
}

int64_t HeadlessAdapter::getHistoryOutputBytes() {
  lock_guard<recursive_mutex> guard(adapterMutex);
  return historyOutputBytes;
}

size_t HeadlessAdapter::getQueueLength() {
  lock_guard<recursive_mutex> guard(adapterMutex);
  return queue.size();
}

size_t HeadlessAdapter::getHistoryLength() {
  lock_guard<recursive_mutex> guard(adapterMutex);
  return history.size();
}

vector<string> HeadlessAdapter::getQueuedPayloads() {
  lock_guard<recursive_mutex> guard(adapterMutex);
  vector<string> payloads;
  for (const auto& entry : queue) {
    payloads.push_back(entry->payload);
  }
  return payloads;
}

vector<string> HeadlessAdapter::getHistoryPayloads() {
  lock_guard<recursive_mutex> guard(adapterMutex);
  vector<string> payloads;
  for (const auto& entry : history) {
    payloads.push_back(entry->payload);
  }
  return payloads;
}
}  // namespace lt
