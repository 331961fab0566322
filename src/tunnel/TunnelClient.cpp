#include "TunnelClient.hpp"

#define BUF_SIZE (16 * 1024)

namespace lt {
shared_ptr<TunnelClient> TunnelClient::connect(
    shared_ptr<SocketHandler> socketHandler, const SocketEndpoint& endpoint) {
  int fd = socketHandler->connect(endpoint);
  if (fd < 0) {
    throw std::runtime_error("Could not connect to tunnel at " +
                             endpoint.getName() + ": " + strerror(GetErrno()));
  }
  return shared_ptr<TunnelClient>(
      new TunnelClient(socketHandler, fd, endpoint));
}

TunnelClient::TunnelClient(shared_ptr<SocketHandler> _socketHandler,
                           int _socketFd, const SocketEndpoint& _endpoint)
    : socketHandler(_socketHandler),
      socketFd(_socketFd),
      endpoint(_endpoint),
      connected(true),
      destroyed(false),
      halt(false) {
  ioThread = std::thread(&TunnelClient::run, this);
}

TunnelClient::~TunnelClient() { destroySync(); }

void TunnelClient::log(const vector<string>& args) {
  send(TunnelMessage::logArgs(TunnelMessageType::Log, args));
  LOG(INFO) << joinArgs(args);
}

void TunnelClient::error(const vector<string>& args) {
  send(TunnelMessage::logArgs(TunnelMessageType::Error, args));
  LOG(ERROR) << joinArgs(args);
}

void TunnelClient::warn(const vector<string>& args) {
  send(TunnelMessage::logArgs(TunnelMessageType::Warn, args));
  LOG(WARNING) << joinArgs(args);
}

void TunnelClient::debug(const vector<string>& args) {
  send(TunnelMessage::logArgs(TunnelMessageType::Debug, args));
  VLOG(1) << "[DEBUG] " << joinArgs(args);
}

void TunnelClient::writeStdout(const string& data) {
  send(TunnelMessage::output(TunnelMessageType::Stdout, data));
  VLOG(1) << data;
}

void TunnelClient::writeStderr(const string& data) {
  send(TunnelMessage::output(TunnelMessageType::Stderr, data));
  VLOG(1) << data;
}

void TunnelClient::sendStructured(const json& message) {
  send(TunnelMessage::structured(message));
  VLOG(1) << ConsoleLogSink::describeStructured(message);
}

bool TunnelClient::send(const TunnelMessage& message) {
  string frame = FrameCodec::encode(tunnelMessageToJson(message));
  lock_guard<recursive_mutex> guard(clientMutex);
  if (!connected || destroyed) {
    return false;
  }
  if (!writeBuffer.enqueue(frame)) {
    LOG(WARNING) << "Tunnel write buffer full, dropping "
                 << tunnelMessageTypeName(message.type) << " frame";
    return false;
  }
  // Write straight away when the socket has room; the io thread picks up
  // whatever is left.
  return flushSome();
}

bool TunnelClient::flushSome() {
  lock_guard<recursive_mutex> guard(clientMutex);
  while (connected && writeBuffer.hasPendingData()) {
    size_t count;
    const char* data = writeBuffer.peekData(&count);
    ssize_t written = socketHandler->write(socketFd, data, count);
    if (written > 0) {
      writeBuffer.consume(written);
      continue;
    }
    if (written < 0 && (GetErrno() == EAGAIN || GetErrno() == EWOULDBLOCK ||
                        GetErrno() == EINTR)) {
      return true;
    }
    handleConnectionLost(string("Tunnel write failed: ") +
                         strerror(GetErrno()));
    return false;
  }
  return connected;
}

json TunnelClient::sendPromptRequest(const json& promptRequest,
                                     int64_t timeoutMs) {
  if (!promptRequest.is_object() || !promptRequest.contains("requestId") ||
      !promptRequest["requestId"].is_string()) {
    throw std::invalid_argument("Prompt request has no requestId");
  }
  const string requestId = promptRequest["requestId"].get<string>();
  {
    lock_guard<recursive_mutex> guard(clientMutex);
    if (destroyed) {
      throw TunnelDestroyedError("Tunnel adapter destroyed");
    }
    if (!connected) {
      throw TunnelConnectionLostError("Tunnel is not connected");
    }
  }

  auto pending = prompts.waitFor(requestId);
  if (!send(TunnelMessage::structured(promptRequest))) {
    pending.cancelWith(std::make_exception_ptr(
        TunnelSendError("Failed to send prompt request over tunnel")));
    return pending.get();
  }

  if (timeoutMs > 0 && !pending.waitFor(std::chrono::milliseconds(timeoutMs))) {
    pending.cancelWith(std::make_exception_ptr(PromptTimeoutError(
        "Prompt request timed out after " + to_string(timeoutMs) + "ms")));
  }
  // Throws when the request was rejected
  return pending.get();
}

void TunnelClient::setUserInputHandler(UserInputHandler handler) {
  lock_guard<std::mutex> guard(handlerMutex);
  userInputHandler = handler;
}

bool TunnelClient::isConnected() {
  lock_guard<recursive_mutex> guard(clientMutex);
  return connected && !destroyed;
}

void TunnelClient::run() {
  el::Helpers::setThreadName("tunnel-client");
  string buf(BUF_SIZE, '\0');
  while (!halt) {
    bool wantWrite;
    {
      lock_guard<recursive_mutex> guard(clientMutex);
      if (!connected) {
        break;
      }
      wantWrite = writeBuffer.hasPendingData();
    }
    fd_set rfds, wfds;
    FD_ZERO(&rfds);
    FD_ZERO(&wfds);
    FD_SET(socketFd, &rfds);
    if (wantWrite) {
      FD_SET(socketFd, &wfds);
    }
    timeval tv;
    tv.tv_sec = 0;
    tv.tv_usec = 10000;
    int numFdsSet = select(socketFd + 1, &rfds, &wfds, NULL, &tv);
    if (numFdsSet == -1 && GetErrno() == EINTR) {
      continue;
    }
    FATAL_FAIL(numFdsSet);
    if (numFdsSet == 0) {
      continue;
    }

    if (FD_ISSET(socketFd, &wfds)) {
      flushSome();
    }
    if (!FD_ISSET(socketFd, &rfds)) {
      continue;
    }

    vector<json> frames;
    {
      lock_guard<recursive_mutex> guard(clientMutex);
      if (!connected) {
        break;
      }
      ssize_t bytesRead = socketHandler->read(socketFd, &buf[0], buf.size());
      if (bytesRead > 0) {
        frames = codec.feedJson(string(&buf[0], bytesRead));
      } else if (bytesRead == 0) {
        handleConnectionLost("Tunnel connection closed");
      } else if (GetErrno() != EAGAIN && GetErrno() != EWOULDBLOCK &&
                 GetErrno() != EINTR) {
        handleConnectionLost(string("Tunnel connection error: ") +
                             strerror(GetErrno()));
      }
    }
    for (const auto& frame : frames) {
      auto message = serverTunnelMessageFromJson(frame);
      if (!message) {
        VLOG(1) << "Dropping invalid server frame";
        continue;
      }
      handleServerMessage(*message);
    }
  }
}

void TunnelClient::handleServerMessage(const ServerTunnelMessage& message) {
  if (message.type == ServerTunnelMessageType::PromptResponse) {
    if (message.error) {
      prompts.reject(message.requestId, std::make_exception_ptr(
                                            PromptResponseError(*message.error)));
    } else {
      prompts.resolve(message.requestId,
                      message.value ? *message.value : json());
    }
    return;
  }

  UserInputHandler handler;
  {
    lock_guard<std::mutex> guard(handlerMutex);
    handler = userInputHandler;
  }
  if (!handler) {
    VLOG(1) << "Dropping user input, no handler installed";
    return;
  }
  try {
    handler(message.content);
  } catch (const std::exception& e) {
    LOG(ERROR) << "User input handler error: " << e.what();
  } catch (...) {
    LOG(ERROR) << "User input handler threw a non-standard exception";
  }
}

void TunnelClient::handleConnectionLost(const string& reason) {
  lock_guard<recursive_mutex> guard(clientMutex);
  if (!connected) {
    return;
  }
  LOG(WARNING) << reason << " (" << endpoint << ")";
  connected = false;
  writeBuffer.clear();
  prompts.rejectAll(
      std::make_exception_ptr(TunnelConnectionLostError(reason)));
}

void TunnelClient::stopThread() {
  halt = true;
  if (ioThread.joinable()) {
    if (ioThread.get_id() == std::this_thread::get_id()) {
      // Called from the user input handler
      ioThread.detach();
    } else {
      ioThread.join();
    }
  }
}

void TunnelClient::destroy(int64_t timeoutMs) {
  {
    lock_guard<recursive_mutex> guard(clientMutex);
    if (destroyed) {
      return;
    }
    destroyed = true;
  }
  prompts.rejectAll(
      std::make_exception_ptr(TunnelDestroyedError("Tunnel adapter destroyed")));

  int64_t deadline = nowMs() + timeoutMs;
  while (nowMs() < deadline) {
    {
      lock_guard<recursive_mutex> guard(clientMutex);
      if (!connected || !writeBuffer.hasPendingData()) {
        break;
      }
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  destroySync();
}

void TunnelClient::destroySync() {
  {
    lock_guard<recursive_mutex> guard(clientMutex);
    destroyed = true;
  }
  prompts.rejectAll(
      std::make_exception_ptr(TunnelDestroyedError("Tunnel adapter destroyed")));
  stopThread();
  lock_guard<recursive_mutex> guard(clientMutex);
  if (socketFd >= 0) {
    connected = false;
    writeBuffer.clear();
    socketHandler->close(socketFd);
    socketFd = -1;
  }
}
}  // namespace lt
