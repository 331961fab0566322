#include "TunnelServer.hpp"

#define BUF_SIZE (64 * 1024)

namespace lt {
TunnelServer::TunnelServer(shared_ptr<PipeSocketHandler> _socketHandler,
                           const SocketEndpoint& _endpoint,
                           shared_ptr<LogSink> _sink,
                           const TunnelServerHandlers& _handlers)
    : socketHandler(_socketHandler),
      endpoint(_endpoint),
      sink(_sink),
      handlers(_handlers),
      nextConnectionId(1),
      halt(false),
      stopped(false) {
  listenFds = socketHandler->listen(endpoint);
  LOG(INFO) << "Tunnel server listening on " << endpoint;
  serverThread = std::thread(&TunnelServer::run, this);
}

TunnelServer::~TunnelServer() { close(); }

void TunnelServer::close() {
  halt = true;
  if (serverThread.joinable()) {
    if (serverThread.get_id() == std::this_thread::get_id()) {
      // Called from a sink callback; the loop exits on its own
      serverThread.detach();
    } else {
      serverThread.join();
    }
  }
  shutdown();
}

bool TunnelServer::isClosed() {
  lock_guard<recursive_mutex> guard(serverMutex);
  return stopped;
}

void TunnelServer::shutdown() {
  map<int64_t, shared_ptr<TunnelConnection>> toClose;
  {
    lock_guard<recursive_mutex> guard(serverMutex);
    if (stopped) {
      return;
    }
    stopped = true;
    toClose.swap(connections);
    socketHandler->stopListening(endpoint);
  }
  for (auto& it : toClose) {
    closeConnection(it.second);
  }
  LOG(INFO) << "Tunnel server on " << endpoint << " closed";
}

void TunnelServer::run() {
  el::Helpers::setThreadName("tunnel-server");
  while (!halt) {
    fd_set rfds;
    FD_ZERO(&rfds);
    int maxFd = 0;
    vector<shared_ptr<TunnelConnection>> activeConnections;
    {
      lock_guard<recursive_mutex> guard(serverMutex);
      if (stopped) {
        break;
      }
      for (int fd : listenFds) {
        FD_SET(fd, &rfds);
        maxFd = max(maxFd, fd);
      }
      for (auto& it : connections) {
        activeConnections.push_back(it.second);
        FD_SET(it.second->fd, &rfds);
        maxFd = max(maxFd, it.second->fd);
      }
    }
    if (maxFd >= FD_SETSIZE) {
      STFATAL << "Tried to select() on too many FDs";
    }

    timeval tv;
    tv.tv_sec = 0;
    tv.tv_usec = 10000;
    int numFdsSet = select(maxFd + 1, &rfds, NULL, NULL, &tv);
    if (numFdsSet == -1 && GetErrno() == EINTR) {
      continue;
    }
    FATAL_FAIL(numFdsSet);
    if (numFdsSet == 0 || halt) {
      continue;
    }

    for (int fd : listenFds) {
      if (FD_ISSET(fd, &rfds)) {
        acceptNewConnection(fd);
      }
    }
    for (auto& connection : activeConnections) {
      if (halt) {
        break;
      }
      if (!FD_ISSET(connection->fd, &rfds)) {
        continue;
      }
      vector<json> frames = readFromConnection(connection);
      for (const auto& frame : frames) {
        if (halt) {
          break;
        }
        handleFrame(connection, frame);
      }
    }
  }
}

void TunnelServer::acceptNewConnection(int listenFd) {
  int clientFd = socketHandler->accept(listenFd);
  if (clientFd < 0) {
    return;
  }
  lock_guard<recursive_mutex> guard(serverMutex);
  int64_t id = nextConnectionId++;
  connections[id] = make_shared<TunnelConnection>(clientFd, id);
  VLOG(1) << "Tunnel client " << id << " connected on fd " << clientFd;
}

vector<json> TunnelServer::readFromConnection(
    shared_ptr<TunnelConnection> connection) {
  // At most one read per select() wakeup
  string buf(BUF_SIZE, '\0');
  ssize_t bytesRead;
  int readErrno;
  {
    lock_guard<std::mutex> guard(connection->connectionMutex);
    if (connection->closed) {
      return vector<json>();
    }
    bytesRead = socketHandler->read(connection->fd, &buf[0], buf.size());
    readErrno = GetErrno();
  }
  if (bytesRead > 0) {
    return connection->codec.feedJson(string(&buf[0], bytesRead));
  }
  if (bytesRead < 0 && (readErrno == EAGAIN || readErrno == EWOULDBLOCK ||
                        readErrno == EINTR)) {
    return vector<json>();
  }
  // EOF or error.  An unterminated trailing frame is dropped with the
  // connection.
  if (connection->codec.pendingBytes()) {
    VLOG(1) << "Dropping " << connection->codec.pendingBytes()
            << " bytes of unterminated frame from client " << connection->id;
  }
  {
    lock_guard<recursive_mutex> guard(serverMutex);
    connections.erase(connection->id);
  }
  closeConnection(connection);
  return vector<json>();
}

void TunnelServer::handleFrame(shared_ptr<TunnelConnection> connection,
                               const json& frame) {
  auto message = tunnelMessageFromJson(frame);
  if (!message) {
    VLOG(1) << "Dropping invalid frame from client " << connection->id;
    return;
  }
  sink->dispatch(*message);

  if (message->type != TunnelMessageType::Structured ||
      message->message["type"] != "prompt_request") {
    return;
  }
  if (!handlers.onPromptRequest) {
    LOG(INFO) << "No prompt handler registered, prompt "
              << message->message["requestId"].get<string>()
              << " stays unanswered";
    return;
  }
  weak_ptr<TunnelConnection> weakConnection = connection;
  shared_ptr<SocketHandler> responseSocketHandler = socketHandler;
  PromptResponder respond =
      [weakConnection,
       responseSocketHandler](const ServerTunnelMessage& response) -> bool {
    auto lockedConnection = weakConnection.lock();
    if (!lockedConnection) {
      return false;
    }
    return writeFrame(responseSocketHandler, lockedConnection,
                      serverTunnelMessageToJson(response));
  };
  handlers.onPromptRequest(message->message, respond);
}

bool TunnelServer::writeFrame(shared_ptr<SocketHandler> socketHandler,
                              shared_ptr<TunnelConnection> connection,
                              const json& frame) {
  string encoded = FrameCodec::encode(frame);
  lock_guard<std::mutex> guard(connection->connectionMutex);
  if (connection->closed) {
    return false;
  }
  int result = socketHandler->writeAllOrReturn(connection->fd, encoded.data(),
                                               encoded.size());
  if (result != int(encoded.size())) {
    LOG(WARNING) << "Failed to write to tunnel client " << connection->id;
    return false;
  }
  return true;
}

int TunnelServer::broadcastUserInput(const string& content) {
  vector<shared_ptr<TunnelConnection>> targets;
  {
    lock_guard<recursive_mutex> guard(serverMutex);
    for (auto& it : connections) {
      targets.push_back(it.second);
    }
  }
  json frame = serverTunnelMessageToJson(ServerTunnelMessage::userInput(content));
  int written = 0;
  for (auto& connection : targets) {
    if (writeFrame(socketHandler, connection, frame)) {
      written++;
    }
  }
  return written;
}

int TunnelServer::getConnectionCount() {
  lock_guard<recursive_mutex> guard(serverMutex);
  return int(connections.size());
}

void TunnelServer::closeConnection(shared_ptr<TunnelConnection> connection) {
  lock_guard<std::mutex> guard(connection->connectionMutex);
  if (connection->closed) {
    return;
  }
  connection->closed = true;
  VLOG(1) << "Tunnel client " << connection->id << " disconnected";
  socketHandler->close(connection->fd);
}
}  // namespace lt
