#ifndef __LT_LOG_SINK__
#define __LT_LOG_SINK__

#include "Headers.hpp"
#include "TunnelMessages.hpp"

namespace lt {
// Receives user_input text sent down from a viewer or parent process
typedef function<void(const string& content)> UserInputHandler;

/**
 * @brief Destination for a process's application output.
 *
 * Implementations print to the console, forward up a tunnel, or mirror to
 * a headless viewer. They are called from several threads.
 */
class LogSink {
 public:
  virtual ~LogSink() {}

  virtual void log(const vector<string>& args) = 0;
  virtual void error(const vector<string>& args) = 0;
  virtual void warn(const vector<string>& args) = 0;
  virtual void debug(const vector<string>& args) = 0;
  virtual void writeStdout(const string& data) = 0;
  virtual void writeStderr(const string& data) = 0;
  virtual void sendStructured(const json& message) = 0;

  /**
   * @brief Routes a decoded tunnel frame to the matching call.
   */
  void dispatch(const TunnelMessage& message);
};

/**
 * @brief Prints output to the local terminal.
 */
class ConsoleLogSink : public LogSink {
 public:
  explicit ConsoleLogSink(bool _showDebug = false) : showDebug(_showDebug) {}
  virtual ~ConsoleLogSink() {}

  virtual void log(const vector<string>& args);
  virtual void error(const vector<string>& args);
  virtual void warn(const vector<string>& args);
  virtual void debug(const vector<string>& args);
  virtual void writeStdout(const string& data);
  virtual void writeStderr(const string& data);
  virtual void sendStructured(const json& message);

  /**
   * @brief One-line rendering of a structured event.
   */
  static string describeStructured(const json& message);

 protected:
  void writeLine(ostream& out, const string& line);

  bool showDebug;
  std::mutex consoleMutex;
};

string joinArgs(const vector<string>& args);
}  // namespace lt

#endif  // __LT_LOG_SINK__
