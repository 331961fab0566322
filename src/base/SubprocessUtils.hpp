#ifndef __LT_SUBPROCESS_UTILS__
#define __LT_SUBPROCESS_UTILS__

#include "Headers.hpp"

namespace lt {
/**
 * @brief Runs helper commands (git and friends) and captures their stdout.
 */
class SubprocessUtils {
 public:
  virtual ~SubprocessUtils() = default;

  /**
   * @brief Runs a command with arguments without a shell.
   * @return The command's stdout, or nullopt when it could not be started or
   * exited non-zero. Stderr of the command is discarded.
   */
  virtual optional<string> SubprocessToString(const string& command,
                                              const vector<string>& args);
};
}  // namespace lt

#endif  // __LT_SUBPROCESS_UTILS__
