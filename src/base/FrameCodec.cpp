#include "FrameCodec.hpp"

#include "TunnelMessages.hpp"

namespace lt {
string FrameCodec::encode(const json& value) { return dumpJson(value) + "\n"; }

vector<string> FrameCodec::feed(const string& chunk) {
  vector<string> lines;
  size_t start = 0;
  while (true) {
    size_t newline = chunk.find('\n', start);
    if (newline == string::npos) {
      break;
    }
    if (discarding) {
      discarding = false;
    } else {
      partial.append(chunk, start, newline - start);
      if (!partial.empty()) {
        lines.push_back(partial);
      }
    }
    partial.clear();
    start = newline + 1;
  }
  if (!discarding) {
    partial.append(chunk, start, string::npos);
    if (partial.size() > MAX_FRAME_BYTES) {
      LOG(WARNING) << "Dropping oversized frame (" << partial.size()
                   << " bytes without a newline)";
      partial.clear();
      discarding = true;
    }
  }
  return lines;
}

vector<json> FrameCodec::feedJson(const string& chunk) {
  vector<json> values;
  for (const auto& line : feed(chunk)) {
    json value = json::parse(line, nullptr, false);
    if (value.is_discarded()) {
      VLOG(1) << "Dropping malformed frame: " << line.substr(0, 200);
      continue;
    }
    values.push_back(std::move(value));
  }
  return values;
}
}  // namespace lt
