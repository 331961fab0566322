#include "HeadlessConfig.hpp"

namespace lt {
namespace {
std::atomic<bool> urlWarningIssued(false);

optional<int64_t> iniInteger(const CSimpleIniA& ini, const char* key) {
  const char* value = ini.GetValue("Headless", key, NULL);
  if (value == NULL) {
    return nullopt;
  }
  try {
    return stoll(value);
  } catch (const std::logic_error&) {
    LOG(WARNING) << "Ignoring invalid Headless." << key << " value: " << value;
    return nullopt;
  }
}

bool isUsableHeadlessUrl(const string& url) {
  return bool(parseWebSocketUrl(url));
}
}  // namespace

HeadlessConfig HeadlessConfig::fromIni(const CSimpleIniA& ini) {
  HeadlessConfig config;
  config.enabled = ini.GetBoolValue("Headless", "enabled", false);
  const char* url = ini.GetValue("Headless", "url", NULL);
  if (url && url[0]) {
    config.url = string(url);
  }
  auto maxBufferBytes = iniInteger(ini, "max_buffer_bytes");
  if (maxBufferBytes && *maxBufferBytes > 0) {
    config.adapterOptions.maxBufferBytes = *maxBufferBytes;
  }
  auto reconnectIntervalMs = iniInteger(ini, "reconnect_interval_ms");
  if (reconnectIntervalMs && *reconnectIntervalMs >= 0) {
    config.adapterOptions.reconnectIntervalMs = *reconnectIntervalMs;
  }
  config.adapterOptions.forwardDebug =
      ini.GetBoolValue("Headless", "forward_debug", true);
  return config;
}

string resolveHeadlessUrl(const optional<string>& configuredUrl) {
  optional<string> candidate = GetEnv(LT_HEADLESS_URL_ENV);
  if (!candidate) {
    candidate = configuredUrl;
  }
  if (!candidate || trim(*candidate).empty()) {
    return DEFAULT_HEADLESS_URL;
  }
  string url = trim(*candidate);
  if (!isUsableHeadlessUrl(url)) {
    if (!urlWarningIssued.exchange(true)) {
      LOG(WARNING) << "Invalid headless URL " << url
                   << ", expected ws:// or wss://. Using "
                   << DEFAULT_HEADLESS_URL;
    }
    return DEFAULT_HEADLESS_URL;
  }
  return url;
}

bool headlessUrlWarningIssued() { return urlWarningIssued; }

void resetHeadlessUrlWarning() { urlWarningIssued = false; }

optional<string> sanitizeGitRemote(const string& remoteUrl) {
  string remote = trim(remoteUrl);
  if (remote.empty()) {
    return nullopt;
  }

  auto schemeEnd = remote.find("://");
  if (schemeEnd != string::npos) {
    remote = remote.substr(schemeEnd + 3);
    auto pathStart = remote.find('/');
    string authority = remote.substr(0, pathStart);
    auto at = authority.rfind('@');
    if (at != string::npos) {
      remote = remote.substr(at + 1);
    }
  } else {
    // scp-like syntax: [user@]host:path
    auto colon = remote.find(':');
    auto slash = remote.find('/');
    if (colon != string::npos && (slash == string::npos || colon < slash)) {
      string host = remote.substr(0, colon);
      auto at = host.rfind('@');
      if (at != string::npos) {
        host = host.substr(at + 1);
      }
      string path = remote.substr(colon + 1);
      while (startsWith(path, "/")) {
        path = path.substr(1);
      }
      remote = host + "/" + path;
    }
  }

  while (!remote.empty() && remote.back() == '/') {
    remote.pop_back();
  }
  if (remote.size() > 4 && remote.compare(remote.size() - 4, 4, ".git") == 0) {
    remote = remote.substr(0, remote.size() - 4);
  }
  if (remote.empty()) {
    return nullopt;
  }
  return remote;
}

HeadlessSessionInfo buildHeadlessSessionInfo(
    const string& command, const optional<int64_t>& planId,
    const optional<string>& planTitle,
    shared_ptr<SubprocessUtils> subprocessUtils) {
  HeadlessSessionInfo info;
  info.command = command;
  info.planId = planId;
  info.planTitle = planTitle;

  auto gitRoot =
      subprocessUtils->SubprocessToString("git", {"rev-parse", "--show-toplevel"});
  if (gitRoot && !trim(*gitRoot).empty()) {
    info.workspacePath = trim(*gitRoot);
    auto remote = subprocessUtils->SubprocessToString(
        "git", {"remote", "get-url", "origin"});
    if (remote) {
      info.gitRemote = sanitizeGitRemote(*remote);
    }
  } else {
    VLOG(1) << "Not inside a git repository, omitting workspace metadata";
  }

  auto pane = GetEnv("WEZTERM_PANE");
  if (pane) {
    info.terminalPaneId = *pane;
    info.terminalType = "wezterm";
  }
  return info;
}
}  // namespace lt
