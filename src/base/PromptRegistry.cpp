#include "PromptRegistry.hpp"

namespace lt {
void PromptRegistry::PendingPrompt::cancelWith(std::exception_ptr error) const {
  auto lockedState = state.lock();
  if (!lockedState) {
    return;
  }
  {
    lock_guard<mutex> guard(lockedState->registryMutex);
    auto it = lockedState->pending.find(requestId);
    // The id may have been reused by a later request after this one settled
    if (it == lockedState->pending.end() || it->second != resolution) {
      return;
    }
    lockedState->pending.erase(it);
  }
  resolution->set_exception(error);
}

PromptRegistry::PendingPrompt PromptRegistry::waitFor(const string& requestId) {
  auto resolution = make_shared<Resolution>();
  {
    lock_guard<mutex> guard(state->registryMutex);
    if (state->pending.find(requestId) != state->pending.end()) {
      throw std::runtime_error("Duplicate prompt request id: " + requestId);
    }
    state->pending[requestId] = resolution;
  }
  VLOG(1) << "Waiting for prompt response " << requestId;
  return PendingPrompt(requestId, resolution, state);
}

shared_ptr<PromptRegistry::Resolution> PromptRegistry::take(
    const string& requestId) {
  lock_guard<mutex> guard(state->registryMutex);
  auto it = state->pending.find(requestId);
  if (it == state->pending.end()) {
    return shared_ptr<Resolution>();
  }
  auto resolution = it->second;
  state->pending.erase(it);
  return resolution;
}

bool PromptRegistry::resolve(const string& requestId, const json& value) {
  auto resolution = take(requestId);
  if (!resolution) {
    VLOG(1) << "Ignoring response for unknown prompt " << requestId;
    return false;
  }
  resolution->set_value(value);
  return true;
}

bool PromptRegistry::reject(const string& requestId,
                            std::exception_ptr error) {
  auto resolution = take(requestId);
  if (!resolution) {
    VLOG(1) << "Ignoring rejection for unknown prompt " << requestId;
    return false;
  }
  resolution->set_exception(error);
  return true;
}

bool PromptRegistry::remove(const string& requestId) {
  return bool(take(requestId));
}

int PromptRegistry::rejectAll(std::exception_ptr error) {
  unordered_map<string, shared_ptr<Resolution>> rejected;
  {
    lock_guard<mutex> guard(state->registryMutex);
    rejected.swap(state->pending);
  }
  for (auto& it : rejected) {
    it.second->set_exception(error);
  }
  return int(rejected.size());
}

bool PromptRegistry::has(const string& requestId) const {
  lock_guard<mutex> guard(state->registryMutex);
  return state->pending.find(requestId) != state->pending.end();
}

size_t PromptRegistry::size() const {
  lock_guard<mutex> guard(state->registryMutex);
  return state->pending.size();
}
}  // namespace lt
