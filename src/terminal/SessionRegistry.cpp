#include "SessionRegistry.hpp"

namespace wb {
bool SessionRegistry::insert(const string &id, shared_ptr<PtySession> session,
                             const string &projectPath) {
  lock_guard<mutex> guard(registryMutex);
  if (sessions.find(id) != sessions.end()) {
    return false;
  }
  sessions.insert(make_pair(id, session));
  projectPaths[id] = projectPath;
  return true;
}

shared_ptr<PtySession> SessionRegistry::get(const string &id) {
  lock_guard<mutex> guard(registryMutex);
  auto it = sessions.find(id);
  if (it == sessions.end()) {
    return nullptr;
  }
  return it->second;
}

shared_ptr<PtySession> SessionRegistry::remove(const string &id) {
  lock_guard<mutex> guard(registryMutex);
  auto it = sessions.find(id);
  if (it == sessions.end()) {
    return nullptr;
  }
  auto session = it->second;
  sessions.erase(it);
  projectPaths.erase(id);
  return session;
}

optional<string> SessionRegistry::projectPathFor(const string &id) {
  lock_guard<mutex> guard(registryMutex);
  auto it = projectPaths.find(id);
  if (it == projectPaths.end()) {
    return nullopt;
  }
  return it->second;
}

vector<string> SessionRegistry::ids() {
  lock_guard<mutex> guard(registryMutex);
  vector<string> retval;
  for (auto &it : sessions) {
    retval.push_back(it.first);
  }
  sort(retval.begin(), retval.end());
  return retval;
}

size_t SessionRegistry::size() {
  lock_guard<mutex> guard(registryMutex);
  return sessions.size();
}
}  // namespace wb
