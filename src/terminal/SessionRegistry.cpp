#include "SessionRegistry.hpp"

namespace ptymux {
void SessionRegistry::insert(const string& id, shared_ptr<Session> session) {
  lock_guard<std::mutex> guard(registryMutex);
  if (!sessions.insert(std::make_pair(id, session)).second) {
    STFATAL << "Tried to register a session id twice: " << id;
  }
}

shared_ptr<Session> SessionRegistry::get(const string& id) {
  lock_guard<std::mutex> guard(registryMutex);
  auto it = sessions.find(id);
  if (it == sessions.end()) {
    return shared_ptr<Session>();
  }
  return it->second;
}

shared_ptr<Session> SessionRegistry::remove(const string& id) {
  lock_guard<std::mutex> guard(registryMutex);
  auto it = sessions.find(id);
  if (it == sessions.end()) {
    return shared_ptr<Session>();
  }
  shared_ptr<Session> session = it->second;
  sessions.erase(it);
  return session;
}

vector<pair<string, shared_ptr<Session>>> SessionRegistry::removeAll() {
  lock_guard<std::mutex> guard(registryMutex);
  vector<pair<string, shared_ptr<Session>>> removed(sessions.begin(),
                                                    sessions.end());
  sessions.clear();
  return removed;
}

bool SessionRegistry::contains(const string& id) {
  lock_guard<std::mutex> guard(registryMutex);
  return sessions.find(id) != sessions.end();
}

vector<string> SessionRegistry::ids() {
  lock_guard<std::mutex> guard(registryMutex);
  vector<string> result;
  for (const auto& it : sessions) {
    result.push_back(it.first);
  }
  return result;
}

size_t SessionRegistry::size() {
  lock_guard<std::mutex> guard(registryMutex);
  return sessions.size();
}
}  // namespace ptymux
