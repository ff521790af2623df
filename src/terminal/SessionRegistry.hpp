#ifndef __PTYMUX_SESSION_REGISTRY_HPP__
#define __PTYMUX_SESSION_REGISTRY_HPP__

#include "Headers.hpp"
#include "Session.hpp"

namespace ptymux {
/**
 * @brief Maps session ids to live sessions.
 *
 * One mutex covers every operation and is released before any I/O on the
 * returned sessions. Removing a session is the point where it is torn down,
 * callers kill the child on the session they got back.
 */
class SessionRegistry {
 public:
  SessionRegistry() {}

  /** @brief Adds a session. Fatal if the id is already registered. */
  void insert(const string& id, shared_ptr<Session> session);
  /** @brief Returns the session or nullptr. */
  shared_ptr<Session> get(const string& id);
  /** @brief Removes and returns the session, nullptr if it was absent. */
  shared_ptr<Session> remove(const string& id);
  /** @brief Removes every session and returns them. */
  vector<pair<string, shared_ptr<Session>>> removeAll();
  bool contains(const string& id);
  vector<string> ids();
  size_t size();

 protected:
  std::mutex registryMutex;
  unordered_map<string, shared_ptr<Session>> sessions;
};
}  // namespace ptymux

#endif  // __PTYMUX_SESSION_REGISTRY_HPP__
