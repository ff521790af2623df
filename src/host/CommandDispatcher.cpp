#include "CommandDispatcher.hpp"

namespace ptymux {
CommandDispatcher::CommandDispatcher(shared_ptr<SessionManager> _sessionManager)
    : sessionManager(_sessionManager) {}

json CommandDispatcher::handleLine(const string& line) {
  json request;
  try {
    request = json::parse(line);
  } catch (const json::parse_error& pe) {
    LOG(WARNING) << "Dropping malformed request: " << pe.what();
    return errorResponse(nullptr, string("Malformed request: ") + pe.what(),
                         "InvalidRequest");
  }
  return handle(request);
}

json CommandDispatcher::handle(const json& request) {
  json id = nullptr;
  if (!request.is_object()) {
    return errorResponse(id, "Request must be an object", "InvalidRequest");
  }
  auto idIt = request.find("id");
  if (idIt != request.end()) {
    id = *idIt;
  }

  auto commandIt = request.find("command");
  if (commandIt == request.end() || !commandIt->is_string()) {
    return errorResponse(id, "Missing command", "InvalidRequest");
  }
  json payload = json::object();
  auto payloadIt = request.find("payload");
  if (payloadIt != request.end() && !payloadIt->is_null()) {
    if (!payloadIt->is_object()) {
      return errorResponse(id, "Payload must be an object", "InvalidRequest");
    }
    payload = *payloadIt;
  }

  string command = commandIt->get<string>();
  try {
    json response;
    response["id"] = id;
    response["ok"] = true;
    response["result"] = dispatch(command, payload);
    return response;
  } catch (const SessionError& se) {
    LOG(INFO) << command << " failed: " << se.what();
    return errorResponse(id, se.what(), errorCodeName(se.getCode()));
  } catch (const std::invalid_argument& ia) {
    LOG(WARNING) << "Rejected " << command << ": " << ia.what();
    return errorResponse(id, ia.what(), "InvalidRequest");
  } catch (const std::runtime_error& re) {
    STERROR << command << " failed unexpectedly: " << re.what();
    return errorResponse(id, re.what(), "InternalError");
  }
}

json CommandDispatcher::dispatch(const string& command, const json& payload) {
  VLOG(1) << "Dispatching " << command;
  if (command == "create_terminal_session") {
    string sessionId =
        sessionManager->create(requireDimension(payload, "cols"),
                               requireDimension(payload, "rows"),
                               optionalString(payload, "cwd"));
    return json{{"session_id", sessionId}};
  }
  if (command == "send_terminal_input") {
    sessionManager->write(requireString(payload, "session_id"),
                          requireString(payload, "data"));
    return nullptr;
  }
  if (command == "resize_terminal") {
    sessionManager->resize(requireString(payload, "session_id"),
                           requireDimension(payload, "cols"),
                           requireDimension(payload, "rows"));
    return nullptr;
  }
  if (command == "close_terminal") {
    sessionManager->close(requireString(payload, "session_id"));
    return nullptr;
  }
  if (command == "restart_terminal_session") {
    string sessionId = sessionManager->restart(
        requireString(payload, "session_id"),
        requireDimension(payload, "cols"), requireDimension(payload, "rows"),
        requireString(payload, "cwd"));
    return json{{"session_id", sessionId}};
  }
  if (command == "force_kill_terminal") {
    // A "cwd" field is accepted for compatibility and ignored.
    sessionManager->forceKill(optionalString(payload, "session_id"));
    return nullptr;
  }
  throw std::invalid_argument("Unknown command: " + command);
}

json CommandDispatcher::errorResponse(const json& id, const string& message,
                                      const string& code) {
  json response;
  response["id"] = id;
  response["ok"] = false;
  response["error"] = message;
  response["code"] = code;
  return response;
}

const json& CommandDispatcher::requireField(const json& payload,
                                            const char* key) {
  auto it = payload.find(key);
  if (it == payload.end() || it->is_null()) {
    throw std::invalid_argument(string("Missing field: ") + key);
  }
  return *it;
}

string CommandDispatcher::requireString(const json& payload, const char* key) {
  const json& value = requireField(payload, key);
  if (!value.is_string()) {
    throw std::invalid_argument(string("Field must be a string: ") + key);
  }
  return value.get<string>();
}

optional<string> CommandDispatcher::optionalString(const json& payload,
                                                   const char* key) {
  auto it = payload.find(key);
  if (it == payload.end() || it->is_null()) {
    return nullopt;
  }
  if (!it->is_string()) {
    throw std::invalid_argument(string("Field must be a string: ") + key);
  }
  return it->get<string>();
}

uint16_t CommandDispatcher::requireDimension(const json& payload,
                                             const char* key) {
  const json& value = requireField(payload, key);
  if (!value.is_number_integer()) {
    throw std::invalid_argument(string("Field must be an integer: ") + key);
  }
  int64_t dimension = value.get<int64_t>();
  if (dimension < 0 || dimension > std::numeric_limits<uint16_t>::max()) {
    throw std::invalid_argument(string("Field out of range: ") + key);
  }
  return uint16_t(dimension);
}
}  // namespace ptymux
