#ifndef PENSYNC_SERVICE_CONNECTION_STATE_H
#define PENSYNC_SERVICE_CONNECTION_STATE_H

namespace pensync {
namespace service {

/**
 * Lifecycle state of one service instance.
 */
enum class ConnectionState {
  Disconnected,  // No peer, no attempt in flight
  Connecting,    // Outbound attempt in flight
  Connected,     // A session is live
  Listening      // Streaming only: idle but accepting
};

/**
 * Outcome of a protocol operation
 */
enum class ActionResult { Ok, Fail };

/**
 * The request a completion answers
 */
enum class PendingAction {
  Connect,
  Disconnect,
  Delete,
  ChangeFolder,
  GetFile,
  ListFolder
};

inline const char* connectionStateToString(ConnectionState state) {
  switch (state) {
    case ConnectionState::Disconnected: return "Disconnected";
    case ConnectionState::Connecting: return "Connecting";
    case ConnectionState::Connected: return "Connected";
    case ConnectionState::Listening: return "Listening";
  }
  return "Unknown";
}

inline const char* actionResultToString(ActionResult result) {
  return result == ActionResult::Ok ? "Ok" : "Fail";
}

inline const char* pendingActionToString(PendingAction action) {
  switch (action) {
    case PendingAction::Connect: return "Connect";
    case PendingAction::Disconnect: return "Disconnect";
    case PendingAction::Delete: return "Delete";
    case PendingAction::ChangeFolder: return "ChangeFolder";
    case PendingAction::GetFile: return "GetFile";
    case PendingAction::ListFolder: return "ListFolder";
  }
  return "Unknown";
}

}  // namespace service
}  // namespace pensync

#endif  // PENSYNC_SERVICE_CONNECTION_STATE_H
