#pragma once

namespace cuemix {

// Recoverable conditions reported by the project model, the sequencer
// and the persistence helpers. None of them is fatal: the front-end
// shows the condition and waits for the next user action.
enum class CueError {
  kNone = 0,
  kDuplicateName,
  kNotFound,
  kFileUnreadable,
  kInUse,
  kOutOfRange,
  kNothingToExecute,
  kAlreadyAtStart,
  kParseError,
  kSchemaError,
  kInvalidName,
  kWriteFailed,
  kInvalidArgument,
};

// Stable identifier such as "DuplicateName", used in logs and tests.
[[nodiscard]] const char* CueErrorName(CueError error);

// Short user-facing sentence for message boxes and the console shell.
[[nodiscard]] const char* DescribeCueError(CueError error);

// Writes `error` into `out` when the caller asked for it.
inline void SetCueError(CueError* const out, const CueError error)
{
  if (out != nullptr) {
    *out = error;
  }
}

}  // namespace cuemix
