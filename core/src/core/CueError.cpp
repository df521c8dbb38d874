#include "core/CueError.h"

namespace cuemix {

const char* CueErrorName(const CueError error)
{
  switch (error) {
    case CueError::kNone:
      return "None";
    case CueError::kDuplicateName:
      return "DuplicateName";
    case CueError::kNotFound:
      return "NotFound";
    case CueError::kFileUnreadable:
      return "FileUnreadable";
    case CueError::kInUse:
      return "InUse";
    case CueError::kOutOfRange:
      return "OutOfRange";
    case CueError::kNothingToExecute:
      return "NothingToExecute";
    case CueError::kAlreadyAtStart:
      return "AlreadyAtStart";
    case CueError::kParseError:
      return "ParseError";
    case CueError::kSchemaError:
      return "SchemaError";
    case CueError::kInvalidName:
      return "InvalidName";
    case CueError::kWriteFailed:
      return "WriteFailed";
    case CueError::kInvalidArgument:
      return "InvalidArgument";
  }
  return "Unknown";
}

const char* DescribeCueError(const CueError error)
{
  switch (error) {
    case CueError::kNone:
      return "No error";
    case CueError::kDuplicateName:
      return "That name is already taken";
    case CueError::kNotFound:
      return "No item with that name exists";
    case CueError::kFileUnreadable:
      return "The sound file could not be loaded";
    case CueError::kInUse:
      return "The sound is still used by at least one cue";
    case CueError::kOutOfRange:
      return "Cue index is out of range";
    case CueError::kNothingToExecute:
      return "All cues of this mixer have been executed";
    case CueError::kAlreadyAtStart:
      return "Already at the first cue";
    case CueError::kParseError:
      return "The project file is not well-formed";
    case CueError::kSchemaError:
      return "The project file content is invalid";
    case CueError::kInvalidName:
      return "Names must not be empty";
    case CueError::kWriteFailed:
      return "The file could not be written";
    case CueError::kInvalidArgument:
      return "The command argument is not valid";
  }
  return "Unknown error";
}

}  // namespace cuemix
