#include "errors.hpp"

namespace PakForge {

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "None";
        case ErrorKind::InvalidInput: return "InvalidInput";
        case ErrorKind::SourceExhausted: return "SourceExhausted";
        case ErrorKind::CorruptArtifact: return "CorruptArtifact";
        case ErrorKind::ToolMissing: return "ToolMissing";
        case ErrorKind::ToolFailed: return "ToolFailed";
        case ErrorKind::ArtifactNotFound: return "ArtifactNotFound";
        case ErrorKind::PatchNotApplied: return "PatchNotApplied";
        case ErrorKind::ConflictUnresolved: return "ConflictUnresolved";
        case ErrorKind::ReplaceFailed: return "ReplaceFailed";
        case ErrorKind::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

const char* errorKindHint(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "";
        case ErrorKind::InvalidInput: return "Check the command line and request file.";
        case ErrorKind::SourceExhausted: return "Check your connection and try again.";
        case ErrorKind::CorruptArtifact: return "The cached data was discarded; try again.";
        case ErrorKind::ToolMissing: return "Install the required tools or fix the paths in pakforge.json.";
        case ErrorKind::ToolFailed: return "An external tool failed; see the log above for its output.";
        case ErrorKind::ArtifactNotFound: return "The packer produced no archive; see the log above.";
        case ErrorKind::PatchNotApplied: return "The requested entry does not exist in the game data.";
        case ErrorKind::ConflictUnresolved: return "Pick a resolution for each listed conflict and run again.";
        case ErrorKind::ReplaceFailed: return "Close the game and try again; the previous install is unchanged.";
        case ErrorKind::Cancelled: return "Operation cancelled.";
    }
    return "";
}

} // namespace PakForge
