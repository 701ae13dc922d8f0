#pragma once

namespace histscrub {

enum class Browser {
    Chrome,
    Brave,
    Firefox,
    Safari
};

enum class SchemaFamily {
    Chromium,
    Gecko,
    WebKit
};

enum class EpochFamily {
    ChromiumMicros1601,
    GeckoMicros1970,
    WebKitSeconds1970
};

enum class HostPlatform {
    Linux,
    MacOS,
    Windows
};

enum class MutationState {
    Idle,
    BackedUp,
    WorkingCopyOpen,
    CountedAffected,
    Deleted,
    Committed,
    Compacted,
    Swapped,
    BackupRemoved,
    Done,
    Failed
};

enum class ErrorKind {
    ProfileNotFound,
    SchemaMismatch,
    BackupFailed,
    CopyFailed,
    DeleteFailed,
    CompactFailed,
    SwapFailed,
    RestoreFailed,
    // Read-only inspection could not query a working copy.
    ReadFailed
};

} // namespace histscrub
