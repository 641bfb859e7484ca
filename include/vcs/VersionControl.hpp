#pragma once

#include <string>

namespace osync::vcs {

// The shared remote behind the mirror. Both calls are blocking and atomic from
// the caller's point of view; failures are reported as sync::VersionControlError.
class VersionControl {
public:
    virtual ~VersionControl() = default;

    // Records the mirror's current content and publishes it.
    virtual void commitAndPush(const std::string& message) = 0;

    // Brings the mirror up to date with the remote.
    virtual void pullRebase() = 0;
};

}
