#pragma once

#include "sync/model/ChangeSet.hpp"

#include <string>
#include <vector>

namespace osync::sync::model {

struct StatusReport {
    ChangeSet changes;
    std::size_t local_files = 0, mirror_files = 0, baseline_files = 0;
};

struct PushReport {
    ChangeSet changes;
    std::vector<std::string> copied, removed;
    std::size_t left_for_apply = 0;  // mirror-side changes push does not touch
};

struct ApplyReport {
    std::vector<std::string> copied, removed;
};

struct WipeReport {
    std::size_t removed = 0;
    bool baseline_reset = false;
};

}
