#pragma once

#include <string>
#include <vector>

namespace storyloop::protocol {

    // One independently completable unit of backlog work.
    struct WorkItem {
        std::string id;
        std::string title;
        std::string description;
        std::vector<std::string> acceptance_criteria;
        int priority = 0;       // lower value runs first
        bool passes = false;    // completion flag, the only field mutated during a run
        std::string notes;
    };

    // The ordered backlog for a run, keyed to one target branch.
    struct Backlog {
        std::string project;
        std::string branch_name;
        std::string description;
        std::vector<WorkItem> items;   // insertion order, ids unique
    };

} // namespace storyloop::protocol
