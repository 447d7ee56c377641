#include "task.hpp"
#include <map>
#include <set>

const char* action_kind_name(ActionKind kind) {
    switch (kind) {
    case ActionKind::CALL:  return "call";
    case ActionKind::COPY:  return "copy";
    case ActionKind::SLURP: return "slurp";
    }
    return "?";
}

std::vector<Task> make_tasks(const std::vector<HostSpec>& hosts, ActionKind kind) {
    std::vector<Task> tasks;
    tasks.reserve(hosts.size());

    std::map<std::string, int> seen;
    std::set<std::string> taken;
    for (const auto& h : hosts) {
        taken.insert(h.entry);
    }

    for (size_t i = 0; i < hosts.size(); ++i) {
        const auto& h = hosts[i];
        int count = seen[h.entry]++;
        std::string key = h.entry;
        if (count > 0) {
            // Skip suffixes that collide with an entry the caller supplied.
            int n = count;
            do {
                key = h.entry + "." + std::to_string(n++);
            } while (taken.count(key));
            seen[h.entry] = n;
            taken.insert(key);
        }
        tasks.push_back(Task{i, key, h, kind});
    }
    return tasks;
}
