#pragma once

#include "graph/types.hpp"

#include <iosfwd>
#include <string>
#include <vector>

namespace reasongraph {

// ─── EventLog ──────────────────────────────────────────────────
// JSON-lines serialization of the event log, one record per line in
// index order:
//   {"index":0,"kind":"branch_created","timestamp":...,"branch_id":"...",
//    "thought_id":"...","payload":{...}}
// thought_id and payload are omitted when absent. Feeding the imported
// events to BranchGraph::replay() rebuilds the store.

class EventLog {
public:
    static std::string toLine(const Event& event);
    /// Throws ImportError on malformed input.
    static Event fromLine(const std::string& line);

    static void write(std::ostream& out, const std::vector<Event>& events);
    static std::vector<Event> read(std::istream& in);

    /// Throws ExportError if the file cannot be written.
    static void exportToFile(const std::vector<Event>& events, const std::string& path);
    /// Throws ImportError if the file cannot be read or parsed.
    static std::vector<Event> importFromFile(const std::string& path);
};

} // namespace reasongraph
