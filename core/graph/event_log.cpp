#include "graph/event_log.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"

#include <json/json.h>

#include <fstream>
#include <memory>
#include <sstream>

namespace reasongraph {

namespace {

Json::Value stringArray(const std::vector<std::string>& items) {
    Json::Value arr(Json::arrayValue);
    for (const auto& s : items) arr.append(s);
    return arr;
}

Json::Value payloadToJson(const EventPayload& payload) {
    Json::Value out(Json::objectValue);
    if (const auto* p = std::get_if<ThoughtAddedPayload>(&payload)) {
        out["content"] = p->content;
        out["kind"] = p->kind;
        out["confidence"] = p->confidence;
        out["key_points"] = stringArray(p->key_points);
        out["references"] = stringArray(p->references);
    } else if (const auto* p = std::get_if<BranchCreatedPayload>(&payload)) {
        if (p->parent_id) out["parent_id"] = *p->parent_id;
    } else if (const auto* p = std::get_if<CrossRefPayload>(&payload)) {
        out["from_branch"] = p->from_branch;
        out["to_branch"] = p->to_branch;
        out["type"] = crossRefTypeName(p->type);
        out["reason"] = p->reason;
        out["strength"] = p->strength;
        out["thought_id"] = p->thought_id;
    } else if (const auto* p = std::get_if<StateChangedPayload>(&payload)) {
        out["previous"] = branchStateName(p->previous);
        out["state"] = branchStateName(p->current);
    }
    return out;
}

// ── Reading helpers; all throw ImportError ──

const Json::Value& member(const Json::Value& obj, const char* key) {
    if (!obj.isObject() || !obj.isMember(key)) {
        throw ImportError(std::string("missing field '") + key + "'");
    }
    return obj[key];
}

std::string readString(const Json::Value& obj, const char* key) {
    const Json::Value& v = member(obj, key);
    if (!v.isString()) throw ImportError(std::string("field '") + key + "' must be a string");
    return v.asString();
}

double readNumber(const Json::Value& obj, const char* key) {
    const Json::Value& v = member(obj, key);
    if (!v.isNumeric()) throw ImportError(std::string("field '") + key + "' must be a number");
    return v.asDouble();
}

uint64_t readUnsigned(const Json::Value& obj, const char* key) {
    const Json::Value& v = member(obj, key);
    if (!v.isUInt64()) {
        throw ImportError(std::string("field '") + key + "' must be a non-negative integer");
    }
    return v.asUInt64();
}

std::vector<std::string> readStringArray(const Json::Value& obj, const char* key) {
    std::vector<std::string> out;
    if (!obj.isMember(key)) return out;
    const Json::Value& arr = obj[key];
    if (!arr.isArray()) throw ImportError(std::string("field '") + key + "' must be an array");
    for (const auto& item : arr) {
        if (!item.isString()) throw ImportError(std::string("field '") + key + "' must hold strings");
        out.push_back(item.asString());
    }
    return out;
}

EventPayload payloadFromJson(EventKind kind, const Json::Value& obj) {
    switch (kind) {
        case EventKind::ThoughtAdded: {
            ThoughtAddedPayload p;
            p.content = readString(obj, "content");
            p.kind = readString(obj, "kind");
            p.confidence = readNumber(obj, "confidence");
            p.key_points = readStringArray(obj, "key_points");
            p.references = readStringArray(obj, "references");
            return p;
        }
        case EventKind::BranchCreated: {
            BranchCreatedPayload p;
            if (obj.isMember("parent_id")) p.parent_id = readString(obj, "parent_id");
            return p;
        }
        case EventKind::CrossRefAdded: {
            CrossRefPayload p;
            p.from_branch = readString(obj, "from_branch");
            p.to_branch = readString(obj, "to_branch");
            auto type = parseCrossRefType(readString(obj, "type"));
            if (!type) throw ImportError("unknown cross reference type");
            p.type = *type;
            p.reason = readString(obj, "reason");
            p.strength = readNumber(obj, "strength");
            p.thought_id = readString(obj, "thought_id");
            return p;
        }
        case EventKind::BranchStateChanged: {
            StateChangedPayload p;
            auto previous = parseBranchState(readString(obj, "previous"));
            auto current = parseBranchState(readString(obj, "state"));
            if (!previous || !current) throw ImportError("unknown branch state");
            p.previous = *previous;
            p.current = *current;
            return p;
        }
    }
    return std::monostate{};
}

} // namespace

// ─── Lines ─────────────────────────────────────────────────────

std::string EventLog::toLine(const Event& event) {
    Json::Value root(Json::objectValue);
    root["index"] = static_cast<Json::UInt64>(event.index);
    root["kind"] = eventKindName(event.kind);
    root["timestamp"] = static_cast<Json::UInt64>(event.timestamp);
    root["branch_id"] = event.branch_id;
    if (event.thought_id) root["thought_id"] = *event.thought_id;
    if (!std::holds_alternative<std::monostate>(event.payload)) {
        root["payload"] = payloadToJson(event.payload);
    }

    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    return Json::writeString(writer, root);
}

Event EventLog::fromLine(const std::string& line) {
    Json::Value root;
    Json::CharReaderBuilder builder;
    std::string errors;
    std::istringstream stream(line);
    if (!Json::parseFromStream(builder, stream, &root, &errors)) {
        throw ImportError("invalid JSON: " + errors);
    }
    if (!root.isObject()) throw ImportError("event record must be an object");

    Event e;
    e.index = readUnsigned(root, "index");
    auto kind = parseEventKind(readString(root, "kind"));
    if (!kind) throw ImportError("unknown event kind");
    e.kind = *kind;
    e.timestamp = readUnsigned(root, "timestamp");
    e.branch_id = readString(root, "branch_id");
    if (root.isMember("thought_id")) e.thought_id = readString(root, "thought_id");
    if (root.isMember("payload")) e.payload = payloadFromJson(e.kind, root["payload"]);
    return e;
}

// ─── Streams / files ───────────────────────────────────────────

void EventLog::write(std::ostream& out, const std::vector<Event>& events) {
    for (const auto& e : events) {
        out << toLine(e) << "\n";
    }
}

std::vector<Event> EventLog::read(std::istream& in) {
    std::vector<Event> events;
    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        line_no++;
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
        try {
            events.push_back(fromLine(line));
        } catch (const ImportError& e) {
            throw ImportError("line " + std::to_string(line_no) + ": " + e.what());
        }
    }
    return events;
}

void EventLog::exportToFile(const std::vector<Event>& events, const std::string& path) {
    std::ofstream out(path);
    if (!out) throw ExportError("cannot open " + path);
    write(out, events);
    if (!out) throw ExportError("write to " + path + " failed");
}

std::vector<Event> EventLog::importFromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        Logger::error("cannot open event log " + path);
        throw ImportError("cannot open " + path);
    }
    return read(in);
}

} // namespace reasongraph
