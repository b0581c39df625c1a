#include "stagehand/core/events.hpp"
#include "stagehand/core/utils.hpp"

#include <cstdio>
#include <utility>

namespace stagehand::core {

EventEmitter::EventEmitter(std::string run_id, std::ostream& out)
    : run_id_(std::move(run_id)), out_(&out) {}

json EventEmitter::base_event(const std::string& type) const {
    return {
        {"type", type},
        {"run_id", run_id_},
        {"ts", get_iso_timestamp()}
    };
}

void EventEmitter::write(const json& event) {
    (*out_) << event.dump() << "\n";
    out_->flush();
}

void EventEmitter::emit(const std::string& type, const json& data) {
    json event = base_event(type);
    if (data.is_object()) {
        for (auto& [key, value] : data.items()) {
            event[key] = value;
        }
    }
    write(event);
}

void EventEmitter::run_start(const json& extra) {
    emit("run_start", extra);
}

void EventEmitter::run_end(bool success, const std::string& status, const json& extra) {
    json event = base_event("run_end");
    event["success"] = success;
    event["status"] = status;
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    write(event);
}

void EventEmitter::run_stop_requested(int signal, int deliveries) {
    json event = base_event("run_stop_requested");
    event["signal"] = signal;
    event["deliveries"] = deliveries;
    write(event);
}

void EventEmitter::stage_start(const std::string& stage, size_t index, size_t total) {
    json event = base_event("stage_start");
    event["stage"] = stage;
    event["index"] = index;
    event["total"] = total;
    write(event);
}

void EventEmitter::stage_end(const std::string& stage, const std::string& status, double seconds) {
    json event = base_event("stage_end");
    event["stage"] = stage;
    event["status"] = status;
    event["seconds"] = seconds;
    write(event);
}

void EventEmitter::step_start(const std::string& key, const std::string& decision, const json& extra) {
    json event = base_event("step_start");
    event["key"] = key;
    event["decision"] = decision;
    for (auto& [k, value] : extra.items()) {
        event[k] = value;
    }
    write(event);
}

void EventEmitter::step_end(const std::string& key, const std::string& status, const json& extra) {
    json event = base_event("step_end");
    event["key"] = key;
    event["status"] = status;
    for (auto& [k, value] : extra.items()) {
        event[k] = value;
    }
    write(event);
}

void EventEmitter::step_skipped(const std::string& key, const std::string& reason) {
    json event = base_event("step_skipped");
    event["key"] = key;
    event["reason"] = reason;
    write(event);
}

void EventEmitter::warning(const std::string& message, const json& extra) {
    json event = base_event("warning");
    event["message"] = message;
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    write(event);
}

void EventEmitter::error(const std::string& message) {
    json event = base_event("error");
    event["message"] = message;
    write(event);
}

TeeBuf::TeeBuf(std::streambuf* a, std::streambuf* b) : a_(a), b_(b) {}

int TeeBuf::overflow(int c) {
    if (c == EOF)
        return EOF;
    const int ra = a_ ? a_->sputc(static_cast<char>(c)) : c;
    const int rb = b_ ? b_->sputc(static_cast<char>(c)) : c;
    return (ra == EOF || rb == EOF) ? EOF : c;
}

int TeeBuf::sync() {
    int ra = a_ ? a_->pubsync() : 0;
    int rb = b_ ? b_->pubsync() : 0;
    return (ra == 0 && rb == 0) ? 0 : -1;
}

} // namespace stagehand::core
