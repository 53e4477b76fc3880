#include "lucky_stack/core/events.hpp"
#include "lucky_stack/core/utils.hpp"

namespace lucky_stack::core {

EventEmitter::EventEmitter(std::ostream& out, std::ostream* log)
    : out_(out), log_(log) {}

json EventEmitter::base_event(const std::string& type, const std::string& run_id) const {
    return {
        {"type", type},
        {"run_id", run_id},
        {"ts", get_iso_timestamp()}
    };
}

void EventEmitter::emit(const json& event) {
    const std::string line = event.dump();
    out_ << line << "\n";
    out_.flush();
    if (log_) {
        (*log_) << line << "\n";
        log_->flush();
    }
}

void EventEmitter::run_start(const std::string& run_id, const json& extra) {
    json event = base_event("run_start", run_id);
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event);
}

void EventEmitter::run_end(const std::string& run_id, bool success,
                           const std::string& status) {
    json event = base_event("run_end", run_id);
    event["success"] = success;
    event["status"] = status;
    emit(event);
}

void EventEmitter::phase_start(const std::string& run_id, Phase phase) {
    json event = base_event("phase_start", run_id);
    event["phase"] = phase_to_int(phase);
    event["phase_name"] = phase_to_string(phase);
    emit(event);
}

void EventEmitter::phase_progress(const std::string& run_id, Phase phase, int current,
                                  int total, const std::string& message) {
    json event = base_event("phase_progress", run_id);
    event["phase"] = phase_to_int(phase);
    event["phase_name"] = phase_to_string(phase);
    event["current"] = current;
    event["total"] = total;
    event["progress"] = total > 0 ? static_cast<float>(current) / static_cast<float>(total)
                                  : 1.0f;
    if (!message.empty()) {
        event["substep"] = message;
    }
    emit(event);
}

void EventEmitter::phase_end(const std::string& run_id, Phase phase,
                             const std::string& status, const json& extra) {
    json event = base_event("phase_end", run_id);
    event["phase"] = phase_to_int(phase);
    event["phase_name"] = phase_to_string(phase);
    event["status"] = status;
    if (extra.is_object()) {
        for (auto& [key, value] : extra.items()) {
            event[key] = value;
        }
    }
    emit(event);
}

void EventEmitter::warning(const std::string& run_id, const std::string& message) {
    json event = base_event("warning", run_id);
    event["message"] = message;
    emit(event);
}

void EventEmitter::error(const std::string& run_id, const std::string& message) {
    json event = base_event("error", run_id);
    event["message"] = message;
    emit(event);
}

} // namespace lucky_stack::core
