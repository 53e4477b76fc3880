#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace lucky_stack::core {

using json = nlohmann::json;

/**
 * JSON-lines run events. Every event carries type, run_id and an ISO-8601
 * UTC timestamp; each line is written to the primary stream and, when set,
 * mirrored to a log stream.
 */
class EventEmitter {
public:
    explicit EventEmitter(std::ostream& out, std::ostream* log = nullptr);

    void run_start(const std::string& run_id, const json& extra);
    void run_end(const std::string& run_id, bool success, const std::string& status);

    void phase_start(const std::string& run_id, Phase phase);
    void phase_progress(const std::string& run_id, Phase phase, int current, int total,
                        const std::string& message = "");
    void phase_end(const std::string& run_id, Phase phase, const std::string& status,
                   const json& extra = json::object());

    void warning(const std::string& run_id, const std::string& message);
    void error(const std::string& run_id, const std::string& message);

private:
    void emit(const json& event);
    json base_event(const std::string& type, const std::string& run_id) const;

    std::ostream& out_;
    std::ostream* log_;
};

} // namespace lucky_stack::core
