#include "core/types/Event.hpp"

namespace markflow::core {

std::string Event::typeToString() const {
    switch (type) {
    case EventType::OpenTab:
        return "open_tab";
    case EventType::Ping:
        return "ping";
    }
    return "unknown";
}

nlohmann::json Event::toJson() const {
    nlohmann::json j = payload.is_object() ? payload : nlohmann::json::object();
    j["type"] = typeToString();
    return j;
}

std::string Event::toStreamFrame() const {
    // Documents are expected to be UTF-8; stray bytes are replaced rather than thrown on.
    return "data: " + toJson().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) +
           "\n\n";
}

Event Event::openTab(const std::string& url, const std::string& title,
                     const std::string& filePath, const std::string& content) {
    Event event;
    event.type = EventType::OpenTab;
    event.timestamp = std::chrono::system_clock::now();
    event.payload["url"] = url;
    event.payload["title"] = title;
    event.payload["file_path"] = filePath;
    event.payload["content"] = content;
    return event;
}

Event Event::ping(std::chrono::system_clock::time_point at) {
    Event event;
    event.type = EventType::Ping;
    event.timestamp = at;
    event.payload["timestamp"] =
        std::chrono::duration_cast<std::chrono::seconds>(at.time_since_epoch()).count();
    return event;
}

} // namespace markflow::core
