#pragma once

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace markflow::core {

enum class EventType : int { OpenTab = 0, Ping = 1 };

/**
 * @brief A record delivered over the push channel.
 *
 * The wire form is the payload object with a "type" member added, e.g.
 * {"type":"open_tab","url":...,"title":...,"file_path":...,"content":...}.
 */
struct Event {
    uint64_t sequence{0}; ///< Assigned by the broadcaster on publish, starts at 1.
    EventType type{EventType::Ping};
    nlohmann::json payload = nlohmann::json::object();
    std::chrono::system_clock::time_point timestamp;

    [[nodiscard]] std::string typeToString() const;

    [[nodiscard]] nlohmann::json toJson() const;

    /**
     * @brief Formats the event as one event-stream frame ("data: <json>\n\n").
     */
    [[nodiscard]] std::string toStreamFrame() const;

    static Event openTab(const std::string& url, const std::string& title,
                         const std::string& filePath, const std::string& content);
    static Event ping(std::chrono::system_clock::time_point at = std::chrono::system_clock::now());

    bool operator==(const Event& other) const = default;
};

} // namespace markflow::core
