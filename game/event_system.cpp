#include "snake_app.h"
#include <memory>
#include <unordered_map>
#include <vector>

// ===== EVENT SYSTEM IMPLEMENTATION =====

namespace {

class EventSystemImpl : public EventSystem {
public:
    void subscribe(EventType eventType, EventCallback callback) override {
        m_subscribers[eventType].push_back(callback);
    }

    void unsubscribe(EventType eventType) override {
        m_subscribers[eventType].clear();
    }

    void publish(const Event& event) override {
        auto it = m_subscribers.find(event.type);
        if (it != m_subscribers.end()) {
            for (const auto& callback : it->second) {
                callback(event);
            }
        }
    }

private:
    std::unordered_map<EventType, std::vector<EventCallback>> m_subscribers;
};

} // anonymous namespace

std::unique_ptr<EventSystem> createEventSystem() {
    return std::make_unique<EventSystemImpl>();
}
