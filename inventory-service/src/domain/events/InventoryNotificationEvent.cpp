#include "domain/events/InventoryNotificationEvent.hpp"
#include <nlohmann/json.hpp>

namespace inventory::domain {

std::string InventoryNotificationEvent::toJson() const {
    nlohmann::json j;
    j["eventId"] = eventId;
    j["eventType"] = eventType;
    j["timestamp"] = timestamp.toString();
    j["type"] = toString(type);
    j["storeId"] = storeId;
    j["productId"] = productId;
    j["title"] = title;
    j["message"] = message;
    j["priority"] = toString(priority);
    j["data"] = data;
    return j.dump();
}

} // namespace inventory::domain
