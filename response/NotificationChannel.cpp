#include "response/NotificationChannel.hpp"
#include "core/Logger.hpp"

namespace filesentry {

DeliveryStatus LogNotificationChannel::Send(const std::string& recipient,
                                            const std::string& method,
                                            const std::string& message) {
    LOG_WARN("[notify:{}] to={} {}", method, recipient, message);
    return DeliveryStatus{true, "logged"};
}

} // namespace filesentry
