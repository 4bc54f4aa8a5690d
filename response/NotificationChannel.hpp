#pragma once

#include <string>

namespace filesentry {

struct DeliveryStatus {
    bool delivered{false};
    std::string status;
};

class NotificationChannel {
public:
    virtual ~NotificationChannel() = default;

    // `method` is "email" or "webhook". Implementations report transport
    // failures through the returned status rather than throwing.
    virtual DeliveryStatus Send(const std::string& recipient,
                                const std::string& method,
                                const std::string& message) = 0;
};

// Delivers by writing the message to the application log.
class LogNotificationChannel : public NotificationChannel {
public:
    DeliveryStatus Send(const std::string& recipient,
                        const std::string& method,
                        const std::string& message) override;
};

} // namespace filesentry
