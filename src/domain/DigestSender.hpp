/**
 * @file DigestSender.hpp
 * @brief Interface for delivering a rendered digest.
 */

#pragma once
#include <string>

namespace highlightdigest::domain {

/**
 * @struct DigestMessage
 * @brief A ready-to-send digest.
 */
struct DigestMessage {
    std::string from;
    std::string to;
    std::string subject;
    std::string html;
};

/**
 * @class DigestSender
 * @brief Delivery transport boundary.
 */
class DigestSender {
public:
    virtual ~DigestSender() = default;

    /**
     * @brief Sends the message.
     * @return Opaque delivery identifier.
     * Throws DeliveryFailedError on transport failure.
     */
    virtual std::string send(const DigestMessage& message) = 0;
};

} // namespace highlightdigest::domain
