/**
 * @file DigestService.hpp
 * @brief Builds and delivers the daily highlight digest.
 */

#pragma once
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include "application/DigestRenderer.hpp"
#include "domain/DigestSender.hpp"
#include "domain/HighlightRepository.hpp"
#include "domain/HighlightSampler.hpp"

namespace highlightdigest::application {

/**
 * @class DigestService
 * @brief load -> sample -> render -> send.
 */
class DigestService {
public:
    /**
     * @param sender May be null when only previews are rendered.
     */
    DigestService(std::shared_ptr<domain::HighlightRepository> repository,
                  std::shared_ptr<domain::DigestSender> sender,
                  domain::HighlightSampler sampler);

    struct DigestOutcome {
        int storeSize = 0;
        int bookCount = 0;
        int selectedCount = 0;
        std::optional<std::string> deliveryId;  ///< Unset when nothing was sent.
    };

    /**
     * @brief Samples @p count highlights and sends them to @p to.
     * An empty store sends nothing and is not an error.
     * Throws StoreCorruptError or DeliveryFailedError.
     */
    DigestOutcome sendDaily(const std::string& to, const std::string& from, std::size_t count);

    /** @brief Samples and renders without sending. */
    DigestDocument preview(std::size_t count);

private:
    std::shared_ptr<domain::HighlightRepository> m_repository;
    std::shared_ptr<domain::DigestSender> m_sender;
    domain::HighlightSampler m_sampler;
};

} // namespace highlightdigest::application
