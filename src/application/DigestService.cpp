#include "application/DigestService.hpp"
#include "domain/Errors.hpp"
#include <iostream>
#include <unordered_set>

namespace highlightdigest::application {

namespace {
int CountDistinctTitles(const std::vector<domain::Highlight>& highlights) {
    std::unordered_set<std::string> titles;
    for (const auto& h : highlights) titles.insert(h.title);
    return static_cast<int>(titles.size());
}
}

DigestService::DigestService(std::shared_ptr<domain::HighlightRepository> repository,
                             std::shared_ptr<domain::DigestSender> sender,
                             domain::HighlightSampler sampler)
    : m_repository(std::move(repository)), m_sender(std::move(sender)), m_sampler(std::move(sampler)) {}

DigestService::DigestOutcome DigestService::sendDaily(const std::string& to, const std::string& from, std::size_t count) {
    if (!m_sender) {
        throw domain::DeliveryFailedError("no delivery transport configured");
    }

    DigestOutcome outcome;
    auto highlights = m_repository->load();
    outcome.storeSize = static_cast<int>(highlights.size());
    if (highlights.empty()) {
        std::cout << "[DigestService] No highlights found. Run the import command first." << std::endl;
        return outcome;
    }
    outcome.bookCount = CountDistinctTitles(highlights);
    std::cout << "[DigestService] Loaded " << outcome.storeSize << " highlights from "
              << outcome.bookCount << " books" << std::endl;

    auto selection = m_sampler.sample(highlights, count);
    outcome.selectedCount = static_cast<int>(selection.size());
    std::cout << "[DigestService] Selected " << outcome.selectedCount << " random highlights" << std::endl;

    DigestDocument doc = DigestRenderer::Render(selection);
    outcome.deliveryId = m_sender->send(domain::DigestMessage{from, to, doc.subject, doc.html});
    std::cout << "[DigestService] Email sent successfully! ID: " << *outcome.deliveryId << std::endl;
    return outcome;
}

DigestDocument DigestService::preview(std::size_t count) {
    auto highlights = m_repository->load();
    return DigestRenderer::Render(m_sampler.sample(highlights, count));
}

} // namespace highlightdigest::application
