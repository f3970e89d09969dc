/**
 * @file HighlightMerger.cpp
 * @brief Implementation of HighlightMerger.
 */

#include "domain/HighlightMerger.hpp"
#include "domain/DedupSignature.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <unordered_set>
#include <utility>

namespace highlightdigest::domain {

namespace {

std::tm ToLocalTime(std::time_t tt) {
    std::tm tm = {};
#if defined(_WIN32)
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    return tm;
}

} // namespace

HighlightMerger::HighlightMerger(Clock clock)
    : m_clock(clock ? std::move(clock) : Clock(&HighlightMerger::NowIso8601)) {}

std::string HighlightMerger::NowIso8601() {
    auto now = std::chrono::system_clock::now();
    auto tt = std::chrono::system_clock::to_time_t(now);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        now.time_since_epoch()).count() % 1000000;
    if (micros < 0) micros += 1000000;

    std::tm tm = ToLocalTime(tt);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
       << '.' << std::setw(6) << std::setfill('0') << micros;
    return ss.str();
}

HighlightMerger::MergeResult HighlightMerger::merge(const std::vector<Highlight>& existing,
                                                    const std::vector<Highlight>& incoming) const {
    std::unordered_set<DedupSignature, DedupSignatureHash> seen;
    seen.reserve(existing.size() + incoming.size());
    for (const auto& h : existing) {
        seen.insert(BuildSignature(h));
    }

    MergeResult result;
    result.merged = existing;

    const std::string stamp = m_clock();
    for (const auto& h : incoming) {
        if (!seen.insert(BuildSignature(h)).second) {
            continue;
        }
        Highlight accepted = h;
        accepted.addedAt = stamp;
        result.merged.push_back(std::move(accepted));
        result.addedCount++;
    }

    return result;
}

} // namespace highlightdigest::domain
