#include "domain/ClippingSplitter.hpp"
#include "domain/TextUtils.hpp"

namespace highlightdigest::domain {

std::vector<RawBlock> ClippingSplitter::Split(const std::string& content) {
    std::vector<RawBlock> blocks;
    std::string current;

    auto flush = [&]() {
        std::string trimmed = Trim(current);
        if (!trimmed.empty()) {
            blocks.push_back(RawBlock{trimmed});
        }
        current.clear();
    };

    for (const auto& line : SplitLines(content)) {
        if (Trim(line) == kSeparator) {
            flush();
            continue;
        }
        current += line;
        current += '\n';
    }
    flush();

    return blocks;
}

} // namespace highlightdigest::domain
