#include "domain/DedupSignature.hpp"
#include "domain/TextUtils.hpp"

namespace highlightdigest::domain {

DedupSignature BuildSignature(const Highlight& highlight) {
    return DedupSignature{highlight.title, Utf8Prefix(highlight.text, DedupSignature::kPrefixLength)};
}

} // namespace highlightdigest::domain
