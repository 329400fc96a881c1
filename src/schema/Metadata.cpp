#include "wirepod/schema/Metadata.hpp"

#include <sstream>
#include <utility>

namespace wirepod::schema {

TagMatch TagMatch::literal(std::int64_t value) {
    return range(value, value);
}

TagMatch TagMatch::range(std::int64_t first, std::int64_t last) {
    TagMatch match;
    match.ranges_.push_back({first, last});
    return match;
}

TagMatch TagMatch::anyOf(std::initializer_list<std::int64_t> values) {
    TagMatch match;
    for (auto v : values) {
        match.ranges_.push_back({v, v});
    }
    return match;
}

TagMatch& TagMatch::orLiteral(std::int64_t value) {
    ranges_.push_back({value, value});
    return *this;
}

TagMatch& TagMatch::orRange(std::int64_t first, std::int64_t last) {
    ranges_.push_back({first, last});
    return *this;
}

bool TagMatch::matches(std::uint64_t bits, bool isSigned) const noexcept {
    for (const auto& r : ranges_) {
        if (isSigned) {
            const auto v = static_cast<std::int64_t>(bits);
            if (v >= r.first && v <= r.last) return true;
        } else {
            const auto lo = static_cast<std::uint64_t>(r.first);
            const auto hi = static_cast<std::uint64_t>(r.last);
            if (bits >= lo && bits <= hi) return true;
        }
    }
    return false;
}

std::optional<std::int64_t> TagMatch::singleLiteral() const noexcept {
    if (ranges_.size() == 1 && ranges_.front().first == ranges_.front().last) {
        return ranges_.front().first;
    }
    return std::nullopt;
}

std::string TagMatch::describe() const {
    std::ostringstream os;
    for (std::size_t i = 0; i < ranges_.size(); ++i) {
        if (i) os << " | ";
        if (ranges_[i].first == ranges_[i].last) {
            os << ranges_[i].first;
        } else {
            os << ranges_[i].first << "..=" << ranges_[i].last;
        }
    }
    return os.str();
}

namespace {

template <typename T>
void overlay(std::optional<T>& target, const std::optional<T>& inner) {
    if (inner) {
        target = inner;
    }
}

} // namespace

Metadata merge(const Metadata& outer, const Metadata& inner) {
    Metadata out = outer;
    overlay(out.tagType, inner.tagType);
    overlay(out.keepTag, inner.keepTag);
    overlay(out.keepDiff, inner.keepDiff);
    overlay(out.sizeType, inner.sizeType);
    overlay(out.byteSized, inner.byteSized);
    overlay(out.byteOrder, inner.byteOrder);
    return out;
}

} // namespace wirepod::schema
