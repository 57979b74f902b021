// value_compare.cpp - Scalar and deep equality under DiffOptions

#include <tree_diff/value_compare.h>

#include <cmath>
#include <vector>

namespace tree_diff {

namespace detail {

std::string_view trim(std::string_view text) noexcept
{
    constexpr std::string_view whitespace{" \t\n\v\f\r\0", 7};
    const auto first = text.find_first_not_of(whitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

} // namespace detail

bool comparable(const Value& lhs, const Value& rhs, bool strict) noexcept
{
    if (lhs.is_map() && rhs.is_map()) return true;
    if (lhs.is_vector() && rhs.is_vector()) return true;
    if (!strict && lhs.is_number() && rhs.is_number()) return true;
    return lhs.type_index() == rhs.type_index();
}

bool compare_values(const Value& lhs, const Value& rhs, const DiffOptions& options)
{
    if (lhs.is_number() && rhs.is_number()) {
        const auto* li = lhs.get_if<int64_t>();
        const auto* ri = rhs.get_if<int64_t>();
        if (li && ri && options.numeric_tolerance == 0.0) {
            return *li == *ri;
        }
        return std::fabs(lhs.as_number() - rhs.as_number()) <= options.numeric_tolerance;
    }

    if (options.strip) {
        const auto* ls = lhs.get_if<std::string>();
        const auto* rs = rhs.get_if<std::string>();
        if (ls && rs) {
            return detail::trim(*ls) == detail::trim(*rs);
        }
    }

    return lhs == rhs;
}

bool one_sided_key_equal(const DiffPath& path, const Value& lhs, const Value& rhs,
                         const DiffOptions& options)
{
    const Verdict verdict = consult_comparator(path, lhs, rhs, options);
    switch (verdict.kind()) {
        case Verdict::Kind::Equal:
            return true;
        case Verdict::Kind::Replace:
            return verdict.changes().empty();
        case Verdict::Kind::NotEqual:
        case Verdict::Kind::Defer:
            break;
    }
    return false;
}

bool values_equal(const DiffPath& path, const Value& lhs, const Value& rhs, const DiffOptions& options)
{
    struct Pending {
        DiffPath path;
        const Value* lhs;
        const Value* rhs;
    };

    // Paths only matter to a custom comparator
    const bool track_paths = static_cast<bool>(options.comparator);

    std::vector<Pending> stack;
    stack.push_back(Pending{path, &lhs, &rhs});

    while (!stack.empty()) {
        Pending top = std::move(stack.back());
        stack.pop_back();

        const Verdict verdict = consult_comparator(top.path, *top.lhs, *top.rhs, options);
        switch (verdict.kind()) {
            case Verdict::Kind::Equal:
                continue;
            case Verdict::Kind::NotEqual:
                return false;
            case Verdict::Kind::Replace:
                if (!verdict.changes().empty()) return false;
                continue;
            case Verdict::Kind::Defer:
                break;
        }

        const Value& a = *top.lhs;
        const Value& b = *top.rhs;

        if (a.is_null() && b.is_null()) continue;
        if (a.is_null() || b.is_null()) return false;
        if (!comparable(a, b, options.strict)) return false;

        if (const auto* am = a.get_if<ValueMap>()) {
            const auto& bm = *b.get_if<ValueMap>();
            // Without a comparator a one-sided key always differs
            if (!track_paths && am->size() != bm.size()) return false;
            for (const auto& [key, box] : *am) {
                const auto* other = bm.find(key);
                if (!other) {
                    if (!track_paths || !one_sided_key_equal(append_key(top.path, key, options),
                                                             box.get(), Value{}, options)) {
                        return false;
                    }
                    continue;
                }
                stack.push_back(Pending{track_paths ? append_key(top.path, key, options) : DiffPath{},
                                        &box.get(), &other->get()});
            }
            if (track_paths) {
                for (const auto& [key, box] : bm) {
                    if (!am->find(key) && !one_sided_key_equal(append_key(top.path, key, options),
                                                               Value{}, box.get(), options)) {
                        return false;
                    }
                }
            }
        } else if (const auto* av = a.get_if<ValueVector>()) {
            const auto& bv = *b.get_if<ValueVector>();
            if (av->size() != bv.size()) return false;
            for (std::size_t i = 0; i < av->size(); ++i) {
                stack.push_back(Pending{track_paths ? append_index(top.path, i, options) : DiffPath{},
                                        &(*av)[i].get(), &bv[i].get()});
            }
        } else if (!compare_values(a, b, options)) {
            return false;
        }
    }

    return true;
}

} // namespace tree_diff
