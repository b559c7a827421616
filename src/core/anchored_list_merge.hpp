#pragma once

#include <cstddef>
#include <iterator>
#include <list>
#include <map>
#include <optional>
#include <set>
#include <utility>
#include <vector>

namespace quire {

/**
 * ListAnchor - an element that exists only on one side of a sequence merge,
 * together with its immediate neighbours in that side's original order.
 */
template<typename Id>
struct ListAnchor {
    Id id;
    std::optional<Id> predecessor;
    std::optional<Id> successor;

    bool operator==(const ListAnchor&) const = default;
};

template<typename Id, typename T>
struct AnchoredElement {
    ListAnchor<Id> anchor;
    T value;
};

/**
 * Builds anchors for the ids in `sequence` that are members of `foreign`,
 * in sequence order. Neighbours are taken from the full sequence, so a
 * foreign element may be anchored to another foreign element.
 */
template<typename Id>
[[nodiscard]] std::vector<ListAnchor<Id>> build_list_anchors(const std::vector<Id>& sequence,
                                                             const std::set<Id>& foreign) {
    std::vector<ListAnchor<Id>> anchors;
    anchors.reserve(foreign.size());
    for (size_t i = 0; i < sequence.size(); ++i) {
        if (foreign.count(sequence[i]) == 0) continue;

        ListAnchor<Id> anchor{sequence[i], std::nullopt, std::nullopt};
        if (i > 0) anchor.predecessor = sequence[i - 1];
        if (i + 1 < sequence.size()) anchor.successor = sequence[i + 1];
        anchors.push_back(std::move(anchor));
    }
    return anchors;
}

/**
 * Splices `foreign` elements into `placed`, keeping each one adjacent to an
 * original neighbour:
 * - after its predecessor when the predecessor is already placed,
 * - else before its successor when the successor is already placed,
 * - else appended to the end.
 *
 * Elements are resolved greedily in their given (original relative) order and
 * each one becomes an anchor for the rest, so a run of consecutive foreign
 * elements lands in order behind its first member.
 *
 * `id_of(const T&)` returns std::optional<Id>; placed elements without an id
 * keep their position but cannot serve as anchors.
 */
template<typename Id, typename T, typename IdOf>
[[nodiscard]] std::vector<T> splice_anchored(std::vector<T> placed,
                                             std::vector<AnchoredElement<Id, T>> foreign,
                                             IdOf&& id_of) {
    if (foreign.empty()) return placed;

    std::list<T> out;
    std::map<Id, typename std::list<T>::iterator> positions;

    for (auto& element : placed) {
        out.push_back(std::move(element));
        if (auto id = id_of(out.back())) {
            positions.emplace(std::move(*id), std::prev(out.end()));
        }
    }

    for (auto& element : foreign) {
        const auto& anchor = element.anchor;
        auto at = out.end();

        const auto pred = anchor.predecessor ? positions.find(*anchor.predecessor) : positions.end();
        if (pred != positions.end()) {
            at = std::next(pred->second);
        } else if (anchor.successor) {
            const auto succ = positions.find(*anchor.successor);
            if (succ != positions.end()) {
                at = succ->second;
            }
        }

        const auto inserted = out.insert(at, std::move(element.value));
        positions.emplace(anchor.id, inserted);
    }

    return std::vector<T>(std::make_move_iterator(out.begin()), std::make_move_iterator(out.end()));
}

} // namespace quire
