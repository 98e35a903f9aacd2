/**
 * @file topic_index.hpp
 * @brief N‑dimensional topic trie used by the indexed topic hubs.
 *
 * A subscription registers one topic list per dimension.  It is stored
 * along every path of the cartesian product of those lists: level *d* of
 * the trie is keyed by the topics of dimension *d* and the node reached
 * after the last dimension records the subscription id.
 *
 * @verbatim
 *   subscribe(id 7, {{"a", "b"}, {"x"}})
 *
 *   root ─┬─ "a" ── "x" {7}
 *         └─ "b" ── "x" {7}
 * @endverbatim
 *
 * A notification matches a subscription when, in every dimension, the two
 * topic lists share at least one topic.  Because a subscription only lives
 * along combinations it registered for, walking the trie dimension by
 * dimension performs the AND across dimensions, while the fan‑out inside
 * one level performs the OR within a dimension.
 */

#pragma once

#include "observer/options.hpp"
#include "observer/types.hpp"

#include <algorithm>
#include <cstddef>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace observer {

class TopicIndex {
  public:
    using IdSet = std::set<SubscriptionId>;

  private:
    struct Node {
        IdSet subscribers; ///< Ids whose path ends here (last level only).
        std::unordered_map<Topic, std::unique_ptr<Node>> children;

        bool empty() const { return subscribers.empty() && children.empty(); }
    };

    const size_t m_dimensions;
    const WildcardMatching m_wildcard;
    Node m_root;

    void check_dimensions(const TopicSets& topic_sets) const {
        if (topic_sets.size() != m_dimensions) {
            throw std::invalid_argument(
                "expected " + std::to_string(m_dimensions) +
                " topic lists, got " + std::to_string(topic_sets.size()));
        }
    }

    static bool contains(const TopicList& topics, const Topic& topic) {
        return std::find(topics.begin(), topics.end(), topic) != topics.end();
    }

    static void insert_into(Node& node, const TopicSets& topic_sets,
                            size_t depth, SubscriptionId id) {
        if (depth == topic_sets.size()) {
            node.subscribers.insert(id);
            return;
        }
        for (const auto& topic : topic_sets[depth]) {
            auto& child = node.children[topic];
            if (!child) {
                child = std::make_unique<Node>();
            }
            insert_into(*child, topic_sets, depth + 1, id);
        }
    }

    static void remove_from(Node& node, const TopicSets& topic_sets,
                            size_t depth, SubscriptionId id) {
        if (depth == topic_sets.size()) {
            node.subscribers.erase(id);
            return;
        }
        for (const auto& topic : topic_sets[depth]) {
            auto it = node.children.find(topic);
            if (it == node.children.end()) {
                continue;
            }
            remove_from(*it->second, topic_sets, depth + 1, id);
            if (it->second->empty()) {
                node.children.erase(it);
            }
        }
    }

    void collect(const Node& node, const TopicSets& query, size_t depth,
                 IdSet& out) const {
        if (depth == query.size()) {
            out.insert(node.subscribers.begin(), node.subscribers.end());
            return;
        }
        const TopicList& topics = query[depth];
        if (topics.empty() || node.children.empty()) {
            return;
        }

        std::vector<const Node*> next;
        if (contains(topics, wildcard_topic)) {
            next.reserve(node.children.size());
            for (const auto& [topic, child] : node.children) {
                next.push_back(child.get());
            }
        } else {
            next.reserve(topics.size() + 1);
            for (const auto& topic : topics) {
                auto it = node.children.find(topic);
                if (it != node.children.end()) {
                    next.push_back(it->second.get());
                }
            }
            if (m_wildcard == WildcardMatching::Symmetric) {
                auto it = node.children.find(wildcard_topic);
                if (it != node.children.end()) {
                    next.push_back(it->second.get());
                }
            }
            // Repeated query topics reach the same child.
            std::sort(next.begin(), next.end());
            next.erase(std::unique(next.begin(), next.end()), next.end());
        }

        for (const Node* child : next) {
            collect(*child, query, depth + 1, out);
        }
    }

    static size_t count_nodes(const Node& node) {
        size_t count = 1;
        for (const auto& [topic, child] : node.children) {
            count += count_nodes(*child);
        }
        return count;
    }

  public:
    /**
     * @param dimensions Number of topic lists per subscription, at least 1.
     * @param wildcard   Whether a subscriber's `"*"` is universal too.
     */
    explicit TopicIndex(size_t dimensions,
                        WildcardMatching wildcard = WildcardMatching::Symmetric)
        : m_dimensions(dimensions), m_wildcard(wildcard) {
        if (m_dimensions == 0) {
            throw std::invalid_argument("topic index needs a dimension");
        }
    }

    /**
     * @brief Route future matches of @p topic_sets to @p id.
     *
     * Touches one trie path per combination of topics, i.e. the product of
     * the list sizes.  An empty list in any dimension inserts nothing.
     *
     * @throws std::invalid_argument on a dimension count mismatch.
     */
    void insert(const TopicSets& topic_sets, SubscriptionId id) {
        check_dimensions(topic_sets);
        // No path would reach the last level; creating a prefix would leave
        // nodes without subscribers behind.
        if (std::any_of(topic_sets.begin(), topic_sets.end(),
                        [](const TopicList& topics) { return topics.empty(); })) {
            return;
        }
        insert_into(m_root, topic_sets, 0, id);
    }

    /**
     * @brief Undo an @ref insert of the same @p topic_sets and @p id.
     *
     * Nodes left without subscribers and children are pruned.  Paths that
     * were never inserted are ignored.
     *
     * @throws std::invalid_argument on a dimension count mismatch.
     */
    void remove(const TopicSets& topic_sets, SubscriptionId id) {
        check_dimensions(topic_sets);
        remove_from(m_root, topic_sets, 0, id);
    }

    /**
     * @brief Ids whose topics intersect @p query in every dimension.
     *
     * `"*"` in a query list selects every subscriber of that dimension.
     * With WildcardMatching::Symmetric a subscriber's `"*"` likewise
     * matches any non‑empty query list.  An empty query list matches
     * nothing.
     *
     * @throws std::invalid_argument on a dimension count mismatch.
     */
    IdSet match(const TopicSets& query) const {
        check_dimensions(query);
        IdSet out;
        collect(m_root, query, 0, out);
        return out;
    }

    size_t dimensions() const { return m_dimensions; }
    WildcardMatching wildcard() const { return m_wildcard; }

    /// Live nodes including the root.
    size_t node_count() const { return count_nodes(m_root); }

    bool empty() const { return m_root.empty(); }

    void clear() {
        m_root.children.clear();
        m_root.subscribers.clear();
    }
};

} // namespace observer
