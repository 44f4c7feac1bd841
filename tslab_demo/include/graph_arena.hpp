#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "tslab/keys/index_key.hpp"
#include "tslab/slab/typed_slab.hpp"

namespace tslab_demo {

    struct node_tag;
    struct edge_tag;

    using node_key = tslab::keys::index_key<node_tag>;
    using edge_key = tslab::keys::index_key<edge_tag>;

    struct node {
        node_key self;
        std::string name;
        std::vector<edge_key> outgoing;
    };

    struct edge {
        node_key from;
        node_key to;
        double weight = 0.0;
    };

    // Directed graph kept in two arenas. Nodes and edges refer to each other
    // through keys only, so removing one never invalidates references to the others.
    class graph_arena {
    public:

        using node_store = tslab::slab::typed_slab<node_key, node, tslab::slab::stats>;
        using edge_store = tslab::slab::typed_slab<edge_key, edge, tslab::slab::stats>;

        node_key add_node(std::string name) {
            auto [key, value] = nodes_.insert_entry(node{ {}, std::move(name), {} });
            value.self = key;
            return key;
        }

        std::optional<edge_key> connect(node_key from, node_key to, double weight) {
            auto source = nodes_.get_mut(from);
            if (source == nullptr || !nodes_.contains(to)) {
                return std::nullopt;
            }
            auto key = edges_.insert(edge{ from, to, weight });
            source->outgoing.push_back(key);
            return { key };
        }

        bool remove_edge(edge_key key) {
            auto removed = edges_.remove(key);
            if (!removed) {
                return false;
            }
            if (auto source = nodes_.get_mut(removed->from)) {
                std::erase(source->outgoing, key);
            }
            return true;
        }

        // drops the node together with every edge that touches it
        bool remove_node(node_key key) {
            if (!nodes_.contains(key)) {
                return false;
            }
            std::vector<edge_key> touching;
            for (const auto& [ek, e] : edges_.iter()) {
                if (e.from == key || e.to == key) {
                    touching.push_back(ek);
                }
            }
            for (auto ek : touching) {
                remove_edge(ek);
            }
            return nodes_.remove(key).has_value();
        }

        const node* find(node_key key) const {
            return nodes_.get(key);
        }

        const edge* find(edge_key key) const {
            return edges_.get(key);
        }

        std::vector<node_key> neighbours(node_key key) const {
            std::vector<node_key> res;
            if (auto n = nodes_.get(key)) {
                for (auto ek : n->outgoing) {
                    if (auto e = edges_.get(ek)) {
                        res.push_back(e->to);
                    }
                }
            }
            return res;
        }

        double out_weight(node_key key) const {
            double total = 0.0;
            if (auto n = nodes_.get(key)) {
                for (auto ek : n->outgoing) {
                    total += edges_.at(ek).weight;
                }
            }
            return total;
        }

        std::size_t node_count() const noexcept {
            return nodes_.len();
        }

        std::size_t edge_count() const noexcept {
            return edges_.len();
        }

        const node_store& nodes() const noexcept {
            return nodes_;
        }

        const edge_store& edges() const noexcept {
            return edges_;
        }

        // hands every node out and leaves both arenas empty
        std::vector<node> take_nodes() {
            std::vector<node> res;
            res.reserve(nodes_.len());
            for (auto n : nodes_.drain()) {
                res.push_back(std::move(n));
            }
            edges_.clear();
            return res;
        }

    private:
        node_store nodes_;
        edge_store edges_;
    };

} // namespace tslab_demo
