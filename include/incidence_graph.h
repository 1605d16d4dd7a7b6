#ifndef INCIDENCE_GRAPH_H
#define INCIDENCE_GRAPH_H

#include <vector>
#include <unordered_map>
#include <cstdint>
#include <cstddef>

#include "common.h"

// Transaction nodes live in their own key space, so no item label can
// collide with a transaction node.
enum class NodeKind : uint32_t {
    Item = 0,
    Transaction = 1
};

struct GraphNode {
    NodeKind kind;
    uint32_t label;                 // item id or transaction index
    std::vector<size_t> adjacent;   // indices into the node table

    GraphNode(NodeKind kind, uint32_t label): kind(kind), label(label) {}
};

class IncidenceGraph {
public:
    IncidenceGraph() = default;
    explicit IncidenceGraph(const TransactionList& transactions);

    void add_transaction(uint32_t transaction_id, const Transaction& transaction);
    void add_edge(uint32_t transaction_id, ItemId item);

    // Items with at least one incident transaction, ascending
    std::vector<ItemId> seed_items() const;

    size_t degree(NodeKind kind, uint32_t label) const;
    size_t node_count() const { return _nodes.size(); }
    size_t edge_count() const { return _edge_count; }

private:
    std::vector<GraphNode> _nodes;
    std::unordered_map<uint64_t, size_t> _node_index;
    size_t _edge_count = 0;

    static uint64_t node_key(NodeKind kind, uint32_t label) {
        return (static_cast<uint64_t>(kind) << 32) | label;
    }

    size_t find_or_add_node(NodeKind kind, uint32_t label);
};

#endif
