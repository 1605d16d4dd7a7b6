#include "incidence_graph.h"

#include <algorithm>

IncidenceGraph::IncidenceGraph(const TransactionList& transactions) {
    for (uint32_t tid = 0; tid < transactions.size(); ++tid) {
        add_transaction(tid, transactions[tid]);
    }
}

void IncidenceGraph::add_transaction(uint32_t transaction_id, const Transaction& transaction) {
    find_or_add_node(NodeKind::Transaction, transaction_id);
    for (ItemId item : transaction) {
        add_edge(transaction_id, item);
    }
}

void IncidenceGraph::add_edge(uint32_t transaction_id, ItemId item) {
    size_t t = find_or_add_node(NodeKind::Transaction, transaction_id);
    size_t i = find_or_add_node(NodeKind::Item, item);

    // Simple graph: a repeated membership adds nothing
    auto& t_adj = _nodes[t].adjacent;
    if (std::find(t_adj.begin(), t_adj.end(), i) != t_adj.end()) {
        return;
    }
    t_adj.push_back(i);
    _nodes[i].adjacent.push_back(t);
    ++_edge_count;
}

std::vector<ItemId> IncidenceGraph::seed_items() const {
    std::vector<ItemId> items;
    for (const auto& node : _nodes) {
        if (node.kind == NodeKind::Item && !node.adjacent.empty()) {
            items.push_back(node.label);
        }
    }
    std::sort(items.begin(), items.end());
    return items;
}

size_t IncidenceGraph::degree(NodeKind kind, uint32_t label) const {
    auto it = _node_index.find(node_key(kind, label));
    if (it == _node_index.end()) {
        return 0;
    }
    return _nodes[it->second].adjacent.size();
}

size_t IncidenceGraph::find_or_add_node(NodeKind kind, uint32_t label) {
    auto [it, inserted] = _node_index.try_emplace(node_key(kind, label), _nodes.size());
    if (inserted) {
        _nodes.emplace_back(kind, label);
    }
    return it->second;
}
