#include <map>
#include <stdexcept>
#include <utility>

#include "builders/adjmatrix.h"


dy::Expression
make_fixed_adj(dy::ComputationGraph& cg, const SparseAdj& adj)
{
    unsigned n = adj.n;

    if (adj.nnz() == 0)
        return dy::zeros(cg, { n, n });

    // (row, col) of A lands at column-major offset row * n + col of A^T
    std::map<unsigned, float> cells;
    for (size_t k = 0; k < adj.nnz(); ++k) {
        if (adj.rows[k] >= n || adj.cols[k] >= n)
            throw std::invalid_argument("Adjacency entry outside node range");
        cells[adj.rows[k] * n + adj.cols[k]] += adj.values[k];
    }

    std::vector<unsigned int> ixs;
    std::vector<float> data;
    for (auto&& c : cells) {
        ixs.push_back(c.first);
        data.push_back(c.second);
    }

    // sparse input
    return dy::input(cg, { n, n }, ixs, data);
}

SparseAdj
merge_labels(const std::vector<SparseAdj>& adjs)
{
    SparseAdj merged;
    if (adjs.empty())
        return merged;
    merged.n = adjs.front().n;

    std::map<std::pair<unsigned, unsigned>, float> cells;
    for (auto&& adj : adjs)
        for (size_t k = 0; k < adj.nnz(); ++k)
            cells[{ adj.rows[k], adj.cols[k] }] += adj.values[k];

    for (auto&& c : cells)
        merged.add(c.first.first, c.first.second, c.second);
    return merged;
}

GraphExprs
make_graph(dy::ComputationGraph& cg, const GraphInput& graph, unsigned n_labels)
{
    GraphExprs g;
    g.n_nodes = graph.n_nodes();

    if (n_labels == 1) {
        g.in_t.push_back(make_fixed_adj(cg, merge_labels(graph.adj_in)));
        g.out_t.push_back(make_fixed_adj(cg, merge_labels(graph.adj_out)));
    } else {
        if (graph.adj_in.size() != n_labels || graph.adj_out.size() != n_labels)
            throw std::invalid_argument(
              "Graph has " + std::to_string(graph.adj_in.size()) +
              " labels, GCN expects " + std::to_string(n_labels));
        for (unsigned l = 0; l < n_labels; ++l) {
            g.in_t.push_back(make_fixed_adj(cg, graph.adj_in[l]));
            g.out_t.push_back(make_fixed_adj(cg, graph.adj_out[l]));
        }
    }

    g.degree = dy::input(cg, { 1, g.n_nodes }, graph.neighbour_count);
    return g;
}
