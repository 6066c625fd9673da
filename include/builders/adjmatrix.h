#pragma once

/* Turn host-side dependency graphs into graph-level expressions. */

#include <vector>

#include <dynet/expr.h>

#include "data.h"

namespace dy = dynet;

/* Adjacency in the node-as-column layout used by the GCN: for node
 * features H (dim x n), H * in_t[l] aggregates the incoming neighbours
 * of every node under label l. */
struct GraphExprs
{
    std::vector<dy::Expression> in_t;
    std::vector<dy::Expression> out_t;
    dy::Expression degree;  // {1, n}
    unsigned n_nodes = 0;

    unsigned n_labels() const { return in_t.size(); }
};

/* Transpose of a COO matrix, fed as a sparse input. */
dy::Expression make_fixed_adj(dy::ComputationGraph& cg, const SparseAdj& adj);

/* Collapse all labels into one adjacency, summing coinciding arcs. */
SparseAdj merge_labels(const std::vector<SparseAdj>& adjs);

/* With n_labels == 1 every label's arcs are merged; otherwise the input
 * must carry exactly n_labels adjacency matrices per direction. */
GraphExprs make_graph(dy::ComputationGraph& cg,
                      const GraphInput& graph,
                      unsigned n_labels);
