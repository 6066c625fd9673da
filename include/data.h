#pragma once

#include <iostream>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "hparams.h"
#include "vocab.h"

struct Dependency
{
    unsigned head;  // 1-based, 0 is the root
    unsigned label;
};

/* One line of a data file:
 * article \t abstract \t article deps \t query \t query deps */
struct Example
{
    std::vector<std::string> article;
    std::vector<std::string> abstract;
    std::vector<Dependency> article_deps;
    std::vector<std::string> query;
    std::vector<Dependency> query_deps;

    size_t size() const { return article.size(); }
};

std::istream& operator>>(std::istream& in, Example& data);

/* Square sparse matrix in COO form. */
struct SparseAdj
{
    unsigned n = 0;
    std::vector<unsigned> rows;
    std::vector<unsigned> cols;
    std::vector<float> values;

    void add(unsigned row, unsigned col, float value = 1.f)
    {
        rows.push_back(row);
        cols.push_back(col);
        values.push_back(value);
    }
    size_t nnz() const { return values.size(); }
};

/* Per-label incoming and outgoing arcs over a padded node set. */
struct GraphInput
{
    std::vector<SparseAdj> adj_in;
    std::vector<SparseAdj> adj_out;
    std::vector<float> neighbour_count;

    unsigned n_nodes() const { return neighbour_count.size(); }
};

GraphInput make_graph_input(const std::vector<Dependency>& deps,
                            unsigned length,
                            unsigned n_nodes,
                            unsigned n_labels);

/* Padded, masked tensors for a group of examples. All per-example fields
 * have `size` entries. */
struct Batch
{
    unsigned size = 0;
    unsigned enc_steps = 0;
    unsigned dec_steps = 0;
    unsigned query_steps = 0;
    unsigned max_art_oovs = 0;

    std::vector<std::vector<unsigned>> enc_ids;
    std::vector<std::vector<unsigned>> enc_ext_ids;
    std::vector<unsigned> enc_lens;
    std::vector<std::vector<float>> enc_mask;

    std::vector<std::vector<unsigned>> dec_ids;
    std::vector<std::vector<unsigned>> target_ids;
    std::vector<unsigned> dec_lens;
    std::vector<std::vector<float>> dec_mask;

    std::vector<std::vector<unsigned>> query_ids;
    std::vector<unsigned> query_lens;
    std::vector<std::vector<float>> query_mask;

    std::vector<GraphInput> enc_graphs;
    std::vector<GraphInput> query_graphs;

    std::vector<std::vector<std::string>> art_oovs;
    std::vector<std::vector<std::string>> abstracts;
};

Batch make_batch(const std::vector<Example>& examples,
                 const Vocab& vocab,
                 const HParams& hps);

/* the same example repeated batch_size times, one slot per beam */
Batch make_decode_batch(const Example& example,
                        const Vocab& vocab,
                        const HParams& hps);


template<typename T>
std::vector<std::vector<T> >
read_batches(const std::string& filename, unsigned batch_size)
{
    std::vector<std::vector<T> > batches;

    std::ifstream in(filename);
    if (!in)
        throw std::runtime_error("Cannot open " + filename);

    std::vector<T> curr_batch;

    while(in)
    {
        T s;
        in >> s;
        if (!in) break;

        if (curr_batch.size() == batch_size)
        {
            batches.push_back(curr_batch);
            curr_batch.clear();
        }
        curr_batch.push_back(s);
    }

    // leftover batch
    if (curr_batch.size() > 0)
        batches.push_back(curr_batch);

    unsigned total_samples = 0;
    unsigned total_words = 0;
    for (auto& batch : batches)
    {
        total_samples += batch.size();
        for (auto& s : batch)
            total_words += s.size();
    }
    std::cerr << batches.size() << " batches, "
              << total_samples << " samples, "
              << total_words << " words\n";

    return batches;
}
