#pragma once
/* Author: Caio Corro
 * License: MIT
 * Part of https://github.com/FilippoC/dynet-tools/
 */

#include <memory>
#include <vector>

#include <dynet/model.h>
#include <dynet/rnn.h>
#include <dynet/lstm.h>

#include "builders/registry.h"

namespace dy = dynet;

struct BiRNNSettings
{
    unsigned stacks;
    unsigned dim;
    bool lstm;

    unsigned int output_rows(const unsigned input_dim) const;
};


/* Forward/backward recurrent pair. After a call, fw_final and bw_final hold
 * each direction's last state: {c, h} for an LSTM, {h} for a plain RNN. */
struct BiRNNBuilder
{
    const BiRNNSettings settings;
    dy::ParameterCollection local_pc;
    const unsigned input_dim;
    ParamRegistry registry;

    std::vector<std::pair<std::unique_ptr<dy::RNNBuilder>,
                          std::unique_ptr<dy::RNNBuilder>>> builders;

    std::vector<dy::Expression> fw_final;
    std::vector<dy::Expression> bw_final;

    BiRNNBuilder(dy::ParameterCollection& pc,
                 const BiRNNSettings& settings,
                 unsigned input_dim,
                 const std::string& name = "birnn");

    void new_graph(dy::ComputationGraph& cg, bool training, bool update);
    std::vector<dy::Expression> operator()(const std::vector<dy::Expression>& embeddings);

    unsigned output_rows() const;
};
