/* Author: Caio Corro
 * License: MIT
 * Part of https://github.com/FilippoC/dynet-tools/
 */

#include <iostream>
#include <stdexcept>

#include "builders/bilstm.h"

namespace dy = dynet;


unsigned int BiRNNSettings::output_rows(const unsigned input_dim) const
{
    if (stacks == 0)
        return input_dim;
    else
        return 2 * dim;
}


namespace {

std::unique_ptr<dy::RNNBuilder>
make_cell(bool lstm, unsigned input_dim, unsigned dim, dy::ParameterCollection& pc)
{
    if (lstm)
        return std::make_unique<dy::VanillaLSTMBuilder>(1, input_dim, dim, pc);
    return std::make_unique<dy::SimpleRNNBuilder>(1, input_dim, dim, pc);
}

}


BiRNNBuilder::BiRNNBuilder(dy::ParameterCollection &pc,
                           const BiRNNSettings &settings,
                           unsigned input_dim,
                           const std::string& name) :
        settings(settings),
        local_pc(pc.add_subcollection(name)),
        input_dim(input_dim)
{
    for (unsigned stack = 0; stack < settings.stacks; ++stack)
    {
        auto in_dim = (stack == 0 ? input_dim : 2 * settings.dim);
        builders.emplace_back(
                make_cell(settings.lstm, in_dim, settings.dim, local_pc),
                make_cell(settings.lstm, in_dim, settings.dim, local_pc));
    }
    registry.add_all(local_pc);

    std::cerr
            << (settings.lstm ? "BiLSTM" : "BiRNN") << " (" << name << ")\n"
            << " input dim: " << input_dim << "\n"
            << " hidden dim: " << settings.dim << "\n"
            << " stacks: " << settings.stacks << "\n"
            << "\n";
}

unsigned BiRNNBuilder::output_rows() const
{
    return settings.output_rows(input_dim);
}

void BiRNNBuilder::new_graph(dy::ComputationGraph &cg, bool, bool update)
{
    for (unsigned stack = 0; stack < settings.stacks; ++stack)
    {
        builders.at(stack).first->new_graph(cg, update);
        builders.at(stack).second->new_graph(cg, update);
    }
}

std::vector<dy::Expression> BiRNNBuilder::operator()(const std::vector<dy::Expression>& embeddings)
{
    const unsigned size = embeddings.size();
    if (size == 0)
        throw std::invalid_argument("BiRNN over an empty sequence");

    std::vector<dy::Expression> ret(embeddings);

    std::vector<dy::Expression> e_forward(embeddings.size());
    std::vector<dy::Expression> e_backward(embeddings.size());
    for (unsigned stack = 0; stack < settings.stacks; ++stack)
    {
        auto& fw = *builders.at(stack).first;
        auto& bw = *builders.at(stack).second;
        fw.start_new_sequence();
        bw.start_new_sequence();

        for (unsigned i = 0u ; i < size ; ++i)
            e_forward.at(i) = fw.add_input(ret.at(i));
        for (int i = size - 1 ; i >= 0 ; --i)
            e_backward.at(i) = bw.add_input(ret.at(i));
        for (unsigned i = 0u ; i < size ; ++i)
            ret.at(i) = dy::concatenate({e_forward.at(i), e_backward.at(i)});

        fw_final = fw.final_s();
        bw_final = bw.final_s();
    }
    return ret;
}
