#include <iostream>
#include <stdexcept>

#include <dynet/lstm.h>
#include <dynet/param-init.h>

#include "builders/attn-decoder.h"
#include "utils.h"

namespace dy = dynet;

AttnDecoderBuilder::AttnDecoderBuilder(dy::ParameterCollection& pc,
                                       const AttnDecoderSettings& settings)
  : settings(settings)
  , local_pc(pc.add_subcollection("attn-decoder"))
{
    const unsigned E = settings.emb_dim;
    const unsigned H = settings.hidden_dim;
    const unsigned D = settings.enc_dim;
    const unsigned Q = settings.query_dim;
    const unsigned S = settings.lstm ? 2 * H : H;
    auto zero = dy::ParameterInitConst(0.f);

    if (settings.lstm)
        cell = std::make_unique<dy::VanillaLSTMBuilder>(1, E, H, local_pc);
    else
        cell = std::make_unique<dy::SimpleRNNBuilder>(1, E, H, local_pc);
    registry.add_all(local_pc);

    p_W_h = registry.add(local_pc.add_parameters({ D, D }, 0, "W-h"));
    p_W_s = registry.add(local_pc.add_parameters({ D, S }, 0, "W-s"));
    p_b_s = registry.add(local_pc.add_parameters({ D }, zero, "b-s"));
    p_v = registry.add(local_pc.add_parameters({ D }, 0, "v"));
    if (settings.coverage)
        p_w_c = registry.add(local_pc.add_parameters({ D }, 0, "w-c"));

    if (Q > 0) {
        p_Wq_h = registry.add(local_pc.add_parameters({ Q, Q }, 0, "Wq-h"));
        p_Wq_s = registry.add(local_pc.add_parameters({ Q, S }, 0, "Wq-s"));
        p_bq_s = registry.add(local_pc.add_parameters({ Q }, zero, "bq-s"));
        p_vq = registry.add(local_pc.add_parameters({ Q }, 0, "vq"));
    }

    p_W_x = registry.add(local_pc.add_parameters({ E, E + D + Q }, 0, "W-x"));
    p_b_x = registry.add(local_pc.add_parameters({ E }, zero, "b-x"));

    if (settings.pointer_gen) {
        p_w_gen = registry.add(
          local_pc.add_parameters({ 1, D + S + E + Q }, 0, "w-gen"));
        p_b_gen = registry.add(local_pc.add_parameters({ 1 }, zero, "b-gen"));
    }

    p_W_o = registry.add(local_pc.add_parameters({ H, H + D + Q }, 0, "W-o"));
    p_b_o = registry.add(local_pc.add_parameters({ H }, zero, "b-o"));

    std::cerr << "Attention decoder\n"
              << "  hidden dim: " << H << "\n"
              << " encoder dim: " << D << "\n"
              << "   query dim: " << Q << "\n"
              << " pointer-gen: " << settings.pointer_gen << "\n"
              << "    coverage: " << settings.coverage << "\n"
              << std::endl;
}

void
AttnDecoderBuilder::new_graph(dy::ComputationGraph& cg, bool)
{
    cg_ = &cg;
    cell->new_graph(cg);

    W_h = dy::parameter(cg, p_W_h);
    W_s = dy::parameter(cg, p_W_s);
    b_s = dy::parameter(cg, p_b_s);
    v = dy::parameter(cg, p_v);
    if (settings.coverage)
        w_c = dy::parameter(cg, p_w_c);

    if (settings.query_dim > 0) {
        Wq_h = dy::parameter(cg, p_Wq_h);
        Wq_s = dy::parameter(cg, p_Wq_s);
        bq_s = dy::parameter(cg, p_bq_s);
        vq = dy::parameter(cg, p_vq);
    }

    W_x = dy::parameter(cg, p_W_x);
    b_x = dy::parameter(cg, p_b_x);
    if (settings.pointer_gen) {
        w_gen = dy::parameter(cg, p_w_gen);
        b_gen = dy::parameter(cg, p_b_gen);
    }
    W_o = dy::parameter(cg, p_W_o);
    b_o = dy::parameter(cg, p_b_o);
}

AttnMemory
AttnDecoderBuilder::memory(const dy::Expression& states,
                           const std::vector<float>& mask)
{
    AttnMemory mem;
    mem.length = mask.size();
    mem.states = states;
    mem.features = W_h * states;
    mem.mask = dy::input(*cg_, { mem.length }, mask);
    return mem;
}

AttnMemory
AttnDecoderBuilder::query_memory(const dy::Expression& states,
                                 const std::vector<float>& mask)
{
    if (settings.query_dim == 0)
        throw std::invalid_argument("Decoder was built without a query memory");

    AttnMemory mem;
    mem.length = mask.size();
    mem.states = states;
    mem.features = Wq_h * states;
    mem.mask = dy::input(*cg_, { mem.length }, mask);
    return mem;
}

std::pair<dy::Expression, dy::Expression>
AttnDecoderBuilder::attend(const AttnMemory& mem,
                           const dy::Expression& state,
                           const dy::Expression* coverage,
                           bool query)
{
    auto dec_features = query ? dy::affine_transform({ bq_s, Wq_s, state })
                              : dy::affine_transform({ b_s, W_s, state });
    auto pre = dy::colwise_add(mem.features, dec_features);
    if (coverage != nullptr)
        pre = pre + w_c * dy::transpose(*coverage);

    auto e = dy::transpose(dy::tanh(pre)) * (query ? vq : v);
    e = dy::reshape(e, { mem.length });

    // softmax restricted to the unpadded positions
    auto attn = dy::cmult(dy::softmax(e), mem.mask);
    attn = dy::cdiv(attn, broadcast(dy::sum_elems(attn), attn.dim()));

    auto context = mem.states * attn;
    return { context, attn };
}

DecoderOutput
AttnDecoderBuilder::run(const std::vector<dy::Expression>& inputs,
                        const std::vector<dy::Expression>& init_state,
                        const AttnMemory& enc,
                        const AttnMemory* query,
                        const dy::Expression* prev_coverage,
                        bool initial_state_attention)
{
    if (init_state.size() != state_size())
        throw std::invalid_argument("Decoder initial state has wrong arity");
    if ((query != nullptr) != (settings.query_dim > 0))
        throw std::invalid_argument("Query memory does not match decoder");

    DecoderOutput out;
    out.state = init_state;

    if (settings.coverage && prev_coverage != nullptr) {
        out.coverage = *prev_coverage;
        out.has_coverage = true;
    }

    auto update_coverage = [&out](const dy::Expression& attn) {
        if (out.has_coverage)
            out.coverage = out.coverage + attn;
        else
            out.coverage = attn;
        out.has_coverage = true;
    };
    auto coverage_ptr = [this, &out]() -> const dy::Expression* {
        return (settings.coverage && out.has_coverage) ? &out.coverage : nullptr;
    };

    auto context = dy::zeros(*cg_, { settings.enc_dim });
    dy::Expression qcontext;
    if (query != nullptr)
        qcontext = dy::zeros(*cg_, { settings.query_dim });

    cell->start_new_sequence(init_state);

    if (initial_state_attention) {
        auto flat = dy::concatenate(out.state);
        auto ca = attend(enc, flat, coverage_ptr(), false);
        context = ca.first;
        if (settings.coverage)
            update_coverage(ca.second);
        if (query != nullptr)
            qcontext = attend(*query, flat, nullptr, true).first;
    }

    for (unsigned i = 0; i < inputs.size(); ++i) {
        std::vector<dy::Expression> x_in{ inputs[i], context };
        if (query != nullptr)
            x_in.push_back(qcontext);
        auto x = dy::affine_transform({ b_x, W_x, dy::concatenate(x_in) });

        auto cell_output = cell->add_input(x);
        out.state = cell->final_s();
        auto flat = dy::concatenate(out.state);

        auto ca = attend(enc, flat, coverage_ptr(), false);
        context = ca.first;
        out.attn_dists.push_back(ca.second);
        if (settings.coverage && !(i == 0 && initial_state_attention))
            update_coverage(ca.second);

        if (query != nullptr) {
            auto qa = attend(*query, flat, nullptr, true);
            qcontext = qa.first;
            out.query_attn_dists.push_back(qa.second);
        }

        if (settings.pointer_gen) {
            std::vector<dy::Expression> g_in{ context };
            g_in.insert(g_in.end(), out.state.begin(), out.state.end());
            g_in.push_back(x);
            if (query != nullptr)
                g_in.push_back(qcontext);
            out.p_gens.push_back(dy::logistic(
              dy::affine_transform({ b_gen, w_gen, dy::concatenate(g_in) })));
        }

        std::vector<dy::Expression> o_in{ cell_output, context };
        if (query != nullptr)
            o_in.push_back(qcontext);
        out.outputs.push_back(
          dy::affine_transform({ b_o, W_o, dy::concatenate(o_in) }));
    }

    return out;
}
