#include <algorithm>
#include <stdexcept>

#include <dynet/param-init.h>

#include "builders/copy.h"
#include "utils.h"

VocabProjection::VocabProjection(dy::ParameterCollection& pc,
                                 unsigned hidden_dim,
                                 unsigned vocab_size,
                                 float init_std)
  : local_pc(pc.add_subcollection("output-projection"))
{
    p_W = registry.add(local_pc.add_parameters(
      { vocab_size, hidden_dim },
      truncated_normal_init({ vocab_size, hidden_dim }, init_std), "W"));
    p_v = registry.add(local_pc.add_parameters(
      { vocab_size }, truncated_normal_init({ vocab_size }, init_std), "v"));
}

void
VocabProjection::new_graph(dy::ComputationGraph& cg)
{
    W = dy::parameter(cg, p_W);
    v = dy::parameter(cg, p_v);
}

dy::Expression
VocabProjection::scores(const dy::Expression& output) const
{
    return dy::affine_transform({ v, W, output });
}

CopyDistribution::CopyDistribution(dy::ComputationGraph& cg,
                                   const std::vector<unsigned>& enc_ext_ids,
                                   unsigned vocab_size,
                                   unsigned max_oovs)
  : cg{ &cg }
  , vocab_size{ vocab_size }
  , max_oovs{ max_oovs }
  , ids{ enc_ext_ids }
{
    if (enc_ext_ids.empty())
        throw std::invalid_argument("Copy distribution over an empty article");

    std::sort(ids.begin(), ids.end());
    ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
    if (ids.back() >= extended_size())
        throw std::invalid_argument("Article id beyond the extended vocabulary");

    const unsigned U = ids.size();
    const unsigned T = enc_ext_ids.size();
    std::vector<unsigned int> ixs;
    std::vector<float> data(T, 1.f);
    for (unsigned t = 0; t < T; ++t) {
        auto k = std::lower_bound(ids.begin(), ids.end(), enc_ext_ids[t]) -
                 ids.begin();
        ixs.push_back(t * U + k);
    }
    scatter = dy::input(cg, { U, T }, ixs, data);
}

dy::Expression
CopyDistribution::copy_mass(const dy::Expression& attn) const
{
    return scatter * attn;
}

dy::Expression
CopyDistribution::final_dist(const dy::Expression& vocab_dist,
                             const dy::Expression& attn,
                             const dy::Expression& p_gen) const
{
    auto gen = scale(vocab_dist, p_gen);
    auto copy = copy_mass(scale(attn, 1.f - p_gen));

    // walk the extended vocabulary once, adding copy mass where an
    // article id lands
    std::vector<dy::Expression> pieces;
    unsigned pos = 0;
    for (unsigned k = 0; k < ids.size(); ++k) {
        auto id = ids[k];
        auto mass = dy::pick(copy, k);
        if (id < vocab_size) {
            if (id > pos)
                pieces.push_back(dy::pick_range(gen, pos, id));
            pieces.push_back(dy::pick(gen, id) + mass);
        } else {
            if (pos < vocab_size) {
                pieces.push_back(dy::pick_range(gen, pos, vocab_size));
                pos = vocab_size;
            }
            if (id > pos)
                pieces.push_back(dy::zeros(*cg, { id - pos }));
            pieces.push_back(mass);
        }
        pos = id + 1;
    }
    if (pos < vocab_size) {
        pieces.push_back(dy::pick_range(gen, pos, vocab_size));
        pos = vocab_size;
    }
    if (pos < extended_size())
        pieces.push_back(dy::zeros(*cg, { extended_size() - pos }));

    return dy::concatenate(pieces);
}

dy::Expression
CopyDistribution::gold_prob(const dy::Expression& vocab_dist,
                            const dy::Expression& attn,
                            const dy::Expression& p_gen,
                            unsigned target) const
{
    std::vector<dy::Expression> terms;
    if (target < vocab_size)
        terms.push_back(dy::cmult(p_gen, dy::pick(vocab_dist, target)));

    auto it = std::lower_bound(ids.begin(), ids.end(), target);
    if (it != ids.end() && *it == target) {
        auto k = it - ids.begin();
        auto mass = dy::pick(copy_mass(attn), k);
        terms.push_back(dy::cmult(1.f - p_gen, mass));
    }

    if (terms.empty())
        throw std::invalid_argument(
          "Target id " + std::to_string(target) +
          " is neither in the vocabulary nor copied from the article");
    return dy::sum(terms);
}
