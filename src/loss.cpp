#include <stdexcept>

#include "loss.h"

dy::Expression
mask_and_avg(const std::vector<std::vector<dy::Expression>>& values,
             const std::vector<std::vector<float>>& mask)
{
    if (values.size() != mask.size() || values.empty())
        throw std::invalid_argument("mask_and_avg: batch size mismatch");

    std::vector<dy::Expression> per_example;
    for (size_t b = 0; b < values.size(); ++b) {
        float dec_len = 0.f;
        for (auto m : mask[b])
            dec_len += m;
        if (dec_len <= 0.f)
            throw std::invalid_argument("mask_and_avg: example with no valid step");

        std::vector<dy::Expression> terms;
        for (size_t t = 0; t < values[b].size() && t < mask[b].size(); ++t)
            if (mask[b][t] != 0.f)
                terms.push_back(values[b][t] * mask[b][t]);

        if (terms.empty())
            throw std::invalid_argument("mask_and_avg: no value under the mask");
        per_example.push_back(dy::sum(terms) / dec_len);
    }
    return dy::average(per_example);
}

std::vector<dy::Expression>
step_coverage_losses(const std::vector<dy::Expression>& attn_dists)
{
    std::vector<dy::Expression> losses;
    if (attn_dists.empty())
        return losses;

    auto& a0 = attn_dists.front();
    auto coverage = dy::zeros(*a0.pg, a0.dim());
    for (auto&& a : attn_dists) {
        losses.push_back(dy::sum_elems(dy::min(a, coverage)));
        coverage = coverage + a;
    }
    return losses;
}

dy::Expression
coverage_loss(const std::vector<std::vector<dy::Expression>>& attn_dists,
              const std::vector<std::vector<float>>& mask)
{
    std::vector<std::vector<dy::Expression>> per_step;
    for (auto&& dists : attn_dists)
        per_step.push_back(step_coverage_losses(dists));
    return mask_and_avg(per_step, mask);
}

dy::Expression
sequence_loss(const std::vector<std::vector<dy::Expression>>& scores,
              const std::vector<std::vector<unsigned>>& targets,
              const std::vector<std::vector<float>>& mask)
{
    if (scores.size() != targets.size() || scores.size() != mask.size())
        throw std::invalid_argument("sequence_loss: batch size mismatch");

    std::vector<dy::Expression> losses;
    float total = 0.f;
    for (size_t b = 0; b < scores.size(); ++b) {
        for (size_t t = 0; t < scores[b].size() && t < mask[b].size(); ++t) {
            if (mask[b][t] == 0.f)
                continue;
            losses.push_back(
              dy::pickneglogsoftmax(scores[b][t], targets[b].at(t)) * mask[b][t]);
            total += mask[b][t];
        }
    }

    if (losses.empty())
        throw std::invalid_argument("sequence_loss: no unpadded target");
    return dy::sum(losses) / total;
}
