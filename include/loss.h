#pragma once

/* Training objectives over per-example, per-step expressions. Outer
 * vectors index examples, inner vectors decoder steps. */

#include <vector>

#include <dynet/expr.h>

namespace dy = dynet;

/* sum_t mask * value / dec_len per example, then the batch mean */
dy::Expression mask_and_avg(const std::vector<std::vector<dy::Expression>>& values,
                            const std::vector<std::vector<float>>& mask);

/* per step: sum_i min(a_t[i], sum_{s<t} a_s[i]) */
std::vector<dy::Expression> step_coverage_losses(const std::vector<dy::Expression>& attn_dists);

dy::Expression coverage_loss(const std::vector<std::vector<dy::Expression>>& attn_dists,
                             const std::vector<std::vector<float>>& mask);

/* token-level cross-entropy over unnormalized scores, averaged over all
 * unpadded tokens of the batch */
dy::Expression sequence_loss(const std::vector<std::vector<dy::Expression>>& scores,
                             const std::vector<std::vector<unsigned>>& targets,
                             const std::vector<std::vector<float>>& mask);
