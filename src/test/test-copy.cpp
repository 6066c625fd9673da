#include <dynet/dynet.h>
#include <dynet/expr.h>
#include <dynet/grad-check.h>

#include <iostream>
#include <numeric>
#include <vector>

#include "builders/copy.h"
#include "expect.h"

namespace dy = dynet;

/* vocabulary of 6 words; the article repeats word 5 and has two OOVs,
 * one of them (6) only as a padding slot of the batch */
const unsigned V = 6;
const unsigned MAX_OOVS = 2;
const std::vector<unsigned> ARTICLE{ 5, 7, 5, 2 };

void test_final_dist()
{
    dy::ComputationGraph cg;
    CopyDistribution copy(cg, ARTICLE, V, MAX_OOVS);
    expect(copy.extended_size() == 8, "extended size is V + max oovs");
    expect(copy.ids == std::vector<unsigned>({ 2, 5, 7 }), "distinct ids sorted");

    auto scores = dy::input(cg, { V }, { .1f, -.3f, .5f, 0.f, .2f, 1.f });
    auto vocab_dist = dy::softmax(scores);
    auto attn = dy::input(cg, { 4 }, { .1f, .2f, .3f, .4f });
    auto p_gen = dy::input(cg, { 1 }, { .7f });

    auto final_dist = copy.final_dist(vocab_dist, attn, p_gen);
    auto fd = dy::as_vector(final_dist.value());
    auto vd = dy::as_vector(vocab_dist.value());

    expect(fd.size() == 8, "final distribution covers the extended vocabulary");
    expect(close_to(std::accumulate(fd.begin(), fd.end(), 0.f), 1.f),
           "final distribution sums to one");
    expect(close_to(fd[5], .7f * vd[5] + .3f * (.1f + .3f)),
           "repeated article word accumulates its attention");
    expect(close_to(fd[2], .7f * vd[2] + .3f * .4f), "in-vocabulary copy mixes");
    expect(close_to(fd[0], .7f * vd[0]), "uncopied word is generated only");
    expect(close_to(fd[6], 0.f), "absent OOV slot is zero");
    expect(close_to(fd[7], .3f * .2f), "article OOV gets copy mass only");

    for (unsigned target : { 0u, 2u, 5u, 7u }) {
        auto g = dy::as_scalar(copy.gold_prob(vocab_dist, attn, p_gen, target).value());
        expect(close_to(g, fd[target]),
               "gold probability of " + std::to_string(target) + " matches");
    }

    expect_throw([&] { copy.gold_prob(vocab_dist, attn, p_gen, 6); },
                 "unreachable target throws");
}

void test_gradients()
{
    dy::ParameterCollection m;
    auto p_scores = m.add_parameters({ V }, 0, "scores");
    auto p_attn = m.add_parameters({ 4 }, 0, "attn");
    auto p_gen = m.add_parameters({ 1 }, 0, "gen");

    dy::ComputationGraph cg;
    CopyDistribution copy(cg, ARTICLE, V, MAX_OOVS);
    auto vocab_dist = dy::softmax(dy::parameter(cg, p_scores));
    auto attn = dy::softmax(dy::parameter(cg, p_attn));
    auto gen = dy::logistic(dy::parameter(cg, p_gen));

    auto z = -dy::log(copy.gold_prob(vocab_dist, attn, gen, 5));
    cg.forward(z);
    cg.backward(z);
    expect(dy::check_grad(m, z, 0), "copy loss gradients match finite differences");
}

void test_projection()
{
    dy::ParameterCollection m;
    VocabProjection proj(m, 3, V, 1e-2f);
    expect(proj.registry.size() == 2, "projection registers weight and bias");

    dy::ComputationGraph cg;
    proj.new_graph(cg);
    auto h = dy::input(cg, { 3 }, { 1.f, 2.f, 3.f });
    auto s = proj.scores(h);
    expect(s.dim()[0] == V, "one score per vocabulary word");
}

void test_invalid()
{
    dy::ComputationGraph cg;
    expect_throw([&] { CopyDistribution c(cg, {}, V, MAX_OOVS); },
                 "empty article throws");
    expect_throw([&] { CopyDistribution c(cg, { 1, 9 }, V, MAX_OOVS); },
                 "id beyond extended vocabulary throws");
}

int main(int argc, char** argv)
{
    dy::initialize(argc, argv);

    std::cout << "final distribution" << std::endl;
    test_final_dist();
    std::cout << "gradients" << std::endl;
    test_gradients();
    std::cout << "projection" << std::endl;
    test_projection();
    std::cout << "invalid input" << std::endl;
    test_invalid();

    return test_status();
}
