#include <dynet/dynet.h>
#include <dynet/expr.h>
#include <dynet/grad-check.h>

#include <iostream>
#include <vector>

#include "data.h"
#include "builders/adjmatrix.h"
#include "builders/gcn.h"
#include "expect.h"

namespace dy = dynet;

GCNSettings
plain_settings(unsigned dim, unsigned labels)
{
    GCNSettings s;
    s.dim = dim;
    s.layers = 1;
    s.labels = labels;
    s.gating = false;
    s.skip = false;
    s.normalize = true;
    s.keep_prob = 1.f;
    return s;
}

void test_single_node()
{
    dy::ParameterCollection m;
    GCNBuilder gcn(m, plain_settings(2, 1), 2);
    gcn.params[0].W_loop.set_value({ 1, 3, 2, -4 });  // [[1 2] [3 -4]]

    dy::ComputationGraph cg;
    gcn.new_graph(cg, false);

    auto graph_in = make_graph_input({ Dependency{ 0, 0 } }, 1, 1, 1);
    auto graph = make_graph(cg, graph_in, 1);
    auto x = dy::input(cg, { 2, 1 }, { 1, 1 });
    auto h = dy::as_vector(gcn.apply(x, graph).value());

    expect(h.size() == 2, "single node keeps its shape");
    expect(close_to(h[0], 3.f) && close_to(h[1], 0.f),
           "single node is relu(W_loop x)");
}

void test_one_arc()
{
    dy::ParameterCollection m;
    GCNBuilder gcn(m, plain_settings(2, 1), 2);
    std::vector<float> eye{ 1, 0, 0, 1 };
    gcn.params[0].W_loop.set_value(eye);
    gcn.params[0].W_in[0].set_value(eye);
    gcn.params[0].W_out[0].set_value(eye);

    dy::ComputationGraph cg;
    gcn.new_graph(cg, false);

    // token 2 depends on token 1
    auto graph_in = make_graph_input({ Dependency{ 0, 0 }, Dependency{ 1, 0 } },
                                     2, 2, 1);
    expect(graph_in.neighbour_count[0] == 2.f && graph_in.neighbour_count[1] == 2.f,
           "both endpoints count the arc");

    auto graph = make_graph(cg, graph_in, 1);
    auto x = dy::input(cg, { 2, 2 }, { 1, 0, 0, 2 });
    auto h = dy::as_vector(gcn.apply(x, graph).value());

    // every node sees itself and its neighbour, halved by the degree
    expect(close_to(h[0], .5f) && close_to(h[1], 1.f), "head aggregates dependent");
    expect(close_to(h[2], .5f) && close_to(h[3], 1.f), "dependent aggregates head");
}

void test_label_merge()
{
    GraphInput g;
    g.adj_in.resize(2);
    g.adj_out.resize(2);
    for (auto&& a : g.adj_in) a.n = 3;
    for (auto&& a : g.adj_out) a.n = 3;
    g.adj_in[0].add(1, 0);
    g.adj_in[1].add(1, 0);
    g.adj_in[1].add(2, 1);
    g.neighbour_count = { 1, 1, 1 };

    auto merged = merge_labels(g.adj_in);
    expect(merged.nnz() == 2, "coinciding arcs share one entry");

    dy::ComputationGraph cg;
    auto exprs = make_graph(cg, g, 1);
    expect(exprs.n_labels() == 1, "label-free mode keeps one adjacency");

    // transposed, column-major: A[r][c] sits at r * n + c
    auto at = dy::as_vector(exprs.in_t[0].value());
    expect(close_to(at[1 * 3 + 0], 2.f), "duplicate arcs are summed");
    expect(close_to(at[2 * 3 + 1], 1.f), "second label's arc is kept");
    expect(close_to(at[0 * 3 + 1], 0.f), "no spurious reverse arc");

    auto labelled = make_graph(cg, g, 2);
    expect(labelled.n_labels() == 2, "label-aware mode keeps every label");

    expect_throw([&] { make_graph(cg, g, 3); }, "label count mismatch throws");
}

void test_gradients()
{
    dy::ParameterCollection m;
    GCNSettings s;
    s.dim = 4;
    s.layers = 2;
    s.labels = 2;
    s.gating = true;
    s.skip = true;
    s.normalize = true;
    s.keep_prob = 1.f;
    GCNBuilder gcn(m, s, 3);
    auto p_x = m.add_parameters({ 3, 4 }, 0, "X");

    auto graph_in = make_graph_input(
      { Dependency{ 2, 0 }, Dependency{ 0, 0 }, Dependency{ 2, 1 }, Dependency{ 3, 1 } },
      4, 4, 2);

    dy::ComputationGraph cg;
    gcn.new_graph(cg, true);
    auto graph = make_graph(cg, graph_in, 2);
    auto x = dy::parameter(cg, p_x);
    auto z = dy::sum_elems(dy::square(gcn.apply(x, graph)));
    cg.forward(z);
    cg.backward(z);
    expect(dy::check_grad(m, z, 0), "gcn gradients match finite differences");
}

void test_invalid()
{
    dy::ParameterCollection m;
    auto s = plain_settings(2, 1);
    s.keep_prob = 0.f;
    expect_throw([&] { GCNBuilder gcn(m, s, 2); }, "zero keep probability throws");

    s = plain_settings(2, 0);
    expect_throw([&] { GCNBuilder gcn(m, s, 2); }, "zero labels throws");

    expect_throw([] { make_graph_input({ Dependency{ 0, 0 }, Dependency{ 1, 5 } },
                                       2, 2, 2); },
                 "label out of range throws");
}

int main(int argc, char** argv)
{
    dy::initialize(argc, argv);

    std::cout << "single node" << std::endl;
    test_single_node();
    std::cout << "one arc" << std::endl;
    test_one_arc();
    std::cout << "label merge" << std::endl;
    test_label_merge();
    std::cout << "gradients" << std::endl;
    test_gradients();
    std::cout << "invalid settings" << std::endl;
    test_invalid();

    return test_status();
}
