#pragma once

/* Explicit list of the weights a component created, so the model can
 * build an L2 penalty without a global collection lookup. */

#include <vector>

#include <dynet/model.h>
#include <dynet/expr.h>

namespace dy = dynet;

struct ParamRegistry
{
    std::vector<dy::Parameter> params;
    std::vector<dy::LookupParameter> lookups;

    dy::Parameter add(dy::Parameter p)
    {
        params.push_back(p);
        return p;
    }

    dy::LookupParameter add(dy::LookupParameter p)
    {
        lookups.push_back(p);
        return p;
    }

    /* every dense weight owned by a collection, e.g. an RNN builder's */
    void add_all(dy::ParameterCollection& pc)
    {
        for (auto&& storage : pc.parameters_list())
            params.push_back(dy::Parameter(storage));
    }

    void extend(const ParamRegistry& other)
    {
        params.insert(params.end(), other.params.begin(), other.params.end());
        lookups.insert(lookups.end(), other.lookups.begin(),
                       other.lookups.end());
    }

    size_t size() const { return params.size() + lookups.size(); }

    /* sum over weights of ||w||^2 / 2 */
    dy::Expression l2_penalty(dy::ComputationGraph& cg) const
    {
        std::vector<dy::Expression> terms;
        for (auto&& p : params)
            terms.push_back(dy::squared_norm(dy::parameter(cg, p)));
        for (auto&& p : lookups)
            terms.push_back(dy::squared_norm(dy::parameter(cg, p)));
        if (terms.empty())
            return dy::zeros(cg, {1});
        return 0.5f * dy::sum(terms);
    }
};
