#include "bindfit/ModelFactory.hpp"
#include "bindfit/Errors.hpp"
#include <algorithm>

namespace bindfit {

static std::vector<std::string> params_1to1(Flavour)
{
    return { "k" };
}

static std::vector<std::string> params_two_step(Flavour f)
{
    if (forces_statistical_k12(f)) return { "k11" };
    return { "k11", "k12" };
}

static std::vector<std::string> params_dimer(Flavour)
{
    return { "ke" };
}

static std::vector<std::string> params_coek(Flavour)
{
    return { "ke", "rho" };
}

static std::vector<std::string> params_inhibitor(Flavour)
{
    return { "hillslope", "logIC50" };
}

const std::vector<CatalogEntry>& model_catalog()
{
    static const std::vector<CatalogEntry> catalog = {
        //  key         strategy                        model               uv     flav.  params
        { "nmr1to1",  Strategy::Binding,           &nmr_1to1,           false, false, &params_1to1      },
        { "nmr1to2",  Strategy::Binding,           &nmr_1to2,           false, true,  &params_two_step  },
        { "nmr2to1",  Strategy::Binding,           &nmr_2to1,           false, true,  &params_two_step  },
        { "uv1to1",   Strategy::Binding,           &uv_1to1,            true,  false, &params_1to1      },
        { "uv1to2",   Strategy::Binding,           &uv_1to2,            true,  true,  &params_two_step  },
        { "uv2to1",   Strategy::Binding,           &uv_2to1,            true,  true,  &params_two_step  },
        { "nmrdimer", Strategy::Aggregation,       &nmr_dimer,          false, false, &params_dimer     },
        { "uvdimer",  Strategy::Aggregation,       &uv_dimer,           true,  false, &params_dimer     },
        { "nmrcoek",  Strategy::Aggregation,       &nmr_coek,           false, false, &params_coek      },
        { "uvcoek",   Strategy::Aggregation,       &uv_coek,            true,  false, &params_coek      },
        { "inhibitor",Strategy::InhibitorResponse, &inhibitor_response, false, false, &params_inhibitor },
    };
    return catalog;
}

std::vector<std::string> model_keys()
{
    std::vector<std::string> keys;
    for (const auto& e : model_catalog()) keys.emplace_back(e.key);
    return keys;
}

ObjectiveFunction construct(const std::string& key,
                            bool               normalise,
                            const std::string& flavour)
{
    const auto& catalog = model_catalog();
    auto it = std::find_if(catalog.begin(), catalog.end(),
                           [&](const CatalogEntry& e) { return key == e.key; });
    if (it == catalog.end()) {
        std::string known;
        for (const auto& k : model_keys()) known += (known.empty() ? "" : ", ") + k;
        throw ConfigurationError("unknown model key '" + key + "' (known: " + known + ")");
    }

    bool    recognised = true;
    Flavour f          = parse_flavour(flavour, &recognised);
    if (!it->flavoured) {
        f = Flavour::None;
    } else if (!recognised) {
        throw ConfigurationError("unknown flavour '" + flavour + "' for model '"
                                 + key + "' (expected none, add, noncoop or stat)");
    }

    return ObjectiveFunction(it->key,
                             it->strategy,
                             it->model,
                             ParameterSchema(it->parameters(f)),
                             normalise,
                             f,
                             it->uv);
}

} // namespace bindfit
