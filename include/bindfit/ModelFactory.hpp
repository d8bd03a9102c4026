#pragma once
#include "ObjectiveFunction.hpp"
#include <string>
#include <vector>

namespace bindfit {

/* One row of the closed model catalog. */
struct CatalogEntry {
    const char*   key;
    Strategy      strategy;
    ModelFunction model;
    bool          uv;          // absorbance data: non-negative coefficients
    bool          flavoured;   // model branches on the flavour tag
    std::vector<std::string> (*parameters)(Flavour);
};

const std::vector<CatalogEntry>& model_catalog();
std::vector<std::string>         model_keys();

/* Build a ready-to-use objective for `key`.
 * Throws ConfigurationError for unknown keys, and for unknown flavour
 * strings on models that branch on the flavour.  Models without
 * flavour support ignore the tag.                                     */
ObjectiveFunction construct(const std::string& key,
                            bool               normalise = true,
                            const std::string& flavour   = "none");

} // namespace bindfit
