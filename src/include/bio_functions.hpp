#pragma once

#include "duckdb.hpp"

namespace duckdb {

//! Register the scalar helpers: quality score codecs, mass-spec peak
//! functions, region predicates, sequence utilities and motif scoring.
void RegisterBioFunctions(ExtensionLoader &loader);

} // namespace duckdb
