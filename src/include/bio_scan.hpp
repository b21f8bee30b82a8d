#pragma once

#include "duckdb.hpp"

namespace duckdb {

//! Register `<format>_scan` for every format, the indexed VCF/BAM variants
//! and the format-dispatching `read_bio`.
void RegisterBioScanFunctions(ExtensionLoader &loader);

} // namespace duckdb
