#pragma once

#include "bio_format.hpp"

namespace duckdb {

//! GenBank flat files: one row per LOCUS ... // record.
BioSchema GenbankSchema();

unique_ptr<BioRecordDecoder> CreateGenbankDecoder(unique_ptr<ByteStream> stream, const BioFormatOptions &options,
                                                  const BioHeaderInfo &bound_header);

} // namespace duckdb
