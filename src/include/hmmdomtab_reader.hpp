#pragma once

#include "bio_format.hpp"

namespace duckdb {

//! HMMER --domtblout: 22 whitespace-separated columns plus a free-text
//! description.
BioSchema HmmDomTabSchema();

unique_ptr<BioRecordDecoder> CreateHmmDomTabDecoder(unique_ptr<ByteStream> stream, const BioFormatOptions &options,
                                                    const BioHeaderInfo &bound_header);

} // namespace duckdb
