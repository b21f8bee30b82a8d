#pragma once

#include "bio_format.hpp"

namespace duckdb {

//! GFF3: attributes as MAP(VARCHAR, LIST(VARCHAR)).
BioSchema GffSchema();

//! GTF: attributes as MAP(VARCHAR, VARCHAR), frame as INTEGER.
BioSchema GtfSchema();

unique_ptr<BioRecordDecoder> CreateGffDecoder(unique_ptr<ByteStream> stream, const BioFormatOptions &options,
                                              const BioHeaderInfo &bound_header);

unique_ptr<BioRecordDecoder> CreateGtfDecoder(unique_ptr<ByteStream> stream, const BioFormatOptions &options,
                                              const BioHeaderInfo &bound_header);

} // namespace duckdb
