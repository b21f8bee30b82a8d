#pragma once

#include "bio_format.hpp"

namespace duckdb {

//! BED3 through BED12. Missing optional columns are NULL.
BioSchema BedSchema();

unique_ptr<BioRecordDecoder> CreateBedDecoder(unique_ptr<ByteStream> stream, const BioFormatOptions &options,
                                              const BioHeaderInfo &bound_header);

} // namespace duckdb
