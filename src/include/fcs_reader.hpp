#pragma once

#include "bio_format.hpp"

namespace duckdb {

//! Parse the HEADER and TEXT segments of an FCS file held in memory and fill
//! header.fcs_parameters with one entry per $PnN parameter.
void ParseFcsLayout(const string &content, const string &path, const string &func_name, BioHeaderInfo &header);

//! FCS list mode: one column per parameter.
BioSchema FcsSchema(const BioHeaderInfo &header);

unique_ptr<BioRecordDecoder> CreateFcsDecoder(unique_ptr<ByteStream> stream, const BioFormatOptions &options,
                                              const BioHeaderInfo &bound_header);

} // namespace duckdb
