#pragma once

#include "bio_format.hpp"

namespace duckdb {

//! mzML: one row per <spectrum>.
BioSchema MzmlSchema();

//! Decode one <binary> payload: base64, optionally zlib, then little-endian
//! 32 or 64-bit floats. Exposed for tests.
vector<double> DecodeMzmlBinaryArray(const string &base64, bool zlib_compressed, bool is_64bit,
                                     const string &what);

unique_ptr<BioRecordDecoder> CreateMzmlDecoder(unique_ptr<ByteStream> stream, const BioFormatOptions &options,
                                               const BioHeaderInfo &bound_header);

} // namespace duckdb
