#pragma once

#include "bio_format.hpp"

namespace duckdb {

//! Collect the `> <name>` data item names of a whole SD file, in first-seen
//! order, into header.sdf_data_fields.
void ScanSdfDataFields(BufferedByteReader &reader, BioHeaderInfo &header);

//! SDF: header, atom_count, bond_count, data. `data` is a STRUCT of the
//! names collected from the first file, or a NULL VARCHAR when it had none.
BioSchema SdfSchema(const BioHeaderInfo &header);

unique_ptr<BioRecordDecoder> CreateSdfDecoder(unique_ptr<ByteStream> stream, const BioFormatOptions &options,
                                              const BioHeaderInfo &bound_header);

} // namespace duckdb
