#pragma once

#include "bio_format.hpp"

namespace duckdb {

//! FASTA: id, description, sequence. The sequence is VARCHAR, or
//! LIST(TINYINT) residue codes for the integer encodings.
BioSchema FastaSchema(const BioFormatOptions &options);

//! FASTQ: name, description, sequence, quality_scores.
BioSchema FastqSchema();

unique_ptr<BioRecordDecoder> CreateFastaDecoder(unique_ptr<ByteStream> stream, const BioFormatOptions &options,
                                                const BioHeaderInfo &bound_header);

unique_ptr<BioRecordDecoder> CreateFastqDecoder(unique_ptr<ByteStream> stream, const BioFormatOptions &options,
                                                const BioHeaderInfo &bound_header);

} // namespace duckdb
