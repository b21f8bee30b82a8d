#pragma once

#include "bio_format.hpp"

namespace duckdb {

//! SAM/BAM/CRAM: name, flag, reference, start, end, mapping_quality, cigar,
//! mate_reference, sequence, quality_scores, tags. `tags` is raw VARCHAR or
//! LIST(STRUCT(tag, value)) depending on parse_sam_tags.
BioSchema AlignmentSchema(const BioFormatOptions &options);

unique_ptr<BioRecordDecoder> CreateSamDecoder(unique_ptr<ByteStream> stream, const BioFormatOptions &options,
                                              const BioHeaderInfo &bound_header);

//! BAM or CRAM decoded by htslib from `path`.
unique_ptr<BioRecordDecoder> CreateHtsAlignmentDecoder(BioFormat format, const string &path,
                                                       const BioFormatOptions &options,
                                                       const BioHeaderInfo &bound_header);

} // namespace duckdb
