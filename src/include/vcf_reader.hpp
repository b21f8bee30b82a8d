#pragma once

#include "bio_format.hpp"

namespace duckdb {

//! Consume the VCF meta-information and #CHROM lines, collecting ##INFO and
//! ##FORMAT declarations and sample names. The reader is left at the first
//! data line.
void ReadVcfHeader(BufferedByteReader &reader, BioHeaderInfo &header, const string &func_name);

//! Read the header of a BCF file through htslib into the same structure.
void ReadBcfHeader(const string &path, BioHeaderInfo &header, const string &func_name);

//! VCF and BCF: chrom, pos, id, ref, alt, qual, filter, info, formats.
//! `info` and `formats` are structured when parsing is enabled and the header
//! declares at least one field, raw VARCHAR otherwise.
BioSchema VcfSchema(const BioFormatOptions &options, const BioHeaderInfo &header);

unique_ptr<BioRecordDecoder> CreateVcfDecoder(unique_ptr<ByteStream> stream, const BioFormatOptions &options,
                                              const BioHeaderInfo &bound_header);

//! BCF decoded by htslib from `path`.
unique_ptr<BioRecordDecoder> CreateBcfDecoder(const string &path, const BioFormatOptions &options,
                                              const BioHeaderInfo &bound_header);

} // namespace duckdb
