#pragma once

#include "duckdb.hpp"
#include "bio_codec.hpp"
#include "bio_common.hpp"
#include "bio_location.hpp"

namespace duckdb {

// ---------------------------------------------------------------------------
// Supported formats
// ---------------------------------------------------------------------------

//! Closed set of file formats. Every switch over this enum is exhaustive so
//! adding a format surfaces every place that has to learn about it.
enum class BioFormat : uint8_t {
	FASTA,
	FASTQ,
	SAM,
	BAM,
	CRAM,
	VCF,
	BCF,
	BED,
	GFF,
	GTF,
	GENBANK,
	HMMDOMTAB,
	MZML,
	SDF,
	FCS
};

//! Look up a format by name ("vcf", "fa", "gbk", "hmmdomtab", ...).
bool TryFormatFromName(const string &name, BioFormat &format);
BioFormat FormatFromName(const string &name, const string &func_name);

//! Infer the format from a file name, ignoring a compression suffix.
bool TryInferFormatFromPath(const string &path, BioFormat &format);

//! Canonical lower-case name, used for function names and messages.
string FormatName(BioFormat format);

//! Extensions recognised when listing a directory (lower case, no compression suffix).
vector<string> FormatExtensions(BioFormat format);

//! Formats with an index-accelerated variant.
bool FormatSupportsIndex(BioFormat format);

//! Formats read by htslib from a path rather than through a ByteStream.
bool FormatReadByHtslib(BioFormat format);

// ---------------------------------------------------------------------------
// Run-time options and header-derived information
// ---------------------------------------------------------------------------

enum class FastaSequenceDataType : uint8_t { UTF8, LARGE_UTF8, INTEGER_ENCODE_DNA, INTEGER_ENCODE_PROTEIN };

//! Parse "utf8", "large_utf8", "integer_encode_dna" or "integer_encode_protein".
FastaSequenceDataType FastaSequenceDataTypeFromString(const string &name, const string &func_name);

//! Parse toggles that change the output schema. Resolved per bind from
//! session settings and named parameters.
struct BioFormatOptions {
	bool parse_vcf_info = true;
	bool parse_vcf_formats = true;
	bool parse_sam_tags = false;
	//! FASTA sequence column encoding
	FastaSequenceDataType fasta_sequence_type = FastaSequenceDataType::UTF8;
	//! Reference FASTA used to decode CRAM, empty for the file's own lookup
	string cram_reference;
};

//! One ##INFO or ##FORMAT declaration from a VCF header.
struct VcfFieldDefinition {
	string id;
	string number;
	string type;
	string description;
};

//! One FCS parameter ($PnN) with its storage width.
struct FcsParameter {
	string name;
	idx_t bits = 32;
	LogicalType type = LogicalType::FLOAT;
};

//! Content-derived schema inputs read from the first file of a table. Only
//! the members relevant to the bound format are populated.
struct BioHeaderInfo {
	// VCF
	vector<VcfFieldDefinition> info_fields;
	vector<VcfFieldDefinition> format_fields;
	vector<string> sample_names;

	// SDF: annotation names in first-seen order
	vector<string> sdf_data_fields;

	// FCS
	vector<FcsParameter> fcs_parameters;
};

//! Column names and types in output order.
struct BioSchema {
	vector<string> names;
	vector<LogicalType> types;
};

//! Data-column schema as a pure function of format, options and header.
BioSchema ComputeBioSchema(BioFormat format, const BioFormatOptions &options, const BioHeaderInfo &header);

//! True for formats whose schema depends on file content.
bool FormatHasHeaderSchema(BioFormat format);

//! Read the header information a format's schema depends on from one file.
//! Formats with a fixed layout return an empty header without opening the file.
BioHeaderInfo ReadBioHeader(ClientContext &context, BioFormat format, const SourceFile &file,
                            const string &func_name);

// ---------------------------------------------------------------------------
// Decoders
// ---------------------------------------------------------------------------

//! A data column requested by the scan, and where it goes in the output chunk.
struct BioProjectedColumn {
	idx_t output_idx;
	idx_t column_idx;
};

//! Lazy, single-pass record sequence over one source file. Callers
//! alternate Advance() and Emit(); the decoder materialises projected
//! columns only.
class BioRecordDecoder {
public:
	BioRecordDecoder(BioFormat format_p, string path_p, const BioFormatOptions &options_p,
	                 const BioHeaderInfo &bound_header_p)
	    : format(format_p), path(std::move(path_p)), options(options_p), bound_header(bound_header_p) {
	}
	virtual ~BioRecordDecoder() = default;

	//! Parse the next record. Returns false at end of stream.
	virtual bool Advance() = 0;

	//! Genomic interval of the current record (0-based half-open). Returns
	//! false for formats or records without a position.
	virtual bool CurrentInterval(GenomicInterval &interval) const {
		return false;
	}

	//! Write the current record's projected columns into row `row`.
	virtual void Emit(DataChunk &output, const vector<BioProjectedColumn> &projection, idx_t row) = 0;

	//! Restrict the remaining records to those overlapping `region`, located
	//! through the index at `index_path`. Returns false when the index does
	//! not know the region's reference.
	virtual bool SeekRegion(const GenomicInterval &region, const string &index_path);

	const string &GetPath() const {
		return path;
	}

protected:
	//! Build a decode error naming the file and record ordinal.
	InvalidInputException DecodeError(const string &message) const;

	BioFormat format;
	string path;
	const BioFormatOptions &options;
	const BioHeaderInfo &bound_header;
	idx_t record_ordinal = 0;
};

//! Decoder reading a ByteStream through a buffered reader.
class BioStreamDecoder : public BioRecordDecoder {
public:
	BioStreamDecoder(BioFormat format_p, unique_ptr<ByteStream> stream, const BioFormatOptions &options_p,
	                 const BioHeaderInfo &bound_header_p)
	    : BioRecordDecoder(format_p, stream->GetPath(), options_p, bound_header_p), reader(std::move(stream)) {
	}

protected:
	BufferedByteReader reader;
};

//! Create the decoder for a stream format. The header of the file is consumed here.
unique_ptr<BioRecordDecoder> CreateBioDecoder(BioFormat format, unique_ptr<ByteStream> stream,
                                              const BioFormatOptions &options, const BioHeaderInfo &bound_header);

//! Open one source file and create its decoder. htslib formats open the path
//! themselves; the others are read through DuckDB's file system.
unique_ptr<BioRecordDecoder> OpenBioDecoder(ClientContext &context, BioFormat format, const SourceFile &file,
                                            const BioFormatOptions &options, const BioHeaderInfo &bound_header);

} // namespace duckdb
