#include "bio_format.hpp"
#include "alignment_reader.hpp"
#include "bed_reader.hpp"
#include "fcs_reader.hpp"
#include "genbank_reader.hpp"
#include "gff_reader.hpp"
#include "hmmdomtab_reader.hpp"
#include "mzml_reader.hpp"
#include "sdf_reader.hpp"
#include "sequence_reader.hpp"
#include "vcf_reader.hpp"

#include "duckdb/common/string_util.hpp"

namespace duckdb {

// ---------------------------------------------------------------------------
// Format names and extensions
// ---------------------------------------------------------------------------

bool TryFormatFromName(const string &name, BioFormat &format) {
	auto lower = StringUtil::Lower(TrimWhitespace(name));
	if (lower == "fasta" || lower == "fa" || lower == "fna" || lower == "faa") {
		format = BioFormat::FASTA;
	} else if (lower == "fastq" || lower == "fq") {
		format = BioFormat::FASTQ;
	} else if (lower == "sam") {
		format = BioFormat::SAM;
	} else if (lower == "bam") {
		format = BioFormat::BAM;
	} else if (lower == "cram") {
		format = BioFormat::CRAM;
	} else if (lower == "vcf") {
		format = BioFormat::VCF;
	} else if (lower == "bcf") {
		format = BioFormat::BCF;
	} else if (lower == "bed") {
		format = BioFormat::BED;
	} else if (lower == "gff" || lower == "gff3") {
		format = BioFormat::GFF;
	} else if (lower == "gtf") {
		format = BioFormat::GTF;
	} else if (lower == "genbank" || lower == "gbk" || lower == "gb") {
		format = BioFormat::GENBANK;
	} else if (lower == "hmmdomtab" || lower == "hmm_dom_tab" || lower == "hmmdomtbl") {
		format = BioFormat::HMMDOMTAB;
	} else if (lower == "mzml") {
		format = BioFormat::MZML;
	} else if (lower == "sdf") {
		format = BioFormat::SDF;
	} else if (lower == "fcs") {
		format = BioFormat::FCS;
	} else {
		return false;
	}
	return true;
}

BioFormat FormatFromName(const string &name, const string &func_name) {
	BioFormat format;
	if (!TryFormatFromName(name, format)) {
		throw InvalidInputException("%s: unknown file format '%s'", func_name, name);
	}
	return format;
}

string FormatName(BioFormat format) {
	switch (format) {
	case BioFormat::FASTA:
		return "fasta";
	case BioFormat::FASTQ:
		return "fastq";
	case BioFormat::SAM:
		return "sam";
	case BioFormat::BAM:
		return "bam";
	case BioFormat::CRAM:
		return "cram";
	case BioFormat::VCF:
		return "vcf";
	case BioFormat::BCF:
		return "bcf";
	case BioFormat::BED:
		return "bed";
	case BioFormat::GFF:
		return "gff";
	case BioFormat::GTF:
		return "gtf";
	case BioFormat::GENBANK:
		return "genbank";
	case BioFormat::HMMDOMTAB:
		return "hmm_dom_tab";
	case BioFormat::MZML:
		return "mzml";
	case BioFormat::SDF:
		return "sdf";
	case BioFormat::FCS:
		return "fcs";
	}
	throw InternalException("Unhandled BioFormat in FormatName");
}

vector<string> FormatExtensions(BioFormat format) {
	switch (format) {
	case BioFormat::FASTA:
		return {".fasta", ".fa", ".fna", ".faa"};
	case BioFormat::FASTQ:
		return {".fastq", ".fq"};
	case BioFormat::SAM:
		return {".sam"};
	case BioFormat::BAM:
		return {".bam"};
	case BioFormat::CRAM:
		return {".cram"};
	case BioFormat::VCF:
		return {".vcf"};
	case BioFormat::BCF:
		return {".bcf"};
	case BioFormat::BED:
		return {".bed"};
	case BioFormat::GFF:
		return {".gff", ".gff3"};
	case BioFormat::GTF:
		return {".gtf"};
	case BioFormat::GENBANK:
		return {".gbk", ".gb", ".genbank"};
	case BioFormat::HMMDOMTAB:
		return {".hmmdomtab", ".domtbl", ".domtblout"};
	case BioFormat::MZML:
		return {".mzml"};
	case BioFormat::SDF:
		return {".sdf"};
	case BioFormat::FCS:
		return {".fcs"};
	}
	throw InternalException("Unhandled BioFormat in FormatExtensions");
}

bool TryInferFormatFromPath(const string &path, BioFormat &format) {
	auto base = StringUtil::Lower(StripCompressionExtension(path));
	// Binary formats carry their own compression, so the raw path is checked first
	for (auto candidate : {BioFormat::BAM, BioFormat::CRAM, BioFormat::BCF}) {
		if (StringUtil::EndsWith(StringUtil::Lower(path), FormatExtensions(candidate)[0])) {
			format = candidate;
			return true;
		}
	}
	static const BioFormat ALL_FORMATS[] = {
	    BioFormat::FASTA, BioFormat::FASTQ,     BioFormat::SAM,  BioFormat::BAM, BioFormat::CRAM,
	    BioFormat::VCF,   BioFormat::BCF,       BioFormat::BED,  BioFormat::GFF, BioFormat::GTF,
	    BioFormat::GENBANK, BioFormat::HMMDOMTAB, BioFormat::MZML, BioFormat::SDF, BioFormat::FCS};
	for (auto candidate : ALL_FORMATS) {
		for (auto &ext : FormatExtensions(candidate)) {
			if (StringUtil::EndsWith(base, ext)) {
				format = candidate;
				return true;
			}
		}
	}
	return false;
}

bool FormatSupportsIndex(BioFormat format) {
	return format == BioFormat::VCF || format == BioFormat::BAM || format == BioFormat::CRAM;
}

bool FormatReadByHtslib(BioFormat format) {
	return format == BioFormat::BAM || format == BioFormat::CRAM || format == BioFormat::BCF;
}

FastaSequenceDataType FastaSequenceDataTypeFromString(const string &name, const string &func_name) {
	auto lower = StringUtil::Lower(name);
	if (lower == "utf8") {
		return FastaSequenceDataType::UTF8;
	}
	if (lower == "large_utf8") {
		return FastaSequenceDataType::LARGE_UTF8;
	}
	if (lower == "integer_encode_dna") {
		return FastaSequenceDataType::INTEGER_ENCODE_DNA;
	}
	if (lower == "integer_encode_protein") {
		return FastaSequenceDataType::INTEGER_ENCODE_PROTEIN;
	}
	throw InvalidInputException("%s: unknown sequence_data_type '%s' (expected utf8, large_utf8, "
	                            "integer_encode_dna or integer_encode_protein)",
	                            func_name, name);
}

// ---------------------------------------------------------------------------
// Schema
// ---------------------------------------------------------------------------

BioSchema ComputeBioSchema(BioFormat format, const BioFormatOptions &options, const BioHeaderInfo &header) {
	switch (format) {
	case BioFormat::FASTA:
		return FastaSchema(options);
	case BioFormat::FASTQ:
		return FastqSchema();
	case BioFormat::SAM:
	case BioFormat::BAM:
	case BioFormat::CRAM:
		return AlignmentSchema(options);
	case BioFormat::VCF:
	case BioFormat::BCF:
		return VcfSchema(options, header);
	case BioFormat::BED:
		return BedSchema();
	case BioFormat::GFF:
		return GffSchema();
	case BioFormat::GTF:
		return GtfSchema();
	case BioFormat::GENBANK:
		return GenbankSchema();
	case BioFormat::HMMDOMTAB:
		return HmmDomTabSchema();
	case BioFormat::MZML:
		return MzmlSchema();
	case BioFormat::SDF:
		return SdfSchema(header);
	case BioFormat::FCS:
		return FcsSchema(header);
	}
	throw InternalException("Unhandled BioFormat in ComputeBioSchema");
}

bool FormatHasHeaderSchema(BioFormat format) {
	return format == BioFormat::VCF || format == BioFormat::BCF || format == BioFormat::SDF ||
	       format == BioFormat::FCS;
}

BioHeaderInfo ReadBioHeader(ClientContext &context, BioFormat format, const SourceFile &file,
                            const string &func_name) {
	BioHeaderInfo header;
	switch (format) {
	case BioFormat::VCF: {
		BufferedByteReader reader(OpenByteStream(context, file.path, file.compression));
		ReadVcfHeader(reader, header, func_name);
		break;
	}
	case BioFormat::BCF:
		ReadBcfHeader(file.path, header, func_name);
		break;
	case BioFormat::SDF: {
		BufferedByteReader reader(OpenByteStream(context, file.path, file.compression));
		ScanSdfDataFields(reader, header);
		break;
	}
	case BioFormat::FCS: {
		BufferedByteReader reader(OpenByteStream(context, file.path, file.compression));
		auto content = reader.ReadAll();
		ParseFcsLayout(content, file.path, func_name, header);
		break;
	}
	case BioFormat::FASTA:
	case BioFormat::FASTQ:
	case BioFormat::SAM:
	case BioFormat::BAM:
	case BioFormat::CRAM:
	case BioFormat::BED:
	case BioFormat::GFF:
	case BioFormat::GTF:
	case BioFormat::GENBANK:
	case BioFormat::HMMDOMTAB:
	case BioFormat::MZML:
		break;
	}
	return header;
}

// ---------------------------------------------------------------------------
// Decoders
// ---------------------------------------------------------------------------

InvalidInputException BioRecordDecoder::DecodeError(const string &message) const {
	return InvalidInputException("%s_scan: malformed record %llu in '%s': %s", FormatName(format),
	                            static_cast<unsigned long long>(record_ordinal), path, message);
}

bool BioRecordDecoder::SeekRegion(const GenomicInterval &region, const string &index_path) {
	throw InternalException("%s_scan: '%s' cannot be read through index '%s'", FormatName(format), path,
	                        index_path);
}

unique_ptr<BioRecordDecoder> CreateBioDecoder(BioFormat format, unique_ptr<ByteStream> stream,
                                              const BioFormatOptions &options, const BioHeaderInfo &bound_header) {
	switch (format) {
	case BioFormat::FASTA:
		return CreateFastaDecoder(std::move(stream), options, bound_header);
	case BioFormat::FASTQ:
		return CreateFastqDecoder(std::move(stream), options, bound_header);
	case BioFormat::SAM:
		return CreateSamDecoder(std::move(stream), options, bound_header);
	case BioFormat::VCF:
		return CreateVcfDecoder(std::move(stream), options, bound_header);
	case BioFormat::BAM:
	case BioFormat::CRAM:
	case BioFormat::BCF:
		throw InternalException("%s files are opened by path, not as a stream", FormatName(format));
	case BioFormat::BED:
		return CreateBedDecoder(std::move(stream), options, bound_header);
	case BioFormat::GFF:
		return CreateGffDecoder(std::move(stream), options, bound_header);
	case BioFormat::GTF:
		return CreateGtfDecoder(std::move(stream), options, bound_header);
	case BioFormat::GENBANK:
		return CreateGenbankDecoder(std::move(stream), options, bound_header);
	case BioFormat::HMMDOMTAB:
		return CreateHmmDomTabDecoder(std::move(stream), options, bound_header);
	case BioFormat::MZML:
		return CreateMzmlDecoder(std::move(stream), options, bound_header);
	case BioFormat::SDF:
		return CreateSdfDecoder(std::move(stream), options, bound_header);
	case BioFormat::FCS:
		return CreateFcsDecoder(std::move(stream), options, bound_header);
	}
	throw InternalException("Unhandled BioFormat in CreateBioDecoder");
}

unique_ptr<BioRecordDecoder> OpenBioDecoder(ClientContext &context, BioFormat format, const SourceFile &file,
                                            const BioFormatOptions &options, const BioHeaderInfo &bound_header) {
	if (!FormatReadByHtslib(format)) {
		return CreateBioDecoder(format, OpenByteStream(context, file.path, file.compression), options, bound_header);
	}
	// htslib opens by path and handles its own block compression
	if (format == BioFormat::BCF) {
		return CreateBcfDecoder(file.path, options, bound_header);
	}
	return CreateHtsAlignmentDecoder(format, file.path, options, bound_header);
}

} // namespace duckdb
