#include "alignment_reader.hpp"
#include "bio_hts.hpp"
#include "bio_index.hpp"

#include "duckdb/common/string_util.hpp"

#include <cerrno>

namespace duckdb {

// ---------------------------------------------------------------------------
// Schema
// ---------------------------------------------------------------------------

static LogicalType TagListType() {
	child_list_t<LogicalType> children;
	children.push_back(make_pair("tag", LogicalType::VARCHAR));
	children.push_back(make_pair("value", LogicalType::VARCHAR));
	return LogicalType::LIST(LogicalType::STRUCT(std::move(children)));
}

BioSchema AlignmentSchema(const BioFormatOptions &options) {
	BioSchema schema;
	schema.names = {"name",    "flag",           "reference", "start", "end", "mapping_quality", "cigar",
	                "mate_reference", "sequence", "quality_scores", "tags"};
	schema.types = {LogicalType::VARCHAR, LogicalType::INTEGER, LogicalType::VARCHAR,
	                LogicalType::BIGINT,  LogicalType::BIGINT,  LogicalType::VARCHAR,
	                LogicalType::VARCHAR, LogicalType::VARCHAR, LogicalType::VARCHAR,
	                LogicalType::LIST(LogicalType::INTEGER)};
	schema.types.push_back(options.parse_sam_tags ? TagListType() : LogicalType::VARCHAR);
	return schema;
}

// ---------------------------------------------------------------------------
// Shared alignment record
// ---------------------------------------------------------------------------

enum AlignmentColumn : idx_t {
	ALN_NAME = 0,
	ALN_FLAG,
	ALN_REFERENCE,
	ALN_START,
	ALN_END,
	ALN_MAPPING_QUALITY,
	ALN_CIGAR,
	ALN_MATE_REFERENCE,
	ALN_SEQUENCE,
	ALN_QUALITY_SCORES,
	ALN_TAGS
};

static constexpr int32_t MAPQ_MISSING = 255;

//! One optional field, both as its SAM text and as the rendered value.
struct AlignmentTag {
	string text;
	string tag;
	string value;
};

struct AlignmentRecord {
	string name;
	bool has_name = false;
	int32_t flag = 0;
	string reference;
	bool has_reference = false;
	//! 1-based leftmost position, 0 when unset
	int64_t start = 0;
	//! Number of reference bases covered by the CIGAR
	int64_t span = 0;
	int32_t mapping_quality = MAPQ_MISSING;
	string cigar;
	string mate_reference;
	bool has_mate_reference = false;
	string sequence;
	vector<int32_t> quality_scores;
	vector<AlignmentTag> tags;

	void Reset() {
		has_name = false;
		has_reference = false;
		has_mate_reference = false;
		start = 0;
		span = 0;
		mapping_quality = MAPQ_MISSING;
		cigar.clear();
		sequence.clear();
		quality_scores.clear();
		tags.clear();
	}
};

static constexpr int64_t MAX_CIGAR_OP_LENGTH = (int64_t(1) << 28) - 1;

static bool ConsumesReference(char op) {
	return op == 'M' || op == 'D' || op == 'N' || op == '=' || op == 'X';
}

//! Base for the SAM and htslib decoders: both fill an AlignmentRecord and
//! share column materialisation.
class AlignmentDecoder : public BioRecordDecoder {
public:
	AlignmentDecoder(BioFormat format, const string &path, const BioFormatOptions &options,
	                 const BioHeaderInfo &header)
	    : BioRecordDecoder(format, path, options, header) {
	}

	bool CurrentInterval(GenomicInterval &interval) const override {
		if (!record.has_reference || record.start <= 0) {
			return false;
		}
		interval.reference = record.reference;
		interval.start = record.start - 1;
		interval.end = interval.start + record.span;
		return true;
	}

	void Emit(DataChunk &output, const vector<BioProjectedColumn> &projection, idx_t row) override {
		for (auto &col : projection) {
			auto &vec = output.data[col.output_idx];
			switch (col.column_idx) {
			case ALN_NAME:
				EmitOptionalString(vec, row, record.name, record.has_name);
				break;
			case ALN_FLAG:
				FlatVector::GetData<int32_t>(vec)[row] = record.flag;
				break;
			case ALN_REFERENCE:
				EmitOptionalString(vec, row, record.reference, record.has_reference);
				break;
			case ALN_START:
				if (record.start > 0) {
					FlatVector::GetData<int64_t>(vec)[row] = record.start;
				} else {
					FlatVector::SetNull(vec, row, true);
				}
				break;
			case ALN_END:
				// Inclusive end; undefined without a position or a reference-consuming CIGAR
				if (record.start > 0 && record.span > 0) {
					FlatVector::GetData<int64_t>(vec)[row] = record.start + record.span - 1;
				} else {
					FlatVector::SetNull(vec, row, true);
				}
				break;
			case ALN_MAPPING_QUALITY:
				EmitOptionalString(vec, row, std::to_string(record.mapping_quality),
				                   record.mapping_quality != MAPQ_MISSING);
				break;
			case ALN_CIGAR:
				SetStringValue(vec, row, record.cigar);
				break;
			case ALN_MATE_REFERENCE:
				EmitOptionalString(vec, row, record.mate_reference, record.has_mate_reference);
				break;
			case ALN_SEQUENCE:
				SetStringValue(vec, row, record.sequence);
				break;
			case ALN_QUALITY_SCORES:
				SetIntegerList(vec, row, record.quality_scores);
				break;
			case ALN_TAGS:
				EmitTags(vec, row);
				break;
			default:
				throw InternalException("%s_scan: column index %llu out of range", FormatName(format),
				                        static_cast<unsigned long long>(col.column_idx));
			}
		}
	}

protected:
	static void EmitOptionalString(Vector &vec, idx_t row, const string &value, bool present) {
		if (present) {
			SetStringValue(vec, row, value);
		} else {
			FlatVector::SetNull(vec, row, true);
		}
	}

	void EmitTags(Vector &vec, idx_t row) {
		if (!options.parse_sam_tags) {
			string raw;
			for (idx_t i = 0; i < record.tags.size(); i++) {
				if (i > 0) {
					raw += "\t";
				}
				raw += record.tags[i].text;
			}
			SetStringValue(vec, row, raw);
			return;
		}
		child_list_t<LogicalType> struct_children;
		struct_children.push_back(make_pair("tag", LogicalType::VARCHAR));
		struct_children.push_back(make_pair("value", LogicalType::VARCHAR));
		auto struct_type = LogicalType::STRUCT(std::move(struct_children));

		vector<Value> entries;
		for (auto &tag : record.tags) {
			child_list_t<Value> values;
			values.push_back(make_pair("tag", Value(tag.tag)));
			values.push_back(make_pair("value", Value(tag.value)));
			entries.push_back(Value::STRUCT(std::move(values)));
		}
		vec.SetValue(row, Value::LIST(struct_type, std::move(entries)));
	}

	AlignmentRecord record;
};

// ---------------------------------------------------------------------------
// SAM
// ---------------------------------------------------------------------------

class SamDecoder : public AlignmentDecoder {
public:
	SamDecoder(unique_ptr<ByteStream> stream, const BioFormatOptions &options, const BioHeaderInfo &header)
	    : AlignmentDecoder(BioFormat::SAM, stream->GetPath(), options, header), reader(std::move(stream)) {
	}

	bool Advance() override {
		string line;
		while (true) {
			if (!reader.ReadLine(line)) {
				return false;
			}
			// Header lines may only precede the alignments, but skipping them
			// anywhere is harmless
			if (!line.empty() && line[0] != '@') {
				break;
			}
		}
		record_ordinal++;
		auto fields = SplitTabLine(line);
		if (fields.size() < 11) {
			throw DecodeError("expected at least 11 tab-separated fields, found " + std::to_string(fields.size()));
		}
		record.Reset();

		record.has_name = fields[0] != "*";
		record.name = fields[0];

		int64_t value;
		if (!TryParseInt64(fields[1], value) || value < 0 || value > 0xFFFF) {
			throw DecodeError("invalid FLAG '" + fields[1] + "'");
		}
		record.flag = static_cast<int32_t>(value);

		record.has_reference = fields[2] != "*";
		record.reference = fields[2];

		if (!TryParseInt64(fields[3], record.start) || record.start < 0) {
			throw DecodeError("invalid POS '" + fields[3] + "'");
		}

		if (!TryParseInt64(fields[4], value) || value < 0 || value > 255) {
			throw DecodeError("invalid MAPQ '" + fields[4] + "'");
		}
		record.mapping_quality = static_cast<int32_t>(value);

		ParseCigar(fields[5]);

		if (fields[6] == "=") {
			record.has_mate_reference = record.has_reference;
			record.mate_reference = record.reference;
		} else {
			record.has_mate_reference = fields[6] != "*";
			record.mate_reference = fields[6];
		}

		if (fields[9] != "*") {
			record.sequence = fields[9];
		}
		if (fields[10] != "*") {
			if (fields[10].size() != record.sequence.size()) {
				throw DecodeError("QUAL length does not match SEQ length");
			}
			record.quality_scores = DecodePhred33(fields[10].data(), fields[10].size());
		}

		for (idx_t i = 11; i < fields.size(); i++) {
			ParseTag(fields[i]);
		}
		return true;
	}

private:
	void ParseCigar(const string &text) {
		if (text == "*") {
			return;
		}
		int64_t length = 0;
		bool have_digits = false;
		for (auto c : text) {
			if (c >= '0' && c <= '9') {
				// BAM stores operation lengths in 28 bits
				length = length * 10 + (c - '0');
				if (length > MAX_CIGAR_OP_LENGTH) {
					throw DecodeError("CIGAR operation length in '" + text + "' exceeds " +
					                  std::to_string(MAX_CIGAR_OP_LENGTH));
				}
				have_digits = true;
				continue;
			}
			if (!have_digits || string("MIDNSHP=X").find(c) == string::npos) {
				throw DecodeError("invalid CIGAR '" + text + "'");
			}
			if (ConsumesReference(c)) {
				record.span += length;
			}
			length = 0;
			have_digits = false;
		}
		if (have_digits) {
			throw DecodeError("invalid CIGAR '" + text + "'");
		}
		record.cigar = text;
	}

	void ParseTag(const string &field) {
		// TAG:TYPE:VALUE
		if (field.size() < 5 || field[2] != ':' || field[4] != ':') {
			throw DecodeError("invalid optional field '" + field + "'");
		}
		AlignmentTag tag;
		tag.text = field;
		tag.tag = field.substr(0, 2);
		auto type = field[3];
		auto value = field.substr(5);
		if (type == 'B') {
			// B:<subtype>,v1,v2,... renders as [v1,v2,...]
			auto items = SplitOn(value, ',');
			string rendered = "[";
			for (idx_t i = 1; i < items.size(); i++) {
				if (i > 1) {
					rendered += ",";
				}
				rendered += items[i];
			}
			tag.value = rendered + "]";
		} else {
			tag.value = value;
		}
		record.tags.push_back(std::move(tag));
	}

	BufferedByteReader reader;
};

unique_ptr<BioRecordDecoder> CreateSamDecoder(unique_ptr<ByteStream> stream, const BioFormatOptions &options,
                                              const BioHeaderInfo &bound_header) {
	return make_uniq<SamDecoder>(std::move(stream), options, bound_header);
}

// ---------------------------------------------------------------------------
// BAM and CRAM through htslib
// ---------------------------------------------------------------------------

//! Render a float the way DuckDB prints FLOAT values.
static string FormatFloat(float value) {
	return Value::FLOAT(value).ToString();
}

static const char *HtsFormatLabel(htsExactFormat format) {
	switch (format) {
	case sam:
		return "SAM";
	case bam:
		return "BAM";
	case cram:
		return "CRAM";
	case vcf:
		return "VCF";
	case bcf:
		return "BCF";
	default:
		return "unknown";
	}
}

class HtsAlignmentDecoder : public AlignmentDecoder {
public:
	HtsAlignmentDecoder(BioFormat format, const string &path, const BioFormatOptions &options,
	                    const BioHeaderInfo &header)
	    : AlignmentDecoder(format, path, options, header), func_name(FormatName(format) + "_scan") {
		fp = OpenHtsFile(path, func_name);
		auto expected = format == BioFormat::CRAM ? cram : bam;
		auto actual = HtsFormatOf(fp.get());
		if (actual != expected) {
			throw InvalidInputException("%s: '%s' is %s, not %s", func_name, path, HtsFormatLabel(actual),
			                            HtsFormatLabel(expected));
		}
		if (format == BioFormat::CRAM && !options.cram_reference.empty() &&
		    hts_set_fai_filename(fp.get(), options.cram_reference.c_str()) != 0) {
			throw IOException("%s: failed to load reference '%s' for '%s'", func_name, options.cram_reference, path);
		}
		hdr.reset(sam_hdr_read(fp.get()));
		if (!hdr) {
			throw InvalidInputException("%s: failed to read the header of '%s'", func_name, path);
		}
		aln.reset(bam_init1());
		if (!aln) {
			throw InternalException("%s: failed to allocate an alignment record", func_name);
		}
	}

	bool Advance() override {
		auto ret = itr ? sam_itr_next(fp.get(), itr.get(), aln.get()) : sam_read1(fp.get(), hdr.get(), aln.get());
		if (ret == -1) {
			return false;
		}
		record_ordinal++;
		if (ret < -1) {
			throw DecodeError("htslib failed to decode the record (code " + std::to_string(ret) + ")");
		}
		DecodeRecord();
		return true;
	}

	bool SeekRegion(const GenomicInterval &region, const string &index_path) override {
		idx.reset(sam_index_load2(fp.get(), path.c_str(), index_path.c_str()));
		if (!idx) {
			throw IOException("%s: failed to load index '%s'", func_name, index_path);
		}
		auto tid = sam_hdr_name2tid(hdr.get(), region.reference.c_str());
		if (tid == -1) {
			return false;
		}
		if (tid < -1) {
			throw InvalidInputException("%s: failed to parse the header of '%s'", func_name, path);
		}
		itr.reset(sam_itr_queryi(idx.get(), tid, region.start, HtsRegionEnd(region)));
		if (!itr) {
			throw IOException("%s: failed to query index '%s' for %s", func_name, index_path, region.reference);
		}
		return true;
	}

private:
	string ReferenceName(int32_t tid) const {
		auto name = sam_hdr_tid2name(hdr.get(), tid);
		if (!name) {
			throw DecodeError("reference id " + std::to_string(tid) + " out of range");
		}
		return name;
	}

	void DecodeRecord() {
		record.Reset();
		auto b = aln.get();
		auto &core = b->core;

		string name(bam_get_qname(b));
		record.has_name = !name.empty() && name != "*";
		record.name = std::move(name);
		record.flag = core.flag;
		if (core.tid >= 0) {
			record.has_reference = true;
			record.reference = ReferenceName(core.tid);
		}
		record.start = core.pos >= 0 ? static_cast<int64_t>(core.pos) + 1 : 0;
		record.mapping_quality = core.qual;
		if (core.mtid >= 0) {
			record.has_mate_reference = true;
			record.mate_reference = ReferenceName(core.mtid);
		}

		auto cigar = bam_get_cigar(b);
		for (uint32_t i = 0; i < core.n_cigar; i++) {
			record.cigar += std::to_string(bam_cigar_oplen(cigar[i]));
			record.cigar += bam_cigar_opchr(cigar[i]);
		}
		record.span = bam_cigar2rlen(core.n_cigar, cigar);

		auto seq = bam_get_seq(b);
		auto seq_len = static_cast<idx_t>(core.l_qseq);
		record.sequence.resize(seq_len);
		for (idx_t i = 0; i < seq_len; i++) {
			record.sequence[i] = seq_nt16_str[bam_seqi(seq, i)];
		}
		auto qual = bam_get_qual(b);
		// 0xFF in the first position marks absent qualities
		if (seq_len > 0 && qual[0] != 0xFF) {
			record.quality_scores.resize(seq_len);
			for (idx_t i = 0; i < seq_len; i++) {
				record.quality_scores[i] = qual[i];
			}
		}

		for (auto aux = bam_aux_first(b); aux; aux = bam_aux_next(b, aux)) {
			DecodeTag(aux);
		}
		if (errno != ENOENT) {
			throw DecodeError("corrupt auxiliary fields");
		}
	}

	void DecodeTag(const uint8_t *aux) {
		AlignmentTag tag;
		tag.tag = string(bam_aux_tag(aux), 2);
		auto type = bam_aux_type(aux);
		char sam_type = type;
		switch (type) {
		case 'A':
			tag.value = string(1, bam_aux2A(aux));
			break;
		case 'c':
		case 'C':
		case 's':
		case 'S':
		case 'i':
		case 'I':
			tag.value = std::to_string(bam_aux2i(aux));
			sam_type = 'i';
			break;
		case 'f':
		case 'd':
			tag.value = FormatFloat(static_cast<float>(bam_aux2f(aux)));
			sam_type = 'f';
			break;
		case 'Z':
		case 'H':
			tag.value = bam_aux2Z(aux);
			break;
		case 'B': {
			auto subtype = static_cast<char>(aux[1]);
			auto count = bam_auxB_len(aux);
			string text_values;
			string rendered = "[";
			for (uint32_t i = 0; i < count; i++) {
				auto item = subtype == 'f' ? FormatFloat(static_cast<float>(bam_auxB2f(aux, i)))
				                           : std::to_string(bam_auxB2i(aux, i));
				if (i > 0) {
					rendered += ",";
				}
				rendered += item;
				text_values += "," + item;
			}
			tag.value = rendered + "]";
			tag.text = tag.tag + ":B:" + string(1, subtype) + text_values;
			record.tags.push_back(std::move(tag));
			return;
		}
		default:
			throw DecodeError("unknown tag type '" + string(1, type) + "' in tag " + tag.tag);
		}
		tag.text = tag.tag + ":" + string(1, sam_type) + ":" + tag.value;
		record.tags.push_back(std::move(tag));
	}

	string func_name;
	HtsFilePtr fp;
	SamHeaderPtr hdr;
	BamRecordPtr aln;
	HtsIndexPtr idx;
	HtsIteratorPtr itr;
};

unique_ptr<BioRecordDecoder> CreateHtsAlignmentDecoder(BioFormat format, const string &path,
                                                       const BioFormatOptions &options,
                                                       const BioHeaderInfo &bound_header) {
	return make_uniq<HtsAlignmentDecoder>(format, path, options, bound_header);
}

} // namespace duckdb
