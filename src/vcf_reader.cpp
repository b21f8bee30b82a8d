#include "vcf_reader.hpp"
#include "bio_hts.hpp"
#include "bio_index.hpp"

#include "duckdb/common/string_util.hpp"

#include <limits>

namespace duckdb {

// ---------------------------------------------------------------------------
// Header parsing
// ---------------------------------------------------------------------------

//! Parse the body of a structured meta line, e.g.
//! `ID=DP,Number=1,Type=Integer,Description="Total depth"`. Quoted values may
//! contain commas and escaped quotes.
static unordered_map<string, string> ParseStructuredMeta(const string &body) {
	unordered_map<string, string> result;
	idx_t i = 0;
	while (i < body.size()) {
		auto eq = body.find('=', i);
		if (eq == string::npos) {
			break;
		}
		auto key = TrimWhitespace(body.substr(i, eq - i));
		i = eq + 1;
		string value;
		if (i < body.size() && body[i] == '"') {
			i++;
			while (i < body.size() && body[i] != '"') {
				if (body[i] == '\\' && i + 1 < body.size()) {
					i++;
				}
				value += body[i];
				i++;
			}
			// closing quote
			i++;
		} else {
			auto comma = body.find(',', i);
			if (comma == string::npos) {
				comma = body.size();
			}
			value = body.substr(i, comma - i);
			i = comma;
		}
		result[key] = value;
		if (i < body.size() && body[i] == ',') {
			i++;
		}
	}
	return result;
}

static bool HasFieldNamed(const vector<VcfFieldDefinition> &fields, const string &id) {
	for (auto &field : fields) {
		if (StringUtil::CIEquals(field.id, id)) {
			return true;
		}
	}
	return false;
}

static void AddFieldDefinition(const string &line, idx_t prefix_len, vector<VcfFieldDefinition> &fields,
                               const string &func_name, const string &path) {
	if (line.size() < prefix_len + 1 || line.back() != '>') {
		throw InvalidInputException("%s: malformed header line '%s' in '%s'", func_name, line, path);
	}
	auto meta = ParseStructuredMeta(line.substr(prefix_len, line.size() - prefix_len - 1));
	VcfFieldDefinition def;
	def.id = meta["ID"];
	def.number = meta["Number"];
	def.type = meta["Type"];
	def.description = meta["Description"];
	if (def.id.empty()) {
		throw InvalidInputException("%s: header line without ID '%s' in '%s'", func_name, line, path);
	}
	// Struct field names must be unique; later duplicates are ignored
	if (!HasFieldNamed(fields, def.id)) {
		fields.push_back(std::move(def));
	}
}

//! Apply one header line. Returns true once the #CHROM line has been read.
static bool ConsumeVcfHeaderLine(const string &line, BioHeaderInfo &header, const string &func_name,
                                 const string &path) {
	if (StringUtil::StartsWith(line, "##INFO=<")) {
		AddFieldDefinition(line, 8, header.info_fields, func_name, path);
	} else if (StringUtil::StartsWith(line, "##FORMAT=<")) {
		AddFieldDefinition(line, 10, header.format_fields, func_name, path);
	} else if (StringUtil::StartsWith(line, "#CHROM")) {
		auto columns = SplitTabLine(line);
		for (idx_t i = 9; i < columns.size(); i++) {
			header.sample_names.push_back(columns[i]);
		}
		return true;
	} else if (!line.empty() && !StringUtil::StartsWith(line, "##")) {
		throw InvalidInputException("%s: '%s' has no #CHROM header line", func_name, path);
	}
	return false;
}

void ReadVcfHeader(BufferedByteReader &reader, BioHeaderInfo &header, const string &func_name) {
	string line;
	while (reader.ReadLine(line)) {
		if (ConsumeVcfHeaderLine(line, header, func_name, reader.GetPath())) {
			return;
		}
	}
	throw InvalidInputException("%s: '%s' has no #CHROM header line", func_name, reader.GetPath());
}

//! Open a BCF file and read its binary header.
static BcfHeaderPtr OpenBcf(const string &path, const string &func_name, HtsFilePtr &fp) {
	fp = OpenHtsFile(path, func_name);
	if (HtsFormatOf(fp.get()) != bcf) {
		throw InvalidInputException("%s: '%s' is not a BCF file", func_name, path);
	}
	BcfHeaderPtr hdr(bcf_hdr_read(fp.get()));
	if (!hdr) {
		throw InvalidInputException("%s: failed to read the header of '%s'", func_name, path);
	}
	return hdr;
}

//! Feed the text rendering of a BCF header through the VCF header parser.
static void ParseBcfHeaderText(bcf_hdr_t *hdr, BioHeaderInfo &header, const string &func_name, const string &path) {
	KString text;
	if (bcf_hdr_format(hdr, 0, &text.value) < 0) {
		throw InvalidInputException("%s: failed to format the header of '%s'", func_name, path);
	}
	for (auto &line : SplitOn(text.ToString(), '\n')) {
		if (ConsumeVcfHeaderLine(line, header, func_name, path)) {
			return;
		}
	}
	throw InvalidInputException("%s: '%s' has no #CHROM header line", func_name, path);
}

void ReadBcfHeader(const string &path, BioHeaderInfo &header, const string &func_name) {
	HtsFilePtr fp;
	auto hdr = OpenBcf(path, func_name, fp);
	ParseBcfHeaderText(hdr.get(), header, func_name, path);
}

// ---------------------------------------------------------------------------
// Schema
// ---------------------------------------------------------------------------

static bool IsScalarField(const VcfFieldDefinition &def) {
	return def.type == "Flag" || def.number == "0" || def.number == "1";
}

static LogicalType VcfBaseType(const VcfFieldDefinition &def) {
	if (def.type == "Integer") {
		return LogicalType::INTEGER;
	}
	if (def.type == "Float") {
		return LogicalType::FLOAT;
	}
	if (def.type == "Flag") {
		return LogicalType::BOOLEAN;
	}
	return LogicalType::VARCHAR;
}

static LogicalType VcfFieldType(const VcfFieldDefinition &def) {
	auto base = VcfBaseType(def);
	return IsScalarField(def) ? base : LogicalType::LIST(base);
}

static LogicalType VcfStructType(const vector<VcfFieldDefinition> &fields) {
	child_list_t<LogicalType> children;
	for (auto &def : fields) {
		children.push_back(make_pair(def.id, VcfFieldType(def)));
	}
	return LogicalType::STRUCT(std::move(children));
}

static bool StructuredInfo(const BioFormatOptions &options, const BioHeaderInfo &header) {
	return options.parse_vcf_info && !header.info_fields.empty();
}

static bool StructuredFormats(const BioFormatOptions &options, const BioHeaderInfo &header) {
	return options.parse_vcf_formats && !header.format_fields.empty();
}

BioSchema VcfSchema(const BioFormatOptions &options, const BioHeaderInfo &header) {
	BioSchema schema;
	auto string_list = LogicalType::LIST(LogicalType::VARCHAR);
	schema.names = {"chrom", "pos", "id", "ref", "alt", "qual", "filter", "info", "formats"};
	schema.types = {LogicalType::VARCHAR, LogicalType::BIGINT, string_list, LogicalType::VARCHAR, string_list,
	                LogicalType::FLOAT,   string_list};
	schema.types.push_back(StructuredInfo(options, header) ? VcfStructType(header.info_fields)
	                                                       : LogicalType::VARCHAR);
	schema.types.push_back(StructuredFormats(options, header)
	                           ? LogicalType::LIST(VcfStructType(header.format_fields))
	                           : LogicalType::VARCHAR);
	return schema;
}

// ---------------------------------------------------------------------------
// Decoder
// ---------------------------------------------------------------------------

enum VcfColumn : idx_t {
	VCF_CHROM = 0,
	VCF_POS,
	VCF_ID,
	VCF_REF,
	VCF_ALT,
	VCF_QUAL,
	VCF_FILTER,
	VCF_INFO,
	VCF_FORMATS
};

//! Split a list field; a lone "." is the empty list.
static vector<string> SplitVcfList(const string &field, char delimiter) {
	if (field == "." || field.empty()) {
		return vector<string>();
	}
	return SplitOn(field, delimiter);
}

//! Shared record handling for VCF text and BCF. Subclasses supply the data
//! lines as VCF text.
class VcfDecoder : public BioRecordDecoder {
public:
	VcfDecoder(BioFormat format, const string &path, const BioFormatOptions &options, const BioHeaderInfo &header)
	    : BioRecordDecoder(format, path, options, header) {
		structured_info = StructuredInfo(options, header);
		structured_formats = StructuredFormats(options, header);
	}

	bool Advance() override {
		string line;
		if (!NextLine(line)) {
			return false;
		}
		record_ordinal++;
		fields = SplitTabLine(line);
		if (fields.size() < 8) {
			throw DecodeError("expected at least 8 tab-separated fields, found " + std::to_string(fields.size()));
		}
		if (!TryParseInt64(fields[1], pos) || pos < 0) {
			throw DecodeError("invalid POS '" + fields[1] + "'");
		}
		return true;
	}

	bool CurrentInterval(GenomicInterval &interval) const override {
		interval.reference = fields[0];
		interval.start = pos - 1;
		interval.end = interval.start + MaxValue<int64_t>(static_cast<int64_t>(fields[3].size()), 1);
		return true;
	}

	void Emit(DataChunk &output, const vector<BioProjectedColumn> &projection, idx_t row) override {
		for (auto &col : projection) {
			auto &vec = output.data[col.output_idx];
			switch (col.column_idx) {
			case VCF_CHROM:
				SetStringValue(vec, row, fields[0]);
				break;
			case VCF_POS:
				FlatVector::GetData<int64_t>(vec)[row] = pos;
				break;
			case VCF_ID:
				SetStringList(vec, row, SplitVcfList(fields[2], ';'));
				break;
			case VCF_REF:
				SetStringValue(vec, row, fields[3]);
				break;
			case VCF_ALT:
				SetStringList(vec, row, SplitVcfList(fields[4], ','));
				break;
			case VCF_QUAL:
				EmitQual(vec, row);
				break;
			case VCF_FILTER:
				SetStringList(vec, row, SplitVcfList(fields[6], ';'));
				break;
			case VCF_INFO:
				if (structured_info) {
					vec.SetValue(row, ParseInfo(fields[7]));
				} else {
					SetStringValue(vec, row, fields[7], true);
				}
				break;
			case VCF_FORMATS:
				EmitFormats(vec, row);
				break;
			default:
				throw InternalException("%s_scan: column index %llu out of range", FormatName(format),
				                        static_cast<unsigned long long>(col.column_idx));
			}
		}
	}

protected:
	//! The next data line without its terminator. Returns false at end of input.
	virtual bool NextLine(string &line) = 0;

private:
	void EmitQual(Vector &vec, idx_t row) {
		auto &text = fields[5];
		if (text == ".") {
			FlatVector::SetNull(vec, row, true);
			return;
		}
		double qual;
		if (!TryParseDouble(text, qual)) {
			throw DecodeError("invalid QUAL '" + text + "'");
		}
		FlatVector::GetData<float>(vec)[row] = static_cast<float>(qual);
	}

	//! Convert one typed value; "." is NULL.
	Value ParseTypedValue(const string &text, const LogicalType &type, const string &key) const {
		if (text == "." || text.empty()) {
			return Value(type);
		}
		switch (type.id()) {
		case LogicalTypeId::INTEGER: {
			int64_t result;
			if (!TryParseInt64(text, result) || result > std::numeric_limits<int32_t>::max() ||
			    result < std::numeric_limits<int32_t>::min()) {
				throw DecodeError("invalid Integer value '" + text + "' for " + key);
			}
			return Value::INTEGER(static_cast<int32_t>(result));
		}
		case LogicalTypeId::FLOAT: {
			double result;
			if (!TryParseDouble(text, result)) {
				throw DecodeError("invalid Float value '" + text + "' for " + key);
			}
			return Value::FLOAT(static_cast<float>(result));
		}
		case LogicalTypeId::VARCHAR:
			return Value(text);
		case LogicalTypeId::BOOLEAN:
			return Value::BOOLEAN(true);
		default:
			throw InternalException("%s_scan: unexpected field type %s", FormatName(format), type.ToString());
		}
	}

	Value ParseFieldValue(const VcfFieldDefinition &def, const string &text) const {
		auto base = VcfBaseType(def);
		if (IsScalarField(def)) {
			return ParseTypedValue(text, base, def.id);
		}
		if (text == "." || text.empty()) {
			return Value(LogicalType::LIST(base));
		}
		vector<Value> values;
		for (auto &item : SplitOn(text, ',')) {
			values.push_back(ParseTypedValue(item, base, def.id));
		}
		return Value::LIST(base, std::move(values));
	}

	Value ParseInfo(const string &text) const {
		auto &defs = bound_header.info_fields;
		vector<Value> values;
		for (auto &def : defs) {
			values.push_back(def.type == "Flag" ? Value::BOOLEAN(false) : Value(VcfFieldType(def)));
		}
		if (text != ".") {
			for (auto &entry : SplitOn(text, ';')) {
				if (entry.empty()) {
					continue;
				}
				auto eq = entry.find('=');
				auto key = eq == string::npos ? entry : entry.substr(0, eq);
				for (idx_t i = 0; i < defs.size(); i++) {
					if (!StringUtil::CIEquals(defs[i].id, key)) {
						continue;
					}
					if (defs[i].type == "Flag") {
						values[i] = Value::BOOLEAN(true);
					} else if (eq != string::npos) {
						values[i] = ParseFieldValue(defs[i], entry.substr(eq + 1));
					}
					break;
				}
			}
		}
		child_list_t<Value> children;
		for (idx_t i = 0; i < defs.size(); i++) {
			children.push_back(make_pair(defs[i].id, std::move(values[i])));
		}
		return Value::STRUCT(std::move(children));
	}

	void EmitFormats(Vector &vec, idx_t row) {
		if (fields.size() < 9) {
			FlatVector::SetNull(vec, row, true);
			return;
		}
		if (!structured_formats) {
			string raw = fields[8];
			for (idx_t i = 9; i < fields.size(); i++) {
				raw += "\t" + fields[i];
			}
			SetStringValue(vec, row, raw);
			return;
		}
		auto &defs = bound_header.format_fields;
		auto keys = SplitOn(fields[8], ':');
		// Position of each declared field within this record's FORMAT column
		vector<idx_t> key_positions(defs.size(), DConstants::INVALID_INDEX);
		for (idx_t d = 0; d < defs.size(); d++) {
			for (idx_t k = 0; k < keys.size(); k++) {
				if (StringUtil::CIEquals(keys[k], defs[d].id)) {
					key_positions[d] = k;
					break;
				}
			}
		}
		auto struct_type = VcfStructType(defs);
		vector<Value> samples;
		for (idx_t s = 9; s < fields.size(); s++) {
			auto sample_values = SplitOn(fields[s], ':');
			child_list_t<Value> children;
			for (idx_t d = 0; d < defs.size(); d++) {
				auto k = key_positions[d];
				if (k == DConstants::INVALID_INDEX || k >= sample_values.size()) {
					children.push_back(make_pair(defs[d].id, Value(VcfFieldType(defs[d]))));
				} else {
					children.push_back(make_pair(defs[d].id, ParseFieldValue(defs[d], sample_values[k])));
				}
			}
			samples.push_back(Value::STRUCT(std::move(children)));
		}
		vec.SetValue(row, Value::LIST(struct_type, std::move(samples)));
	}

	vector<string> fields;
	int64_t pos = 0;
	bool structured_info = false;
	bool structured_formats = false;
};

class VcfTextDecoder : public VcfDecoder {
public:
	VcfTextDecoder(unique_ptr<ByteStream> stream, const BioFormatOptions &options, const BioHeaderInfo &header)
	    : VcfDecoder(BioFormat::VCF, stream->GetPath(), options, header), reader(std::move(stream)) {
		// Each file carries its own header; the bound header drives the schema
		BioHeaderInfo file_header;
		ReadVcfHeader(reader, file_header, "vcf_scan");
	}

	bool SeekRegion(const GenomicInterval &region, const string &index_path) override {
		auto stream = make_uniq<TabixRegionStream>(path, LoadTabixIndex(path, index_path, "vcf_scan"), region,
		                                           "vcf_scan");
		if (!stream->HasReference()) {
			return false;
		}
		reader = BufferedByteReader(std::move(stream));
		return true;
	}

protected:
	bool NextLine(string &line) override {
		while (reader.ReadLine(line)) {
			if (!line.empty() && line[0] != '#') {
				return true;
			}
		}
		return false;
	}

private:
	BufferedByteReader reader;
};

unique_ptr<BioRecordDecoder> CreateVcfDecoder(unique_ptr<ByteStream> stream, const BioFormatOptions &options,
                                              const BioHeaderInfo &bound_header) {
	return make_uniq<VcfTextDecoder>(std::move(stream), options, bound_header);
}

//! BCF records are decoded by htslib and rendered back to VCF text.
class BcfDecoder : public VcfDecoder {
public:
	BcfDecoder(const string &path, const BioFormatOptions &options, const BioHeaderInfo &header)
	    : VcfDecoder(BioFormat::BCF, path, options, header) {
		hdr = OpenBcf(path, "bcf_scan", fp);
		rec.reset(bcf_init());
		if (!rec) {
			throw InternalException("bcf_scan: failed to allocate a variant record");
		}
	}

protected:
	bool NextLine(string &line) override {
		auto ret = bcf_read(fp.get(), hdr.get(), rec.get());
		if (ret == -1) {
			return false;
		}
		if (ret < -1) {
			record_ordinal++;
			throw DecodeError("htslib failed to decode the record (code " + std::to_string(ret) + ")");
		}
		text.value.l = 0;
		if (vcf_format(hdr.get(), rec.get(), &text.value) < 0) {
			record_ordinal++;
			throw DecodeError("htslib failed to format the record");
		}
		line = text.ToString();
		if (!line.empty() && line.back() == '\n') {
			line.pop_back();
		}
		return true;
	}

private:
	HtsFilePtr fp;
	BcfHeaderPtr hdr;
	BcfRecordPtr rec;
	KString text;
};

unique_ptr<BioRecordDecoder> CreateBcfDecoder(const string &path, const BioFormatOptions &options,
                                              const BioHeaderInfo &bound_header) {
	return make_uniq<BcfDecoder>(path, options, bound_header);
}

} // namespace duckdb
