#include "gff_reader.hpp"

#include "duckdb/common/string_util.hpp"

namespace duckdb {

// ---------------------------------------------------------------------------
// Schemas
// ---------------------------------------------------------------------------

BioSchema GffSchema() {
	BioSchema schema;
	schema.names = {"seqname", "source", "type", "start", "end", "score", "strand", "phase", "attributes"};
	schema.types = {LogicalType::VARCHAR, LogicalType::VARCHAR, LogicalType::VARCHAR,
	                LogicalType::BIGINT,  LogicalType::BIGINT,  LogicalType::FLOAT,
	                LogicalType::VARCHAR, LogicalType::VARCHAR,
	                LogicalType::MAP(LogicalType::VARCHAR, LogicalType::LIST(LogicalType::VARCHAR))};
	return schema;
}

BioSchema GtfSchema() {
	BioSchema schema;
	schema.names = {"seqname", "source", "type", "start", "end", "score", "strand", "frame", "attributes"};
	schema.types = {LogicalType::VARCHAR, LogicalType::VARCHAR, LogicalType::VARCHAR,
	                LogicalType::BIGINT,  LogicalType::BIGINT,  LogicalType::FLOAT,
	                LogicalType::VARCHAR, LogicalType::INTEGER,
	                LogicalType::MAP(LogicalType::VARCHAR, LogicalType::VARCHAR)};
	return schema;
}

// ---------------------------------------------------------------------------
// Attribute parsing
// ---------------------------------------------------------------------------

static int HexValue(char c) {
	if (c >= '0' && c <= '9') {
		return c - '0';
	}
	if (c >= 'a' && c <= 'f') {
		return c - 'a' + 10;
	}
	if (c >= 'A' && c <= 'F') {
		return c - 'A' + 10;
	}
	return -1;
}

//! Undo GFF3 percent-encoding (%3B, %2C, ...). Invalid escapes are kept as-is.
static string PercentDecode(const string &text) {
	if (text.find('%') == string::npos) {
		return text;
	}
	string result;
	for (idx_t i = 0; i < text.size(); i++) {
		if (text[i] == '%' && i + 2 < text.size() && HexValue(text[i + 1]) >= 0 && HexValue(text[i + 2]) >= 0) {
			result += static_cast<char>(HexValue(text[i + 1]) * 16 + HexValue(text[i + 2]));
			i += 2;
		} else {
			result += text[i];
		}
	}
	return result;
}

//! GFF3 column 9: `key=v1,v2;key2=v3`. Repeated keys extend the same list.
static Value ParseGffAttributes(const string &text) {
	vector<string> keys;
	vector<vector<Value>> values;
	if (text != "." && !text.empty()) {
		for (auto &entry : SplitOn(text, ';')) {
			auto trimmed = TrimWhitespace(entry);
			if (trimmed.empty()) {
				continue;
			}
			auto eq = trimmed.find('=');
			auto key = PercentDecode(eq == string::npos ? trimmed : trimmed.substr(0, eq));
			idx_t slot = keys.size();
			for (idx_t i = 0; i < keys.size(); i++) {
				if (keys[i] == key) {
					slot = i;
					break;
				}
			}
			if (slot == keys.size()) {
				keys.push_back(key);
				values.emplace_back();
			}
			if (eq != string::npos) {
				for (auto &item : SplitOn(trimmed.substr(eq + 1), ',')) {
					values[slot].push_back(Value(PercentDecode(item)));
				}
			}
		}
	}
	vector<Value> key_values;
	vector<Value> list_values;
	for (idx_t i = 0; i < keys.size(); i++) {
		key_values.push_back(Value(keys[i]));
		list_values.push_back(Value::LIST(LogicalType::VARCHAR, std::move(values[i])));
	}
	return Value::MAP(LogicalType::VARCHAR, LogicalType::LIST(LogicalType::VARCHAR), std::move(key_values),
	                  std::move(list_values));
}

//! GTF column 9: `gene_id "G1"; transcript_id "T1";`. Repeated keys (e.g.
//! several `tag` entries) are joined with commas so map keys stay unique.
static Value ParseGtfAttributes(const string &text) {
	vector<string> keys;
	vector<string> values;
	idx_t i = 0;
	while (i < text.size()) {
		while (i < text.size() && (text[i] == ' ' || text[i] == ';' || text[i] == '\t')) {
			i++;
		}
		if (i >= text.size()) {
			break;
		}
		auto key_start = i;
		while (i < text.size() && text[i] != ' ' && text[i] != ';') {
			i++;
		}
		auto key = text.substr(key_start, i - key_start);
		while (i < text.size() && text[i] == ' ') {
			i++;
		}
		string value;
		if (i < text.size() && text[i] == '"') {
			auto close = text.find('"', i + 1);
			if (close == string::npos) {
				close = text.size();
			}
			value = text.substr(i + 1, close - i - 1);
			i = close + 1;
		} else {
			auto semi = text.find(';', i);
			if (semi == string::npos) {
				semi = text.size();
			}
			value = TrimWhitespace(text.substr(i, semi - i));
			i = semi;
		}
		bool merged = false;
		for (idx_t k = 0; k < keys.size(); k++) {
			if (keys[k] == key) {
				values[k] += "," + value;
				merged = true;
				break;
			}
		}
		if (!merged) {
			keys.push_back(std::move(key));
			values.push_back(std::move(value));
		}
	}
	vector<Value> key_values;
	vector<Value> map_values;
	for (idx_t k = 0; k < keys.size(); k++) {
		key_values.push_back(Value(keys[k]));
		map_values.push_back(Value(values[k]));
	}
	return Value::MAP(LogicalType::VARCHAR, LogicalType::VARCHAR, std::move(key_values), std::move(map_values));
}

// ---------------------------------------------------------------------------
// Decoder
// ---------------------------------------------------------------------------

enum FeatureColumn : idx_t {
	FEATURE_SEQNAME = 0,
	FEATURE_SOURCE,
	FEATURE_TYPE,
	FEATURE_START,
	FEATURE_END,
	FEATURE_SCORE,
	FEATURE_STRAND,
	FEATURE_PHASE,
	FEATURE_ATTRIBUTES
};

//! GFF3 and GTF share the nine-column layout; they differ in attribute syntax
//! and in how the eighth column is typed.
class FeatureDecoder : public BioStreamDecoder {
public:
	FeatureDecoder(BioFormat format, unique_ptr<ByteStream> stream, const BioFormatOptions &options,
	               const BioHeaderInfo &header)
	    : BioStreamDecoder(format, std::move(stream), options, header) {
	}

	bool Advance() override {
		if (reached_sequence_section) {
			return false;
		}
		string line;
		while (true) {
			if (!reader.ReadLine(line)) {
				return false;
			}
			if (StringUtil::StartsWith(line, "##FASTA")) {
				// Embedded sequences follow; no more features
				reached_sequence_section = true;
				return false;
			}
			if (!line.empty() && line[0] != '#') {
				break;
			}
		}
		record_ordinal++;
		fields = SplitTabLine(line);
		if (fields.size() == 8) {
			fields.emplace_back(".");
		}
		if (fields.size() != 9) {
			throw DecodeError("expected 9 tab-separated fields, found " + std::to_string(fields.size()));
		}
		if (!TryParseInt64(fields[3], start) || start < 1) {
			throw DecodeError("invalid start '" + fields[3] + "'");
		}
		if (!TryParseInt64(fields[4], end) || end < start - 1) {
			throw DecodeError("invalid end '" + fields[4] + "'");
		}
		return true;
	}

	bool CurrentInterval(GenomicInterval &interval) const override {
		interval.reference = fields[0];
		interval.start = start - 1;
		interval.end = end;
		return true;
	}

	void Emit(DataChunk &output, const vector<BioProjectedColumn> &projection, idx_t row) override {
		bool is_gtf = format == BioFormat::GTF;
		for (auto &col : projection) {
			auto &vec = output.data[col.output_idx];
			switch (col.column_idx) {
			case FEATURE_SEQNAME:
			case FEATURE_SOURCE:
			case FEATURE_TYPE:
			case FEATURE_STRAND:
				SetStringValue(vec, row, fields[col.column_idx], col.column_idx == FEATURE_SOURCE);
				break;
			case FEATURE_START:
				FlatVector::GetData<int64_t>(vec)[row] = start;
				break;
			case FEATURE_END:
				FlatVector::GetData<int64_t>(vec)[row] = end;
				break;
			case FEATURE_SCORE: {
				double score;
				if (TryParseDouble(fields[5], score)) {
					FlatVector::GetData<float>(vec)[row] = static_cast<float>(score);
				} else if (fields[5] == "." || is_gtf) {
					FlatVector::SetNull(vec, row, true);
				} else {
					throw DecodeError("invalid score '" + fields[5] + "'");
				}
				break;
			}
			case FEATURE_PHASE:
				if (is_gtf) {
					int64_t frame;
					if (TryParseInt64(fields[7], frame) && frame >= 0 && frame <= 2) {
						FlatVector::GetData<int32_t>(vec)[row] = static_cast<int32_t>(frame);
					} else {
						FlatVector::SetNull(vec, row, true);
					}
				} else {
					SetStringValue(vec, row, fields[7], true);
				}
				break;
			case FEATURE_ATTRIBUTES:
				vec.SetValue(row, is_gtf ? ParseGtfAttributes(fields[8]) : ParseGffAttributes(fields[8]));
				break;
			default:
				throw InternalException("%s_scan: column index %llu out of range", FormatName(format),
				                        static_cast<unsigned long long>(col.column_idx));
			}
		}
	}

private:
	vector<string> fields;
	int64_t start = 0;
	int64_t end = 0;
	bool reached_sequence_section = false;
};

unique_ptr<BioRecordDecoder> CreateGffDecoder(unique_ptr<ByteStream> stream, const BioFormatOptions &options,
                                              const BioHeaderInfo &bound_header) {
	return make_uniq<FeatureDecoder>(BioFormat::GFF, std::move(stream), options, bound_header);
}

unique_ptr<BioRecordDecoder> CreateGtfDecoder(unique_ptr<ByteStream> stream, const BioFormatOptions &options,
                                              const BioHeaderInfo &bound_header) {
	return make_uniq<FeatureDecoder>(BioFormat::GTF, std::move(stream), options, bound_header);
}

} // namespace duckdb
