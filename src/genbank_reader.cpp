#include "genbank_reader.hpp"

#include "duckdb/common/string_util.hpp"

namespace duckdb {

// ---------------------------------------------------------------------------
// Schema
// ---------------------------------------------------------------------------

enum GenbankColumn : idx_t {
	GB_SEQUENCE = 0,
	GB_ACCESSION,
	GB_COMMENT,
	GB_CONTIG,
	GB_DATE,
	GB_DBLINK,
	GB_DEFINITION,
	GB_DIVISION,
	GB_KEYWORDS,
	GB_MOLECULE_TYPE,
	GB_NAME,
	GB_SOURCE,
	GB_VERSION,
	GB_TOPOLOGY,
	GB_FEATURES,
	GB_COLUMN_COUNT
};

static LogicalType FeatureType() {
	child_list_t<LogicalType> children;
	children.push_back(make_pair("kind", LogicalType::VARCHAR));
	children.push_back(make_pair("location", LogicalType::VARCHAR));
	children.push_back(make_pair("qualifiers", LogicalType::MAP(LogicalType::VARCHAR, LogicalType::VARCHAR)));
	return LogicalType::STRUCT(std::move(children));
}

BioSchema GenbankSchema() {
	BioSchema schema;
	schema.names = {"sequence", "accession",     "comment", "contig", "date",    "dblink",   "definition", "division",
	                "keywords", "molecule_type", "name",    "source", "version", "topology", "features"};
	for (idx_t i = 0; i < GB_FEATURES; i++) {
		schema.types.push_back(LogicalType::VARCHAR);
	}
	schema.types.push_back(LogicalType::LIST(FeatureType()));
	return schema;
}

// ---------------------------------------------------------------------------
// Record model
// ---------------------------------------------------------------------------

struct GenbankQualifier {
	string key;
	string value;
	bool has_value = false;
};

struct GenbankFeature {
	string kind;
	string location;
	vector<GenbankQualifier> qualifiers;
};

//! Column at which keyword values, feature locations and qualifiers start.
static constexpr idx_t GB_VALUE_COLUMN = 12;
static constexpr idx_t GB_FEATURE_VALUE_COLUMN = 21;

static bool IsLocusDate(const string &token) {
	// DD-MMM-YYYY
	return token.size() == 11 && token[2] == '-' && token[6] == '-';
}

static string StripQuotes(const string &value) {
	if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
		return value.substr(1, value.size() - 2);
	}
	return value;
}

// ---------------------------------------------------------------------------
// Decoder
// ---------------------------------------------------------------------------

class GenbankDecoder : public BioStreamDecoder {
public:
	GenbankDecoder(unique_ptr<ByteStream> stream, const BioFormatOptions &options, const BioHeaderInfo &header)
	    : BioStreamDecoder(BioFormat::GENBANK, std::move(stream), options, header) {
	}

	bool Advance() override {
		string line;
		// Skip anything before the next LOCUS line (file banners, blank lines)
		while (true) {
			if (!reader.ReadLine(line)) {
				return false;
			}
			if (StringUtil::StartsWith(line, "LOCUS")) {
				break;
			}
			if (!TrimWhitespace(line).empty()) {
				record_ordinal++;
				throw DecodeError("expected LOCUS line, found '" + line.substr(0, 40) + "'");
			}
		}
		record_ordinal++;
		ResetRecord();
		ParseLocus(line);

		enum class Section { KEYWORD, FEATURES, ORIGIN };
		auto section = Section::KEYWORD;
		idx_t current_column = GB_COLUMN_COUNT;
		bool terminated = false;
		while (reader.ReadLine(line)) {
			if (StringUtil::StartsWith(line, "//")) {
				terminated = true;
				break;
			}
			if (line.empty()) {
				continue;
			}
			bool is_keyword_line = line[0] != ' ';
			if (is_keyword_line) {
				auto keyword = line.substr(0, line.find(' '));
				auto value = line.size() > GB_VALUE_COLUMN ? TrimWhitespace(line.substr(GB_VALUE_COLUMN)) : string();
				current_column = GB_COLUMN_COUNT;
				if (keyword == "FEATURES") {
					section = Section::FEATURES;
					continue;
				}
				if (keyword == "ORIGIN") {
					section = Section::ORIGIN;
					continue;
				}
				section = Section::KEYWORD;
				current_column = KeywordColumn(keyword);
				if (current_column != GB_COLUMN_COUNT) {
					AppendText(current_column, value);
				}
				continue;
			}
			switch (section) {
			case Section::KEYWORD:
				// Continuation lines are blank up to the value column; indented
				// sub-keywords (ORGANISM, AUTHORS, ...) are not kept
				if (line.size() > 2 && line[2] != ' ') {
					current_column = GB_COLUMN_COUNT;
				} else if (current_column != GB_COLUMN_COUNT) {
					AppendText(current_column, TrimWhitespace(line));
				}
				break;
			case Section::FEATURES:
				ParseFeatureLine(line);
				break;
			case Section::ORIGIN:
				for (auto c : line) {
					if (StringUtil::CharacterIsAlpha(c)) {
						sequence += c;
					}
				}
				break;
			}
		}
		if (!terminated) {
			throw DecodeError("record is not terminated by '//'");
		}
		return true;
	}

	void Emit(DataChunk &output, const vector<BioProjectedColumn> &projection, idx_t row) override {
		for (auto &col : projection) {
			auto &vec = output.data[col.output_idx];
			if (col.column_idx == GB_SEQUENCE) {
				SetStringValue(vec, row, sequence);
			} else if (col.column_idx == GB_FEATURES) {
				vec.SetValue(row, FeaturesValue());
			} else if (col.column_idx < GB_COLUMN_COUNT) {
				if (present[col.column_idx]) {
					SetStringValue(vec, row, text[col.column_idx]);
				} else {
					FlatVector::SetNull(vec, row, true);
				}
			} else {
				throw InternalException("genbank_scan: column index %llu out of range",
				                        static_cast<unsigned long long>(col.column_idx));
			}
		}
	}

private:
	void ResetRecord() {
		text.assign(GB_COLUMN_COUNT, string());
		present.assign(GB_COLUMN_COUNT, false);
		sequence.clear();
		features.clear();
		in_location = false;
		open_quote = false;
	}

	static idx_t KeywordColumn(const string &keyword) {
		if (keyword == "ACCESSION") {
			return GB_ACCESSION;
		}
		if (keyword == "COMMENT") {
			return GB_COMMENT;
		}
		if (keyword == "CONTIG") {
			return GB_CONTIG;
		}
		if (keyword == "DBLINK") {
			return GB_DBLINK;
		}
		if (keyword == "DEFINITION") {
			return GB_DEFINITION;
		}
		if (keyword == "KEYWORDS") {
			return GB_KEYWORDS;
		}
		if (keyword == "SOURCE") {
			return GB_SOURCE;
		}
		if (keyword == "VERSION") {
			return GB_VERSION;
		}
		return GB_COLUMN_COUNT;
	}

	void SetText(idx_t column, const string &value) {
		text[column] = value;
		present[column] = true;
	}

	void AppendText(idx_t column, const string &value) {
		if (present[column] && !value.empty()) {
			text[column] += (column == GB_COMMENT || column == GB_DBLINK) ? "\n" : " ";
		}
		text[column] += value;
		present[column] = true;
	}

	//! LOCUS name length bp molecule [topology] division date
	void ParseLocus(const string &line) {
		auto tokens = SplitWhitespaceLine(line);
		if (tokens.size() < 2) {
			throw DecodeError("LOCUS line has no name");
		}
		SetText(GB_NAME, tokens[1]);
		idx_t next = 2;
		for (idx_t i = 2; i < tokens.size(); i++) {
			if (tokens[i] == "bp" || tokens[i] == "aa") {
				next = i + 1;
				break;
			}
		}
		idx_t last = tokens.size();
		if (last > next && IsLocusDate(tokens[last - 1])) {
			SetText(GB_DATE, tokens[last - 1]);
			last--;
		}
		for (idx_t i = next; i < last; i++) {
			auto lower = StringUtil::Lower(tokens[i]);
			if (lower == "linear" || lower == "circular") {
				SetText(GB_TOPOLOGY, lower);
			} else if (i == last - 1 && tokens[i].size() == 3) {
				SetText(GB_DIVISION, tokens[i]);
			} else if (!present[GB_MOLECULE_TYPE]) {
				SetText(GB_MOLECULE_TYPE, tokens[i]);
			}
		}
	}

	void ParseFeatureLine(const string &line) {
		// "     gene            51..221" starts a feature; deeper indents continue it
		if (line.size() > 5 && line[5] != ' ' && line.compare(0, 5, "     ") == 0) {
			GenbankFeature feature;
			auto rest = line.substr(5);
			auto space = rest.find(' ');
			feature.kind = rest.substr(0, space);
			feature.location = space == string::npos ? string() : TrimWhitespace(rest.substr(space));
			features.push_back(std::move(feature));
			in_location = true;
			open_quote = false;
			return;
		}
		if (features.empty()) {
			throw DecodeError("feature qualifier before any feature key");
		}
		auto &feature = features.back();
		auto content = TrimWhitespace(line.size() > GB_FEATURE_VALUE_COLUMN ? line.substr(GB_FEATURE_VALUE_COLUMN)
		                                                                    : line);
		if (!open_quote && !content.empty() && content[0] == '/') {
			in_location = false;
			GenbankQualifier qualifier;
			auto eq = content.find('=');
			if (eq == string::npos) {
				qualifier.key = content.substr(1);
			} else {
				qualifier.key = content.substr(1, eq - 1);
				qualifier.value = content.substr(eq + 1);
				qualifier.has_value = true;
				open_quote = !qualifier.value.empty() && qualifier.value[0] == '"' &&
				             (qualifier.value.size() == 1 || qualifier.value.back() != '"');
			}
			feature.qualifiers.push_back(std::move(qualifier));
			return;
		}
		if (in_location) {
			feature.location += content;
			return;
		}
		if (feature.qualifiers.empty()) {
			throw DecodeError("unexpected feature continuation line");
		}
		auto &qualifier = feature.qualifiers.back();
		// Protein translations wrap without a separating space
		if (qualifier.key != "translation") {
			qualifier.value += " ";
		}
		qualifier.value += content;
		if (!content.empty() && content.back() == '"') {
			open_quote = false;
		}
	}

	Value FeaturesValue() const {
		vector<Value> entries;
		for (auto &feature : features) {
			vector<string> keys;
			vector<Value> values;
			for (auto &qualifier : feature.qualifiers) {
				auto value = StripQuotes(qualifier.value);
				bool merged = false;
				for (idx_t i = 0; i < keys.size(); i++) {
					if (keys[i] != qualifier.key) {
						continue;
					}
					// Repeated qualifiers such as /db_xref are comma joined
					if (qualifier.has_value) {
						values[i] = values[i].IsNull() ? Value(value)
						                               : Value(StringValue::Get(values[i]) + "," + value);
					}
					merged = true;
					break;
				}
				if (!merged) {
					keys.push_back(qualifier.key);
					values.push_back(qualifier.has_value ? Value(value) : Value(LogicalType::VARCHAR));
				}
			}
			vector<Value> key_values;
			for (auto &key : keys) {
				key_values.push_back(Value(key));
			}
			child_list_t<Value> children;
			children.push_back(make_pair("kind", Value(feature.kind)));
			children.push_back(make_pair("location", Value(feature.location)));
			children.push_back(make_pair("qualifiers", Value::MAP(LogicalType::VARCHAR, LogicalType::VARCHAR,
			                                                      std::move(key_values), std::move(values))));
			entries.push_back(Value::STRUCT(std::move(children)));
		}
		return Value::LIST(FeatureType(), std::move(entries));
	}

	vector<string> text;
	vector<bool> present;
	string sequence;
	vector<GenbankFeature> features;
	bool in_location = false;
	bool open_quote = false;
};

unique_ptr<BioRecordDecoder> CreateGenbankDecoder(unique_ptr<ByteStream> stream, const BioFormatOptions &options,
                                                  const BioHeaderInfo &bound_header) {
	return make_uniq<GenbankDecoder>(std::move(stream), options, bound_header);
}

} // namespace duckdb
