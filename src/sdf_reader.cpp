#include "sdf_reader.hpp"

#include "duckdb/common/string_util.hpp"

namespace duckdb {

// ---------------------------------------------------------------------------
// Data items
// ---------------------------------------------------------------------------

static const char *SDF_RECORD_END = "$$$$";

//! Extract NAME from a data header line such as `> <NAME>` or `>  <NAME> (12)`.
static bool ParseDataHeader(const string &line, string &name) {
	if (line.empty() || line[0] != '>') {
		return false;
	}
	auto open = line.find('<');
	if (open == string::npos) {
		return false;
	}
	auto close = line.find('>', open + 1);
	if (close == string::npos) {
		return false;
	}
	name = line.substr(open + 1, close - open - 1);
	return true;
}

static bool ContainsFieldName(const vector<string> &fields, const string &name) {
	for (auto &field : fields) {
		if (StringUtil::CIEquals(field, name)) {
			return true;
		}
	}
	return false;
}

void ScanSdfDataFields(BufferedByteReader &reader, BioHeaderInfo &header) {
	string line;
	string name;
	while (reader.ReadLine(line)) {
		if (ParseDataHeader(line, name) && !name.empty() && !ContainsFieldName(header.sdf_data_fields, name)) {
			header.sdf_data_fields.push_back(name);
		}
	}
}

static LogicalType SdfDataType(const BioHeaderInfo &header) {
	if (header.sdf_data_fields.empty()) {
		return LogicalType::VARCHAR;
	}
	child_list_t<LogicalType> children;
	for (auto &field : header.sdf_data_fields) {
		children.push_back(make_pair(field, LogicalType::VARCHAR));
	}
	return LogicalType::STRUCT(std::move(children));
}

BioSchema SdfSchema(const BioHeaderInfo &header) {
	BioSchema schema;
	schema.names = {"header", "atom_count", "bond_count", "data"};
	schema.types = {LogicalType::VARCHAR, LogicalType::INTEGER, LogicalType::INTEGER, SdfDataType(header)};
	return schema;
}

// ---------------------------------------------------------------------------
// Decoder
// ---------------------------------------------------------------------------

class SdfDecoder : public BioStreamDecoder {
public:
	SdfDecoder(unique_ptr<ByteStream> stream, const BioFormatOptions &options, const BioHeaderInfo &header)
	    : BioStreamDecoder(BioFormat::SDF, std::move(stream), options, header) {
	}

	bool Advance() override {
		// Header block: name, program, comment, counts. The name may be blank.
		string header_lines[4];
		idx_t header_count = 0;
		while (header_count < 4 && reader.ReadLine(header_lines[header_count])) {
			header_count++;
		}
		if (header_count < 4) {
			bool only_blank = true;
			for (idx_t i = 0; i < header_count; i++) {
				if (!TrimWhitespace(header_lines[i]).empty()) {
					only_blank = false;
				}
			}
			// Trailing blank lines after the last $$$$
			if (only_blank) {
				return false;
			}
			record_ordinal++;
			throw DecodeError("truncated molecule header block");
		}
		record_ordinal++;
		molecule_name = TrimWhitespace(header_lines[0]);
		data_values.clear();

		string line;
		auto &counts = header_lines[3];
		bool v3000 = counts.find("V3000") != string::npos;
		if (!v3000) {
			ParseV2000Counts(counts);
		}

		bool in_molfile = true;
		bool in_value = false;
		while (true) {
			if (!reader.ReadLine(line)) {
				throw DecodeError("molecule is not terminated by '$$$$'");
			}
			if (StringUtil::StartsWith(line, SDF_RECORD_END)) {
				break;
			}
			if (in_molfile) {
				if (v3000 && StringUtil::StartsWith(line, "M  V30 COUNTS")) {
					ParseV3000Counts(line);
				}
				if (StringUtil::StartsWith(line, "M  END")) {
					in_molfile = false;
				}
				continue;
			}
			string name;
			if (!in_value && ParseDataHeader(line, name)) {
				in_value = true;
				data_values.emplace_back(name, string());
				continue;
			}
			if (!in_value) {
				continue;
			}
			if (line.empty()) {
				in_value = false;
				continue;
			}
			auto &value = data_values.back().second;
			if (!value.empty()) {
				value += "\n";
			}
			value += line;
		}
		if (in_molfile) {
			throw DecodeError("missing 'M  END' line");
		}
		return true;
	}

	void Emit(DataChunk &output, const vector<BioProjectedColumn> &projection, idx_t row) override {
		for (auto &col : projection) {
			auto &vec = output.data[col.output_idx];
			switch (col.column_idx) {
			case 0:
				SetStringValue(vec, row, molecule_name);
				break;
			case 1:
				FlatVector::GetData<int32_t>(vec)[row] = atom_count;
				break;
			case 2:
				FlatVector::GetData<int32_t>(vec)[row] = bond_count;
				break;
			case 3:
				EmitData(vec, row);
				break;
			default:
				throw InternalException("sdf_scan: column index %llu out of range",
				                        static_cast<unsigned long long>(col.column_idx));
			}
		}
	}

private:
	void ParseV2000Counts(const string &counts) {
		int64_t atoms;
		int64_t bonds;
		if (counts.size() < 6 || !TryParseInt64(TrimWhitespace(counts.substr(0, 3)), atoms) ||
		    !TryParseInt64(TrimWhitespace(counts.substr(3, 3)), bonds)) {
			throw DecodeError("invalid counts line '" + counts + "'");
		}
		atom_count = static_cast<int32_t>(atoms);
		bond_count = static_cast<int32_t>(bonds);
	}

	//! M  V30 COUNTS na nb nsg n3d chiral
	void ParseV3000Counts(const string &line) {
		auto tokens = SplitWhitespaceLine(line);
		int64_t atoms;
		int64_t bonds;
		if (tokens.size() < 5 || !TryParseInt64(tokens[3], atoms) || !TryParseInt64(tokens[4], bonds)) {
			throw DecodeError("invalid V3000 counts line '" + line + "'");
		}
		atom_count = static_cast<int32_t>(atoms);
		bond_count = static_cast<int32_t>(bonds);
	}

	void EmitData(Vector &vec, idx_t row) {
		auto &fields = bound_header.sdf_data_fields;
		if (fields.empty()) {
			FlatVector::SetNull(vec, row, true);
			return;
		}
		child_list_t<Value> children;
		for (auto &field : fields) {
			Value value(LogicalType::VARCHAR);
			for (auto &entry : data_values) {
				if (StringUtil::CIEquals(entry.first, field)) {
					value = Value(entry.second);
					break;
				}
			}
			children.push_back(make_pair(field, std::move(value)));
		}
		vec.SetValue(row, Value::STRUCT(std::move(children)));
	}

	string molecule_name;
	int32_t atom_count = 0;
	int32_t bond_count = 0;
	vector<pair<string, string>> data_values;
};

unique_ptr<BioRecordDecoder> CreateSdfDecoder(unique_ptr<ByteStream> stream, const BioFormatOptions &options,
                                              const BioHeaderInfo &bound_header) {
	return make_uniq<SdfDecoder>(std::move(stream), options, bound_header);
}

} // namespace duckdb
