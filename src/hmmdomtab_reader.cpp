#include "hmmdomtab_reader.hpp"

namespace duckdb {

static constexpr idx_t HMMDOMTAB_FIXED_COLUMNS = 22;

struct HmmDomTabColumn {
	const char *name;
	LogicalTypeId type;
};

static const HmmDomTabColumn HMMDOMTAB_COLUMNS[] = {
    {"target_name", LogicalTypeId::VARCHAR},        {"target_accession", LogicalTypeId::VARCHAR},
    {"tlen", LogicalTypeId::BIGINT},                {"query_name", LogicalTypeId::VARCHAR},
    {"accession", LogicalTypeId::VARCHAR},          {"qlen", LogicalTypeId::BIGINT},
    {"evalue", LogicalTypeId::DOUBLE},              {"sequence_score", LogicalTypeId::FLOAT},
    {"bias", LogicalTypeId::FLOAT},                 {"domain_number", LogicalTypeId::INTEGER},
    {"ndom", LogicalTypeId::INTEGER},               {"conditional_evalue", LogicalTypeId::DOUBLE},
    {"independent_evalue", LogicalTypeId::DOUBLE},  {"domain_score", LogicalTypeId::FLOAT},
    {"domain_bias", LogicalTypeId::FLOAT},          {"hmm_from", LogicalTypeId::BIGINT},
    {"hmm_to", LogicalTypeId::BIGINT},              {"ali_from", LogicalTypeId::BIGINT},
    {"ali_to", LogicalTypeId::BIGINT},              {"env_from", LogicalTypeId::BIGINT},
    {"env_to", LogicalTypeId::BIGINT},              {"accuracy", LogicalTypeId::FLOAT},
    {"description", LogicalTypeId::VARCHAR}};

BioSchema HmmDomTabSchema() {
	BioSchema schema;
	for (auto &column : HMMDOMTAB_COLUMNS) {
		schema.names.push_back(column.name);
		schema.types.push_back(LogicalType(column.type));
	}
	return schema;
}

class HmmDomTabDecoder : public BioStreamDecoder {
public:
	HmmDomTabDecoder(unique_ptr<ByteStream> stream, const BioFormatOptions &options, const BioHeaderInfo &header)
	    : BioStreamDecoder(BioFormat::HMMDOMTAB, std::move(stream), options, header) {
	}

	bool Advance() override {
		string line;
		while (true) {
			if (!reader.ReadLine(line)) {
				return false;
			}
			if (!line.empty() && line[0] != '#') {
				break;
			}
		}
		record_ordinal++;
		fields = SplitWhitespaceLine(line);
		if (fields.size() < HMMDOMTAB_FIXED_COLUMNS) {
			throw DecodeError("expected at least 22 columns, found " + std::to_string(fields.size()));
		}
		// The description may contain spaces; fold it back into one field
		string description;
		for (idx_t i = HMMDOMTAB_FIXED_COLUMNS; i < fields.size(); i++) {
			if (!description.empty()) {
				description += " ";
			}
			description += fields[i];
		}
		fields.resize(HMMDOMTAB_FIXED_COLUMNS);
		fields.push_back(std::move(description));
		return true;
	}

	void Emit(DataChunk &output, const vector<BioProjectedColumn> &projection, idx_t row) override {
		for (auto &col : projection) {
			auto &vec = output.data[col.output_idx];
			auto &column = HMMDOMTAB_COLUMNS[col.column_idx];
			auto &text = fields[col.column_idx];
			switch (column.type) {
			case LogicalTypeId::VARCHAR:
				SetStringValue(vec, row, text);
				break;
			case LogicalTypeId::BIGINT:
			case LogicalTypeId::INTEGER: {
				int64_t value;
				if (!TryParseInt64(text, value)) {
					throw DecodeError(string("invalid ") + column.name + " '" + text + "'");
				}
				if (column.type == LogicalTypeId::BIGINT) {
					FlatVector::GetData<int64_t>(vec)[row] = value;
				} else {
					FlatVector::GetData<int32_t>(vec)[row] = static_cast<int32_t>(value);
				}
				break;
			}
			case LogicalTypeId::DOUBLE:
			case LogicalTypeId::FLOAT: {
				double value;
				if (!TryParseDouble(text, value)) {
					throw DecodeError(string("invalid ") + column.name + " '" + text + "'");
				}
				if (column.type == LogicalTypeId::DOUBLE) {
					FlatVector::GetData<double>(vec)[row] = value;
				} else {
					FlatVector::GetData<float>(vec)[row] = static_cast<float>(value);
				}
				break;
			}
			default:
				throw InternalException("hmm_dom_tab_scan: unsupported column type");
			}
		}
	}

private:
	vector<string> fields;
};

unique_ptr<BioRecordDecoder> CreateHmmDomTabDecoder(unique_ptr<ByteStream> stream, const BioFormatOptions &options,
                                                    const BioHeaderInfo &bound_header) {
	return make_uniq<HmmDomTabDecoder>(std::move(stream), options, bound_header);
}

} // namespace duckdb
