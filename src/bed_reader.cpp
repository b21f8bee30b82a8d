#include "bed_reader.hpp"

#include "duckdb/common/string_util.hpp"

namespace duckdb {

static const char *const BED_COLUMN_NAMES[] = {"reference_sequence_name", "start",     "end",         "name",
                                                "score",                   "strand",    "thick_start", "thick_end",
                                                "color",                   "block_count", "block_sizes",
                                                "block_starts"};

BioSchema BedSchema() {
	BioSchema schema;
	for (auto name : BED_COLUMN_NAMES) {
		schema.names.push_back(name);
	}
	schema.types = {LogicalType::VARCHAR, LogicalType::BIGINT,  LogicalType::BIGINT, LogicalType::VARCHAR,
	                LogicalType::INTEGER, LogicalType::VARCHAR, LogicalType::BIGINT, LogicalType::BIGINT,
	                LogicalType::VARCHAR, LogicalType::BIGINT,  LogicalType::VARCHAR, LogicalType::VARCHAR};
	return schema;
}

static constexpr idx_t BED_MIN_FIELDS = 3;
static constexpr idx_t BED_MAX_FIELDS = 12;

//! Browser and track lines only configure genome browsers.
static bool IsBedMetaLine(const string &line) {
	return line.empty() || line[0] == '#' || StringUtil::StartsWith(line, "track") ||
	       StringUtil::StartsWith(line, "browser");
}

class BedDecoder : public BioStreamDecoder {
public:
	BedDecoder(unique_ptr<ByteStream> stream, const BioFormatOptions &options, const BioHeaderInfo &header)
	    : BioStreamDecoder(BioFormat::BED, std::move(stream), options, header) {
	}

	bool Advance() override {
		string line;
		while (true) {
			if (!reader.ReadLine(line)) {
				return false;
			}
			if (!IsBedMetaLine(line)) {
				break;
			}
		}
		record_ordinal++;
		fields = SplitTabLine(line);
		if (fields.size() < BED_MIN_FIELDS) {
			// Some producers use spaces instead of tabs
			fields = SplitWhitespaceLine(line);
		}
		if (fields.size() < BED_MIN_FIELDS || fields.size() > BED_MAX_FIELDS) {
			throw DecodeError("expected 3 to 12 fields, found " + std::to_string(fields.size()));
		}
		if (!TryParseInt64(fields[1], start) || start < 0) {
			throw DecodeError("invalid start '" + fields[1] + "'");
		}
		if (!TryParseInt64(fields[2], end) || end < start) {
			throw DecodeError("invalid end '" + fields[2] + "'");
		}
		return true;
	}

	bool CurrentInterval(GenomicInterval &interval) const override {
		interval.reference = fields[0];
		interval.start = start;
		interval.end = end;
		return true;
	}

	void Emit(DataChunk &output, const vector<BioProjectedColumn> &projection, idx_t row) override {
		for (auto &col : projection) {
			auto &vec = output.data[col.output_idx];
			auto idx = col.column_idx;
			if (idx >= BED_MAX_FIELDS) {
				throw InternalException("bed_scan: column index %llu out of range", static_cast<unsigned long long>(idx));
			}
			if (idx >= fields.size()) {
				FlatVector::SetNull(vec, row, true);
				continue;
			}
			switch (idx) {
			case 1:
				// Output positions are 1-based like every other format
				FlatVector::GetData<int64_t>(vec)[row] = start + 1;
				break;
			case 2:
				FlatVector::GetData<int64_t>(vec)[row] = end;
				break;
			case 4:
				EmitInteger<int32_t>(vec, row, fields[idx], BED_COLUMN_NAMES[idx]);
				break;
			case 6:
			case 7:
			case 9:
				EmitInteger<int64_t>(vec, row, fields[idx], BED_COLUMN_NAMES[idx]);
				break;
			default:
				SetStringValue(vec, row, fields[idx], idx != 0);
				break;
			}
		}
	}

private:
	template <class T>
	void EmitInteger(Vector &vec, idx_t row, const string &text, const string &what) const {
		if (text == "." || text.empty()) {
			FlatVector::SetNull(vec, row, true);
			return;
		}
		int64_t value;
		if (!TryParseInt64(text, value)) {
			throw DecodeError("invalid " + what + " '" + text + "'");
		}
		FlatVector::GetData<T>(vec)[row] = static_cast<T>(value);
	}

	vector<string> fields;
	int64_t start = 0;
	int64_t end = 0;
};

unique_ptr<BioRecordDecoder> CreateBedDecoder(unique_ptr<ByteStream> stream, const BioFormatOptions &options,
                                              const BioHeaderInfo &bound_header) {
	return make_uniq<BedDecoder>(std::move(stream), options, bound_header);
}

} // namespace duckdb
