#include "fcs_reader.hpp"

#include "duckdb/common/case_insensitive_map.hpp"
#include "duckdb/common/limits.hpp"
#include "duckdb/common/string_util.hpp"

#include <cstring>

namespace duckdb {

// ---------------------------------------------------------------------------
// HEADER and TEXT segments
// ---------------------------------------------------------------------------

static constexpr idx_t FCS_HEADER_SIZE = 58;

//! Everything needed to decode the DATA segment of one file.
struct FcsLayout {
	idx_t data_begin = 0;
	idx_t data_end = 0;
	idx_t event_count = 0;
	char data_type = 'F';
	bool little_endian = true;
	vector<FcsParameter> parameters;
};

static idx_t ParseHeaderOffset(const string &content, idx_t pos, const string &path, const string &func_name) {
	auto text = TrimWhitespace(content.substr(pos, 8));
	if (text.empty()) {
		return 0;
	}
	int64_t value;
	if (!TryParseInt64(text, value) || value < 0) {
		throw InvalidInputException("%s: invalid segment offset '%s' in FCS header of '%s'", func_name, text, path);
	}
	return static_cast<idx_t>(value);
}

//! Split the TEXT segment into keyword/value pairs. The first byte is the
//! delimiter; a doubled delimiter stands for a literal one.
static case_insensitive_map_t<string> ParseTextSegment(const string &text) {
	case_insensitive_map_t<string> keywords;
	if (text.empty()) {
		return keywords;
	}
	auto delimiter = text[0];
	vector<string> tokens;
	string current;
	for (idx_t i = 1; i < text.size(); i++) {
		if (text[i] != delimiter) {
			current += text[i];
			continue;
		}
		if (i + 1 < text.size() && text[i + 1] == delimiter) {
			current += delimiter;
			i++;
			continue;
		}
		tokens.push_back(current);
		current.clear();
	}
	if (!current.empty()) {
		tokens.push_back(current);
	}
	for (idx_t i = 0; i + 1 < tokens.size(); i += 2) {
		keywords[TrimWhitespace(tokens[i])] = tokens[i + 1];
	}
	return keywords;
}

static const string &RequireKeyword(const case_insensitive_map_t<string> &keywords, const string &key,
                                    const string &path, const string &func_name) {
	auto entry = keywords.find(key);
	if (entry == keywords.end()) {
		throw InvalidInputException("%s: FCS file '%s' is missing required keyword %s", func_name, path, key);
	}
	return entry->second;
}

static idx_t RequireCount(const case_insensitive_map_t<string> &keywords, const string &key, const string &path,
                          const string &func_name) {
	int64_t value;
	auto &text = RequireKeyword(keywords, key, path, func_name);
	if (!TryParseInt64(TrimWhitespace(text), value) || value < 0) {
		throw InvalidInputException("%s: invalid %s value '%s' in '%s'", func_name, key, text, path);
	}
	return static_cast<idx_t>(value);
}

static FcsLayout ParseLayout(const string &content, const string &path, const string &func_name) {
	if (content.size() < FCS_HEADER_SIZE || !StringUtil::StartsWith(content, "FCS")) {
		throw InvalidInputException("%s: '%s' is not an FCS file", func_name, path);
	}
	auto version = content.substr(0, 6);
	if (version != "FCS2.0" && version != "FCS3.0" && version != "FCS3.1") {
		throw InvalidInputException("%s: unsupported FCS version '%s' in '%s'", func_name, version, path);
	}
	auto text_begin = ParseHeaderOffset(content, 10, path, func_name);
	auto text_end = ParseHeaderOffset(content, 18, path, func_name);
	if (text_begin == 0 || text_end < text_begin || text_end >= content.size()) {
		throw InvalidInputException("%s: TEXT segment offsets out of range in '%s'", func_name, path);
	}
	auto keywords = ParseTextSegment(content.substr(text_begin, text_end - text_begin + 1));

	FcsLayout layout;
	layout.data_begin = ParseHeaderOffset(content, 26, path, func_name);
	layout.data_end = ParseHeaderOffset(content, 34, path, func_name);
	// Large files put the DATA offsets in TEXT and zeros in the HEADER
	if (layout.data_begin == 0 && layout.data_end == 0) {
		layout.data_begin = RequireCount(keywords, "$BEGINDATA", path, func_name);
		layout.data_end = RequireCount(keywords, "$ENDDATA", path, func_name);
	}

	auto mode = keywords.find("$MODE");
	if (mode != keywords.end() && StringUtil::Upper(TrimWhitespace(mode->second)) != "L") {
		throw InvalidInputException("%s: only list mode FCS data is supported, '%s' has $MODE %s", func_name, path,
		                            mode->second);
	}

	auto data_type = StringUtil::Upper(TrimWhitespace(RequireKeyword(keywords, "$DATATYPE", path, func_name)));
	if (data_type != "I" && data_type != "F" && data_type != "D") {
		throw InvalidInputException("%s: unsupported $DATATYPE '%s' in '%s'", func_name, data_type, path);
	}
	layout.data_type = data_type[0];

	auto byte_order = TrimWhitespace(RequireKeyword(keywords, "$BYTEORD", path, func_name));
	if (StringUtil::StartsWith(byte_order, "1,2")) {
		layout.little_endian = true;
	} else if (StringUtil::StartsWith(byte_order, "4,3") || StringUtil::StartsWith(byte_order, "2,1")) {
		layout.little_endian = false;
	} else {
		throw InvalidInputException("%s: unsupported $BYTEORD '%s' in '%s'", func_name, byte_order, path);
	}

	auto parameter_count = RequireCount(keywords, "$PAR", path, func_name);
	layout.event_count = RequireCount(keywords, "$TOT", path, func_name);
	for (idx_t p = 1; p <= parameter_count; p++) {
		FcsParameter parameter;
		auto prefix = "$P" + std::to_string(p);
		parameter.name = TrimWhitespace(RequireKeyword(keywords, prefix + "N", path, func_name));
		parameter.bits = RequireCount(keywords, prefix + "B", path, func_name);
		switch (layout.data_type) {
		case 'F':
			if (parameter.bits != 32) {
				throw InvalidInputException("%s: %sB must be 32 for float data in '%s'", func_name, prefix, path);
			}
			parameter.type = LogicalType::FLOAT;
			break;
		case 'D':
			if (parameter.bits != 64) {
				throw InvalidInputException("%s: %sB must be 64 for double data in '%s'", func_name, prefix, path);
			}
			parameter.type = LogicalType::DOUBLE;
			break;
		default:
			if (parameter.bits != 8 && parameter.bits != 16 && parameter.bits != 32) {
				throw InvalidInputException("%s: unsupported integer width %sB=%llu in '%s'", func_name, prefix,
				                            static_cast<unsigned long long>(parameter.bits), path);
			}
			parameter.type = LogicalType::INTEGER;
			break;
		}
		layout.parameters.push_back(std::move(parameter));
	}
	return layout;
}

void ParseFcsLayout(const string &content, const string &path, const string &func_name, BioHeaderInfo &header) {
	header.fcs_parameters = ParseLayout(content, path, func_name).parameters;
}

BioSchema FcsSchema(const BioHeaderInfo &header) {
	BioSchema schema;
	for (auto &parameter : header.fcs_parameters) {
		schema.names.push_back(parameter.name);
		schema.types.push_back(parameter.type);
	}
	return schema;
}

// ---------------------------------------------------------------------------
// Decoder
// ---------------------------------------------------------------------------

class FcsDecoder : public BioStreamDecoder {
public:
	FcsDecoder(unique_ptr<ByteStream> stream, const BioFormatOptions &options, const BioHeaderInfo &header)
	    : BioStreamDecoder(BioFormat::FCS, std::move(stream), options, header) {
		// FCS addresses segments by absolute offset, so the file is read whole
		content = reader.ReadAll();
		layout = ParseLayout(content, reader.GetPath(), "fcs_scan");
		if (layout.parameters.size() != header.fcs_parameters.size()) {
			throw InvalidInputException("fcs_scan: '%s' has %llu parameters but the table was bound with %llu",
			                            reader.GetPath(), static_cast<unsigned long long>(layout.parameters.size()),
			                            static_cast<unsigned long long>(header.fcs_parameters.size()));
		}
		for (idx_t i = 0; i < layout.parameters.size(); i++) {
			if (layout.parameters[i].type != header.fcs_parameters[i].type) {
				throw InvalidInputException("fcs_scan: parameter %s in '%s' has type %s, expected %s",
				                            layout.parameters[i].name, reader.GetPath(),
				                            layout.parameters[i].type.ToString(),
				                            header.fcs_parameters[i].type.ToString());
			}
			parameter_offsets.push_back(event_width);
			event_width += layout.parameters[i].bits / 8;
		}
		if (event_width == 0) {
			throw InvalidInputException("fcs_scan: '%s' declares no parameters", reader.GetPath());
		}
		// Compare by division so a huge $TOT cannot wrap the product
		auto available = layout.data_begin <= content.size() ? content.size() - layout.data_begin : 0;
		if (layout.event_count > available / event_width) {
			throw InvalidInputException("fcs_scan: DATA segment of '%s' is shorter than $TOT x $PAR", reader.GetPath());
		}
		auto required = layout.event_count * event_width;
		if (layout.data_end + 1 < layout.data_begin + required) {
			throw InvalidInputException("fcs_scan: DATA segment of '%s' is shorter than $TOT x $PAR", reader.GetPath());
		}
	}

	bool Advance() override {
		if (record_ordinal >= layout.event_count) {
			return false;
		}
		record_ordinal++;
		return true;
	}

	void Emit(DataChunk &output, const vector<BioProjectedColumn> &projection, idx_t row) override {
		auto event = const_data_ptr_cast(content.data()) + layout.data_begin + (record_ordinal - 1) * event_width;
		for (auto &col : projection) {
			if (col.column_idx >= layout.parameters.size()) {
				throw InternalException("fcs_scan: column index %llu out of range",
				                        static_cast<unsigned long long>(col.column_idx));
			}
			auto &vec = output.data[col.output_idx];
			auto &parameter = layout.parameters[col.column_idx];
			auto field = event + parameter_offsets[col.column_idx];
			switch (layout.data_type) {
			case 'F': {
				auto bits = ReadUnsigned(field, 4);
				float value;
				auto raw = static_cast<uint32_t>(bits);
				memcpy(&value, &raw, sizeof(value));
				FlatVector::GetData<float>(vec)[row] = value;
				break;
			}
			case 'D': {
				auto bits = ReadUnsigned(field, 8);
				double value;
				memcpy(&value, &bits, sizeof(value));
				FlatVector::GetData<double>(vec)[row] = value;
				break;
			}
			default: {
				auto value = ReadUnsigned(field, parameter.bits / 8);
				if (value > static_cast<uint64_t>(NumericLimits<int32_t>::Maximum())) {
					throw DecodeError("integer value " + std::to_string(value) + " of " + parameter.name +
					                  " exceeds INTEGER range");
				}
				FlatVector::GetData<int32_t>(vec)[row] = static_cast<int32_t>(value);
				break;
			}
			}
		}
	}

private:
	uint64_t ReadUnsigned(const_data_ptr_t field, idx_t width) const {
		uint64_t value = 0;
		for (idx_t b = 0; b < width; b++) {
			auto byte = layout.little_endian ? field[b] : field[width - 1 - b];
			value |= static_cast<uint64_t>(byte) << (8 * b);
		}
		return value;
	}

	string content;
	FcsLayout layout;
	vector<idx_t> parameter_offsets;
	idx_t event_width = 0;
};

unique_ptr<BioRecordDecoder> CreateFcsDecoder(unique_ptr<ByteStream> stream, const BioFormatOptions &options,
                                              const BioHeaderInfo &bound_header) {
	return make_uniq<FcsDecoder>(std::move(stream), options, bound_header);
}

} // namespace duckdb
