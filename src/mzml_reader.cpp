#include "mzml_reader.hpp"

#include "duckdb/common/string_util.hpp"
#include "duckdb/common/types/blob.hpp"

namespace duckdb {

// ---------------------------------------------------------------------------
// Schema
// ---------------------------------------------------------------------------

BioSchema MzmlSchema() {
	BioSchema schema;
	schema.names = {"id", "index", "ms_level", "mz", "intensity", "precursor_mz", "precursor_charge", "cv_params"};
	schema.types = {LogicalType::VARCHAR,
	                LogicalType::INTEGER,
	                LogicalType::INTEGER,
	                LogicalType::LIST(LogicalType::DOUBLE),
	                LogicalType::LIST(LogicalType::DOUBLE),
	                LogicalType::DOUBLE,
	                LogicalType::INTEGER,
	                LogicalType::MAP(LogicalType::VARCHAR, LogicalType::VARCHAR)};
	return schema;
}

// ---------------------------------------------------------------------------
// Controlled vocabulary accessions
// ---------------------------------------------------------------------------

static constexpr const char *CV_MS_LEVEL = "MS:1000511";
static constexpr const char *CV_SELECTED_ION_MZ = "MS:1000744";
static constexpr const char *CV_CHARGE_STATE = "MS:1000041";
static constexpr const char *CV_32BIT_FLOAT = "MS:1000521";
static constexpr const char *CV_64BIT_FLOAT = "MS:1000523";
static constexpr const char *CV_ZLIB = "MS:1000574";
static constexpr const char *CV_MZ_ARRAY = "MS:1000514";
static constexpr const char *CV_INTENSITY_ARRAY = "MS:1000515";

// ---------------------------------------------------------------------------
// Minimal tag scanner
// ---------------------------------------------------------------------------

struct XmlTag {
	string name;
	bool closing = false;
	bool self_closing = false;
	unordered_map<string, string> attributes;
	//! Offset just past the closing '>'
	idx_t end = 0;
};

static string DecodeXmlEntities(const string &text) {
	if (text.find('&') == string::npos) {
		return text;
	}
	string result;
	for (idx_t i = 0; i < text.size(); i++) {
		if (text[i] != '&') {
			result += text[i];
			continue;
		}
		auto semi = text.find(';', i);
		if (semi == string::npos) {
			result += text[i];
			continue;
		}
		auto entity = text.substr(i + 1, semi - i - 1);
		if (entity == "amp") {
			result += '&';
		} else if (entity == "lt") {
			result += '<';
		} else if (entity == "gt") {
			result += '>';
		} else if (entity == "quot") {
			result += '"';
		} else if (entity == "apos") {
			result += '\'';
		} else {
			result += text.substr(i, semi - i + 1);
		}
		i = semi;
	}
	return result;
}

//! Find the next element tag at or after `pos`, skipping comments and
//! processing instructions. Returns false when no complete tag remains.
static bool NextTag(const string &xml, idx_t pos, XmlTag &tag) {
	while (true) {
		auto open = xml.find('<', pos);
		if (open == string::npos) {
			return false;
		}
		if (xml.compare(open, 4, "<!--") == 0) {
			auto close = xml.find("-->", open);
			if (close == string::npos) {
				return false;
			}
			pos = close + 3;
			continue;
		}
		if (open + 1 < xml.size() && (xml[open + 1] == '?' || xml[open + 1] == '!')) {
			pos = open + 1;
			continue;
		}
		auto close = xml.find('>', open);
		if (close == string::npos) {
			return false;
		}
		tag = XmlTag();
		tag.end = close + 1;
		idx_t i = open + 1;
		if (xml[i] == '/') {
			tag.closing = true;
			i++;
		}
		auto name_start = i;
		while (i < close && !StringUtil::CharacterIsSpace(xml[i]) && xml[i] != '/') {
			i++;
		}
		tag.name = xml.substr(name_start, i - name_start);
		tag.self_closing = xml[close - 1] == '/';
		// Attributes: name="value" or name='value'
		while (i < close) {
			while (i < close && (StringUtil::CharacterIsSpace(xml[i]) || xml[i] == '/')) {
				i++;
			}
			auto eq = xml.find('=', i);
			if (i >= close || eq == string::npos || eq > close) {
				break;
			}
			auto key = TrimWhitespace(xml.substr(i, eq - i));
			i = eq + 1;
			while (i < close && StringUtil::CharacterIsSpace(xml[i])) {
				i++;
			}
			if (i >= close || (xml[i] != '"' && xml[i] != '\'')) {
				break;
			}
			auto quote = xml[i];
			auto value_end = xml.find(quote, i + 1);
			if (value_end == string::npos || value_end > close) {
				break;
			}
			tag.attributes[key] = DecodeXmlEntities(xml.substr(i + 1, value_end - i - 1));
			i = value_end + 1;
		}
		return true;
	}
}

static string Attribute(const XmlTag &tag, const string &name) {
	auto entry = tag.attributes.find(name);
	return entry == tag.attributes.end() ? string() : entry->second;
}

// ---------------------------------------------------------------------------
// Binary arrays
// ---------------------------------------------------------------------------

vector<double> DecodeMzmlBinaryArray(const string &base64, bool zlib_compressed, bool is_64bit,
                                     const string &what) {
	string clean;
	clean.reserve(base64.size());
	for (auto c : base64) {
		if (!StringUtil::CharacterIsSpace(c)) {
			clean += c;
		}
	}
	if (clean.empty()) {
		return vector<double>();
	}

	string raw;
	try {
		auto size = Blob::FromBase64Size(clean);
		raw.resize(size);
		Blob::FromBase64(clean, data_ptr_cast(&raw[0]), size);
	} catch (ConversionException &ex) {
		throw InvalidInputException("%s: invalid base64 in binary array: %s", what, ex.what());
	}
	if (zlib_compressed) {
		raw = InflateZlibBuffer(const_data_ptr_cast(raw.data()), raw.size(), what);
	}

	idx_t width = is_64bit ? 8 : 4;
	if (raw.size() % width != 0) {
		throw InvalidInputException("%s: binary array of %llu bytes is not a multiple of %llu", what,
		                            static_cast<unsigned long long>(raw.size()),
		                            static_cast<unsigned long long>(width));
	}
	vector<double> values(raw.size() / width);
	auto data = const_data_ptr_cast(raw.data());
	for (idx_t i = 0; i < values.size(); i++) {
		if (is_64bit) {
			values[i] = Load<double>(data + i * width);
		} else {
			values[i] = static_cast<double>(Load<float>(data + i * width));
		}
	}
	return values;
}

// ---------------------------------------------------------------------------
// Decoder
// ---------------------------------------------------------------------------

enum MzmlColumn : idx_t {
	MZML_ID = 0,
	MZML_INDEX,
	MZML_MS_LEVEL,
	MZML_MZ,
	MZML_INTENSITY,
	MZML_PRECURSOR_MZ,
	MZML_PRECURSOR_CHARGE,
	MZML_CV_PARAMS
};

struct MzmlSpectrum {
	string id;
	bool has_index = false;
	int32_t index = 0;
	bool has_ms_level = false;
	int32_t ms_level = 0;
	vector<double> mz;
	vector<double> intensity;
	bool has_precursor_mz = false;
	double precursor_mz = 0;
	bool has_precursor_charge = false;
	int32_t precursor_charge = 0;
	vector<pair<string, string>> cv_params;
};

//! Find "<spectrum" as an element name (not "<spectrumList").
static idx_t FindSpectrumStart(const string &text, idx_t from) {
	auto pos = text.find("<spectrum", from);
	while (pos != string::npos) {
		auto next = pos + 9;
		if (next < text.size() && (StringUtil::CharacterIsSpace(text[next]) || text[next] == '>')) {
			return pos;
		}
		pos = text.find("<spectrum", pos + 1);
	}
	return string::npos;
}

class MzmlDecoder : public BioStreamDecoder {
public:
	MzmlDecoder(unique_ptr<ByteStream> stream, const BioFormatOptions &options, const BioHeaderInfo &header)
	    : BioStreamDecoder(BioFormat::MZML, std::move(stream), options, header) {
	}

	bool Advance() override {
		string chunk;
		if (!NextSpectrumChunk(chunk)) {
			return false;
		}
		record_ordinal++;
		ParseSpectrum(chunk);
		return true;
	}

	void Emit(DataChunk &output, const vector<BioProjectedColumn> &projection, idx_t row) override {
		for (auto &col : projection) {
			auto &vec = output.data[col.output_idx];
			switch (col.column_idx) {
			case MZML_ID:
				SetStringValue(vec, row, spectrum.id);
				break;
			case MZML_INDEX:
				EmitOptional<int32_t>(vec, row, spectrum.has_index, spectrum.index);
				break;
			case MZML_MS_LEVEL:
				EmitOptional<int32_t>(vec, row, spectrum.has_ms_level, spectrum.ms_level);
				break;
			case MZML_MZ:
				SetDoubleList(vec, row, spectrum.mz);
				break;
			case MZML_INTENSITY:
				SetDoubleList(vec, row, spectrum.intensity);
				break;
			case MZML_PRECURSOR_MZ:
				EmitOptional<double>(vec, row, spectrum.has_precursor_mz, spectrum.precursor_mz);
				break;
			case MZML_PRECURSOR_CHARGE:
				EmitOptional<int32_t>(vec, row, spectrum.has_precursor_charge, spectrum.precursor_charge);
				break;
			case MZML_CV_PARAMS: {
				vector<Value> keys;
				vector<Value> values;
				for (auto &param : spectrum.cv_params) {
					keys.push_back(Value(param.first));
					values.push_back(Value(param.second));
				}
				vec.SetValue(row,
				             Value::MAP(LogicalType::VARCHAR, LogicalType::VARCHAR, std::move(keys), std::move(values)));
				break;
			}
			default:
				throw InternalException("mzml_scan: column index %llu out of range",
				                        static_cast<unsigned long long>(col.column_idx));
			}
		}
	}

private:
	template <class T>
	static void EmitOptional(Vector &vec, idx_t row, bool present, T value) {
		if (present) {
			FlatVector::GetData<T>(vec)[row] = value;
		} else {
			FlatVector::SetNull(vec, row, true);
		}
	}

	//! Collect the text of the next <spectrum> ... </spectrum> element.
	//! Bytes before `pending_pos` are consumed; they are dropped once they
	//! make up half of the buffer.
	bool NextSpectrumChunk(string &chunk) {
		string line;
		while (true) {
			auto start = FindSpectrumStart(pending, pending_pos);
			if (start != string::npos) {
				pending_pos = start;
				auto end = pending.find("</spectrum>", MaxValue<idx_t>(start, end_search_from));
				if (end != string::npos) {
					end += 11;
					chunk = pending.substr(start, end - start);
					pending_pos = end;
					end_search_from = 0;
					CompactPending();
					return true;
				}
				// Only the tail can complete a closing tag split across lines
				end_search_from = pending.size() > 10 ? pending.size() - 10 : 0;
			} else if (pending.size() > pending_pos + 16) {
				// Retain a short tail so a tag split across lines is still found
				pending_pos = pending.size() - 16;
			}
			CompactPending();
			if (!reader.ReadLine(line)) {
				if (FindSpectrumStart(pending, pending_pos) != string::npos) {
					record_ordinal++;
					throw DecodeError("unterminated <spectrum> element");
				}
				return false;
			}
			pending += line;
			pending += '\n';
		}
	}

	void CompactPending() {
		if (pending_pos == 0 || pending_pos < pending.size() / 2) {
			return;
		}
		pending.erase(0, pending_pos);
		end_search_from = end_search_from > pending_pos ? end_search_from - pending_pos : 0;
		pending_pos = 0;
	}

	void ParseSpectrum(const string &xml) {
		spectrum = MzmlSpectrum();
		XmlTag tag;
		if (!NextTag(xml, 0, tag) || tag.name != "spectrum") {
			throw DecodeError("malformed <spectrum> start tag");
		}
		spectrum.id = Attribute(tag, "id");
		int64_t number;
		if (TryParseInt64(Attribute(tag, "index"), number)) {
			spectrum.has_index = true;
			spectrum.index = static_cast<int32_t>(number);
		}

		idx_t precursor_depth = 0;
		bool seen_precursor = false;
		bool in_array = false;
		bool array_64bit = false;
		bool array_zlib = false;
		string array_kind;
		idx_t pos = tag.end;
		while (NextTag(xml, pos, tag)) {
			pos = tag.end;
			if (tag.name == "precursor") {
				if (tag.closing && precursor_depth > 0) {
					precursor_depth--;
					seen_precursor = true;
				} else if (!tag.closing && !tag.self_closing) {
					precursor_depth++;
				}
			} else if (tag.name == "binaryDataArray") {
				if (!tag.closing) {
					in_array = true;
					array_64bit = false;
					array_zlib = false;
					array_kind.clear();
				} else {
					in_array = false;
				}
			} else if (tag.name == "binary" && !tag.closing && !tag.self_closing) {
				auto close = xml.find("</binary>", pos);
				if (close == string::npos) {
					throw DecodeError("unterminated <binary> element");
				}
				auto payload = xml.substr(pos, close - pos);
				pos = close;
				StoreArray(array_kind, DecodeMzmlBinaryArray(payload, array_zlib, array_64bit, ArrayContext()));
			} else if (tag.name == "cvParam" && !tag.closing) {
				auto accession = Attribute(tag, "accession");
				auto value = Attribute(tag, "value");
				if (in_array) {
					if (accession == CV_64BIT_FLOAT) {
						array_64bit = true;
					} else if (accession == CV_32BIT_FLOAT) {
						array_64bit = false;
					} else if (accession == CV_ZLIB) {
						array_zlib = true;
					} else if (accession == CV_MZ_ARRAY || accession == CV_INTENSITY_ARRAY) {
						array_kind = accession;
					}
				} else if (precursor_depth > 0) {
					// Only the first precursor is reported
					if (seen_precursor) {
						continue;
					}
					if (accession == CV_SELECTED_ION_MZ && !spectrum.has_precursor_mz) {
						spectrum.has_precursor_mz = TryParseDouble(value, spectrum.precursor_mz);
					} else if (accession == CV_CHARGE_STATE && !spectrum.has_precursor_charge &&
					           TryParseInt64(value, number)) {
						spectrum.has_precursor_charge = true;
						spectrum.precursor_charge = static_cast<int32_t>(number);
					}
				} else {
					AddCvParam(accession, value);
				}
			}
		}
	}

	void AddCvParam(const string &accession, const string &value) {
		if (accession.empty()) {
			return;
		}
		int64_t number;
		if (accession == CV_MS_LEVEL && TryParseInt64(value, number)) {
			spectrum.has_ms_level = true;
			spectrum.ms_level = static_cast<int32_t>(number);
		}
		for (auto &param : spectrum.cv_params) {
			if (param.first == accession) {
				return;
			}
		}
		spectrum.cv_params.emplace_back(accession, value);
	}

	void StoreArray(const string &kind, vector<double> values) {
		if (kind == CV_MZ_ARRAY) {
			spectrum.mz = std::move(values);
		} else if (kind == CV_INTENSITY_ARRAY) {
			spectrum.intensity = std::move(values);
		}
	}

	string ArrayContext() const {
		return "mzml_scan: spectrum " + std::to_string(record_ordinal) + " in '" + reader.GetPath() + "'";
	}

	string pending;
	idx_t pending_pos = 0;
	idx_t end_search_from = 0;
	MzmlSpectrum spectrum;
};

unique_ptr<BioRecordDecoder> CreateMzmlDecoder(unique_ptr<ByteStream> stream, const BioFormatOptions &options,
                                               const BioHeaderInfo &bound_header) {
	return make_uniq<MzmlDecoder>(std::move(stream), options, bound_header);
}

} // namespace duckdb
