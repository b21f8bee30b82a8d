#include "bio_common.hpp"

#include "duckdb/common/file_system.hpp"
#include "duckdb/common/string_util.hpp"

#include <cerrno>
#include <cstdlib>
#include <limits>

namespace duckdb {

// ---------------------------------------------------------------------------
// Line splitting
// ---------------------------------------------------------------------------

vector<string> SplitTabLine(const string &line) {
	return SplitOn(line, '\t');
}

vector<string> SplitWhitespaceLine(const string &line) {
	vector<string> fields;
	size_t i = 0;
	while (i < line.size()) {
		while (i < line.size() && (line[i] == ' ' || line[i] == '\t')) {
			i++;
		}
		if (i >= line.size()) {
			break;
		}
		size_t start = i;
		while (i < line.size() && line[i] != ' ' && line[i] != '\t') {
			i++;
		}
		fields.push_back(line.substr(start, i - start));
	}
	return fields;
}

vector<string> SplitOn(const string &text, char delimiter) {
	vector<string> fields;
	size_t start = 0;
	size_t pos = text.find(delimiter);
	while (pos != string::npos) {
		fields.push_back(text.substr(start, pos - start));
		start = pos + 1;
		pos = text.find(delimiter, start);
	}
	fields.push_back(text.substr(start));
	return fields;
}

string TrimWhitespace(const string &text) {
	auto begin = text.find_first_not_of(" \t\r");
	if (begin == string::npos) {
		return "";
	}
	auto end = text.find_last_not_of(" \t\r");
	return text.substr(begin, end - begin + 1);
}

// ---------------------------------------------------------------------------
// Companion file discovery
// ---------------------------------------------------------------------------

string ReplaceExtension(const string &path, const string &new_ext) {
	auto dot = path.rfind('.');
	auto slash = path.rfind('/');
	if (dot == string::npos || (slash != string::npos && dot < slash)) {
		return path + new_ext;
	}
	return path.substr(0, dot) + new_ext;
}

string FindCompanionFile(FileSystem &fs, const string &path, const vector<string> &suffixes) {
	for (auto &suffix : suffixes) {
		auto candidate = path + suffix;
		if (fs.FileExists(candidate)) {
			return candidate;
		}
	}
	return "";
}

// ---------------------------------------------------------------------------
// Strict numeric parsing
// ---------------------------------------------------------------------------

bool TryParseInt64(const string &text, int64_t &result) {
	if (text.empty()) {
		return false;
	}
	char *end;
	errno = 0;
	long long val = std::strtoll(text.c_str(), &end, 10);
	if (end == text.c_str() || *end != '\0' || errno != 0) {
		return false;
	}
	result = static_cast<int64_t>(val);
	return true;
}

bool TryParseDouble(const string &text, double &result) {
	if (text.empty()) {
		return false;
	}
	char *end;
	errno = 0;
	double val = std::strtod(text.c_str(), &end);
	if (end == text.c_str() || *end != '\0' || errno == ERANGE) {
		return false;
	}
	result = val;
	return true;
}

// ---------------------------------------------------------------------------
// Region parsing
// ---------------------------------------------------------------------------

bool RegionPredicate::Matches(const GenomicInterval &record) const {
	if (!active) {
		return true;
	}
	if (record.reference != interval.reference) {
		return false;
	}
	if (record.end <= record.start) {
		return record.start >= interval.start && record.start < interval.end;
	}
	return record.start < interval.end && interval.start < record.end;
}

string RegionPredicate::ToString() const {
	if (interval.end == std::numeric_limits<int64_t>::max()) {
		if (interval.start == 0) {
			return interval.reference;
		}
		return StringUtil::Format("%s:%lld-", interval.reference, static_cast<long long>(interval.start + 1));
	}
	return StringUtil::Format("%s:%lld-%lld", interval.reference, static_cast<long long>(interval.start + 1),
	                          static_cast<long long>(interval.end));
}

void ParseIntervalRange(const string &range_str, const string &func_name, int64_t &start, int64_t &end) {
	auto dash_pos = range_str.find('-');
	string start_str = dash_pos == string::npos ? range_str : range_str.substr(0, dash_pos);

	int64_t start_1based;
	if (!TryParseInt64(start_str, start_1based) || start_1based < 1) {
		throw InvalidInputException("%s: invalid interval start '%s' in '%s'", func_name, start_str, range_str);
	}

	int64_t end_1based;
	if (dash_pos == string::npos) {
		// "start" alone selects a single position
		end_1based = start_1based;
	} else {
		auto end_str = range_str.substr(dash_pos + 1);
		if (end_str.empty()) {
			end_1based = std::numeric_limits<int64_t>::max();
		} else if (!TryParseInt64(end_str, end_1based) || end_1based < 1) {
			throw InvalidInputException("%s: invalid interval end '%s' in '%s'", func_name, end_str, range_str);
		}
	}

	if (start_1based > end_1based) {
		throw InvalidInputException("%s: interval start (%lld) > end (%lld) in '%s'", func_name,
		                            static_cast<long long>(start_1based), static_cast<long long>(end_1based),
		                            range_str);
	}

	start = start_1based - 1;
	end = end_1based;
}

RegionPredicate ParseRegion(const string &region_str, const string &func_name) {
	RegionPredicate region;
	region.active = true;

	if (region_str.empty()) {
		throw InvalidInputException("%s: region must not be empty", func_name);
	}

	auto colon_pos = region_str.rfind(':');
	if (colon_pos == string::npos) {
		// Chromosome-only filter
		region.interval.reference = region_str;
		region.interval.start = 0;
		region.interval.end = std::numeric_limits<int64_t>::max();
		return region;
	}

	region.interval.reference = region_str.substr(0, colon_pos);
	if (region.interval.reference.empty()) {
		throw InvalidInputException("%s: invalid region format '%s' (empty chromosome)", func_name, region_str);
	}
	if (colon_pos + 1 >= region_str.size()) {
		throw InvalidInputException("%s: invalid region format '%s' (expected chr:start-end)", func_name, region_str);
	}

	ParseIntervalRange(region_str.substr(colon_pos + 1), func_name, region.interval.start, region.interval.end);
	return region;
}

// ---------------------------------------------------------------------------
// Output vector helpers
// ---------------------------------------------------------------------------

void SetStringValue(Vector &vec, idx_t row, const string &val, bool dot_is_null) {
	if (dot_is_null && (val.empty() || val == ".")) {
		FlatVector::SetNull(vec, row, true);
		return;
	}
	FlatVector::GetData<string_t>(vec)[row] = StringVector::AddString(vec, val);
}

template <class T>
static void SetPrimitiveList(Vector &vec, idx_t row, const vector<T> &values) {
	auto list_size = static_cast<idx_t>(values.size());
	auto current_offset = ListVector::GetListSize(vec);
	auto &entry = FlatVector::GetData<list_entry_t>(vec)[row];
	entry.offset = current_offset;
	entry.length = list_size;

	ListVector::Reserve(vec, current_offset + list_size);
	auto &child = ListVector::GetEntry(vec);
	auto child_data = FlatVector::GetData<T>(child);
	for (idx_t i = 0; i < list_size; i++) {
		child_data[current_offset + i] = values[i];
	}
	ListVector::SetListSize(vec, current_offset + list_size);
}

void SetIntegerList(Vector &vec, idx_t row, const vector<int32_t> &values) {
	SetPrimitiveList<int32_t>(vec, row, values);
}

void SetTinyIntList(Vector &vec, idx_t row, const vector<int8_t> &values) {
	SetPrimitiveList<int8_t>(vec, row, values);
}

void SetDoubleList(Vector &vec, idx_t row, const vector<double> &values) {
	SetPrimitiveList<double>(vec, row, values);
}

void SetStringList(Vector &vec, idx_t row, const vector<string> &values) {
	auto list_size = static_cast<idx_t>(values.size());
	auto current_offset = ListVector::GetListSize(vec);
	auto &entry = FlatVector::GetData<list_entry_t>(vec)[row];
	entry.offset = current_offset;
	entry.length = list_size;

	ListVector::Reserve(vec, current_offset + list_size);
	auto &child = ListVector::GetEntry(vec);
	auto child_data = FlatVector::GetData<string_t>(child);
	for (idx_t i = 0; i < list_size; i++) {
		child_data[current_offset + i] = StringVector::AddString(child, values[i]);
	}
	ListVector::SetListSize(vec, current_offset + list_size);
}

// ---------------------------------------------------------------------------
// Phred+33 quality scores
// ---------------------------------------------------------------------------

vector<int32_t> DecodePhred33(const char *data, idx_t len) {
	vector<int32_t> scores;
	scores.reserve(len);
	for (idx_t i = 0; i < len; i++) {
		auto code = static_cast<int32_t>(static_cast<unsigned char>(data[i])) - PHRED_OFFSET;
		if (code < 0 || code > PHRED_MAX) {
			throw InvalidInputException("invalid quality score character '%c' at position %llu", data[i],
			                            static_cast<unsigned long long>(i));
		}
		scores.push_back(code);
	}
	return scores;
}

string EncodePhred33(const int32_t *scores, idx_t count) {
	string result;
	result.reserve(count);
	for (idx_t i = 0; i < count; i++) {
		if (scores[i] < 0 || scores[i] > PHRED_MAX) {
			throw InvalidInputException("quality score %d out of range [0, %d]", scores[i], PHRED_MAX);
		}
		result.push_back(static_cast<char>(scores[i] + PHRED_OFFSET));
	}
	return result;
}

} // namespace duckdb
