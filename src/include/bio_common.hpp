#pragma once

#include "duckdb.hpp"

#include <cstdint>

namespace duckdb {

// ---------------------------------------------------------------------------
// Line splitting
// ---------------------------------------------------------------------------

//! Split a line on tab characters.
vector<string> SplitTabLine(const string &line);

//! Split a line on runs of spaces/tabs (HMMER tables, SDF counts line).
vector<string> SplitWhitespaceLine(const string &line);

//! Split on an arbitrary single-character delimiter.
vector<string> SplitOn(const string &text, char delimiter);

//! Strip leading/trailing spaces, tabs and CR.
string TrimWhitespace(const string &text);

// ---------------------------------------------------------------------------
// Companion file discovery
// ---------------------------------------------------------------------------

//! Replace the extension of a file path.
string ReplaceExtension(const string &path, const string &new_ext);

//! Return the first existing path among `path + suffix` for each suffix,
//! or empty string if none exists.
string FindCompanionFile(FileSystem &fs, const string &path, const vector<string> &suffixes);

// ---------------------------------------------------------------------------
// Strict numeric parsing
// ---------------------------------------------------------------------------

//! Parse a whole string as a signed 64-bit integer. Returns false on any
//! trailing garbage, empty input or overflow.
bool TryParseInt64(const string &text, int64_t &result);

//! Parse a whole string as a double.
bool TryParseDouble(const string &text, double &result);

// ---------------------------------------------------------------------------
// Genomic regions
// ---------------------------------------------------------------------------

//! 0-based half-open genomic interval on a named reference.
struct GenomicInterval {
	string reference;
	int64_t start = 0;
	int64_t end = 0;
};

//! Region filter parsed from "chr", "chr:start-end", "chr:start-" or "chr:start".
//! Text coordinates are 1-based inclusive, stored as 0-based half-open.
struct RegionPredicate {
	GenomicInterval interval;
	bool active = false;

	//! True if a record interval overlaps this region. A record with an
	//! empty interval (e.g. unmapped or zero-length) overlaps when its start
	//! lies inside the region.
	bool Matches(const GenomicInterval &record) const;

	string ToString() const;
};

//! Parse a region string; throws InvalidInputException naming func_name on
//! malformed input or start > end.
RegionPredicate ParseRegion(const string &region_str, const string &func_name);

//! Parse "start-end" (1-based inclusive) into a 0-based half-open interval.
void ParseIntervalRange(const string &range_str, const string &func_name, int64_t &start, int64_t &end);

// ---------------------------------------------------------------------------
// Output vector helpers
// ---------------------------------------------------------------------------

//! Write a string value; "." and empty map to NULL when dot_is_null is set.
void SetStringValue(Vector &vec, idx_t row, const string &val, bool dot_is_null = false);

//! Append an integer list entry for `row` directly into the list child.
void SetIntegerList(Vector &vec, idx_t row, const vector<int32_t> &values);

//! Append a TINYINT list entry for `row`.
void SetTinyIntList(Vector &vec, idx_t row, const vector<int8_t> &values);

//! Append a double list entry for `row` directly into the list child.
void SetDoubleList(Vector &vec, idx_t row, const vector<double> &values);

//! Append a VARCHAR list entry for `row`.
void SetStringList(Vector &vec, idx_t row, const vector<string> &values);

// ---------------------------------------------------------------------------
// Phred+33 quality scores
// ---------------------------------------------------------------------------

static constexpr int32_t PHRED_OFFSET = 33;
static constexpr int32_t PHRED_MAX = 93;

//! Decode a Phred+33 string. Throws InvalidInputException on characters
//! outside '!'..'~'.
vector<int32_t> DecodePhred33(const char *data, idx_t len);

//! Encode scores as Phred+33. Throws InvalidInputException on values outside
//! [0, 93].
string EncodePhred33(const int32_t *scores, idx_t count);

} // namespace duckdb
