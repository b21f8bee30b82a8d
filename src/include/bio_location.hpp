#pragma once

#include "duckdb.hpp"
#include "bio_codec.hpp"

namespace duckdb {

//! One resolved input file of a table.
struct SourceFile {
	string path;
	//! Codec after applying the explicit option or extension inference
	BioCompression compression = BioCompression::NONE;
	//! Partition values in declared column order
	vector<string> partition_values;
	//! Size of the file as stored, before decompression
	idx_t byte_length = 0;
};

//! Options controlling how a table location is expanded.
struct LocationOptions {
	//! Recognised data extensions without compression suffix, e.g. {".vcf"}
	vector<string> extensions;
	//! Explicit compression, AUTO to infer per file
	BioCompression compression = BioCompression::AUTO;
	//! Declared Hive-style partition columns
	vector<string> partition_columns;
};

//! Expand a file, glob or directory (local or object-store prefix) into the
//! ordered list of source files. A directory is listed recursively and
//! filtered by extension; with partition columns every path segment between
//! the root and the file must be `key=value` or a bare value, and there must
//! be exactly one segment per declared column.
vector<SourceFile> ResolveLocation(ClientContext &context, const string &location, const LocationOptions &options,
                                   const string &func_name);

//! Parse the partition values for a file below `root`. Exposed for tests.
vector<string> ParsePartitionSegments(const string &root, const string &file_path,
                                      const vector<string> &partition_columns, const string &func_name);

} // namespace duckdb
