#include "bio_location.hpp"
#include "bio_common.hpp"

#include "duckdb/common/file_system.hpp"
#include "duckdb/common/string_util.hpp"
#include "duckdb/logging/logger.hpp"

#include <algorithm>

namespace duckdb {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static bool HasRecognisedExtension(const string &path, const vector<string> &extensions) {
	if (extensions.empty()) {
		return true;
	}
	auto base = StringUtil::Lower(StripCompressionExtension(path));
	for (auto &ext : extensions) {
		if (StringUtil::EndsWith(base, ext)) {
			return true;
		}
	}
	return false;
}

static string StripTrailingSlash(const string &path) {
	auto result = path;
	while (result.size() > 1 && result.back() == '/') {
		result.pop_back();
	}
	return result;
}

//! Resolve the codec for one file. The explicit option always wins; when it
//! disagrees with the extension we log a warning rather than guess.
static BioCompression ResolveCompression(ClientContext &context, const string &path, BioCompression explicit_codec,
                                         const string &func_name) {
	auto inferred = InferCompressionFromPath(path);
	if (explicit_codec == BioCompression::AUTO) {
		return inferred;
	}
	bool compatible = explicit_codec == inferred ||
	                  (explicit_codec == BioCompression::GZIP && inferred == BioCompression::BGZF) ||
	                  (explicit_codec == BioCompression::BGZF && inferred == BioCompression::GZIP);
	if (!compatible) {
		DUCKDB_LOG_WARN(context, "%s: explicit compression '%s' overrides '%s' inferred from the extension of '%s'",
		                func_name, CompressionToString(explicit_codec), CompressionToString(inferred), path);
	}
	return explicit_codec;
}

//! Size reported by the listing when the file system provides one, otherwise
//! read from an opened handle.
static idx_t ListedFileSize(FileSystem &fs, const OpenFileInfo &info) {
	if (info.extended_info) {
		auto &entries = info.extended_info->options;
		auto entry = entries.find("file_size");
		if (entry != entries.end() && !entry->second.IsNull()) {
			return entry->second.GetValue<uint64_t>();
		}
	}
	auto handle = fs.OpenFile(info.path, FileFlags::FILE_FLAGS_READ);
	return handle->GetFileSize();
}

// ---------------------------------------------------------------------------
// Partition parsing
// ---------------------------------------------------------------------------

vector<string> ParsePartitionSegments(const string &root, const string &file_path,
                                      const vector<string> &partition_columns, const string &func_name) {
	auto root_dir = StripTrailingSlash(root);
	string relative = file_path;
	if (StringUtil::StartsWith(file_path, root_dir + "/")) {
		relative = file_path.substr(root_dir.size() + 1);
	}

	auto segments = SplitOn(relative, '/');
	// The last segment is the file name itself
	segments.pop_back();
	segments.erase(std::remove(segments.begin(), segments.end(), string()), segments.end());

	if (segments.size() != partition_columns.size()) {
		throw InvalidInputException("%s: file '%s' has %llu partition directories but %llu partition columns "
		                            "were declared",
		                            func_name, file_path, static_cast<unsigned long long>(segments.size()),
		                            static_cast<unsigned long long>(partition_columns.size()));
	}

	vector<string> values;
	for (idx_t i = 0; i < segments.size(); i++) {
		auto &segment = segments[i];
		auto eq = segment.find('=');
		if (eq == string::npos) {
			values.push_back(segment);
			continue;
		}
		auto key = segment.substr(0, eq);
		if (!StringUtil::CIEquals(key, partition_columns[i])) {
			throw InvalidInputException("%s: partition directory '%s' in '%s' does not match declared column '%s'",
			                            func_name, segment, file_path, partition_columns[i]);
		}
		values.push_back(segment.substr(eq + 1));
	}
	return values;
}

// ---------------------------------------------------------------------------
// Resolution
// ---------------------------------------------------------------------------

vector<SourceFile> ResolveLocation(ClientContext &context, const string &location, const LocationOptions &options,
                                   const string &func_name) {
	if (location.empty()) {
		throw InvalidInputException("%s: location must not be empty", func_name);
	}

	auto &fs = FileSystem::GetFileSystem(context);
	bool is_directory = StringUtil::EndsWith(location, "/") || fs.DirectoryExists(location);

	vector<OpenFileInfo> paths;
	if (is_directory) {
		auto root = StripTrailingSlash(location);
		auto pattern = fs.JoinPath(root, "**");
		for (auto &info : fs.GlobFiles(fs.JoinPath(pattern, "*"), context, FileGlobOptions::ALLOW_EMPTY)) {
			if (HasRecognisedExtension(info.path, options.extensions)) {
				paths.push_back(info);
			}
		}
	} else if (FileSystem::HasGlob(location)) {
		if (!options.partition_columns.empty()) {
			throw InvalidInputException("%s: partition_columns requires a directory location, got glob '%s'",
			                            func_name, location);
		}
		for (auto &info : fs.GlobFiles(location, context, FileGlobOptions::ALLOW_EMPTY)) {
			paths.push_back(info);
		}
	} else {
		if (!options.partition_columns.empty()) {
			throw InvalidInputException("%s: partition_columns requires a directory location, got file '%s'",
			                            func_name, location);
		}
		if (!fs.FileExists(location)) {
			throw IOException("%s: location '%s' does not exist", func_name, location);
		}
		paths.push_back(OpenFileInfo(location));
	}

	// Enumeration order is filesystem dependent; sort for reproducible scans
	std::sort(paths.begin(), paths.end(),
	          [](const OpenFileInfo &a, const OpenFileInfo &b) { return a.path < b.path; });

	vector<SourceFile> files;
	for (auto &info : paths) {
		auto &path = info.path;
		SourceFile file;
		file.path = path;
		file.byte_length = ListedFileSize(fs, info);
		file.compression = ResolveCompression(context, path, options.compression, func_name);
		if (is_directory && !options.partition_columns.empty()) {
			file.partition_values = ParsePartitionSegments(location, path, options.partition_columns, func_name);
		}
		files.push_back(std::move(file));
	}

	DUCKDB_LOG_DEBUG(context, "%s: resolved '%s' to %llu file(s)", func_name, location,
	                 static_cast<unsigned long long>(files.size()));
	return files;
}

} // namespace duckdb
