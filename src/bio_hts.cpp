#include "bio_hts.hpp"

namespace duckdb {

HtsFilePtr OpenHtsFile(const string &path, const string &func_name) {
	HtsFilePtr fp(hts_open(path.c_str(), "r"));
	if (!fp) {
		throw IOException("%s: failed to open '%s'", func_name, path);
	}
	return fp;
}

htsExactFormat HtsFormatOf(htsFile *fp) {
	auto format = hts_get_format(fp);
	return format ? format->format : unknown_format;
}

} // namespace duckdb
