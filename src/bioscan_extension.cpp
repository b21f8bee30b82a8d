#define DUCKDB_EXTENSION_MAIN

#include "bioscan_extension.hpp"
#include "bio_functions.hpp"
#include "bio_scan.hpp"
#include "duckdb.hpp"
#include "duckdb/main/config.hpp"

namespace duckdb {

static void RegisterSettings(ExtensionLoader &loader) {
	auto &config = DBConfig::GetConfig(loader.GetDatabaseInstance());
	config.AddExtensionOption("bioscan_parse_vcf_info", "Parse the VCF INFO column into a STRUCT (default true)",
	                          LogicalType::BOOLEAN, Value::BOOLEAN(true));
	config.AddExtensionOption("bioscan_parse_vcf_formats",
	                          "Parse VCF FORMAT and sample columns into a LIST of STRUCT (default true)",
	                          LogicalType::BOOLEAN, Value::BOOLEAN(true));
	config.AddExtensionOption("bioscan_parse_sam_tags", "Parse SAM/BAM optional tags into a LIST of STRUCT (default false)",
	                          LogicalType::BOOLEAN, Value::BOOLEAN(false));
	config.AddExtensionOption("bioscan_batch_size", "Maximum rows per scanned batch (default 2048)",
	                          LogicalType::UBIGINT, Value::UBIGINT(2048));
	config.AddExtensionOption("bioscan_max_parallel_files", "Maximum number of files scanned concurrently (default 8)",
	                          LogicalType::UBIGINT, Value::UBIGINT(8));
	config.AddExtensionOption("bioscan_fasta_sequence_data_type",
	                          "Type of the FASTA sequence column: utf8, large_utf8, integer_encode_dna or "
	                          "integer_encode_protein (default utf8)",
	                          LogicalType::VARCHAR, Value("utf8"));
}

static void LoadInternal(ExtensionLoader &loader) {
	RegisterSettings(loader);
	RegisterBioScanFunctions(loader);
	RegisterBioFunctions(loader);
}

void BioscanExtension::Load(ExtensionLoader &loader) {
	LoadInternal(loader);
}
std::string BioscanExtension::Name() {
	return "bioscan";
}

std::string BioscanExtension::Version() const {
#ifdef EXT_VERSION_BIOSCAN
	return EXT_VERSION_BIOSCAN;
#else
	return "";
#endif
}

} // namespace duckdb

extern "C" {

DUCKDB_CPP_EXTENSION_ENTRY(bioscan, loader) {
	duckdb::LoadInternal(loader);
}
}
