#include "bioscan_test_helpers.hpp"
#include "bio_location.hpp"

#include "duckdb/common/file_system.hpp"

using namespace duckdb;

TEST_CASE("Partition segments parse key=value and bare values", "[location]") {
	vector<string> columns = {"sample", "lane"};
	auto values = ParsePartitionSegments("/data/root/", "/data/root/sample=a/L001/x.bam", columns, "test");
	REQUIRE(values == vector<string>({"a", "L001"}));

	// Keys are matched case-insensitively against the declared column
	values = ParsePartitionSegments("/data/root", "/data/root/SAMPLE=b/lane=2/x.bam", columns, "test");
	REQUIRE(values == vector<string>({"b", "2"}));

	// An empty value after '=' is kept as an empty string
	values = ParsePartitionSegments("/data/root", "/data/root/sample=/lane=2/x.bam", columns, "test");
	REQUIRE(values[0].empty());
}

TEST_CASE("Partition layout mismatches are rejected", "[location]") {
	vector<string> columns = {"sample"};
	REQUIRE_THROWS_AS(ParsePartitionSegments("/root", "/root/x.bam", columns, "test"), InvalidInputException);
	REQUIRE_THROWS_AS(ParsePartitionSegments("/root", "/root/a/b/x.bam", columns, "test"), InvalidInputException);
	REQUIRE_THROWS_AS(ParsePartitionSegments("/root", "/root/lane=1/x.bam", columns, "test"),
	                  InvalidInputException);
}

TEST_CASE("Directories are listed recursively and filtered by extension", "[location]") {
	BioscanTestDatabase db;
	LocationOptions options;
	options.extensions = {".vcf"};

	auto files = ResolveLocation(db.Context(), TestDataPath("vcf"), options, "vcf_scan");
	// index.vcf, index.vcf.gz, small.vcf, small.vcf.zst; the .tbi is skipped
	REQUIRE(files.size() == 4);
	for (idx_t i = 1; i < files.size(); i++) {
		REQUIRE(files[i - 1].path < files[i].path);
	}
	for (auto &file : files) {
		REQUIRE(file.partition_values.empty());
		if (StringUtil::EndsWith(file.path, ".gz")) {
			REQUIRE(file.compression == BioCompression::GZIP);
		} else if (StringUtil::EndsWith(file.path, ".zst")) {
			REQUIRE(file.compression == BioCompression::ZSTD);
		} else {
			REQUIRE(file.compression == BioCompression::NONE);
		}
	}
}

TEST_CASE("Partitioned directories carry values per file", "[location]") {
	BioscanTestDatabase db;
	LocationOptions options;
	options.extensions = {".bam"};
	options.partition_columns = {"sample"};

	auto files = ResolveLocation(db.Context(), TestDataPath("bam_partitioned/"), options, "bam_scan");
	REQUIRE(files.size() == 2);
	REQUIRE(files[0].partition_values == vector<string>({"a"}));
	REQUIRE(files[1].partition_values == vector<string>({"b"}));
	// BAM block compression belongs to htslib, not the byte stream layer
	REQUIRE(files[0].compression == BioCompression::NONE);
}

TEST_CASE("Resolved files carry their byte length", "[location]") {
	BioscanTestDatabase db;
	auto &fs = FileSystem::GetFileSystem(db.Context());
	LocationOptions options;
	options.extensions = {".bam"};

	auto listed = ResolveLocation(db.Context(), TestDataPath("bam_partitioned"), options, "bam_scan");
	REQUIRE(listed.size() == 2);
	for (auto &file : listed) {
		auto handle = fs.OpenFile(file.path, FileFlags::FILE_FLAGS_READ);
		REQUIRE(file.byte_length == handle->GetFileSize());
		REQUIRE(file.byte_length > 0);
	}

	auto single = ResolveLocation(db.Context(), TestDataPath("fasta/test.fasta"), LocationOptions(), "fasta_scan");
	REQUIRE(single.size() == 1);
	REQUIRE(single[0].byte_length == 82);
}

TEST_CASE("Explicit compression wins over the extension", "[location]") {
	BioscanTestDatabase db;
	LocationOptions options;
	options.compression = BioCompression::NONE;
	auto files = ResolveLocation(db.Context(), TestDataPath("fasta/test.fasta.gz"), options, "fasta_scan");
	REQUIRE(files.size() == 1);
	REQUIRE(files[0].compression == BioCompression::NONE);
}

TEST_CASE("Single files, globs and missing paths", "[location]") {
	BioscanTestDatabase db;
	LocationOptions options;

	auto files = ResolveLocation(db.Context(), TestDataPath("fasta/test.fasta*"), options, "fasta_scan");
	REQUIRE(files.size() == 3);

	REQUIRE_THROWS_AS(ResolveLocation(db.Context(), TestDataPath("fasta/missing.fasta"), options, "fasta_scan"),
	                  IOException);
	REQUIRE_THROWS_AS(ResolveLocation(db.Context(), "", options, "fasta_scan"), InvalidInputException);

	options.partition_columns = {"sample"};
	REQUIRE_THROWS_AS(ResolveLocation(db.Context(), TestDataPath("fasta/test.fasta"), options, "fasta_scan"),
	                  InvalidInputException);
}
