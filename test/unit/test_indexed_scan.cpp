#include "bioscan_test_helpers.hpp"
#include "bio_index.hpp"

using namespace duckdb;

TEST_CASE("Tabix index lists its references and answers region queries", "[index][vcf]") {
	auto data_path = TestDataPath("vcf/index.vcf.gz");
	auto index = LoadTabixIndex(data_path, TestDataPath("vcf/index.vcf.gz.tbi"), "vcf_indexed_scan");
	auto names = index->ReferenceNames();
	REQUIRE(names.size() == 2);
	REQUIRE(names[0] == "1");
	REQUIRE(names[1] == "2");

	REQUIRE(index->Query(ParseRegion("1:1-5000", "test").interval, "vcf_indexed_scan") != nullptr);
	REQUIRE(index->Query(ParseRegion("chrUn:1-10", "test").interval, "vcf_indexed_scan") == nullptr);

	// A BAI file is not a tabix index
	REQUIRE_THROWS_AS(LoadTabixIndex(data_path, TestDataPath("bam/test.bam.bai"), "vcf_indexed_scan"), IOException);
}

TEST_CASE("Tabix region streams yield newline terminated records", "[index][vcf]") {
	auto data_path = TestDataPath("vcf/index.vcf.gz");
	auto index_path = TestDataPath("vcf/index.vcf.gz.tbi");
	BufferedByteReader reader(make_uniq<TabixRegionStream>(
	    data_path, LoadTabixIndex(data_path, index_path, "test"), ParseRegion("2:1-2001", "test").interval, "test"));
	string line;
	REQUIRE(reader.ReadLine(line));
	REQUIRE(StringUtil::StartsWith(line, "2\t1\t"));
	REQUIRE(reader.ReadLine(line));
	REQUIRE(StringUtil::StartsWith(line, "2\t1001\t"));
	REQUIRE(reader.ReadLine(line));
	REQUIRE(StringUtil::StartsWith(line, "2\t2001\t"));
	REQUIRE_FALSE(reader.ReadLine(line));

	TabixRegionStream unknown(data_path, LoadTabixIndex(data_path, index_path, "test"),
	                          ParseRegion("chrUn", "test").interval, "test");
	REQUIRE_FALSE(unknown.HasReference());

	// Plain text cannot be read through an index
	REQUIRE_THROWS_AS(TabixRegionStream(TestDataPath("vcf/index.vcf"), LoadTabixIndex(data_path, index_path, "test"),
	                                    ParseRegion("1", "test").interval, "test"),
	                  InvalidInputException);
}

TEST_CASE("Companion index discovery", "[index]") {
	BioscanTestDatabase db;
	auto &fs = FileSystem::GetFileSystem(db.Context());
	REQUIRE(FindTabixIndex(fs, TestDataPath("vcf/index.vcf.gz")) == TestDataPath("vcf/index.vcf.gz.tbi"));
	REQUIRE(FindTabixIndex(fs, TestDataPath("vcf/small.vcf")).empty());
	REQUIRE(FindAlignmentIndex(fs, TestDataPath("bam/test.bam"), BioFormat::BAM) == TestDataPath("bam/test.bam.bai"));
	REQUIRE(FindAlignmentIndex(fs, TestDataPath("bam_partitioned/sample=a/test.bam"), BioFormat::BAM).empty());
	// CRAM looks for .crai only
	REQUIRE(FindAlignmentIndex(fs, TestDataPath("bam/test.bam"), BioFormat::CRAM).empty());
}

TEST_CASE("vcf_indexed_scan returns only overlapping records", "[scan][index][vcf]") {
	BioscanTestDatabase db;
	auto path = TestDataPath("vcf/index.vcf.gz");
	REQUIRE(db.Count("SELECT * FROM vcf_indexed_scan('" + path + "', '1:1-5000')") == 5);
	REQUIRE(db.Count("SELECT * FROM vcf_indexed_scan('" + path + "', '2')") == 221);
	REQUIRE(db.Count("SELECT * FROM vcf_indexed_scan('" + path + "', '2:220001-220001')") == 1);
	REQUIRE(db.Count("SELECT * FROM vcf_indexed_scan('" + path + "', region := '1:350000-360000')") == 10);
	REQUIRE(db.Count("SELECT * FROM vcf_indexed_scan('" + path + "', '3')") == 0);

	// Same rows as the sequential filter
	REQUIRE(db.Scalar("SELECT SUM(pos) FROM vcf_indexed_scan('" + path + "', '1:10000-20000')") ==
	        db.Scalar("SELECT SUM(pos) FROM vcf_scan('" + TestDataPath("vcf/index.vcf") +
	                  "') WHERE chrom = '1' AND pos BETWEEN 10000 AND 20000"));
}

TEST_CASE("vcf_scan uses a companion index for bgzf input", "[scan][index][vcf]") {
	BioscanTestDatabase db;
	REQUIRE(db.Count("SELECT * FROM vcf_scan('" + TestDataPath("vcf/index.vcf.gz") + "', region := '1:1-5000')") ==
	        5);
}

TEST_CASE("bam_indexed_scan returns only overlapping reads", "[scan][index][bam]") {
	BioscanTestDatabase db;
	auto path = TestDataPath("bam/test.bam");
	auto result = db.Query("SELECT name FROM bam_indexed_scan('" + path + "', 'ref1:1001-3000') ORDER BY name");
	REQUIRE_NO_FAIL(result);
	REQUIRE(result->RowCount() == 2);
	REQUIRE(result->GetValue(0, 0) == Value("ref1_read001"));
	REQUIRE(result->GetValue(0, 1) == Value("ref1_read002"));

	// Read ref1_read000 covers 1-10, so a region ending at 5 still overlaps it
	REQUIRE(db.Count("SELECT * FROM bam_indexed_scan('" + path + "', 'ref1:5-5')") == 1);
	REQUIRE(db.Count("SELECT * FROM bam_indexed_scan('" + path + "', 'ref2')") == 20);
}

TEST_CASE("Indexed scans require a region and an index", "[scan][index]") {
	BioscanTestDatabase db;
	REQUIRE(db.ErrorType("SELECT * FROM vcf_indexed_scan('" + TestDataPath("vcf/index.vcf.gz") + "')") ==
	        ExceptionType::BINDER);
	REQUIRE(db.ErrorType("SELECT * FROM vcf_indexed_scan('" + TestDataPath("vcf/index.vcf.gz") + "', '')") ==
	        ExceptionType::BINDER);
	REQUIRE(db.ErrorType("SELECT * FROM vcf_indexed_scan('" + TestDataPath("vcf/index.vcf.gz") + "', '1:x-')") ==
	        ExceptionType::INVALID_INPUT);

	// No .tbi beside the plain file
	REQUIRE(db.ErrorType("SELECT * FROM vcf_indexed_scan('" + TestDataPath("vcf/index.vcf") + "', '1:1-10')") ==
	        ExceptionType::IO);
	// The partitioned copies carry no .bai
	REQUIRE(db.ErrorType("SELECT * FROM bam_indexed_scan('" + TestDataPath("bam_partitioned/sample=a/test.bam") +
	                     "', 'ref1')") == ExceptionType::IO);
	// A .bai that htslib cannot load
	REQUIRE(db.ErrorType("SELECT * FROM bam_indexed_scan('" + TestDataPath("bam_bad_index/test.bam") +
	                     "', 'ref1')") == ExceptionType::IO);
	// References missing from the index select nothing
	REQUIRE(db.Count("SELECT * FROM bam_indexed_scan('" + TestDataPath("bam/test.bam") + "', 'chrUn')") == 0);
}

TEST_CASE("Sequential BAM region filtering matches the indexed read", "[scan][index][bam]") {
	BioscanTestDatabase db;
	auto path = TestDataPath("bam/test.bam");
	REQUIRE(db.Scalar("SELECT string_agg(name, ',' ORDER BY name) FROM bam_indexed_scan('" + path +
	                  "', 'ref1:10001-15000')") ==
	        db.Scalar("SELECT string_agg(name, ',' ORDER BY name) FROM bam_scan('" + path +
	                  "') WHERE reference = 'ref1' AND \"end\" >= 10001 AND start <= 15000"));
}
