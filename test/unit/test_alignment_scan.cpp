#include "bioscan_test_helpers.hpp"

using namespace duckdb;

TEST_CASE("sam_scan decodes alignment fields", "[scan][sam]") {
	BioscanTestDatabase db;
	auto result = db.Query("SELECT name, flag, reference, start, \"end\", mapping_quality, mate_reference, sequence, "
	                       "quality_scores, tags FROM sam_scan('" +
	                       TestDataPath("sam/test.sam") + "')");
	REQUIRE_NO_FAIL(result);
	REQUIRE(result->RowCount() == 4);

	// Mate "=" resolves to the record's own reference
	REQUIRE(result->GetValue(0, 0) == Value("ref1_grp1_p001"));
	REQUIRE(result->GetValue(1, 0) == Value::INTEGER(99));
	REQUIRE(result->GetValue(2, 0) == Value("ref1"));
	REQUIRE(result->GetValue(3, 0) == Value::BIGINT(1));
	REQUIRE(result->GetValue(4, 0) == Value::BIGINT(10));
	REQUIRE(result->GetValue(5, 0) == Value("60"));
	REQUIRE(result->GetValue(6, 0) == Value("ref1"));
	REQUIRE(result->GetValue(7, 0) == Value("ACGTACGTAC"));
	REQUIRE(ListValue::GetChildren(result->GetValue(8, 0)).size() == 10);
	REQUIRE(result->GetValue(9, 0) == Value("NM:i:0\tMD:Z:10"));

	// Deletions extend the reference span; MAPQ 255 means unavailable
	REQUIRE(result->GetValue(4, 1) == Value::BIGINT(36));
	REQUIRE(result->GetValue(5, 1).IsNull());
	REQUIRE(ListValue::GetChildren(result->GetValue(8, 1)).empty());

	// Soft clips do not consume the reference
	REQUIRE(result->GetValue(4, 2) == Value::BIGINT(10));
	REQUIRE(result->GetValue(6, 2).IsNull());

	// Unmapped read
	REQUIRE(result->GetValue(2, 3).IsNull());
	REQUIRE(result->GetValue(3, 3).IsNull());
	REQUIRE(result->GetValue(4, 3).IsNull());
}

TEST_CASE("sam_scan parses tags into a list when requested", "[scan][sam]") {
	BioscanTestDatabase db;
	auto path = TestDataPath("sam/test.sam");
	auto result =
	    db.Query("SELECT tags FROM sam_scan('" + path + "', parse_tags := true) WHERE name = 'ref1_grp1_p002'");
	REQUIRE_NO_FAIL(result);
	auto tags = ListValue::GetChildren(result->GetValue(0, 0));
	REQUIRE(tags.size() == 2);
	auto &array_tag = StructValue::GetChildren(tags[1]);
	REQUIRE(array_tag[0] == Value("ZB"));
	REQUIRE(array_tag[1] == Value("[1,-2,3]"));

	// The session setting has the same effect
	REQUIRE_NO_FAIL(db.Query("SET bioscan_parse_sam_tags = true"));
	auto type_name = db.Scalar("SELECT typeof(tags) FROM sam_scan('" + path + "') LIMIT 1").ToString();
	REQUIRE(StringUtil::StartsWith(type_name, "STRUCT("));
	REQUIRE(StringUtil::EndsWith(type_name, "[]"));
}

TEST_CASE("bam_scan decodes binary records", "[scan][bam]") {
	BioscanTestDatabase db;
	auto path = TestDataPath("bam/test.bam");
	REQUIRE(db.Count("SELECT * FROM bam_scan('" + path + "')") == 61);
	REQUIRE(db.Count("SELECT * FROM bam_scan('" + path + "') WHERE reference = 'ref1'") == 40);
	REQUIRE(db.Count("SELECT * FROM bam_scan('" + path + "') WHERE reference IS NULL") == 1);

	auto result = db.Query("SELECT name, flag, start, \"end\", cigar, sequence, mapping_quality, tags FROM bam_scan('" +
	                       path + "') WHERE name = 'ref1_read002'");
	REQUIRE_NO_FAIL(result);
	REQUIRE(result->RowCount() == 1);
	REQUIRE(result->GetValue(1, 0) == Value::INTEGER(0));
	REQUIRE(result->GetValue(2, 0) == Value::BIGINT(2001));
	REQUIRE(result->GetValue(3, 0) == Value::BIGINT(2010));
	REQUIRE(result->GetValue(4, 0) == Value("10M"));
	REQUIRE(result->GetValue(5, 0) == Value("ACGTACGTAC"));
	REQUIRE(result->GetValue(6, 0) == Value("60"));
	REQUIRE(result->GetValue(7, 0) == Value("NM:i:0\tRG:Z:grp1"));
}

TEST_CASE("bam_scan honours a region argument", "[scan][bam]") {
	BioscanTestDatabase db;
	auto path = TestDataPath("bam/test.bam");
	// ref2 reads sit every 2 kbp: 1, 2001 and 4001 overlap 1-5000
	REQUIRE(db.Count("SELECT * FROM bam_scan('" + path + "', region := 'ref2:1-5000')") == 3);
	REQUIRE(db.Count("SELECT * FROM bam_scan('" + path + "', region := 'ref2')") == 20);
	REQUIRE(db.Count("SELECT * FROM bam_scan('" + path + "', region := 'chrUn')") == 0);
	REQUIRE(db.ErrorType("SELECT * FROM bam_scan('" + path + "', region := 'ref2:9-1')") ==
	        ExceptionType::INVALID_INPUT);
}

TEST_CASE("Alignment scans reject non-BAM input", "[scan][bam]") {
	BioscanTestDatabase db;
	auto result = db.Query("SELECT * FROM bam_scan('" + TestDataPath("vcf/index.vcf.gz") + "', 'bgzf')");
	REQUIRE_FAIL(result);
}

TEST_CASE("CIGAR operation lengths past 28 bits are rejected", "[scan][sam]") {
	BioscanTestDatabase db;
	REQUIRE(db.ErrorType("SELECT * FROM sam_scan('" + TestDataPath("sam_malformed/long_cigar.sam") + "')") ==
	        ExceptionType::INVALID_INPUT);
}

TEST_CASE("htslib alignment scans check the detected format", "[scan][bam][cram]") {
	BioscanTestDatabase db;
	auto bam = TestDataPath("bam/test.bam");
	REQUIRE(db.ErrorType("SELECT * FROM bam_scan('" + TestDataPath("vcf/small.vcf") + "')") ==
	        ExceptionType::INVALID_INPUT);

	auto result = db.Query("SELECT * FROM cram_scan('" + bam + "')");
	REQUIRE_FAIL(result);
	REQUIRE(result->GetErrorType() == ExceptionType::INVALID_INPUT);
	REQUIRE(StringUtil::Contains(result->GetError(), "not cram"));

	// Without a .crai beside the file the indexed variant cannot run
	REQUIRE(db.ErrorType("SELECT * FROM cram_indexed_scan('" + bam + "', 'ref1')") == ExceptionType::IO);
	REQUIRE(db.ErrorType("SELECT * FROM cram_scan('" + TestDataPath("bam/missing.cram") + "')") ==
	        ExceptionType::IO);
}

TEST_CASE("cram_scan shares the alignment schema", "[scan][cram]") {
	BioscanTestDatabase db;
	auto bam_columns = db.Query("DESCRIBE SELECT * FROM bam_scan('" + TestDataPath("bam/test.bam") + "')");
	REQUIRE_NO_FAIL(bam_columns);
	// Binding reads no header for alignments, so the schema is known without a CRAM file
	auto cram_columns = db.Query("DESCRIBE SELECT * FROM cram_scan('" + TestDataPath("bam/test.bam") + "')");
	REQUIRE_NO_FAIL(cram_columns);
	REQUIRE(bam_columns->RowCount() == cram_columns->RowCount());
	for (idx_t i = 0; i < bam_columns->RowCount(); i++) {
		REQUIRE(bam_columns->GetValue(0, i) == cram_columns->GetValue(0, i));
		REQUIRE(bam_columns->GetValue(1, i) == cram_columns->GetValue(1, i));
	}
}
