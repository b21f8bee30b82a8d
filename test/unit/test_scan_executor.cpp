#include "bioscan_test_helpers.hpp"

using namespace duckdb;

static string PartitionedBam() {
	return "bam_scan('" + TestDataPath("bam_partitioned") + "', partition_columns := ['sample'])";
}

static string PartitionedVcf() {
	return "vcf_scan('" + TestDataPath("vcf_partitioned") + "', partition_columns := ['region'])";
}

TEST_CASE("Partition columns are appended as VARCHAR", "[executor][partition]") {
	BioscanTestDatabase db;
	REQUIRE(db.Count("SELECT * FROM " + PartitionedBam()) == 122);

	auto result = db.Query("SELECT sample, COUNT(*) FROM " + PartitionedBam() + " GROUP BY sample ORDER BY sample");
	REQUIRE_NO_FAIL(result);
	REQUIRE(result->RowCount() == 2);
	REQUIRE(result->GetValue(0, 0) == Value("a"));
	REQUIRE(result->GetValue(1, 0) == Value::BIGINT(61));
	REQUIRE(result->GetValue(0, 1) == Value("b"));

	REQUIRE(db.Scalar("SELECT typeof(sample) FROM " + PartitionedBam() + " LIMIT 1") == Value("VARCHAR"));
	// Partition values can be projected on their own
	REQUIRE(db.Count("SELECT sample FROM " + PartitionedBam() + " WHERE sample = 'b'") == 61);
}

TEST_CASE("Partition filters prune files before they are opened", "[executor][partition]") {
	BioscanTestDatabase db;
	// region=west holds a malformed record; reading it fails the query
	REQUIRE_FAIL(db.Query("SELECT * FROM " + PartitionedVcf()));

	REQUIRE(db.Count("SELECT * FROM " + PartitionedVcf() + " WHERE region = 'east'") == 3);
	REQUIRE(db.Count("SELECT * FROM " + PartitionedVcf() + " WHERE region IN ('east', 'north')") == 3);
	REQUIRE(db.Count("SELECT * FROM " + PartitionedVcf() + " WHERE region = 'south'") == 0);
	REQUIRE(db.Count("SELECT * FROM " + PartitionedVcf() + " WHERE region = 'east' AND pos > 100") == 2);
}

TEST_CASE("The schema comes from the first file with a readable header", "[executor][partition]") {
	BioscanTestDatabase db;
	// region=central sorts first and has no #CHROM line; binding still succeeds
	auto result = db.Query("DESCRIBE SELECT * FROM " + PartitionedVcf());
	REQUIRE_NO_FAIL(result);
	REQUIRE(db.Count("SELECT * FROM " + PartitionedVcf() + " WHERE region = 'east'") == 3);
	REQUIRE(db.Scalar("SELECT info.GENE FROM " + PartitionedVcf() + " WHERE region = 'east' AND pos = 100") ==
	        Value("ABC"));

	// Reaching the unreadable file still fails
	auto central = db.Query("SELECT * FROM " + PartitionedVcf() + " WHERE region = 'central'");
	REQUIRE_FAIL(central);
	REQUIRE(central->GetErrorType() == ExceptionType::INVALID_INPUT);
	// With no readable header at all the first error is reported
	REQUIRE(db.ErrorType("SELECT * FROM vcf_scan('" + TestDataPath("vcf_partitioned/region=central/calls.vcf") +
	                     "')") == ExceptionType::INVALID_INPUT);
}

TEST_CASE("Partition layout errors", "[executor][partition]") {
	BioscanTestDatabase db;
	// Key does not match the declared column
	REQUIRE(db.ErrorType("SELECT * FROM bam_scan('" + TestDataPath("bam_partitioned") +
	                     "', partition_columns := ['lane'])") == ExceptionType::INVALID_INPUT);
	// Too many declared columns for the directory depth
	REQUIRE(db.ErrorType("SELECT * FROM bam_scan('" + TestDataPath("bam_partitioned") +
	                     "', partition_columns := ['sample', 'lane'])") == ExceptionType::INVALID_INPUT);
	// Partition columns need a directory
	REQUIRE(db.ErrorType("SELECT * FROM bam_scan('" + TestDataPath("bam/test.bam") +
	                     "', partition_columns := ['sample'])") == ExceptionType::INVALID_INPUT);
}

TEST_CASE("Only projected columns are materialised", "[executor][projection]") {
	BioscanTestDatabase db;
	auto path = TestDataPath("vcf/index.vcf.gz");
	auto result = db.Query("SELECT pos, chrom FROM vcf_scan('" + path + "') ORDER BY chrom, pos LIMIT 2");
	REQUIRE_NO_FAIL(result);
	REQUIRE(result->ColumnCount() == 2);
	REQUIRE(result->GetValue(0, 0) == Value::BIGINT(1));
	REQUIRE(result->GetValue(1, 0) == Value("1"));
	REQUIRE(result->GetValue(0, 1) == Value::BIGINT(1001));

	REQUIRE(db.Count("SELECT 1 FROM vcf_scan('" + path + "')") == 621);
}

TEST_CASE("Batch size and file parallelism settings", "[executor][settings]") {
	BioscanTestDatabase db;
	auto path = TestDataPath("vcf/index.vcf");

	REQUIRE_NO_FAIL(db.Query("SET bioscan_batch_size = 7"));
	REQUIRE(db.Count("SELECT * FROM vcf_scan('" + path + "')") == 621);
	// Positions are 1000 * i + 1 for 400 records on chromosome 1 and 221 on chromosome 2
	REQUIRE(db.Scalar("SELECT SUM(pos) FROM vcf_scan('" + path + "')").GetValue<int64_t>() == 104110621);

	// Larger than a vector is clamped rather than rejected
	REQUIRE_NO_FAIL(db.Query("SET bioscan_batch_size = 1000000"));
	REQUIRE(db.Count("SELECT * FROM vcf_scan('" + path + "')") == 621);

	REQUIRE_NO_FAIL(db.Query("SET bioscan_batch_size = 0"));
	REQUIRE(db.ErrorType("SELECT * FROM vcf_scan('" + path + "')") == ExceptionType::INVALID_INPUT);
	REQUIRE_NO_FAIL(db.Query("RESET bioscan_batch_size"));

	REQUIRE_NO_FAIL(db.Query("SET bioscan_max_parallel_files = 1"));
	REQUIRE(db.Count("SELECT * FROM " + PartitionedBam()) == 122);
	REQUIRE_NO_FAIL(db.Query("SET threads = 4"));
	REQUIRE_NO_FAIL(db.Query("SET bioscan_max_parallel_files = 4"));
	REQUIRE(db.Count("SELECT * FROM fasta_scan('" + TestDataPath("fasta") + "')") == 9);
}

//! Every row of the query rendered as text, in the query's order.
static vector<string> RenderRows(BioscanTestDatabase &db, const string &sql) {
	auto result = db.Query(sql);
	REQUIRE_NO_FAIL(result);
	vector<string> rows;
	for (idx_t row = 0; row < result->RowCount(); row++) {
		string text;
		for (idx_t col = 0; col < result->ColumnCount(); col++) {
			text += result->GetValue(col, row).ToString() + "\t";
		}
		rows.push_back(text);
	}
	return rows;
}

TEST_CASE("Scans return the same rows whatever the file parallelism", "[executor][settings]") {
	BioscanTestDatabase db;
	REQUIRE_NO_FAIL(db.Query("SET threads = 4"));
	auto bam_sql = "SELECT * FROM " + PartitionedBam() + " ORDER BY sample, reference NULLS LAST, start, name";
	auto fasta_sql = "SELECT * FROM fasta_scan('" + TestDataPath("fasta") + "') ORDER BY ALL";

	REQUIRE_NO_FAIL(db.Query("SET bioscan_max_parallel_files = 1"));
	auto serial_bam = RenderRows(db, bam_sql);
	auto serial_fasta = RenderRows(db, fasta_sql);
	REQUIRE(serial_bam.size() == 122);
	REQUIRE(serial_fasta.size() == 9);

	REQUIRE_NO_FAIL(db.Query("SET bioscan_max_parallel_files = 4"));
	auto parallel_bam = RenderRows(db, bam_sql);
	auto parallel_fasta = RenderRows(db, fasta_sql);
	REQUIRE(parallel_bam.size() == serial_bam.size());
	for (idx_t i = 0; i < serial_bam.size(); i++) {
		REQUIRE(parallel_bam[i] == serial_bam[i]);
	}
	REQUIRE(parallel_fasta.size() == serial_fasta.size());
	for (idx_t i = 0; i < serial_fasta.size(); i++) {
		REQUIRE(parallel_fasta[i] == serial_fasta[i]);
	}
}

TEST_CASE("Filters on reference columns become region hints", "[executor][region]") {
	BioscanTestDatabase db;
	auto indexed = TestDataPath("vcf/index.vcf.gz");
	REQUIRE(db.Count("SELECT * FROM vcf_scan('" + indexed + "') WHERE chrom = '2'") == 221);
	REQUIRE(db.Count("SELECT * FROM vcf_scan('" + indexed + "') WHERE chrom = '2' AND pos < 5000") == 5);
	REQUIRE(db.Count("SELECT * FROM vcf_scan('" + indexed + "') WHERE region_match(chrom, pos, '1:1-5000')") == 5);
	REQUIRE(db.Count("SELECT * FROM bam_scan('" + TestDataPath("bam/test.bam") + "') WHERE reference = 'ref2'") ==
	        20);
	REQUIRE(db.Count("SELECT * FROM gff_scan('" + TestDataPath("gff/test.gff3") + "') WHERE seqname = 'ctg123'") ==
	        3);
	// An explicit region wins over the hint and the filter still applies
	REQUIRE(db.Count("SELECT * FROM vcf_scan('" + indexed + "', region := '1:1-5000') WHERE chrom = '2'") == 0);
}

TEST_CASE("Bind-time argument errors", "[executor]") {
	BioscanTestDatabase db;
	REQUIRE(db.ErrorType("SELECT * FROM vcf_scan(NULL)") == ExceptionType::BINDER);
	REQUIRE(db.ErrorType("SELECT * FROM vcf_scan('" + TestDataPath("vcf/missing.vcf") + "')") == ExceptionType::IO);
	REQUIRE(db.ErrorType("SELECT * FROM fasta_scan('" + TestDataPath("fasta/test.fasta") + "', region := 'seq1')") ==
	        ExceptionType::INVALID_INPUT);
	REQUIRE(db.ErrorType("SELECT * FROM fasta_scan('" + TestDataPath("fasta/test.fasta.gz") + "', 'lz4')") ==
	        ExceptionType::INVALID_INPUT);
	// FCS columns come from the file, and the directory holds no .fcs file
	REQUIRE(db.ErrorType("SELECT * FROM fcs_scan('" + TestDataPath("fasta") + "')") == ExceptionType::BINDER);
	// Fixed-layout formats bind without files and scan nothing
	REQUIRE(db.Count("SELECT * FROM sdf_scan('" + TestDataPath("fasta") + "')") == 0);
}

TEST_CASE("read_bio dispatches on format", "[executor][read_bio]") {
	BioscanTestDatabase db;
	REQUIRE(db.Count("SELECT * FROM read_bio('" + TestDataPath("vcf/small.vcf") + "')") == 3);
	REQUIRE(db.Count("SELECT * FROM read_bio('" + TestDataPath("fasta/test.fasta.gz") + "')") == 3);
	REQUIRE(db.Count("SELECT * FROM read_bio('" + TestDataPath("bam/test.bam") + "')") == 61);
	REQUIRE(db.Count("SELECT * FROM read_bio('" + TestDataPath("fasta") + "', format := 'fa')") == 9);
	REQUIRE(db.Count("SELECT * FROM read_bio('" + TestDataPath("hmmdomtab/test.domtblout") + "')") == 2);

	REQUIRE(db.ErrorType("SELECT * FROM read_bio('" + TestDataPath("vcf/small.vcf") + "', format := 'parquet')") ==
	        ExceptionType::INVALID_INPUT);
	REQUIRE(db.ErrorType("SELECT * FROM read_bio('" + TestDataPath("vcf/index.vcf.gz.tbi") + "')") ==
	        ExceptionType::BINDER);
}
