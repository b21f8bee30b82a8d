#include "bioscan_test_helpers.hpp"

using namespace duckdb;

TEST_CASE("fasta_scan reads multi-line records", "[scan][fasta]") {
	BioscanTestDatabase db;
	auto result = db.Query("SELECT id, description, sequence FROM fasta_scan('" + TestDataPath("fasta/test.fasta") +
	                       "') ORDER BY id");
	REQUIRE_NO_FAIL(result);
	REQUIRE(result->RowCount() == 3);
	REQUIRE(result->GetValue(0, 0) == Value("seq1"));
	REQUIRE(result->GetValue(1, 0) == Value("first sequence"));
	REQUIRE(result->GetValue(2, 0) == Value("ACGTACGTACGTACGT"));
	REQUIRE(result->GetValue(1, 1).IsNull());
	REQUIRE(result->GetValue(2, 1) == Value("NNNNACGT"));
	REQUIRE(result->GetValue(1, 2) == Value("third record"));
	// Sequence case is preserved
	REQUIRE(result->GetValue(2, 2) == Value("acgtGGCC"));
}

TEST_CASE("fasta_scan decodes compressed inputs", "[scan][fasta]") {
	BioscanTestDatabase db;
	for (auto suffix : {".gz", ".zst"}) {
		auto path = TestDataPath(string("fasta/test.fasta") + suffix);
		REQUIRE(db.Count("SELECT * FROM fasta_scan('" + path + "')") == 3);
	}
	// Explicit compression as the second positional argument
	REQUIRE(db.Count("SELECT * FROM fasta_scan('" + TestDataPath("fasta/test.fasta.gz") + "', 'gzip')") == 3);
	REQUIRE(db.Count("SELECT * FROM fasta_scan('" + TestDataPath("fasta/test.fasta.zst") +
	                 "', compression := 'zstd')") == 3);
}

TEST_CASE("fasta_scan over a directory unions every file", "[scan][fasta]") {
	BioscanTestDatabase db;
	// The plain, gzip and zstd copies of the same three records
	REQUIRE(db.Count("SELECT * FROM fasta_scan('" + TestDataPath("fasta") + "')") == 9);
	REQUIRE(db.Scalar("SELECT COUNT(DISTINCT id) FROM fasta_scan('" + TestDataPath("fasta") + "')") == Value::BIGINT(3));
}

static vector<int8_t> TinyIntList(const Value &value) {
	vector<int8_t> result;
	for (auto &child : ListValue::GetChildren(value)) {
		result.push_back(child.GetValue<int8_t>());
	}
	return result;
}

TEST_CASE("fasta_scan integer-encodes sequences on request", "[scan][fasta]") {
	BioscanTestDatabase db;
	auto path = TestDataPath("fasta/test.fasta");
	auto result = db.Query("SELECT sequence, typeof(sequence) FROM fasta_scan('" + path +
	                       "', sequence_data_type := 'integer_encode_dna') ORDER BY id");
	REQUIRE_NO_FAIL(result);
	REQUIRE(result->RowCount() == 3);
	REQUIRE(result->GetValue(1, 0) == Value("TINYINT[]"));
	REQUIRE(TinyIntList(result->GetValue(0, 1)) == vector<int8_t>({5, 5, 5, 5, 1, 2, 3, 4}));
	// Lower case residues share the upper case codes
	REQUIRE(TinyIntList(result->GetValue(0, 2)) == vector<int8_t>({1, 2, 3, 4, 3, 3, 2, 2}));

	auto protein = db.Scalar("SELECT sequence FROM fasta_scan('" + path +
	                         "', sequence_data_type := 'integer_encode_protein') WHERE id = 'seq3'");
	REQUIRE(TinyIntList(protein) == vector<int8_t>({1, 2, 6, 17, 6, 6, 2, 2}));

	// The text types keep VARCHAR
	REQUIRE(db.Scalar("SELECT typeof(sequence) FROM fasta_scan('" + path +
	                  "', sequence_data_type := 'large_utf8') LIMIT 1") == Value("VARCHAR"));
	REQUIRE(db.ErrorType("SELECT * FROM fasta_scan('" + path + "', sequence_data_type := 'binary')") ==
	        ExceptionType::INVALID_INPUT);
}

TEST_CASE("The FASTA sequence type follows the session setting", "[scan][fasta]") {
	BioscanTestDatabase db;
	auto path = TestDataPath("fasta/test.fasta");
	REQUIRE_NO_FAIL(db.Query("SET bioscan_fasta_sequence_data_type = 'integer_encode_dna'"));
	REQUIRE(db.Scalar("SELECT typeof(sequence) FROM fasta_scan('" + path + "') LIMIT 1") == Value("TINYINT[]"));
	// The named parameter wins over the setting
	REQUIRE(db.Scalar("SELECT typeof(sequence) FROM fasta_scan('" + path + "', sequence_data_type := 'utf8') LIMIT 1") ==
	        Value("VARCHAR"));
}

TEST_CASE("Residues outside the alphabet fail DNA encoding", "[scan][fasta]") {
	BioscanTestDatabase db;
	auto path = TestDataPath("fasta_protein/protein.fasta");
	auto protein = db.Scalar("SELECT sequence FROM fasta_scan('" + path +
	                         "', sequence_data_type := 'integer_encode_protein')");
	REQUIRE(TinyIntList(protein) == vector<int8_t>({11, 9, 18, 26}));

	auto result = db.Query("SELECT * FROM fasta_scan('" + path + "', sequence_data_type := 'integer_encode_dna')");
	REQUIRE_FAIL(result);
	REQUIRE(result->GetErrorType() == ExceptionType::INVALID_INPUT);
	REQUIRE(StringUtil::Contains(result->GetError(), "as DNA"));
}

TEST_CASE("fastq_scan decodes quality scores", "[scan][fastq]") {
	BioscanTestDatabase db;
	auto result = db.Query("SELECT name, description, sequence, quality_scores FROM fastq_scan('" +
	                       TestDataPath("fastq/test.fastq") + "') ORDER BY name");
	REQUIRE_NO_FAIL(result);
	REQUIRE(result->RowCount() == 2);
	REQUIRE(result->GetValue(0, 0) == Value("read1"));
	REQUIRE(result->GetValue(1, 0) == Value("sample=1"));
	REQUIRE(result->GetValue(2, 0) == Value("ACGTACGT"));

	auto scores = ListValue::GetChildren(result->GetValue(3, 0));
	REQUIRE(scores.size() == 8);
	REQUIRE(scores[0] == Value::INTEGER(40));

	REQUIRE(result->GetValue(1, 1).IsNull());
	auto low = ListValue::GetChildren(result->GetValue(3, 1));
	REQUIRE(low.size() == 5);
	REQUIRE(low[0] == Value::INTEGER(0));
	REQUIRE(low[1] == Value::INTEGER(2));
	REQUIRE(low[2] == Value::INTEGER(10));
	REQUIRE(low[3] == Value::INTEGER(20));
	REQUIRE(low[4] == Value::INTEGER(30));
}

TEST_CASE("fastq quality scores round-trip through the scalar codec", "[scan][fastq]") {
	BioscanTestDatabase db;
	REQUIRE(db.Count("SELECT * FROM fastq_scan('" + TestDataPath("fastq/test.fastq.gz") +
	                 "') WHERE quality_scores_to_string(quality_scores) IN ('IIIIIIII', '!#+5?')") == 2);
}
