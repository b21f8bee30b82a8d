#include "bioscan_test_helpers.hpp"

using namespace duckdb;

//! Value stored under `key` in a MAP value, NULL when absent.
static Value MapLookup(const Value &map, const string &key) {
	for (auto &entry : MapValue::GetChildren(map)) {
		auto &pair = StructValue::GetChildren(entry);
		if (pair[0].ToString() == key) {
			return pair[1];
		}
	}
	return Value();
}

TEST_CASE("bed_scan skips browser lines and pads missing columns", "[scan][bed]") {
	BioscanTestDatabase db;
	auto result = db.Query("SELECT reference_sequence_name, start, \"end\", name, score, strand, color, block_count, "
	                       "block_sizes FROM bed_scan('" +
	                       TestDataPath("bed/test.bed") + "')");
	REQUIRE_NO_FAIL(result);
	REQUIRE(result->RowCount() == 3);

	// BED3: positions are reported 1-based inclusive
	REQUIRE(result->GetValue(0, 0) == Value("chr1"));
	REQUIRE(result->GetValue(1, 0) == Value::BIGINT(1));
	REQUIRE(result->GetValue(2, 0) == Value::BIGINT(100));
	REQUIRE(result->GetValue(3, 0).IsNull());
	REQUIRE(result->GetValue(7, 0).IsNull());

	// BED12
	REQUIRE(result->GetValue(1, 1) == Value::BIGINT(151));
	REQUIRE(result->GetValue(3, 1) == Value("feature2"));
	REQUIRE(result->GetValue(4, 1) == Value::INTEGER(500));
	REQUIRE(result->GetValue(5, 1) == Value("+"));
	REQUIRE(result->GetValue(6, 1) == Value("255,0,0"));
	REQUIRE(result->GetValue(7, 1) == Value::BIGINT(2));
	REQUIRE(result->GetValue(8, 1) == Value("50,40,"));

	// BED6 with a missing score
	REQUIRE(result->GetValue(4, 2).IsNull());
	REQUIRE(result->GetValue(5, 2) == Value("-"));
	REQUIRE(result->GetValue(6, 2).IsNull());
}

TEST_CASE("bed_scan filters by region", "[scan][bed]") {
	BioscanTestDatabase db;
	auto path = TestDataPath("bed/test.bed");
	REQUIRE(db.Count("SELECT * FROM bed_scan('" + path + "', region := 'chr1:101-150')") == 0);
	REQUIRE(db.Count("SELECT * FROM bed_scan('" + path + "', region := 'chr1:100-151')") == 2);
	REQUIRE(db.Count("SELECT * FROM bed_scan('" + path + "', region := 'chr2')") == 1);
}

TEST_CASE("gff_scan parses GFF3 attributes and stops at ##FASTA", "[scan][gff]") {
	BioscanTestDatabase db;
	auto result = db.Query("SELECT seqname, source, type, start, \"end\", score, strand, phase, attributes FROM "
	                       "gff_scan('" +
	                       TestDataPath("gff/test.gff3") + "')");
	REQUIRE_NO_FAIL(result);
	REQUIRE(result->RowCount() == 3);

	REQUIRE(result->GetValue(0, 0) == Value("ctg123"));
	REQUIRE(result->GetValue(1, 0).IsNull());
	REQUIRE(result->GetValue(2, 0) == Value("gene"));
	REQUIRE(result->GetValue(3, 0) == Value::BIGINT(1000));
	REQUIRE(result->GetValue(4, 0) == Value::BIGINT(9000));
	REQUIRE(result->GetValue(5, 0).IsNull());
	REQUIRE(result->GetValue(7, 0).IsNull());
	auto name = ListValue::GetChildren(MapLookup(result->GetValue(8, 0), "Name"));
	REQUIRE(name.size() == 1);
	REQUIRE(name[0] == Value("EDEN"));

	// Comma-separated values split into a list, escapes decoded after splitting
	auto note = ListValue::GetChildren(MapLookup(result->GetValue(8, 1), "Note"));
	REQUIRE(note.size() == 2);
	REQUIRE(note[0] == Value("a;b"));
	REQUIRE(note[1] == Value("c"));

	// Repeated keys accumulate
	REQUIRE(result->GetValue(5, 2) == Value::FLOAT(0.5f));
	REQUIRE(result->GetValue(7, 2) == Value("0"));
	REQUIRE(ListValue::GetChildren(MapLookup(result->GetValue(8, 2), "Parent")).size() == 2);
}

TEST_CASE("gtf_scan parses quoted attributes and frames", "[scan][gtf]") {
	BioscanTestDatabase db;
	auto result = db.Query("SELECT type, score, frame, attributes FROM gtf_scan('" + TestDataPath("gtf/test.gtf") +
	                       "')");
	REQUIRE_NO_FAIL(result);
	REQUIRE(result->RowCount() == 2);

	auto gene_attributes = result->GetValue(3, 0);
	REQUIRE(MapLookup(gene_attributes, "gene_id") == Value("ENSG00000223972"));
	REQUIRE(MapLookup(gene_attributes, "tag") == Value("basic,CCDS"));
	REQUIRE(result->GetValue(2, 0).IsNull());

	REQUIRE(result->GetValue(1, 1) == Value::FLOAT(0.75f));
	REQUIRE(result->GetValue(2, 1) == Value::INTEGER(2));
	REQUIRE(MapLookup(result->GetValue(3, 1), "exon_number") == Value("1"));
}

TEST_CASE("genbank_scan reads header keywords, features and sequence", "[scan][genbank]") {
	BioscanTestDatabase db;
	auto result = db.Query("SELECT name, accession, version, definition, molecule_type, topology, division, date, "
	                       "keywords, length(sequence), features FROM genbank_scan('" +
	                       TestDataPath("genbank/test.gb") + "')");
	REQUIRE_NO_FAIL(result);
	REQUIRE(result->RowCount() == 2);

	REQUIRE(result->GetValue(0, 0) == Value("SCU49845"));
	REQUIRE(result->GetValue(1, 0) == Value("U49845"));
	REQUIRE(result->GetValue(2, 0) == Value("U49845.1  GI:1293613"));
	REQUIRE(result->GetValue(3, 0) == Value("Saccharomyces cerevisiae TCP1-beta gene, partial cds, and Axl2p "
	                                        "(AXL2) and Rev7p (REV7) genes, complete cds."));
	REQUIRE(result->GetValue(4, 0) == Value("DNA"));
	REQUIRE(result->GetValue(5, 0) == Value("linear"));
	REQUIRE(result->GetValue(6, 0) == Value("PLN"));
	REQUIRE(result->GetValue(7, 0) == Value("21-JUN-1999"));
	REQUIRE(result->GetValue(8, 0) == Value("."));
	REQUIRE(result->GetValue(9, 0) == Value::BIGINT(70));

	auto features = ListValue::GetChildren(result->GetValue(10, 0));
	REQUIRE(features.size() == 2);
	auto &cds = StructValue::GetChildren(features[1]);
	REQUIRE(cds[0] == Value("CDS"));
	REQUIRE(cds[1] == Value("<1..206"));
	REQUIRE(MapLookup(cds[2], "product") == Value("TCP1-beta"));
	REQUIRE(MapLookup(cds[2], "translation") ==
	        Value("SSIYNGISTSGLDLNNGTIADMRQLGIVESYKLKRAVVSSASEAAEVLLRVDNIIRARPRTANRQHM"));

	REQUIRE(result->GetValue(0, 1) == Value("AB000001"));
	REQUIRE(result->GetValue(5, 1) == Value("circular"));
	REQUIRE(result->GetValue(9, 1) == Value::BIGINT(20));
	REQUIRE(ListValue::GetChildren(result->GetValue(10, 1)).empty());
	REQUIRE(result->GetValue(8, 1).IsNull());
}

TEST_CASE("hmm_dom_tab_scan reads domain tables", "[scan][hmmdomtab]") {
	BioscanTestDatabase db;
	auto result = db.Query("SELECT target_name, target_accession, tlen, query_name, evalue, domain_number, ndom, "
	                       "env_to, accuracy, description FROM hmm_dom_tab_scan('" +
	                       TestDataPath("hmmdomtab/test.domtblout") + "')");
	REQUIRE_NO_FAIL(result);
	REQUIRE(result->RowCount() == 2);
	REQUIRE(result->GetValue(0, 0) == Value("KanNP_rdsDRAFT_3085"));
	REQUIRE(result->GetValue(2, 0) == Value::BIGINT(164));
	REQUIRE(result->GetValue(3, 0) == Value("PF00001.21"));
	REQUIRE(result->GetValue(4, 0) == Value::DOUBLE(1.5e-07));
	REQUIRE(result->GetValue(5, 0) == Value::INTEGER(1));
	REQUIRE(result->GetValue(6, 0) == Value::INTEGER(2));
	REQUIRE(result->GetValue(7, 0) == Value::BIGINT(95));
	REQUIRE(result->GetValue(8, 0) == Value::FLOAT(0.85f));
	// The free-text description keeps its spaces
	REQUIRE(result->GetValue(9, 0) == Value("hypothetical protein"));
	REQUIRE(result->GetValue(5, 1) == Value::INTEGER(2));
}
