#pragma once

#include "duckdb.hpp"
#include "bio_codec.hpp"
#include "bio_common.hpp"
#include "bio_format.hpp"
#include "bio_hts.hpp"

namespace duckdb {

//! Clamp a region end to what htslib iterators accept.
hts_pos_t HtsRegionEnd(const GenomicInterval &region);

//! A loaded tabix (.tbi or .csi) index of one bgzf text file.
class TabixIndex {
public:
	TabixIndex(string index_path, TabixPtr tbx);

	//! Iterator over records overlapping `region`. Returns nullptr when the
	//! index has no such reference.
	HtsIteratorPtr Query(const GenomicInterval &region, const string &func_name) const;

	//! Reference names in index order.
	vector<string> ReferenceNames() const;

	const string &GetPath() const {
		return index_path;
	}

	tbx_t *Handle() const {
		return tbx.get();
	}

private:
	string index_path;
	TabixPtr tbx;
};

//! Load the tabix index at `index_path` for `data_path`. Errors are
//! IOExceptions naming the index path.
unique_ptr<TabixIndex> LoadTabixIndex(const string &data_path, const string &index_path, const string &func_name);

//! The record lines of one tabix region, newline terminated, as a byte
//! stream for the text decoders.
class TabixRegionStream : public ByteStream {
public:
	TabixRegionStream(const string &data_path, unique_ptr<TabixIndex> index, const GenomicInterval &region,
	                  const string &func_name);

	//! False when the index does not know the region's reference.
	bool HasReference() const {
		return itr != nullptr;
	}

	idx_t Read(data_ptr_t buffer, idx_t nr_bytes) override;

	BioCompression Compression() const override {
		return BioCompression::BGZF;
	}

private:
	bool NextRecord();

	HtsFilePtr fp;
	unique_ptr<TabixIndex> index;
	HtsIteratorPtr itr;
	string func_name;
	KString line;
	string pending;
	idx_t pending_pos = 0;
	bool finished = false;
};

//! Locate the index beside `data_path`: `<file>.tbi` or `<file>.csi`.
//! Returns empty if absent.
string FindTabixIndex(FileSystem &fs, const string &data_path);

//! Locate an alignment index: `.bai` or `.csi` for BAM (also with the .bam
//! extension replaced), `.crai` for CRAM. Returns empty if absent.
string FindAlignmentIndex(FileSystem &fs, const string &data_path, BioFormat format);

} // namespace duckdb
