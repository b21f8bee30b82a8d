#pragma once

#include "duckdb.hpp"

#include <htslib/bgzf.h>
#include <htslib/hts.h>
#include <htslib/kstring.h>
#include <htslib/sam.h>
#include <htslib/tbx.h>
#include <htslib/vcf.h>

#include <memory>

namespace duckdb {

// ---------------------------------------------------------------------------
// htslib handles
// ---------------------------------------------------------------------------

struct HtsFileDeleter {
	void operator()(htsFile *fp) const {
		if (fp) {
			hts_close(fp);
		}
	}
};

struct SamHeaderDeleter {
	void operator()(sam_hdr_t *hdr) const {
		if (hdr) {
			sam_hdr_destroy(hdr);
		}
	}
};

struct BamRecordDeleter {
	void operator()(bam1_t *aln) const {
		if (aln) {
			bam_destroy1(aln);
		}
	}
};

struct BcfHeaderDeleter {
	void operator()(bcf_hdr_t *hdr) const {
		if (hdr) {
			bcf_hdr_destroy(hdr);
		}
	}
};

struct BcfRecordDeleter {
	void operator()(bcf1_t *rec) const {
		if (rec) {
			bcf_destroy(rec);
		}
	}
};

struct HtsIndexDeleter {
	void operator()(hts_idx_t *idx) const {
		if (idx) {
			hts_idx_destroy(idx);
		}
	}
};

struct TabixDeleter {
	void operator()(tbx_t *tbx) const {
		if (tbx) {
			tbx_destroy(tbx);
		}
	}
};

struct HtsIteratorDeleter {
	void operator()(hts_itr_t *itr) const {
		if (itr) {
			hts_itr_destroy(itr);
		}
	}
};

struct BgzfDeleter {
	void operator()(BGZF *fp) const {
		if (fp) {
			bgzf_close(fp);
		}
	}
};

using HtsFilePtr = std::unique_ptr<htsFile, HtsFileDeleter>;
using SamHeaderPtr = std::unique_ptr<sam_hdr_t, SamHeaderDeleter>;
using BamRecordPtr = std::unique_ptr<bam1_t, BamRecordDeleter>;
using BcfHeaderPtr = std::unique_ptr<bcf_hdr_t, BcfHeaderDeleter>;
using BcfRecordPtr = std::unique_ptr<bcf1_t, BcfRecordDeleter>;
using HtsIndexPtr = std::unique_ptr<hts_idx_t, HtsIndexDeleter>;
using TabixPtr = std::unique_ptr<tbx_t, TabixDeleter>;
using HtsIteratorPtr = std::unique_ptr<hts_itr_t, HtsIteratorDeleter>;
using BgzfPtr = std::unique_ptr<BGZF, BgzfDeleter>;

//! kstring_t that frees its buffer.
struct KString {
	KString() {
		value.l = 0;
		value.m = 0;
		value.s = nullptr;
	}
	~KString() {
		free(value.s);
	}
	KString(const KString &) = delete;
	KString &operator=(const KString &) = delete;

	string ToString() const {
		return value.s ? string(value.s, value.l) : string();
	}

	kstring_t value;
};

//! Open a file through htslib for reading. Throws IOException naming
//! `func_name` when the file cannot be opened.
HtsFilePtr OpenHtsFile(const string &path, const string &func_name);

//! htslib format of an open file (bam, cram, bcf, vcf, sam, ...).
htsExactFormat HtsFormatOf(htsFile *fp);

} // namespace duckdb
