#pragma once

#include "duckdb.hpp"
#include "duckdb/common/file_system.hpp"

#include <cstdint>

namespace duckdb {

// ---------------------------------------------------------------------------
// Compression codecs
// ---------------------------------------------------------------------------

enum class BioCompression : uint8_t {
	AUTO, //!< Infer from the file extension
	NONE,
	GZIP, //!< Sequential gzip, including multi-member (and therefore bgzf) files
	ZSTD,
	BGZF //!< Block gzip, decoded by htslib
};

//! Parse a user-supplied compression name ("none", "gzip", "zstd", "bgzf", "auto").
BioCompression CompressionFromString(const string &name, const string &func_name);

string CompressionToString(BioCompression compression);

//! Infer the codec from a path's trailing extension. Returns NONE when the
//! extension carries no compression.
BioCompression InferCompressionFromPath(const string &path);

//! Strip a trailing compression extension (.gz, .bgz, .zst, ...).
string StripCompressionExtension(const string &path);

//! True if htslib recognises the file at `path` as bgzf compressed.
bool IsBgzfFile(const string &path);

// ---------------------------------------------------------------------------
// Byte streams
// ---------------------------------------------------------------------------

//! A decompressed, sequential view of one source file.
class ByteStream {
public:
	explicit ByteStream(string path_p) : path(std::move(path_p)) {
	}
	virtual ~ByteStream() = default;

	//! Read up to nr_bytes decompressed bytes. Returns 0 at end of stream.
	virtual idx_t Read(data_ptr_t buffer, idx_t nr_bytes) = 0;

	virtual BioCompression Compression() const = 0;

	const string &GetPath() const {
		return path;
	}

protected:
	string path;
};

//! Open `path` through DuckDB's VFS and wrap it in the requested codec.
//! AUTO is resolved from the extension. bgzf is opened by htslib instead.
unique_ptr<ByteStream> OpenByteStream(ClientContext &context, const string &path, BioCompression compression);

//! Wrap an already open handle.
unique_ptr<ByteStream> OpenByteStream(unique_ptr<FileHandle> handle, const string &path, BioCompression compression);

//! Inflate a complete zlib-wrapped buffer (mzML binary arrays). Throws
//! IOException naming `what` on corrupt or truncated input.
string InflateZlibBuffer(const_data_ptr_t data, idx_t size, const string &what);

// ---------------------------------------------------------------------------
// Buffered reader
// ---------------------------------------------------------------------------

//! Buffered line/byte reader on top of a ByteStream. Decoders read through
//! this so text and binary formats share one buffering strategy.
class BufferedByteReader {
public:
	explicit BufferedByteReader(unique_ptr<ByteStream> stream_p);

	//! Read one line, stripping "\n" and "\r\n". Returns false at EOF.
	bool ReadLine(string &line);

	//! Peek at the next byte without consuming it. Returns false at EOF.
	bool PeekByte(char &c);

	//! Read up to nr_bytes. Returns bytes read (0 at EOF).
	idx_t Read(data_ptr_t target, idx_t nr_bytes);

	//! Read exactly nr_bytes or throw an IOException mentioning `what`.
	void ReadExact(data_ptr_t target, idx_t nr_bytes, const char *what);

	//! Read everything remaining in the stream.
	string ReadAll();

	ByteStream &Stream() {
		return *stream;
	}

	const string &GetPath() const {
		return stream->GetPath();
	}

private:
	bool FillBuffer();

	unique_ptr<ByteStream> stream;
	vector<char> buffer;
	idx_t buffer_pos = 0;
	idx_t buffer_end = 0;
	bool exhausted = false;
};

} // namespace duckdb
