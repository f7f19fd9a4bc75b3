#ifndef LZ4JB_IO_CSTDIO_H
#define LZ4JB_IO_CSTDIO_H

#include <cstdio>
#include <string>
#include <cstdint>
#include "lz4jb.h"

namespace Lz4Jb { namespace Cstdio {

// Pseudo filenames for the process streams and for a sink that discards
// everything.
const std::string& stdinName();
const std::string& stdoutName();
const std::string& nullName();

// Source and sink of one Lz4JbContext, backed by FILE*.
//
// Opening installs the matching read/write callback into the context.
// Whatever is still open is closed by the destructor, with the context
// callbacks cleared. stdin and stdout are flushed, never closed.
class Streams {
public:
	explicit Streams(Lz4JbContext* ctx);
	~Streams();

	bool openSource(const std::string& filename);
	bool openSink(const std::string& filename);
	void openNullSink();

	void closeSource();

	// false when buffered bytes could not reach the file.
	bool closeSink();

private:
	Streams(const Streams&);
	const Streams& operator=(const Streams&);

	static int readFile(const Lz4JbContext* ctx, void* dst, int dstSize);
	static int writeFile(const Lz4JbContext* ctx, const void* src, int srcSize);
	static int writeNull(const Lz4JbContext* ctx, const void* src, int srcSize);

	Lz4JbContext* ctx;
	FILE* source;
	FILE* sink;
};

bool fileExists(const std::string& filename);
uint64_t fileSize(const std::string& filename);
bool removeFile(const std::string& filename);

bool isConsoleInput();
bool isConsoleOutput();

// "dir/file" -> "dir/file.ext"
std::string compressedName(const std::string& filename, const std::string& extension);

// "dir/file.ext" -> "dir/file". Fails when the last path component has no
// ".extension" suffix, or is nothing but that suffix.
bool decompressedName(const std::string& filename, const std::string& extension, std::string* result);

}} // namespace Cstdio, Lz4Jb

#endif
