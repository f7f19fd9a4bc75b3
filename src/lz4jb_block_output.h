#ifndef LZ4JB_BLOCK_OUTPUT_H
#define LZ4JB_BLOCK_OUTPUT_H

#include <stddef.h>
#include <vector>
#include "lz4jb.h"

namespace Lz4Jb {

// Frames a byte stream into LZ4Block blocks and writes them through
// ctx->write. The context must outlive the BlockOutput.
//
// Block boundaries depend only on blockSize, never on how the input is
// split across write() calls. Destroying a BlockOutput without close()
// writes nothing.
class BlockOutput {
public:
	BlockOutput(Lz4JbContext* ctx, int blockSize = LZ4JB_BLOCK_SIZE_DEFAULT);
	~BlockOutput();

	Lz4JbResult write(const void* src, size_t srcSize);

	// Emits the buffered bytes as one block, if any. The stream stays open.
	Lz4JbResult flush();

	// Emits the buffered bytes and the end marker. A second call writes
	// nothing and returns result().
	Lz4JbResult close();

	Lz4JbResult result() const {
		return res;
	}

	bool isClosed() const {
		return closed;
	}

	int getBlockSize() const {
		return blockSize;
	}

	int getCompressionLevel() const {
		return compressionLevel;
	}

private:
	BlockOutput(const BlockOutput&);
	const BlockOutput& operator=(const BlockOutput&);

	Lz4JbResult flushBlock();
	bool writeBin(const void* ptr, size_t size);
	Lz4JbResult quit(Lz4JbResult result);

	Lz4JbContext* ctx;
	const int blockSize;
	const int compressionLevel;
	std::vector<char> srcBuffer;
	std::vector<char> dstBuffer;
	size_t srcPos;
	bool closed;
	Lz4JbResult res;
};

} // namespace Lz4Jb

#endif
