#ifndef LZ4JB_BLOCK_INPUT_H
#define LZ4JB_BLOCK_INPUT_H

#include <stddef.h>
#include <vector>
#include "lz4jb.h"

namespace Lz4Jb {

// Reads LZ4Block blocks through ctx->read and exposes the decoded bytes as
// one continuous sequence. Nothing past the end marker is consumed from
// the source. The context must outlive the BlockInput.
class BlockInput {
public:
	BlockInput(Lz4JbContext* ctx);
	~BlockInput();

	// Copies up to dstSize decoded bytes into dst and returns the count.
	// 0 means end of stream when result() is LZ4JB_RESULT_OK, otherwise
	// result() holds the first error and every later call returns 0.
	int read(void* dst, int dstSize);

	Lz4JbResult result() const {
		return res;
	}

	bool isEnded() const {
		return ended;
	}

	const Lz4JbStreamInfo& info() const {
		return streamInfo;
	}

private:
	BlockInput(const BlockInput&);
	const BlockInput& operator=(const BlockInput&);

	bool refill();
	int readBin(void* dst, int size);
	bool quit(Lz4JbResult result);

	Lz4JbContext* ctx;
	std::vector<char> srcBuffer;
	std::vector<char> dstBuffer;
	size_t dstPos;
	size_t dstSize;
	bool ended;
	Lz4JbResult res;
	Lz4JbStreamInfo streamInfo;
};

} // namespace Lz4Jb

#endif
