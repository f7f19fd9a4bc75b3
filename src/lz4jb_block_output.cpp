#include <string.h>
#include "lz4jb_block_output.h"
#include "lz4jb_header.h"
#include "lz4jb_xxh32.h"


namespace {

bool isUsableContext(const Lz4JbContext* ctx) {
	return ctx
		&& ctx->write
		&& ctx->compress
		&& ctx->compressBound;
}

} // anonymous namespace


namespace Lz4Jb {

BlockOutput::BlockOutput(Lz4JbContext* ctx, int blockSize)
	: ctx(ctx)
	, blockSize(blockSize)
	, compressionLevel(isValidBlockSize(blockSize) ? compressionLevelFromBlockSize(blockSize) : 0)
	, srcBuffer()
	, dstBuffer()
	, srcPos(0)
	, closed(false)
	, res(LZ4JB_RESULT_OK)
{
	if(!isValidBlockSize(blockSize) || !isUsableContext(ctx)) {
		quit(LZ4JB_RESULT_BAD_ARG);
		return;
	}

	const auto bound = ctx->compressBound(blockSize);
	if(bound <= 0) {
		quit(LZ4JB_RESULT_BAD_ARG);
		return;
	}

	srcBuffer.resize(static_cast<size_t>(blockSize));
	dstBuffer.resize(LZ4JB_HEADER_SIZE + static_cast<size_t>(bound));
}


BlockOutput::~BlockOutput() {
}


Lz4JbResult BlockOutput::write(const void* src, size_t srcSize) {
	if(closed) {
		return LZ4JB_RESULT_STREAM_CLOSED;
	}

	const auto* p = reinterpret_cast<const char*>(src);
	while(srcSize > 0) {
		const auto room = srcBuffer.size() - srcPos;
		const auto n = srcSize < room ? srcSize : room;
		memcpy(&srcBuffer[srcPos], p, n);
		srcPos  += n;
		p       += n;
		srcSize -= n;

		if(srcPos == srcBuffer.size()) {
			const auto r = flushBlock();
			if(LZ4JB_RESULT_OK != r) {
				return r;
			}
		}
	}

	return LZ4JB_RESULT_OK;
}


Lz4JbResult BlockOutput::flush() {
	if(closed) {
		return LZ4JB_RESULT_STREAM_CLOSED;
	}
	return flushBlock();
}


Lz4JbResult BlockOutput::close() {
	if(closed) {
		return res;
	}

	const auto r = flushBlock();
	if(LZ4JB_RESULT_OK != r) {
		return r;
	}

	char d[LZ4JB_HEADER_SIZE];
	const auto size = storeHeader(d, makeEosHeader(compressionLevel));
	if(!writeBin(d, size)) {
		return quit(LZ4JB_RESULT_CANNOT_WRITE_EOS);
	}

	closed = true;
	return res;
}


Lz4JbResult BlockOutput::flushBlock() {
	if(0 == srcPos) {
		return LZ4JB_RESULT_OK;
	}

	const auto* srcPtr = srcBuffer.data();
	const auto srcSize = static_cast<int>(srcPos);
	auto* cmpPtr = &dstBuffer[LZ4JB_HEADER_SIZE];
	const auto cmpCapacity = static_cast<int>(dstBuffer.size() - LZ4JB_HEADER_SIZE);

	const auto cmpSize = ctx->compress(srcPtr, cmpPtr, srcSize, cmpCapacity, ctx->compressionLevel);
	if(cmpSize < 0 || cmpSize > cmpCapacity) {
		return quit(LZ4JB_RESULT_COMPRESS_FAIL);
	}

	// 0 is the backend's "did not fit" answer.
	const bool incompressible = (0 == cmpSize || cmpSize >= srcSize);

	Header h;
	h.method			= incompressible ? Method::RAW : Method::LZ4;
	h.compressionLevel	= compressionLevel;
	h.compressedSize	= static_cast<uint32_t>(incompressible ? srcSize : cmpSize);
	h.originalSize		= static_cast<uint32_t>(srcSize);
	h.checksum			= blockChecksum(srcPtr, srcPos);

	if(incompressible) {
		memcpy(cmpPtr, srcPtr, srcPos);
	}
	storeHeader(dstBuffer.data(), h);

	if(!writeBin(dstBuffer.data(), LZ4JB_HEADER_SIZE + h.compressedSize)) {
		return quit(LZ4JB_RESULT_CANNOT_WRITE_BLOCK);
	}

	srcPos = 0;
	return LZ4JB_RESULT_OK;
}


bool BlockOutput::writeBin(const void* ptr, size_t size) {
	const auto s = static_cast<int>(size);
	return s == ctx->write(ctx, ptr, s);
}


Lz4JbResult BlockOutput::quit(Lz4JbResult result) {
	if(LZ4JB_RESULT_OK == res) {
		res = result;
	}
	closed = true;
	if(ctx && LZ4JB_RESULT_OK == ctx->result) {
		ctx->result = res;
	}
	return res;
}

} // namespace Lz4Jb
