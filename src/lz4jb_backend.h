#ifndef LZ4JB_BACKEND_H
#define LZ4JB_BACKEND_H

namespace Lz4Jb { namespace Backend {

// LZ4 block engines. Every engine writes plain LZ4 blocks, so a stream
// compressed by one of them is decompressed by any other.

// Fast engine. compressionLevel is the acceleration factor, 0 means default.
int lz4Compress(const char* src, char* dst, int isize, int maxOutputSize, int compressionLevel);

// High compression engine. compressionLevel 0 means LZ4HC_CLEVEL_DEFAULT.
int lz4hcCompress(const char* src, char* dst, int isize, int maxOutputSize, int compressionLevel);

int compressBound(int isize);

// Returns the decoded size, or a negative value on malformed input or
// insufficient output capacity.
int decompress(const char* src, char* dst, int isize, int maxOutputSize);

}} // namespace Backend, Lz4Jb

#endif
