#ifndef GZIP_HPP
#define GZIP_HPP

#include <string>

namespace gzip {

// gzip-framed deflate of the input. Returns false on zlib failure.
bool compress(const std::string& in, std::string& out);

// Accepts gzip or zlib framing
bool decompress(const std::string& in, std::string& out);

} // namespace gzip

#endif // GZIP_HPP
