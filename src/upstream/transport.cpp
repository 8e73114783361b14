#include "upstream/transport.hpp"

namespace linebridge {

bool ReadAll(BodyReader* reader, CancelToken* cancel, size_t max_bytes, std::string* out, std::string* err) {
  if (!reader || !out) return false;
  std::string chunk;
  while (true) {
    chunk.clear();
    const auto r = reader->Read(cancel, &chunk, err);
    if (r == BodyReader::Result::kEof) return true;
    if (r == BodyReader::Result::kError) return false;
    if (max_bytes > 0 && out->size() + chunk.size() > max_bytes) {
      out->append(chunk, 0, max_bytes - out->size());
      return true;
    }
    out->append(chunk);
  }
}

}  // namespace linebridge
