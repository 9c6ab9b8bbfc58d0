#ifndef BLOBSTORE_DOT_HPP
#define BLOBSTORE_DOT_HPP

#include <cstdint>
#include <limits>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "fs.hpp"

namespace Queue {

// Content addressed storage for message bodies, named by the hash of
// their bytes. Failures throw, they are system faults rather than
// delivery outcomes.
class BlobStore {
public:
  static constexpr std::size_t npos = std::numeric_limits<std::size_t>::max();

  virtual ~BlobStore() = default;

  // Stores the bytes, returns their hash.
  virtual std::string put_blob(std::string_view bytes) = 0;

  // Up to len bytes starting at offset, nothing if there is no such
  // blob.
  virtual std::optional<std::string>
  get_blob(std::string_view hash, std::size_t offset = 0, std::size_t len = npos)
      = 0;

  virtual void delete_blob(std::string_view hash) = 0;
};

std::string blob_hash(std::string_view bytes);

// One file per blob below a directory: written to a temporary name,
// then renamed into place. Reads map the file.
class FsBlobStore : public BlobStore {
public:
  explicit FsBlobStore(fs::path dir);

  std::string                put_blob(std::string_view bytes) override;
  std::optional<std::string> get_blob(std::string_view hash,
                                      std::size_t      offset,
                                      std::size_t      len) override;
  void                       delete_blob(std::string_view hash) override;

  fs::path path_for(std::string_view hash) const;

private:
  fs::path dir_;
};

class MemoryBlobStore : public BlobStore {
public:
  std::string                put_blob(std::string_view bytes) override;
  std::optional<std::string> get_blob(std::string_view hash,
                                      std::size_t      offset,
                                      std::size_t      len) override;
  void                       delete_blob(std::string_view hash) override;

  std::size_t size() const;

private:
  mutable std::mutex                           mtx_;
  std::unordered_map<std::string, std::string> blobs_;
};

} // namespace Queue

#endif // BLOBSTORE_DOT_HPP
