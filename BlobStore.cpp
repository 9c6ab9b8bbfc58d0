#include "BlobStore.hpp"

#include "Hash.hpp"
#include "Pill.hpp"

#include <fstream>
#include <system_error>

#include <boost/iostreams/device/mapped_file.hpp>

#include <fmt/format.h>

#include <glog/logging.h>

namespace Queue {

std::string blob_hash(std::string_view bytes)
{
  Hash h;
  h.update(bytes);
  return h.final();
}

FsBlobStore::FsBlobStore(fs::path dir)
  : dir_(std::move(dir))
{
  fs::create_directories(dir_ / "tmp");
}

fs::path FsBlobStore::path_for(std::string_view hash) const
{
  // Two level fan out keeps the directories small.
  return dir_ / std::string(hash.substr(0, 2)) / std::string(hash);
}

std::string FsBlobStore::put_blob(std::string_view bytes)
{
  auto       hash = blob_hash(bytes);
  auto const path = path_for(hash);

  error_code ec;
  if (fs::exists(path, ec))
    return hash;

  Pill       uniq;
  auto const tmp = dir_ / "tmp" / fmt::format("{}.{}", hash, uniq.as_string_view());

  {
    std::ofstream ofs;
    ofs.exceptions(std::ofstream::failbit | std::ofstream::badbit);
    ofs.open(tmp, std::ios::out | std::ios::binary | std::ios::trunc);
    ofs.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    ofs.close();
  }

  fs::create_directories(path.parent_path());
  fs::rename(tmp, path, ec);
  if (ec) {
    fs::remove(tmp, ec);
    throw std::system_error(ec, fmt::format("can't rename {} to {}",
                                            tmp.string(), path.string()));
  }
  return hash;
}

std::optional<std::string> FsBlobStore::get_blob(std::string_view hash,
                                                 std::size_t      offset,
                                                 std::size_t      len)
{
  auto const path = path_for(hash);

  error_code ec;
  if (!fs::exists(path, ec))
    return {};

  auto const size = fs::file_size(path);
  if (size == 0 || offset >= size)
    return std::string{};

  boost::iostreams::mapped_file_source mapping(path.string());
  std::string_view const               data(mapping.data(), mapping.size());
  return std::string(data.substr(offset, len));
}

void FsBlobStore::delete_blob(std::string_view hash)
{
  error_code ec;
  fs::remove(path_for(hash), ec);
  if (ec) {
    LOG(ERROR) << "can't remove blob " << hash << ": " << ec.message();
  }
}

std::string MemoryBlobStore::put_blob(std::string_view bytes)
{
  auto hash = blob_hash(bytes);

  std::lock_guard<std::mutex> lock(mtx_);
  blobs_.emplace(hash, std::string(bytes));
  return hash;
}

std::optional<std::string> MemoryBlobStore::get_blob(std::string_view hash,
                                                     std::size_t      offset,
                                                     std::size_t      len)
{
  std::lock_guard<std::mutex> lock(mtx_);
  auto const                  it = blobs_.find(std::string(hash));
  if (it == blobs_.end())
    return {};
  if (offset >= it->second.size())
    return std::string{};
  return it->second.substr(offset, len);
}

void MemoryBlobStore::delete_blob(std::string_view hash)
{
  std::lock_guard<std::mutex> lock(mtx_);
  blobs_.erase(std::string(hash));
}

std::size_t MemoryBlobStore::size() const
{
  std::lock_guard<std::mutex> lock(mtx_);
  return blobs_.size();
}

} // namespace Queue
