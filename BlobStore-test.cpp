#include "BlobStore.hpp"

#include "Pill.hpp"

#include <fstream>

#include <glog/logging.h>

using namespace Queue;

namespace {
void exercise(BlobStore& store)
{
  auto const body = std::string("Subject: hello\r\n\r\nHi there.\r\n");

  auto const hash = store.put_blob(body);
  CHECK_EQ(hash, blob_hash(body));
  CHECK_EQ(store.put_blob(body), hash); // same bytes, same blob

  CHECK_EQ(*store.get_blob(hash), body);
  CHECK_EQ(*store.get_blob(hash, 0, 7), "Subject");
  CHECK_EQ(*store.get_blob(hash, 9, 5), "hello");
  CHECK_EQ(*store.get_blob(hash, body.size() - 4), "e.\r\n");
  CHECK_EQ(*store.get_blob(hash, body.size()), "");
  CHECK_EQ(*store.get_blob(hash, 1000, 10), "");

  auto const other = store.put_blob("something else");
  CHECK_NE(other, hash);

  auto const empty = store.put_blob("");
  CHECK_EQ(*store.get_blob(empty), "");

  store.delete_blob(hash);
  CHECK(!store.get_blob(hash));
  CHECK_EQ(*store.get_blob(other), "something else");

  store.delete_blob(hash); // already gone
  CHECK(!store.get_blob("0000"));
}
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  CHECK_EQ(blob_hash("abc").size(), 52u);
  CHECK_NE(blob_hash("abc"), blob_hash("abd"));

  MemoryBlobStore mem;
  exercise(mem);
  CHECK_EQ(mem.size(), 2u);

  Pill       uniq;
  auto const dir = fs::temp_directory_path()
                   / (std::string("blobs-") + std::string(uniq.as_string_view()));

  {
    FsBlobStore store(dir);
    CHECK(fs::is_directory(dir / "tmp"));
    exercise(store);

    auto const hash = store.put_blob("on disk");
    auto const path = store.path_for(hash);
    CHECK_EQ(path.parent_path().filename().string(), hash.substr(0, 2));
    CHECK(fs::exists(path));
    CHECK(fs::is_empty(dir / "tmp"));

    std::ifstream ifs(path, std::ios::binary);
    std::string const stored{std::istreambuf_iterator<char>(ifs),
                             std::istreambuf_iterator<char>()};
    CHECK_EQ(stored, "on disk");
  }

  // A fresh store over the same directory sees the same blobs.
  {
    FsBlobStore store(dir);
    CHECK_EQ(*store.get_blob(blob_hash("on disk")), "on disk");
  }

  fs::remove_all(dir);
}
