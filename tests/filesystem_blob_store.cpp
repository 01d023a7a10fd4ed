#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include "folio.h"
#include "test_documents.h"
#include <filesystem>
#include <iostream>

using namespace folio;

int main(int argc, char* argv[])
{
  std::filesystem::path root = std::filesystem::temp_directory_path() / ("folio_store_" + boost::uuids::to_string(boost::uuids::random_generator()()));
  int result = 0;
  try
  {
    filesystem_blob_store store{root};

    // objects and their content types
    store.put("files", "nested/dir/doc.txt", to_bytes("Hello, store"), "text/plain");
    ensure(std::filesystem::exists(root / "files" / "nested" / "dir" / "doc.txt")) == true;
    ensure(to_string(store.get("files", "nested/dir/doc.txt"))) == "Hello, store";
    ensure(store.content_type("files", "nested/dir/doc.txt")) == std::optional<std::string>{"text/plain"};
    ensure(store.content_type("files", "absent").has_value()) == false;

    // ranges
    ensure(to_string(store.get("files", "nested/dir/doc.txt", byte_range{7, 5}))) == "store";
    ensure(to_string(store.get("files", "nested/dir/doc.txt", byte_range{0, 100}))) == "Hello, store";
    ensure(store.get("files", "nested/dir/doc.txt", byte_range{50, 8}).size()) == 0;

    // overwrite
    store.put("files", "nested/dir/doc.txt", to_bytes("v2"), "text/plain");
    ensure(to_string(store.get("files", "nested/dir/doc.txt"))) == "v2";

    // file type detection through the store
    store.put("files", "upload", test::make_docx(test::paragraph_xml("x")), "application/octet-stream");
    ensure(conversion::sniff(store, "files", "upload")) == file_type::docx;
    ensure(conversion::sniff(store, "files", "nothing-here")) == file_type::unknown;

    // missing objects and keys leaving the bucket are storage failures
    auto storage_failure = [&](auto&& operation)
    {
      try
      {
        operation();
      }
      catch (const std::exception& e)
      {
        return errors::contains_type<errors::storage_failure>(e);
      }
      return false;
    };
    ensure(storage_failure([&]() { store.get("files", "nothing-here"); })) == true;
    ensure(storage_failure([&]() { store.get("files", "../outside"); })) == true;
    ensure(storage_failure([&]() { store.put("files", "a/../../outside", to_bytes("x"), "text/plain"); })) == true;
    ensure(storage_failure([&]() { store.put("../files", "key", to_bytes("x"), "text/plain"); })) == true;
    ensure(storage_failure([&]() { store.put("files", "/etc/absolute", to_bytes("x"), "text/plain"); })) == true;
    ensure(storage_failure([&]() { store.put("a/b", "key", to_bytes("x"), "text/plain"); })) == true;
    ensure(std::filesystem::exists(root / "outside")) == false;
    ensure(store.object_path("files", "a/./b") == (root / "files" / "a" / "b").lexically_normal()) == true;
  }
  catch (const std::exception& e)
  {
    std::cerr << errors::diagnostic_message(e) << std::endl;
    result = 1;
  }
  std::error_code ec;
  std::filesystem::remove_all(root, ec);
  return result;
}
