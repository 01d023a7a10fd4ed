#include <boost/json.hpp>
#include "folio.h"
#include "test_documents.h"
#include <iostream>

using namespace folio;

namespace
{

job docx_job(const std::string& document_id, const std::string& target = "text/html")
{
  job request;
  request.document_id = document_id;
  request.job_id = "job-" + document_id;
  request.trace_id = "trace-" + document_id;
  request.filename = document_id + ".upload";
  request.target_file_type = target;
  request.page_count = 4;
  return request;
}

std::string stored_text(const memory_blob_store& store, const std::string& bucket, const std::string& key)
{
  std::optional<memory_blob_store::object> object = store.find(bucket, key);
  throw_if(!object, "object not stored", bucket, key);
  return to_string(object->data);
}

} // anonymous namespace

int main(int argc, char* argv[])
{
  try
  {
    // job messages
    {
      job request = parse_job(R"({"recordId":"worker|||doc-1","jobId":"j1","filename":"uploads/doc-1","bucketName":"in",
        "targetFileType":"application/vnd.nldoc.tiptap+json","attributes":{"pageCount":{"values":[{"stringResult":"7"}]}}})");
      ensure(request.document_id) == "doc-1";
      ensure(request.job_id) == "j1";
      ensure(request.trace_id) == "doc-1";
      ensure(request.filename) == "uploads/doc-1";
      ensure(request.bucket_name) == "in";
      ensure(request.target_file_type) == "application/vnd.nldoc.tiptap+json";
      ensure(request.page_count) == 7;

      job defaults = parse_job(R"({"filename":"plain.pdf","traceId":"t"})");
      ensure(defaults.document_id) == "plain.pdf";
      ensure(defaults.trace_id) == "t";
      ensure(defaults.bucket_name) == "files";
      ensure(defaults.target_file_type) == "text/html";
      ensure(defaults.page_count) == 10;
      ensure(defaults.job_id.size()) == 36;
      ensure(parse_job("{}").document_id) == "unknown";

      for (std::string_view invalid : {std::string_view{"{"}, std::string_view{"[1]"}, std::string_view{R"({"attributes":{"pageCount":{"values":[{"stringResult":"7a"}]}}})"}})
      {
        bool thrown = false;
        try
        {
          parse_job(invalid);
        }
        catch (const std::exception& e)
        {
          thrown = errors::contains_type<errors::uninterpretable_data>(e);
        }
        ensure(thrown) == true;
      }
    }

    // DOCX to HTML: tree in the spec bucket, page in the output bucket
    {
      memory_blob_store store;
      store.put("files", "d1.upload", test::make_docx(test::paragraph_xml("Title", "Heading1") + test::paragraph_xml("Hello world.")), "application/octet-stream");
      job_result result = conversion::run_job(store, docx_job("d1"), {}, spec::sequential_id_generator());
      ensure(result.success) == true;
      ensure(result.trace_id) == "trace-d1";
      ensure(result.record_id) == "folio|||d1";
      ensure(result.job_id) == "job-d1";
      ensure(result.bucket_name) == "files";
      ensure(result.filename) == "d1.spec.json";
      ensure(result.done_location) == "d1.html";
      ensure(result.done_content_type) == "text/html";
      ensure(result.timestamp.ends_with("Z")) == true;
      ensure(store.size()) == 3;

      spec::Node tree = spec::parse(stored_text(store, "files", "d1.spec.json"));
      ensure(tree.children.size()) == 2;
      ensure(tree.children[0].as<spec::Heading>().level) == 10;
      ensure(store.find("files", "d1.spec.json")->content_type) == "application/json";
      ensure(store.find("output", "d1.html")->content_type) == "text/html; charset=utf-8";
      ensure(stored_text(store, "output", "d1.html")).contains("<body>\n<h1>Title</h1>\n<p>Hello world.</p>\n\n</body>");

      boost::json::object record = result_record(result);
      ensure(std::string{record.at("resultType").as_string()}) == "fileWorkerResult";
      ensure(std::string{record.at("filename").as_string()}) == "d1.spec.json";
      ensure(record.at("success").as_bool()) == true;
      boost::json::object event = done_event(result);
      ensure(std::string{event.at("type").as_string()}) == "https://event.spec.nldoc.nl/done";
      ensure(std::string{event.at("context").as_object().at("location").as_string()}) == "d1.html";
    }

    // PDF to TipTap, with custom buckets
    {
      memory_blob_store store;
      store.put("files", "p1.upload", test::make_pdf({{"Intro", 20}, {"Body text.", 12}}), "application/pdf");
      conversion::settings config;
      config.spec_bucket = "specs";
      config.output_bucket = "rendered";
      job_result result = conversion::run_job(store, docx_job("p1", std::string{tiptap::content_type}), config);
      ensure(result.done_location) == "p1.json";
      ensure(result.bucket_name) == "specs";
      ensure(result.done_content_type) == std::string{tiptap::content_type};
      ensure(store.size()) == 4;
      ensure(store.find("rendered", "p1.html").has_value()) == true;
      ensure(store.find("rendered", "p1.json")->content_type) == "application/vnd.nldoc.tiptap+json; charset=utf-8";
      boost::json::value doc = boost::json::parse(stored_text(store, "rendered", "p1.json"));
      const boost::json::array& content = doc.as_object().at("content").as_array();
      ensure(content.size()) == 2;
      ensure(std::string{content[0].as_object().at("type").as_string()}) == "heading";
      ensure(std::string{content[1].as_object().at("type").as_string()}) == "paragraph";
    }

    // unreadable bytes: fallback paragraph with the page count
    {
      memory_blob_store store;
      store.put("files", "x.upload", test::bytes("neither pdf nor docx"), "application/octet-stream");
      conversion::run_job(store, docx_job("x"), {}, spec::sequential_id_generator());
      ensure(stored_text(store, "output", "x.html")).contains("<p>Dit document bevat 4 pagina&#x27;s maar de tekst kon niet worden ge\xC3\xABxtraheerd.</p>");
    }

    // unknown type detection falls back to trying both extractors
    {
      std::vector<std::byte> docx = test::make_docx(test::paragraph_xml("Via fallback"));
      ensure(spec::plain_text(spec::build(conversion::extract(docx, file_type::unknown), 1))) == "Via fallback";
      ensure(conversion::extract(test::bytes("junk"), file_type::pdf).size()) == 0;
    }

    // missing source document
    {
      memory_blob_store store;
      bool thrown = false;
      try
      {
        conversion::run_job(store, docx_job("missing"));
      }
      catch (const std::exception& e)
      {
        thrown = errors::contains_type<errors::storage_failure>(e);
        ensure(errors::diagnostic_message(e)).contains("Conversion job failed");
      }
      ensure(thrown) == true;
      ensure(store.size()) == 0;
    }
  }
  catch (const std::exception& e)
  {
    std::cerr << errors::diagnostic_message(e) << std::endl;
    return 1;
  }
  return 0;
}
