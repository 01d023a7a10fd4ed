/*********************************************************************************************************************************************/
/*  Folio: document conversion in C++20. Reads PDF and DOCX uploads into one canonical document tree and renders                             */
/*  that tree to HTML and TipTap JSON. Runs as a job worker over a blob store or as a command line tool.                                     */
/*  Input that cannot be interpreted degrades to an empty result instead of failing the job.                                                 */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*  Project: folio document conversion service                                                                                               */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#include <boost/json.hpp>
#include <boost/program_options.hpp>
#include "conversion.h"
#include "diagnostic_message.h"
#include "environment.h"
#include "filesystem_blob_store.h"
#include "html_renderer.h"
#include "job.h"
#include "log_core.h"
#include "log_entry.h"
#include "log_json_stream_sink.h"
#include "serialization_enum.h" // IWYU pragma: keep
#include "spec_json.h"
#include "throw_if.h"
#include "tiptap_renderer.h"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>

namespace po = boost::program_options;
using namespace folio;

namespace
{

std::string read_file(const std::filesystem::path& path)
{
	std::ifstream stream(path, std::ios::binary);
	throw_if(!stream, "cannot open file", path.string());
	return std::string{std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>()};
}

void write_output(const std::string& content, const std::string& output_path)
{
	if (output_path.empty() || output_path == "-")
	{
		std::cout << content << std::endl;
		return;
	}
	std::ofstream stream(output_path, std::ios::binary | std::ios::trunc);
	throw_if(!stream, "cannot open output file", output_path);
	stream << content;
}

std::string render_tree(const spec::Node& tree, const std::string& format)
{
	if (format == "html")
		return html::render(tree);
	if (format == "tiptap")
		return tiptap::render_to_string(tree);
	throw_if(format != "spec", "unknown output format", format);
	return spec::serialize(tree);
}

job job_from_options(const po::variables_map& vm)
{
	if (vm.count("job"))
		return parse_job(read_file(vm["job"].as<std::string>()));
	throw_if(!vm.count("filename"), "either --job or --filename is required");
	job request;
	request.filename = vm["filename"].as<std::string>();
	request.document_id = vm.count("document-id") ? vm["document-id"].as<std::string>() : std::filesystem::path{request.filename}.stem().string();
	request.job_id = vm.count("job-id") ? vm["job-id"].as<std::string>() : request.document_id;
	request.trace_id = request.document_id;
	request.bucket_name = vm["bucket"].as<std::string>();
	request.target_file_type = vm["target"].as<std::string>();
	request.page_count = vm["page-count"].as<int>();
	return request;
}

int run(int argc, char* argv[])
{
	po::options_description desc("Usage: folio <command> [options]\n\n"
		"Commands:\n"
		"  job      convert a stored document and write the results to the store\n"
		"  convert  convert a local PDF or DOCX file\n"
		"  render   render a stored canonical tree (spec JSON)\n\n"
		"Options");
	desc.add_options()
		("help", "show this help")
		("command", po::value<std::string>(), "job, convert or render")
		("store", po::value<std::string>()->default_value("."), "root directory of the blob store, one subdirectory per bucket")
		("job", po::value<std::string>(), "job message file (JSON)")
		("filename", po::value<std::string>(), "source document key in the bucket")
		("bucket", po::value<std::string>()->default_value("files"), "source document bucket")
		("document-id", po::value<std::string>(), "document id, default: filename stem")
		("job-id", po::value<std::string>(), "job id, default: document id")
		("target", po::value<std::string>()->default_value("text/html"), "requested output content type (text/html or application/vnd.nldoc.tiptap+json)")
		("page-count", po::value<int>()->default_value(10), "page count used when no text can be extracted")
		("input", po::value<std::string>(), "input file for convert and render")
		("format", po::value<std::string>()->default_value("html"), "output of convert and render: html, tiptap or spec")
		("output", po::value<std::string>()->default_value("-"), "output file, - for standard output")
		("log-filter", po::value<std::string>(), "log filter, default: FOLIO_LOG_FILTER")
	;
	po::positional_options_description positional;
	positional.add("command", 1);

	po::variables_map vm;
	po::store(po::command_line_parser(argc, argv).options(desc).positional(positional).run(), vm);
	po::notify(vm);

	if (vm.count("help") || !vm.count("command"))
	{
		std::cout << desc << std::endl;
		return vm.count("help") ? 0 : 1;
	}

	std::optional<std::string> log_filter = vm.count("log-filter") ? vm["log-filter"].as<std::string>() : environment::get("FOLIO_LOG_FILTER");
	if (log_filter && !log_filter->empty())
	{
		log::set_filter(*log_filter);
		log::set_sink(log::json_stream_sink(std::cerr));
	}

	std::string command = vm["command"].as<std::string>();
	conversion::settings config = conversion::settings::from_environment();
	if (command == "job")
	{
		filesystem_blob_store store{vm["store"].as<std::string>()};
		job request = job_from_options(vm);
		job_result result = conversion::run_job(store, request, config);
		boost::json::object output{
			{"result", result_record(result)},
			{"event", done_event(result)}
		};
		write_output(boost::json::serialize(output), vm["output"].as<std::string>());
	}
	else if (command == "convert")
	{
		throw_if(!vm.count("input"), "--input is required");
		std::string data = read_file(vm["input"].as<std::string>());
		std::vector<std::byte> bytes = to_bytes(data);
		file_type type = detect_file_type(std::span<const std::byte>{bytes}.first(std::min(bytes.size(), file_type_prefix_size)));
		log_entry(type, bytes.size());
		spec::Node tree = spec::build(conversion::extract(bytes, type, config), vm["page-count"].as<int>());
		write_output(render_tree(tree, vm["format"].as<std::string>()), vm["output"].as<std::string>());
	}
	else if (command == "render")
	{
		throw_if(!vm.count("input"), "--input is required");
		spec::Node tree = spec::parse(read_file(vm["input"].as<std::string>()));
		write_output(render_tree(tree, vm["format"].as<std::string>()), vm["output"].as<std::string>());
	}
	else
	{
		std::cerr << "Unknown command: " << command << std::endl << desc << std::endl;
		return 1;
	}
	return 0;
}

} // anonymous namespace

int main(int argc, char* argv[])
{
	try
	{
		return run(argc, argv);
	}
	catch (const po::error& e)
	{
		std::cerr << "Error: " << e.what() << std::endl;
		return 1;
	}
	catch (const std::exception& e)
	{
		std::cerr << errors::diagnostic_message(e) << std::endl;
		return 1;
	}
}
