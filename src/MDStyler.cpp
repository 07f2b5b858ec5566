/*
MIT License

Copyright (c) 2020 Christian Greyeyes

Permission is hereby granted, free of charge, to any person obtaining a copy
of this software and associated documentation files (the "Software"), to deal
in the Software without restriction, including without limitation the rights
to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
copies of the Software, and to permit persons to whom the Software is
furnished to do so, subject to the following conditions:

The above copyright notice and this permission notice shall be included in all
copies or substantial portions of the Software.

THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
SOFTWARE.
*/


#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <cxxopts.hpp>
#include <spdlog/spdlog.h>
#include "md_styler/MDStyler.h"
#include "md_styler/HelpResource.h"
#include "md_styler/Json.h"
#include "md_styler/Rendering.h"

namespace {
	int run(const cxxopts::Options& options, const cxxopts::ParseResult& argValues);
	void printSummary(const md_styler::Document& doc, std::ostream& out);
	auto readAll(std::istream& in) -> std::string;
}

int main(int argc, char* argv[])
{
	cxxopts::Options options("mdstyler", "Markdown block parser: dumps the block model or shows the bundled help");
	options.add_options()
		("m, markdown-file", "Open a markdown-format text file and dump its blocks", cxxopts::value<std::string>()->default_value(""))
		("j, json", "Dump the blocks as JSON instead of a summary", cxxopts::value<bool>()->default_value("false"))
		("help-root", "Directory holding HELP.md (or docs/, Doc/, Documentation/, Resources/ with it)", cxxopts::value<std::string>()->default_value(""))
		("title", "Application name used by the help placeholder", cxxopts::value<std::string>()->default_value("MDStyler"))
		("no-color", "Print the help document without terminal styling", cxxopts::value<bool>()->default_value("false"))
		("v, verbose", "Log library diagnostics", cxxopts::value<bool>()->default_value("false"))
		("h, help", "Print usage")
		;

	try {
		const auto argValues = options.parse(argc, argv);
		return run(options, argValues);
	}
	catch (const std::exception& e) {
		spdlog::error("{}", e.what());
		std::cerr << options.help() << "\n";
		return 1;
	}
}

namespace {
	int run(const cxxopts::Options& options, const cxxopts::ParseResult& argValues) {
		if (argValues.count("help")) {
			std::cout << options.help() << "\n";
			return 0;
		}
		if (argValues["verbose"].as<bool>()) {
			spdlog::set_level(spdlog::level::debug);
		}

		if (!argValues["help-root"].as<std::string>().empty()) {
			const std::string helpText = md_styler::helpMarkdownOrPlaceholder(argValues["help-root"].as<std::string>(), argValues["title"].as<std::string>());
			const md_styler::NativeRenderer renderer{};
			if (!md_styler::ansiExport(renderer.render(helpText, std::nullopt), std::cout, !argValues["no-color"].as<bool>())) {
				return 1;
			}
			return 0;
		}

		const std::string mdFile = argValues["markdown-file"].as<std::string>();
		std::ifstream streamie{};
		std::string source{};
		if (!mdFile.empty()) {
			streamie.open(mdFile, std::ios::binary);
			if (!streamie) {
				spdlog::error("cannot open {}", mdFile);
				return 1;
			}
			source = readAll(streamie);
		}
		else {
			source = readAll(std::cin);
		}

		const md_styler::Document doc = md_styler::parse(source);
		if (argValues["json"].as<bool>()) {
			std::cout << md_styler::toJson(doc).dump(2) << "\n";
		}
		else {
			printSummary(doc, std::cout);
		}
		return std::cout.fail() ? 1 : 0;
	}

	void printSummary(const md_styler::Document& doc, std::ostream& out) {
		size_t i = 0;
		for (const auto& node : doc) {
			out << i++ << ": " << md_styler::flavorName(md_styler::flavorOf(node));
			switch (md_styler::flavorOf(node)) {
			case md_styler::type_e::Heading:
				out << " (h" << static_cast<unsigned>(std::get<md_styler::Heading>(node).lvl) << ") " << std::get<md_styler::Heading>(node).text;
				break;
			case md_styler::type_e::Paragraph:
				out << " " << std::get<md_styler::Paragraph>(node).text;
				break;
			case md_styler::type_e::UnorderedList:
				out << " [" << std::get<md_styler::UnorderedList>(node).items.size() << " items]";
				break;
			case md_styler::type_e::OrderedList:
				out << " [" << std::get<md_styler::OrderedList>(node).items.size() << " items]";
				break;
			case md_styler::type_e::CodeBlock:
			{
				const auto& code = std::get<md_styler::CodeBlock>(node);
				out << " (" << (code.language.empty() ? "plain" : code.language) << ") " << code.code.size() << " bytes";
			}
			break;
			}
			out << "\n";
		}
	}

	auto readAll(std::istream& in) -> std::string {
		return std::string{ std::istreambuf_iterator<char>{ in }, std::istreambuf_iterator<char>{} };
	}
}
