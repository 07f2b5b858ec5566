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


#include <algorithm>
#include <fstream>
#include <iostream>
#include <iterator>
#include <map>
#include <optional>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include "md_styler/MDStyler.h"
#include "md_styler/Rendering.h"
#include "md_styler/StyleConfig.h"

namespace mdsprig {
	enum class in_type : uint8_t {
		File, StdCIn
	};
	enum class out_format : uint8_t {
		Html, Ansi, Text
	};
	struct CmdArgInfo {
		in_type         inSource;
		bool              toFile;
		out_format        format;
		std::string      outFile;
		std::string      baseUrl;
		std::string    styleFile;
		bool             verbose;
		std::vector<std::string> inputs;
	};
}

void configureParser(CLI::App& cmdArgParser, mdsprig::CmdArgInfo& argInfo);
void parseArgs(const CLI::App& argProcessor, mdsprig::CmdArgInfo& res);
bool convert(const std::string& markdown, const mdsprig::CmdArgInfo& args, const md_styler::NativeRenderer& renderer, std::ostream& out);

std::string correctUserFilename(const std::string& rawStr, mdsprig::out_format format) noexcept;

int main(int argc, char* argv[])
{
	mdsprig::CmdArgInfo cmdArgResult{};

	CLI::App argProcessor{ "A markdown converter: html, ANSI-styled terminal text or plain text.", "mdsprig" };

	configureParser(argProcessor, cmdArgResult);

	CLI11_PARSE(argProcessor, argc, argv);

	parseArgs(argProcessor, cmdArgResult);

	if (cmdArgResult.verbose) {
		spdlog::set_level(spdlog::level::debug);
	}

	md_styler::StyleConfig config = md_styler::StyleConfig::defaults();
	if (!cmdArgResult.styleFile.empty()) {
		std::ifstream styleStream{ cmdArgResult.styleFile };
		if (!styleStream) {
			spdlog::error("style file not found: {}", cmdArgResult.styleFile);
			return 1;
		}
		auto loaded = md_styler::loadStyleConfig(styleStream);
		if (!loaded) {
			spdlog::error("invalid style file: {}", cmdArgResult.styleFile);
			return 1;
		}
		config = std::move(*loaded);
	}
	const md_styler::NativeRenderer renderer{ std::move(config) };

	std::optional<std::ofstream> outFileOptional;
	if (cmdArgResult.toFile) {
		outFileOptional.emplace(cmdArgResult.outFile, std::ios::binary);
		if (!*outFileOptional) {
			spdlog::error("cannot write {}", cmdArgResult.outFile);
			return 1;
		}
	}

	if (cmdArgResult.inSource == mdsprig::in_type::StdCIn) {
		const std::string markdown{ std::istreambuf_iterator<char>{ std::cin }, std::istreambuf_iterator<char>{} };
		std::ostream& out = outFileOptional ? static_cast<std::ostream&>(*outFileOptional) : std::cout;
		return convert(markdown, cmdArgResult, renderer, out) ? 0 : 1;
	}

	int failTally = 0;
	const bool singleFile = cmdArgResult.inputs.size() == 1;
	for (const auto& inFilename : cmdArgResult.inputs) {
		std::ifstream streamie{ inFilename, std::ios::binary };
		if (!streamie) {
			spdlog::warn("file not found; skipping {}", inFilename);
			++failTally;
			continue;
		}
		const std::string markdown{ std::istreambuf_iterator<char>{ streamie }, std::istreambuf_iterator<char>{} };

		if (cmdArgResult.toFile) {
			if (!singleFile) {
				*outFileOptional << inFilename << ":\n";
			}
			if (!convert(markdown, cmdArgResult, renderer, *outFileOptional)) {
				return 1;
			}
			continue;
		}
		const std::string outputName = correctUserFilename(inFilename, cmdArgResult.format);
		std::ofstream result{ outputName, std::ios::binary };
		if (!result or !convert(markdown, cmdArgResult, renderer, result)) {
			spdlog::error("cannot write {}", outputName);
			return 1;
		}
		spdlog::debug("{} -> {}", inFilename, outputName);
	}
	return failTally == 0 ? 0 : 1;
}

bool convert(const std::string& markdown, const mdsprig::CmdArgInfo& args, const md_styler::NativeRenderer& renderer, std::ostream& out) {
	std::optional<md_styler::BaseContext> base{};
	if (!args.baseUrl.empty()) {
		base = md_styler::BaseContext{ args.baseUrl };
	}
	switch (args.format) {
	case mdsprig::out_format::Html:
		return md_styler::htmlExport(md_styler::parse(markdown), out);
	case mdsprig::out_format::Ansi:
		return md_styler::ansiExport(renderer.render(markdown, base), out, true);
	case mdsprig::out_format::Text:
		return md_styler::ansiExport(renderer.render(markdown, base), out, false);
	}
	return false;
}

void parseArgs(const CLI::App& argProcessor, mdsprig::CmdArgInfo& res) {
	if (!res.inputs.empty()) {
		res.inSource = mdsprig::in_type::File;
	}
	else {
		res.inSource = mdsprig::in_type::StdCIn;
	}
	res.toFile = argProcessor.count("--output") != 0;
}

void configureParser(CLI::App& cmdArgParser, mdsprig::CmdArgInfo& argInfo) {
	const std::map<std::string, mdsprig::out_format> formats{
		{ "html", mdsprig::out_format::Html },
		{ "ansi", mdsprig::out_format::Ansi },
		{ "text", mdsprig::out_format::Text }
	};
	argInfo.format = mdsprig::out_format::Html;
	cmdArgParser.add_option("files", argInfo.inputs, "Markdown files to convert; stdin when none are given");
	cmdArgParser.add_option("-o, --output", argInfo.outFile, "Output file as this filename");
	cmdArgParser.add_option("-f, --format", argInfo.format, "Output format: html, ansi or text")
		->transform(CLI::CheckedTransformer(formats, CLI::ignore_case));
	cmdArgParser.add_option("--base", argInfo.baseUrl, "Base URL or path that relative links resolve against");
	cmdArgParser.add_option("--style", argInfo.styleFile, "JSON style configuration");
	cmdArgParser.add_flag("-v, --verbose", argInfo.verbose, "Log library diagnostics");
}

std::string correctUserFilename(const std::string& rawStr, const mdsprig::out_format format) noexcept {
	const char* extension = format == mdsprig::out_format::Html ? ".html" : ".txt";
	size_t pos = std::min(rawStr.rfind('.'), rawStr.size());
	std::string correctedStr{ rawStr, 0, pos };
	if (rawStr.compare(pos, std::string::npos, extension) != 0) {
		correctedStr.append(extension);
	}
	else {
		correctedStr.append("COPY").append(extension);
	}
	return correctedStr;
}
