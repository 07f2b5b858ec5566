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


#include <string>
#include <string_view>
#include <tao/pegtl/parse_error.hpp>
#include "md_styler/MDStyler.h"
#include "md_styler/Rendering.h"
#include "MDStylerImpl.h"
#include "Log.h"

namespace {
	void layoutItems(const std::vector<std::string>& items, const bool ordered, const md_styler::StyleConfig& config,
		const std::optional<md_styler::BaseContext>& base, md_styler::StyledText& out)
	{
		size_t position = 1;
		for (const auto& item : items) {
			const std::string marker = ordered ? std::to_string(position) + "." : config.bulletMarker;
			out.append(marker, config.markerStyle());
			out.appendPlain(" ");
			mdsm_impl::styleInline(item, config.bodyStyle(), config, base, out);
			out.appendPlain("\n");
			++position;
		}
	}

	void layoutBlock(const md_styler::MDSNode& node, const md_styler::StyleConfig& config,
		const std::optional<md_styler::BaseContext>& base, md_styler::StyledText& out)
	{
		using md_styler::type_e;
		switch (md_styler::flavorOf(node)) {
		case type_e::Heading:
		{
			const auto& heading = std::get<md_styler::Heading>(node);
			mdsm_impl::styleInline(heading.text, config.headingStyle(heading.lvl), config, base, out);
			out.appendPlain("\n");
		}
		break;
		case type_e::Paragraph:
			mdsm_impl::styleInline(std::get<md_styler::Paragraph>(node).text, config.bodyStyle(), config, base, out);
			out.appendPlain("\n");
			break;
		case type_e::UnorderedList:
			layoutItems(std::get<md_styler::UnorderedList>(node).items, false, config, base, out);
			break;
		case type_e::OrderedList:
			layoutItems(std::get<md_styler::OrderedList>(node).items, true, config, base, out);
			break;
		case type_e::CodeBlock:
			out.append(std::get<md_styler::CodeBlock>(node).code, config.codeStyle());
			out.appendPlain("\n");
			break;
		}
	}
}

md_styler::NativeRenderer::NativeRenderer() : config_{ StyleConfig::defaults() } {}

md_styler::NativeRenderer::NativeRenderer(StyleConfig config) : config_{ std::move(config) } {}

md_styler::StyledText md_styler::NativeRenderer::render(std::string_view markdown, const std::optional<BaseContext>& base) const {
	try {
		mdsm_impl::validateSource(markdown);
	}
	catch (const TAO_PEGTL_NAMESPACE::parse_error& e) {
		mdsm_impl::log()->debug("rendering {} bytes as plain text: {}", markdown.size(), e.what());
		return StyledText{ std::string{ markdown } };
	}

	const Document doc = parse(markdown);

	StyledText result{};
	bool first = true;
	for (const auto& node : doc) {
		if (!first) {
			result.appendPlain("\n");
		}
		layoutBlock(node, config_, base, result);
		first = false;
	}
	return result;
}
