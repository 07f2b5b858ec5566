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


#include "md_styler/Json.h"
#include <stdexcept>

namespace md = md_styler;

void md::to_json(nlohmann::json& jc, const MDSNode& node) {
	jc = nlohmann::json{ { "type", flavorName(flavorOf(node)) } };
	switch (flavorOf(node)) {
	case type_e::Heading:
		jc["level"] = std::get<Heading>(node).lvl;
		jc["text"] = std::get<Heading>(node).text;
		break;
	case type_e::Paragraph:
		jc["text"] = std::get<Paragraph>(node).text;
		break;
	case type_e::UnorderedList:
		jc["items"] = std::get<UnorderedList>(node).items;
		break;
	case type_e::OrderedList:
		jc["items"] = std::get<OrderedList>(node).items;
		break;
	case type_e::CodeBlock:
		jc["language"] = std::get<CodeBlock>(node).language;
		jc["code"] = std::get<CodeBlock>(node).code;
		break;
	}
}

void md::to_json(nlohmann::json& jc, const FontSpec& font) {
	jc = nlohmann::json{ { "family", font.family }, { "size", font.size }, { "bold", font.bold } };
}

// Keys left out keep the value already in font.
void md::from_json(const nlohmann::json& jc, FontSpec& font) {
	const auto& obj = jc.get_ref<const nlohmann::json::object_t&>();
	if (auto it = obj.find("family"); it != obj.end()) {
		font.family = it->second.get<std::string>();
	}
	if (auto it = obj.find("size"); it != obj.end()) {
		// get<float>() would turn true/false into 1/0
		if (!it->second.is_number()) {
			throw std::invalid_argument{ "font size must be a number, not " + std::string{ it->second.type_name() } };
		}
		font.size = it->second.get<float>();
	}
	if (auto it = obj.find("bold"); it != obj.end()) {
		font.bold = it->second.get<bool>();
	}
}

void md::to_json(nlohmann::json& jc, const StyleConfig& config) {
	jc = nlohmann::json{
		{ "body", config.body },
		{ "headings", config.headings },
		{ "code", config.code },
		{ "subscriptScale", config.subscriptScale },
		{ "subscriptBaselineOffset", config.subscriptBaselineOffset },
		{ "bulletMarker", config.bulletMarker }
	};
}

auto md::toJson(const Document& doc) -> nlohmann::json {
	nlohmann::json jc = nlohmann::json::array();
	for (const auto& node : doc) {
		jc.push_back(node);
	}
	return jc;
}
